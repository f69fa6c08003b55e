#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

#include "action_shorts/audio_profiler.hpp"
#include "action_shorts/errors.hpp"

namespace action_shorts {

class AudioProfilerTest : public ::testing::Test {
protected:
  static constexpr int SAMPLE_RATE = 8000;

  void SetUp() override {
    settings_.window_size = 256;
    settings_.hop_size = 128;
    settings_.smoothing_frames = 5;
  }

  static PcmAudio make_audio(std::vector<float> samples) {
    PcmAudio audio;
    audio.sample_rate = SAMPLE_RATE;
    audio.duration = static_cast<double>(samples.size()) / SAMPLE_RATE;
    audio.samples = std::move(samples);
    return audio;
  }

  /// Silence with a 1 kHz tone between burst_start and burst_end seconds
  static PcmAudio burst(double total, double burst_start, double burst_end) {
    const size_t n = static_cast<size_t>(total * SAMPLE_RATE);
    std::vector<float> s(n, 0.0f);
    for (size_t i = 0; i < n; ++i) {
      double t = static_cast<double>(i) / SAMPLE_RATE;
      if (t >= burst_start && t < burst_end)
        s[i] = static_cast<float>(0.8 * std::sin(2.0 * 3.14159265358979 *
                                                 1000.0 * t));
    }
    return make_audio(std::move(s));
  }

  /// Deterministic pseudo-random noise
  static PcmAudio noise(double total) {
    const size_t n = static_cast<size_t>(total * SAMPLE_RATE);
    std::vector<float> s(n);
    uint32_t state = 12345;
    for (size_t i = 0; i < n; ++i) {
      state = state * 1664525u + 1013904223u;
      s[i] = static_cast<float>((state >> 8) & 0xFFFF) / 32768.0f - 1.0f;
      s[i] *= 0.1f + 0.9f * static_cast<float>((i / 4000) % 3) / 2.0f;
    }
    return make_audio(std::move(s));
  }

  static double mean_score(const ActionProfile &p, double from, double to) {
    double sum = 0.0;
    int count = 0;
    for (const auto &f : p) {
      if (f.timestamp >= from && f.timestamp < to) {
        sum += f.score;
        ++count;
      }
    }
    return count > 0 ? sum / count : 0.0;
  }

  AnalysisSettings settings_;
};

TEST_F(AudioProfilerTest, ScoresStayInUnitRange) {
  AudioActionProfiler profiler(settings_);
  ActionProfile p = profiler.profile(noise(3.0));

  ASSERT_FALSE(p.empty());
  for (const auto &f : p) {
    EXPECT_GE(f.rms, 0.0f);
    EXPECT_LE(f.rms, 1.0f);
    EXPECT_GE(f.flux, 0.0f);
    EXPECT_LE(f.flux, 1.0f);
    EXPECT_GE(f.score, 0.0f);
    EXPECT_LE(f.score, 1.0f);
  }
}

TEST_F(AudioProfilerTest, FramesAreEvenlySpacedByHop) {
  AudioActionProfiler profiler(settings_);
  ActionProfile p = profiler.profile(noise(1.0));

  ASSERT_EQ(p.size(), 63u); // ceil(8000 / 128)
  const double hop = profiler.hop_seconds(SAMPLE_RATE);
  EXPECT_DOUBLE_EQ(hop, 0.016);
  for (size_t i = 0; i < p.size(); ++i) {
    EXPECT_NEAR(p[i].timestamp, i * hop, 1e-12);
  }
}

TEST_F(AudioProfilerTest, LoudSectionScoresHigher) {
  AudioActionProfiler profiler(settings_);
  ActionProfile p = profiler.profile(burst(5.0, 2.0, 3.0));

  double quiet = mean_score(p, 0.0, 1.5);
  double loud = mean_score(p, 2.2, 2.8);
  EXPECT_NEAR(quiet, 0.0, 1e-6);
  EXPECT_GT(loud, 0.5);
  EXPECT_GT(loud, mean_score(p, 3.5, 5.0));
}

TEST_F(AudioProfilerTest, SilenceScoresZero) {
  AudioActionProfiler profiler(settings_);
  ActionProfile p = profiler.profile(make_audio(std::vector<float>(16000)));

  ASSERT_FALSE(p.empty());
  for (const auto &f : p) {
    EXPECT_FLOAT_EQ(f.score, 0.0f);
  }
}

TEST_F(AudioProfilerTest, EmptyAudioGivesEmptyProfile) {
  AudioActionProfiler profiler(settings_);
  EXPECT_TRUE(profiler.profile(make_audio({})).empty());
}

TEST_F(AudioProfilerTest, SpanExtendsProfilePastAudio) {
  AudioActionProfiler profiler(settings_);
  ActionProfile p = profiler.profile(noise(1.0), 3.0);

  ASSERT_EQ(p.size(), 188u); // ceil(3.0 * 8000 / 128)
  EXPECT_GE(p.back().timestamp + profiler.hop_seconds(SAMPLE_RATE), 3.0);

  ActionProfile only_span = profiler.profile(make_audio({}), 2.0);
  ASSERT_EQ(only_span.size(), 125u);
  for (const auto &f : only_span) {
    EXPECT_FLOAT_EQ(f.score, 0.0f);
  }
}

TEST_F(AudioProfilerTest, SpanPaddingDoesNotChangeTrackNormalization) {
  AudioActionProfiler profiler(settings_);
  PcmAudio audio = noise(1.0);

  ActionProfile track = profiler.profile(audio);
  ActionProfile padded = profiler.profile(audio, 3.0);
  ASSERT_EQ(track.size(), 63u);
  ASSERT_EQ(padded.size(), 188u);

  /// Away from the end of the track the smoothing window sees no padding
  for (size_t i = 0; i + 2 < track.size(); ++i) {
    EXPECT_FLOAT_EQ(track[i].rms, padded[i].rms) << "frame " << i;
    EXPECT_FLOAT_EQ(track[i].flux, padded[i].flux) << "frame " << i;
  }
  for (size_t i = track.size() + 2; i < padded.size(); ++i) {
    EXPECT_FLOAT_EQ(padded[i].score, 0.0f) << "frame " << i;
  }
}

TEST_F(AudioProfilerTest, PartialLastHopKeepsItsLoudness) {
  /// Constant magnitude; 8037 samples leave a last hop of 101 samples
  std::vector<float> samples(8037);
  for (size_t i = 0; i < samples.size(); ++i)
    samples[i] = (i % 2 == 0) ? 0.5f : -0.5f;

  AudioActionProfiler profiler(settings_);
  ActionProfile p = profiler.profile(make_audio(std::move(samples)));

  ASSERT_EQ(p.size(), 63u);
  /// Equal loudness in every hop normalizes to 0 everywhere
  for (const auto &f : p) {
    EXPECT_FLOAT_EQ(f.rms, 0.0f) << "t=" << f.timestamp;
  }
}

TEST_F(AudioProfilerTest, ProfileIsDeterministic) {
  AudioActionProfiler profiler(settings_);
  PcmAudio audio = noise(2.0);

  ActionProfile a = profiler.profile(audio);
  ActionProfile b = profiler.profile(audio);
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].timestamp, b[i].timestamp);
    EXPECT_EQ(a[i].score, b[i].score);
  }
}

TEST_F(AudioProfilerTest, InvalidSampleRateThrows) {
  AudioActionProfiler profiler(settings_);
  PcmAudio audio;
  audio.samples.assign(1000, 0.5f);
  audio.sample_rate = 0;
  EXPECT_THROW(profiler.profile(audio), DecodeError);
}

TEST(SignalHelpersTest, NormalizeMinMax) {
  auto out = normalize_min_max({2.0f, 4.0f, 6.0f});
  ASSERT_EQ(out.size(), 3u);
  EXPECT_FLOAT_EQ(out[0], 0.0f);
  EXPECT_FLOAT_EQ(out[1], 0.5f);
  EXPECT_FLOAT_EQ(out[2], 1.0f);

  auto flat = normalize_min_max({3.0f, 3.0f, 3.0f});
  for (float v : flat)
    EXPECT_FLOAT_EQ(v, 0.0f);

  EXPECT_TRUE(normalize_min_max({}).empty());
}

TEST(SignalHelpersTest, MovingAverageIsCentered) {
  auto out = moving_average({0.0f, 0.0f, 1.0f, 0.0f, 0.0f}, 3);
  ASSERT_EQ(out.size(), 5u);
  EXPECT_FLOAT_EQ(out[0], 0.0f);
  EXPECT_FLOAT_EQ(out[1], 1.0f / 3.0f);
  EXPECT_FLOAT_EQ(out[2], 1.0f / 3.0f);
  EXPECT_FLOAT_EQ(out[3], 1.0f / 3.0f);
  EXPECT_FLOAT_EQ(out[4], 0.0f);
}

TEST(SignalHelpersTest, MovingAverageShrinksAtEdges) {
  auto out = moving_average({1.0f, 0.0f, 0.0f, 0.0f}, 3);
  EXPECT_FLOAT_EQ(out[0], 0.5f);
  EXPECT_FLOAT_EQ(out[1], 1.0f / 3.0f);
  EXPECT_FLOAT_EQ(out[3], 0.0f);

  std::vector<float> values = {0.1f, 0.9f, 0.4f};
  EXPECT_EQ(moving_average(values, 1), values);
}

} // namespace action_shorts
