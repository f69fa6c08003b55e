/**
 * @file audio_profiler.cpp
 * @brief RMS / spectral flux action profile implementation
 */

#include "action_shorts/audio_profiler.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

extern "C" {
#include <libavutil/mem.h>
#include <libavutil/tx.h>
}

#include "action_shorts/errors.hpp"
#include "action_shorts/logging.hpp"

namespace action_shorts {

// **---- Signal Helpers ----**

std::vector<float> normalize_min_max(const std::vector<float> &values) {
  std::vector<float> out(values.size(), 0.0f);
  if (values.empty())
    return out;

  auto [mn_it, mx_it] = std::minmax_element(values.begin(), values.end());
  const double mn = *mn_it;
  const double range = static_cast<double>(*mx_it) - mn;
  if (!(range > 0.0))
    return out;

  for (size_t i = 0; i < values.size(); ++i) {
    double v = (values[i] - mn) / range;
    out[i] = static_cast<float>(std::clamp(v, 0.0, 1.0));
  }
  return out;
}

std::vector<float> moving_average(const std::vector<float> &values,
                                  int window) {
  const size_t n = values.size();
  if (window <= 1 || n == 0)
    return values;

  /// Prefix sums in double so the result does not depend on summation order
  std::vector<double> prefix(n + 1, 0.0);
  for (size_t i = 0; i < n; ++i)
    prefix[i + 1] = prefix[i] + values[i];

  const size_t before = static_cast<size_t>(window - 1) / 2;
  const size_t after = static_cast<size_t>(window) / 2;

  std::vector<float> out(n);
  for (size_t i = 0; i < n; ++i) {
    size_t lo = (i >= before) ? i - before : 0;
    size_t hi = std::min(n, i + after + 1);
    double mean = (prefix[hi] - prefix[lo]) / static_cast<double>(hi - lo);
    out[i] = static_cast<float>(std::clamp(mean, 0.0, 1.0));
  }
  return out;
}

namespace {

constexpr double PI = 3.14159265358979323846;

/**
 * @brief Min-max normalize the first track_frames values by their own range;
 *        padding frames after them are 0.
 */
std::vector<float> normalize_over_track(const std::vector<float> &values,
                                        size_t track_frames) {
  track_frames = std::min(track_frames, values.size());
  std::vector<float> out = normalize_min_max(std::vector<float>(
      values.begin(), values.begin() + static_cast<std::ptrdiff_t>(track_frames)));
  out.resize(values.size(), 0.0f);
  return out;
}

/**
 * @class FftPlan
 * @brief RAII owner of a complex float FFT context and its buffers.
 */
class FftPlan {
public:
  explicit FftPlan(int size) : size_(size) {
    float scale = 1.0f;
    int ret = av_tx_init(&ctx_, &fn_, AV_TX_FLOAT_FFT, 0, size, &scale, 0);
    if (ret < 0 || !ctx_) {
      throw std::runtime_error(
          fmt::format("cannot create FFT of size {}", size));
    }
    in_ = static_cast<AVComplexFloat *>(
        av_calloc(size, sizeof(AVComplexFloat)));
    out_ = static_cast<AVComplexFloat *>(
        av_calloc(size, sizeof(AVComplexFloat)));
    if (!in_ || !out_) {
      release();
      throw std::runtime_error("cannot allocate FFT buffers");
    }
  }

  ~FftPlan() { release(); }

  FftPlan(const FftPlan &) = delete;
  FftPlan &operator=(const FftPlan &) = delete;

  /// Input buffer (size() entries)
  AVComplexFloat *input() { return in_; }

  /**
   * @brief Transform the input and write |X[k]| for k in [0, size/2].
   */
  void magnitudes(std::vector<float> &mag) {
    fn_(ctx_, out_, in_, sizeof(AVComplexFloat));
    const int bins = size_ / 2 + 1;
    mag.resize(bins);
    for (int k = 0; k < bins; ++k) {
      mag[k] = std::sqrt(out_[k].re * out_[k].re + out_[k].im * out_[k].im);
    }
  }

private:
  void release() {
    av_tx_uninit(&ctx_);
    av_freep(&in_);
    av_freep(&out_);
  }

  int size_;
  AVTXContext *ctx_ = nullptr;
  av_tx_fn fn_ = nullptr;
  AVComplexFloat *in_ = nullptr;
  AVComplexFloat *out_ = nullptr;
};

} // namespace

// **---- AudioActionProfiler ----**

AudioActionProfiler::AudioActionProfiler(const AnalysisSettings &settings) {
  const AnalysisSettings s = settings.sanitized();
  window_size_ = s.window_size;
  hop_size_ = s.hop_size;
  smoothing_frames_ = s.smoothing_frames;
}

ActionProfile AudioActionProfiler::profile(const PcmAudio &audio,
                                           double span_sec) const {
  if (audio.sample_rate <= 0) {
    throw DecodeError(
        fmt::format("invalid sample rate {}", audio.sample_rate));
  }

  TIMER_START(audio_profile);

  const size_t n = audio.samples.size();
  const size_t hop = static_cast<size_t>(hop_size_);
  const size_t win = static_cast<size_t>(window_size_);

  /// Hops that start inside the samples; the rest pad the span with silence
  const size_t track_frames = (n + hop - 1) / hop;
  size_t frames = track_frames;
  if (span_sec > 0) {
    const double span_samples = span_sec * audio.sample_rate;
    frames = std::max(frames,
                      static_cast<size_t>(std::ceil(span_samples / hop)));
  }

  ActionProfile profile;
  if (frames == 0) {
    TIMER_END(audio_profile);
    return profile;
  }

  /// Periodic Hann window
  std::vector<float> hann(win);
  for (size_t i = 0; i < win; ++i) {
    hann[i] = static_cast<float>(
        0.5 - 0.5 * std::cos(2.0 * PI * static_cast<double>(i) / win));
  }

  std::vector<float> rms(frames, 0.0f);
  std::vector<float> flux(frames, 0.0f);

  FftPlan fft(window_size_);
  std::vector<float> mag;
  std::vector<float> prev_mag(win / 2 + 1, 0.0f);

  const float *x = audio.samples.data();
  for (size_t f = 0; f < frames; ++f) {
    const size_t start = f * hop;

    // **----- RMS -----**

    double energy = 0.0;
    const size_t avail = (start < n) ? std::min(win, n - start) : 0;
    for (size_t i = 0; i < avail; ++i) {
      energy += static_cast<double>(x[start + i]) * x[start + i];
    }
    /// Mean over the samples present, so the last partial hop is not
    /// attenuated by the missing tail
    rms[f] = (avail > 0) ? static_cast<float>(std::sqrt(energy / avail))
                         : 0.0f;

    // **----- SPECTRAL FLUX -----**

    if (avail == 0) {
      mag.assign(prev_mag.size(), 0.0f);
    } else {
      AVComplexFloat *in = fft.input();
      for (size_t i = 0; i < win; ++i) {
        in[i].re = (i < avail) ? x[start + i] * hann[i] : 0.0f;
        in[i].im = 0.0f;
      }
      fft.magnitudes(mag);
    }

    if (f > 0) {
      double rise = 0.0;
      for (size_t k = 0; k < mag.size(); ++k) {
        float d = mag[k] - prev_mag[k];
        if (d > 0)
          rise += d;
      }
      flux[f] = static_cast<float>(rise);
    }
    prev_mag.swap(mag);
  }

  std::vector<float> rms_n = moving_average(
      normalize_over_track(rms, track_frames), smoothing_frames_);
  std::vector<float> flux_n = moving_average(
      normalize_over_track(flux, track_frames), smoothing_frames_);

  profile.resize(frames);
  for (size_t f = 0; f < frames; ++f) {
    ActionFrame &af = profile[f];
    af.timestamp = static_cast<double>(f * hop) / audio.sample_rate;
    af.rms = rms_n[f];
    af.flux = flux_n[f];
    af.score = std::clamp(RMS_WEIGHT * af.rms + FLUX_WEIGHT * af.flux, 0.0f,
                          1.0f);
  }

  TIMER_END(audio_profile);

  LOG_DEBUG("Action profile: {} frames, hop {:.1f}ms", frames,
            hop_seconds(audio.sample_rate) * 1000.0);
  return profile;
}

} // namespace action_shorts
