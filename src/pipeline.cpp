/**
 * @file pipeline.cpp
 * @brief Short selection pipeline implementation
 */

#include "action_shorts/pipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include "action_shorts/logging.hpp"
#include "action_shorts/scene_ranker.hpp"
#include "action_shorts/scene_segmenter.hpp"

namespace action_shorts {

ShortSelectionPipeline::ShortSelectionPipeline(BoundaryDetector &detector,
                                               AudioDecoder &decoder,
                                               const AnalysisSettings &settings)
    : detector_(detector), decoder_(decoder), profiler_(settings) {}

Shortlist ShortSelectionPipeline::run(const std::string &video,
                                      const ShortsConfig &config) const {
  return select(video, config).shortlist;
}

Selection ShortSelectionPipeline::select(const std::string &video,
                                         const ShortsConfig &config) const {
  TIMER_START(total_run);
  const ShortsConfig cfg = config.sanitized();

  LOG_PHASE("Process: {}", std::filesystem::path(video).filename().string());

  // **----- PHASE 1: AUDIO -----**

  /// Decoded first: an unreadable track skips the video before the more
  /// expensive frame decode
  LOG_PHASE("Decoding audio...");
  PcmAudio audio = decoder_.decode(video);

  // **----- PHASE 2: SCENES -----**

  LOG_PHASE("Detecting scenes...");
  std::vector<RawScene> raw = detector_.detect(video);

  TIMER_START(combine);
  std::vector<CombinedScene> combined =
      combine_scenes(raw, cfg.max_combined_scene_length);
  TIMER_END(combine);

  LOG_INFO("Combined scenes list:");
  for (size_t i = 0; i < combined.size(); ++i) {
    const CombinedScene &s = combined[i];
    LOG_INFO("    Combined Scene {:2d}: Duration {:.1f} Start {}, End {}",
             i + 1, s.duration(), format_timecode(s.start),
             format_timecode(s.end));
  }

  // **----- PHASE 3: ACTION PROFILE -----**

  LOG_PHASE("Profiling audio...");
  double span = audio.duration;
  if (audio.sample_rate > 0) {
    span = std::max(span, static_cast<double>(audio.samples.size()) /
                              audio.sample_rate);
  }
  if (!raw.empty())
    span = std::max(span, raw.back().end);
  ActionProfile profile = profiler_.profile(audio, span);

  // **----- PHASE 4: RANKING -----**

  TIMER_START(rank);
  Shortlist shortlist = rank_scenes(profile, combined, cfg);
  TIMER_END(rank);

  if (shortlist.empty()) {
    LOG_WARN("No scene between {:.1f}s and {:.1f}s", cfg.min_short_length,
             cfg.max_short_length);
  } else {
    LOG_INFO("Shortlist (top {} by action score):", cfg.scene_limit);
    for (size_t i = 0; i < shortlist.size(); ++i) {
      const RankedScene &r = shortlist[i];
      LOG_INFO("    Scene {:2d}: Score {:.3f} Duration {:.1f} Start {}, End {}",
               i + 1, r.action_score, r.scene.duration(),
               format_timecode(r.scene.start), format_timecode(r.scene.end));
    }
  }

  TIMER_END(total_run);
  return {std::move(shortlist), span};
}

std::vector<TimeRange> shortlist_ranges(const Shortlist &shortlist) {
  std::vector<TimeRange> ranges;
  ranges.reserve(shortlist.size());
  for (const RankedScene &r : shortlist)
    ranges.push_back(r.scene);
  return ranges;
}

std::optional<TimeRange> fallback_range(double duration,
                                        const ShortsConfig &config) {
  if (!(duration > 0))
    return std::nullopt;
  const ShortsConfig cfg = config.sanitized();
  const double length = std::min(duration, cfg.max_short_length);
  const double start = std::max(0.0, std::min(10.0, duration - length));
  return TimeRange{start, start + length};
}

} // namespace action_shorts
