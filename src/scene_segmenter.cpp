/**
 * @file scene_segmenter.cpp
 * @brief Greedy merge of adjacent raw scenes
 */

#include "action_shorts/scene_segmenter.hpp"

#include "action_shorts/logging.hpp"

namespace action_shorts {

std::vector<CombinedScene> combine_scenes(const std::vector<RawScene> &raw,
                                          double max_combined_length) {
  std::vector<CombinedScene> combined;
  combined.reserve(raw.size());

  bool open = false;
  CombinedScene running{0.0, 0.0};
  double running_duration = 0.0;

  for (const RawScene &scene : raw) {
    const double d = scene.duration();
    if (!(d > 0)) {
      LOG_WARN("Ignoring empty scene {} - {}", format_timecode(scene.start),
               format_timecode(scene.end));
      continue;
    }

    if (open && running_duration + d <= max_combined_length) {
      running.end = scene.end;
      running_duration += d;
      continue;
    }

    if (open)
      combined.push_back(running);
    running = scene;
    running_duration = d;
    open = true;
  }

  if (open)
    combined.push_back(running);

  return combined;
}

} // namespace action_shorts
