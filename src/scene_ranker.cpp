/**
 * @file scene_ranker.cpp
 * @brief Audio-driven ranking of combined scenes
 */

#include "action_shorts/scene_ranker.hpp"

#include <algorithm>
#include <numeric>

namespace action_shorts {

std::vector<double> score_scenes(const ActionProfile &profile,
                                 const std::vector<CombinedScene> &scenes) {
  std::vector<double> scores(scenes.size(), 0.0);

  /// Visit scenes by start time so the frame cursor only moves forward
  std::vector<size_t> order(scenes.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return scenes[a].start < scenes[b].start;
  });

  size_t first = 0;
  for (size_t idx : order) {
    const CombinedScene &scene = scenes[idx];
    while (first < profile.size() && profile[first].timestamp < scene.start)
      ++first;

    double sum = 0.0;
    size_t count = 0;
    for (size_t k = first;
         k < profile.size() && profile[k].timestamp < scene.end; ++k) {
      sum += profile[k].score;
      ++count;
    }
    scores[idx] = (count > 0) ? sum / static_cast<double>(count) : 0.0;
  }
  return scores;
}

Shortlist rank_scenes(const ActionProfile &profile,
                      const std::vector<CombinedScene> &scenes,
                      const ShortsConfig &config) {
  std::vector<CombinedScene> eligible;
  eligible.reserve(scenes.size());
  for (const CombinedScene &scene : scenes) {
    const double d = scene.duration();
    if (d >= config.min_short_length && d <= config.max_short_length)
      eligible.push_back(scene);
  }

  /// Chronological order is the tie-break
  std::stable_sort(eligible.begin(), eligible.end(),
                   [](const CombinedScene &a, const CombinedScene &b) {
                     return a.start < b.start;
                   });

  std::vector<double> scores = score_scenes(profile, eligible);

  Shortlist shortlist;
  shortlist.reserve(eligible.size());
  for (size_t i = 0; i < eligible.size(); ++i)
    shortlist.push_back({eligible[i], scores[i]});

  std::stable_sort(shortlist.begin(), shortlist.end(),
                   [](const RankedScene &a, const RankedScene &b) {
                     return a.action_score > b.action_score;
                   });

  const size_t limit = static_cast<size_t>(std::max(0, config.scene_limit));
  if (shortlist.size() > limit)
    shortlist.resize(limit);
  return shortlist;
}

} // namespace action_shorts
