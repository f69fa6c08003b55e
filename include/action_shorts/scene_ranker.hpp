/**
 * @file scene_ranker.hpp
 * @brief Audio-driven ranking of combined scenes
 *
 * @details Scoring uses half-open ranges: a frame belongs to a scene when
 *          start <= timestamp < end. Profile and scenes are both sorted in
 *          time, so all scenes are scored in one sweep over the profile.
 */

#ifndef ACTION_SHORTS_SCENE_RANKER_HPP
#define ACTION_SHORTS_SCENE_RANKER_HPP

#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace action_shorts {

/**
 * @brief Mean action score of every scene.
 * @param profile Chronological action frames
 * @param scenes Scenes in any order (sorted internally if needed)
 * @return One score per scene, in the order of scenes; 0 for a scene
 *         without frames
 */
std::vector<double> score_scenes(const ActionProfile &profile,
                                 const std::vector<CombinedScene> &scenes);

/**
 * @brief Build the shortlist.
 *
 * @details
 *   1. Drop scenes whose duration is outside
 *      [min_short_length, max_short_length]
 *
 *   2. Score the rest
 *
 *   3. Sort by score, descending; equal scores keep chronological order
 *
 *   4. Keep the first scene_limit entries
 */
Shortlist rank_scenes(const ActionProfile &profile,
                      const std::vector<CombinedScene> &scenes,
                      const ShortsConfig &config);

} // namespace action_shorts

#endif // ACTION_SHORTS_SCENE_RANKER_HPP
