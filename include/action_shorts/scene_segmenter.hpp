/**
 * @file scene_segmenter.hpp
 * @brief Greedy merge of adjacent raw scenes
 */

#ifndef ACTION_SHORTS_SCENE_SEGMENTER_HPP
#define ACTION_SHORTS_SCENE_SEGMENTER_HPP

#include <vector>

#include "types.hpp"

namespace action_shorts {

/**
 * @brief Merge chronologically adjacent raw scenes.
 *
 * @details Walks the scenes in order, appending each to the running
 *          combination while running + next stays within
 *          max_combined_length, otherwise closing the running combination
 *          and starting a new one. A single scene longer than the cap is
 *          kept as its own combined scene; it is never split.
 *
 * @param raw Chronological raw scenes
 * @param max_combined_length Cap on the summed duration of a combination
 * @return Chronological combined scenes
 */
std::vector<CombinedScene> combine_scenes(const std::vector<RawScene> &raw,
                                          double max_combined_length);

} // namespace action_shorts

#endif // ACTION_SHORTS_SCENE_SEGMENTER_HPP
