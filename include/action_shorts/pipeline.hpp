/**
 * @file pipeline.hpp
 * @brief Short selection pipeline orchestration
 *
 * @details The ShortSelectionPipeline turns one source video into a
 *          Shortlist:
 *
 *          1. Decode the audio track to mono PCM
 *
 *          2. Detect raw scenes
 *
 *          3. Merge adjacent scenes up to MAX_COMBINED_SCENE_LENGTH
 *
 *          4. Profile the audio over the whole source duration
 *
 *          5. Rank the combined scenes by mean action score
 *
 * @note One run() call is one unit of work. The pipeline keeps no state
 *       between calls; every ActionProfile and Shortlist belongs to the
 *       call that produced it.
 */

#ifndef ACTION_SHORTS_PIPELINE_HPP
#define ACTION_SHORTS_PIPELINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "audio_decoder.hpp"
#include "audio_profiler.hpp"
#include "boundary_detector.hpp"
#include "config.hpp"
#include "types.hpp"

namespace action_shorts {

/**
 * @struct Selection
 * @brief Shortlist of one video and the duration it was selected from.
 */
struct Selection {
  Shortlist shortlist;
  double duration = 0.0; //< max(audio duration, end of the last scene)
};

/**
 * @class ShortSelectionPipeline
 * @brief Orchestrates decoding, segmentation, profiling and ranking.
 */
class ShortSelectionPipeline {
public:
  /**
   * @param detector Scene boundary source (not owned)
   * @param decoder Audio source (not owned)
   * @param settings Analysis tuning
   */
  ShortSelectionPipeline(BoundaryDetector &detector, AudioDecoder &decoder,
                         const AnalysisSettings &settings = AnalysisSettings());

  /**
   * @brief Select the shortlist of one video.
   * @return Ranked scenes, best first (possibly empty)
   * @throws DecodeError if the audio or video of the source is unreadable
   */
  Shortlist run(const std::string &video, const ShortsConfig &config) const;

  /**
   * @brief Same as run(), also reporting the analysed source duration.
   */
  Selection select(const std::string &video, const ShortsConfig &config) const;

private:
  BoundaryDetector &detector_;
  AudioDecoder &decoder_;
  AudioActionProfiler profiler_;
};

/**
 * @brief Time ranges of a shortlist, in shortlist order.
 */
std::vector<TimeRange> shortlist_ranges(const Shortlist &shortlist);

/**
 * @brief Range rendered when no scene qualifies.
 *
 * @details Length L = min(duration, max_short_length), starting at
 *          max(0, min(10, duration - L)) so intros are skipped when the
 *          video is long enough.
 *
 * @return std::nullopt for a non-positive duration
 */
std::optional<TimeRange> fallback_range(double duration,
                                        const ShortsConfig &config);

} // namespace action_shorts

#endif // ACTION_SHORTS_PIPELINE_HPP
