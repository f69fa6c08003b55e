/**
 * @file batch_processor.hpp
 * @brief Sequential processing of a list of videos
 *
 * @details The BatchProcessor runs one ShortSelectionPipeline unit of work
 *          per video, hands every shortlisted range to the Renderer and
 *          keeps a per-video result for the final summary.
 *
 *          - Videos are processed one at a time, each to completion
 *
 *          - A DecodeError skips that video (logged, counted as failed)
 *
 *          - An empty shortlist renders one fallback short named after
 *            the source (see fallback_range)
 *
 *          - Render failures are counted; the batch continues
 */

#ifndef ACTION_SHORTS_BATCH_PROCESSOR_HPP
#define ACTION_SHORTS_BATCH_PROCESSOR_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "pipeline.hpp"
#include "renderer.hpp"

namespace action_shorts {

/**
 * @struct VideoResult
 * @brief Result of processing a single video.
 */
struct VideoResult {
  std::string filename;        //< Input filename
  bool success = false;        //< Decoded and every render succeeded
  int scenes_selected = 0;     //< Shortlist length
  int scenes_rendered = 0;     //< Renders that succeeded
  int render_failures = 0;     //< Renders that failed after retries
  bool used_fallback = false;  //< Empty shortlist, fallback range rendered
  std::string error;           //< Reason for a skipped video
  long processing_time_us = 0; //< Processing time in microseconds
};

/**
 * @class BatchProcessor
 * @brief Per-file loop over the selection pipeline and the renderer.
 */
class BatchProcessor {
public:
  /**
   * @param pipeline Selection pipeline (not owned)
   * @param renderer Render stage (not owned)
   * @param config Selection parameters for every video
   */
  BatchProcessor(const ShortSelectionPipeline &pipeline, Renderer &renderer,
                 const ShortsConfig &config);

  /**
   * @brief Process all video files in the input list.
   * @param input_files Video file paths, processed in the given order
   * @param output_dir Output directory for rendered shorts
   * @return Number of failed videos (0 = all succeeded)
   */
  int process(const std::vector<std::string> &input_files,
              const std::string &output_dir);

  const std::vector<VideoResult> &results() const { return results_; }

private:
  const ShortSelectionPipeline &pipeline_;
  Renderer &renderer_;
  ShortsConfig config_;
  std::vector<VideoResult> results_;

  VideoResult process_one(const std::string &file,
                          const std::string &output_dir);

  /// Render the fallback range of a video whose shortlist is empty
  void render_fallback(const std::string &file, double duration,
                       const std::string &output_dir, VideoResult &result);

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec);
};

/**
 * @brief Video files of a directory, sorted by path.
 * @note Extensions .mp4 .mkv .mov .avi .ts .webm, case-insensitive.
 */
std::vector<std::string> collect_video_files(const std::string &dir);

} // namespace action_shorts

#endif // ACTION_SHORTS_BATCH_PROCESSOR_HPP
