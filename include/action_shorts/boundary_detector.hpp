/**
 * @file boundary_detector.hpp
 * @brief Scene boundary detection
 *
 * @details BoundaryDetector is the seam between the selection pipeline and
 *          shot detection. ContentBoundaryDetector implements a content
 *          change detector:
 *
 *          1. Decode every video frame, downscale it to a fixed analysis
 *             width (libswscale) and convert it to HSV
 *
 *          2. Score each frame as the mean absolute difference of H, S and V
 *             against the previous frame
 *
 *          3. Cut where the score reaches the threshold and the current
 *             scene is at least min_scene_frames long
 *
 *          4. Turn the cut list into gap-free scenes covering [0, duration)
 */

#ifndef ACTION_SHORTS_BOUNDARY_DETECTOR_HPP
#define ACTION_SHORTS_BOUNDARY_DETECTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace action_shorts {

/**
 * @class BoundaryDetector
 * @brief Produces the raw scenes of a video.
 */
class BoundaryDetector {
public:
  virtual ~BoundaryDetector() = default;

  /**
   * @brief Detect scenes.
   * @return Chronological, non-overlapping, gap-free scenes covering
   *         [0, duration)
   * @throws DecodeError if the video stream cannot be read
   */
  virtual std::vector<RawScene> detect(const std::string &video) = 0;
};

/**
 * @struct HsvFrame
 * @brief Planar HSV image, 8-bit OpenCV convention (H in [0, 180)).
 */
struct HsvFrame {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> h;
  std::vector<uint8_t> s;
  std::vector<uint8_t> v;

  bool empty() const { return h.empty(); }
};

/**
 * @brief Convert packed RGB24 pixels to planar HSV.
 * @param rgb First row of pixels
 * @param stride Bytes between rows
 */
HsvFrame rgb_to_hsv(const uint8_t *rgb, int width, int height, int stride);

/**
 * @brief Mean of the per-channel mean absolute differences of H, S and V.
 * @return Score in [0, 255]; 0 when the frames differ in size
 */
double content_score(const HsvFrame &prev, const HsvFrame &curr);

/**
 * @class CutTracker
 * @brief Threshold plus minimum scene length decision.
 */
class CutTracker {
public:
  CutTracker(double threshold, int min_scene_frames)
      : threshold_(threshold), min_scene_frames_(min_scene_frames) {}

  /**
   * @brief Feed the score of one frame.
   * @param frame_index Index of the frame in decode order
   * @return true if a new scene starts at this frame
   */
  bool update(long frame_index, double score);

private:
  double threshold_;
  int min_scene_frames_;
  long last_cut_ = -1; //< Frame index of the last cut (first frame initially)
};

/**
 * @brief Build gap-free scenes from cut timestamps.
 * @note Cuts outside (0, duration) and duplicates are ignored. A video
 *       without cuts is a single scene; a non-positive duration yields none.
 */
std::vector<RawScene> scenes_from_cuts(std::vector<double> cut_times,
                                       double duration);

/**
 * @class ContentBoundaryDetector
 * @brief BoundaryDetector using HSV content change between frames.
 */
class ContentBoundaryDetector : public BoundaryDetector {
public:
  explicit ContentBoundaryDetector(const AnalysisSettings &settings)
      : settings_(settings) {}

  std::vector<RawScene> detect(const std::string &video) override;

private:
  AnalysisSettings settings_;
};

} // namespace action_shorts

#endif // ACTION_SHORTS_BOUNDARY_DETECTOR_HPP
