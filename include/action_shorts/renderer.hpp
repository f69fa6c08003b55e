/**
 * @file renderer.hpp
 * @brief Rendering of selected time ranges with the ffmpeg CLI
 *
 * @details Renderer is the seam between the selection pipeline and the
 *          render stage. FfmpegRenderer builds one ffmpeg command per range:
 *
 *          - Crop to TARGET_RATIO_W:TARGET_RATIO_H around (X_CENTER,
 *            Y_CENTER) when the source is wider than the target ratio
 *
 *          - Scale the result to the output width picked from its width
 *
 *          - Landscape/square results sit on a square blurred background,
 *            results narrower than 9:16 on a 9:16 blurred background
 *
 *          - H.264 + AAC, at most 60 fps
 *
 *          A failed render is retried up to MAX_ERROR_DEPTH more times.
 */

#ifndef ACTION_SHORTS_RENDERER_HPP
#define ACTION_SHORTS_RENDERER_HPP

#include <cstddef>
#include <string>
#include <utility>

#include "config.hpp"
#include "media_input.hpp"
#include "types.hpp"

namespace action_shorts {

/**
 * @class Renderer
 * @brief Writes one time range of a video to a file.
 */
class Renderer {
public:
  virtual ~Renderer() = default;

  /**
   * @brief Render [range.start, range.end) of video to output_path.
   * @return true on success, false once every attempt failed
   */
  virtual bool render(const std::string &video, const TimeRange &range,
                      const std::string &output_path) = 0;
};

/**
 * @struct CropRect
 * @brief Crop window in pixels.
 */
struct CropRect {
  int x;
  int y;
  int width;
  int height;
};

/**
 * @brief Crop window of ratio ratio_w:ratio_h centred on
 *        (width * x_center, height * y_center).
 * @note The window is clamped inside the frame and its size rounded down
 *       to even values for 4:2:0 output.
 */
CropRect crop_to_ratio(int width, int height, int ratio_w, int ratio_h,
                       double x_center, double y_center);

/**
 * @brief Output (width, height) for a clip of the given width.
 */
std::pair<int, int> select_background_resolution(int width);

/**
 * @brief ffmpeg -filter_complex graph producing [v].
 */
std::string build_filter_graph(const VideoInfo &info,
                               const ShortsConfig &config);

/**
 * @brief File name "<stem> scene-<index><ext>" for the index-th range.
 */
std::string scene_output_name(const std::string &video, size_t index);

/**
 * @brief Single-quote a string for /bin/sh.
 */
std::string shell_quote(const std::string &s);

/**
 * @class FfmpegRenderer
 * @brief Renderer running the ffmpeg command-line tool.
 */
class FfmpegRenderer : public Renderer {
public:
  /**
   * @param config Ratio, crop centre and retry depth
   * @param ffmpeg_bin ffmpeg executable (FFMPEG_BIN)
   */
  explicit FfmpegRenderer(const ShortsConfig &config,
                          std::string ffmpeg_bin = "ffmpeg");

  bool render(const std::string &video, const TimeRange &range,
              const std::string &output_path) override;

  /**
   * @brief Full shell command for one render attempt.
   */
  std::string build_command(const std::string &video, const VideoInfo &info,
                            const TimeRange &range,
                            const std::string &output_path) const;

protected:
  /// Run a shell command, return its exit status
  virtual int execute(const std::string &cmd);

  /// Inspect the source video
  virtual VideoInfo inspect(const std::string &video);

private:
  ShortsConfig config_;
  std::string ffmpeg_bin_;
};

} // namespace action_shorts

#endif // ACTION_SHORTS_RENDERER_HPP
