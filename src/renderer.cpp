/**
 * @file renderer.cpp
 * @brief ffmpeg CLI rendering implementation
 */

#include "action_shorts/renderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>

#include <fmt/core.h>

#include "action_shorts/errors.hpp"
#include "action_shorts/logging.hpp"

namespace action_shorts {

namespace fs = std::filesystem;

// **---- Geometry ----**

CropRect crop_to_ratio(int width, int height, int ratio_w, int ratio_h,
                       double x_center, double y_center) {
  const double current_ratio = static_cast<double>(width) / height;
  const double target_ratio = static_cast<double>(ratio_w) / ratio_h;

  int crop_w = width;
  int crop_h = height;
  if (current_ratio > target_ratio) {
    crop_w = static_cast<int>(
        std::lround(static_cast<double>(height) * ratio_w / ratio_h));
  } else {
    crop_h = static_cast<int>(
        std::lround(static_cast<double>(width) / ratio_w * ratio_h));
  }
  crop_w = std::clamp(crop_w, 2, width) & ~1;
  crop_h = std::clamp(crop_h, 2, height) & ~1;

  const double cx = width * x_center;
  const double cy = height * y_center;
  int x = static_cast<int>(std::lround(cx - crop_w / 2.0));
  int y = static_cast<int>(std::lround(cy - crop_h / 2.0));
  x = std::clamp(x, 0, width - crop_w);
  y = std::clamp(y, 0, height - crop_h);

  return {x, y, crop_w, crop_h};
}

std::pair<int, int> select_background_resolution(int width) {
  if (width < 840)
    return {720, 1280};
  if (width < 1020)
    return {900, 1600};
  if (width < 1320)
    return {1080, 1920};
  if (width < 1680)
    return {1440, 2560};
  if (width < 2040)
    return {1800, 3200};
  return {2160, 3840};
}

std::string build_filter_graph(const VideoInfo &info,
                               const ShortsConfig &config) {
  const double target_ratio =
      static_cast<double>(config.target_ratio_w) / config.target_ratio_h;
  const double source_ratio = static_cast<double>(info.width) / info.height;

  /// Foreground: optional crop to the target ratio
  std::string fg_crop;
  int fg_w = info.width;
  int fg_h = info.height;
  if (source_ratio > target_ratio) {
    CropRect c = crop_to_ratio(info.width, info.height, config.target_ratio_w,
                               config.target_ratio_h, config.x_center,
                               config.y_center);
    fg_crop = fmt::format("crop={}:{}:{}:{},", c.width, c.height, c.x, c.y);
    fg_w = c.width;
    fg_h = c.height;
  }

  auto [out_w, out_h] = select_background_resolution(fg_w);
  const std::string fps_cap = (info.fps > 60.0) ? ",fps=60" : "";

  std::string bg_chain;
  if (fg_w >= fg_h) {
    CropRect b = crop_to_ratio(info.width, info.height, 1, 1, config.x_center,
                               config.y_center);
    bg_chain = fmt::format(
        "crop={}:{}:{}:{},scale=720:720,gblur=sigma=8,scale={}:{},setsar=1",
        b.width, b.height, b.x, b.y, out_w, out_w);
  } else if (static_cast<double>(fg_w) / 9.0 <
             static_cast<double>(fg_h) / 16.0) {
    CropRect b = crop_to_ratio(info.width, info.height, 9, 16, config.x_center,
                               config.y_center);
    bg_chain = fmt::format(
        "crop={}:{}:{}:{},scale=720:1280,gblur=sigma=8,scale={}:{},setsar=1",
        b.width, b.height, b.x, b.y, out_w, out_h);
  }

  if (bg_chain.empty()) {
    return fmt::format("[0:v]{}scale={}:-2,setsar=1{}[v]", fg_crop, out_w,
                       fps_cap);
  }

  return fmt::format("[0:v]split=2[fg][bg];"
                     "[fg]{}scale={}:-2,setsar=1[fgs];"
                     "[bg]{}[bgs];"
                     "[bgs][fgs]overlay=(W-w)/2:(H-h)/2{}[v]",
                     fg_crop, out_w, bg_chain, fps_cap);
}

std::string scene_output_name(const std::string &video, size_t index) {
  fs::path p(video);
  return fmt::format("{} scene-{}{}", p.stem().string(), index,
                     p.extension().string());
}

std::string shell_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

// **---- FfmpegRenderer ----**

FfmpegRenderer::FfmpegRenderer(const ShortsConfig &config,
                               std::string ffmpeg_bin)
    : config_(config.sanitized()), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

std::string FfmpegRenderer::build_command(const std::string &video,
                                          const VideoInfo &info,
                                          const TimeRange &range,
                                          const std::string &output_path) const {
  return fmt::format(
      "{} -y -hide_banner -loglevel error -ss {:.3f} -i {} -t {:.3f} "
      "-filter_complex {} -map \"[v]\" -map \"0:a?\" "
      "-c:v libx264 -pix_fmt yuv420p -c:a aac -movflags +faststart {}",
      shell_quote(ffmpeg_bin_), range.start, shell_quote(video),
      range.duration(), shell_quote(build_filter_graph(info, config_)),
      shell_quote(output_path));
}

int FfmpegRenderer::execute(const std::string &cmd) {
  return std::system(cmd.c_str());
}

VideoInfo FfmpegRenderer::inspect(const std::string &video) {
  return inspect_video(video);
}

bool FfmpegRenderer::render(const std::string &video, const TimeRange &range,
                            const std::string &output_path) {
  VideoInfo info;
  try {
    info = inspect(video);
  } catch (const DecodeError &e) {
    LOG_ERROR("Cannot render {}: {}", output_path, e.what());
    return false;
  }

  const std::string cmd = build_command(video, info, range, output_path);
  LOG_DEBUG("{}", cmd);

  const int attempts = 1 + config_.max_error_depth;
  for (int attempt = 0; attempt < attempts; ++attempt) {
    TIMER_START(render);
    int status = execute(cmd);
    TIMER_END(render);

    if (status == 0) {
      LOG_SUCCESS("Output saved to: {}", output_path);
      return true;
    }

    int exit_code = (status >> 8) & 0xFF;
    if (attempt + 1 < attempts) {
      LOG_WARN("Rendering failed (exit code {}), retrying ({}/{})...",
               exit_code, attempt + 1, config_.max_error_depth);
    } else {
      LOG_ERROR("Rendering failed after {} attempts (exit code {}): {}",
                attempts, exit_code, output_path);
    }
  }
  return false;
}

} // namespace action_shorts
