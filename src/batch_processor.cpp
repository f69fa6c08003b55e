/**
 * @file batch_processor.cpp
 * @brief Sequential batch processing implementation
 */

#include "action_shorts/batch_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "action_shorts/errors.hpp"
#include "action_shorts/logging.hpp"

namespace action_shorts {

namespace fs = std::filesystem;

BatchProcessor::BatchProcessor(const ShortSelectionPipeline &pipeline,
                               Renderer &renderer, const ShortsConfig &config)
    : pipeline_(pipeline), renderer_(renderer), config_(config.sanitized()) {}

int BatchProcessor::process(const std::vector<std::string> &input_files,
                            const std::string &output_dir) {
  results_.clear();
  if (input_files.empty()) {
    LOG_WARN("No input files to process");
    return 0;
  }

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Files to process: {}", input_files.size());
  LOG_INFO("Output directory: {}", output_dir);
  LOG_PHASE("=======================================================");

  auto batch_start = std::chrono::steady_clock::now();

  for (size_t i = 0; i < input_files.size(); ++i) {
    LOG_PHASE("----------------------------------------");
    LOG_INFO("Progress: {}/{}", i + 1, input_files.size());

    VideoResult result = process_one(input_files[i], output_dir);

    if (result.success) {
      LOG_SUCCESS("Completed: {} ({} shorts, {:.1f}s)", result.filename,
                  result.scenes_rendered, result.processing_time_us / 1e6);
    } else {
      LOG_ERROR("Failed: {}", result.filename);
    }
    results_.push_back(std::move(result));

    TimingCollector::print_summary();
    TimingCollector::clear();
  }

  auto batch_end = std::chrono::steady_clock::now();
  double elapsed_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();

  print_batch_summary(elapsed_sec);

  return static_cast<int>(
      std::count_if(results_.begin(), results_.end(),
                    [](const VideoResult &r) { return !r.success; }));
}

VideoResult BatchProcessor::process_one(const std::string &file,
                                        const std::string &output_dir) {
  VideoResult result;
  result.filename = fs::path(file).filename().string();
  auto start_time = std::chrono::steady_clock::now();

  try {
    Selection selection = pipeline_.select(file, config_);
    result.scenes_selected = static_cast<int>(selection.shortlist.size());

    if (selection.shortlist.empty()) {
      render_fallback(file, selection.duration, output_dir, result);
    }

    std::vector<TimeRange> ranges = shortlist_ranges(selection.shortlist);
    for (size_t i = 0; i < ranges.size(); ++i) {
      std::string output_file =
          (fs::path(output_dir) / scene_output_name(file, i)).string();
      LOG_PHASE("Rendering {} ({} - {})...",
                fs::path(output_file).filename().string(),
                format_timecode(ranges[i].start),
                format_timecode(ranges[i].end));
      if (renderer_.render(file, ranges[i], output_file)) {
        ++result.scenes_rendered;
      } else {
        ++result.render_failures;
      }
    }
    result.success = (result.render_failures == 0);
  } catch (const DecodeError &e) {
    LOG_ERROR("Skipping {}: {}", result.filename, e.what());
    result.error = e.what();
  } catch (const std::exception &e) {
    LOG_ERROR("Skipping {} after unexpected error: {}", result.filename,
              e.what());
    result.error = e.what();
  }

  auto end_time = std::chrono::steady_clock::now();
  result.processing_time_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                            start_time)
          .count();
  return result;
}

void BatchProcessor::render_fallback(const std::string &file, double duration,
                                     const std::string &output_dir,
                                     VideoResult &result) {
  std::optional<TimeRange> range = fallback_range(duration, config_);
  if (!range) {
    LOG_WARN("No duration known for {}; nothing to render", result.filename);
    return;
  }

  /// The fallback short keeps the source file name
  fs::path output_file = fs::path(output_dir) / fs::path(file).filename();
  std::error_code ec;
  if (fs::equivalent(output_file, file, ec)) {
    LOG_ERROR("Fallback output {} would overwrite its source",
              output_file.string());
    ++result.render_failures;
    return;
  }

  LOG_PHASE("Rendering fallback {} ({} - {})...",
            output_file.filename().string(), format_timecode(range->start),
            format_timecode(range->end));
  result.used_fallback = true;
  if (renderer_.render(file, *range, output_file.string())) {
    ++result.scenes_rendered;
  } else {
    ++result.render_failures;
  }
}

void BatchProcessor::print_batch_summary(double wall_clock_sec) {
  int total = static_cast<int>(results_.size());
  int success = 0;
  int failed = 0;
  int rendered = 0;
  int render_failures = 0;
  int fallbacks = 0;

  for (const auto &result : results_) {
    if (result.success) {
      success++;
    } else {
      failed++;
    }
    rendered += result.scenes_rendered;
    render_failures += result.render_failures;
    if (result.used_fallback)
      fallbacks++;
  }

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH PROCESSING SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", total);
  fmt::print("{:<25} {:>25}\n", "Successful:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Shorts rendered:", rendered);
  fmt::print("{:<25} {:>25}\n", "Render failures:", render_failures);
  fmt::print("{:<25} {:>25}\n", "Fallback shorts:", fallbacks);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);

  if (total > 0) {
    fmt::print("{:<25} {:>22.1f}s\n",
               "Average time per file:", wall_clock_sec / total);
  }

  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &result : results_) {
      if (!result.success) {
        fmt::print(fg(fmt::color::red), "  - {}{}\n", result.filename,
                   result.error.empty() ? "" : " (" + result.error + ")");
      }
    }
  }
  std::fflush(stdout);
}

std::vector<std::string> collect_video_files(const std::string &dir) {
  std::vector<std::string> files;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    std::string ext = entry.path().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext == ".mp4" || ext == ".mkv" || ext == ".mov" || ext == ".avi" ||
        ext == ".ts" || ext == ".webm") {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace action_shorts
