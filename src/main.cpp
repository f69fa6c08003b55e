/**
 * @file main.cpp
 * @brief Entry point for Action Shorts
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Configuration from the environment (and ./.env)
 *
 *          - Single file or directory input, processed one video at a time
 *
 * @note Usage: action_shorts [<input file|dir> <output dir>]
 *       Without arguments, videos in ./gameplay are rendered to ./generated.
 */

#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "action_shorts/audio_decoder.hpp"
#include "action_shorts/batch_processor.hpp"
#include "action_shorts/boundary_detector.hpp"
#include "action_shorts/config.hpp"
#include "action_shorts/logging.hpp"
#include "action_shorts/pipeline.hpp"
#include "action_shorts/renderer.hpp"

using namespace action_shorts;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::string input_arg = "gameplay";
  std::string output_arg = "generated";
  if (argc == 3) {
    input_arg = argv[1];
    output_arg = argv[2];
  } else if (argc != 1) {
    LOG_WARN("Usage: ./action_shorts [<input file|dir> <output dir>]");
    return 2;
  }

  namespace fs = std::filesystem;

  int loaded = Config::load_env_file(".env");
  if (loaded > 0) {
    LOG_INFO("Loaded {} variables from .env", loaded);
  }

  std::vector<std::string> files;
  std::error_code ec;
  if (fs::is_directory(input_arg, ec)) {
    files = collect_video_files(input_arg);
    if (files.empty()) {
      LOG_WARN("No video files found in directory {}", input_arg);
      return 0;
    }
  } else if (fs::is_regular_file(input_arg, ec)) {
    files.push_back(input_arg);
  } else {
    LOG_ERROR("Input not found: {}", input_arg);
    return 2;
  }

  fs::create_directories(output_arg, ec);
  if (ec) {
    LOG_ERROR("Cannot create output directory {}: {}", output_arg,
              ec.message());
    return 2;
  }

  LOG_INFO("Action Shorts");
  LOG_INFO("Input: {}", input_arg);
  LOG_INFO("Output directory: {}", output_arg);

  const ShortsConfig config = ShortsConfig::from_env();
  const AnalysisSettings settings = AnalysisSettings::from_env();
  config.log();
  settings.log();

  ContentBoundaryDetector detector(settings);
  FfmpegAudioDecoder decoder;
  ShortSelectionPipeline pipeline(detector, decoder, settings);

  FfmpegRenderer renderer(config,
                          Config::get_env("FFMPEG_BIN").value_or("ffmpeg"));

  BatchProcessor processor(pipeline, renderer, config);
  int failures = processor.process(files, output_arg);
  return failures == 0 ? 0 : 1;
}
