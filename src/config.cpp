/**
 * @file config.cpp
 * @brief Environment parsing and validation of ShortsConfig and
 *        AnalysisSettings
 */

#include "action_shorts/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>

#include "action_shorts/errors.hpp"
#include "action_shorts/logging.hpp"

namespace action_shorts {
namespace Config {

std::optional<std::string> get_env(const char *name) {
  const char *val = std::getenv(name);
  if (val == nullptr || *val == '\0')
    return std::nullopt;
  return std::string(val);
}

int parse_int(const char *field, const std::string &text) {
  size_t consumed = 0;
  int value = 0;
  try {
    value = std::stoi(text, &consumed);
  } catch (const std::exception &) {
    throw ConfigurationError(field,
                             fmt::format("{}='{}' is not an integer", field, text));
  }
  if (consumed != text.size())
    throw ConfigurationError(field,
                             fmt::format("{}='{}' is not an integer", field, text));
  return value;
}

double parse_double(const char *field, const std::string &text) {
  size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::exception &) {
    throw ConfigurationError(field,
                             fmt::format("{}='{}' is not a number", field, text));
  }
  if (consumed != text.size())
    throw ConfigurationError(field,
                             fmt::format("{}='{}' is not a number", field, text));
  return value;
}

int get_env_int(const char *name, int default_val) {
  auto val = get_env(name);
  if (!val)
    return default_val;
  try {
    return parse_int(name, *val);
  } catch (const ConfigurationError &e) {
    LOG_WARN("{}; using default {}", e.what(), default_val);
    return default_val;
  }
}

double get_env_double(const char *name, double default_val) {
  auto val = get_env(name);
  if (!val)
    return default_val;
  try {
    return parse_double(name, *val);
  } catch (const ConfigurationError &e) {
    LOG_WARN("{}; using default {}", e.what(), default_val);
    return default_val;
  }
}

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

} // namespace

int load_env_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    return 0;

  int count = 0;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    if (line.compare(0, 7, "export ") == 0)
      line = trim(line.substr(7));

    auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      LOG_WARN("Ignoring malformed line in {}: {}", path, line);
      continue;
    }

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    /// overwrite = 0: the real environment wins over the file
    if (std::getenv(key.c_str()) == nullptr &&
        setenv(key.c_str(), value.c_str(), 0) == 0) {
      ++count;
    }
  }
  return count;
}

} // namespace Config

// **---- Validation ----**

namespace {

template <typename T>
void check_range(const char *field, T value, T min_val, T max_val) {
  if (!(value >= min_val && value <= max_val)) {
    throw ConfigurationError(
        field, fmt::format("{}={} outside [{}, {}]", field, value, min_val,
                           max_val));
  }
}

/// Replace value by default_val when it is outside [min_val, max_val]
template <typename T>
void fallback_if_invalid(const char *field, T &value, T default_val, T min_val,
                         T max_val) {
  try {
    check_range(field, value, min_val, max_val);
  } catch (const ConfigurationError &e) {
    LOG_WARN("{}; using default {}", e.what(), default_val);
    value = default_val;
  }
}

constexpr int INT_MAX_VAL = std::numeric_limits<int>::max();
constexpr double DOUBLE_MAX_VAL = std::numeric_limits<double>::max();

} // namespace

ShortsConfig ShortsConfig::from_env() {
  const ShortsConfig d;
  ShortsConfig c;
  c.target_ratio_w = Config::get_env_int("TARGET_RATIO_W", d.target_ratio_w);
  c.target_ratio_h = Config::get_env_int("TARGET_RATIO_H", d.target_ratio_h);
  c.scene_limit = Config::get_env_int("SCENE_LIMIT", d.scene_limit);
  c.x_center = Config::get_env_double("X_CENTER", d.x_center);
  c.y_center = Config::get_env_double("Y_CENTER", d.y_center);
  c.max_error_depth =
      Config::get_env_int("MAX_ERROR_DEPTH", d.max_error_depth);
  c.min_short_length =
      Config::get_env_double("MIN_SHORT_LENGTH", d.min_short_length);
  c.max_short_length =
      Config::get_env_double("MAX_SHORT_LENGTH", d.max_short_length);
  c.max_combined_scene_length = Config::get_env_double(
      "MAX_COMBINED_SCENE_LENGTH", d.max_combined_scene_length);
  return c.sanitized();
}

ShortsConfig ShortsConfig::sanitized() const {
  const ShortsConfig d;
  ShortsConfig c = *this;

  fallback_if_invalid("TARGET_RATIO_W", c.target_ratio_w, d.target_ratio_w, 1,
                      INT_MAX_VAL);
  fallback_if_invalid("TARGET_RATIO_H", c.target_ratio_h, d.target_ratio_h, 1,
                      INT_MAX_VAL);
  fallback_if_invalid("SCENE_LIMIT", c.scene_limit, d.scene_limit, 1,
                      INT_MAX_VAL);
  fallback_if_invalid("X_CENTER", c.x_center, d.x_center, 0.0, 1.0);
  fallback_if_invalid("Y_CENTER", c.y_center, d.y_center, 0.0, 1.0);
  fallback_if_invalid("MAX_ERROR_DEPTH", c.max_error_depth, d.max_error_depth,
                      0, INT_MAX_VAL);
  fallback_if_invalid("MIN_SHORT_LENGTH", c.min_short_length,
                      d.min_short_length, std::numeric_limits<double>::min(),
                      DOUBLE_MAX_VAL);
  fallback_if_invalid("MAX_SHORT_LENGTH", c.max_short_length,
                      d.max_short_length, std::numeric_limits<double>::min(),
                      DOUBLE_MAX_VAL);
  fallback_if_invalid("MAX_COMBINED_SCENE_LENGTH", c.max_combined_scene_length,
                      d.max_combined_scene_length,
                      std::numeric_limits<double>::min(), DOUBLE_MAX_VAL);

  try {
    check_range("MAX_SHORT_LENGTH", c.max_short_length, c.min_short_length,
                DOUBLE_MAX_VAL);
  } catch (const ConfigurationError &e) {
    LOG_WARN("{} (below MIN_SHORT_LENGTH); using defaults {} and {}",
             e.what(), d.min_short_length, d.max_short_length);
    c.min_short_length = d.min_short_length;
    c.max_short_length = d.max_short_length;
  }
  return c;
}

void ShortsConfig::log() const {
  LOG_INFO("Target ratio: {}:{}", target_ratio_w, target_ratio_h);
  LOG_INFO("Crop centre: ({:.2f}, {:.2f})", x_center, y_center);
  LOG_INFO("Scene limit: {}", scene_limit);
  LOG_INFO("Short length: {:.1f}s - {:.1f}s (middle {:.1f}s)",
           min_short_length, max_short_length, middle_short_length());
  LOG_INFO("Max combined scene length: {:.1f}s", max_combined_scene_length);
  LOG_INFO("Render retries: {}", max_error_depth);
}

AnalysisSettings AnalysisSettings::from_env() {
  const AnalysisSettings d;
  AnalysisSettings s;
  s.window_size = Config::get_env_int("AUDIO_WINDOW", d.window_size);
  s.hop_size = Config::get_env_int("AUDIO_HOP", d.hop_size);
  s.smoothing_frames =
      Config::get_env_int("SMOOTHING_FRAMES", d.smoothing_frames);
  s.scene_threshold =
      Config::get_env_double("SCENE_THRESHOLD", d.scene_threshold);
  s.min_scene_frames =
      Config::get_env_int("MIN_SCENE_FRAMES", d.min_scene_frames);
  s.analysis_width =
      Config::get_env_int("SCENE_ANALYSIS_WIDTH", d.analysis_width);
  return s.sanitized();
}

AnalysisSettings AnalysisSettings::sanitized() const {
  const AnalysisSettings d;
  AnalysisSettings s = *this;

  fallback_if_invalid("AUDIO_WINDOW", s.window_size, d.window_size, 64, 65536);
  if ((s.window_size & (s.window_size - 1)) != 0) {
    LOG_WARN("AUDIO_WINDOW={} is not a power of two; using default {}",
             s.window_size, d.window_size);
    s.window_size = d.window_size;
  }
  fallback_if_invalid("AUDIO_HOP", s.hop_size, std::min(d.hop_size, s.window_size),
                      1, s.window_size);
  fallback_if_invalid("SMOOTHING_FRAMES", s.smoothing_frames,
                      d.smoothing_frames, 1, INT_MAX_VAL);
  fallback_if_invalid("SCENE_THRESHOLD", s.scene_threshold, d.scene_threshold,
                      std::numeric_limits<double>::min(), DOUBLE_MAX_VAL);
  fallback_if_invalid("MIN_SCENE_FRAMES", s.min_scene_frames,
                      d.min_scene_frames, 1, INT_MAX_VAL);
  fallback_if_invalid("SCENE_ANALYSIS_WIDTH", s.analysis_width,
                      d.analysis_width, 16, 4096);
  return s;
}

void AnalysisSettings::log() const {
  LOG_INFO("Audio window/hop: {}/{} samples, smoothing {} frames",
           window_size, hop_size, smoothing_frames);
  LOG_INFO("Scene threshold: {:.1f}, min scene {} frames, analysis width {}px",
           scene_threshold, min_scene_frames, analysis_width);
}

} // namespace action_shorts
