/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Configuration is read once at start-up into two explicit
 *          structs:
 *
 *          - ShortsConfig: selection and rendering parameters
 *
 *          - AnalysisSettings: tuning of the audio and scene analysis
 *
 *          Every field has a documented default and valid range. Values that
 *          do not parse or fall outside their range raise a
 *          ConfigurationError inside this layer, which is logged and
 *          replaced by the default. See config/action_shorts.env for the
 *          documentation of each variable.
 */

#ifndef ACTION_SHORTS_CONFIG_HPP
#define ACTION_SHORTS_CONFIG_HPP

#include <optional>
#include <string>

namespace action_shorts {
namespace Config {

/**
 * @brief Read an environment variable.
 * @return The value, or std::nullopt when unset or empty
 */
std::optional<std::string> get_env(const char *name);

/**
 * @brief Parse a whole string as an integer.
 * @throws ConfigurationError if the text is not a complete integer
 */
int parse_int(const char *field, const std::string &text);

/**
 * @brief Parse a whole string as a floating point number.
 * @throws ConfigurationError if the text is not a complete number
 */
double parse_double(const char *field, const std::string &text);

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Value used when unset or unparseable
 * @return Parsed integer value or default
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Value used when unset or unparseable
 * @return Parsed double value or default
 */
double get_env_double(const char *name, double default_val);

/**
 * @brief Load KEY=VALUE pairs from a dotenv file into the environment.
 * @note Variables already present in the environment are left untouched.
 *       Blank lines, '#' comments and an optional "export " prefix are
 *       accepted; surrounding single or double quotes are stripped.
 * @return Number of variables set (0 when the file does not exist)
 */
int load_env_file(const std::string &path);

} // namespace Config

/**
 * @struct ShortsConfig
 * @brief Selection parameters for one pipeline run.
 * @note Aspect ratio, crop centre and error depth only reach the renderer;
 *       they have no effect on ranking.
 */
struct ShortsConfig {
  int target_ratio_w = 1;                   //< TARGET_RATIO_W, >= 1
  int target_ratio_h = 1;                   //< TARGET_RATIO_H, >= 1
  int scene_limit = 6;                      //< SCENE_LIMIT, >= 1
  double x_center = 0.5;                    //< X_CENTER, [0, 1]
  double y_center = 0.5;                    //< Y_CENTER, [0, 1]
  int max_error_depth = 3;                  //< MAX_ERROR_DEPTH, >= 0
  double min_short_length = 15.0;           //< MIN_SHORT_LENGTH, > 0
  double max_short_length = 179.0;          //< MAX_SHORT_LENGTH, >= min
  double max_combined_scene_length = 300.0; //< MAX_COMBINED_SCENE_LENGTH, > 0

  /**
   * @brief Build from the environment, falling back to defaults.
   */
  static ShortsConfig from_env();

  /**
   * @brief Copy with every invalid field replaced by its default.
   * @note If max_short_length < min_short_length both are reset.
   */
  ShortsConfig sanitized() const;

  /// Mid point between the minimum and maximum short length
  double middle_short_length() const {
    return (min_short_length + max_short_length) / 2.0;
  }

  /// Log the effective values
  void log() const;
};

/**
 * @struct AnalysisSettings
 * @brief Window sizes and thresholds of the analysis stages.
 */
struct AnalysisSettings {
  int window_size = 2048;        //< AUDIO_WINDOW, power of two in [64, 65536]
  int hop_size = 512;            //< AUDIO_HOP, [1, window_size]
  int smoothing_frames = 5;      //< SMOOTHING_FRAMES, >= 1
  double scene_threshold = 27.0; //< SCENE_THRESHOLD, > 0
  int min_scene_frames = 15;     //< MIN_SCENE_FRAMES, >= 1
  int analysis_width = 256;      //< SCENE_ANALYSIS_WIDTH, [16, 4096]

  static AnalysisSettings from_env();

  AnalysisSettings sanitized() const;

  void log() const;
};

} // namespace action_shorts

#endif // ACTION_SHORTS_CONFIG_HPP
