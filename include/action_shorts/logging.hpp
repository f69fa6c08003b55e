/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime gated LOG_DEBUG (LOG_DEBUG=1 in the environment)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for per-video phase timings
 *
 *          - Time formatting helpers for scene listings and summaries
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress is visible while long renders run.
 */

#ifndef ACTION_SHORTS_LOGGING_HPP
#define ACTION_SHORTS_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace action_shorts {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Whether LOG_DEBUG output is enabled.
 * @note Read once from the LOG_DEBUG environment variable.
 */
bool debug_logging_enabled();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(action_shorts::log_mutex);                \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(action_shorts::log_mutex);                \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(action_shorts::log_mutex);                \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(action_shorts::log_mutex);                \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(action_shorts::log_mutex);                \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (action_shorts::debug_logging_enabled()) {                              \
      std::lock_guard<std::mutex> lock(action_shorts::log_mutex);              \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @brief PhaseTiming: All measurements of one phase name.
 */
struct PhaseTiming {
  std::string name;
  int calls = 0;
  long total_us = 0;
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for phase timings of the current video.
 *
 * @details Phases such as render run once per shortlisted scene (and once
 *          more per retry), so the summary groups entries by name.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Entries grouped by phase name, in order of first appearance.
   */
  static std::vector<PhaseTiming> phases();

  /**
   * @brief Print the grouped timings as a formatted table.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   * @note Called between files in batch mode.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    action_shorts::TimingCollector::record(#name, timer_duration_##name);      \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

// **----- TIME FORMATTING -----**

/**
 * @brief Format seconds as HH:MM:SS.
 */
std::string format_time(double seconds);

/**
 * @brief Format seconds as HH:MM:SS.mmm (scene listings).
 */
std::string format_timecode(double seconds);

} // namespace action_shorts

#endif // ACTION_SHORTS_LOGGING_HPP
