/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 */

#include "action_shorts/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include <fmt/color.h>
#include <fmt/core.h>

namespace action_shorts {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

bool debug_logging_enabled() {
  static const bool enabled = [] {
    const char *val = std::getenv("LOG_DEBUG");
    return val != nullptr && *val != '\0' && std::string(val) != "0";
  }();
  return enabled;
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

std::vector<PhaseTiming> TimingCollector::phases() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  std::vector<PhaseTiming> grouped;
  for (const auto &e : entries) {
    auto it = std::find_if(grouped.begin(), grouped.end(),
                           [&](const PhaseTiming &p) { return p.name == e.name; });
    if (it == grouped.end()) {
      grouped.push_back({e.name, 0, 0});
      it = grouped.end() - 1;
    }
    it->calls++;
    it->total_us += e.microseconds;
  }
  return grouped;
}

void TimingCollector::print_summary() {
  std::vector<PhaseTiming> grouped = phases();
  if (grouped.empty())
    return;

  std::lock_guard<std::mutex> out_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<24} {:>6} {:>20}\n", "Phase", "Calls", "Time (us) [sec]");
  fmt::print("{:-<24} {:-<6} {:-<20}\n", "", "", "");

  for (const auto &p : grouped) {
    fmt::print("{:<24} {:>6} {:>10} [{:.2f}s]\n", p.name, p.calls, p.total_us,
               p.total_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

// **----- TIME FORMATTING -----**

std::string format_time(double seconds) {
  int total = static_cast<int>(seconds);
  int h = total / 3600;
  int m = (total % 3600) / 60;
  int s = total % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_timecode(double seconds) {
  long long ms = std::llround(std::max(0.0, seconds) * 1000.0);
  long long h = ms / 3600000;
  long long m = (ms % 3600000) / 60000;
  long long s = (ms % 60000) / 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms % 1000);
}

} // namespace action_shorts
