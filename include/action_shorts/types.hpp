/**
 * @file types.hpp
 * @brief Core data types and constants for Action Shorts
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Action score weights
 *
 *          - TimeRange for scene and clip ranges
 *
 *          - ActionFrame / ActionProfile for the audio analysis
 *
 *          - RankedScene / Shortlist for the ranking output
 */

#ifndef ACTION_SHORTS_TYPES_HPP
#define ACTION_SHORTS_TYPES_HPP

#include <cstddef>
#include <vector>

namespace action_shorts {

// **----- CONSTANTS -----**

/// Weight of normalized RMS loudness in the action score
constexpr float RMS_WEIGHT = 0.6f;

/// Weight of normalized spectral flux in the action score
constexpr float FLUX_WEIGHT = 0.4f;

/**
 * @brief Size of the I/O buffer used by FFmpeg when reading mapped files.
 * @note 256KB keeps the number of read callbacks low for both the audio
 *       decoder and the frame decoder of the boundary detector.
 */
constexpr size_t AVIO_BUFFER_SIZE = 256 * 1024; //< 256KB

/// Sample rate reported for a video without an audio stream
constexpr int SILENT_SAMPLE_RATE = 48000;

// **----- DATA STRUCTURES -----**

/**
 * @struct TimeRange
 * @brief Represents a time range [start, end) in seconds.
 * @note Used for raw scenes, combined scenes and render ranges.
 *       Aligned to 16 bytes for potential SIMD operations.
 */
struct alignas(16) TimeRange {
  double start; //< Start time in seconds
  double end;   //< End time in seconds

  double duration() const { return end - start; }
};

/// A range exactly as reported by the boundary detector
using RawScene = TimeRange;

/// One or more adjacent raw scenes merged together
using CombinedScene = TimeRange;

/**
 * @struct ActionFrame
 * @brief One analysis hop of the audio track.
 * @note rms, flux and score are normalized to [0, 1].
 */
struct ActionFrame {
  double timestamp; //< Start of the analysis window in seconds
  float rms;        //< Normalized, smoothed RMS loudness
  float flux;       //< Normalized, smoothed spectral flux
  float score;      //< RMS_WEIGHT * rms + FLUX_WEIGHT * flux
};

/// Chronologically ordered action frames spanning the source
using ActionProfile = std::vector<ActionFrame>;

/**
 * @struct RankedScene
 * @brief A combined scene with the mean action score of its frames.
 */
struct RankedScene {
  CombinedScene scene;
  double action_score; //< 0 when no frame falls inside the scene
};

/// Ranked, filtered and truncated scenes, best first
using Shortlist = std::vector<RankedScene>;

/**
 * @struct PcmAudio
 * @brief Decoded mono audio track.
 */
struct PcmAudio {
  std::vector<float> samples; //< Mono samples in [-1, 1]
  int sample_rate = 0;        //< Samples per second
  double duration = 0.0;      //< Container duration in seconds (0 = unknown)
};

} // namespace action_shorts

#endif // ACTION_SHORTS_TYPES_HPP
