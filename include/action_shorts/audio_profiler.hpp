/**
 * @file audio_profiler.hpp
 * @brief Per-frame action score from a video's audio track
 *
 * @details The AudioActionProfiler turns mono PCM into an ActionProfile:
 *
 *          1. Short-time RMS loudness over window_size samples every
 *             hop_size samples (the last hops average only the samples
 *             they still contain)
 *
 *          2. Spectral flux: half-wave rectified increase of the Hann
 *             windowed magnitude spectrum against the previous hop
 *             (FFT from libavutil/tx.h)
 *
 *          3. Min-max normalization of each signal over the hops of the
 *             track itself (zero variance normalizes to 0); silent hops
 *             added to reach span_sec stay at 0
 *
 *          4. Centered moving average of smoothing_frames hops
 *
 *          5. score = RMS_WEIGHT * rms + FLUX_WEIGHT * flux
 *
 * @note Output depends only on the samples and the settings; there is no
 *       randomness anywhere in the computation.
 */

#ifndef ACTION_SHORTS_AUDIO_PROFILER_HPP
#define ACTION_SHORTS_AUDIO_PROFILER_HPP

#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace action_shorts {

/**
 * @brief Scale values to [0, 1] by their own min and max.
 * @note A constant (or empty) input maps to all zeros.
 */
std::vector<float> normalize_min_max(const std::vector<float> &values);

/**
 * @brief Centered moving average; the window shrinks at both ends.
 */
std::vector<float> moving_average(const std::vector<float> &values,
                                  int window);

/**
 * @class AudioActionProfiler
 * @brief Computes the ActionProfile of an audio track.
 */
class AudioActionProfiler {
public:
  explicit AudioActionProfiler(const AnalysisSettings &settings);

  /**
   * @brief Profile decoded audio.
   * @param audio Mono PCM
   * @param span_sec Minimum time the profile must cover; hops past the end
   *                 of the samples are analysed as silence
   * @throws DecodeError if the sample rate is not positive
   */
  ActionProfile profile(const PcmAudio &audio, double span_sec = 0.0) const;

  /// Seconds between consecutive frames for a given sample rate
  double hop_seconds(int sample_rate) const {
    return static_cast<double>(hop_size_) / sample_rate;
  }

private:
  int window_size_;
  int hop_size_;
  int smoothing_frames_;
};

} // namespace action_shorts

#endif // ACTION_SHORTS_AUDIO_PROFILER_HPP
