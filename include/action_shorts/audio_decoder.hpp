/**
 * @file audio_decoder.hpp
 * @brief Audio track decoding to mono PCM
 *
 * @details AudioDecoder is the seam between the selection pipeline and
 *          media decoding. FfmpegAudioDecoder decodes the best audio stream
 *          of a file and downmixes it to mono float samples at the stream's
 *          native sample rate with libswresample.
 */

#ifndef ACTION_SHORTS_AUDIO_DECODER_HPP
#define ACTION_SHORTS_AUDIO_DECODER_HPP

#include <string>

#include "types.hpp"

namespace action_shorts {

/**
 * @class AudioDecoder
 * @brief Produces the mono PCM signal of a video's audio track.
 */
class AudioDecoder {
public:
  virtual ~AudioDecoder() = default;

  /**
   * @brief Decode the audio track of a video.
   * @throws DecodeError if the track cannot be read at all
   */
  virtual PcmAudio decode(const std::string &video) = 0;
};

/**
 * @class FfmpegAudioDecoder
 * @brief AudioDecoder backed by libavformat/libavcodec/libswresample.
 *
 * @note Corrupt packets inside an otherwise readable track are skipped.
 *       A file without an audio stream decodes to empty PCM at
 *       SILENT_SAMPLE_RATE; only an unopenable file or codec is fatal.
 */
class FfmpegAudioDecoder : public AudioDecoder {
public:
  PcmAudio decode(const std::string &video) override;
};

} // namespace action_shorts

#endif // ACTION_SHORTS_AUDIO_DECODER_HPP
