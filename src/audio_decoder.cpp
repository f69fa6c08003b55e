/**
 * @file audio_decoder.cpp
 * @brief FFmpeg audio decoding implementation
 */

#include "action_shorts/audio_decoder.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

#include "action_shorts/errors.hpp"
#include "action_shorts/logging.hpp"
#include "action_shorts/media_input.hpp"

namespace action_shorts {

namespace {

/**
 * @class AudioDecodeSession
 * @brief Decoder, resampler, frame and packet of one decode() call.
 * @note All FFmpeg resources are freed in reverse allocation order.
 */
class AudioDecodeSession {
public:
  AudioDecodeSession() {
    frame = av_frame_alloc();
    pkt = av_packet_alloc();
  }

  ~AudioDecodeSession() {
    swr_free(&swr_ctx);
    if (dec_ctx)
      avcodec_free_context(&dec_ctx);
    av_frame_free(&frame);
    av_packet_free(&pkt);
  }

  AudioDecodeSession(const AudioDecodeSession &) = delete;
  AudioDecodeSession &operator=(const AudioDecodeSession &) = delete;

  AVCodecContext *dec_ctx = nullptr;
  SwrContext *swr_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
};

void setup_resampler(AudioDecodeSession &s) {
  AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
  AVChannelLayout in_layout;
  if (s.dec_ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
    av_channel_layout_default(&in_layout, s.dec_ctx->ch_layout.nb_channels);
  } else if (av_channel_layout_copy(&in_layout, &s.dec_ctx->ch_layout) < 0) {
    throw DecodeError("cannot copy audio channel layout");
  }

  int ret = swr_alloc_set_opts2(&s.swr_ctx, &mono, AV_SAMPLE_FMT_FLT,
                                s.dec_ctx->sample_rate, &in_layout,
                                s.dec_ctx->sample_fmt, s.dec_ctx->sample_rate,
                                0, nullptr);
  av_channel_layout_uninit(&in_layout);
  if (ret < 0 || !s.swr_ctx) {
    throw DecodeError(fmt::format("cannot configure resampler: {}",
                                  av_error_string(ret)));
  }

  ret = swr_init(s.swr_ctx);
  if (ret < 0) {
    throw DecodeError(fmt::format("cannot initialize resampler: {}",
                                  av_error_string(ret)));
  }
}

/// Convert one decoded frame (or flush with frame == nullptr) into pcm
void append_samples(AudioDecodeSession &s, const AVFrame *frame,
                    PcmAudio &pcm) {
  const int in_samples = frame ? frame->nb_samples : 0;
  const int capacity = swr_get_out_samples(s.swr_ctx, in_samples);
  if (capacity <= 0)
    return;

  const size_t offset = pcm.samples.size();
  pcm.samples.resize(offset + static_cast<size_t>(capacity));
  uint8_t *out = reinterpret_cast<uint8_t *>(pcm.samples.data() + offset);

  int converted = swr_convert(
      s.swr_ctx, &out, capacity,
      frame ? const_cast<const uint8_t **>(frame->extended_data) : nullptr,
      in_samples);
  if (converted < 0) {
    LOG_WARN("Resampling failed: {}", av_error_string(converted));
    converted = 0;
  }
  pcm.samples.resize(offset + static_cast<size_t>(converted));
}

/// Drain every frame the decoder has ready
void receive_frames(AudioDecodeSession &s, PcmAudio &pcm) {
  while (true) {
    int ret = avcodec_receive_frame(s.dec_ctx, s.frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
      return;
    if (ret < 0) {
      LOG_WARN("Audio frame decode error: {}", av_error_string(ret));
      return;
    }
    append_samples(s, s.frame, pcm);
    av_frame_unref(s.frame);
  }
}

} // namespace

PcmAudio FfmpegAudioDecoder::decode(const std::string &video) {
  TIMER_START(audio_decode);

  MediaInput input;
  input.open(video);

  int stream_idx = input.find_stream(AVMEDIA_TYPE_AUDIO);
  if (stream_idx < 0) {
    /// Muted recordings still get scenes; they just all score 0
    LOG_WARN("No audio stream in '{}'; treating it as silent", video);
    PcmAudio silent;
    silent.sample_rate = SILENT_SAMPLE_RATE;
    silent.duration = input.duration();
    TIMER_END(audio_decode);
    return silent;
  }
  input.discard_other_streams(stream_idx);

  AudioDecodeSession s;
  if (!s.frame || !s.pkt) {
    throw DecodeError("failed to allocate frame/packet");
  }
  s.dec_ctx = open_decoder(input.format(), stream_idx);
  if (s.dec_ctx->sample_rate <= 0) {
    throw DecodeError(fmt::format("invalid sample rate {} in '{}'",
                                  s.dec_ctx->sample_rate, video));
  }
  setup_resampler(s);

  PcmAudio pcm;
  pcm.sample_rate = s.dec_ctx->sample_rate;
  pcm.duration = input.duration();
  if (pcm.duration > 0) {
    pcm.samples.reserve(static_cast<size_t>(pcm.duration * pcm.sample_rate) +
                        pcm.sample_rate);
  }

  int read_ret = 0;
  while ((read_ret = av_read_frame(input.format(), s.pkt)) >= 0) {
    if (s.pkt->stream_index == stream_idx) {
      int send_ret = avcodec_send_packet(s.dec_ctx, s.pkt);
      if (send_ret < 0 && send_ret != AVERROR(EAGAIN)) {
        LOG_DEBUG("Skipping corrupt audio packet: {}",
                  av_error_string(send_ret));
      }
      receive_frames(s, pcm);
    }
    av_packet_unref(s.pkt);
  }
  if (read_ret != AVERROR_EOF) {
    LOG_WARN("Audio read stopped early: {}", av_error_string(read_ret));
  }

  /// Flush decoder, then resampler
  int flush_ret = avcodec_send_packet(s.dec_ctx, nullptr);
  if (flush_ret < 0 && flush_ret != AVERROR_EOF) {
    LOG_WARN("Audio decoder flush failed: {}", av_error_string(flush_ret));
  }
  receive_frames(s, pcm);
  append_samples(s, nullptr, pcm);

  TIMER_END(audio_decode);

  LOG_INFO("Decoded {} audio samples @ {} Hz ({})", pcm.samples.size(),
           pcm.sample_rate,
           format_time(pcm.samples.size() /
                       static_cast<double>(pcm.sample_rate)));
  return pcm;
}

} // namespace action_shorts
