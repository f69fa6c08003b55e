/**
 * @file boundary_detector.cpp
 * @brief Content change scene detection implementation
 *
 * @attention HOT PATH: rgb_to_hsv and content_score run once per decoded
 *            frame on the downscaled image. Everything else is per scene.
 */

#include "action_shorts/boundary_detector.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

extern "C" {
#include <libswscale/swscale.h>
}

#include "action_shorts/errors.hpp"
#include "action_shorts/logging.hpp"
#include "action_shorts/media_input.hpp"

namespace action_shorts {

// **---- Frame Scoring ----**

HsvFrame rgb_to_hsv(const uint8_t *rgb, int width, int height, int stride) {
  HsvFrame out;
  out.width = width;
  out.height = height;
  const size_t n = static_cast<size_t>(width) * height;
  out.h.resize(n);
  out.s.resize(n);
  out.v.resize(n);

  for (int y = 0; y < height; ++y) {
    const uint8_t *row = rgb + static_cast<size_t>(y) * stride;
    for (int x = 0; x < width; ++x) {
      const int r = row[3 * x];
      const int g = row[3 * x + 1];
      const int b = row[3 * x + 2];
      const int v = std::max({r, g, b});
      const int mn = std::min({r, g, b});
      const int diff = v - mn;

      int s = (v == 0) ? 0 : (255 * diff + v / 2) / v;

      double h = 0.0;
      if (diff != 0) {
        if (v == r)
          h = 60.0 * (g - b) / diff;
        else if (v == g)
          h = 120.0 + 60.0 * (b - r) / diff;
        else
          h = 240.0 + 60.0 * (r - g) / diff;
        if (h < 0)
          h += 360.0;
      }

      const size_t idx = static_cast<size_t>(y) * width + x;
      /// 8-bit hue is degrees / 2 so it fits [0, 180)
      out.h[idx] = static_cast<uint8_t>(static_cast<int>(std::lround(h / 2.0)) % 180);
      out.s[idx] = static_cast<uint8_t>(s);
      out.v[idx] = static_cast<uint8_t>(v);
    }
  }
  return out;
}

namespace {

double mean_abs_diff(const std::vector<uint8_t> &a,
                     const std::vector<uint8_t> &b) {
  uint64_t sum = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<uint64_t>(std::abs(int(a[i]) - int(b[i])));
  }
  return a.empty() ? 0.0 : static_cast<double>(sum) / a.size();
}

} // namespace

double content_score(const HsvFrame &prev, const HsvFrame &curr) {
  if (prev.width != curr.width || prev.height != curr.height || prev.empty())
    return 0.0;
  return (mean_abs_diff(prev.h, curr.h) + mean_abs_diff(prev.s, curr.s) +
          mean_abs_diff(prev.v, curr.v)) /
         3.0;
}

bool CutTracker::update(long frame_index, double score) {
  if (last_cut_ < 0)
    last_cut_ = frame_index;

  if (score >= threshold_ && frame_index - last_cut_ >= min_scene_frames_) {
    last_cut_ = frame_index;
    return true;
  }
  return false;
}

std::vector<RawScene> scenes_from_cuts(std::vector<double> cut_times,
                                       double duration) {
  std::vector<RawScene> scenes;
  if (!(duration > 0))
    return scenes;

  std::sort(cut_times.begin(), cut_times.end());
  double start = 0.0;
  for (double cut : cut_times) {
    if (cut <= start || cut >= duration)
      continue;
    scenes.push_back({start, cut});
    start = cut;
  }
  scenes.push_back({start, duration});
  return scenes;
}

// **---- ContentBoundaryDetector ----**

namespace {

/**
 * @class FrameDecodeSession
 * @brief Decoder, scaler and buffers of one detect() call.
 */
class FrameDecodeSession {
public:
  FrameDecodeSession() {
    frame = av_frame_alloc();
    pkt = av_packet_alloc();
  }

  ~FrameDecodeSession() {
    sws_freeContext(sws_ctx);
    if (dec_ctx)
      avcodec_free_context(&dec_ctx);
    av_frame_free(&frame);
    av_packet_free(&pkt);
  }

  FrameDecodeSession(const FrameDecodeSession &) = delete;
  FrameDecodeSession &operator=(const FrameDecodeSession &) = delete;

  AVCodecContext *dec_ctx = nullptr;
  SwsContext *sws_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  std::vector<uint8_t> rgb;
};

} // namespace

std::vector<RawScene> ContentBoundaryDetector::detect(const std::string &video) {
  TIMER_START(scene_detect);

  MediaInput input;
  input.open(video);

  const int stream_idx = input.find_stream(AVMEDIA_TYPE_VIDEO);
  if (stream_idx < 0) {
    throw DecodeError(fmt::format("no video stream in '{}'", video));
  }
  input.discard_other_streams(stream_idx);

  FrameDecodeSession s;
  if (!s.frame || !s.pkt) {
    throw DecodeError("failed to allocate frame/packet");
  }
  s.dec_ctx = open_decoder(input.format(), stream_idx);

  const AVStream *stream = input.format()->streams[stream_idx];
  const double time_base = av_q2d(stream->time_base);
  const double start_offset = (stream->start_time != AV_NOPTS_VALUE)
                                  ? stream->start_time * time_base
                                  : 0.0;
  AVRational fr = stream->avg_frame_rate;
  const double frame_duration =
      (fr.num > 0 && fr.den > 0) ? 1.0 / av_q2d(fr) : 1.0 / 25.0;

  CutTracker tracker(settings_.scene_threshold, settings_.min_scene_frames);
  std::vector<double> cuts;
  HsvFrame previous;
  long frame_index = 0;
  double last_pts = 0.0;

  auto process_frame = [&](const AVFrame *f) {
    const int out_w = std::min(settings_.analysis_width, f->width);
    int out_h = static_cast<int>(
        std::lround(static_cast<double>(f->height) * out_w / f->width));
    out_h = std::max(2, out_h & ~1);

    s.sws_ctx = sws_getCachedContext(
        s.sws_ctx, f->width, f->height, static_cast<AVPixelFormat>(f->format),
        out_w, out_h, AV_PIX_FMT_RGB24, SWS_AREA, nullptr, nullptr, nullptr);
    if (!s.sws_ctx) {
      throw DecodeError("cannot create frame scaler");
    }

    const int stride = out_w * 3;
    s.rgb.resize(static_cast<size_t>(stride) * out_h);
    uint8_t *dst[4] = {s.rgb.data(), nullptr, nullptr, nullptr};
    int dst_stride[4] = {stride, 0, 0, 0};
    sws_scale(s.sws_ctx, f->data, f->linesize, 0, f->height, dst, dst_stride);

    HsvFrame current = rgb_to_hsv(s.rgb.data(), out_w, out_h, stride);

    int64_t ts = f->best_effort_timestamp;
    double pts = (ts != AV_NOPTS_VALUE)
                     ? ts * time_base - start_offset
                     : frame_index * frame_duration;
    last_pts = std::max(last_pts, pts);

    if (!previous.empty()) {
      const double score = content_score(previous, current);
      if (tracker.update(frame_index, score)) {
        LOG_DEBUG("Cut at {} (frame {}, score {:.1f})", format_timecode(pts),
                  frame_index, score);
        cuts.push_back(pts);
      }
    } else {
      tracker.update(frame_index, 0.0);
    }

    previous = std::move(current);
    ++frame_index;
  };

  auto receive_frames = [&]() {
    while (true) {
      int ret = avcodec_receive_frame(s.dec_ctx, s.frame);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
        return;
      if (ret < 0) {
        LOG_WARN("Video frame decode error: {}", av_error_string(ret));
        return;
      }
      process_frame(s.frame);
      av_frame_unref(s.frame);
    }
  };

  int read_ret = 0;
  while ((read_ret = av_read_frame(input.format(), s.pkt)) >= 0) {
    if (s.pkt->stream_index == stream_idx) {
      int send_ret = avcodec_send_packet(s.dec_ctx, s.pkt);
      if (send_ret < 0 && send_ret != AVERROR(EAGAIN)) {
        LOG_DEBUG("Skipping corrupt video packet: {}",
                  av_error_string(send_ret));
      }
      receive_frames();
    }
    av_packet_unref(s.pkt);
  }
  if (read_ret != AVERROR_EOF) {
    LOG_WARN("Video read stopped early: {}", av_error_string(read_ret));
  }

  int flush_ret = avcodec_send_packet(s.dec_ctx, nullptr);
  if (flush_ret < 0 && flush_ret != AVERROR_EOF) {
    LOG_WARN("Video decoder flush failed: {}", av_error_string(flush_ret));
  }
  receive_frames();

  if (frame_index == 0) {
    throw DecodeError(fmt::format("no decodable video frames in '{}'", video));
  }

  const double duration =
      std::max(input.duration(), last_pts + frame_duration);
  std::vector<RawScene> scenes = scenes_from_cuts(std::move(cuts), duration);

  TIMER_END(scene_detect);

  LOG_INFO("Analyzed {} frames, detected {} scenes ({})", frame_index,
           scenes.size(), format_time(duration));
  return scenes;
}

} // namespace action_shorts
