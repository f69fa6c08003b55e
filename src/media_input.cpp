/**
 * @file media_input.cpp
 * @brief Memory-mapped media access implementation
 */

#include "action_shorts/media_input.hpp"

#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

#include "action_shorts/errors.hpp"
#include "action_shorts/logging.hpp"
#include "action_shorts/types.hpp"

namespace action_shorts {

// **---- MappedFile Implementation ----**

MappedFile::~MappedFile() { release(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

void MappedFile::release() {
  if (data_) {
    munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ != -1) {
    close(fd_);
    fd_ = -1;
  }
  size_ = 0;
}

bool MappedFile::map(const std::string &path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    LOG_ERROR("Failed to open file: {}", path);
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    LOG_ERROR("Failed to stat file: {}", path);
    close(fd);
    return false;
  }

  if (sb.st_size <= 0) {
    LOG_ERROR("File is empty or invalid: {}", path);
    close(fd);
    return false;
  }

  void *addr = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    LOG_ERROR("Failed to mmap file: {}", path);
    close(fd);
    return false;
  }

  /// Both analysis passes read front to back
  if (madvise(addr, sb.st_size, MADV_SEQUENTIAL) != 0) {
    LOG_DEBUG("madvise failed for {}", path);
  }

  release();
  data_ = static_cast<uint8_t *>(addr);
  size_ = static_cast<size_t>(sb.st_size);
  fd_ = fd;
  return true;
}

// **---- MediaInput Implementation ----**

MediaInput::~MediaInput() {
  if (fmt_ctx_) {
    avformat_close_input(&fmt_ctx_);
  }
  /// With AVFMT_FLAG_CUSTOM_IO the AVIO context (and its current buffer)
  /// stays ours to free
  if (avio_ctx_) {
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  } else if (avio_buffer_) {
    av_free(avio_buffer_);
  }
}

void MediaInput::open(const std::string &path) {
  if (!file_.map(path)) {
    throw DecodeError(fmt::format("cannot read media file '{}'", path));
  }

  fmt_ctx_ = avformat_alloc_context();
  if (!fmt_ctx_) {
    throw DecodeError("failed to allocate AVFormatContext");
  }

  avio_buffer_ = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!avio_buffer_) {
    throw DecodeError("failed to allocate AVIO buffer");
  }

  mem_state_ = {file_.data(), file_.size(), 0};

  avio_ctx_ = avio_alloc_context(avio_buffer_, AVIO_BUFFER_SIZE, 0,
                                 &mem_state_, &MediaInput::read, nullptr,
                                 &MediaInput::seek);
  if (!avio_ctx_) {
    throw DecodeError("failed to allocate AVIOContext");
  }

  fmt_ctx_->pb = avio_ctx_;
  fmt_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  /// On failure avformat_open_input frees fmt_ctx_ and sets it to null
  int ret = avformat_open_input(&fmt_ctx_, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    throw DecodeError(fmt::format("cannot open '{}': {}", path,
                                  av_error_string(ret)));
  }

  ret = avformat_find_stream_info(fmt_ctx_, nullptr);
  if (ret < 0) {
    throw DecodeError(fmt::format("cannot read stream info of '{}': {}", path,
                                  av_error_string(ret)));
  }
}

int MediaInput::find_stream(AVMediaType type) const {
  if (!fmt_ctx_)
    return -1;
  int idx = av_find_best_stream(fmt_ctx_, type, -1, -1, nullptr, 0);
  return idx < 0 ? -1 : idx;
}

double MediaInput::duration() const {
  if (!fmt_ctx_ || fmt_ctx_->duration == AV_NOPTS_VALUE)
    return 0.0;
  return fmt_ctx_->duration / static_cast<double>(AV_TIME_BASE);
}

void MediaInput::discard_other_streams(int keep_idx) {
  for (unsigned int i = 0; i < fmt_ctx_->nb_streams; i++) {
    if (i != static_cast<unsigned int>(keep_idx)) {
      fmt_ctx_->streams[i]->discard = AVDISCARD_ALL;
    }
  }
}

int MediaInput::read(void *opaque, uint8_t *buf, int buf_size) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);
  size_t bytes_left = bd->size - bd->pos;
  if (bytes_left == 0)
    return AVERROR_EOF;
  size_t copy = std::min(bytes_left, static_cast<size_t>(buf_size));
  std::memcpy(buf, bd->ptr + bd->pos, copy);
  bd->pos += copy;
  return static_cast<int>(copy);
}

int64_t MediaInput::seek(void *opaque, int64_t offset, int whence) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);

  if (whence & AVSEEK_SIZE)
    return static_cast<int64_t>(bd->size);

  int64_t new_pos = static_cast<int64_t>(bd->pos);
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    new_pos = offset;
    break;
  case SEEK_CUR:
    new_pos += offset;
    break;
  case SEEK_END:
    new_pos = static_cast<int64_t>(bd->size) + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  new_pos = std::clamp<int64_t>(new_pos, 0, static_cast<int64_t>(bd->size));
  bd->pos = static_cast<size_t>(new_pos);
  return new_pos;
}

// **---- Decoder Helpers ----**

AVCodecContext *open_decoder(AVFormatContext *fmt_ctx, int stream_idx) {
  AVCodecParameters *param = fmt_ctx->streams[stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    throw DecodeError(fmt::format("no decoder for codec '{}'",
                                  avcodec_get_name(param->codec_id)));
  }

  AVCodecContext *dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    throw DecodeError("failed to allocate decoder context");
  }

  int ret = avcodec_parameters_to_context(dec_ctx, param);
  if (ret >= 0) {
    /// Decoding runs inside one pipeline run; let FFmpeg pick its threads
    dec_ctx->thread_count = 0;
    ret = avcodec_open2(dec_ctx, codec, nullptr);
  }
  if (ret < 0) {
    avcodec_free_context(&dec_ctx);
    throw DecodeError(fmt::format("cannot open decoder '{}': {}", codec->name,
                                  av_error_string(ret)));
  }
  return dec_ctx;
}

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return std::string(buf);
}

VideoInfo inspect_video(const std::string &path) {
  MediaInput input;
  input.open(path);

  int idx = input.find_stream(AVMEDIA_TYPE_VIDEO);
  if (idx < 0) {
    throw DecodeError(fmt::format("no video stream in '{}'", path));
  }

  const AVStream *stream = input.format()->streams[idx];
  VideoInfo info;
  info.width = stream->codecpar->width;
  info.height = stream->codecpar->height;
  AVRational r = stream->avg_frame_rate;
  info.fps = (r.den > 0 && r.num > 0) ? av_q2d(r) : 25.0;
  info.duration = input.duration();

  if (info.width <= 0 || info.height <= 0) {
    throw DecodeError(fmt::format("invalid video size {}x{} in '{}'",
                                  info.width, info.height, path));
  }
  return info;
}

} // namespace action_shorts
