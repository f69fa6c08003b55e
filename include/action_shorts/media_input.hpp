/**
 * @file media_input.hpp
 * @brief Memory-mapped media access for FFmpeg
 *
 * @details Provides:
 *          - MappedFile: RAII wrapper for a read-only mmap of a source file
 *
 *          - MediaInput: AVFormatContext opened over a MappedFile through
 *            custom AVIO read/seek callbacks
 *
 *          - open_decoder: decoder context for one stream
 *
 *          - inspect_video: dimensions, frame rate and duration of a video
 *
 * @note Both the audio decoder and the boundary detector read the source
 *       through MediaInput, so each analysis pass works from RAM after the
 *       first page-in.
 */

#ifndef ACTION_SHORTS_MEDIA_INPUT_HPP
#define ACTION_SHORTS_MEDIA_INPUT_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <cstdint>
#include <string>

namespace action_shorts {

/**
 * @brief MemReaderState: Read cursor for custom FFmpeg I/O.
 */
struct MemReaderState {
  const uint8_t *ptr; //< Pointer to buffer start
  size_t size;        //< Total buffer size
  size_t pos;         //< Current read position
};

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note Handles automatic cleanup (munmap/close) on destruction.
 *       Supports move semantics but not copy.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  /**
   * @brief Map an entire file read-only.
   * @return true on success, false on failure (logged)
   */
  bool map(const std::string &path);

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }

private:
  void release();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/**
 * @class MediaInput
 * @brief Owns an AVFormatContext reading from a mapped file.
 *
 * @attention MANAGEMENT:
 *
 *            - Uses AVFMT_FLAG_CUSTOM_IO so avformat_close_input leaves the
 *              AVIO context to us
 *
 *            - Destructor handles partial initialization failures
 */
class MediaInput {
public:
  MediaInput() = default;
  ~MediaInput();

  MediaInput(const MediaInput &) = delete;
  MediaInput &operator=(const MediaInput &) = delete;

  /**
   * @brief Map the file and open its container.
   * @throws DecodeError if the file cannot be mapped or inspected
   */
  void open(const std::string &path);

  AVFormatContext *format() const { return fmt_ctx_; }

  /**
   * @brief Index of the best stream of the given type, -1 if none.
   */
  int find_stream(AVMediaType type) const;

  /**
   * @brief Container duration in seconds (0 when unknown).
   */
  double duration() const;

  /**
   * @brief Discard every stream except keep_idx.
   */
  void discard_other_streams(int keep_idx);

  /// FFmpeg read callback for custom I/O
  static int read(void *opaque, uint8_t *buf, int buf_size);

  /// FFmpeg seek callback for custom I/O (handles AVSEEK_SIZE)
  static int64_t seek(void *opaque, int64_t offset, int whence);

private:
  MappedFile file_;
  MemReaderState mem_state_{nullptr, 0, 0};

  AVFormatContext *fmt_ctx_ = nullptr;
  AVIOContext *avio_ctx_ = nullptr;
  uint8_t *avio_buffer_ = nullptr;
};

/**
 * @brief Allocate and open a decoder for one stream.
 * @return Owned decoder context (free with avcodec_free_context)
 * @throws DecodeError if no decoder is available or it fails to open
 */
AVCodecContext *open_decoder(AVFormatContext *fmt_ctx, int stream_idx);

/**
 * @brief Human readable FFmpeg error.
 */
std::string av_error_string(int errnum);

/**
 * @struct VideoInfo
 * @brief Basic properties of the best video stream.
 */
struct VideoInfo {
  int width = 0;
  int height = 0;
  double fps = 0.0;
  double duration = 0.0;
};

/**
 * @brief Inspect the best video stream of a file.
 * @throws DecodeError if the file has no readable video stream
 */
VideoInfo inspect_video(const std::string &path);

} // namespace action_shorts

#endif // ACTION_SHORTS_MEDIA_INPUT_HPP
