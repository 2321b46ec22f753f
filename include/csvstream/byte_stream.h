/**
 * @file byte_stream.h
 * @brief Byte source and sink capabilities consumed by readers and writers.
 *
 * A reader pulls bytes from a ByteSource and a writer pushes bytes into a
 * ByteSink. Both are only ever called from the owning reader's or writer's
 * I/O worker thread, so implementations may block there without stalling the
 * caller. Failures are reported by throwing IoError.
 */

#ifndef CSVSTREAM_BYTE_STREAM_H
#define CSVSTREAM_BYTE_STREAM_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace csvstream {

/**
 * @brief Chunked byte source.
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;

  /**
   * @brief Read up to max_bytes into dst.
   * @return Number of bytes read; 0 marks the end of the source
   * @throws IoError on failure
   */
  virtual size_t read(char* dst, size_t max_bytes) = 0;

  /// Release the underlying handle. Must be idempotent.
  virtual void close() = 0;
};

/**
 * @brief Chunked byte sink.
 */
class ByteSink {
public:
  virtual ~ByteSink() = default;

  /**
   * @brief Write up to n bytes from src.
   * @return Number of bytes accepted (may be short; callers loop)
   * @throws IoError on failure
   */
  virtual size_t write(const char* src, size_t n) = 0;

  /// Push accepted bytes down to the device.
  virtual void flush() = 0;

  /// Release the underlying handle. Must be idempotent.
  virtual void close() = 0;
};

/// Who closes a handle passed to a reader or writer.
enum class HandleOwnership {
  OWNED,   ///< Reader/writer closes the handle on close() or destruction
  BORROWED ///< Caller keeps responsibility for closing the handle
};

/// Reads a file through a POSIX file descriptor.
class FileSource : public ByteSource {
public:
  /// @throws IoError if the file cannot be opened
  explicit FileSource(const std::string& path);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  size_t read(char* dst, size_t max_bytes) override;
  void close() override;

  const std::string& path() const { return path_; }
  bool is_open() const { return fd_ >= 0; }

private:
  std::string path_;
  int fd_ = -1;
};

/// How a FileSink opens its file.
enum class FileMode {
  TRUNCATE, ///< Create or truncate
  APPEND    ///< Create or append
};

/// Writes a file through a POSIX file descriptor.
class FileSink : public ByteSink {
public:
  /// @throws IoError if the file cannot be opened
  explicit FileSink(const std::string& path, FileMode mode = FileMode::TRUNCATE);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  size_t write(const char* src, size_t n) override;
  void flush() override;
  void close() override;

  const std::string& path() const { return path_; }
  bool is_open() const { return fd_ >= 0; }

private:
  std::string path_;
  int fd_ = -1;
};

/**
 * @brief Serves an in-memory string.
 *
 * max_read caps the bytes returned per read() call, which lets tests force
 * arbitrary refill boundaries (0 = no cap).
 */
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string data, size_t max_read = 0)
      : data_(std::move(data)), max_read_(max_read) {}

  size_t read(char* dst, size_t max_bytes) override;
  void close() override { closed_ = true; }

  bool closed() const { return closed_; }
  size_t reads() const { return reads_; }

private:
  std::string data_;
  size_t max_read_;
  size_t pos_ = 0;
  size_t reads_ = 0;
  bool closed_ = false;
};

/**
 * @brief Appends into a shared in-memory string.
 *
 * The string is shared so the written bytes stay inspectable after the
 * writer that owned the sink is gone.
 */
class MemorySink : public ByteSink {
public:
  MemorySink() : data_(std::make_shared<std::string>()) {}
  explicit MemorySink(std::shared_ptr<std::string> data) : data_(std::move(data)) {}

  size_t write(const char* src, size_t n) override;
  void flush() override { ++flushes_; }
  void close() override { closed_ = true; }

  const std::shared_ptr<std::string>& data() const { return data_; }
  bool closed() const { return closed_; }
  size_t writes() const { return writes_; }
  size_t flushes() const { return flushes_; }

private:
  std::shared_ptr<std::string> data_;
  size_t writes_ = 0;
  size_t flushes_ = 0;
  bool closed_ = false;
};

/// Turns a path into a source; used when a reader is constructed from a path.
using SourceOpener = std::function<std::shared_ptr<ByteSource>(const std::string& path)>;

/// Turns a path into a sink; used when a writer is constructed from a path.
using SinkOpener = std::function<std::shared_ptr<ByteSink>(const std::string& path)>;

/// Default opener: FileSource
std::shared_ptr<ByteSource> open_file_source(const std::string& path);

/// Default opener: FileSink in TRUNCATE mode
std::shared_ptr<ByteSink> open_file_sink(const std::string& path);

/// FileSink in APPEND mode
std::shared_ptr<ByteSink> open_file_sink_append(const std::string& path);

/**
 * @brief Reject paths that cannot name a file.
 * @throws ConfigError for an empty path or a path containing a NUL byte
 */
void validate_path(const std::string& path);

} // namespace csvstream

#endif // CSVSTREAM_BYTE_STREAM_H
