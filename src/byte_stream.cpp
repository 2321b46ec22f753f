#include "csvstream/byte_stream.h"

#include "csvstream/error.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace csvstream {

namespace {

std::string errno_message(const char* action, const std::string& path, int err) {
  return std::string("Failed to ") + action + " " + path + ": " + std::strerror(err);
}

} // namespace

//-----------------------------------------------------------------------------
// FileSource
//-----------------------------------------------------------------------------

FileSource::FileSource(const std::string& path) : path_(path) {
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    int err = errno;
    throw IoError(errno_message("open file", path, err), err);
  }
}

FileSource::~FileSource() {
  close();
}

size_t FileSource::read(char* dst, size_t max_bytes) {
  if (fd_ < 0) {
    throw IoError("Read from closed file " + path_, EBADF);
  }
  while (true) {
    ssize_t n = ::read(fd_, dst, max_bytes);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    int err = errno;
    throw IoError(errno_message("read file", path_, err), err);
  }
}

void FileSource::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

//-----------------------------------------------------------------------------
// FileSink
//-----------------------------------------------------------------------------

FileSink::FileSink(const std::string& path, FileMode mode) : path_(path) {
  int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
  flags |= (mode == FileMode::APPEND) ? O_APPEND : O_TRUNC;
  fd_ = ::open(path.c_str(), flags, 0644);
  if (fd_ < 0) {
    int err = errno;
    throw IoError(errno_message("open file", path, err), err);
  }
}

FileSink::~FileSink() {
  // Close errors cannot be reported from here; close() reports them
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

size_t FileSink::write(const char* src, size_t n) {
  if (fd_ < 0) {
    throw IoError("Write to closed file " + path_, EBADF);
  }
  while (true) {
    ssize_t written = ::write(fd_, src, n);
    if (written >= 0) {
      return static_cast<size_t>(written);
    }
    if (errno == EINTR) {
      continue;
    }
    int err = errno;
    throw IoError(errno_message("write file", path_, err), err);
  }
}

void FileSink::flush() {
  // write(2) leaves no user-space buffer
  if (fd_ < 0) {
    throw IoError("Flush of closed file " + path_, EBADF);
  }
}

void FileSink::close() {
  if (fd_ >= 0) {
    if (::close(fd_) < 0 && errno != EINTR) {
      int err = errno;
      fd_ = -1;
      throw IoError(errno_message("close file", path_, err), err);
    }
    fd_ = -1;
  }
}

//-----------------------------------------------------------------------------
// In-memory streams
//-----------------------------------------------------------------------------

size_t MemorySource::read(char* dst, size_t max_bytes) {
  if (closed_) {
    throw IoError("Read from closed memory source", EBADF);
  }
  ++reads_;
  size_t n = std::min(max_bytes, data_.size() - pos_);
  if (max_read_ > 0) {
    n = std::min(n, max_read_);
  }
  std::memcpy(dst, data_.data() + pos_, n);
  pos_ += n;
  return n;
}

size_t MemorySink::write(const char* src, size_t n) {
  if (closed_) {
    throw IoError("Write to closed memory sink", EBADF);
  }
  ++writes_;
  data_->append(src, n);
  return n;
}

//-----------------------------------------------------------------------------
// Openers
//-----------------------------------------------------------------------------

std::shared_ptr<ByteSource> open_file_source(const std::string& path) {
  return std::make_shared<FileSource>(path);
}

std::shared_ptr<ByteSink> open_file_sink(const std::string& path) {
  return std::make_shared<FileSink>(path, FileMode::TRUNCATE);
}

std::shared_ptr<ByteSink> open_file_sink_append(const std::string& path) {
  return std::make_shared<FileSink>(path, FileMode::APPEND);
}

void validate_path(const std::string& path) {
  if (path.empty()) {
    throw ConfigError("Path cannot be empty", ErrorCode::INVALID_OPTION);
  }
  if (path.find('\0') != std::string::npos) {
    throw ConfigError("Path cannot contain null bytes", ErrorCode::INVALID_OPTION);
  }
}

} // namespace csvstream
