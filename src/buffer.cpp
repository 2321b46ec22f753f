#include "csvstream/buffer.h"

#include "csvstream/error.h"

#include <cstring>
#include <exception>

namespace csvstream {

BufferManager::BufferManager(ByteSource& source, size_t chunk_size, DebugTrace* trace)
    : source_(source), trace_(trace), chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw ConfigError("chunk size must be positive", ErrorCode::INVALID_OPTION);
  }
  data_.resize(chunk_size_);
}

size_t BufferManager::ensure(size_t min_bytes) {
  while (available() < min_bytes && !exhausted_) {
    if (guard_) {
      guard_();
    }
    fetch_once();
  }
  return available();
}

void BufferManager::fetch_once() {
  // Reclaim consumed bytes before growing
  if (cursor_ == length_) {
    cursor_ = 0;
    length_ = 0;
  } else if (cursor_ > 0) {
    std::memmove(data_.data(), data_.data() + cursor_, length_ - cursor_);
    length_ -= cursor_;
    cursor_ = 0;
  }
  if (data_.size() < length_ + chunk_size_) {
    data_.resize(length_ + chunk_size_);
  }

  size_t n = 0;
  try {
    n = source_.read(data_.data() + length_, chunk_size_);
  } catch (const IoError&) {
    throw;
  } catch (const CsvError&) {
    throw;
  } catch (const std::exception& e) {
    throw IoError(std::string("Byte source failed: ") + e.what(), 0,
                  ErrorLocation{std::nullopt, fetched_});
  }

  if (n > chunk_size_) {
    throw IoError("Byte source returned more bytes than requested", 0,
                  ErrorLocation{std::nullopt, fetched_});
  }
  if (n == 0) {
    exhausted_ = true;
  }
  length_ += n;
  fetched_ += n;
  if (trace_) {
    trace_->log_fetch(chunk_size_, n, fetched_);
  }
}

} // namespace csvstream
