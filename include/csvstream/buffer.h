/**
 * @file buffer.h
 * @brief Incremental byte buffer that refills from a ByteSource on demand.
 */

#ifndef CSVSTREAM_BUFFER_H
#define CSVSTREAM_BUFFER_H

#include "byte_stream.h"
#include "debug.h"

#include <cstddef>
#include <functional>
#include <vector>

namespace csvstream {

/**
 * @brief Owns the read buffer of one reader.
 *
 * Invariant: `0 <= cursor <= length <= capacity`. Bytes in [cursor, length)
 * are fetched but not yet consumed; they survive cancellation and errors of
 * the operation that fetched them. ensure() is the only place that touches
 * the source, which makes it the reader's only suspension point.
 */
class BufferManager {
public:
  /// Called right before every fetch; may throw to abandon the fetch.
  using FetchGuard = std::function<void()>;

  /**
   * @param source Byte source; must outlive the buffer manager
   * @param chunk_size Bytes requested from the source per fetch (> 0)
   * @param trace Debug trace for fetch logging, may be null
   */
  BufferManager(ByteSource& source, size_t chunk_size, DebugTrace* trace = nullptr);

  BufferManager(const BufferManager&) = delete;
  BufferManager& operator=(const BufferManager&) = delete;

  /**
   * @brief Make at least min_bytes unread bytes available.
   *
   * Fetches from the source until the request is satisfied or the source is
   * exhausted. Once exhausted, further calls never touch the source again.
   *
   * @return Number of unread bytes available (may be < min_bytes at the end)
   * @throws IoError wrapping any source failure
   */
  size_t ensure(size_t min_bytes);

  /// Unread bytes currently buffered
  size_t available() const { return length_ - cursor_; }

  /// Next unread byte; requires available() > 0
  char peek() const { return data_[cursor_]; }

  /// Consume and return the next byte; requires available() > 0
  char next() {
    ++consumed_;
    return data_[cursor_++];
  }

  /// Pointer to the first unread byte
  const char* current() const { return data_.data() + cursor_; }

  /// Consume n bytes; requires n <= available()
  void advance(size_t n) {
    cursor_ += n;
    consumed_ += n;
  }

  /// True once the source has reported its end
  bool exhausted() const { return exhausted_; }

  /// True when nothing is buffered and nothing more will arrive
  bool at_end() const { return exhausted_ && cursor_ == length_; }

  /// Total bytes consumed since construction (absolute stream offset of cursor)
  size_t consumed() const { return consumed_; }

  /// Total bytes fetched from the source
  size_t fetched() const { return fetched_; }

  size_t cursor() const { return cursor_; }
  size_t length() const { return length_; }
  size_t capacity() const { return data_.size(); }
  size_t chunk_size() const { return chunk_size_; }

  void set_fetch_guard(FetchGuard guard) { guard_ = std::move(guard); }

private:
  void fetch_once();

  ByteSource& source_;
  DebugTrace* trace_;
  FetchGuard guard_;
  std::vector<char> data_;
  size_t chunk_size_;
  size_t cursor_ = 0;
  size_t length_ = 0;
  size_t consumed_ = 0;
  size_t fetched_ = 0;
  bool exhausted_ = false;
};

} // namespace csvstream

#endif // CSVSTREAM_BUFFER_H
