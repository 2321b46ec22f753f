/**
 * @file reader.h
 * @brief Asynchronous record reader over a byte source.
 *
 * A RecordReader owns one byte source, one BufferManager and one Tokenizer.
 * Every operation that may touch the source returns a std::future and runs on
 * the reader's private I/O worker, so the calling thread (typically an event
 * loop or a cooperative scheduler polling futures) never blocks on device
 * latency.
 *
 * Overlapping calls are serialized: operations queue on the single worker and
 * execute strictly in submission order, so records are always delivered in
 * stream order and never interleaved.
 *
 * @example
 * @code
 * csvstream::RecordReader reader("data.csv");
 * auto header = reader.read_row().get();
 * for (const auto& record : reader) {
 *     std::cout << record[0] << "\n";
 * }
 * reader.close().get();
 * @endcode
 */

#ifndef CSVSTREAM_READER_H
#define CSVSTREAM_READER_H

#include "byte_stream.h"
#include "debug.h"
#include "dialect.h"
#include "types.h"

#include "BS_thread_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <future>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace csvstream {

/**
 * @brief Reader configuration.
 */
struct ReaderOptions {
  Dialect dialect;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;             ///< Bytes requested per fetch (> 0)
  size_t field_size_limit = DEFAULT_FIELD_SIZE_LIMIT; ///< Max field bytes (0 = unlimited)
  DebugConfig debug;

  /// @throws ConfigError if the dialect or a size option is invalid
  void validate() const;
};

class RecordReader;

/**
 * @brief Blocking input iterator over the records of a RecordReader.
 *
 * Each increment waits for the next read_row() to complete. Stops at end of
 * stream; rethrows read failures from operator++.
 */
class RecordIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = Record;
  using difference_type = std::ptrdiff_t;
  using pointer = const Record*;
  using reference = const Record&;

  /// Create end iterator
  RecordIterator();

  /// Create iterator positioned at the reader's next record
  explicit RecordIterator(RecordReader* reader);

  reference operator*() const { return current_; }
  pointer operator->() const { return &current_; }

  RecordIterator& operator++();
  RecordIterator operator++(int);

  bool operator==(const RecordIterator& other) const;
  bool operator!=(const RecordIterator& other) const;

private:
  void advance();

  RecordReader* reader_ = nullptr;
  Record current_;
  bool at_end_ = true;
};

class RecordReader {
  struct Impl;

public:
  /**
   * @brief Worker-side access to the record stream.
   *
   * Handed to tasks scheduled with run(). Only valid inside that task; every
   * call happens on the reader's I/O worker.
   */
  class Cursor {
  public:
    /// Read the next record; false at end of stream
    bool next(Record& out);

    /// Put records back at the front of the stream, preserving their order
    void unread(std::vector<Record> records);

    size_t line_num() const;
    DebugTrace& trace();

  private:
    friend class RecordReader;
    explicit Cursor(Impl* impl) : impl_(impl) {}

    Impl* impl_;
  };

  /**
   * @brief Construct a reader over an open byte source.
   *
   * @param source Byte source; must not be null
   * @param options Reader configuration, validated eagerly
   * @param ownership OWNED closes the source on close(); BORROWED leaves it open
   * @throws ConfigError on invalid options or a null source
   */
  explicit RecordReader(std::shared_ptr<ByteSource> source,
                        const ReaderOptions& options = ReaderOptions(),
                        HandleOwnership ownership = HandleOwnership::OWNED);

  /**
   * @brief Construct a reader that opens a path.
   *
   * The reader owns the opened source.
   *
   * @throws ConfigError on invalid options or an invalid path
   * @throws IoError if the opener fails
   */
  explicit RecordReader(const std::string& path, const ReaderOptions& options = ReaderOptions(),
                        const SourceOpener& opener = open_file_source);

  /// Waits for queued operations, then releases an owned source if still open
  ~RecordReader();

  // Non-copyable
  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  // Moveable
  RecordReader(RecordReader&&) noexcept;
  RecordReader& operator=(RecordReader&&) noexcept;

  const ReaderOptions& options() const;

  /**
   * @brief Read the next record.
   *
   * The future yields a zero-field Record at end of stream, which is distinct
   * from a record holding one empty field.
   */
  std::future<Record> read_row();

  /// Read up to n records; fewer only at end of stream
  std::future<std::vector<Record>> read_rows(size_t n);

  /// Discard up to n records; yields the number actually skipped
  std::future<size_t> skip_rows(size_t n);

  /// Next record, or std::nullopt at end of stream
  std::future<std::optional<Record>> next_row();

  /// Release the source. Idempotent; later reads fail with ClosedResourceError.
  std::future<void> close();

  /**
   * @brief Cancel every operation queued or running at this moment.
   *
   * Cancelled operations fail with CancelledError at their next suspension
   * point. Consumed state is kept: the next read continues at the first
   * record the cancelled operation had not returned.
   */
  void cancel();

  /**
   * @brief Schedule a task on the I/O worker with exclusive record access.
   *
   * The building block of every read operation, also used by adapters layered
   * on a reader. The task runs after all previously submitted operations.
   *
   * @param operation Name used in cancellation errors and timing output;
   *        must have static storage duration
   */
  template <typename F>
  auto run(const char* operation, F task) -> std::future<std::invoke_result_t<F, Cursor&>> {
    Impl* impl = impl_.get();
    const uint64_t epoch = current_epoch();
    return executor().submit_task([impl, epoch, operation, task]() {
      Cursor cursor = start_operation(impl, epoch, operation);
      CSVSTREAM_TIMED_PHASE(cursor.trace(), operation, 0);
      return task(cursor);
    });
  }

  /// Physical lines consumed so far
  size_t line_num() const;

  /// Bytes consumed by the tokenizer so far
  size_t bytes_consumed() const;

  /// Records returned or skipped so far
  size_t records_read() const;

  bool closed() const;

  /// True once end of stream was reached and no record is left to return
  bool exhausted() const;

  /// Iterator support for range-based for
  RecordIterator begin();
  RecordIterator end();

private:
  BS::thread_pool& executor();
  uint64_t current_epoch() const;
  static Cursor start_operation(Impl* impl, uint64_t epoch, const char* operation);

  std::unique_ptr<Impl> impl_;
};

} // namespace csvstream

#endif // CSVSTREAM_READER_H
