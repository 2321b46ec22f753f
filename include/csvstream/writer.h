/**
 * @file writer.h
 * @brief Asynchronous record writer over a byte sink.
 *
 * Rendered records accumulate in a pending buffer and reach the sink in
 * flushes of at least write_size bytes. Flushing is the writer's only
 * suspension point and always runs on the writer's private I/O worker.
 *
 * Overlapping calls are serialized in submission order, so batch output is
 * never interleaved with rows from another caller.
 */

#ifndef CSVSTREAM_WRITER_H
#define CSVSTREAM_WRITER_H

#include "byte_stream.h"
#include "debug.h"
#include "dialect.h"
#include "types.h"

#include "BS_thread_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace csvstream {

/**
 * @brief Writer configuration.
 */
struct WriterOptions {
  Dialect dialect;
  size_t write_size = DEFAULT_WRITE_SIZE; ///< Pending bytes that trigger a flush (> 0)
  DebugConfig debug;

  /// @throws ConfigError if the dialect or write_size is invalid
  void validate() const;
};

class RecordWriter {
  struct Impl;

public:
  /**
   * @brief Worker-side access to the pending buffer.
   *
   * One session per scheduled operation. Bytes appended through a session
   * and not yet flushed are the ones dropped if the operation is cancelled.
   */
  class Session {
  public:
    /// Render and buffer one record; flushes if write_size is reached
    void write(const Record& record);
    void write(const NullableRecord& record);

    /**
     * @brief Write records in order and flush.
     *
     * Rows before an unwritable one are flushed before the FormatError is
     * rethrown. Sink failures become IoError carrying rows_flushed().
     */
    void write_all(const std::vector<Record>& records);
    void write_all(const std::vector<NullableRecord>& records);

    /// Push every pending byte to the sink and flush it
    void flush();

    /// Rows of this session whose bytes the sink has accepted
    size_t rows_flushed() const;

    DebugTrace& trace();

  private:
    friend class RecordWriter;
    Session(Impl* impl, uint64_t epoch, const char* operation);

    template <typename Row> void write_record(const Row& record);
    template <typename Row> void write_records(const std::vector<Row>& records);
    void flush_if_full();

    Impl* impl_;
    uint64_t epoch_;
    const char* operation_;
    size_t mark_;                   ///< Start of this session's unflushed bytes
    std::vector<size_t> row_ends_;  ///< Stream offset after each row written
  };

  /**
   * @brief Construct a writer over an open byte sink.
   *
   * @param sink Byte sink; must not be null
   * @param options Writer configuration, validated eagerly
   * @param ownership OWNED closes the sink on close(); BORROWED only flushes it
   * @throws ConfigError on invalid options or a null sink
   */
  explicit RecordWriter(std::shared_ptr<ByteSink> sink,
                        const WriterOptions& options = WriterOptions(),
                        HandleOwnership ownership = HandleOwnership::OWNED);

  /**
   * @brief Construct a writer that opens a path.
   *
   * The default opener truncates; pass open_file_sink_append to append.
   *
   * @throws ConfigError on invalid options or an invalid path
   * @throws IoError if the opener fails
   */
  explicit RecordWriter(const std::string& path, const WriterOptions& options = WriterOptions(),
                        const SinkOpener& opener = open_file_sink);

  /// Waits for queued operations, then flushes and releases the sink if still open
  ~RecordWriter();

  // Non-copyable
  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;

  // Moveable
  RecordWriter(RecordWriter&&) noexcept;
  RecordWriter& operator=(RecordWriter&&) noexcept;

  const WriterOptions& options() const;

  /**
   * @brief Write one record followed by the line terminator.
   *
   * @throws FormatError (via the future) if a field cannot be rendered; no
   *         byte of the record is written in that case
   */
  std::future<void> write_row(Record record);
  std::future<void> write_row(NullableRecord record);

  /**
   * @brief Write records in order, flushing per write_size and once at the end.
   *
   * On a sink failure the future throws IoError whose rows_written() counts
   * the rows of this batch the sink accepted.
   */
  std::future<void> write_rows(std::vector<Record> records);
  std::future<void> write_rows(std::vector<NullableRecord> records);

  /// Drain pending bytes to the sink without closing it
  std::future<void> flush();

  /// Flush, then release the sink. Idempotent; later writes fail with ClosedResourceError.
  std::future<void> close();

  /**
   * @brief Cancel every operation queued or running at this moment.
   *
   * A cancelled operation fails with CancelledError at its next flush and
   * drops only its own unflushed bytes.
   */
  void cancel();

  /**
   * @brief Schedule a task on the I/O worker with exclusive access to the writer.
   *
   * @param operation Name used in cancellation errors and timing output;
   *        must have static storage duration
   */
  template <typename F>
  auto run(const char* operation, F task) -> std::future<std::invoke_result_t<F, Session&>> {
    Impl* impl = impl_.get();
    const uint64_t epoch = current_epoch();
    return executor().submit_task([impl, epoch, operation, task]() {
      Session session = start_operation(impl, epoch, operation);
      CSVSTREAM_TIMED_PHASE(session.trace(), operation, 0);
      return task(session);
    });
  }

  /// Bytes the sink has accepted so far
  size_t bytes_written() const;

  /// Records rendered and not discarded by cancellation
  size_t records_written() const;

  bool closed() const;

private:
  BS::thread_pool& executor();
  uint64_t current_epoch() const;
  static Session start_operation(Impl* impl, uint64_t epoch, const char* operation);

  std::unique_ptr<Impl> impl_;
};

} // namespace csvstream

#endif // CSVSTREAM_WRITER_H
