/**
 * @file writer.cpp
 * @brief RecordWriter: serializer and pending buffer flushed on a private I/O worker.
 */

#include "csvstream/writer.h"

#include "csvstream/error.h"
#include "csvstream/serializer.h"

#include <algorithm>
#include <atomic>
#include <exception>

namespace csvstream {

namespace {

constexpr const char* kResourceName = "writer";

std::shared_ptr<ByteSink> open_sink(const std::string& path, const WriterOptions& options,
                                    const SinkOpener& opener) {
  options.validate();
  validate_path(path);
  if (!opener) {
    throw ConfigError("sink opener must not be empty", ErrorCode::INVALID_OPTION);
  }
  std::shared_ptr<ByteSink> sink = opener(path);
  if (!sink) {
    throw IoError("Opener returned no sink for " + path);
  }
  return sink;
}

} // namespace

void WriterOptions::validate() const {
  dialect.validate();
  if (write_size == 0) {
    throw ConfigError("write_size must be positive", ErrorCode::INVALID_OPTION);
  }
}

//-----------------------------------------------------------------------------
// RecordWriter::Impl
//-----------------------------------------------------------------------------

struct RecordWriter::Impl {
  WriterOptions options;
  std::shared_ptr<ByteSink> sink;
  HandleOwnership ownership;
  DebugTrace trace;
  Serializer serializer;

  // Rendered bytes not yet accepted by the sink; touched only on the worker
  std::string pending;

  std::atomic<size_t> bytes_written{0};
  std::atomic<size_t> records_written{0};
  std::atomic<bool> closed{false};
  std::atomic<uint64_t> cancel_epoch{0};

  // Last member: destroyed first, so queued tasks finish while the rest is alive
  BS::thread_pool pool{1};

  Impl(std::shared_ptr<ByteSink> snk, const WriterOptions& opts, HandleOwnership own)
      : options(opts), sink(std::move(snk)), ownership(own), trace(opts.debug),
        serializer(opts.dialect) {
    trace.log("writer opened: %s, write size %zu bytes", options.dialect.to_string().c_str(),
              options.write_size);
  }

  ~Impl() {
    pool.wait();
    try {
      close_sink();
    } catch (const std::exception& e) {
      trace.log("closing sink on destruction failed: %s", e.what());
    }
  }

  bool cancelled(uint64_t epoch) const { return cancel_epoch.load() != epoch; }

  size_t sink_write(const char* data, size_t n) {
    try {
      return sink->write(data, n);
    } catch (const CsvError&) {
      throw;
    } catch (const std::exception& e) {
      throw IoError(std::string("Byte sink failed: ") + e.what(), 0,
                    ErrorLocation{std::nullopt, bytes_written.load()});
    }
  }

  void sink_flush() {
    try {
      sink->flush();
    } catch (const CsvError&) {
      throw;
    } catch (const std::exception& e) {
      throw IoError(std::string("Byte sink flush failed: ") + e.what(), 0,
                    ErrorLocation{std::nullopt, bytes_written.load()});
    }
  }

  // Hand every pending byte to the sink. Bytes the sink accepted are removed
  // from pending even when a later write fails.
  void drain() {
    size_t done = 0;
    try {
      while (done < pending.size()) {
        size_t remaining = pending.size() - done;
        size_t n = sink_write(pending.data() + done, remaining);
        if (n == 0 || n > remaining) {
          throw IoError("Byte sink accepted " + std::to_string(n) + " of " +
                            std::to_string(remaining) + " bytes",
                        0, ErrorLocation{std::nullopt, bytes_written.load() + done});
        }
        done += n;
      }
      sink_flush();
    } catch (const CsvError&) {
      pending.erase(0, done);
      bytes_written.fetch_add(done);
      throw;
    }
    pending.clear();
    bytes_written.fetch_add(done);
    trace.log_flush(done, bytes_written.load());
  }

  void release_sink() {
    if (ownership == HandleOwnership::OWNED) {
      sink->close();
    }
  }

  void close_sink() {
    if (closed.load()) {
      return;
    }
    try {
      drain();
    } catch (const CsvError&) {
      closed.store(true);
      try {
        release_sink();
      } catch (const std::exception& e) {
        trace.log("releasing sink after failed flush: %s", e.what());
      }
      throw;
    }
    closed.store(true);
    trace.log("writer closed after %zu bytes, %zu records", bytes_written.load(),
              records_written.load());
    trace.print_timing_summary();
    release_sink();
  }
};

//-----------------------------------------------------------------------------
// RecordWriter::Session
//-----------------------------------------------------------------------------

RecordWriter::Session::Session(Impl* impl, uint64_t epoch, const char* operation)
    : impl_(impl), epoch_(epoch), operation_(operation), mark_(impl->pending.size()) {}

template <typename Row> void RecordWriter::Session::write_record(const Row& record) {
  impl_->serializer.append(record, impl_->pending);
  row_ends_.push_back(impl_->bytes_written.load() + impl_->pending.size());
  impl_->records_written.fetch_add(1);
  flush_if_full();
}

void RecordWriter::Session::write(const Record& record) {
  write_record(record);
}

void RecordWriter::Session::write(const NullableRecord& record) {
  write_record(record);
}

template <typename Row>
void RecordWriter::Session::write_records(const std::vector<Row>& records) {
  try {
    try {
      for (const auto& record : records) {
        write_record(record);
      }
    } catch (const FormatError&) {
      // Rows before the unwritable one are kept
      flush();
      throw;
    }
    flush();
  } catch (const IoError& e) {
    throw IoError(e, rows_flushed());
  }
}

void RecordWriter::Session::write_all(const std::vector<Record>& records) {
  write_records(records);
}

void RecordWriter::Session::write_all(const std::vector<NullableRecord>& records) {
  write_records(records);
}

void RecordWriter::Session::flush_if_full() {
  if (impl_->pending.size() >= impl_->options.write_size) {
    flush();
  }
}

void RecordWriter::Session::flush() {
  if (impl_->cancelled(epoch_)) {
    // Drop this session's unflushed rows; earlier operations' bytes stay pending
    const size_t cut = impl_->bytes_written.load() + mark_;
    size_t dropped = 0;
    while (!row_ends_.empty() && row_ends_.back() > cut) {
      row_ends_.pop_back();
      ++dropped;
    }
    impl_->pending.resize(mark_);
    impl_->records_written.fetch_sub(dropped);
    impl_->trace.log("%s cancelled, %zu unflushed records dropped", operation_, dropped);
    throw CancelledError(operation_);
  }
  const size_t before = impl_->bytes_written.load();
  try {
    impl_->drain();
  } catch (const CsvError&) {
    // drain() erased the accepted prefix of pending
    const size_t accepted = impl_->bytes_written.load() - before;
    mark_ = mark_ > accepted ? mark_ - accepted : 0;
    throw;
  }
  mark_ = 0;
}

size_t RecordWriter::Session::rows_flushed() const {
  const size_t accepted = impl_->bytes_written.load();
  return static_cast<size_t>(std::count_if(row_ends_.begin(), row_ends_.end(),
                                           [accepted](size_t end) { return end <= accepted; }));
}

DebugTrace& RecordWriter::Session::trace() {
  return impl_->trace;
}

//-----------------------------------------------------------------------------
// RecordWriter
//-----------------------------------------------------------------------------

RecordWriter::RecordWriter(std::shared_ptr<ByteSink> sink, const WriterOptions& options,
                           HandleOwnership ownership) {
  options.validate();
  if (!sink) {
    throw ConfigError("byte sink must not be null", ErrorCode::INVALID_OPTION);
  }
  impl_ = std::make_unique<Impl>(std::move(sink), options, ownership);
}

RecordWriter::RecordWriter(const std::string& path, const WriterOptions& options,
                           const SinkOpener& opener)
    : RecordWriter(open_sink(path, options, opener), options, HandleOwnership::OWNED) {}

RecordWriter::~RecordWriter() = default;

RecordWriter::RecordWriter(RecordWriter&&) noexcept = default;
RecordWriter& RecordWriter::operator=(RecordWriter&&) noexcept = default;

const WriterOptions& RecordWriter::options() const {
  return impl_->options;
}

BS::thread_pool& RecordWriter::executor() {
  return impl_->pool;
}

uint64_t RecordWriter::current_epoch() const {
  return impl_->cancel_epoch.load();
}

RecordWriter::Session RecordWriter::start_operation(Impl* impl, uint64_t epoch,
                                                    const char* operation) {
  if (impl->closed.load()) {
    throw ClosedResourceError(kResourceName);
  }
  if (impl->cancelled(epoch)) {
    impl->trace.log("%s cancelled before it started", operation);
    throw CancelledError(operation);
  }
  return Session(impl, epoch, operation);
}

std::future<void> RecordWriter::write_row(Record record) {
  auto row = std::make_shared<const Record>(std::move(record));
  return run("write_row", [row](Session& session) { session.write(*row); });
}

std::future<void> RecordWriter::write_row(NullableRecord record) {
  auto row = std::make_shared<const NullableRecord>(std::move(record));
  return run("write_row", [row](Session& session) { session.write(*row); });
}

std::future<void> RecordWriter::write_rows(std::vector<Record> records) {
  auto rows = std::make_shared<const std::vector<Record>>(std::move(records));
  return run("write_rows", [rows](Session& session) { session.write_all(*rows); });
}

std::future<void> RecordWriter::write_rows(std::vector<NullableRecord> records) {
  auto rows = std::make_shared<const std::vector<NullableRecord>>(std::move(records));
  return run("write_rows", [rows](Session& session) { session.write_all(*rows); });
}

std::future<void> RecordWriter::flush() {
  return run("flush", [](Session& session) { session.flush(); });
}

std::future<void> RecordWriter::close() {
  Impl* impl = impl_.get();
  return impl->pool.submit_task([impl]() { impl->close_sink(); });
}

void RecordWriter::cancel() {
  impl_->cancel_epoch.fetch_add(1);
}

size_t RecordWriter::bytes_written() const {
  return impl_->bytes_written.load();
}

size_t RecordWriter::records_written() const {
  return impl_->records_written.load();
}

bool RecordWriter::closed() const {
  return impl_->closed.load();
}

} // namespace csvstream
