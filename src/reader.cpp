/**
 * @file reader.cpp
 * @brief RecordReader: tokenizer and buffer driven on a private I/O worker.
 */

#include "csvstream/reader.h"

#include "csvstream/buffer.h"
#include "csvstream/error.h"
#include "csvstream/tokenizer.h"

#include <algorithm>
#include <atomic>
#include <deque>

namespace csvstream {

namespace {

constexpr const char* kResourceName = "reader";

// Cap on up-front reservation for read_rows(n) with a huge n
constexpr size_t kMaxReserve = 1024;

std::shared_ptr<ByteSource> open_source(const std::string& path, const ReaderOptions& options,
                                        const SourceOpener& opener) {
  options.validate();
  validate_path(path);
  if (!opener) {
    throw ConfigError("source opener must not be empty", ErrorCode::INVALID_OPTION);
  }
  std::shared_ptr<ByteSource> source = opener(path);
  if (!source) {
    throw IoError("Opener returned no source for " + path);
  }
  return source;
}

} // namespace

void ReaderOptions::validate() const {
  dialect.validate();
  if (chunk_size == 0) {
    throw ConfigError("chunk_size must be positive", ErrorCode::INVALID_OPTION);
  }
}

//-----------------------------------------------------------------------------
// RecordReader::Impl
//-----------------------------------------------------------------------------

struct RecordReader::Impl {
  ReaderOptions options;
  std::shared_ptr<ByteSource> source;
  HandleOwnership ownership;
  DebugTrace trace;
  BufferManager buffer;
  Tokenizer tokenizer;

  // Records handed back by an interrupted batch read, returned before new ones
  std::deque<Record> carried;

  // Published by the worker after every operation, read by accessors
  std::atomic<size_t> line_num{0};
  std::atomic<size_t> bytes_consumed{0};
  std::atomic<size_t> records_read{0};
  std::atomic<bool> exhausted{false};
  std::atomic<bool> closed{false};
  std::atomic<uint64_t> cancel_epoch{0};

  // Last member: destroyed first, so queued tasks finish while the rest is alive
  BS::thread_pool pool{1};

  Impl(std::shared_ptr<ByteSource> src, const ReaderOptions& opts, HandleOwnership own)
      : options(opts), source(std::move(src)), ownership(own), trace(opts.debug),
        buffer(*source, opts.chunk_size, &trace),
        tokenizer(opts.dialect, opts.field_size_limit) {
    trace.log("reader opened: %s, chunk %zu bytes", options.dialect.to_string().c_str(),
              options.chunk_size);
  }

  ~Impl() {
    pool.wait();
    if (closed.exchange(true)) {
      return;
    }
    if (ownership == HandleOwnership::OWNED) {
      try {
        source->close();
      } catch (const std::exception& e) {
        trace.log("closing source on destruction failed: %s", e.what());
      }
    }
    trace.print_timing_summary();
  }

  void check_cancelled(uint64_t epoch, const char* operation) {
    if (cancel_epoch.load() != epoch) {
      trace.log("%s cancelled", operation);
      throw CancelledError(operation);
    }
  }

  bool next(Record& out) {
    if (!carried.empty()) {
      out = std::move(carried.front());
      carried.pop_front();
      publish();
      return true;
    }
    bool produced = false;
    try {
      produced = tokenizer.next_record(buffer, out);
    } catch (const CsvError&) {
      publish();
      throw;
    }
    if (!produced) {
      trace.log("end of stream: %zu records, %zu lines", tokenizer.records(),
                tokenizer.line_num());
    }
    publish();
    return produced;
  }

  void publish() {
    line_num.store(tokenizer.line_num());
    bytes_consumed.store(buffer.consumed());
    records_read.store(tokenizer.records() - carried.size());
    exhausted.store(tokenizer.finished() && carried.empty());
  }

  void close_source() {
    if (closed.exchange(true)) {
      return;
    }
    trace.log("reader closed after %zu bytes", buffer.consumed());
    trace.print_timing_summary();
    if (ownership == HandleOwnership::OWNED) {
      source->close();
    }
  }
};

//-----------------------------------------------------------------------------
// RecordReader::Cursor
//-----------------------------------------------------------------------------

bool RecordReader::Cursor::next(Record& out) {
  return impl_->next(out);
}

void RecordReader::Cursor::unread(std::vector<Record> records) {
  for (auto it = records.rbegin(); it != records.rend(); ++it) {
    impl_->carried.push_front(std::move(*it));
  }
  impl_->publish();
}

size_t RecordReader::Cursor::line_num() const {
  return impl_->tokenizer.line_num();
}

DebugTrace& RecordReader::Cursor::trace() {
  return impl_->trace;
}

//-----------------------------------------------------------------------------
// RecordReader
//-----------------------------------------------------------------------------

RecordReader::RecordReader(std::shared_ptr<ByteSource> source, const ReaderOptions& options,
                           HandleOwnership ownership) {
  options.validate();
  if (!source) {
    throw ConfigError("byte source must not be null", ErrorCode::INVALID_OPTION);
  }
  impl_ = std::make_unique<Impl>(std::move(source), options, ownership);
}

RecordReader::RecordReader(const std::string& path, const ReaderOptions& options,
                           const SourceOpener& opener)
    : RecordReader(open_source(path, options, opener), options, HandleOwnership::OWNED) {}

RecordReader::~RecordReader() = default;

RecordReader::RecordReader(RecordReader&&) noexcept = default;
RecordReader& RecordReader::operator=(RecordReader&&) noexcept = default;

const ReaderOptions& RecordReader::options() const {
  return impl_->options;
}

BS::thread_pool& RecordReader::executor() {
  return impl_->pool;
}

uint64_t RecordReader::current_epoch() const {
  return impl_->cancel_epoch.load();
}

RecordReader::Cursor RecordReader::start_operation(Impl* impl, uint64_t epoch,
                                                   const char* operation) {
  if (impl->closed.load()) {
    throw ClosedResourceError(kResourceName);
  }
  // A queued operation cancelled before it started never touches the stream
  impl->check_cancelled(epoch, operation);
  impl->buffer.set_fetch_guard(
      [impl, epoch, operation]() { impl->check_cancelled(epoch, operation); });
  return Cursor(impl);
}

std::future<Record> RecordReader::read_row() {
  return run("read_row", [](Cursor& cursor) {
    Record record;
    cursor.next(record);
    return record;
  });
}

std::future<std::vector<Record>> RecordReader::read_rows(size_t n) {
  return run("read_rows", [n](Cursor& cursor) {
    std::vector<Record> records;
    records.reserve(std::min(n, kMaxReserve));
    try {
      Record record;
      while (records.size() < n && cursor.next(record)) {
        records.push_back(std::move(record));
      }
    } catch (const CsvError&) {
      // Completed records stay readable
      cursor.unread(std::move(records));
      throw;
    }
    return records;
  });
}

std::future<size_t> RecordReader::skip_rows(size_t n) {
  return run("skip_rows", [n](Cursor& cursor) {
    size_t skipped = 0;
    Record record;
    while (skipped < n && cursor.next(record)) {
      ++skipped;
    }
    return skipped;
  });
}

std::future<std::optional<Record>> RecordReader::next_row() {
  return run("next_row", [](Cursor& cursor) -> std::optional<Record> {
    Record record;
    if (!cursor.next(record)) {
      return std::nullopt;
    }
    return record;
  });
}

std::future<void> RecordReader::close() {
  Impl* impl = impl_.get();
  return impl->pool.submit_task([impl]() { impl->close_source(); });
}

void RecordReader::cancel() {
  impl_->cancel_epoch.fetch_add(1);
}

size_t RecordReader::line_num() const {
  return impl_->line_num.load();
}

size_t RecordReader::bytes_consumed() const {
  return impl_->bytes_consumed.load();
}

size_t RecordReader::records_read() const {
  return impl_->records_read.load();
}

bool RecordReader::closed() const {
  return impl_->closed.load();
}

bool RecordReader::exhausted() const {
  return impl_->exhausted.load();
}

RecordIterator RecordReader::begin() {
  return RecordIterator(this);
}

RecordIterator RecordReader::end() {
  return RecordIterator();
}

//-----------------------------------------------------------------------------
// RecordIterator
//-----------------------------------------------------------------------------

RecordIterator::RecordIterator() : reader_(nullptr), at_end_(true) {}

RecordIterator::RecordIterator(RecordReader* reader) : reader_(reader), at_end_(false) {
  advance();
}

void RecordIterator::advance() {
  current_ = reader_->read_row().get();
  if (current_.empty()) {
    at_end_ = true;
  }
}

RecordIterator& RecordIterator::operator++() {
  if (!at_end_) {
    advance();
  }
  return *this;
}

RecordIterator RecordIterator::operator++(int) {
  RecordIterator tmp = *this;
  ++(*this);
  return tmp;
}

bool RecordIterator::operator==(const RecordIterator& other) const {
  // Both at end are equal regardless of reader
  if (at_end_ && other.at_end_)
    return true;
  return reader_ == other.reader_ && at_end_ == other.at_end_;
}

bool RecordIterator::operator!=(const RecordIterator& other) const {
  return !(*this == other);
}

} // namespace csvstream
