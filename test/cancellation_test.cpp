/**
 * @file cancellation_test.cpp
 * @brief Tests for cancel(): what a cancelled operation leaves behind.
 *
 * Sources and sessions are held at a known point with a Gate so the test
 * thread can cancel while the worker is inside an operation.
 */

#include "csvstream/error.h"
#include "csvstream/reader.h"
#include "csvstream/writer.h"

#include "test_util.h"

#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace csvstream;
using test_util::Gate;
using test_util::GatedSource;

namespace {

ReaderOptions byte_chunks() {
  ReaderOptions options;
  options.chunk_size = 1;
  return options;
}

WriterOptions lf_options(size_t write_size = DEFAULT_WRITE_SIZE) {
  WriterOptions options;
  options.dialect.line_terminator = LineTerminator::LF;
  options.write_size = write_size;
  return options;
}

} // namespace

// =============================================================================
// Reader
// =============================================================================

TEST(ReaderCancellationTest, CancelledReadKeepsPartialRecord) {
  auto source = std::make_shared<GatedSource>("alpha,beta\ngamma\n", 1);
  RecordReader reader(source, byte_chunks());

  auto running = reader.read_row();
  source->entered.wait();
  // The caller is never blocked by the device
  EXPECT_EQ(running.wait_for(std::chrono::seconds(0)), std::future_status::timeout);

  auto queued = reader.read_row();
  reader.cancel();
  source->release.open();

  try {
    running.get();
    FAIL() << "expected CancelledError";
  } catch (const CancelledError& e) {
    EXPECT_EQ(e.code(), ErrorCode::OPERATION_CANCELLED);
    EXPECT_EQ(e.message(), "read_row was cancelled");
  }
  EXPECT_THROW(queued.get(), CancelledError);

  // Operations submitted after cancel() run normally and resume mid-field
  EXPECT_EQ(reader.read_row().get(), (Record{"alpha", "beta"}));
  EXPECT_EQ(reader.read_row().get(), Record{"gamma"});
  EXPECT_TRUE(reader.read_row().get().empty());
  EXPECT_EQ(reader.line_num(), 2u);
}

TEST(ReaderCancellationTest, CancelledBatchHandsBackCompletedRecords) {
  // Reads 0-3 deliver "1\n2\n"; read 4 holds the byte of the third record
  auto source = std::make_shared<GatedSource>("1\n2\n3\n", 1, 4);
  RecordReader reader(source, byte_chunks());

  auto batch = reader.read_rows(3);
  source->entered.wait();
  reader.cancel();
  source->release.open();
  EXPECT_THROW(batch.get(), CancelledError);
  EXPECT_EQ(reader.records_read(), 0u);

  std::vector<Record> records = reader.read_rows(3).get();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0], Record{"1"});
  EXPECT_EQ(records[1], Record{"2"});
  EXPECT_EQ(records[2], Record{"3"});
}

TEST(ReaderCancellationTest, CancelWithNothingQueuedIsHarmless) {
  RecordReader reader(std::make_shared<MemorySource>("a\nb\n"));
  reader.cancel();
  EXPECT_EQ(reader.read_row().get(), Record{"a"});
  reader.cancel();
  reader.cancel();
  EXPECT_EQ(reader.skip_rows(5).get(), 1u);
}

TEST(ReaderCancellationTest, CloseAfterCancelStillReleases) {
  auto source = std::make_shared<GatedSource>("a\n", 1);
  RecordReader reader(source, byte_chunks());
  auto running = reader.read_row();
  source->entered.wait();
  reader.cancel();
  auto closing = reader.close();
  source->release.open();

  EXPECT_THROW(running.get(), CancelledError);
  EXPECT_NO_THROW(closing.get());
  EXPECT_TRUE(reader.closed());
}

// =============================================================================
// Writer
// =============================================================================

TEST(WriterCancellationTest, CancelledSessionDropsOnlyItsUnflushedRows) {
  auto sink = std::make_shared<MemorySink>();
  RecordWriter writer(sink, lf_options());
  writer.write_row(Record{"kept"}).get();

  Gate entered;
  Gate release;
  auto batch = writer.run("batch", [&entered, &release](RecordWriter::Session& session) {
    session.write(Record{"dropped"});
    entered.open();
    release.wait();
    session.flush();
  });
  entered.wait();
  writer.cancel();
  release.open();

  try {
    batch.get();
    FAIL() << "expected CancelledError";
  } catch (const CancelledError& e) {
    EXPECT_EQ(e.message(), "batch was cancelled");
  }
  EXPECT_EQ(writer.records_written(), 1u);
  writer.flush().get();
  EXPECT_EQ(*sink->data(), "kept\n");
}

TEST(WriterCancellationTest, FlushedBytesAreNeverTouched) {
  auto sink = std::make_shared<MemorySink>();
  RecordWriter writer(sink, lf_options(1));

  Gate entered;
  Gate release;
  auto batch = writer.run("batch", [&entered, &release](RecordWriter::Session& session) {
    session.write(Record{"a"});
    entered.open();
    release.wait();
    session.write(Record{"b"});
  });
  entered.wait();
  writer.cancel();
  release.open();

  EXPECT_THROW(batch.get(), CancelledError);
  EXPECT_EQ(*sink->data(), "a\n");
  EXPECT_EQ(writer.bytes_written(), 2u);
  EXPECT_EQ(writer.records_written(), 1u);

  writer.write_row(Record{"c"}).get();
  writer.close().get();
  EXPECT_EQ(*sink->data(), "a\nc\n");
}

TEST(WriterCancellationTest, QueuedWriteNeverRenders) {
  auto sink = std::make_shared<MemorySink>();
  RecordWriter writer(sink, lf_options());

  Gate entered;
  Gate release;
  auto holder = writer.run("hold", [&entered, &release](RecordWriter::Session&) {
    entered.open();
    release.wait();
  });
  entered.wait();
  auto queued = writer.write_rows({Record{"never"}});
  writer.cancel();
  release.open();

  // The holder has no flush, so it finishes normally
  EXPECT_NO_THROW(holder.get());
  EXPECT_THROW(queued.get(), CancelledError);
  writer.close().get();
  EXPECT_TRUE(sink->data()->empty());
  EXPECT_EQ(writer.records_written(), 0u);
}

TEST(WriterCancellationTest, CloseIsNotCancelled) {
  auto sink = std::make_shared<MemorySink>();
  RecordWriter writer(sink, lf_options());
  writer.write_row(Record{"x"}).get();
  auto closing = writer.close();
  writer.cancel();
  EXPECT_NO_THROW(closing.get());
  EXPECT_EQ(*sink->data(), "x\n");
  EXPECT_TRUE(sink->closed());
}
