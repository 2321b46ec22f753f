/**
 * @file reader_test.cpp
 * @brief Tests for RecordReader operations, bookkeeping and lifecycle.
 */

#include "csvstream/error.h"
#include "csvstream/reader.h"

#include "test_util.h"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace csvstream;
using test_util::read_all;

namespace {

RecordReader make_reader(const std::string& csv, size_t chunk_size = DEFAULT_CHUNK_SIZE,
                         size_t max_read = 0) {
  ReaderOptions options;
  options.chunk_size = chunk_size;
  return RecordReader(std::make_shared<MemorySource>(csv, max_read), options);
}

} // namespace

// =============================================================================
// read_row
// =============================================================================

TEST(RecordReaderTest, ReadRowThenEndOfStream) {
  RecordReader reader = make_reader("a,b\n1,2\n");
  EXPECT_EQ(reader.read_row().get(), (Record{"a", "b"}));
  EXPECT_EQ(reader.read_row().get(), (Record{"1", "2"}));
  Record eof = reader.read_row().get();
  EXPECT_TRUE(eof.empty());
  EXPECT_TRUE(is_end_of_stream(eof));
  EXPECT_TRUE(reader.exhausted());
  // End of stream is sticky
  EXPECT_TRUE(reader.read_row().get().empty());
}

TEST(RecordReaderTest, SingleEmptyFieldIsNotEndOfStream) {
  RecordReader reader = make_reader("\"\"\nx\n");
  Record record = reader.read_row().get();
  ASSERT_EQ(record.size(), 1u);
  EXPECT_EQ(record[0], "");
  EXPECT_FALSE(is_end_of_stream(record));
  EXPECT_EQ(reader.read_row().get(), Record{"x"});
}

TEST(RecordReaderTest, QuotedFieldAcrossOneByteChunks) {
  const std::string csv = "\"a,\"\"b\"\"\nc\",d\r\ne,f\r\n";
  std::vector<Record> expected = {{"a,\"b\"\nc", "d"}, {"e", "f"}};
  RecordReader big = make_reader(csv);
  RecordReader tiny = make_reader(csv, 1, 1);
  EXPECT_EQ(read_all(big), expected);
  EXPECT_EQ(read_all(tiny), expected);
}

TEST(RecordReaderTest, LineNumberAfterEmbeddedNewline) {
  RecordReader reader = make_reader("\"one\ntwo\",x\nsimple,y\n");
  reader.read_row().get();
  EXPECT_EQ(reader.line_num(), 2u);
  reader.read_row().get();
  EXPECT_EQ(reader.line_num(), 3u);
}

// =============================================================================
// read_rows / skip_rows / next_row
// =============================================================================

TEST(RecordReaderTest, ReadRowsStopsAtEnd) {
  RecordReader reader = make_reader("1\n2\n3\n");
  std::vector<Record> first = reader.read_rows(2).get();
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[1], Record{"2"});

  std::vector<Record> rest = reader.read_rows(10).get();
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(rest[0], Record{"3"});
  EXPECT_TRUE(reader.read_rows(5).get().empty());
  EXPECT_EQ(reader.records_read(), 3u);
}

TEST(RecordReaderTest, ReadRowsDoesNotOverRead) {
  RecordReader reader = make_reader("a\nb\nc\n", 1, 1);
  reader.read_rows(2).get();
  EXPECT_EQ(reader.bytes_consumed(), 4u);
  EXPECT_EQ(reader.read_row().get(), Record{"c"});
}

TEST(RecordReaderTest, ReadRowsZero) {
  RecordReader reader = make_reader("a\n");
  EXPECT_TRUE(reader.read_rows(0).get().empty());
  EXPECT_EQ(reader.read_row().get(), Record{"a"});
}

TEST(RecordReaderTest, SkipRowsAdvancesLikeReading) {
  RecordReader reader = make_reader("\"x\ny\"\n2\n3\n4\n");
  EXPECT_EQ(reader.skip_rows(2).get(), 2u);
  EXPECT_EQ(reader.line_num(), 3u);
  EXPECT_EQ(reader.records_read(), 2u);
  EXPECT_EQ(reader.read_row().get(), Record{"3"});
  EXPECT_EQ(reader.skip_rows(10).get(), 1u);
  EXPECT_TRUE(reader.exhausted());
}

TEST(RecordReaderTest, NextRow) {
  RecordReader reader = make_reader("a\n");
  std::optional<Record> first = reader.next_row().get();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, Record{"a"});
  EXPECT_FALSE(reader.next_row().get().has_value());
}

TEST(RecordReaderTest, QueuedOperationsRunInOrder) {
  RecordReader reader = make_reader("1\n2\n3\n4\n", 1, 1);
  auto a = reader.read_row();
  auto b = reader.read_rows(2);
  auto c = reader.read_row();
  EXPECT_EQ(a.get(), Record{"1"});
  std::vector<Record> middle = b.get();
  ASSERT_EQ(middle.size(), 2u);
  EXPECT_EQ(middle[0], Record{"2"});
  EXPECT_EQ(middle[1], Record{"3"});
  EXPECT_EQ(c.get(), Record{"4"});
}

// =============================================================================
// Iteration
// =============================================================================

TEST(RecordReaderTest, IterationIsFiniteAndRepeatableWithFreshReader) {
  const std::string csv = "r1\nr2\nr3\n";
  std::vector<Record> first;
  RecordReader reader = make_reader(csv);
  for (const Record& record : reader) {
    first.push_back(record);
  }
  ASSERT_EQ(first.size(), 3u);

  // Exhausted: a second pass yields nothing
  size_t again = 0;
  for (const Record& record : reader) {
    (void)record;
    ++again;
  }
  EXPECT_EQ(again, 0u);

  RecordReader fresh = make_reader(csv);
  EXPECT_EQ(read_all(fresh), first);
}

TEST(RecordReaderTest, IteratorRethrowsErrors) {
  ReaderOptions options;
  options.dialect.strict = true;
  RecordReader reader(std::make_shared<MemorySource>("a\n\"b\"x\n"), options);
  auto it = reader.begin();
  EXPECT_EQ(*it, Record{"a"});
  EXPECT_THROW(++it, FormatError);
}

// =============================================================================
// Errors
// =============================================================================

TEST(RecordReaderTest, MalformedRecordSurfacesThenReadingResumes) {
  ReaderOptions options;
  options.dialect.strict = true;
  RecordReader reader(std::make_shared<MemorySource>("ok\n\"bad\"x,1\nnext\n"), options);
  EXPECT_EQ(reader.read_row().get(), Record{"ok"});
  try {
    reader.read_row().get();
    FAIL() << "expected FormatError";
  } catch (const FormatError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_QUOTE_ESCAPE);
    EXPECT_EQ(*e.location().line, 2u);
    EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
  }
  EXPECT_EQ(reader.read_row().get(), Record{"next"});
}

TEST(RecordReaderTest, ReadRowsKeepsCompletedRecordsOnError) {
  ReaderOptions options;
  options.dialect.strict = true;
  RecordReader reader(std::make_shared<MemorySource>("1\n2\n\"3\"x\n4\n"), options);
  EXPECT_THROW(reader.read_rows(4).get(), FormatError);
  EXPECT_EQ(reader.records_read(), 0u);

  std::vector<Record> records = reader.read_rows(4).get();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0], Record{"1"});
  EXPECT_EQ(records[1], Record{"2"});
  EXPECT_EQ(records[2], Record{"4"});
  EXPECT_TRUE(reader.exhausted());
}

TEST(RecordReaderTest, SourceFailureIsIoError) {
  auto source = std::make_shared<test_util::FailingSource>("a\nb\nc\n", 2);
  ReaderOptions options;
  options.chunk_size = 2;
  RecordReader reader(source, options);
  EXPECT_EQ(reader.read_row().get(), Record{"a"});
  try {
    reader.read_row().get();
    FAIL() << "expected IoError";
  } catch (const IoError& e) {
    EXPECT_EQ(e.os_error(), 5);
  }
}

TEST(RecordReaderTest, FieldSizeLimitFromOptions) {
  ReaderOptions options;
  options.field_size_limit = 4;
  RecordReader reader(std::make_shared<MemorySource>("abcd\nabcde\n"), options);
  EXPECT_EQ(reader.read_row().get(), Record{"abcd"});
  try {
    reader.read_row().get();
    FAIL() << "expected FormatError";
  } catch (const FormatError& e) {
    EXPECT_EQ(e.code(), ErrorCode::FIELD_TOO_LARGE);
  }
}

// =============================================================================
// Construction and lifecycle
// =============================================================================

TEST(RecordReaderTest, InvalidOptionsRejectedEagerly) {
  ReaderOptions zero_chunk;
  zero_chunk.chunk_size = 0;
  EXPECT_THROW(RecordReader(std::make_shared<MemorySource>("a"), zero_chunk), ConfigError);

  ReaderOptions bad_dialect;
  bad_dialect.dialect.delimiter = '"';
  EXPECT_THROW(RecordReader(std::make_shared<MemorySource>("a"), bad_dialect), ConfigError);

  EXPECT_THROW(RecordReader{std::shared_ptr<ByteSource>()}, ConfigError);
}

TEST(RecordReaderTest, PathConstructor) {
  test_util::TempCsvFile csv("name,qty\nbolt,3\n");
  RecordReader reader(csv.path());
  EXPECT_EQ(reader.read_row().get(), (Record{"name", "qty"}));
  EXPECT_EQ(reader.read_row().get(), (Record{"bolt", "3"}));
  reader.close().get();
}

TEST(RecordReaderTest, PathValidation) {
  EXPECT_THROW(RecordReader{std::string()}, ConfigError);
  EXPECT_THROW(RecordReader("/nonexistent/dir/data.csv"), IoError);
}

TEST(RecordReaderTest, CustomOpener) {
  std::string seen;
  SourceOpener opener = [&seen](const std::string& path) -> std::shared_ptr<ByteSource> {
    seen = path;
    return std::make_shared<MemorySource>("x,y\n");
  };
  RecordReader reader("virtual.csv", ReaderOptions(), opener);
  EXPECT_EQ(seen, "virtual.csv");
  EXPECT_EQ(reader.read_row().get(), (Record{"x", "y"}));
}

TEST(RecordReaderTest, CloseIsIdempotentAndBlocksReads) {
  auto source = std::make_shared<MemorySource>("a\nb\n");
  RecordReader reader(source);
  EXPECT_EQ(reader.read_row().get(), Record{"a"});
  reader.close().get();
  EXPECT_NO_THROW(reader.close().get());
  EXPECT_TRUE(reader.closed());
  EXPECT_TRUE(source->closed());

  try {
    reader.read_row().get();
    FAIL() << "expected ClosedResourceError";
  } catch (const ClosedResourceError& e) {
    EXPECT_EQ(e.code(), ErrorCode::RESOURCE_CLOSED);
  }
  EXPECT_THROW(reader.read_rows(1).get(), ClosedResourceError);
  EXPECT_THROW(reader.skip_rows(1).get(), ClosedResourceError);
}

TEST(RecordReaderTest, BorrowedSourceLeftOpen) {
  auto source = std::make_shared<MemorySource>("a\n");
  {
    RecordReader reader(source, ReaderOptions(), HandleOwnership::BORROWED);
    EXPECT_EQ(reader.read_row().get(), Record{"a"});
    reader.close().get();
  }
  EXPECT_FALSE(source->closed());
}

TEST(RecordReaderTest, DestructorClosesOwnedSource) {
  auto source = std::make_shared<MemorySource>("a\n");
  {
    RecordReader reader(source);
    reader.read_row().get();
  }
  EXPECT_TRUE(source->closed());
}

TEST(RecordReaderTest, MovedReaderKeepsPosition) {
  RecordReader reader = make_reader("1\n2\n");
  reader.read_row().get();
  RecordReader moved = std::move(reader);
  EXPECT_EQ(moved.read_row().get(), Record{"2"});
  EXPECT_EQ(moved.records_read(), 2u);
}

TEST(RecordReaderTest, VerboseTraceLogsLifecycle) {
  FILE* out = std::tmpfile();
  ASSERT_NE(out, nullptr);
  ReaderOptions options;
  options.debug.verbose = true;
  options.debug.output = out;
  {
    RecordReader reader(std::make_shared<MemorySource>("a\n"), options);
    read_all(reader);
    reader.close().get();
  }
  std::rewind(out);
  char line[512];
  std::string log;
  while (std::fgets(line, sizeof(line), out)) {
    log += line;
  }
  std::fclose(out);
  EXPECT_NE(log.find("reader opened"), std::string::npos);
  EXPECT_NE(log.find("end of stream: 1 records"), std::string::npos);
  EXPECT_NE(log.find("reader closed"), std::string::npos);
}
