/**
 * @file byte_stream_test.cpp
 * @brief Tests for file and in-memory byte sources and sinks.
 */

#include "csvstream/byte_stream.h"
#include "csvstream/error.h"

#include "test_util.h"

#include <gtest/gtest.h>
#include <string>

using namespace csvstream;

TEST(FileSourceTest, ReadsWholeFile) {
  test_util::TempCsvFile csv("a,b\n1,2\n");
  FileSource source(csv.path());
  EXPECT_TRUE(source.is_open());

  char buf[64];
  std::string data;
  size_t n;
  while ((n = source.read(buf, 3)) > 0) {
    data.append(buf, n);
  }
  EXPECT_EQ(data, "a,b\n1,2\n");
  source.close();
  EXPECT_FALSE(source.is_open());
  source.close(); // idempotent
}

TEST(FileSourceTest, MissingFileThrowsIoError) {
  try {
    FileSource source("/nonexistent/path/to/file.csv");
    FAIL() << "expected IoError";
  } catch (const IoError& e) {
    EXPECT_NE(e.os_error(), 0);
    EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
  }
}

TEST(FileSourceTest, ReadAfterCloseThrows) {
  test_util::TempCsvFile csv("x\n");
  FileSource source(csv.path());
  source.close();
  char buf[4];
  EXPECT_THROW(source.read(buf, sizeof(buf)), IoError);
}

TEST(FileSinkTest, TruncateAndAppend) {
  test_util::TempOutputFile out;
  {
    FileSink sink(out.path());
    EXPECT_EQ(sink.write("abc", 3), 3u);
    sink.flush();
    sink.close();
  }
  {
    FileSink sink(out.path(), FileMode::APPEND);
    sink.write("def", 3);
    sink.close();
  }
  EXPECT_EQ(test_util::read_file(out.path()), "abcdef");
  {
    FileSink sink(out.path(), FileMode::TRUNCATE);
    sink.write("z", 1);
  }
  EXPECT_EQ(test_util::read_file(out.path()), "z");
}

TEST(FileSinkTest, WriteAfterCloseThrows) {
  test_util::TempOutputFile out;
  FileSink sink(out.path());
  sink.close();
  EXPECT_THROW(sink.write("a", 1), IoError);
}

TEST(MemorySourceTest, MaxReadCapsEachCall) {
  MemorySource source("hello", 2);
  char buf[16];
  EXPECT_EQ(source.read(buf, sizeof(buf)), 2u);
  EXPECT_EQ(source.read(buf, sizeof(buf)), 2u);
  EXPECT_EQ(source.read(buf, sizeof(buf)), 1u);
  EXPECT_EQ(source.read(buf, sizeof(buf)), 0u);
  EXPECT_EQ(source.reads(), 4u);
}

TEST(MemorySourceTest, ClosedSourceThrows) {
  MemorySource source("abc");
  source.close();
  EXPECT_TRUE(source.closed());
  char buf[4];
  EXPECT_THROW(source.read(buf, sizeof(buf)), IoError);
}

TEST(MemorySinkTest, SharedStorageOutlivesSink) {
  auto storage = std::make_shared<std::string>();
  {
    MemorySink sink(storage);
    sink.write("ab", 2);
    sink.write("c", 1);
    sink.flush();
    EXPECT_EQ(sink.writes(), 2u);
    EXPECT_EQ(sink.flushes(), 1u);
  }
  EXPECT_EQ(*storage, "abc");
}

TEST(OpenerTest, DefaultOpeners) {
  test_util::TempOutputFile out;
  auto sink = open_file_sink(out.path());
  sink->write("1,2\n", 4);
  sink->close();

  auto append = open_file_sink_append(out.path());
  append->write("3,4\n", 4);
  append->close();

  auto source = open_file_source(out.path());
  char buf[16];
  size_t n = source->read(buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "1,2\n3,4\n");
}

TEST(ValidatePathTest, RejectsEmptyAndNul) {
  EXPECT_THROW(validate_path(""), ConfigError);
  EXPECT_THROW(validate_path(std::string("a\0b", 3)), ConfigError);
  EXPECT_NO_THROW(validate_path("data.csv"));
  try {
    validate_path("");
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_OPTION);
  }
}
