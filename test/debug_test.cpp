/**
 * @file debug_test.cpp
 * @brief Tests for the debug tracing used by readers and writers.
 */

#include "csvstream/debug.h"
#include "csvstream/reader.h"
#include "csvstream/writer.h"

#include <cstdio>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace csvstream;

class DebugTest : public ::testing::Test {
protected:
  void SetUp() override { output_file_ = tmpfile(); }

  void TearDown() override {
    if (output_file_) {
      fclose(output_file_);
    }
  }

  std::string get_output() {
    if (!output_file_)
      return "";
    fflush(output_file_);
    rewind(output_file_);
    std::string result;
    char buffer[1024];
    while (fgets(buffer, sizeof(buffer), output_file_)) {
      result += buffer;
    }
    return result;
  }

  FILE* output_file_ = nullptr;
};

TEST_F(DebugTest, DebugConfigDefaults) {
  DebugConfig config;
  EXPECT_FALSE(config.verbose);
  EXPECT_FALSE(config.io);
  EXPECT_FALSE(config.timing);
  EXPECT_FALSE(config.enabled());
}

TEST_F(DebugTest, DebugConfigAll) {
  DebugConfig config = DebugConfig::all();
  EXPECT_TRUE(config.verbose);
  EXPECT_TRUE(config.io);
  EXPECT_TRUE(config.timing);
  EXPECT_TRUE(config.enabled());
}

TEST_F(DebugTest, DebugTraceLog) {
  DebugConfig config;
  config.verbose = true;
  config.output = output_file_;
  DebugTrace trace(config);

  trace.log("Test message %d", 42);

  std::string output = get_output();
  EXPECT_NE(output.find("[csvstream] Test message 42"), std::string::npos);
}

TEST_F(DebugTest, DisabledCategoriesPrintNothing) {
  DebugConfig config;
  config.output = output_file_;
  DebugTrace trace(config);

  trace.log("hidden");
  trace.log_fetch(10, 10, 10);
  trace.log_flush(5, 5);
  {
    CSVSTREAM_TIMED_PHASE(trace, "read_row", 0);
  }
  trace.print_timing_summary();

  EXPECT_TRUE(get_output().empty());
  EXPECT_TRUE(trace.get_phase_times().empty());
}

TEST_F(DebugTest, IoLogging) {
  DebugConfig config;
  config.io = true;
  config.output = output_file_;
  DebugTrace trace(config);

  trace.log_fetch(64, 12, 12);
  trace.log_fetch(64, 0, 12);
  trace.log_flush(30, 90);

  std::string output = get_output();
  EXPECT_NE(output.find("FETCH: 12 of 64 bytes (total 12)"), std::string::npos);
  EXPECT_NE(output.find("FETCH: end of source after 12 bytes"), std::string::npos);
  EXPECT_NE(output.find("FLUSH: 30 bytes (total 90)"), std::string::npos);
}

TEST_F(DebugTest, TimedPhasesAggregateByName) {
  DebugConfig config;
  config.timing = true;
  config.output = output_file_;
  DebugTrace trace(config);

  {
    CSVSTREAM_TIMED_PHASE(trace, "read_row", 10);
  }
  {
    CSVSTREAM_TIMED_PHASE(trace, "read_row", 5);
  }
  {
    ScopedPhaseTimer timer(trace, "close");
    timer.set_bytes(3);
  }
  ASSERT_EQ(trace.get_phase_times().size(), 3u);
  EXPECT_EQ(trace.get_phase_times()[2].name, "close");
  EXPECT_EQ(trace.get_phase_times()[2].bytes_processed, 3u);

  trace.print_timing_summary();
  std::string output = get_output();
  EXPECT_NE(output.find("TIMING SUMMARY"), std::string::npos);
  EXPECT_NE(output.find("read_row"), std::string::npos);

  trace.clear_timing();
  EXPECT_TRUE(trace.get_phase_times().empty());
}

TEST_F(DebugTest, ReaderReportsTimingOnClose) {
  ReaderOptions options;
  options.debug.timing = true;
  options.debug.output = output_file_;
  RecordReader reader(std::make_shared<MemorySource>("a,b\n"), options);
  reader.read_row().get();
  reader.skip_rows(1).get();
  reader.close().get();

  std::string output = get_output();
  EXPECT_NE(output.find("TIMING SUMMARY"), std::string::npos);
  EXPECT_NE(output.find("read_row"), std::string::npos);
  EXPECT_NE(output.find("skip_rows"), std::string::npos);
}

TEST_F(DebugTest, WriterLogsLifecycle) {
  WriterOptions options;
  options.debug.verbose = true;
  options.debug.output = output_file_;
  RecordWriter writer(std::make_shared<MemorySink>(), options);
  writer.write_row(Record{"a"}).get();
  writer.close().get();

  std::string output = get_output();
  EXPECT_NE(output.find("writer opened"), std::string::npos);
  EXPECT_NE(output.find("writer closed after 3 bytes, 1 records"), std::string::npos);
}
