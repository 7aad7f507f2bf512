#include <gtest/gtest.h>

#include <methodxml/logger.hpp>
#include <methodxml/writer.hpp>

#include <string>
#include <vector>

using namespace methodxml;

class LoggerTest : public ::testing::Test {
 protected:
  struct LogEntry {
    log_level level;
    std::string message;
  };

  void SetUp() override {
    set_log_function(&capture, &captured_logs_);
    set_log_level(log_level::debug);
  }

  void TearDown() override {
    set_log_function(nullptr);
    set_log_level(log_level::off);
  }

  static void capture(void* user_data, log_context const& ctx) {
    auto* logs = static_cast<std::vector<LogEntry>*>(user_data);
    logs->push_back({ctx.level, std::string(ctx.message)});
  }

  std::vector<LogEntry> captured_logs_;
};

TEST_F(LoggerTest, FormatsArguments) {
  METHODXML_LOG_INFO("rank={} name={}", 2, "x");

  ASSERT_EQ(captured_logs_.size(), 1u);
  EXPECT_EQ(captured_logs_[0].level, log_level::info);
  EXPECT_EQ(captured_logs_[0].message, "rank=2 name=x");
}

TEST_F(LoggerTest, PlainMessage) {
  METHODXML_LOG_WARNING("plain");

  ASSERT_EQ(captured_logs_.size(), 1u);
  EXPECT_EQ(captured_logs_[0].level, log_level::warning);
  EXPECT_EQ(captured_logs_[0].message, "plain");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  set_log_level(log_level::warning);

  METHODXML_LOG_DEBUG("debug");
  METHODXML_LOG_INFO("info");
  METHODXML_LOG_ERROR("error");

  ASSERT_EQ(captured_logs_.size(), 1u);
  EXPECT_EQ(captured_logs_[0].level, log_level::error);
}

TEST_F(LoggerTest, OffDisablesEverything) {
  set_log_level(log_level::off);
  METHODXML_LOG_ERROR("error");
  EXPECT_TRUE(captured_logs_.empty());
  EXPECT_FALSE(get_logger().enabled(log_level::error));
}

TEST_F(LoggerTest, RewindIsLoggedAtDebug) {
  writer w;
  auto const m = w.mark();
  w.text("speculative");
  w.rewind(m);

  ASSERT_EQ(captured_logs_.size(), 1u);
  EXPECT_EQ(captured_logs_[0].level, log_level::debug);
  EXPECT_EQ(captured_logs_[0].message, "rewind discards 11 bytes");
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(to_string(log_level::debug), "debug");
  EXPECT_STREQ(to_string(log_level::info), "info");
  EXPECT_STREQ(to_string(log_level::warning), "warning");
  EXPECT_STREQ(to_string(log_level::error), "error");
  EXPECT_STREQ(to_string(log_level::off), "off");
}
