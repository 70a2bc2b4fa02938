// Logger sinks: capture per level, clear with nullptr, debug gate.

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "framestamp/util/Logger.hpp"

namespace framestamp::util {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetInfoSink([this](const std::string& line) { info_.push_back(line); });
    Logger::SetWarnSink([this](const std::string& line) { warn_.push_back(line); });
    Logger::SetErrorSink([this](const std::string& line) { error_.push_back(line); });
  }

  void TearDown() override {
    Logger::SetInfoSink(nullptr);
    Logger::SetWarnSink(nullptr);
    Logger::SetErrorSink(nullptr);
    unsetenv("FRAMESTAMP_DEBUG");
  }

  std::vector<std::string> info_;
  std::vector<std::string> warn_;
  std::vector<std::string> error_;
};

TEST_F(LoggerTest, EachLevelReachesOnlyItsSink) {
  Logger::Info("info line");
  Logger::Warn("warn line");
  Logger::Error("error line");

  ASSERT_EQ(info_.size(), 1u);
  ASSERT_EQ(warn_.size(), 1u);
  ASSERT_EQ(error_.size(), 1u);
  EXPECT_EQ(info_[0], "info line");
  EXPECT_EQ(warn_[0], "warn line");
  EXPECT_EQ(error_[0], "error line");
}

TEST_F(LoggerTest, ClearedSinkStopsCapturing) {
  Logger::Error("first");
  Logger::SetErrorSink(nullptr);
  Logger::Error("second");

  ASSERT_EQ(error_.size(), 1u);
  EXPECT_EQ(error_[0], "first");
}

TEST_F(LoggerTest, DebugNeverReachesInfoSink) {
  unsetenv("FRAMESTAMP_DEBUG");
  Logger::Debug("quiet");
  setenv("FRAMESTAMP_DEBUG", "1", 1);
  Logger::Debug("loud");

  EXPECT_TRUE(info_.empty());
  EXPECT_TRUE(warn_.empty());
  EXPECT_TRUE(error_.empty());
}

}  // namespace
}  // namespace framestamp::util
