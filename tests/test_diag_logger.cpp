/**
 * @file test_diag_logger.cpp
 * @brief Tests for the file logger: level filtering, line format, directory creation.
 */
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

#include "diag_logger.hpp"
#include "fakes.hpp"

using namespace wanwatch;
using wanwatch::fakes::ScratchDir;

namespace {
std::string slurp(const std::string& path) {
  std::ifstream in(path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
} // namespace

TEST(DiagLogger, ParseLevel) {
  EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level(" WARNING "), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("ERROR"), LogLevel::Error);
  EXPECT_EQ(parse_log_level("chatty"), LogLevel::Info);
}

TEST(DiagLogger, WritesFormattedLinesAndFilters) {
  ScratchDir dir;
  const std::string path = (dir.path() / "logs" / "wanwatch.log").string();
  {
    DiagLogger log(path, LogLevel::Info, false);
    ASSERT_TRUE(log.ok());
    log.debug("hidden detail");
    log.info("cycle started");
    log.error("state write failed");
  }
  const std::string text = slurp(path);
  EXPECT_EQ(text.find("hidden detail"), std::string::npos);
  EXPECT_NE(text.find(" | INFO | cycle started"), std::string::npos);
  EXPECT_NE(text.find(" | ERROR | state write failed"), std::string::npos);
}

TEST(DiagLogger, LevelCanBeRaised) {
  ScratchDir dir;
  const std::string path = dir.file("w.log");
  {
    DiagLogger log(path, LogLevel::Debug, false);
    log.debug("first");
    log.set_level(LogLevel::Error);
    EXPECT_EQ(log.level(), LogLevel::Error);
    log.warn("second");
  }
  const std::string text = slurp(path);
  EXPECT_NE(text.find("first"), std::string::npos);
  EXPECT_EQ(text.find("second"), std::string::npos);
}

TEST(DiagLogger, EmptyPathIsConsoleOnly) {
  DiagLogger log("", LogLevel::Error, false);
  EXPECT_TRUE(log.ok());
  EXPECT_TRUE(log.path().empty());
}
