#include "TestFixtures.hpp"
#include "bench-io/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <unistd.h>

using namespace benchio;
using namespace benchio::test;

namespace fs = std::filesystem;

class LoggerTest : public BenchTest {
protected:
  void SetUp() override {
    BenchTest::SetUp();
    log_path_ = fs::temp_directory_path() /
                ("bench_io_logger_" + std::to_string(::getpid()) + ".log");
    fs::remove(log_path_);
  }

  void TearDown() override {
    BenchLogger::instance().shutdown();
    fs::remove(log_path_);
    BenchTest::TearDown();
  }

  std::string read_log() {
    std::ifstream in(log_path_);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

  fs::path log_path_;
};

TEST_F(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
  EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
  EXPECT_EQ(parse_log_level("loud"), spdlog::level::info);
}

TEST_F(LoggerTest, WritesComponentAndContextToFile) {
  BenchLogger::instance().shutdown();
  BenchLogger::instance().init(log_path_.string(), spdlog::level::debug);
  BenchLogger::instance().set_console_level(spdlog::level::off);

  LOG_INFO("PIPELINE", "unit161d", "Done: {} commands", 3);
  LOG_TRACE("PIPELINE", "unit161d", "below threshold");
  BenchLogger::instance().shutdown();

  std::string text = read_log();
  EXPECT_NE(text.find("[PIPELINE] [unit161d] Done: 3 commands"),
            std::string::npos);
  EXPECT_EQ(text.find("below threshold"), std::string::npos);
}

TEST_F(LoggerTest, ReinitOnlyChangesLevel) {
  BenchLogger::instance().shutdown();
  BenchLogger::instance().init(log_path_.string(), spdlog::level::info);
  BenchLogger::instance().init("ignored.log", spdlog::level::warn);
  BenchLogger::instance().set_console_level(spdlog::level::off);

  LOG_INFO("CONFIG", "VALIDATE", "info line");
  LOG_WARN("CONFIG", "VALIDATE", "warn line");
  BenchLogger::instance().shutdown();

  std::string text = read_log();
  EXPECT_EQ(text.find("info line"), std::string::npos);
  EXPECT_NE(text.find("[CONFIG] [VALIDATE] warn line"), std::string::npos);
  EXPECT_FALSE(fs::exists("ignored.log"));
}
