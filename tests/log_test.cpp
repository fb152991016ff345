#include "uuidforge/util/log.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace uuidforge;

namespace {

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto dir = std::filesystem::temp_directory_path();
    path_ = dir / std::format("uuidforge_log_test_{}.log", ::getpid());
    other_path_ =
        dir / std::format("uuidforge_log_test_{}_other.log", ::getpid());
    std::filesystem::remove(path_);
    std::filesystem::remove(other_path_);
    saved_level_ = log::logger().level();
    log::set_level(log::Level::Info);
    ASSERT_TRUE(log::set_output_file(path_.string()));
  }

  void TearDown() override {
    log::stop();
    EXPECT_TRUE(log::set_output_file(""));
    log::set_output_stderr();
    log::set_level(saved_level_);
    std::filesystem::remove(path_);
    std::filesystem::remove(other_path_);
  }

  [[nodiscard]] static auto read_lines(const std::filesystem::path &path)
      -> std::vector<std::string> {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
      lines.push_back(std::move(line));
    }
    return lines;
  }

  std::filesystem::path path_;
  std::filesystem::path other_path_;
  log::Level saved_level_{log::Level::Info};
};

} // namespace

TEST_F(LogTest, WriterThreadDeliversLines) {
  log::start();
  ASSERT_TRUE(log::logger().is_running());
  log::info("hello {}", 42);
  log::stop();
  EXPECT_FALSE(log::logger().is_running());

  auto lines = read_lines(path_);
  ASSERT_EQ(lines.size(), 1U);
  EXPECT_NE(lines[0].find("[info]"), std::string::npos);
  EXPECT_NE(lines[0].find("hello 42"), std::string::npos);
}

TEST_F(LogTest, InlineBeforeStart) {
  ASSERT_FALSE(log::logger().is_running());
  log::warn("written inline");
  auto lines = read_lines(path_);
  ASSERT_EQ(lines.size(), 1U);
  EXPECT_NE(lines[0].find("[warn] "), std::string::npos);
}

TEST_F(LogTest, LevelFilter) {
  log::set_level(log::Level::Warn);
  log::info("dropped");
  log::error("kept");
  auto lines = read_lines(path_);
  ASSERT_EQ(lines.size(), 1U);
  EXPECT_NE(lines[0].find("kept"), std::string::npos);
}

TEST_F(LogTest, NoLinesLostWhenStoppingUnderLoad) {
  constexpr int kThreads = 4;
  constexpr int kLinesPerThread = 250;
  log::start();
  {
    std::vector<std::jthread> writers;
    for (int t = 0; t < kThreads; ++t) {
      writers.emplace_back([t] {
        for (int i = 0; i < kLinesPerThread; ++i) {
          log::info("writer {} line {}", t, i);
        }
      });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    log::stop();
  }
  EXPECT_EQ(read_lines(path_).size(),
            static_cast<std::size_t>(kThreads * kLinesPerThread));
}

TEST_F(LogTest, SwitchFileWhileRunning) {
  log::start();
  log::info("first");
  ASSERT_TRUE(log::set_output_file(other_path_.string()));
  EXPECT_TRUE(log::logger().is_running());
  log::info("second");
  log::stop();

  auto first = read_lines(path_);
  auto second = read_lines(other_path_);
  ASSERT_EQ(first.size(), 1U);
  ASSERT_EQ(second.size(), 1U);
  EXPECT_NE(first[0].find("first"), std::string::npos);
  EXPECT_NE(second[0].find("second"), std::string::npos);
}

TEST_F(LogTest, RestartAfterStop) {
  log::start();
  log::info("one");
  log::stop();
  log::start();
  log::info("two");
  log::stop();
  EXPECT_EQ(read_lines(path_).size(), 2U);
}

TEST(LogLevelTest, ParseLevel) {
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_FALSE(log::parse_level("loud").has_value());
}
