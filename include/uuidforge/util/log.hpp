#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>

namespace uuidforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Async logger: lines are formatted on the calling thread and handed to a
// single writer thread through an io_context. Before start() and after stop()
// lines are written inline.
class Logger {
  using WorkGuard =
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stderr};
  FILE *file_{nullptr};
  std::mutex lifecycle_mu_;
  // Shared by log() across its running_ check and post(); taken exclusively
  // to flip running_, so nothing is posted after the writer drains.
  std::shared_mutex post_mu_;
  boost::asio::io_context writer_ctx_{1};
  std::optional<WorkGuard> work_;
  std::jthread writer_;

  auto write_line(const std::string &line) -> void {
    auto *out = output_.load(std::memory_order_acquire);
    if (!out) {
      out = stderr;
    }
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }

  [[nodiscard]] auto use_color() const noexcept -> bool {
    auto *out = output_.load(std::memory_order_acquire);
    return out != nullptr && ::isatty(::fileno(out)) != 0;
  }

  auto start_locked() -> void {
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    writer_ctx_.restart();
    work_.emplace(writer_ctx_.get_executor());
    writer_ = std::jthread([this] { writer_ctx_.run(); });
    std::unique_lock lock(post_mu_);
    running_.store(true, std::memory_order_release);
  }

  auto stop_locked() -> void {
    {
      std::unique_lock lock(post_mu_);
      if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
      }
    }
    work_.reset();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    std::lock_guard lock(lifecycle_mu_);
    start_locked();
  }

  // Lines posted before stop() are written before the writer thread exits;
  // later lines go out inline.
  auto stop() -> void {
    std::lock_guard lock(lifecycle_mu_);
    stop_locked();
  }

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  auto set_output_stdout() noexcept -> void {
    output_.store(stdout, std::memory_order_release);
  }

  // The writer is paused around the swap so it never writes to a closed file.
  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(lifecycle_mu_);
    FILE *f = nullptr;
    if (!path.empty()) {
      f = std::fopen(std::string(path).c_str(), "a");
      if (!f) {
        return false;
      }
      std::setvbuf(f, nullptr, _IOLBF, 0);
    }
    const bool was_running = running_.load(std::memory_order_acquire);
    stop_locked();
    output_.store(f ? f : stderr, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    if (was_running) {
      start_locked();
    }
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    const bool color = use_color();
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                            color ? level_color(level) : "", level_name(level),
                            color ? "\o{33}[0m" : "", tid,
                            std::format(fmt, std::forward<Args>(args)...));

    std::shared_lock lock(post_mu_);
    if (!running_.load(std::memory_order_acquire)) {
      write_line(line);
      return;
    }
    boost::asio::post(writer_ctx_, [this, line = std::move(line)] {
      write_line(line);
    });
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto set_output_stdout() noexcept -> void {
  logger().set_output_stdout();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace uuidforge::log
