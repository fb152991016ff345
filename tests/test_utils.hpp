#pragma once

#include "uuidforge/core/coroutine.hpp"
#include "uuidforge/core/error.hpp"
#include "uuidforge/entropy/entropy_source.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace uuidforge::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

// Packs `width` bits of `value`, most significant first, after `bits`.
inline auto append_bits(BitSequence &bits, std::uint64_t value,
                        std::size_t width) -> void {
  for (std::size_t i = 0; i < width; ++i) {
    bits.push_back(((value >> (width - 1 - i)) & 1U) != 0);
  }
}

[[nodiscard]] inline auto make_v7_bits(std::uint16_t rand_a,
                                       std::uint64_t rand_b) -> BitSequence {
  BitSequence bits;
  append_bits(bits, rand_a, 12);
  append_bits(bits, rand_b, 62);
  return bits;
}

// Deterministic source: every draw encodes a fresh call counter in its
// trailing bits, so successive draws never repeat. Can be told to fail once
// a number of draws has been served.
class CountingEntropySource final : public EntropySource {
public:
  explicit CountingEntropySource(
      std::size_t fail_after = std::numeric_limits<std::size_t>::max())
      : fail_after_(fail_after) {}

  [[nodiscard]] auto start() -> Result<void> override {
    running_.store(true);
    return ok();
  }
  auto stop() noexcept -> void override { running_.store(false); }
  [[nodiscard]] auto is_running() const noexcept -> bool override {
    return running_.load();
  }

  [[nodiscard]] auto random_bits(std::size_t count)
      -> Result<BitSequence> override {
    if (count == 0) {
      return fail(Error::InvalidArgument);
    }
    if (!running_.load()) {
      return fail(Error::EntropyUnavailable);
    }
    const auto n = calls_.fetch_add(1);
    if (n >= fail_after_) {
      return fail(Error::EntropyUnavailable);
    }
    BitSequence bits(count);
    const auto value = n + 1;
    for (std::size_t i = 0; i < count && i < 64; ++i) {
      bits[count - 1 - i] = ((value >> i) & 1U) != 0;
    }
    requested_bits_.store(count);
    return ok(std::move(bits));
  }

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "counting";
  }

  [[nodiscard]] auto calls() const noexcept -> std::size_t {
    return calls_.load();
  }
  [[nodiscard]] auto last_request_bits() const noexcept -> std::size_t {
    return requested_bits_.load();
  }

private:
  std::size_t fail_after_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> calls_{0};
  std::atomic<std::size_t> requested_bits_{0};
};

// Source whose start() fails, as when the entropy backend is unreachable.
class UnreachableEntropySource final : public EntropySource {
public:
  [[nodiscard]] auto start() -> Result<void> override {
    return fail(Error::EntropyUnavailable);
  }
  auto stop() noexcept -> void override {}
  [[nodiscard]] auto is_running() const noexcept -> bool override {
    return false;
  }
  [[nodiscard]] auto random_bits(std::size_t) -> Result<BitSequence> override {
    return fail(Error::EntropyUnavailable);
  }
  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "unreachable";
  }
};

} // namespace uuidforge::test
