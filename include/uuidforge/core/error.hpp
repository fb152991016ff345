#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace uuidforge {

// Zero stays reserved for "no error" so that a default std::error_code and a
// uuidforge code never collide.
enum class Error : std::uint8_t {
  InvalidArgument = 1,
  InvalidNamespace,
  EntropyUnavailable,
  ClockOutOfRange,
  DigestFailed,
  FileNotFound,
  ParseError,
  InvalidState,
};

class ErrorCategory : public std::error_category {
  // Indexed by code - 1.
  static constexpr std::array<std::string_view, 8> messages = {
      "invalid argument",
      "namespace must be exactly 16 bytes",
      "entropy source unavailable",
      "clock reading does not fit in 48 bits",
      "digest computation failed",
      "file not found",
      "parse error",
      "invalid state",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "uuidforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    if (ev == 0) {
      return "success";
    }
    const auto idx = static_cast<std::size_t>(ev) - 1;
    if (ev < 0 || idx >= std::size(messages)) {
      return std::format("unrecognized uuidforge error {}", ev);
    }
    return std::string{messages[idx]};
  }

  using std::error_category::equivalent;

  // InvalidNamespace is a caller contract violation like InvalidArgument, so
  // both compare equal to std::errc::invalid_argument.
  [[nodiscard]] auto equivalent(int code,
                                const std::error_condition &cond) const noexcept
      -> bool override {
    if (cond.category() == std::generic_category()) {
      switch (static_cast<Error>(code)) {
      case Error::InvalidArgument:
      case Error::InvalidNamespace:
        return cond.value() == static_cast<int>(std::errc::invalid_argument);
      case Error::FileNotFound:
        return cond.value() ==
               static_cast<int>(std::errc::no_such_file_or_directory);
      default:
        break;
      }
    }
    return default_error_condition(code) == cond;
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace uuidforge

template <> struct std::is_error_code_enum<uuidforge::Error> : std::true_type {};
