#pragma once

#include "uuidforge/core/constants.hpp"
#include "uuidforge/core/error.hpp"
#include "uuidforge/util/hash.hpp"

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>

namespace uuidforge {

// 128-bit RFC 9562 identifier. Bytes are held in network (big-endian) order,
// so byte-wise comparison is the same as comparing the 128-bit integer.
class Uuid {
public:
  using Bytes = std::array<std::uint8_t, layout::kUuidSize>;

  // Nil UUID.
  constexpr Uuid() noexcept = default;
  constexpr explicit Uuid(const Bytes &bytes) noexcept : bytes_(bytes) {}

  [[nodiscard]] static auto from_bytes(std::span<const std::uint8_t> bytes)
      -> Result<Uuid>;
  [[nodiscard]] static auto from_bytes(std::span<const std::byte> bytes)
      -> Result<Uuid>;

  [[nodiscard]] constexpr auto bytes() const noexcept -> const Bytes & {
    return bytes_;
  }
  [[nodiscard]] auto as_bytes() const noexcept
      -> std::span<const std::byte, layout::kUuidSize> {
    return std::as_bytes(std::span<const std::uint8_t, layout::kUuidSize>{
        bytes_});
  }
  [[nodiscard]] static constexpr auto size() noexcept -> std::size_t {
    return layout::kUuidSize;
  }

  // High nibble of byte 6.
  [[nodiscard]] constexpr auto version() const noexcept -> std::uint8_t {
    return static_cast<std::uint8_t>(bytes_[layout::kVersionByte] >> 4);
  }
  // Two most significant bits of byte 8.
  [[nodiscard]] constexpr auto variant() const noexcept -> std::uint8_t {
    return static_cast<std::uint8_t>(bytes_[layout::kVariantByte] >> 6);
  }
  [[nodiscard]] constexpr auto is_nil() const noexcept -> bool {
    return std::ranges::all_of(bytes_,
                               [](std::uint8_t b) { return b == 0; });
  }

  // Leading 48 bits as Unix milliseconds; only meaningful for v7 values.
  [[nodiscard]] auto unix_millis() const noexcept
      -> std::optional<std::uint64_t>;

  [[nodiscard]] auto high_bits() const noexcept -> std::uint64_t;
  [[nodiscard]] auto low_bits() const noexcept -> std::uint64_t;

  [[nodiscard]] friend constexpr auto operator<=>(const Uuid &,
                                                  const Uuid &) = default;
  [[nodiscard]] friend constexpr auto operator==(const Uuid &, const Uuid &)
      -> bool = default;

private:
  Bytes bytes_{};
};

// Standard 8-4-4-4-12 form.
auto operator<<(std::ostream &os, const Uuid &id) -> std::ostream &;

[[nodiscard]] auto to_string(const Uuid &id) -> std::string;

} // namespace uuidforge

template <> struct std::hash<uuidforge::Uuid> {
  auto operator()(const uuidforge::Uuid &id) const noexcept -> std::size_t {
    return uuidforge::util::hash_u128(id.high_bits(), id.low_bits());
  }
};

template <>
struct std::formatter<uuidforge::Uuid> : std::formatter<std::string_view> {
  auto format(const uuidforge::Uuid &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(uuidforge::to_string(id),
                                                    ctx);
  }
};
