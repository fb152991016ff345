#pragma once

#include "uuidforge/core/error.hpp"

#include <boost/dynamic_bitset.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace uuidforge {

// Bits in the order the source produced them: index 0 is the first bit.
using BitSequence = boost::dynamic_bitset<std::uint8_t>;

// Boundary to whatever supplies unbiased random bits. Implementations must
// accept concurrent random_bits() calls and never hand the same bits to two
// callers. A call may block while the source gathers randomness.
class EntropySource {
public:
  virtual ~EntropySource() = default;

  // Must succeed before random_bits() is called.
  [[nodiscard]] virtual auto start() -> Result<void> = 0;
  virtual auto stop() noexcept -> void = 0;
  [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

  // Error::EntropyUnavailable when the source is stopped, unreachable or
  // exhausted; Error::InvalidArgument when count is zero or too large.
  [[nodiscard]] virtual auto random_bits(std::size_t count)
      -> Result<BitSequence> = 0;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
};

// Expands bytes into a BitSequence, most significant bit of each byte first,
// keeping only the leading `count` bits.
[[nodiscard]] auto bits_from_bytes(const std::uint8_t *data, std::size_t count)
    -> BitSequence;

// Reads `width` (<= 64) bits starting at `offset`, first bit most significant.
[[nodiscard]] auto bits_to_uint(const BitSequence &bits, std::size_t offset,
                                std::size_t width) noexcept -> std::uint64_t;

} // namespace uuidforge
