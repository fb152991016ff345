#include "uuidforge/entropy/entropy_source.hpp"

namespace uuidforge {

auto bits_from_bytes(const std::uint8_t *data, std::size_t count)
    -> BitSequence {
  BitSequence bits(count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto byte = data[i / 8];
    bits[i] = ((byte >> (7 - (i % 8))) & 1U) != 0;
  }
  return bits;
}

auto bits_to_uint(const BitSequence &bits, std::size_t offset,
                  std::size_t width) noexcept -> std::uint64_t {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width && offset + i < bits.size(); ++i) {
    value = (value << 1) | (bits.test(offset + i) ? 1U : 0U);
  }
  return value;
}

} // namespace uuidforge
