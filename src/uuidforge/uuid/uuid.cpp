#include "uuidforge/uuid/uuid.hpp"
#include "uuidforge/uuid/render.hpp"

#include <algorithm>

namespace uuidforge {
namespace {

[[nodiscard]] auto load_be64(const Uuid::Bytes &bytes, std::size_t offset)
    -> std::uint64_t {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    value = (value << 8) | bytes[offset + i];
  }
  return value;
}

} // namespace

auto Uuid::from_bytes(std::span<const std::uint8_t> bytes) -> Result<Uuid> {
  if (bytes.size() != layout::kUuidSize) {
    return fail(Error::InvalidArgument);
  }
  Bytes out{};
  std::ranges::copy(bytes, out.begin());
  return ok(Uuid{out});
}

auto Uuid::from_bytes(std::span<const std::byte> bytes) -> Result<Uuid> {
  return from_bytes(std::span<const std::uint8_t>{
      reinterpret_cast<const std::uint8_t *>(bytes.data()), bytes.size()});
}

auto Uuid::unix_millis() const noexcept -> std::optional<std::uint64_t> {
  if (version() != layout::kVersionV7) {
    return std::nullopt;
  }
  return high_bits() >> (64 - layout::kTimestampBits);
}

auto Uuid::high_bits() const noexcept -> std::uint64_t {
  return load_be64(bytes_, 0);
}

auto Uuid::low_bits() const noexcept -> std::uint64_t {
  return load_be64(bytes_, 8);
}

auto operator<<(std::ostream &os, const Uuid &id) -> std::ostream & {
  return os << render(id, Format::Standard);
}

auto to_string(const Uuid &id) -> std::string {
  return render(id, Format::Standard);
}

} // namespace uuidforge
