#include "uuidforge/uuid/name_based.hpp"

#include "uuidforge/core/constants.hpp"
#include "uuidforge/util/digest.hpp"
#include "uuidforge/util/log.hpp"

#include <algorithm>

namespace uuidforge {
namespace {

[[nodiscard]] auto text_bytes(std::string_view name)
    -> std::span<const std::byte> {
  return std::as_bytes(std::span<const char>{name.data(), name.size()});
}

} // namespace

auto stamp_v5(std::span<const std::uint8_t, layout::kSha1DigestSize> digest) noexcept
    -> Uuid {
  Uuid::Bytes out{};
  std::copy_n(digest.begin(), out.size(), out.begin());

  auto &version = out[layout::kVersionByte];
  version = static_cast<std::uint8_t>((version & 0x0F) |
                                      (layout::kVersionV5 << 4));

  auto &variant = out[layout::kVariantByte];
  variant = static_cast<std::uint8_t>((variant & 0x3F) |
                                      (layout::kVariantRfc << 6));
  return Uuid{out};
}

auto generate_v5(const Uuid &namespace_id, std::span<const std::byte> name)
    -> Result<Uuid> {
  util::Sha1 hasher;
  if (auto r = hasher.update(namespace_id.as_bytes()); !r) {
    return fail(r.error());
  }
  if (auto r = hasher.update(name); !r) {
    return fail(r.error());
  }
  auto digest = hasher.finish();
  if (!digest) {
    return fail(digest.error());
  }
  return ok(stamp_v5(*digest));
}

auto generate_v5(const Uuid &namespace_id, std::string_view name)
    -> Result<Uuid> {
  return generate_v5(namespace_id, text_bytes(name));
}

auto generate_v5(Namespace tag, std::span<const std::byte> name)
    -> Result<Uuid> {
  return generate_v5(namespace_uuid(tag), name);
}

auto generate_v5(Namespace tag, std::string_view name) -> Result<Uuid> {
  return generate_v5(namespace_uuid(tag), text_bytes(name));
}

auto generate_v5(std::span<const std::uint8_t> namespace_bytes,
                 std::span<const std::byte> name) -> Result<Uuid> {
  auto namespace_id = Uuid::from_bytes(namespace_bytes);
  if (!namespace_id) {
    log::debug("v5 rejected namespace of {} bytes", namespace_bytes.size());
    return fail(Error::InvalidNamespace);
  }
  return generate_v5(*namespace_id, name);
}

auto generate_v5(std::span<const std::uint8_t> namespace_bytes,
                 std::string_view name) -> Result<Uuid> {
  return generate_v5(namespace_bytes, text_bytes(name));
}

} // namespace uuidforge
