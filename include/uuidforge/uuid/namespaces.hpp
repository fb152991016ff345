#pragma once

#include "uuidforge/util/enum.hpp"
#include "uuidforge/uuid/uuid.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>

namespace uuidforge {

// Predefined namespace tags (RFC 9562 Appendix C).
enum class Namespace : std::uint8_t { Dns, Url, Oid, X500 };
BOOST_DESCRIBE_ENUM(Namespace, Dns, Url, Oid, X500)
UUIDFORGE_DEFINE_ENUM_SERDE(Namespace, Namespace::Dns)

namespace ns {

// 6ba7b81x-9dad-11d1-80b4-00c04fd430c8; only the last nibble of byte 3
// differs between the four.
[[nodiscard]] constexpr auto make_rfc_namespace(std::uint8_t low) noexcept
    -> Uuid {
  return Uuid{Uuid::Bytes{0x6b, 0xa7, 0xb8, low, 0x9d, 0xad, 0x11, 0xd1, 0x80,
                          0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
}

inline constexpr Uuid kDns = make_rfc_namespace(0x10);
inline constexpr Uuid kUrl = make_rfc_namespace(0x11);
inline constexpr Uuid kOid = make_rfc_namespace(0x12);
inline constexpr Uuid kX500 = make_rfc_namespace(0x14);

} // namespace ns

[[nodiscard]] constexpr auto namespace_dns() noexcept -> Uuid {
  return ns::kDns;
}
[[nodiscard]] constexpr auto namespace_url() noexcept -> Uuid {
  return ns::kUrl;
}
[[nodiscard]] constexpr auto namespace_oid() noexcept -> Uuid {
  return ns::kOid;
}
[[nodiscard]] constexpr auto namespace_x500() noexcept -> Uuid {
  return ns::kX500;
}

[[nodiscard]] constexpr auto namespace_uuid(Namespace tag) noexcept -> Uuid {
  switch (tag) {
  case Namespace::Dns:
    return ns::kDns;
  case Namespace::Url:
    return ns::kUrl;
  case Namespace::Oid:
    return ns::kOid;
  case Namespace::X500:
    return ns::kX500;
  }
  std::unreachable();
}

} // namespace uuidforge
