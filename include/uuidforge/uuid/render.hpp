#pragma once

#include "uuidforge/core/error.hpp"
#include "uuidforge/util/enum.hpp"
#include "uuidforge/uuid/uuid.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace uuidforge {

enum class Format : std::uint8_t {
  Standard, // 8-4-4-4-12 lowercase hex, 36 chars
  Hex,      // 32 lowercase hex digits
  Urn,      // "urn:uuid:" + standard, 45 chars
  Raw,      // debug projection of the bytes, not for interchange
};
BOOST_DESCRIBE_ENUM(Format, Standard, Hex, Urn, Raw)

[[nodiscard]] inline auto to_string_view(Format value) noexcept
    -> std::string_view {
  return util::enum_name(value);
}

// Lenient: unknown tags map to Format::Standard. "binary" is accepted as an
// alias of "raw".
template <>
[[nodiscard]] auto parse<Format>(std::string_view s) noexcept -> Format;

// Strict: unknown tags are Error::InvalidArgument.
[[nodiscard]] auto parse_format_strict(std::string_view s) -> Result<Format>;

[[nodiscard]] auto render(const Uuid &id, Format format = Format::Standard)
    -> std::string;

// Text tag form; applies the lenient parse<Format>() policy.
[[nodiscard]] auto render(const Uuid &id, std::string_view format)
    -> std::string;

} // namespace uuidforge
