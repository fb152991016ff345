#include "uuidforge/uuid/render.hpp"

#include <array>
#include <format>
#include <iterator>

namespace uuidforge {
namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";
constexpr std::string_view kUrnPrefix = "urn:uuid:";

// Byte indices after which the standard form inserts a hyphen.
constexpr std::array<bool, layout::kUuidSize> kHyphenAfter = {
    false, false, false, true,  // time_low
    false, true,                // time_mid
    false, true,                // time_hi_and_version
    false, true,                // clock_seq
    false, false, false, false, false, false};

template <typename Out>
auto append_hex_byte(Out out, std::uint8_t byte) -> Out {
  *out++ = kHexDigits[byte >> 4];
  *out++ = kHexDigits[byte & 0x0F];
  return out;
}

[[nodiscard]] auto render_hex(const Uuid &id, bool hyphens) -> std::string {
  std::string out;
  out.reserve(hyphens ? 36 : 32);
  auto it = std::back_inserter(out);
  for (std::size_t i = 0; i < layout::kUuidSize; ++i) {
    it = append_hex_byte(it, id.bytes()[i]);
    if (hyphens && kHyphenAfter[i]) {
      *it++ = '-';
    }
  }
  return out;
}

[[nodiscard]] auto render_raw(const Uuid &id) -> std::string {
  std::string out = std::format("Uuid(version={}, variant={}, bytes=[",
                                id.version(), id.variant());
  auto it = std::back_inserter(out);
  for (std::size_t i = 0; i < layout::kUuidSize; ++i) {
    if (i != 0) {
      *it++ = ' ';
    }
    it = append_hex_byte(it, id.bytes()[i]);
  }
  out += "])";
  return out;
}

} // namespace

template <>
auto parse<Format>(std::string_view s) noexcept -> Format {
  if (util::normalize_enum_token(s) == "binary") {
    return Format::Raw;
  }
  return util::parse_enum(s, Format::Standard);
}

auto parse_format_strict(std::string_view s) -> Result<Format> {
  if (util::normalize_enum_token(s) == "binary") {
    return ok(Format::Raw);
  }
  Format out{};
  if (!util::try_parse_enum(s, out)) {
    return fail(Error::InvalidArgument);
  }
  return ok(out);
}

auto render(const Uuid &id, Format format) -> std::string {
  switch (format) {
  case Format::Standard:
    return render_hex(id, true);
  case Format::Hex:
    return render_hex(id, false);
  case Format::Urn:
    return std::string{kUrnPrefix} + render_hex(id, true);
  case Format::Raw:
    return render_raw(id);
  }
  return render_hex(id, true);
}

auto render(const Uuid &id, std::string_view format) -> std::string {
  return render(id, parse<Format>(format));
}

} // namespace uuidforge
