#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <cstddef>
#include <ranges>
#include <string>
#include <string_view>

namespace uuidforge {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

// Lowercase, alphanumerics only: "X.500", "x500" and "X500" are one token.
[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  auto folded =
      token | std::views::filter([](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
      }) |
      std::views::transform([](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      });
  return std::string(folded.begin(), folded.end());
}

template <typename E> struct EnumEntry {
  E value;
  std::string token;
};

// Described enumerators in declaration order, each with its normalized name.
template <typename E>
[[nodiscard]] auto enum_entries() -> const auto & {
  using descriptors = boost::describe::describe_enumerators<E>;
  static const auto table = [] {
    std::array<EnumEntry<E>, boost::mp11::mp_size<descriptors>::value> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto d) {
      out[i++] = {d.value, normalize_enum_token(d.name)};
    });
    return out;
  }();
  return table;
}

// Enumerator names are single words, so the normalized token doubles as the
// config/wire name ("openssl", "x500").
template <typename E>
[[nodiscard]] auto enum_name(E value) noexcept -> std::string_view {
  for (const auto &entry : enum_entries<E>()) {
    if (entry.value == value) {
      return entry.token;
    }
  }
  return "unknown";
}

// Writes `out` only when `input` names an enumerator.
template <typename E>
[[nodiscard]] auto try_parse_enum(std::string_view input, E &out) noexcept
    -> bool {
  const auto token = normalize_enum_token(input);
  for (const auto &entry : enum_entries<E>()) {
    if (entry.token == token) {
      out = entry.value;
      return true;
    }
  }
  return false;
}

template <typename E>
[[nodiscard]] auto parse_enum(std::string_view input, E fallback) noexcept
    -> E {
  E out = fallback;
  return try_parse_enum(input, out) ? out : fallback;
}

} // namespace util

#define UUIDFORGE_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                    \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::uuidforge::util::enum_name(value);                                \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::uuidforge::util::parse_enum(s, DefaultValue);                     \
  }

} // namespace uuidforge
