#pragma once

#include "uuidforge/core/constants.hpp"
#include "uuidforge/util/enum.hpp"
#include "uuidforge/uuid/render.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace uuidforge {

struct LogConfig {
  std::string level{"info"};
  std::string file; // empty = stderr

  auto operator==(const LogConfig &) const -> bool = default;
};

enum class EntropySourceKind : std::uint8_t { Openssl, Getrandom };
BOOST_DESCRIBE_ENUM(EntropySourceKind, Openssl, Getrandom)
UUIDFORGE_DEFINE_ENUM_SERDE(EntropySourceKind, EntropySourceKind::Openssl)

struct EntropyConfig {
  EntropySourceKind source{EntropySourceKind::Openssl};
  unsigned workers{entropy::kDefaultWorkers};
  std::size_t max_request_bits{entropy::kDefaultMaxRequestBits};

  auto operator==(const EntropyConfig &) const -> bool = default;
};

struct RenderConfig {
  Format default_format{Format::Standard};
  // Unknown format tags are errors instead of falling back to standard.
  bool strict_format{false};

  auto operator==(const RenderConfig &) const -> bool = default;
};

struct SystemConfig {
  LogConfig log;
  EntropyConfig entropy;
  RenderConfig render;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace uuidforge
