#include "uuidforge/config/config.hpp"

#include "uuidforge/core/constants.hpp"
#include "uuidforge/core/error.hpp"
#include "uuidforge/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace uuidforge {
namespace detail {

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct EntropyToml {
  std::string source{"openssl"};
  std::uint32_t workers{entropy::kDefaultWorkers};
  std::uint64_t max_request_bits{entropy::kDefaultMaxRequestBits};
};

struct RenderToml {
  std::string default_format{"standard"};
  bool strict_format{false};
};

struct SystemToml {
  LogToml log{};
  EntropyToml entropy{};
  RenderToml render{};
};

} // namespace detail
} // namespace uuidforge

namespace glz {
template <> struct meta<uuidforge::detail::LogToml> {
  using T = uuidforge::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<uuidforge::detail::EntropyToml> {
  using T = uuidforge::detail::EntropyToml;
  static constexpr auto value =
      object("source", &T::source, "workers", &T::workers,
             "max_request_bits", &T::max_request_bits);
};

template <> struct meta<uuidforge::detail::RenderToml> {
  using T = uuidforge::detail::RenderToml;
  static constexpr auto value =
      object("default_format", &T::default_format, "strict_format",
             &T::strict_format);
};

template <> struct meta<uuidforge::detail::SystemToml> {
  using T = uuidforge::detail::SystemToml;
  static constexpr auto value = object("log", &T::log, "entropy", &T::entropy,
                                       "render", &T::render);
};
} // namespace glz

namespace uuidforge {
namespace {

// `origin` names the text in diagnostics: a path, or "<string>".
[[nodiscard]] auto parse_system_toml(std::string_view text,
                                     std::string_view origin)
    -> Result<detail::SystemToml> {
  detail::SystemToml raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    log::error("TOML parse error in {}: {}", origin,
               glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

// lexical_cast wraps "-1" into a huge unsigned value instead of failing.
[[nodiscard]] auto env_unsigned(const char *name, std::string_view text)
    -> Result<std::uint32_t> {
  const auto first = text.find_first_not_of(" \t");
  if (first != std::string_view::npos && text[first] == '-') {
    log::error("{} must not be negative, got '{}'", name, text);
    return fail(Error::ParseError);
  }
  return ok(boost::lexical_cast<std::uint32_t>(text));
}

[[nodiscard]] auto env_flag(std::string_view v) -> bool {
  return v == "1" || v == "true";
}

// Known tags only; a typo in the config is an error even though render-time
// tags may be lenient.
[[nodiscard]] auto parse_source(std::string_view text)
    -> Result<EntropySourceKind> {
  EntropySourceKind kind{};
  if (!util::try_parse_enum(text, kind)) {
    log::error("Unknown entropy source '{}'", text);
    return fail(Error::ParseError);
  }
  return ok(kind);
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string_view origin)
    -> Result<SystemConfig> {
  auto raw_result = parse_system_toml(toml_text, origin);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  if (const char *v = std::getenv("UUIDFORGE_LOG_LEVEL"); v != nullptr) {
    raw.log.level = v;
  }
  if (const char *v = std::getenv("UUIDFORGE_LOG_FILE"); v != nullptr) {
    raw.log.file = v;
  }
  if (const char *v = std::getenv("UUIDFORGE_ENTROPY_SOURCE"); v != nullptr) {
    raw.entropy.source = v;
  }
  if (const char *v = std::getenv("UUIDFORGE_ENTROPY_WORKERS"); v != nullptr) {
    auto workers = env_unsigned("UUIDFORGE_ENTROPY_WORKERS", v);
    if (!workers)
      return fail(workers.error());
    raw.entropy.workers = *workers;
  }
  if (const char *v = std::getenv("UUIDFORGE_RENDER_FORMAT"); v != nullptr) {
    raw.render.default_format = v;
  }
  if (const char *v = std::getenv("UUIDFORGE_RENDER_STRICT"); v != nullptr) {
    raw.render.strict_format = env_flag(v);
  }

  SystemConfig cfg{};
  if (!log::parse_level(raw.log.level)) {
    log::error("Unknown log level '{}'", raw.log.level);
    return fail(Error::ParseError);
  }
  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  auto source = parse_source(raw.entropy.source);
  if (!source)
    return fail(source.error());
  cfg.entropy.source = *source;
  cfg.entropy.workers = raw.entropy.workers;
  cfg.entropy.max_request_bits =
      static_cast<std::size_t>(raw.entropy.max_request_bits);

  auto format = parse_format_strict(raw.render.default_format);
  if (!format) {
    log::error("Unknown render format '{}'", raw.render.default_format);
    return fail(Error::ParseError);
  }
  cfg.render.default_format = *format;
  cfg.render.strict_format = raw.render.strict_format;

  if (cfg.entropy.workers == 0 ||
      cfg.entropy.workers > entropy::kMaxWorkers) {
    log::error("entropy.workers must be in [1, {}], got {}",
               entropy::kMaxWorkers, cfg.entropy.workers);
    return fail(Error::ParseError);
  }
  if (cfg.entropy.max_request_bits < layout::kV7RandomBits) {
    log::error("entropy.max_request_bits must be at least {}, got {}",
               layout::kV7RandomBits, cfg.entropy.max_request_bits);
    return fail(Error::ParseError);
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    log::error("Cannot open config file '{}'", path);
    return fail(Error::FileNotFound);
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  return load(text, path);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  return load(toml_str, "<string>");
}

auto ConfigLoader::load(std::string_view toml_str, std::string_view origin)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str, origin);
  } catch (const std::exception &e) {
    log::error("Failed to load configuration from {}: {}", origin, e.what());
    return fail(Error::ParseError);
  }
}

} // namespace uuidforge
