#pragma once

#include "uuidforge/config/system_config.hpp"
#include "uuidforge/core/error.hpp"

#include <string_view>

namespace uuidforge {

using Config = SystemConfig;

// Environment variables (UUIDFORGE_*) override values read from TOML.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

private:
  [[nodiscard]] static auto load(std::string_view toml_str,
                                 std::string_view origin)
      -> Result<SystemConfig>;
};

} // namespace uuidforge
