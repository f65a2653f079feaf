#pragma once

#include "flowforge/config/engine_config.hpp"
#include "flowforge/core/error.hpp"

#include <string>
#include <string_view>

namespace flowforge {

using Config = EngineConfig;

// TOML file -> FLOWFORGE_* environment overrides -> validation.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
  /// Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto load_defaults(std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
};

[[nodiscard]] auto validate_config(const EngineConfig &cfg,
                                   std::string *diagnostic = nullptr)
    -> Result<void>;

} // namespace flowforge
