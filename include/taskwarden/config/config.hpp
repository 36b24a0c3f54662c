#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"

#include <string>
#include <string_view>

namespace taskwarden {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
  // Emits only the fields that differ from their defaults.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
  // Rejects values the executor cannot run with.
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;
};

}  // namespace taskwarden
