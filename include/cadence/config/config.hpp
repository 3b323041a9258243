#pragma once

#include "cadence/config/system_config.hpp"
#include "cadence/core/error.hpp"

#include <string_view>

namespace cadence {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
};

// Rejects values the worker cannot run with (non-positive intervals, batch
// size or history cap).
[[nodiscard]] auto validate(const SystemConfig& config) -> Result<void>;

}  // namespace cadence
