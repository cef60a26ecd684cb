#pragma once

#include "benchdock/config/system_config.hpp"
#include "benchdock/core/error.hpp"

#include <string_view>

namespace benchdock {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
};

}  // namespace benchdock
