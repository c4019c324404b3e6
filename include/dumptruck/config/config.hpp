#pragma once

#include "dumptruck/config/system_config.hpp"
#include "dumptruck/core/error.hpp"

#include <string>
#include <string_view>

namespace dumptruck {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<DumpConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<DumpConfig>;

  // Emits only the keys that differ from the defaults.
  [[nodiscard]] static auto to_yaml_string(const DumpConfig& config)
      -> std::string;
};

// Rejects values the run cannot work with (empty tool, zero timeout, a
// format without a name or extension, an unknown log level).
[[nodiscard]] auto validate_config(const DumpConfig& config) -> Result<void>;

}  // namespace dumptruck
