#pragma once

#include "dumptruck/config/system_config.hpp"
#include "dumptruck/core/error.hpp"

#include <optional>
#include <string>

namespace dumptruck::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

// Command-line overrides applied on top of the config file (or defaults).
struct ConfigOptions {
  std::string config_file;
  std::optional<std::string> output_dir;
  std::optional<std::string> tool;
  std::optional<long> timeout_sec;
  std::optional<std::string> log_level;
};

[[nodiscard]] auto resolve_config(const ConfigOptions& opts)
    -> Result<DumpConfig>;

[[nodiscard]] auto cmd_dump(const ConfigOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ConfigOptions& opts) -> int;
[[nodiscard]] auto cmd_show_config(const ConfigOptions& opts) -> int;

}  // namespace dumptruck::cli
