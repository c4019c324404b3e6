#pragma once

#include "dumptruck/core/constants.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace dumptruck {

struct OutputFormat {
  std::string name;       // value passed to --output
  std::string extension;  // artifact file extension, without the dot

  bool operator==(const OutputFormat&) const = default;
};

[[nodiscard]] inline auto default_output_formats() -> std::vector<OutputFormat> {
  return {
      {"text", "log"},
      {"table", "txt"},
      {"json", "json"},
  };
}

struct ToolConfig {
  std::string command{defaults::kTool};
  std::chrono::seconds timeout{defaults::kTimeout};
  std::size_t cache_capacity{defaults::kCacheCapacity};
  std::string services_marker{help::kServicesMarker};
  std::string commands_marker{help::kCommandsMarker};
};

struct OutputConfig {
  std::string directory{defaults::kOutputDir};
  std::vector<OutputFormat> formats{default_output_formats()};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

struct DumpConfig {
  ToolConfig tool;
  OutputConfig output;
  LoggingConfig logging;
};

}  // namespace dumptruck
