#pragma once

#include "dumptruck/config/system_config.hpp"
#include "dumptruck/core/error.hpp"
#include "dumptruck/discovery/discovery_engine.hpp"
#include "dumptruck/process/process_runner.hpp"
#include "dumptruck/storage/directory_materializer.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace dumptruck {

enum class CaptureStatus : std::uint8_t {
  Written,   // artifact written
  TimedOut,  // skipped, no artifact
  Failed,    // non-zero exit, skipped, no artifact
};

[[nodiscard]] constexpr auto to_string_view(CaptureStatus status) noexcept
    -> std::string_view {
  switch (status) {
    case CaptureStatus::Written: return "written";
    case CaptureStatus::TimedOut: return "timed_out";
    case CaptureStatus::Failed: return "failed";
  }
  return "unknown";
}

// <output_dir>/<format>/<service>/<subcommand>.<extension>. Throws
// ContractViolation unless service and subcommand are path-safe names.
[[nodiscard]] auto artifact_path(const std::filesystem::path& output_dir,
                                 const DumpCommand& command,
                                 const OutputFormat& format)
    -> std::filesystem::path;

class CaptureEngine {
public:
  CaptureEngine(IProcessRunner& runner, DirectoryMaterializer& dirs,
                const ToolConfig& tool);

  // Timeouts and non-zero exits are absorbed and reported through the
  // status; only filesystem failures come back as errors.
  [[nodiscard]] auto capture(const DumpCommand& command,
                             const OutputFormat& format,
                             const std::filesystem::path& output_dir)
      -> Result<CaptureStatus>;

  [[nodiscard]] auto capture_all(const DumpCommand& command,
                                 std::span<const OutputFormat> formats,
                                 const std::filesystem::path& output_dir)
      -> Result<void>;

private:
  IProcessRunner* runner_;
  DirectoryMaterializer* dirs_;
  const ToolConfig* tool_;
};

}  // namespace dumptruck
