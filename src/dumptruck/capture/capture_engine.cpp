#include "dumptruck/capture/capture_engine.hpp"

#include "dumptruck/util/log.hpp"

#include <fstream>

namespace dumptruck {

namespace {
constexpr std::string_view kOutputFlag = "--output";
}

auto artifact_path(const std::filesystem::path& output_dir,
                   const DumpCommand& command, const OutputFormat& format)
    -> std::filesystem::path {
  require(is_path_safe_name(command.service) &&
              is_path_safe_name(command.subcommand),
          "unsafe artifact path component in '" + command.service + " " +
              command.subcommand + "'");
  return output_dir / format.name / command.service /
         (command.subcommand + "." + format.extension);
}

CaptureEngine::CaptureEngine(IProcessRunner& runner,
                             DirectoryMaterializer& dirs,
                             const ToolConfig& tool)
    : runner_{&runner}, dirs_{&dirs}, tool_{&tool} {
}

auto CaptureEngine::capture(const DumpCommand& command,
                            const OutputFormat& format,
                            const std::filesystem::path& output_dir)
    -> Result<CaptureStatus> {
  Invocation inv;
  inv.args = {tool_->command, command.service, command.subcommand,
              std::string(kOutputFlag), format.name};
  inv.timeout = tool_->timeout;

  auto execution = runner_->run(inv);
  if (!execution) {
    if (execution.error() == Error::Timeout) {
      log::info("timed out: {}", join_args(inv.args));
      return ok(CaptureStatus::TimedOut);
    }
    return fail(execution.error());
  }
  if (!execution->succeeded()) {
    log::debug("exit {}: {}", execution->exit_code, join_args(inv.args));
    return ok(CaptureStatus::Failed);
  }

  auto path = artifact_path(output_dir, command, format);
  if (auto r = dirs_->ensure_dir(path.parent_path()); !r) {
    return fail(r.error());
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    log::error("failed to open {} for writing", path.string());
    return fail(Error::FileOpenFailed);
  }
  const auto& content = execution->stdout_output;
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  if (!file) {
    log::error("failed while writing {}", path.string());
    return fail(Error::WriteFailed);
  }

  log::info("wrote: {}", path.string());
  return ok(CaptureStatus::Written);
}

auto CaptureEngine::capture_all(const DumpCommand& command,
                                std::span<const OutputFormat> formats,
                                const std::filesystem::path& output_dir)
    -> Result<void> {
  for (const auto& format : formats) {
    auto status = capture(command, format, output_dir);
    if (!status) {
      return fail(status.error());
    }
  }
  return ok();
}

}  // namespace dumptruck
