#include "dumptruck/app/application.hpp"

#include "dumptruck/util/log.hpp"

#include <filesystem>

namespace dumptruck {

Application::Application(DumpConfig config)
    : Application(std::move(config), create_subprocess_runner()) {
}

Application::Application(DumpConfig config,
                         std::unique_ptr<IProcessRunner> runner)
    : config_{std::move(config)},
      base_runner_{std::move(runner)},
      runner_{*base_runner_, config_.tool.cache_capacity},
      oracle_{runner_, config_.tool},
      discovery_{runner_, oracle_},
      dirs_{config_.tool.cache_capacity},
      capture_{runner_, dirs_, config_.tool} {
}

auto Application::dump() -> Result<void> {
  std::filesystem::path output_dir{config_.output.directory};
  log::info("dumping '{}' output into {}", config_.tool.command,
            output_dir.string());

  std::error_code failure;
  auto listed = discovery_.list_valid_dump_commands([&](const DumpCommand& cmd) {
    auto captured = capture_.capture_all(cmd, config_.output.formats, output_dir);
    if (!captured) {
      failure = captured.error();
      return Visit::Stop;
    }
    return Visit::Continue;
  });

  if (!listed) {
    return fail(listed.error());
  }
  if (failure) {
    log::error("aborting dump: {}", failure.message());
    return fail(failure);
  }
  return ok();
}

auto Application::list(const CommandVisitor& visitor) -> Result<void> {
  return discovery_.list_valid_dump_commands(visitor);
}

}  // namespace dumptruck
