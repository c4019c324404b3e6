#include "dumptruck/cli/commands.hpp"

#include "dumptruck/app/application.hpp"
#include "dumptruck/config/config.hpp"
#include "dumptruck/util/log.hpp"

#include <fmt/core.h>

#include <chrono>
#include <cstdio>

namespace dumptruck::cli {

namespace {

auto setup_logging(const LoggingConfig& logging) -> bool {
  log::set_level(logging.level);
  if (!log::set_file(logging.file)) {
    fmt::print(stderr, "Error: cannot open log file: {}\n", logging.file);
    return false;
  }
  return true;
}

}  // namespace

auto resolve_config(const ConfigOptions& opts) -> Result<DumpConfig> {
  DumpConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }

  if (opts.output_dir) {
    config.output.directory = *opts.output_dir;
  }
  if (opts.tool) {
    config.tool.command = *opts.tool;
  }
  if (opts.timeout_sec) {
    config.tool.timeout = std::chrono::seconds(*opts.timeout_sec);
  }
  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }

  if (auto valid = validate_config(config); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(config));
}

auto cmd_dump(const ConfigOptions& opts) -> int {
  auto config = resolve_config(opts);
  if (!config) {
    fmt::print(stderr, "Error: {}\n", config.error().message());
    return kExitFailure;
  }
  if (!setup_logging(config->logging)) {
    return kExitFailure;
  }

  Application app(std::move(*config));
  if (auto r = app.dump(); !r) {
    log::error("dump failed: {}", r.error().message());
    return kExitFailure;
  }
  return kExitOk;
}

auto cmd_list(const ConfigOptions& opts) -> int {
  auto config = resolve_config(opts);
  if (!config) {
    fmt::print(stderr, "Error: {}\n", config.error().message());
    return kExitFailure;
  }
  if (!setup_logging(config->logging)) {
    return kExitFailure;
  }

  Application app(std::move(*config));
  auto r = app.list([](const DumpCommand& cmd) {
    fmt::print("{} {}\n", cmd.service, cmd.subcommand);
    std::fflush(stdout);
    return Visit::Continue;
  });
  if (!r) {
    log::error("discovery failed: {}", r.error().message());
    return kExitFailure;
  }
  return kExitOk;
}

auto cmd_show_config(const ConfigOptions& opts) -> int {
  auto config = resolve_config(opts);
  if (!config) {
    fmt::print(stderr, "Error: {}\n", config.error().message());
    return kExitFailure;
  }
  fmt::print("{}\n", ConfigLoader::to_yaml_string(*config));
  return kExitOk;
}

}  // namespace dumptruck::cli
