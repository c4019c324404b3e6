#include "dumptruck/discovery/discovery_engine.hpp"

#include "dumptruck/discovery/help_scanner.hpp"
#include "dumptruck/text/sanitizer.hpp"
#include "dumptruck/util/log.hpp"

namespace dumptruck {

namespace {
constexpr std::string_view kListPrefix = "list-";
constexpr std::string_view kDescribePrefix = "describe-";
}  // namespace

auto is_dump_subcommand(std::string_view subcommand) noexcept -> bool {
  return subcommand.starts_with(kListPrefix) ||
         subcommand.starts_with(kDescribePrefix);
}

auto is_path_safe_name(std::string_view name) noexcept -> bool {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string_view::npos;
}

DiscoveryEngine::DiscoveryEngine(IProcessRunner& runner,
                                 ValidationOracle& oracle)
    : runner_{&runner}, oracle_{&oracle} {
}

auto DiscoveryEngine::list_services(const ServiceVisitor& visitor)
    -> Result<Visit> {
  const auto& tool = oracle_->tool();

  Invocation inv;
  inv.args = {tool.command, std::string(help::kHelpArg)};
  inv.timeout = tool.timeout;

  log::info("running command: {}", join_args(inv.args));
  auto root = runner_->run(inv);
  if (!root) {
    log::error("failed to fetch root help from '{}': {}", tool.command,
               root.error().message());
    return fail(root.error());
  }

  HelpTextScanner scanner{tool.services_marker};
  SanitizedLines lines{root->stdout_output};
  while (!scanner.finished()) {
    auto line = lines.next();
    if (!line) {
      break;
    }
    auto service = scanner.feed(*line);
    if (!service) {
      continue;
    }
    if (!is_path_safe_name(*service)) {
      log::debug("skipping unsafe service name: '{}'", *service);
      continue;
    }
    if (!oracle_->service_is_valid(*service)) {
      log::debug("invalid service name: '{}'", *service);
      continue;
    }
    if (visitor(*service) == Visit::Stop) {
      return ok(Visit::Stop);
    }
  }

  if (scanner.state() == ScanState::Skipping) {
    log::warn("services marker '{}' not found in '{} help'",
              tool.services_marker, tool.command);
  }
  return ok(Visit::Continue);
}

auto DiscoveryEngine::list_service_commands(std::string_view service,
                                            const CommandVisitor& visitor)
    -> Visit {
  require(!service.empty(), "service name must not be empty");
  require(oracle_->service_is_valid(service),
          "service '" + std::string(service) + "' has not been validated");

  std::string service_name{service};
  auto doc = oracle_->help_document(Args{service_name});
  if (!doc) {
    log::warn("help for service '{}' became unavailable: {}", service_name,
              doc.error().message());
    return Visit::Continue;
  }

  HelpTextScanner scanner{oracle_->tool().commands_marker};
  for (const auto& line : *doc) {
    auto subcommand = scanner.feed(line);
    if (scanner.finished()) {
      break;
    }
    if (!subcommand) {
      continue;
    }
    if (!is_dump_subcommand(*subcommand)) {
      log::debug("skipping: {} {}", service_name, *subcommand);
      continue;
    }
    if (!is_path_safe_name(*subcommand)) {
      log::debug("skipping unsafe subcommand name: {} '{}'", service_name,
                 *subcommand);
      continue;
    }
    if (!oracle_->command_is_valid(service_name, *subcommand)) {
      log::debug("invalid subcommand: '{}' '{}'", service_name, *subcommand);
      continue;
    }
    if (visitor(DumpCommand{service_name, std::move(*subcommand)}) ==
        Visit::Stop) {
      return Visit::Stop;
    }
  }
  return Visit::Continue;
}

auto DiscoveryEngine::list_valid_dump_commands(const CommandVisitor& visitor)
    -> Result<void> {
  auto listed = list_services([&](const std::string& service) {
    log::info("service: {}", service);
    return list_service_commands(service, [&](const DumpCommand& cmd) {
      log::info("subcommand: {} {}", cmd.service, cmd.subcommand);
      if (!oracle_->operation_is_runnable(Args{cmd.service, cmd.subcommand})) {
        log::debug("not runnable: {} {}", cmd.service, cmd.subcommand);
        return Visit::Continue;
      }
      log::info("validated: {} {}", cmd.service, cmd.subcommand);
      return visitor(cmd);
    });
  });
  if (!listed) {
    return fail(listed.error());
  }
  return ok();
}

auto DiscoveryEngine::collect_valid_dump_commands()
    -> Result<std::vector<DumpCommand>> {
  std::vector<DumpCommand> commands;
  auto result = list_valid_dump_commands([&](const DumpCommand& cmd) {
    commands.push_back(cmd);
    return Visit::Continue;
  });
  if (!result) {
    return fail(result.error());
  }
  return ok(std::move(commands));
}

}  // namespace dumptruck
