#include "dumptruck/discovery/validation_oracle.hpp"

#include "dumptruck/text/sanitizer.hpp"
#include "dumptruck/util/log.hpp"

namespace dumptruck {

ValidationOracle::ValidationOracle(IProcessRunner& runner,
                                   const ToolConfig& tool)
    : runner_{&runner},
      tool_{&tool},
      help_docs_{tool.cache_capacity},
      valid_{tool.cache_capacity} {
}

auto ValidationOracle::help_document(const Args& command_path)
    -> Result<HelpDocument> {
  if (auto cached = help_docs_.get(command_path)) {
    return ok(std::move(*cached));
  }

  Invocation inv;
  inv.args.reserve(command_path.size() + 2);
  inv.args.push_back(tool_->command);
  inv.args.insert(inv.args.end(), command_path.begin(), command_path.end());
  inv.args.emplace_back(help::kHelpArg);
  inv.timeout = tool_->timeout;

  log::info("running command: {}", join_args(inv.args));
  auto result = runner_->run(inv);
  if (!result) {
    return fail(result.error());
  }

  auto doc = sanitize(result->stdout_output);
  help_docs_.put(command_path, doc);
  return ok(std::move(doc));
}

auto ValidationOracle::probe_help(const Args& command_path) -> bool {
  if (auto cached = valid_.get(command_path)) {
    return *cached;
  }

  auto doc = help_document(command_path);
  if (!doc) {
    log::debug("help probe failed for '{}': {}", join_args(command_path),
               doc.error().message());
  }
  valid_.put(command_path, doc.has_value());
  return doc.has_value();
}

auto ValidationOracle::service_is_valid(std::string_view service) -> bool {
  if (service.empty()) {
    return false;
  }
  return probe_help(Args{std::string(service)});
}

auto ValidationOracle::command_is_valid(std::string_view service,
                                        std::string_view subcommand) -> bool {
  if (service.empty() || subcommand.empty()) {
    return false;
  }
  return probe_help(Args{std::string(service), std::string(subcommand)});
}

auto ValidationOracle::operation_is_runnable(const Args& args) -> bool {
  Invocation inv;
  inv.args.reserve(args.size() + 1);
  inv.args.push_back(tool_->command);
  inv.args.insert(inv.args.end(), args.begin(), args.end());
  inv.timeout = tool_->timeout;

  auto result = runner_->run(inv);
  if (!result) {
    log::debug("probe failed for '{}': {}", join_args(inv.args),
               result.error().message());
    return false;
  }
  return result->succeeded();
}

}  // namespace dumptruck
