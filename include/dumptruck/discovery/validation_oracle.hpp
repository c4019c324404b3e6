#pragma once

#include "dumptruck/config/system_config.hpp"
#include "dumptruck/core/error.hpp"
#include "dumptruck/core/lru_cache.hpp"
#include "dumptruck/process/process_runner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dumptruck {

using HelpDocument = std::vector<std::string>;

// Decides whether a candidate name is real by probing the tool: a probe that
// completes means valid, its output is not inspected.
class ValidationOracle {
public:
  ValidationOracle(IProcessRunner& runner, const ToolConfig& tool);

  // Sanitized lines of `<tool> <command_path...> help`, memoized per path.
  // Fails only when the probe itself fails (timeout, spawn failure).
  [[nodiscard]] auto help_document(const Args& command_path)
      -> Result<HelpDocument>;

  [[nodiscard]] auto service_is_valid(std::string_view service) -> bool;
  [[nodiscard]] auto command_is_valid(std::string_view service,
                                      std::string_view subcommand) -> bool;

  // True iff `<tool> <args...>` exits with status 0.
  [[nodiscard]] auto operation_is_runnable(const Args& args) -> bool;

  [[nodiscard]] auto tool() const noexcept -> const ToolConfig& {
    return *tool_;
  }

private:
  [[nodiscard]] auto probe_help(const Args& command_path) -> bool;

  IProcessRunner* runner_;
  const ToolConfig* tool_;
  LruCache<Args, HelpDocument, ArgsHash> help_docs_;
  LruCache<Args, bool, ArgsHash> valid_;
};

}  // namespace dumptruck
