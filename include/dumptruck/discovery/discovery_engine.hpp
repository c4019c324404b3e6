#pragma once

#include "dumptruck/config/system_config.hpp"
#include "dumptruck/core/error.hpp"
#include "dumptruck/discovery/validation_oracle.hpp"
#include "dumptruck/process/process_runner.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dumptruck {

// A (service, subcommand) pair that passed every validation probe.
struct DumpCommand {
  std::string service;
  std::string subcommand;

  bool operator==(const DumpCommand&) const = default;
};

// Returned by visitors to continue or short-circuit an enumeration.
enum class Visit : std::uint8_t { Continue, Stop };

using ServiceVisitor = std::function<Visit(const std::string& service)>;
using CommandVisitor = std::function<Visit(const DumpCommand& command)>;

[[nodiscard]] auto is_dump_subcommand(std::string_view subcommand) noexcept
    -> bool;

// A name usable as one path component: non-empty, not "." or "..", no '/'.
[[nodiscard]] auto is_path_safe_name(std::string_view name) noexcept -> bool;

// Enumerates services and their list-/describe- subcommands in help-text
// order, depth-first. Every step may invoke the external tool.
class DiscoveryEngine {
public:
  DiscoveryEngine(IProcessRunner& runner, ValidationOracle& oracle);

  // Fails only when the root help text cannot be fetched.
  [[nodiscard]] auto list_services(const ServiceVisitor& visitor)
      -> Result<Visit>;

  // Throws ContractViolation unless `service` is non-empty and valid.
  [[nodiscard]] auto list_service_commands(std::string_view service,
                                           const CommandVisitor& visitor)
      -> Visit;

  // Services x subcommands, each pair gated by a final runnability probe.
  [[nodiscard]] auto list_valid_dump_commands(const CommandVisitor& visitor)
      -> Result<void>;

  [[nodiscard]] auto collect_valid_dump_commands()
      -> Result<std::vector<DumpCommand>>;

private:
  IProcessRunner* runner_;
  ValidationOracle* oracle_;
};

}  // namespace dumptruck
