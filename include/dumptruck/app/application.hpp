#pragma once

#include "dumptruck/capture/capture_engine.hpp"
#include "dumptruck/config/system_config.hpp"
#include "dumptruck/core/error.hpp"
#include "dumptruck/discovery/discovery_engine.hpp"
#include "dumptruck/discovery/validation_oracle.hpp"
#include "dumptruck/process/process_runner.hpp"
#include "dumptruck/storage/directory_materializer.hpp"

#include <memory>

namespace dumptruck {

class Application {
public:
  explicit Application(DumpConfig config);
  Application(DumpConfig config, std::unique_ptr<IProcessRunner> runner);

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Captures every discovered command in every configured format.
  [[nodiscard]] auto dump() -> Result<void>;

  // Discovery only; nothing is written.
  [[nodiscard]] auto list(const CommandVisitor& visitor) -> Result<void>;

  [[nodiscard]] auto config() const noexcept -> const DumpConfig& {
    return config_;
  }

private:
  DumpConfig config_;
  std::unique_ptr<IProcessRunner> base_runner_;
  MemoizingRunner runner_;
  ValidationOracle oracle_;
  DiscoveryEngine discovery_;
  DirectoryMaterializer dirs_;
  CaptureEngine capture_;
};

}  // namespace dumptruck
