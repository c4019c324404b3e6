#pragma once

#include "dumptruck/core/constants.hpp"
#include "dumptruck/core/error.hpp"
#include "dumptruck/core/lru_cache.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dumptruck {

using Args = std::vector<std::string>;

struct Invocation {
  Args args;
  std::chrono::milliseconds timeout{defaults::kTimeout};
};

struct ExecutionResult {
  int exit_code{0};
  std::string stdout_output;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0;
  }
};

struct ArgsHash {
  [[nodiscard]] auto operator()(const Args& args) const noexcept
      -> std::size_t {
    std::size_t seed = args.size();
    for (const auto& arg : args) {
      seed ^= std::hash<std::string_view>{}(arg) + 0x9e3779b97f4a7c15ULL +
              (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};

[[nodiscard]] auto join_args(const Args& args) -> std::string;

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  // Runs args[0] with the remaining arguments and waits for it. Returns the
  // exit status and stdout; stderr is discarded. Fails with Error::Timeout
  // when the process outlives inv.timeout (the process group is killed).
  [[nodiscard]] virtual auto run(const Invocation& inv)
      -> Result<ExecutionResult> = 0;
};

[[nodiscard]] auto create_subprocess_runner() -> std::unique_ptr<IProcessRunner>;

// Caches completed invocations by argument vector. The timeout is not part of
// the key: a result obtained under one timeout is returned for any other.
// Failed invocations (timeout, spawn failure) are never cached.
class MemoizingRunner : public IProcessRunner {
public:
  MemoizingRunner(IProcessRunner& inner, std::size_t capacity);

  [[nodiscard]] auto run(const Invocation& inv)
      -> Result<ExecutionResult> override;

  [[nodiscard]] auto cache() const noexcept
      -> const LruCache<Args, ExecutionResult, ArgsHash>& {
    return cache_;
  }

private:
  IProcessRunner* inner_;
  LruCache<Args, ExecutionResult, ArgsHash> cache_;
};

}  // namespace dumptruck
