#include "dumptruck/process/process_runner.hpp"
#include "dumptruck/util/log.hpp"

namespace dumptruck {

MemoizingRunner::MemoizingRunner(IProcessRunner& inner, std::size_t capacity)
    : inner_{&inner}, cache_{capacity} {
}

auto MemoizingRunner::run(const Invocation& inv) -> Result<ExecutionResult> {
  if (auto cached = cache_.get(inv.args)) {
    log::trace("cache hit: {}", join_args(inv.args));
    return ok(std::move(*cached));
  }

  auto result = inner_->run(inv);
  if (result) {
    cache_.put(inv.args, *result);
  }
  return result;
}

}  // namespace dumptruck
