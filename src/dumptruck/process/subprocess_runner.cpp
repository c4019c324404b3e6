#include "dumptruck/core/constants.hpp"
#include "dumptruck/process/process_runner.hpp"
#include "dumptruck/util/log.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace dumptruck {

namespace {

using Clock = std::chrono::steady_clock;

class UniqueFd {
public:
  explicit UniqueFd(int fd = -1) noexcept : fd_{fd} {
  }
  ~UniqueFd() {
    reset();
  }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  [[nodiscard]] auto get() const noexcept -> int {
    return fd_;
  }

  auto reset() noexcept -> void {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_;
};

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto remaining_ms(Clock::time_point deadline) -> int {
  auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline -
                                                           Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Reads until EOF or the deadline. Returns false on timeout.
auto read_output(int fd, Clock::time_point deadline, std::string& output)
    -> bool {
  std::array<char, io::kReadBufferSize> buffer;

  while (true) {
    int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      return false;
    }

    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rc = ::poll(&pfd, 1, wait_ms);
    if (rc == 0) {
      return false;
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("poll failed: {}", std::strerror(errno));
      return true;
    }

    ssize_t bytes_read = ::read(fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      log::warn("read failed: {}", std::strerror(errno));
      return true;
    }
    if (bytes_read == 0) {
      return true;
    }
    output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
  }
}

// A child may close stdout and keep running, so reaping honours the same
// deadline. Returns false on timeout.
auto wait_process(pid_t pid, Clock::time_point deadline, int& status) -> bool {
  while (true) {
    int wait_result = ::waitpid(pid, &status, WNOHANG);
    if (wait_result == pid) {
      return true;
    }
    if (wait_result < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      status = 0;
      return true;
    }
    if (Clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(io::kReapPollInterval);
  }
}

auto kill_and_reap(pid_t pid) -> void {
  ::kill(-pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

class SubprocessRunner : public IProcessRunner {
public:
  auto run(const Invocation& inv) -> Result<ExecutionResult> override {
    if (inv.args.empty()) {
      return fail(Error::InvalidArgument);
    }

    std::vector<char*> argv;
    argv.reserve(inv.args.size() + 1);
    for (const auto& arg : inv.args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
      log::error("pipe2 failed: {}", std::strerror(errno));
      return fail(Error::SpawnFailed);
    }
    UniqueFd read_fd{fds[0]};
    UniqueFd write_fd{fds[1]};

    UniqueFd null_fd{::open("/dev/null", O_RDWR | O_CLOEXEC)};
    if (null_fd.get() < 0) {
      log::error("failed to open /dev/null: {}", std::strerror(errno));
      return fail(Error::SpawnFailed);
    }

    log::trace("running command: {}", join_args(inv.args));
    auto deadline = Clock::now() + inv.timeout;

    pid_t pid = ::fork();
    if (pid < 0) {
      log::error("fork failed: {}", std::strerror(errno));
      return fail(Error::SpawnFailed);
    }

    if (pid == 0) {
      // Child process - must only use async-signal-safe functions
      ::setpgid(0, 0);
      ::dup2(null_fd.get(), STDIN_FILENO);
      ::dup2(write_fd.get(), STDOUT_FILENO);
      ::dup2(null_fd.get(), STDERR_FILENO);
      ::execvp(argv[0], argv.data());
      ::_exit(127);
    }

    ::setpgid(pid, pid);
    write_fd.reset();
    null_fd.reset();

    ExecutionResult result;
    result.stdout_output.reserve(io::kInitialOutputReserve);

    bool finished = read_output(read_fd.get(), deadline, result.stdout_output);
    read_fd.reset();

    int status = 0;
    if (finished) {
      finished = wait_process(pid, deadline, status);
    }

    if (!finished) {
      kill_and_reap(pid);
      log::debug("timed out after {}ms: {}", inv.timeout.count(),
                 join_args(inv.args));
      return fail(Error::Timeout);
    }

    result.exit_code = get_exit_code(status);
    return ok(std::move(result));
  }
};

}  // namespace

auto join_args(const Args& args) -> std::string {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += arg;
  }
  return joined;
}

auto create_subprocess_runner() -> std::unique_ptr<IProcessRunner> {
  return std::make_unique<SubprocessRunner>();
}

}  // namespace dumptruck
