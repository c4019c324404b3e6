#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <unistd.h>

namespace dumptruck::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  return Level::Info;
}

[[nodiscard]] constexpr auto is_level_name(std::string_view name) noexcept
    -> bool {
  return name == "trace" || name == "debug" || name == "info" ||
         name == "warn" || name == "error";
}

// Synchronous logger: every line goes to stderr (colored on a TTY) and, when
// configured, to an append-only log file.
class Logger {
  struct FileCloser {
    auto operator()(std::FILE* f) const noexcept -> void {
      std::fclose(f);
    }
  };

  Level level_{Level::Info};
  bool color_{::isatty(STDERR_FILENO) != 0};
  std::unique_ptr<std::FILE, FileCloser> file_;

  [[nodiscard]] static auto timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec,
                       static_cast<int>(ms.count()));
  }

public:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_ = level;
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_;
  }

  auto set_color(bool enabled) noexcept -> void {
    color_ = enabled;
  }

  // An empty path detaches the file sink.
  [[nodiscard]] auto set_file(const std::string& path) -> bool {
    if (path.empty()) {
      file_.reset();
      return true;
    }
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    file_.reset(f);
    return true;
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_;
  }

  template <typename... Args>
  auto log(Level level, fmt::format_string<Args...> fmt_str, Args&&... args)
      -> void {
    if (!enabled(level))
      return;

    auto ts = timestamp();
    auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

    if (color_) {
      fmt::print(stderr, "[{}] [{}{}{}] {}\n", ts, level_color(level),
                 level_name(level), "\033[0m", msg);
    } else {
      fmt::print(stderr, "[{}] [{}] {}\n", ts, level_name(level), msg);
    }

    if (file_) {
      fmt::print(file_.get(), "[{}] [{}] {}\n", ts, level_name(level), msg);
      std::fflush(file_.get());
    }
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

template <typename... Args>
auto trace(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
  logger().log(Level::Trace, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
  logger().log(Level::Debug, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
  logger().log(Level::Info, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
  logger().log(Level::Warn, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
  logger().log(Level::Error, fmt_str, std::forward<Args>(args)...);
}

}  // namespace dumptruck::log
