#include "dumptruck/cli/commands.hpp"
#include "dumptruck/core/error.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  fmt::print("dumptruck - capture every list/describe call of a cloud CLI\n");
  fmt::print("Usage: {} [OPTIONS]\n", prog);
  fmt::print("\n");
  fmt::print("Discovers the tool's services and list-*/describe-* commands from\n");
  fmt::print("its help pages and writes each command's output, in every format,\n");
  fmt::print("to <output-dir>/<format>/<service>/<command>.<ext>.\n");
  fmt::print("\n");
  fmt::print("Options:\n");
  fmt::print("  -c, --config <file>      Config file (YAML)\n");
  fmt::print("  -o, --output-dir <dir>   Output root (default: ./dumptruck)\n");
  fmt::print("  -t, --timeout <sec>      Per-command timeout (default: 300)\n");
  fmt::print("      --tool <path>        CLI to drive (default: aws)\n");
  fmt::print("      --log-level <level>  trace|debug|info|warn|error\n");
  fmt::print("  -l, --list               Print validated commands, capture nothing\n");
  fmt::print("      --show-config        Print the effective config and exit\n");
  fmt::print("  -v, --version            Show version and exit\n");
  fmt::print("  -h, --help               Show this help message\n");
  fmt::print("\n");
  fmt::print("Examples:\n");
  fmt::print("  {} -o /tmp/acct                # full dump\n", prog);
  fmt::print("  {} --list --log-level warn     # what would be captured\n", prog);
}

void print_version() {
  fmt::print("dumptruck v0.1.0\n");
}

enum class Mode { Dump, List, ShowConfig };

struct Options {
  dumptruck::cli::ConfigOptions config;
  Mode mode{Mode::Dump};
};

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  fmt::print(stderr, "Error: {}\n", message);
  fmt::print(stderr, "Try '{} --help' for more information.\n", prog);
  std::exit(dumptruck::cli::kExitUsage);
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  auto value_of = [&](int& i, std::string_view flag) -> std::string {
    if (++i >= argc) {
      usage_error(argv[0], fmt::format("{} requires an argument", flag));
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(dumptruck::cli::kExitOk);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(dumptruck::cli::kExitOk);
    } else if (arg == "-c" || arg == "--config") {
      opts.config.config_file = value_of(i, arg);
    } else if (arg == "-o" || arg == "--output-dir") {
      opts.config.output_dir = value_of(i, arg);
    } else if (arg == "-t" || arg == "--timeout") {
      auto raw = value_of(i, arg);
      long seconds = 0;
      auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), seconds);
      if (ec != std::errc{} || ptr != raw.data() + raw.size() || seconds <= 0) {
        usage_error(argv[0], fmt::format("invalid timeout: {}", raw));
      }
      opts.config.timeout_sec = seconds;
    } else if (arg == "--tool") {
      opts.config.tool = value_of(i, arg);
    } else if (arg == "--log-level") {
      opts.config.log_level = value_of(i, arg);
    } else if (arg == "-l" || arg == "--list") {
      opts.mode = Mode::List;
    } else if (arg == "--show-config") {
      opts.mode = Mode::ShowConfig;
    } else {
      usage_error(argv[0], fmt::format("unknown option: {}", arg));
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  try {
    switch (opts.mode) {
      case Mode::List:
        return dumptruck::cli::cmd_list(opts.config);
      case Mode::ShowConfig:
        return dumptruck::cli::cmd_show_config(opts.config);
      case Mode::Dump:
        break;
    }
    return dumptruck::cli::cmd_dump(opts.config);
  } catch (const dumptruck::ContractViolation& e) {
    fmt::print(stderr, "internal error: {}\n", e.what());
    return dumptruck::cli::kExitFailure;
  }
}
