#include "dumptruck/core/constants.hpp"
#include "dumptruck/core/lru_cache.hpp"
#include "dumptruck/discovery/help_scanner.hpp"
#include "dumptruck/text/sanitizer.hpp"

#include <benchmark/benchmark.h>

#include <string>

using namespace dumptruck;

namespace {

// Roughly the shape of `aws help`: a long preamble, a few hundred service
// bullets, then trailing sections.
auto make_root_help(int services) -> std::string {
  std::string text = "AWS()\n\n\x1b[1mNAME\x1b[0m\n       aws -\r\n\n";
  for (int i = 0; i < 200; ++i) {
    text += "       Some descriptive paragraph text about the CLI.\n";
  }
  text += "AVAILABLE SSEERRVVIICCEESS\n";
  for (int i = 0; i < services; ++i) {
    text += "\n       +o service-" + std::to_string(i) + "\n";
  }
  text += "\nSEE ALSO\n       +o aws help topics\n";
  return text;
}

}  // namespace

static void BM_SanitizeRootHelp(benchmark::State& state) {
  auto raw = make_root_help(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    auto lines = sanitize(raw);
    benchmark::DoNotOptimize(lines);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                          static_cast<int64_t>(raw.size()));
}

static void BM_ScanServicesSection(benchmark::State& state) {
  auto lines = sanitize(make_root_help(static_cast<int>(state.range(0))));
  for (auto _ : state) {
    auto items = scan_help_items(lines, std::string(help::kServicesMarker));
    benchmark::DoNotOptimize(items);
  }
}

static void BM_LazySanitizeAndScan(benchmark::State& state) {
  auto raw = make_root_help(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    SanitizedLines lines{raw};
    HelpTextScanner scanner{std::string(help::kServicesMarker)};
    int count = 0;
    while (!scanner.finished()) {
      auto line = lines.next();
      if (!line) {
        break;
      }
      if (scanner.feed(*line)) {
        ++count;
      }
    }
    benchmark::DoNotOptimize(count);
  }
}

static void BM_LruCacheHit(benchmark::State& state) {
  LruCache<std::string, int> cache{defaults::kCacheCapacity};
  for (int i = 0; i < 1000; ++i) {
    cache.put("aws service-" + std::to_string(i) + " help", i);
  }
  int i = 0;
  for (auto _ : state) {
    auto v = cache.get("aws service-" + std::to_string(i++ % 1000) + " help");
    benchmark::DoNotOptimize(v);
  }
}

BENCHMARK(BM_SanitizeRootHelp)->Arg(50)->Arg(400);
BENCHMARK(BM_ScanServicesSection)->Arg(50)->Arg(400);
BENCHMARK(BM_LazySanitizeAndScan)->Arg(50)->Arg(400);
BENCHMARK(BM_LruCacheHit);

BENCHMARK_MAIN();
