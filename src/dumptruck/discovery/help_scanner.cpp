#include "dumptruck/discovery/help_scanner.hpp"

#include "dumptruck/core/constants.hpp"
#include "dumptruck/util/log.hpp"

namespace dumptruck {

HelpTextScanner::HelpTextScanner(std::string marker)
    : marker_{std::move(marker)} {
}

auto is_bullet_item(std::string_view line) noexcept -> bool {
  return line.starts_with(help::kBulletPrefix) &&
         line.size() >= help::kMinItemLineLength;
}

auto HelpTextScanner::feed(std::string_view line)
    -> std::optional<std::string> {
  switch (state_) {
    case ScanState::Skipping:
      if (line.find(marker_) != std::string_view::npos) {
        state_ = ScanState::Collecting;
      } else {
        log::trace("skipping: {}", line);
      }
      return std::nullopt;

    case ScanState::Collecting:
      if (is_bullet_item(line)) {
        return std::string(line.substr(help::kBulletPrefix.size()));
      }
      state_ = ScanState::Finished;
      return std::nullopt;

    case ScanState::Finished:
      return std::nullopt;
  }
  return std::nullopt;
}

auto scan_help_items(std::span<const std::string> lines,
                     std::string_view marker) -> std::vector<std::string> {
  std::vector<std::string> items;
  HelpTextScanner scanner{std::string(marker)};
  for (const auto& line : lines) {
    if (auto item = scanner.feed(line)) {
      items.push_back(std::move(*item));
    }
    if (scanner.finished()) {
      break;
    }
  }
  return items;
}

}  // namespace dumptruck
