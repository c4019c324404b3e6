#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dumptruck {

enum class ScanState : std::uint8_t {
  Skipping,    // looking for the section marker
  Collecting,  // inside the bullet list
  Finished,    // first non-bullet line after the marker was seen
};

[[nodiscard]] constexpr auto to_string_view(ScanState state) noexcept
    -> std::string_view {
  switch (state) {
    case ScanState::Skipping: return "skipping";
    case ScanState::Collecting: return "collecting";
    case ScanState::Finished: return "finished";
  }
  return "unknown";
}

// Extracts "+o name" bullet items from the section that follows a marker line
// in sanitized help text. Feed lines one at a time; once the state is
// Finished every further line is ignored.
class HelpTextScanner {
public:
  explicit HelpTextScanner(std::string marker);

  // Returns the item name when the line is a bullet inside the section.
  [[nodiscard]] auto feed(std::string_view line) -> std::optional<std::string>;

  [[nodiscard]] auto state() const noexcept -> ScanState {
    return state_;
  }

  [[nodiscard]] auto finished() const noexcept -> bool {
    return state_ == ScanState::Finished;
  }

  [[nodiscard]] auto marker() const noexcept -> const std::string& {
    return marker_;
  }

private:
  std::string marker_;
  ScanState state_{ScanState::Skipping};
};

[[nodiscard]] auto is_bullet_item(std::string_view line) noexcept -> bool;

[[nodiscard]] auto scan_help_items(std::span<const std::string> lines,
                                   std::string_view marker)
    -> std::vector<std::string>;

}  // namespace dumptruck
