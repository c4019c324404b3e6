#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dumptruck {

// Keeps printable ASCII only and trims surrounding spaces. Bytes of invalid or
// non-ASCII sequences are dropped, never reported.
[[nodiscard]] auto sanitize_line(std::string_view line) -> std::string;

// One-pass, non-restartable sequence of clean, non-empty lines over a raw
// output buffer. Splits on \n, \r, \r\n, \v and \f. The buffer must outlive
// the sequence.
class SanitizedLines {
public:
  explicit SanitizedLines(std::string_view raw) noexcept : raw_{raw} {
  }

  [[nodiscard]] auto next() -> std::optional<std::string>;

  [[nodiscard]] auto exhausted() const noexcept -> bool {
    return pos_ >= raw_.size();
  }

private:
  std::string_view raw_;
  std::size_t pos_{0};
};

[[nodiscard]] auto sanitize(std::string_view raw) -> std::vector<std::string>;

}  // namespace dumptruck
