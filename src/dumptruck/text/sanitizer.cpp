#include "dumptruck/text/sanitizer.hpp"

namespace dumptruck {

namespace {

constexpr auto is_line_break(char c) noexcept -> bool {
  return c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

constexpr auto is_printable(char c) noexcept -> bool {
  auto u = static_cast<unsigned char>(c);
  return u >= 0x20 && u <= 0x7e;
}

}  // namespace

auto sanitize_line(std::string_view line) -> std::string {
  std::string clean;
  clean.reserve(line.size());
  for (char c : line) {
    if (is_printable(c)) {
      clean.push_back(c);
    }
  }

  auto first = clean.find_first_not_of(' ');
  if (first == std::string::npos) {
    return {};
  }
  auto last = clean.find_last_not_of(' ');
  return clean.substr(first, last - first + 1);
}

auto SanitizedLines::next() -> std::optional<std::string> {
  while (pos_ < raw_.size()) {
    std::size_t end = pos_;
    while (end < raw_.size() && !is_line_break(raw_[end])) {
      ++end;
    }

    auto line = sanitize_line(raw_.substr(pos_, end - pos_));

    pos_ = end;
    if (pos_ < raw_.size()) {
      // \r\n counts as one break
      if (raw_[pos_] == '\r' && pos_ + 1 < raw_.size() &&
          raw_[pos_ + 1] == '\n') {
        ++pos_;
      }
      ++pos_;
    }

    if (!line.empty()) {
      return line;
    }
  }
  return std::nullopt;
}

auto sanitize(std::string_view raw) -> std::vector<std::string> {
  std::vector<std::string> lines;
  SanitizedLines seq{raw};
  while (auto line = seq.next()) {
    lines.push_back(std::move(*line));
  }
  return lines;
}

}  // namespace dumptruck
