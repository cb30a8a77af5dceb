#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace mcpbridge::utils {

inline auto Trim(std::string_view value) -> std::string {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::ranges::find_if_not(value, is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

inline auto ToLower(std::string_view value) -> std::string {
  std::string lowered(value);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

// Shortens `message` for debug logs and keeps it on one line.
inline auto Preview(std::string_view message, std::size_t limit = 70)
    -> std::string {
  std::string preview(message.substr(0, limit));
  if (message.size() > limit) {
    preview += "...";
  }
  std::ranges::replace(preview, '\n', ' ');
  std::ranges::replace(preview, '\r', ' ');
  return preview;
}

}  // namespace mcpbridge::utils
