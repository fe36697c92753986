#pragma once

#include <string>
#include <string_view>

namespace sme::core {

// Locale-independent ASCII helpers used when decoding boundary records.
// Enum tags ("INTERMEDIATE", "Visual") and institution names are compared
// after normalize_key so casing and padding in upstream data do not split groups.

inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }
  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

// normalize_key = trim + ASCII lowercase.
inline std::string normalize_key(const std::string_view input) {
  return normalize_ascii_lower(trim(input));
}

}  // namespace sme::core
