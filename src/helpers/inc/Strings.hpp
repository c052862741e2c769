#ifndef IBCHECK_HELPERS_STRINGS_HPP
#define IBCHECK_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for sysfs values, command output, and spec fields.
 *
 * Sysfs attributes and tool output are small, line-oriented text. These
 * helpers trim, split, and join them without pulling in a regex engine.
 *
 * @note NOT RT-safe: Most functions allocate std::string / std::vector.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ibcheck {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/// True for space, tab, carriage return, and newline.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/// True if @p str begins with @p prefix.
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/// True if @p str ends with @p suffix.
[[nodiscard]] inline bool endsWith(std::string_view str, std::string_view suffix) noexcept {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// True if @p needle occurs anywhere in @p haystack.
[[nodiscard]] inline bool contains(std::string_view haystack, std::string_view needle) noexcept {
  return haystack.find(needle) != std::string_view::npos;
}

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Return @p str without leading and trailing whitespace.
 * @note RT-safe: Returns a view into the input.
 */
[[nodiscard]] inline std::string_view trimView(std::string_view str) noexcept {
  std::size_t begin = 0;
  while (begin < str.size() && isSpace(str[begin])) {
    ++begin;
  }
  std::size_t end = str.size();
  while (end > begin && isSpace(str[end - 1])) {
    --end;
  }
  return str.substr(begin, end - begin);
}

/// Owning variant of trimView().
[[nodiscard]] inline std::string trim(std::string_view str) { return std::string(trimView(str)); }

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on a single delimiter, keeping empty fields.
 *
 * "a..b" split on '.' yields {"a", "", "b"}; an empty input yields {""}.
 */
[[nodiscard]] inline std::vector<std::string> split(std::string_view str, char delim) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = str.find(delim, start);
    if (POS == std::string_view::npos) {
      out.emplace_back(str.substr(start));
      break;
    }
    out.emplace_back(str.substr(start, POS - start));
    start = POS + 1;
  }
  return out;
}

/// Split on runs of whitespace, dropping empty fields (like awk).
[[nodiscard]] inline std::vector<std::string> splitFields(std::string_view str) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < str.size()) {
    while (i < str.size() && isSpace(str[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < str.size() && !isSpace(str[i])) {
      ++i;
    }
    if (i > START) {
      out.emplace_back(str.substr(START, i - START));
    }
  }
  return out;
}

/// Split into trimmed lines, dropping a trailing empty line.
[[nodiscard]] inline std::vector<std::string> splitLines(std::string_view str) {
  std::vector<std::string> out = split(str, '\n');
  for (std::string& line : out) {
    line = trim(line);
  }
  if (!out.empty() && out.back().empty()) {
    out.pop_back();
  }
  return out;
}

/* ----------------------------- Joining ----------------------------- */

/// Join @p parts with @p sep.
[[nodiscard]] inline std::string join(const std::vector<std::string>& parts,
                                      std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

/* ----------------------------- JSON ----------------------------- */

/**
 * @brief Escape @p str for use inside a JSON string literal.
 *
 * Quotes, backslashes and control characters are escaped; other bytes are
 * copied unchanged.
 */
[[nodiscard]] inline std::string jsonEscape(std::string_view str) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(str.size());
  for (const char C : str) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += "\\u00";
        out += HEX[(static_cast<unsigned char>(C) >> 4) & 0xF];
        out += HEX[static_cast<unsigned char>(C) & 0xF];
      } else {
        out += C;
      }
    }
  }
  return out;
}

/* ----------------------------- Numbers ----------------------------- */

/**
 * @brief Parse a non-negative decimal integer that spans the whole string.
 * @return false on empty input, non-digits, or overflow of long long.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] inline bool parseUnsigned(std::string_view str, long long& out) noexcept {
  if (str.empty()) {
    return false;
  }
  long long value = 0;
  for (const char C : str) {
    if (C < '0' || C > '9') {
      return false;
    }
    if (value > (0x7fffffffffffffffLL - (C - '0')) / 10) {
      return false;
    }
    value = value * 10 + (C - '0');
  }
  out = value;
  return true;
}

} // namespace strings
} // namespace helpers
} // namespace ibcheck

#endif // IBCHECK_HELPERS_STRINGS_HPP
