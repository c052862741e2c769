/**
 * @file VersionConstraint.cpp
 * @brief Parsing and evaluation of stack and firmware version constraints.
 */

#include "src/version/inc/VersionConstraint.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace ibcheck {

namespace version {

using helpers::strings::parseUnsigned;
using helpers::strings::split;
using helpers::strings::trimView;

namespace {

/* ----------------------------- Helpers ----------------------------- */

/**
 * Strip a leading operator from @p text into @p op, defaulting to Op::Eq.
 * A lone "=" or any "<"/"!" form is rejected.
 */
bool takeOperator(std::string_view& text, Op& op, std::string& error) {
  if (text.substr(0, 2) == ">=") {
    text.remove_prefix(2);
    op = Op::Ge;
    return true;
  }
  if (text.substr(0, 2) == "==") {
    text.remove_prefix(2);
    op = Op::Eq;
    return true;
  }
  if (text.substr(0, 1) == ">") {
    text.remove_prefix(1);
    op = Op::Gt;
    return true;
  }
  if (!text.empty() && (text.front() == '=' || text.front() == '<' || text.front() == '!')) {
    const std::size_t LEN = text.find_first_not_of("=<>!");
    error = fmt::format("unsupported operator '{}'", text.substr(0, LEN));
    return false;
  }
  op = Op::Eq;
  return true;
}

/**
 * Parse one dot-separated group into exactly N components.
 */
template <std::size_t N>
bool parseGroup(std::string_view group, std::array<std::int64_t, N>& out, bool allowWildcard,
                std::string_view what, std::string& error) {
  const std::vector<std::string> PARTS = split(group, '.');
  if (PARTS.size() != N) {
    error = fmt::format("{} group '{}' must have {} components, found {}", what, group, N,
                        PARTS.size());
    return false;
  }
  for (std::size_t i = 0; i < N; ++i) {
    if (PARTS[i] == "*") {
      if (!allowWildcard) {
        error = fmt::format("wildcard not allowed in version '{}'", group);
        return false;
      }
      out[i] = WILDCARD;
      continue;
    }
    long long value = 0;
    if (!parseUnsigned(PARTS[i], value)) {
      error = fmt::format("{} component '{}' is not a non-negative integer", what, PARTS[i]);
      return false;
    }
    out[i] = value;
  }
  return true;
}

/**
 * Lexicographic three-way compare of @p actual against @p expected, where a
 * wildcard in @p expected compares equal.
 */
template <std::size_t N>
int compareGroup(const std::array<std::int64_t, N>& actual,
                 const std::array<std::int64_t, N>& expected) noexcept {
  for (std::size_t i = 0; i < N; ++i) {
    if (expected[i] == WILDCARD || actual[i] == WILDCARD) {
      continue;
    }
    if (actual[i] != expected[i]) {
      return actual[i] > expected[i] ? 1 : -1;
    }
  }
  return 0;
}

bool applyOp(Op op, int majorCmp, int minorCmp) noexcept {
  switch (op) {
  case Op::Eq:
    return majorCmp == 0 && minorCmp == 0;
  case Op::Ge:
    return majorCmp >= 0 && minorCmp >= 0;
  case Op::Gt:
    return majorCmp > 0 && minorCmp > 0;
  }
  return false;
}

} // namespace

/* ----------------------------- API ----------------------------- */

const char* toString(Op op) noexcept {
  switch (op) {
  case Op::Eq:
    return "==";
  case Op::Ge:
    return ">=";
  case Op::Gt:
    return ">";
  }
  return "?";
}

bool parseVersion(std::string_view text, StackVersion& out, std::string& error,
                  bool allowWildcard) {
  const std::string_view TRIMMED = trimView(text);
  if (TRIMMED.empty()) {
    error = "empty version string";
    return false;
  }

  // The prefix may itself contain '-', so the groups are the last two fields.
  const std::size_t MINOR_DASH = TRIMMED.rfind('-');
  if (MINOR_DASH == std::string_view::npos || MINOR_DASH == 0) {
    error = fmt::format("version '{}' is not of the form <prefix>-<major>-<minor>", TRIMMED);
    return false;
  }
  const std::size_t MAJOR_DASH = TRIMMED.rfind('-', MINOR_DASH - 1);
  if (MAJOR_DASH == std::string_view::npos || MAJOR_DASH == 0) {
    error = fmt::format("version '{}' is not of the form <prefix>-<major>-<minor>", TRIMMED);
    return false;
  }

  StackVersion parsed;
  parsed.prefix = std::string(TRIMMED.substr(0, MAJOR_DASH));
  const std::string_view MAJOR = TRIMMED.substr(MAJOR_DASH + 1, MINOR_DASH - MAJOR_DASH - 1);
  const std::string_view MINOR = TRIMMED.substr(MINOR_DASH + 1);

  if (!parseGroup(MAJOR, parsed.major, allowWildcard, "major", error) ||
      !parseGroup(MINOR, parsed.minor, allowWildcard, "minor", error)) {
    error = fmt::format("version '{}': {}", TRIMMED, error);
    return false;
  }

  out = std::move(parsed);
  return true;
}

bool parseConstraint(std::string_view text, VersionConstraint& out, std::string& error) {
  std::string_view rest = trimView(text);
  VersionConstraint parsed;
  if (!takeOperator(rest, parsed.op, error)) {
    return false;
  }
  if (!parseVersion(rest, parsed.version, error, true)) {
    return false;
  }
  out = std::move(parsed);
  return true;
}

bool evaluate(const VersionConstraint& constraint, const StackVersion& actual) noexcept {
  const int MAJOR_CMP = compareGroup(actual.major, constraint.version.major);
  const int MINOR_CMP = compareGroup(actual.minor, constraint.version.minor);
  return applyOp(constraint.op, MAJOR_CMP, MINOR_CMP);
}

VersionCheck satisfies(std::string_view constraint, std::string_view actual) {
  VersionCheck result;

  VersionConstraint parsedConstraint;
  std::string error;
  if (!parseConstraint(constraint, parsedConstraint, error)) {
    result.error = fmt::format("invalid constraint: {}", error);
    return result;
  }

  StackVersion parsedActual;
  if (!parseVersion(actual, parsedActual, error)) {
    result.error = fmt::format("invalid version: {}", error);
    return result;
  }

  result.satisfied = evaluate(parsedConstraint, parsedActual);
  return result;
}

VersionCheck compareDotted(std::string_view constraint, std::string_view actual) {
  VersionCheck result;

  std::string_view spec = trimView(constraint);
  Op op = Op::Eq;
  std::string error;
  if (!takeOperator(spec, op, error)) {
    result.error = fmt::format("invalid constraint '{}': {}", constraint, error);
    return result;
  }
  spec = trimView(spec);
  const std::string_view CURR = trimView(actual);

  if (spec.empty() || CURR.empty()) {
    result.error = fmt::format("cannot compare '{}' against '{}'", constraint, actual);
    return result;
  }

  std::vector<std::string> specParts = split(spec, '.');
  std::vector<std::string> currParts = split(CURR, '.');
  const std::size_t LEN = std::max(specParts.size(), currParts.size());
  specParts.resize(LEN, "0");
  currParts.resize(LEN, "0");

  int cmp = 0;
  for (std::size_t i = 0; i < LEN; ++i) {
    if (specParts[i] == "*") {
      break;
    }
    long long s = 0;
    long long c = 0;
    if (!parseUnsigned(specParts[i], s)) {
      result.error = fmt::format("invalid constraint component '{}' in '{}'", specParts[i], spec);
      return result;
    }
    if (!parseUnsigned(currParts[i], c)) {
      result.error = fmt::format("invalid version component '{}' in '{}'", currParts[i], CURR);
      return result;
    }
    if (c != s) {
      cmp = c > s ? 1 : -1;
      break;
    }
  }

  switch (op) {
  case Op::Eq:
    result.satisfied = cmp == 0;
    break;
  case Op::Ge:
    result.satisfied = cmp >= 0;
    break;
  case Op::Gt:
    result.satisfied = cmp > 0;
    break;
  }
  return result;
}

} // namespace version

} // namespace ibcheck
