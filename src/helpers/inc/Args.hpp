#ifndef IBCHECK_HELPERS_ARGS_HPP
#define IBCHECK_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the ibcheck tools.
 *
 * Flags are declared in an ArgMap keyed by a small enum. A flag takes zero or
 * one value, given either as the next token ("--spec a.yaml") or inline
 * ("--spec=a.yaml"). Unknown "--" tokens are rejected so typos do not
 * silently fall back to defaults.
 *
 * @note Cold-path: Allocates.
 */

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace ibcheck {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--spec"
  bool takesValue{false};  ///< True if the flag consumes one value
  std::string_view desc{}; ///< Help text
  std::string_view meta{}; ///< Value placeholder for help, e.g. "<path>"
};

/// Map from key to flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Parsed flags: key -> value ("" for switches).
using ParsedArgs = std::unordered_map<std::uint8_t, std::string>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments (argv[1..]) against @p map.
 * @param args Tokens after the program name.
 * @param map Accepted flags.
 * @param out Parsed values; later occurrences overwrite earlier ones.
 * @param error Set to a readable message on failure.
 * @return false on an unknown flag or a missing value.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& out, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view tok = args[i];
    std::string_view inlineValue;
    bool hasInline = false;

    const std::size_t EQ = tok.find('=');
    if (tok.substr(0, 2) == "--" && EQ != std::string_view::npos) {
      inlineValue = tok.substr(EQ + 1);
      tok = tok.substr(0, EQ);
      hasInline = true;
    }

    const auto IT = lut.find(tok);
    if (IT == lut.end()) {
      error = fmt::format("Unknown argument '{}'", args[i]);
      return false;
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;

    if (!DEF.takesValue) {
      if (hasInline) {
        error = fmt::format("Flag '{}' does not take a value", DEF.flag);
        return false;
      }
      out[KEY].clear();
      continue;
    }

    if (hasInline) {
      out[KEY] = std::string(inlineValue);
      continue;
    }
    if (i + 1 >= args.size()) {
      error = fmt::format("Flag '{}' expects a value", DEF.flag);
      return false;
    }
    out[KEY] = std::string(args[++i]);
  }
  return true;
}

/// True if @p key was given on the command line.
[[nodiscard]] inline bool has(const ParsedArgs& parsed, std::uint8_t key) noexcept {
  return parsed.find(key) != parsed.end();
}

/**
 * @brief Print usage text generated from @p map, sorted by flag.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::size_t width = 16;
  for (const ArgDef* def : defs) {
    const std::size_t W = def->flag.size() + (def->takesValue ? 1 + def->meta.size() : 0);
    width = std::max(width, W);
  }

  for (const ArgDef* def : defs) {
    std::string left(def->flag);
    if (def->takesValue) {
      left.push_back(' ');
      left.append(def->meta.empty() ? std::string_view("<value>") : def->meta);
    }
    fmt::print("  {:<{}}  {}\n", left, width, def->desc);
  }
}

} // namespace args
} // namespace helpers
} // namespace ibcheck

#endif // IBCHECK_HELPERS_ARGS_HPP
