#ifndef IBCHECK_VERSION_VERSION_CONSTRAINT_HPP
#define IBCHECK_VERSION_VERSION_CONSTRAINT_HPP
/**
 * @file VersionConstraint.hpp
 * @brief Version constraints for OFED stacks and adapter firmware.
 *
 * Two grammars are supported:
 *
 *  - Structured stack versions: `[op]<prefix>-<a.b>-<c.d.e.f>`, e.g.
 *    ">=MLNX_OFED_LINUX-23.10-1.1.9.0". The major group has exactly two
 *    components and the minor group exactly four. Each component is a
 *    non-negative integer or "*".
 *  - Dotted versions: `[op]<n.n...>`, e.g. ">=28.39.2048", compared with
 *    zero padding; "*" matches every remaining component.
 *
 * Operators are "==", ">=" and ">"; no operator means "==". Any other
 * operator ("=", "<", "!=") is a format error. For stack versions the
 * operator is applied to the major and minor groups separately and both must
 * pass, so ">" needs each group to be strictly greater.
 *
 * Malformed input is reported through VersionCheck::error, never as a plain
 * "not satisfied", so a broken spec is distinguishable from a mismatch.
 *
 * @note Thread-safe: All functions are pure.
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace ibcheck {
namespace version {

/* ----------------------------- Constants ----------------------------- */

/// Components in the major group ("23.10").
inline constexpr std::size_t MAJOR_COMPONENTS = 2;

/// Components in the minor group ("1.1.9.0").
inline constexpr std::size_t MINOR_COMPONENTS = 4;

/// Sentinel stored for a "*" component.
inline constexpr std::int64_t WILDCARD = -1;

/* ----------------------------- Types ----------------------------- */

/// Comparison operator of a constraint.
enum class Op : std::uint8_t { Eq, Ge, Gt };

/// Printable operator ("==", ">=", ">").
[[nodiscard]] const char* toString(Op op) noexcept;

/// Parsed structured stack version.
struct StackVersion {
  std::string prefix; ///< e.g. "MLNX_OFED_LINUX" (not compared)
  std::array<std::int64_t, MAJOR_COMPONENTS> major{};
  std::array<std::int64_t, MINOR_COMPONENTS> minor{};
};

/// Parsed constraint: operator plus structured version.
struct VersionConstraint {
  Op op{Op::Eq};
  StackVersion version{};
};

/**
 * @brief Outcome of a constraint evaluation.
 *
 * ok() is false when either side failed to parse; satisfied is then false
 * and must not be read as a mismatch.
 */
struct VersionCheck {
  bool satisfied{false};
  std::string error{};

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse a structured stack version (no operator allowed).
 * @param text Version string, e.g. "MLNX_OFED_LINUX-5.9-0.5.6.0".
 * @param out Parsed result.
 * @param error Set on failure.
 * @param allowWildcard Accept "*" components (constraints only).
 * @return true on success.
 */
[[nodiscard]] bool parseVersion(std::string_view text, StackVersion& out, std::string& error,
                                bool allowWildcard = false);

/**
 * @brief Parse a constraint with optional leading operator.
 * @return true on success; @p error describes the failure otherwise.
 */
[[nodiscard]] bool parseConstraint(std::string_view text, VersionConstraint& out,
                                   std::string& error);

/* ----------------------------- Evaluation ----------------------------- */

/**
 * @brief Evaluate a parsed constraint against a parsed version.
 *
 * Major and minor groups are compared independently with the operator and
 * both must hold. Within a group, comparison is lexicographic and stops at
 * the first differing pair of concrete components; wildcard positions are
 * treated as equal.
 */
[[nodiscard]] bool evaluate(const VersionConstraint& constraint,
                            const StackVersion& actual) noexcept;

/**
 * @brief Parse both strings and evaluate.
 *
 * satisfies("==MLNX_OFED_LINUX-5.9-0.5.6.0", "MLNX_OFED_LINUX-5.9-0.5.6.0")
 * yields {true, ""}; an actual version with an extra component yields
 * {false, "<format error>"}.
 */
[[nodiscard]] VersionCheck satisfies(std::string_view constraint, std::string_view actual);

/**
 * @brief Dotted version comparison used for firmware ("28.39.2048").
 *
 * Both sides are split on '.', the shorter is padded with zeros, and the
 * constraint may end early with "*". Non-numeric components are a format
 * error.
 */
[[nodiscard]] VersionCheck compareDotted(std::string_view constraint, std::string_view actual);

} // namespace version
} // namespace ibcheck

#endif // IBCHECK_VERSION_VERSION_CONSTRAINT_HPP
