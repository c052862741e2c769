#ifndef IBCHECK_CHECK_REPORT_HPP
#define IBCHECK_CHECK_REPORT_HPP
/**
 * @file Report.hpp
 * @brief Human and JSON renderings of check results.
 */

#include "src/check/inc/Checker.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ibcheck {
namespace check {

/**
 * @brief Run metadata printed with the results.
 */
struct ReportHeader {
  std::string node{};
  std::string cluster{};
  std::string clusterSource{}; ///< "local", "remote" or "default"
  std::size_t adapters{0};
  std::string nicRole{}; ///< "sriovNode", "macvlanNode", "ErrNode" or ""
};

/**
 * @brief Per-level and overall counts.
 */
struct ReportSummary {
  std::size_t normal{0};
  std::size_t abnormal{0};
  std::size_t critical{0}; ///< Abnormal results at Level::Critical
  std::size_t warning{0};  ///< Abnormal results at Level::Warning
  std::size_t info{0};     ///< Abnormal results at Level::Info

  /// "pass" when nothing is abnormal, else the highest abnormal level.
  [[nodiscard]] const char* overall() const noexcept;
};

[[nodiscard]] ReportSummary summarize(const std::vector<CheckResult>& results) noexcept;

/**
 * @brief Table with one line per item; @p verbose adds spec/curr, detail and
 *        suggestion lines. @p color enables ANSI colors.
 */
[[nodiscard]] std::string formatHuman(const ReportHeader& header,
                                      const std::vector<CheckResult>& results, bool verbose,
                                      bool color);

/// JSON object {"node", "cluster", "clusterSource", "adapters", "nicRole", "checks": [...],
/// "summary"}.
[[nodiscard]] std::string toJson(const ReportHeader& header,
                                 const std::vector<CheckResult>& results);

} // namespace check
} // namespace ibcheck

#endif // IBCHECK_CHECK_REPORT_HPP
