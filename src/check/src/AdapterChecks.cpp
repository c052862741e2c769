/**
 * @file AdapterChecks.cpp
 * @brief Per-adapter items: firmware, port state, link and PCIe parameters.
 */

#include "src/check/inc/Checker.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/version/inc/VersionConstraint.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace ibcheck {

namespace check {

using helpers::strings::join;
using version::VersionCheck;

namespace {

/* ----------------------------- Comparisons ----------------------------- */

using CompareFn = VersionCheck (*)(std::string_view expected, std::string_view actual);

VersionCheck exactMatch(std::string_view expected, std::string_view actual) {
  return {expected == actual, {}};
}

VersionCheck containsMatch(std::string_view expected, std::string_view actual) {
  return {helpers::strings::contains(actual, expected), {}};
}

bool toNumber(std::string_view text, double& out) {
  const std::string S(helpers::strings::trimView(text));
  if (S.empty()) {
    return false;
  }
  char* end = nullptr;
  out = std::strtod(S.c_str(), &end);
  return end != S.c_str();
}

/// Numeric "at least": the tree minimum must not fall below the spec.
VersionCheck atLeast(std::string_view expected, std::string_view actual) {
  double want = 0.0;
  double have = 0.0;
  if (!toNumber(expected, want)) {
    return {false, fmt::format("expected value '{}' is not numeric", expected)};
  }
  if (!toNumber(actual, have)) {
    return {false, fmt::format("observed value '{}' is not numeric", actual)};
  }
  return {have >= want, {}};
}

/* ----------------------------- Field rule ----------------------------- */

/**
 * @brief How one hardware field is compared.
 */
struct FieldRule {
  const char* item;                                  ///< Check item name
  const char* label;                                 ///< Field name used in details
  std::string spec::HardwareSpec::*field;            ///< Expected and observed field
  const char* fallback;                              ///< Expected value if spec is empty, or nullptr
  bool skipUnknown;                                  ///< Skip adapters with no observed value
  CompareFn compare;
};

CheckResult compareField(const CheckContext& ctx, const FieldRule& rule) {
  if (ctx.snapshot.empty()) {
    return noIbFound(rule.item);
  }
  CheckResult result = baseResult(rule.item);

  std::vector<std::string> specs;
  std::vector<std::string> currs;
  std::vector<std::string> failed;
  std::vector<std::string> reasons;

  for (const auto& [ibDev, adapter] : ctx.snapshot.adapters) {
    const collect::AdapterHardware& HW = adapter.hardware;
    const auto SPEC_IT = ctx.spec.hcaSpecs.find(HW.boardId);
    if (SPEC_IT == ctx.spec.hcaSpecs.end()) {
      helpers::log::logger()->warn("board {} of {} has no spec, skipping {}", HW.boardId, ibDev,
                                   rule.item);
      continue;
    }

    std::string expected = SPEC_IT->second.hardware.*(rule.field);
    if (expected.empty() && rule.fallback != nullptr) {
      expected = rule.fallback;
    }
    const std::string& ACTUAL = HW.*(rule.field);
    if (expected.empty() || (rule.skipUnknown && ACTUAL.empty())) {
      continue;
    }

    specs.push_back(expected);
    currs.push_back(ACTUAL);
    const VersionCheck V = rule.compare(expected, ACTUAL);
    if (!V.ok()) {
      failed.push_back(ibDev);
      reasons.push_back(fmt::format("{}: {}", ibDev, V.error));
    } else if (!V.satisfied) {
      failed.push_back(ibDev);
      reasons.push_back(fmt::format("{} expect {}, but get {}", ibDev, expected,
                                    ACTUAL.empty() ? "<none>" : ACTUAL));
    }
  }

  result.spec = join(specs, ",");
  result.curr = join(currs, ",");
  if (!failed.empty()) {
    result.status = Status::Abnormal;
    result.device = join(failed, ",");
    result.detail = fmt::format("{} check fail: {}", rule.label, join(reasons, "; "));
  }
  return result;
}

} // namespace

/* ----------------------------- Items ----------------------------- */

CheckResult checkFirmware(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_IB_FW, "FW", &spec::HardwareSpec::fwVer, nullptr, false,
                            &version::compareDotted});
}

CheckResult checkPortState(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_IB_STATE, "PortState", &spec::HardwareSpec::portState, nullptr,
                            false, &containsMatch});
}

CheckResult checkPhyState(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_IB_PHY_STATE, "PhyState", &spec::HardwareSpec::phyState,
                            nullptr, false, &containsMatch});
}

CheckResult checkNetOperstate(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_NET_OPERSTATE, "NetOperstate",
                            &spec::HardwareSpec::netOperstate, DEFAULT_NET_OPERSTATE, false,
                            &exactMatch});
}

CheckResult checkPortSpeed(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_IB_PORT_SPEED, "PortSpeed", &spec::HardwareSpec::portSpeed,
                            nullptr, false, &exactMatch});
}

CheckResult checkPcieMrr(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_PCIE_MRR, "PCIEMRR", &spec::HardwareSpec::pcieMrr,
                            DEFAULT_PCIE_MRR, false, &exactMatch});
}

CheckResult checkPcieSpeed(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_PCIE_SPEED, "PCIESpeed", &spec::HardwareSpec::pcieSpeed,
                            nullptr, false, &exactMatch});
}

CheckResult checkPcieWidth(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_PCIE_WIDTH, "PCIEWidth", &spec::HardwareSpec::pcieWidth,
                            nullptr, false, &exactMatch});
}

CheckResult checkPcieTreeSpeed(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_PCIE_TREE_SPEED, "PCIETreeSpeed",
                            &spec::HardwareSpec::pcieTreeSpeedMin, nullptr, true, &atLeast});
}

CheckResult checkPcieTreeWidth(const CheckContext& ctx) {
  return compareField(ctx, {CHECK_PCIE_TREE_WIDTH, "PCIETreeWidth",
                            &spec::HardwareSpec::pcieTreeWidthMin, nullptr, true, &atLeast});
}

} // namespace check

} // namespace ibcheck
