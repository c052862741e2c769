#ifndef IBCHECK_CHECK_CHECKER_HPP
#define IBCHECK_CHECK_CHECKER_HPP
/**
 * @file Checker.hpp
 * @brief Per-item health checks comparing an InfinibandSnapshot to a ClusterSpec.
 *
 * Every item produces exactly one CheckResult. Per-adapter items compare each
 * adapter against the spec of its board ID and list the failing ibDevs in
 * CheckResult::device. Items whose expected value is empty in the spec are
 * not evaluated for that adapter.
 *
 * An empty snapshot makes every item abnormal with detail NO_IB_FOUND.
 */

#include "src/inventory/inc/SnapshotCollector.hpp"
#include "src/route/inc/ConnectivityProber.hpp"
#include "src/spec/inc/SpecTypes.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ibcheck {
namespace check {

/* ----------------------------- Item names ----------------------------- */

inline constexpr const char* NO_IB_FOUND = "no_ib_found";

inline constexpr const char* CHECK_IB_OFED = "check_ib_ofed";
inline constexpr const char* CHECK_IB_NUM = "check_ib_num";
inline constexpr const char* CHECK_IB_FW = "check_ib_fw";
inline constexpr const char* CHECK_IB_STATE = "check_ib_state";
inline constexpr const char* CHECK_IB_PHY_STATE = "check_ib_phy_state";
inline constexpr const char* CHECK_NET_OPERSTATE = "check_net_operstate";
inline constexpr const char* CHECK_IB_PORT_SPEED = "check_ib_port_speed";
inline constexpr const char* CHECK_IB_KMOD = "check_ib_kmod";
inline constexpr const char* CHECK_IB_DEVS = "check_ib_devs";
inline constexpr const char* CHECK_PCIE_ACS = "check_pcie_acs";
inline constexpr const char* CHECK_PCIE_MRR = "check_pcie_mrr";
inline constexpr const char* CHECK_PCIE_SPEED = "check_pcie_speed";
inline constexpr const char* CHECK_PCIE_WIDTH = "check_pcie_width";
inline constexpr const char* CHECK_PCIE_TREE_SPEED = "check_pcie_tree_speed";
inline constexpr const char* CHECK_PCIE_TREE_WIDTH = "check_pcie_tree_width";
inline constexpr const char* CHECK_ROCE_GATEWAY = "check_roce_gateway";

/// Expected values used when the spec leaves them empty.
inline constexpr const char* DEFAULT_NET_OPERSTATE = "up";
inline constexpr const char* DEFAULT_PCIE_MRR = "4096";

/* ----------------------------- Types ----------------------------- */

enum class Level : std::uint8_t { Info = 0, Warning, Critical };

enum class Status : std::uint8_t { Normal = 0, Abnormal };

/// "info", "warning", "critical".
[[nodiscard]] const char* toString(Level level) noexcept;

/// "normal", "abnormal".
[[nodiscard]] const char* toString(Status status) noexcept;

/**
 * @brief Outcome of one check item.
 */
struct CheckResult {
  std::string name{};
  Level level{Level::Info};
  Status status{Status::Normal};
  std::string spec{};       ///< Expected values, comma-joined
  std::string curr{};       ///< Observed values, comma-joined
  std::string device{};     ///< Failing devices, comma-joined
  std::string detail{};
  std::string suggestion{};

  [[nodiscard]] bool normal() const noexcept { return status == Status::Normal; }
};

/**
 * @brief Inputs shared by all checks.
 *
 * @p prober may be null; gateway reachability is then not probed and only
 * resolution errors are reported.
 */
struct CheckContext {
  const inventory::InfinibandSnapshot& snapshot;
  const spec::ClusterSpec& spec;
  route::ConnectivityProber* prober{nullptr};
};

/// Signature of a check item.
using CheckFn = CheckResult (*)(const CheckContext&);

/**
 * @brief Static description of a check item.
 */
struct CheckItem {
  const char* name;
  Level level;
  const char* detail;     ///< Detail reported when the item passes
  const char* suggestion; ///< Suggestion reported when it fails
  CheckFn fn;
};

/* ----------------------------- Items ----------------------------- */

[[nodiscard]] CheckResult checkOfed(const CheckContext& ctx);
[[nodiscard]] CheckResult checkIbNum(const CheckContext& ctx);
[[nodiscard]] CheckResult checkFirmware(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPortState(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPhyState(const CheckContext& ctx);
[[nodiscard]] CheckResult checkNetOperstate(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPortSpeed(const CheckContext& ctx);
[[nodiscard]] CheckResult checkKernelModules(const CheckContext& ctx);
[[nodiscard]] CheckResult checkIbDevs(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPcieAcs(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPcieMrr(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPcieSpeed(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPcieWidth(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPcieTreeSpeed(const CheckContext& ctx);
[[nodiscard]] CheckResult checkPcieTreeWidth(const CheckContext& ctx);
[[nodiscard]] CheckResult checkRoceGateway(const CheckContext& ctx);

/* ----------------------------- Registry ----------------------------- */

/// All check items in report order.
[[nodiscard]] const std::vector<CheckItem>& checkItems();

/// Item named @p name, or nullptr.
[[nodiscard]] const CheckItem* findItem(std::string_view name) noexcept;

/**
 * @brief Result of item @p name pre-filled with its level and passing detail.
 */
[[nodiscard]] CheckResult baseResult(std::string_view name);

/// Abnormal result of item @p name for a node without adapters.
[[nodiscard]] CheckResult noIbFound(std::string_view name);

/**
 * @brief Run every item not named in @p ignored.
 *
 * Unknown names in @p ignored are logged and otherwise have no effect.
 */
[[nodiscard]] std::vector<CheckResult> runChecks(const CheckContext& ctx,
                                                 const std::vector<std::string>& ignored = {});

/// True if every result is normal.
[[nodiscard]] bool allNormal(const std::vector<CheckResult>& results) noexcept;

} // namespace check
} // namespace ibcheck

#endif // IBCHECK_CHECK_CHECKER_HPP
