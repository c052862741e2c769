#ifndef IBCHECK_COLLECT_SOFTWARE_INFO_HPP
#define IBCHECK_COLLECT_SOFTWARE_INFO_HPP
/**
 * @file SoftwareInfo.hpp
 * @brief RDMA software stack: OFED version, kernel modules, NIC role and SR-IOV VF count.
 * @note Linux-only. Reads /proc/modules, /sys/module/mlx5_core/version and
 *       /proc/driver/nvidia/gpus; runs ofed_info, rdma and ip.
 */

#include "src/collect/inc/ProcessRunner.hpp"
#include "src/collect/inc/SysPaths.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace ibcheck {
namespace collect {

/* ----------------------------- Constants ----------------------------- */

/// Reported when no OFED or rdma-core version can be determined.
inline constexpr const char* OFED_UNKNOWN = "Unknown";

/// Prefix for versions derived from the in-tree mlx5_core module.
inline constexpr const char* RDMA_CORE_PREFIX = "rdma_core:";

/// Module required in addition to the base set when NVIDIA GPUs are present.
inline constexpr const char* GPU_PEERMEM_MODULE = "nvidia_peermem";

/* ----------------------------- NicRole ----------------------------- */

/**
 * @brief RDMA network namespace mode reported by `rdma system`.
 *
 * "exclusive" netns mode means the node hands VFs to containers (SR-IOV);
 * "shared" means containers share the PF through macvlan.
 */
enum class NicRole {
  Unknown = 0, ///< Output named neither mode
  Sriov,       ///< netns exclusive
  Macvlan,     ///< netns shared
  Error,       ///< `rdma system` failed
};

/// Report name: "sriovNode", "macvlanNode", "ErrNode" or "" for Unknown.
[[nodiscard]] const char* toString(NicRole role) noexcept;

/* ----------------------------- SoftwareInfo ----------------------------- */

/**
 * @brief Node-wide software state, collected once per snapshot.
 */
struct SoftwareInfo {
  std::string ofedVer;                    ///< e.g. "MLNX_OFED_LINUX-23.10-1.1.9.0"
  std::vector<std::string> loadedModules; ///< Module names from /proc/modules
  bool hasNvidiaGpu{false};               ///< At least one NVIDIA GPU entry exists
  NicRole nicRole{NicRole::Unknown};      ///< From `rdma system`

  /// True if @p name is in loadedModules.
  [[nodiscard]] bool isLoaded(std::string_view name) const noexcept;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief First field of every /proc/modules line, in file order.
 */
[[nodiscard]] std::vector<std::string> parseProcModules(std::string_view text);

/**
 * @brief Version from `ofed_info -s` output (text before the first ':').
 * @return "" if the output holds no version.
 */
[[nodiscard]] std::string parseOfedInfo(std::string_view output);

/**
 * @brief NIC role from `rdma system` output.
 *
 * "share" wins over "exclusive" when both appear.
 */
[[nodiscard]] NicRole parseNicRole(std::string_view output) noexcept;

/**
 * @brief Number of active VFs in `ip link show dev <if>` output.
 *
 * Counts lines that mention "vf" and do not carry the all-zero MAC.
 */
[[nodiscard]] int countVfs(std::string_view ipLinkOutput);

/* ----------------------------- Collection ----------------------------- */

/**
 * @brief Kernel modules every RDMA node must have loaded.
 * @param hasNvidiaGpu Adds GPU_PEERMEM_MODULE when true.
 */
[[nodiscard]] std::vector<std::string> requiredModules(bool hasNvidiaGpu);

/// Names from /proc/modules; empty on read failure.
[[nodiscard]] std::vector<std::string> loadedModules(const SysPaths& paths);

/// True if the NVIDIA driver lists at least one GPU.
[[nodiscard]] bool hasNvidiaGpu(const SysPaths& paths);

/**
 * @brief Installed OFED version.
 *
 * Tries `ofed_info -s`, then RDMA_CORE_PREFIX plus the mlx5_core module
 * version, then OFED_UNKNOWN.
 */
[[nodiscard]] std::string readOfedVersion(const SysPaths& paths, ProcessRunner& runner,
                                          std::chrono::milliseconds timeout);

/**
 * @brief Run `rdma system` and classify its netns mode.
 * @return NicRole::Error if the command fails or exits non-zero.
 */
[[nodiscard]] NicRole readNicRole(ProcessRunner& runner,
                                  std::chrono::milliseconds timeout = DEFAULT_COMMAND_TIMEOUT);

/**
 * @brief Active VF count of @p netDev as text.
 *
 * Secondary PCI functions (BDF ending in ".1") share the VFs of function 0
 * and report "0" without running ip.
 *
 * @return Count as text, or "" if ip failed.
 */
[[nodiscard]] std::string readVfCount(ProcessRunner& runner, const std::string& netDev,
                                      const std::string& bdf, std::chrono::milliseconds timeout);

/**
 * @brief Collect OFED version, loaded modules, GPU presence and NIC role.
 */
[[nodiscard]] SoftwareInfo collectSoftware(const SysPaths& paths, ProcessRunner& runner,
                                           std::chrono::milliseconds timeout);

} // namespace collect
} // namespace ibcheck

#endif // IBCHECK_COLLECT_SOFTWARE_INFO_HPP
