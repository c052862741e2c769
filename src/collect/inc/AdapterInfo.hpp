#ifndef IBCHECK_COLLECT_ADAPTER_INFO_HPP
#define IBCHECK_COLLECT_ADAPTER_INFO_HPP
/**
 * @file AdapterInfo.hpp
 * @brief RDMA adapter identity and hardware attributes from sysfs.
 * @note Linux-only. Reads /sys/class/infiniband/, /sys/bus/pci/devices/ and
 *       /sys/class/net/ (all relocatable through SysPaths).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include "src/collect/inc/SysPaths.hpp"

#include <string>
#include <vector>

namespace ibcheck {
namespace collect {

/* ----------------------------- Constants ----------------------------- */

/// PCI vendor ID of Mellanox/NVIDIA networking adapters.
inline constexpr const char* MELLANOX_VENDOR_ID = "0x15b3";

/// Port whose attributes are collected.
inline constexpr int DEFAULT_PORT = 1;

/// Link layer values reported in ports/<n>/link_layer.
inline constexpr const char* LINK_LAYER_IB = "InfiniBand";
inline constexpr const char* LINK_LAYER_ETH = "Ethernet";

/* ----------------------------- AdapterIdentity ----------------------------- */

/**
 * @brief Join key between the resolved spec and live state.
 */
struct AdapterIdentity {
  std::string boardId; ///< Vendor board ID (PSID), e.g. "MT_0000000838"
  std::string bdf;     ///< PCI address, e.g. "0000:1a:00.0"
  std::string ibDev;   ///< RDMA device, e.g. "mlx5_0"
  std::string netDev;  ///< Bound network interface (bond master if enslaved)
};

/* ----------------------------- AdapterHardware ----------------------------- */

/**
 * @brief Collected hardware state of one adapter.
 *
 * Every field is the trimmed sysfs/tool text; an empty string means the
 * value could not be read.
 */
struct AdapterHardware {
  std::string ibDev;
  std::string netDev;
  std::string hcaType;
  std::string systemGuid;
  std::string nodeGuid;
  std::string pfGateway;    ///< Filled by the gateway resolver
  std::string vfSpec;       ///< sriov_totalvfs
  std::string vfNum;        ///< Active VFs from `ip link`
  std::string phyState;     ///< e.g. "5: LinkUp"
  std::string portState;    ///< e.g. "4: ACTIVE"
  std::string linkLayer;    ///< "InfiniBand" or "Ethernet"
  std::string netOperstate; ///< operstate of the bound interface
  std::string portSpeed;    ///< e.g. "400 Gb/sec (4X NDR)"
  std::string boardId;
  std::string deviceId;
  std::string pcieBdf;
  std::string pcieSpeed;
  std::string pcieWidth;
  std::string pcieTreeSpeedMin;
  std::string pcieTreeWidthMin;
  std::string pcieMrr;
  std::string numaNode;
  std::string cpuList;
  std::string fwVer;
  std::string vpd;
  std::string ofedVer;

  /// True if the adapter runs the Ethernet (RoCE) link layer.
  [[nodiscard]] bool isEthernet() const noexcept { return linkLayer == LINK_LAYER_ETH; }

  /// @brief Human-readable one-line summary.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief All entries of the RDMA device class directory, sorted.
 * @note NOT RT-safe: Directory enumeration.
 */
[[nodiscard]] std::vector<std::string> listAdapters(const SysPaths& paths);

/**
 * @brief True if @p ibDev is an SR-IOV virtual function (has device/physfn).
 */
[[nodiscard]] bool isVirtualFunction(const SysPaths& paths, const std::string& ibDev) noexcept;

/**
 * @brief Physical adapters: excludes virtual functions and bonding devices
 *        (any name containing "bond").
 */
[[nodiscard]] std::vector<std::string> listPhysicalAdapters(const SysPaths& paths);

/**
 * @brief Board IDs of all physical adapters, deduplicated and sorted.
 *
 * Adapters whose board_id cannot be read are skipped.
 */
[[nodiscard]] std::vector<std::string> readBoardIds(const SysPaths& paths);

/**
 * @brief Read an adapter attribute ("<ibClass>/<ibDev>/<relPath>").
 * @return Trimmed contents, or "" if unreadable.
 */
[[nodiscard]] std::string readAdapterAttr(const SysPaths& paths, const std::string& ibDev,
                                          const std::string& relPath) noexcept;

/**
 * @brief Read a port attribute ("ports/<port>/<name>").
 */
[[nodiscard]] std::string readPortAttr(const SysPaths& paths, const std::string& ibDev,
                                       const std::string& name, int port = DEFAULT_PORT) noexcept;

/**
 * @brief PCI address from PCI_SLOT_NAME in device/uevent.
 * @return "" if not found.
 */
[[nodiscard]] std::string readPciBdf(const SysPaths& paths, const std::string& ibDev) noexcept;

/**
 * @brief Network interface bound to @p ibDev.
 *
 * Takes the first entry of device/net. If that interface is a slave of a
 * bond (listed in <netClass>/bond*\/bonding/slaves) the bond name is
 * returned instead.
 */
[[nodiscard]] std::string resolveNetDev(const SysPaths& paths, const std::string& ibDev);

/**
 * @brief Physical interface under device/net without bond resolution.
 */
[[nodiscard]] std::string physicalNetDev(const SysPaths& paths, const std::string& ibDev);

/**
 * @brief operstate of a network interface ("up", "down", ...).
 */
[[nodiscard]] std::string readOperstate(const SysPaths& paths, const std::string& netDev) noexcept;

/**
 * @brief Identity (board ID, BDF, names) of one adapter.
 */
[[nodiscard]] AdapterIdentity readIdentity(const SysPaths& paths, const std::string& ibDev);

/**
 * @brief Collect all sysfs-backed fields of AdapterHardware.
 *
 * boardId, pcieBdf and netDev come from readIdentity().
 * Leaves pfGateway, vfNum, pcieMrr and ofedVer empty: those need external
 * tools or the gateway resolver and are filled by the snapshot collector.
 */
[[nodiscard]] AdapterHardware collectHardware(const SysPaths& paths, const std::string& ibDev);

/**
 * @brief Count RDMA-capable Mellanox PCI functions.
 *
 * A function counts when its vendor is MELLANOX_VENDOR_ID, it has an
 * infiniband/ child directory, and it is not a virtual function. Used to
 * cross-check that every adapter on the bus registered an RDMA device.
 */
[[nodiscard]] int countPciAdapters(const SysPaths& paths);

} // namespace collect
} // namespace ibcheck

#endif // IBCHECK_COLLECT_ADAPTER_INFO_HPP
