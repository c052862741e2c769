#ifndef IBCHECK_INVENTORY_SNAPSHOT_COLLECTOR_HPP
#define IBCHECK_INVENTORY_SNAPSHOT_COLLECTOR_HPP
/**
 * @file SnapshotCollector.hpp
 * @brief Point-in-time inventory of every physical RDMA adapter on the node.
 *
 * One worker thread per physical adapter collects its sysfs attributes,
 * counters, gateway, Max Read Request and VF count. The node-wide software
 * state, the PCI adapter count and the ACS scan are collected once on the
 * calling thread while the workers run. Workers are joined before collect()
 * returns or propagates an exception.
 *
 * @note Linux-only.
 * @note NOT RT-safe: Spawns threads, runs external tools.
 */

#include "src/collect/inc/AdapterInfo.hpp"
#include "src/collect/inc/CounterCollector.hpp"
#include "src/collect/inc/PcieInfo.hpp"
#include "src/collect/inc/ProcessRunner.hpp"
#include "src/collect/inc/SoftwareInfo.hpp"
#include "src/collect/inc/SysPaths.hpp"
#include "src/route/inc/GatewayResolver.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace ibcheck {
namespace inventory {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Everything collected for one adapter.
 */
struct AdapterSnapshot {
  collect::AdapterHardware hardware{};
  collect::CounterSnapshot counters{};
  route::GatewayResult gateway{}; ///< Tagged result; hardware.pfGateway holds its field value
};

/**
 * @brief Node inventory consumed by the checkers.
 */
struct InfinibandSnapshot {
  std::map<std::string, AdapterSnapshot> adapters{}; ///< Keyed by ibDev
  std::map<std::string, std::string> ibDevs{};       ///< ibDev -> netDev
  collect::SoftwareInfo software{};
  int pciAdapterCount{0}; ///< RDMA-capable Mellanox functions on the PCI bus
  collect::AcsScan acs{};
  bool acsScanned{false};

  /// True if no physical adapter was found.
  [[nodiscard]] bool empty() const noexcept { return adapters.empty(); }
};

/**
 * @brief Collection switches.
 */
struct CollectorOptions {
  bool autoFixMrr{true};      ///< Rewrite MRR to 4096 when it differs
  bool scanAcs{true};         ///< Run the setpci ACS scan
  bool collectCounters{true}; ///< Read port counter families
  std::chrono::milliseconds commandTimeout{collect::DEFAULT_COMMAND_TIMEOUT};
};

/* ----------------------------- SnapshotCollector ----------------------------- */

/**
 * @brief Builds an InfinibandSnapshot.
 *
 * The resolver is shared with other callers; its cache outlives a single
 * snapshot.
 */
class SnapshotCollector {
public:
  SnapshotCollector(collect::SysPaths paths, collect::ProcessRunner& runner,
                    route::GatewayResolver& resolver, CollectorOptions options = {});

  /**
   * @brief Collect the full inventory.
   *
   * A node without adapters yields an empty snapshot, not an error.
   */
  [[nodiscard]] InfinibandSnapshot collect();

  /// Collect one adapter on the calling thread.
  [[nodiscard]] AdapterSnapshot collectAdapter(const std::string& ibDev);

  [[nodiscard]] const CollectorOptions& options() const noexcept { return options_; }

private:
  collect::SysPaths paths_;
  collect::ProcessRunner& runner_;
  route::GatewayResolver& resolver_;
  CollectorOptions options_;
  collect::CounterCollector counters_;
  collect::PcieInspector pcie_;
};

} // namespace inventory
} // namespace ibcheck

#endif // IBCHECK_INVENTORY_SNAPSHOT_COLLECTOR_HPP
