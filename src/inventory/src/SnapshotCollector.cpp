/**
 * @file SnapshotCollector.cpp
 * @brief Per-adapter fan-out over the raw collectors and the gateway resolver.
 */

#include "src/inventory/inc/SnapshotCollector.hpp"
#include "src/helpers/inc/Log.hpp"

#include <mutex>
#include <thread>
#include <utility>

namespace ibcheck {

namespace inventory {

namespace {

/// Joins every joinable worker on scope exit, including during unwinding.
class WorkerJoiner {
public:
  explicit WorkerJoiner(std::vector<std::thread>& workers) noexcept : workers_(workers) {}
  ~WorkerJoiner() { joinAll(); }

  WorkerJoiner(const WorkerJoiner&) = delete;
  WorkerJoiner& operator=(const WorkerJoiner&) = delete;

  void joinAll() {
    for (std::thread& t : workers_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

private:
  std::vector<std::thread>& workers_;
};

} // namespace

/* ----------------------------- SnapshotCollector ----------------------------- */

SnapshotCollector::SnapshotCollector(collect::SysPaths paths, collect::ProcessRunner& runner,
                                     route::GatewayResolver& resolver, CollectorOptions options)
    : paths_(std::move(paths)), runner_(runner), resolver_(resolver), options_(options),
      counters_(paths_), pcie_(paths_, runner_, options_.commandTimeout) {}

AdapterSnapshot SnapshotCollector::collectAdapter(const std::string& ibDev) {
  AdapterSnapshot out;
  out.hardware = collect::collectHardware(paths_, ibDev);
  collect::AdapterHardware& hw = out.hardware;

  if (options_.collectCounters) {
    out.counters = counters_.collect(ibDev);
  }

  out.gateway = resolver_.resolve(ibDev, hw.netDev);
  hw.pfGateway = out.gateway.fieldValue();

  if (!hw.pcieBdf.empty()) {
    hw.pcieMrr = pcie_.collectMaxReadRequest(hw.pcieBdf, options_.autoFixMrr);
  }
  hw.vfNum = collect::readVfCount(runner_, hw.netDev, hw.pcieBdf, options_.commandTimeout);

  helpers::log::logger()->debug("collected {}", hw.toString());
  return out;
}

InfinibandSnapshot SnapshotCollector::collect() {
  InfinibandSnapshot snap;

  const std::vector<std::string> DEVICES = collect::listPhysicalAdapters(paths_);
  if (DEVICES.empty()) {
    helpers::log::logger()->warn("no physical RDMA adapters under {}", paths_.ibClass);
  }

  std::mutex mergeMutex;
  std::vector<std::thread> workers;
  workers.reserve(DEVICES.size());
  WorkerJoiner joiner(workers);
  for (const std::string& dev : DEVICES) {
    workers.emplace_back([this, &snap, &mergeMutex, &dev]() {
      AdapterSnapshot adapter = collectAdapter(dev);
      std::lock_guard<std::mutex> lock(mergeMutex);
      snap.ibDevs[dev] = adapter.hardware.netDev;
      snap.adapters.emplace(dev, std::move(adapter));
    });
  }

  // Node-wide state, gathered while the adapter workers run.
  collect::SoftwareInfo software = collect::collectSoftware(paths_, runner_, options_.commandTimeout);
  const int PCI_COUNT = collect::countPciAdapters(paths_);
  collect::AcsScan acs;
  if (options_.scanAcs) {
    acs = pcie_.scanAcs();
  }

  joiner.joinAll();

  for (auto& [dev, adapter] : snap.adapters) {
    adapter.hardware.ofedVer = software.ofedVer;
  }
  snap.software = std::move(software);
  snap.pciAdapterCount = PCI_COUNT;
  snap.acs = std::move(acs);
  snap.acsScanned = options_.scanAcs;

  helpers::log::logger()->info("snapshot: {} adapter(s), {} on PCI bus, OFED {}, role {}",
                               snap.adapters.size(), snap.pciAdapterCount, snap.software.ofedVer,
                               collect::toString(snap.software.nicRole));
  return snap;
}

} // namespace inventory

} // namespace ibcheck
