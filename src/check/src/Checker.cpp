/**
 * @file Checker.cpp
 * @brief Check registry and the node-level items.
 */

#include "src/check/inc/Checker.hpp"
#include "src/collect/inc/SoftwareInfo.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/version/inc/VersionConstraint.hpp"

#include <algorithm>
#include <set>

#include <fmt/core.h>

namespace ibcheck {

namespace check {

using helpers::strings::join;

/* ----------------------------- Names ----------------------------- */

const char* toString(Level level) noexcept {
  switch (level) {
  case Level::Info:
    return "info";
  case Level::Warning:
    return "warning";
  case Level::Critical:
    return "critical";
  }
  return "unknown";
}

const char* toString(Status status) noexcept {
  switch (status) {
  case Status::Normal:
    return "normal";
  case Status::Abnormal:
    return "abnormal";
  }
  return "unknown";
}

/* ----------------------------- Registry ----------------------------- */

const std::vector<CheckItem>& checkItems() {
  static const std::vector<CheckItem> ITEMS = {
      {CHECK_IB_OFED, Level::Warning, "OFED version is within specification",
       "Upgrade or reinstall OFED to match the specification", &checkOfed},
      {CHECK_IB_NUM, Level::Critical, "All expected IB NICs are detected",
       "Check PCIe status or IB NIC connectivity", &checkIbNum},
      {CHECK_IB_FW, Level::Warning, "Firmware version is consistent with spec",
       "Update firmware to match the version in the specification", &checkFirmware},
      {CHECK_IB_STATE, Level::Critical, "All IB ports are in ACTIVE state",
       "Check OpenSM and the IB connection", &checkPortState},
      {CHECK_IB_PHY_STATE, Level::Critical, "All IB ports have LinkUp physical state",
       "Verify IB cable and link status", &checkPhyState},
      {CHECK_NET_OPERSTATE, Level::Critical, "Network operstate is up",
       "Check the network interface and driver", &checkNetOperstate},
      {CHECK_IB_PORT_SPEED, Level::Critical, "All IB ports run at the expected speed",
       "Ensure IB speed settings are correct in firmware", &checkPortSpeed},
      {CHECK_IB_KMOD, Level::Critical, "All IB kernel modules are loaded",
       "Install or reload the missing kernel modules", &checkKernelModules},
      {CHECK_IB_DEVS, Level::Warning, "IB device names are consistent",
       "Verify udev or naming rules", &checkIbDevs},
      {CHECK_PCIE_ACS, Level::Critical, "PCIe ACS is disabled on all functions",
       "Disable ACS in BIOS, or run: for i in $(lspci | cut -f 1 -d ' '); do setpci -s $i "
       "ecap_acs+6.w=0; done",
       &checkPcieAcs},
      {CHECK_PCIE_MRR, Level::Info, "PCIe MRR is set correctly (4096)",
       "Set MaxReadReq to 4096 with setpci", &checkPcieMrr},
      {CHECK_PCIE_SPEED, Level::Critical, "PCIe speed matches device spec",
       "Ensure PCIe slot and firmware support the expected speed", &checkPcieSpeed},
      {CHECK_PCIE_WIDTH, Level::Critical, "PCIe width matches device spec",
       "Verify PCIe lane configuration in BIOS", &checkPcieWidth},
      {CHECK_PCIE_TREE_SPEED, Level::Critical, "PCIe path to root complex supports full speed",
       "Check upstream PCIe device speed and configuration", &checkPcieTreeSpeed},
      {CHECK_PCIE_TREE_WIDTH, Level::Critical, "PCIe path to root complex supports full width",
       "Check PCIe switch and topology configuration", &checkPcieTreeWidth},
      {CHECK_ROCE_GATEWAY, Level::Critical, "RoCE gateways are reachable",
       "Check routing rules and the gateway of the RoCE interfaces", &checkRoceGateway},
  };
  return ITEMS;
}

const CheckItem* findItem(std::string_view name) noexcept {
  for (const CheckItem& item : checkItems()) {
    if (name == item.name) {
      return &item;
    }
  }
  return nullptr;
}

CheckResult baseResult(std::string_view name) {
  CheckResult result;
  result.name = std::string(name);
  const CheckItem* item = findItem(name);
  if (item != nullptr) {
    result.level = item->level;
    result.detail = item->detail;
  }
  return result;
}

CheckResult noIbFound(std::string_view name) {
  CheckResult result = baseResult(name);
  result.status = Status::Abnormal;
  result.detail = NO_IB_FOUND;
  return result;
}

std::vector<CheckResult> runChecks(const CheckContext& ctx,
                                   const std::vector<std::string>& ignored) {
  const std::set<std::string> SKIP(ignored.begin(), ignored.end());
  for (const std::string& name : SKIP) {
    if (findItem(name) == nullptr) {
      helpers::log::logger()->warn("ignored checker '{}' does not exist", name);
    }
  }

  std::vector<CheckResult> results;
  std::vector<std::string> used;
  for (const CheckItem& item : checkItems()) {
    if (SKIP.count(item.name) != 0) {
      continue;
    }
    CheckResult r = item.fn(ctx);
    if (!r.normal() && r.suggestion.empty() && r.detail != NO_IB_FOUND) {
      r.suggestion = item.suggestion;
    }
    if (!r.normal()) {
      helpers::log::logger()->warn("{} {}: {}", item.name, toString(r.status), r.detail);
    }
    results.push_back(std::move(r));
    used.emplace_back(item.name);
  }
  helpers::log::logger()->debug("ran checkers: {}", join(used, ","));
  return results;
}

bool allNormal(const std::vector<CheckResult>& results) noexcept {
  return std::all_of(results.begin(), results.end(),
                     [](const CheckResult& r) { return r.normal(); });
}

/* ----------------------------- Node items ----------------------------- */

CheckResult checkOfed(const CheckContext& ctx) {
  if (ctx.snapshot.empty()) {
    return noIbFound(CHECK_IB_OFED);
  }
  CheckResult result = baseResult(CHECK_IB_OFED);
  result.spec = ctx.spec.swDeps.ofedVer;
  result.curr = ctx.snapshot.software.ofedVer;
  if (result.spec.empty()) {
    result.detail = "no OFED version constraint in spec";
    return result;
  }

  const version::VersionCheck V = version::satisfies(result.spec, result.curr);
  if (!V.ok()) {
    result.status = Status::Abnormal;
    result.detail = fmt::format("OFED version cannot be evaluated: {}", V.error);
  } else if (!V.satisfied) {
    result.status = Status::Abnormal;
    result.detail =
        fmt::format("OFED version mismatch, expected: {}, current: {}", result.spec, result.curr);
  }
  return result;
}

CheckResult checkIbNum(const CheckContext& ctx) {
  if (ctx.snapshot.empty()) {
    return noIbFound(CHECK_IB_NUM);
  }
  CheckResult result = baseResult(CHECK_IB_NUM);
  const int FOUND = static_cast<int>(ctx.snapshot.adapters.size());
  result.spec = std::to_string(ctx.snapshot.pciAdapterCount);
  result.curr = std::to_string(FOUND);
  if (FOUND != ctx.snapshot.pciAdapterCount) {
    std::vector<std::string> devs;
    for (const auto& [ibDev, adapter] : ctx.snapshot.adapters) {
      devs.push_back(ibDev);
    }
    result.status = Status::Abnormal;
    result.device = join(devs, ",");
    result.detail = fmt::format("{} RDMA devices registered, {} RDMA-capable PCI functions found",
                                FOUND, ctx.snapshot.pciAdapterCount);
  }
  return result;
}

CheckResult checkKernelModules(const CheckContext& ctx) {
  if (ctx.snapshot.empty()) {
    return noIbFound(CHECK_IB_KMOD);
  }
  CheckResult result = baseResult(CHECK_IB_KMOD);
  const collect::SoftwareInfo& SW = ctx.snapshot.software;

  std::vector<std::string> required = ctx.spec.swDeps.kernelModules;
  if (required.empty()) {
    required = collect::requiredModules(SW.hasNvidiaGpu);
  } else if (SW.hasNvidiaGpu &&
             std::find(required.begin(), required.end(), collect::GPU_PEERMEM_MODULE) ==
                 required.end()) {
    required.emplace_back(collect::GPU_PEERMEM_MODULE);
  }

  std::vector<std::string> missing;
  for (const std::string& mod : required) {
    if (!SW.isLoaded(mod)) {
      missing.push_back(mod);
    }
  }

  result.spec = join(required, ",");
  result.curr = join(SW.loadedModules, ",");
  if (!missing.empty()) {
    result.status = Status::Abnormal;
    result.device = join(missing, ",");
    result.detail = fmt::format("need to load kmod: {}", join(missing, ","));
    result.suggestion = fmt::format("use modprobe to load: {}", join(missing, " "));
  }
  return result;
}

CheckResult checkIbDevs(const CheckContext& ctx) {
  if (ctx.snapshot.empty()) {
    return noIbFound(CHECK_IB_DEVS);
  }
  CheckResult result = baseResult(CHECK_IB_DEVS);

  std::vector<std::string> specPairs;
  std::vector<std::string> mismatches;
  for (const auto& [ibDev, netDev] : ctx.spec.ibDevs) {
    specPairs.push_back(netDev.empty() ? ibDev : ibDev + ":" + netDev);
    const auto IT = ctx.snapshot.ibDevs.find(ibDev);
    if (IT == ctx.snapshot.ibDevs.end()) {
      mismatches.push_back(fmt::format("{} (missing)", ibDev));
    } else if (!netDev.empty() && IT->second != netDev) {
      mismatches.push_back(fmt::format("{} -> {} (expected {})", ibDev, IT->second, netDev));
    }
  }

  std::vector<std::string> currPairs;
  for (const auto& [ibDev, netDev] : ctx.snapshot.ibDevs) {
    currPairs.push_back(ibDev + ":" + netDev);
  }

  result.spec = join(specPairs, ",");
  result.curr = join(currPairs, ",");
  if (!mismatches.empty()) {
    result.status = Status::Abnormal;
    result.device = join(mismatches, ",");
    result.detail = fmt::format("mismatched IB devices: {}", result.device);
  }
  return result;
}

CheckResult checkPcieAcs(const CheckContext& ctx) {
  if (ctx.snapshot.empty()) {
    return noIbFound(CHECK_PCIE_ACS);
  }
  CheckResult result = baseResult(CHECK_PCIE_ACS);
  result.spec = ctx.spec.pcieAcs;

  if (!ctx.snapshot.acsScanned) {
    result.curr = "not scanned";
    result.detail = "ACS scan disabled";
    return result;
  }

  const collect::AcsScan& ACS = ctx.snapshot.acs;
  if (!ACS.error.empty()) {
    result.status = Status::Abnormal;
    result.curr = "unknown";
    result.detail = fmt::format("ACS scan failed: {}", ACS.error);
    return result;
  }

  std::vector<std::string> devices;
  std::vector<std::string> values;
  for (const collect::AcsEntry& e : ACS.enabled) {
    if (e.control == ctx.spec.pcieAcs) {
      continue;
    }
    devices.push_back(e.bdf);
    values.push_back(e.bdf + ":" + e.control);
  }

  if (devices.empty()) {
    result.curr = "Disabled";
    result.detail = fmt::format("PCIe ACS is disabled on all {} readable functions", ACS.scanned);
    return result;
  }
  result.status = Status::Abnormal;
  result.curr = join(values, ",");
  result.device = join(devices, ",");
  result.detail = fmt::format("PCIe ACS enabled on {} of {} functions", devices.size(), ACS.scanned);
  return result;
}

CheckResult checkRoceGateway(const CheckContext& ctx) {
  if (ctx.snapshot.empty()) {
    return noIbFound(CHECK_ROCE_GATEWAY);
  }
  CheckResult result = baseResult(CHECK_ROCE_GATEWAY);

  std::vector<std::string> gateways;
  std::vector<std::string> failed;
  std::vector<std::string> reasons;
  std::size_t roce = 0;

  for (const auto& [ibDev, adapter] : ctx.snapshot.adapters) {
    const collect::AdapterHardware& HW = adapter.hardware;
    if (!HW.isEthernet()) {
      continue;
    }
    ++roce;
    const route::GatewayResult& GW = adapter.gateway;
    switch (GW.kind) {
    case route::GatewayKind::NoGateway:
    case route::GatewayKind::Ipv6Only:
      gateways.push_back(fmt::format("{}:{}", HW.netDev, route::toString(GW.kind)));
      break;
    case route::GatewayKind::Error:
      gateways.push_back(fmt::format("{}:error", HW.netDev));
      failed.push_back(ibDev);
      reasons.push_back(fmt::format("{}: {}", HW.netDev, GW.error));
      break;
    case route::GatewayKind::Resolved: {
      gateways.push_back(fmt::format("{}:{}", HW.netDev, GW.address));
      if (ctx.prober == nullptr) {
        break;
      }
      const cache::CacheEntry<bool> PROBE = ctx.prober->probe(HW.netDev, GW.address);
      if (!PROBE.value) {
        failed.push_back(ibDev);
        reasons.push_back(fmt::format("{}: {}", HW.netDev,
                                      PROBE.error.empty() ? "gateway unreachable" : PROBE.error));
      }
      break;
    }
    }
  }

  result.curr = join(gateways, ",");
  if (roce == 0) {
    result.detail = "no RoCE adapters";
    return result;
  }
  if (!failed.empty()) {
    result.status = Status::Abnormal;
    result.device = join(failed, ",");
    result.detail = fmt::format("RoCE gateway check failed: {}", join(reasons, "; "));
  }
  return result;
}

} // namespace check

} // namespace ibcheck
