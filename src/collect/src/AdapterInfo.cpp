/**
 * @file AdapterInfo.cpp
 * @brief Implementation of RDMA adapter identity and attribute reads.
 */

#include "src/collect/inc/AdapterInfo.hpp"
#include "src/collect/inc/PcieInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <set>

#include <fmt/core.h>

namespace ibcheck {

namespace collect {

using helpers::files::isDirectory;
using helpers::files::joinPath;
using helpers::files::listDir;
using helpers::files::pathExists;
using helpers::files::readAttr;
using helpers::files::readFileRaw;
using helpers::files::readFirstLine;
using helpers::strings::contains;
using helpers::strings::isSpace;
using helpers::strings::splitFields;
using helpers::strings::splitLines;
using helpers::strings::startsWith;
using helpers::strings::trim;

namespace {

/* ----------------------------- Helpers ----------------------------- */

inline std::string adapterDir(const SysPaths& paths, const std::string& ibDev) {
  return joinPath(paths.ibClass, ibDev);
}

/**
 * Keep the printable ASCII portion of a binary VPD blob.
 * Returns "" if no printable characters are present.
 */
std::string readVpdText(const std::string& path) noexcept {
  std::string raw;
  if (!readFileRaw(path, raw)) {
    return {};
  }
  std::string text;
  text.reserve(raw.size());
  for (const char C : raw) {
    if (C >= ' ' && C <= '~') {
      text.push_back(C);
    } else if (!text.empty() && !isSpace(text.back())) {
      text.push_back(' ');
    }
  }
  return trim(text);
}

/// Bond that lists @p slave in bonding/slaves, or "".
std::string findBondMaster(const SysPaths& paths, const std::string& slave) {
  for (const std::string& name : listDir(paths.netClass)) {
    if (!startsWith(name, "bond")) {
      continue;
    }
    const std::string SLAVES = readAttr(joinPath(paths.netClass, name + "/bonding/slaves"));
    for (const std::string& s : splitFields(SLAVES)) {
      if (s == slave) {
        return name;
      }
    }
  }
  return {};
}

} // namespace

/* ----------------------------- AdapterHardware ----------------------------- */

std::string AdapterHardware::toString() const {
  std::string out = fmt::format("{}: board={} fw={} netdev={} link={} state={} phy={} rate={}",
                                ibDev, boardId.empty() ? "?" : boardId, fwVer, netDev,
                                linkLayer, portState, phyState, portSpeed);
  if (!pcieBdf.empty()) {
    out += fmt::format(" pcie={} x{} {}", pcieBdf, pcieWidth, pcieSpeed);
  }
  if (!pcieMrr.empty()) {
    out += fmt::format(" mrr={}", pcieMrr);
  }
  if (!numaNode.empty()) {
    out += fmt::format(" numa={}", numaNode);
  }
  if (!pfGateway.empty()) {
    out += fmt::format(" gw={}", pfGateway);
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

std::vector<std::string> listAdapters(const SysPaths& paths) { return listDir(paths.ibClass); }

bool isVirtualFunction(const SysPaths& paths, const std::string& ibDev) noexcept {
  return pathExists(joinPath(adapterDir(paths, ibDev), "device/physfn"));
}

std::vector<std::string> listPhysicalAdapters(const SysPaths& paths) {
  std::vector<std::string> out;
  for (const std::string& dev : listAdapters(paths)) {
    if (contains(dev, "bond")) {
      continue;
    }
    if (isVirtualFunction(paths, dev)) {
      continue;
    }
    out.push_back(dev);
  }
  return out;
}

std::vector<std::string> readBoardIds(const SysPaths& paths) {
  std::set<std::string> ids;
  for (const std::string& dev : listPhysicalAdapters(paths)) {
    const std::string ID = readAdapterAttr(paths, dev, "board_id");
    if (ID.empty()) {
      helpers::log::logger()->warn("board_id unreadable for {}, skipping", dev);
      continue;
    }
    ids.insert(ID);
  }
  return {ids.begin(), ids.end()};
}

std::string readAdapterAttr(const SysPaths& paths, const std::string& ibDev,
                            const std::string& relPath) noexcept {
  return readFirstLine(joinPath(adapterDir(paths, ibDev), relPath));
}

std::string readPortAttr(const SysPaths& paths, const std::string& ibDev, const std::string& name,
                         int port) noexcept {
  return readAdapterAttr(paths, ibDev, fmt::format("ports/{}/{}", port, name));
}

std::string readPciBdf(const SysPaths& paths, const std::string& ibDev) noexcept {
  std::string raw;
  if (!readFileRaw(joinPath(adapterDir(paths, ibDev), "device/uevent"), raw)) {
    return {};
  }
  for (const std::string& line : splitLines(raw)) {
    if (startsWith(line, "PCI_SLOT_NAME=")) {
      return trim(std::string_view(line).substr(14));
    }
  }
  return {};
}

std::string physicalNetDev(const SysPaths& paths, const std::string& ibDev) {
  const std::vector<std::string> NETS = listDir(joinPath(adapterDir(paths, ibDev), "device/net"));
  if (NETS.empty()) {
    return {};
  }
  return NETS.front();
}

std::string resolveNetDev(const SysPaths& paths, const std::string& ibDev) {
  const std::string PHYS = physicalNetDev(paths, ibDev);
  if (PHYS.empty()) {
    helpers::log::logger()->debug("no network interface bound to {}", ibDev);
    return {};
  }
  const std::string BOND = findBondMaster(paths, PHYS);
  return BOND.empty() ? PHYS : BOND;
}

std::string readOperstate(const SysPaths& paths, const std::string& netDev) noexcept {
  if (netDev.empty()) {
    return {};
  }
  return readFirstLine(joinPath(paths.netClass, netDev + "/operstate"));
}

AdapterIdentity readIdentity(const SysPaths& paths, const std::string& ibDev) {
  AdapterIdentity id;
  id.ibDev = ibDev;
  id.boardId = readAdapterAttr(paths, ibDev, "board_id");
  id.bdf = readPciBdf(paths, ibDev);
  id.netDev = resolveNetDev(paths, ibDev);
  return id;
}

AdapterHardware collectHardware(const SysPaths& paths, const std::string& ibDev) {
  AdapterHardware hw;
  const AdapterIdentity ID = readIdentity(paths, ibDev);
  hw.ibDev = ID.ibDev;
  hw.boardId = ID.boardId;
  hw.netDev = ID.netDev;
  hw.pcieBdf = ID.bdf;

  hw.hcaType = readAdapterAttr(paths, ibDev, "hca_type");
  hw.fwVer = readAdapterAttr(paths, ibDev, "fw_ver");
  hw.deviceId = readAdapterAttr(paths, ibDev, "device/device");
  hw.systemGuid = readAdapterAttr(paths, ibDev, "sys_image_guid");
  hw.nodeGuid = readAdapterAttr(paths, ibDev, "node_guid");
  hw.vfSpec = readAdapterAttr(paths, ibDev, "device/sriov_totalvfs");
  hw.vpd = readVpdText(joinPath(adapterDir(paths, ibDev), "device/vpd"));

  hw.phyState = readPortAttr(paths, ibDev, "phys_state");
  hw.portState = readPortAttr(paths, ibDev, "state");
  hw.portSpeed = readPortAttr(paths, ibDev, "rate");
  hw.linkLayer = readPortAttr(paths, ibDev, "link_layer");

  // operstate follows the physical interface; a bond master hides slave state.
  const std::string PHYS = physicalNetDev(paths, ibDev);
  if (!PHYS.empty()) {
    hw.netOperstate =
        readFirstLine(joinPath(adapterDir(paths, ibDev), "device/net/" + PHYS + "/operstate"));
  }

  if (!hw.pcieBdf.empty()) {
    const PcieLink LINK = readPcieLink(paths, hw.pcieBdf);
    hw.pcieSpeed = LINK.speed;
    hw.pcieWidth = LINK.width;
    hw.pcieTreeSpeedMin = pcieTreeMin(paths, hw.pcieBdf, "current_link_speed");
    hw.pcieTreeWidthMin = pcieTreeMin(paths, hw.pcieBdf, "current_link_width");
    hw.numaNode = readFirstLine(joinPath(paths.pciDevices, hw.pcieBdf + "/numa_node"));
    hw.cpuList = readFirstLine(joinPath(paths.pciDevices, hw.pcieBdf + "/local_cpulist"));
  } else {
    helpers::log::logger()->warn("PCI address unknown for {}", ibDev);
  }

  return hw;
}

int countPciAdapters(const SysPaths& paths) {
  int count = 0;
  for (const std::string& bdf : listDir(paths.pciDevices)) {
    const std::string DEV_DIR = joinPath(paths.pciDevices, bdf);
    if (readFirstLine(joinPath(DEV_DIR, "vendor")) != MELLANOX_VENDOR_ID) {
      continue;
    }
    // Management Ethernet functions have no RDMA device.
    if (!isDirectory(joinPath(DEV_DIR, "infiniband"))) {
      continue;
    }
    if (pathExists(joinPath(DEV_DIR, "physfn"))) {
      continue;
    }
    ++count;
  }
  return count;
}

} // namespace collect

} // namespace ibcheck
