/**
 * @file SoftwareInfo.cpp
 * @brief Implementation of OFED, kernel module, NIC role and VF collection.
 */

#include "src/collect/inc/SoftwareInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace ibcheck {

namespace collect {

using helpers::files::listDir;
using helpers::files::readFirstLine;
using helpers::files::readTextFile;
using helpers::strings::contains;
using helpers::strings::endsWith;
using helpers::strings::splitFields;
using helpers::strings::splitLines;
using helpers::strings::trim;

namespace {

/// Base set of RDMA modules, in the order they are reported.
constexpr const char* BASE_MODULES[] = {"rdma_ucm", "rdma_cm",   "ib_ipoib", "mlx5_core",
                                        "mlx5_ib",  "ib_uverbs", "ib_umad",  "ib_cm",
                                        "ib_core",  "mlxfw"};

constexpr std::string_view ZERO_MAC = "00:00:00:00:00:00";

} // namespace

/* ----------------------------- NicRole ----------------------------- */

const char* toString(NicRole role) noexcept {
  switch (role) {
  case NicRole::Sriov:
    return "sriovNode";
  case NicRole::Macvlan:
    return "macvlanNode";
  case NicRole::Error:
    return "ErrNode";
  case NicRole::Unknown:
    break;
  }
  return "";
}

/* ----------------------------- SoftwareInfo ----------------------------- */

bool SoftwareInfo::isLoaded(std::string_view name) const noexcept {
  return std::find(loadedModules.begin(), loadedModules.end(), name) != loadedModules.end();
}

/* ----------------------------- Parsing ----------------------------- */

std::vector<std::string> parseProcModules(std::string_view text) {
  std::vector<std::string> out;
  for (const std::string& line : splitLines(text)) {
    std::vector<std::string> fields = splitFields(line);
    if (!fields.empty()) {
      out.push_back(std::move(fields.front()));
    }
  }
  return out;
}

std::string parseOfedInfo(std::string_view output) {
  const std::string T = trim(output);
  const std::size_t COLON = T.find(':');
  if (COLON == std::string::npos) {
    return T;
  }
  return trim(std::string_view(T).substr(0, COLON));
}

NicRole parseNicRole(std::string_view output) noexcept {
  if (contains(output, "share")) {
    return NicRole::Macvlan;
  }
  if (contains(output, "exclusive")) {
    return NicRole::Sriov;
  }
  return NicRole::Unknown;
}

int countVfs(std::string_view ipLinkOutput) {
  int count = 0;
  for (const std::string& line : splitLines(ipLinkOutput)) {
    if (contains(line, "vf") && !contains(line, ZERO_MAC)) {
      ++count;
    }
  }
  return count;
}

/* ----------------------------- Collection ----------------------------- */

std::vector<std::string> requiredModules(bool hasNvidiaGpu) {
  std::vector<std::string> out(std::begin(BASE_MODULES), std::end(BASE_MODULES));
  if (hasNvidiaGpu) {
    out.emplace_back(GPU_PEERMEM_MODULE);
  }
  return out;
}

std::vector<std::string> loadedModules(const SysPaths& paths) {
  std::string text;
  if (!readTextFile(paths.procModules, text)) {
    helpers::log::logger()->warn("cannot read {}", paths.procModules);
    return {};
  }
  return parseProcModules(text);
}

bool hasNvidiaGpu(const SysPaths& paths) { return !listDir(paths.nvidiaGpus).empty(); }

std::string readOfedVersion(const SysPaths& paths, ProcessRunner& runner,
                            std::chrono::milliseconds timeout) {
  const CommandResult R = runner.run({"ofed_info", "-s"}, timeout);
  if (R.ok()) {
    const std::string VER = parseOfedInfo(R.output);
    if (!VER.empty()) {
      return VER;
    }
  } else {
    helpers::log::logger()->debug("ofed_info -s unavailable: {}",
                                  R.error.empty() ? std::to_string(R.exitCode) : R.error);
  }

  const std::string MLX5 = readFirstLine(paths.mlx5Version);
  if (!MLX5.empty()) {
    return std::string(RDMA_CORE_PREFIX) + MLX5;
  }

  helpers::log::logger()->warn("OFED version could not be determined");
  return OFED_UNKNOWN;
}

NicRole readNicRole(ProcessRunner& runner, std::chrono::milliseconds timeout) {
  const CommandResult R = runner.run({"rdma", "system"}, timeout);
  if (!R.ok()) {
    helpers::log::logger()->warn("rdma system failed: {}",
                                 R.error.empty() ? std::to_string(R.exitCode) : R.error);
    return NicRole::Error;
  }
  const NicRole ROLE = parseNicRole(R.output);
  if (ROLE == NicRole::Unknown) {
    helpers::log::logger()->debug("rdma system reported no netns mode");
  }
  return ROLE;
}

std::string readVfCount(ProcessRunner& runner, const std::string& netDev, const std::string& bdf,
                        std::chrono::milliseconds timeout) {
  if (endsWith(bdf, ".1")) {
    return "0";
  }
  if (netDev.empty()) {
    return {};
  }
  const CommandResult R = runner.run({"ip", "link", "show", "dev", netDev}, timeout);
  if (!R.ok()) {
    helpers::log::logger()->warn("ip link show dev {} failed: {}", netDev,
                                 R.error.empty() ? std::to_string(R.exitCode) : R.error);
    return {};
  }
  return std::to_string(countVfs(R.output));
}

SoftwareInfo collectSoftware(const SysPaths& paths, ProcessRunner& runner,
                             std::chrono::milliseconds timeout) {
  SoftwareInfo info;
  info.ofedVer = readOfedVersion(paths, runner, timeout);
  info.loadedModules = loadedModules(paths);
  info.hasNvidiaGpu = hasNvidiaGpu(paths);
  info.nicRole = readNicRole(runner, timeout);
  return info;
}

} // namespace collect

} // namespace ibcheck
