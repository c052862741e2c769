#ifndef IBCHECK_COLLECT_SYS_PATHS_HPP
#define IBCHECK_COLLECT_SYS_PATHS_HPP
/**
 * @file SysPaths.hpp
 * @brief Locations of the sysfs/procfs trees read by the collectors.
 *
 * Every collector takes a SysPaths instead of hard-coding /sys and /proc, so
 * a fake tree under a temp directory can stand in for real hardware.
 */

#include <string>

namespace ibcheck {
namespace collect {

/* ----------------------------- SysPaths ----------------------------- */

struct SysPaths {
  std::string ibClass{"/sys/class/infiniband"};            ///< RDMA device class
  std::string pciDevices{"/sys/bus/pci/devices"};          ///< PCI device links
  std::string netClass{"/sys/class/net"};                  ///< Network interfaces
  std::string procModules{"/proc/modules"};                ///< Loaded kernel modules
  std::string mlx5Version{"/sys/module/mlx5_core/version"}; ///< mlx5_core module version
  std::string nvidiaGpus{"/proc/driver/nvidia/gpus"};      ///< NVIDIA GPU entries

  /// Same layout rebased under @p root (e.g. "/tmp/fake" + "/sys/...").
  [[nodiscard]] static SysPaths underRoot(const std::string& root) {
    SysPaths p;
    p.ibClass = root + p.ibClass;
    p.pciDevices = root + p.pciDevices;
    p.netClass = root + p.netClass;
    p.procModules = root + p.procModules;
    p.mlx5Version = root + p.mlx5Version;
    p.nvidiaGpus = root + p.nvidiaGpus;
    return p;
  }
};

} // namespace collect
} // namespace ibcheck

#endif // IBCHECK_COLLECT_SYS_PATHS_HPP
