#ifndef IBCHECK_COLLECT_UTST_FAKE_SYSFS_HPP
#define IBCHECK_COLLECT_UTST_FAKE_SYSFS_HPP
/**
 * @file FakeSysfs.hpp
 * @brief Test doubles for collectors: a sysfs tree under a temp directory and
 *        a ProcessRunner with canned output.
 */

#include "src/collect/inc/ProcessRunner.hpp"
#include "src/collect/inc/SysPaths.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ibcheck {
namespace collect {
namespace test {

/* ----------------------------- FakeSysfs ----------------------------- */

/**
 * @brief Temporary root holding /sys and /proc lookalikes. Removed on destruction.
 */
class FakeSysfs {
public:
  FakeSysfs() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "ibcheck-XXXXXX").string();
    const char* dir = ::mkdtemp(tmpl.data());
    EXPECT_NE(dir, nullptr);
    root_ = tmpl;
    paths_ = SysPaths::underRoot(root_);
    std::filesystem::create_directories(paths_.ibClass);
    std::filesystem::create_directories(paths_.pciDevices);
    std::filesystem::create_directories(paths_.netClass);
  }

  ~FakeSysfs() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  FakeSysfs(const FakeSysfs&) = delete;
  FakeSysfs& operator=(const FakeSysfs&) = delete;

  [[nodiscard]] const SysPaths& paths() const noexcept { return paths_; }
  [[nodiscard]] const std::string& root() const noexcept { return root_; }

  /// Write @p content to an absolute path, creating parents.
  void write(const std::string& path, const std::string& content) const {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
  }

  void mkdir(const std::string& path) const { std::filesystem::create_directories(path); }

  void symlink(const std::string& target, const std::string& link) const {
    std::filesystem::create_directories(std::filesystem::path(link).parent_path());
    std::filesystem::create_directory_symlink(target, link);
  }

  /**
   * @brief Create a PCI function below a chain of bridges.
   *
   * The real function directory lives at
   * <root>/sys/devices/pci0000:00/<bridge0>/.../<bdf> and is linked from
   * pciDevices/<bdf>. Bridges get directories (without the pciDevices link,
   * see addBridge for that).
   *
   * @return Absolute path of the function directory.
   */
  std::string addPciFunction(const std::string& bdf, const std::vector<std::string>& bridges) const {
    std::string dir = root_ + "/sys/devices/pci0000:00";
    for (const std::string& b : bridges) {
      dir += "/" + b;
    }
    dir += "/" + bdf;
    mkdir(dir);
    symlink(dir, paths_.pciDevices + "/" + bdf);
    return dir;
  }

  /// Bridge with link attributes, reachable through pciDevices/<bdf>.
  void addBridge(const std::string& bdf, const std::vector<std::string>& upstream,
                 const std::string& speed, const std::string& width) const {
    const std::string DIR = addPciFunction(bdf, upstream);
    write(DIR + "/current_link_speed", speed + "\n");
    write(DIR + "/current_link_width", width + "\n");
  }

  /**
   * @brief Physical adapter with the common attributes populated.
   * @return Absolute path of its PCI function directory.
   */
  std::string addAdapter(const std::string& ibDev, const std::string& boardId,
                         const std::string& bdf, const std::string& netDev,
                         const std::vector<std::string>& bridges = {},
                         const std::string& linkLayer = "InfiniBand") const {
    const std::string PCI = addPciFunction(bdf, bridges);
    write(PCI + "/vendor", "0x15b3\n");
    write(PCI + "/device", "0x1021\n");
    write(PCI + "/uevent", "DRIVER=mlx5_core\nPCI_CLASS=20000\nPCI_SLOT_NAME=" + bdf + "\n");
    write(PCI + "/current_link_speed", "32.0 GT/s PCIe\n");
    write(PCI + "/current_link_width", "16\n");
    write(PCI + "/numa_node", "0\n");
    write(PCI + "/local_cpulist", "0-31\n");
    write(PCI + "/sriov_totalvfs", "16\n");
    mkdir(PCI + "/infiniband/" + ibDev);
    if (!netDev.empty()) {
      write(PCI + "/net/" + netDev + "/operstate", "up\n");
      write(paths_.netClass + "/" + netDev + "/operstate", "up\n");
    }

    const std::string IB = paths_.ibClass + "/" + ibDev;
    mkdir(IB);
    symlink(PCI, IB + "/device");
    write(IB + "/board_id", boardId + "\n");
    write(IB + "/fw_ver", "28.39.2048\n");
    write(IB + "/hca_type", "MT4129\n");
    write(IB + "/node_guid", "a088:c203:0001:0001\n");
    write(IB + "/sys_image_guid", "a088:c203:0001:0001\n");
    write(IB + "/ports/1/state", "4: ACTIVE\n");
    write(IB + "/ports/1/phys_state", "5: LinkUp\n");
    write(IB + "/ports/1/rate", "400 Gb/sec (4X NDR)\n");
    write(IB + "/ports/1/link_layer", linkLayer + "\n");
    return PCI;
  }

  /// Virtual function adapter (device/physfn present).
  void addVirtualFunction(const std::string& ibDev, const std::string& bdf,
                          const std::string& parentBdf) const {
    const std::string PCI = addPciFunction(bdf, {});
    write(PCI + "/vendor", "0x15b3\n");
    mkdir(PCI + "/infiniband/" + ibDev);
    symlink(paths_.pciDevices + "/" + parentBdf, PCI + "/physfn");
    const std::string IB = paths_.ibClass + "/" + ibDev;
    mkdir(IB);
    symlink(PCI, IB + "/device");
    write(IB + "/board_id", "MT_VF\n");
  }

private:
  std::string root_;
  SysPaths paths_;
};

/* ----------------------------- FakeProcessRunner ----------------------------- */

/**
 * @brief ProcessRunner returning canned results keyed by the joined argv.
 *
 * Responses registered for the same command are returned in order; the last
 * one repeats. Unknown commands fail with exit code 127, like a missing binary.
 */
class FakeProcessRunner final : public ProcessRunner {
public:
  using ProcessRunner::run;

  /// Queue a response to @p cmdline (argv joined by single spaces).
  void on(const std::string& cmdline, std::string output, int exitCode = 0) {
    CommandResult r;
    r.exitCode = exitCode;
    r.output = std::move(output);
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[cmdline].push_back(std::move(r));
  }

  CommandResult run(const std::vector<std::string>& argv,
                    std::chrono::milliseconds /*timeout*/) override {
    const std::string KEY = helpers::strings::join(argv, " ");
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(KEY);
    const auto IT = responses_.find(KEY);
    if (IT == responses_.end() || IT->second.empty()) {
      CommandResult r;
      r.exitCode = 127;
      r.error = argv.empty() ? "empty argv" : argv.front() + ": not found";
      return r;
    }
    std::deque<CommandResult>& queue = IT->second;
    CommandResult r = queue.front();
    if (queue.size() > 1) {
      queue.pop_front();
    }
    return r;
  }

  [[nodiscard]] std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  [[nodiscard]] std::size_t callCount(const std::string& cmdline) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const std::string& c : calls_) {
      n += c == cmdline ? 1 : 0;
    }
    return n;
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::deque<CommandResult>> responses_;
  std::vector<std::string> calls_;
};

} // namespace test
} // namespace collect
} // namespace ibcheck

#endif // IBCHECK_COLLECT_UTST_FAKE_SYSFS_HPP
