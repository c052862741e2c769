/**
 * @file SoftwareInfo_uTest.cpp
 * @brief Unit tests for ibcheck::collect OFED, kernel module and VF collection.
 */

#include "src/collect/inc/SoftwareInfo.hpp"
#include "src/collect/utst/FakeSysfs.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>

using ibcheck::collect::collectSoftware;
using ibcheck::collect::countVfs;
using ibcheck::collect::hasNvidiaGpu;
using ibcheck::collect::loadedModules;
using ibcheck::collect::NicRole;
using ibcheck::collect::parseNicRole;
using ibcheck::collect::parseOfedInfo;
using ibcheck::collect::parseProcModules;
using ibcheck::collect::readNicRole;
using ibcheck::collect::readOfedVersion;
using ibcheck::collect::readVfCount;
using ibcheck::collect::requiredModules;
using ibcheck::collect::SoftwareInfo;
using ibcheck::collect::test::FakeProcessRunner;
using ibcheck::collect::test::FakeSysfs;

namespace {

using namespace std::chrono_literals;

const std::string PROC_MODULES =
    "mlx5_ib 466944 0 - Live 0x0000000000000000\n"
    "ib_uverbs 184320 2 rdma_ucm,mlx5_ib, Live 0x0000000000000000\n"
    "mlx5_core 2134016 1 mlx5_ib, Live 0x0000000000000000\n"
    "nvidia_peermem 16384 0 - Live 0x0000000000000000 (POE)\n";

const std::string IP_LINK = "5: eth2: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500\n"
                            "    link/ether b8:3f:d2:00:00:01 brd ff:ff:ff:ff:ff:ff\n"
                            "    vf 0     link/ether 02:00:00:00:00:01 brd ff:ff:ff:ff:ff:ff\n"
                            "    vf 1     link/ether 02:00:00:00:00:02 brd ff:ff:ff:ff:ff:ff\n"
                            "    vf 2     link/ether 00:00:00:00:00:00 brd ff:ff:ff:ff:ff:ff\n";

const std::string RDMA_EXCLUSIVE = "netns exclusive copy-on-fork on\n";
const std::string RDMA_SHARED = "netns shared copy-on-fork on\n";

} // namespace

/* ----------------------------- Parsing ----------------------------- */

/** @test Module names are the first field of each line. */
TEST(SoftwareParseTest, ProcModules) {
  const auto MODS = parseProcModules(PROC_MODULES);
  EXPECT_EQ(MODS, (std::vector<std::string>{"mlx5_ib", "ib_uverbs", "mlx5_core", "nvidia_peermem"}));
  EXPECT_TRUE(parseProcModules("").empty());
}

/** @test ofed_info -s output is cut at the first colon. */
TEST(SoftwareParseTest, OfedInfo) {
  EXPECT_EQ(parseOfedInfo("MLNX_OFED_LINUX-23.10-1.1.9.0:\n"), "MLNX_OFED_LINUX-23.10-1.1.9.0");
  EXPECT_EQ(parseOfedInfo("OFED-internal-24.04-0.6.6:"), "OFED-internal-24.04-0.6.6");
  EXPECT_EQ(parseOfedInfo("  \n"), "");
}

/** @test netns mode maps to the NIC role; "share" is checked last and wins. */
TEST(SoftwareParseTest, NicRole) {
  EXPECT_EQ(parseNicRole(RDMA_EXCLUSIVE), NicRole::Sriov);
  EXPECT_EQ(parseNicRole(RDMA_SHARED), NicRole::Macvlan);
  EXPECT_EQ(parseNicRole("netns exclusive\nnetns shared\n"), NicRole::Macvlan);
  EXPECT_EQ(parseNicRole("copy-on-fork on\n"), NicRole::Unknown);
  EXPECT_STREQ(toString(NicRole::Sriov), "sriovNode");
  EXPECT_STREQ(toString(NicRole::Macvlan), "macvlanNode");
  EXPECT_STREQ(toString(NicRole::Error), "ErrNode");
  EXPECT_STREQ(toString(NicRole::Unknown), "");
}

/** @test VF lines with a zero MAC are not active. */
TEST(SoftwareParseTest, CountVfs) {
  EXPECT_EQ(countVfs(IP_LINK), 2);
  EXPECT_EQ(countVfs(""), 0);
}

/** @test Required modules grow by one when a GPU is present. */
TEST(SoftwareParseTest, RequiredModules) {
  const auto BASE = requiredModules(false);
  const auto GPU = requiredModules(true);
  EXPECT_EQ(BASE.size(), 10U);
  EXPECT_EQ(GPU.size(), 11U);
  EXPECT_EQ(GPU.back(), "nvidia_peermem");
  EXPECT_NE(std::find(BASE.begin(), BASE.end(), "mlx5_core"), BASE.end());
  EXPECT_EQ(std::find(BASE.begin(), BASE.end(), "nvidia_peermem"), BASE.end());
}

/* ----------------------------- Collection ----------------------------- */

class SoftwareInfoTest : public ::testing::Test {
protected:
  FakeSysfs fs_{};
  FakeProcessRunner runner_{};
};

/** @test ofed_info takes precedence. */
TEST_F(SoftwareInfoTest, OfedFromOfedInfo) {
  runner_.on("ofed_info -s", "MLNX_OFED_LINUX-23.10-1.1.9.0:\n");
  fs_.write(fs_.paths().mlx5Version, "24.04-0.6.6\n");
  EXPECT_EQ(readOfedVersion(fs_.paths(), runner_, 1s), "MLNX_OFED_LINUX-23.10-1.1.9.0");
}

/** @test Without ofed_info the mlx5_core module version is used. */
TEST_F(SoftwareInfoTest, OfedFromModuleVersion) {
  fs_.write(fs_.paths().mlx5Version, "24.04-0.6.6\n");
  EXPECT_EQ(readOfedVersion(fs_.paths(), runner_, 1s), "rdma_core:24.04-0.6.6");
}

/** @test Nothing available reports Unknown. */
TEST_F(SoftwareInfoTest, OfedUnknown) {
  EXPECT_EQ(readOfedVersion(fs_.paths(), runner_, 1s), "Unknown");
}

/** @test rdma system in exclusive mode marks an SR-IOV node. */
TEST_F(SoftwareInfoTest, NicRoleSriov) {
  runner_.on("rdma system", RDMA_EXCLUSIVE);
  EXPECT_EQ(readNicRole(runner_, 1s), NicRole::Sriov);
  EXPECT_EQ(runner_.callCount("rdma system"), 1U);
}

/** @test rdma system in shared mode marks a macvlan node. */
TEST_F(SoftwareInfoTest, NicRoleMacvlan) {
  runner_.on("rdma system", RDMA_SHARED);
  EXPECT_EQ(readNicRole(runner_), NicRole::Macvlan);
}

/** @test A missing or failing rdma tool yields the error role. */
TEST_F(SoftwareInfoTest, NicRoleError) {
  EXPECT_EQ(readNicRole(runner_, 1s), NicRole::Error);
  runner_.on("rdma system", "rdma: unknown command\n", 1);
  EXPECT_EQ(readNicRole(runner_, 1s), NicRole::Error);
}

/** @test Secondary functions report zero VFs without running ip. */
TEST_F(SoftwareInfoTest, VfCountSecondaryFunction) {
  EXPECT_EQ(readVfCount(runner_, "eth3", "0000:1a:00.1", 1s), "0");
  EXPECT_TRUE(runner_.calls().empty());
}

/** @test VF count comes from ip link. */
TEST_F(SoftwareInfoTest, VfCountFromIpLink) {
  runner_.on("ip link show dev eth2", IP_LINK);
  EXPECT_EQ(readVfCount(runner_, "eth2", "0000:1a:00.0", 1s), "2");
  EXPECT_EQ(readVfCount(runner_, "eth9", "0000:1b:00.0", 1s), "");
}

/** @test Software snapshot combines modules, GPU presence and OFED. */
TEST_F(SoftwareInfoTest, CollectSoftware) {
  fs_.write(fs_.paths().procModules, PROC_MODULES);
  fs_.mkdir(fs_.paths().nvidiaGpus + "/0000:3b:00.0");
  runner_.on("ofed_info -s", "MLNX_OFED_LINUX-23.10-1.1.9.0:\n");
  runner_.on("rdma system", RDMA_EXCLUSIVE);

  const SoftwareInfo INFO = collectSoftware(fs_.paths(), runner_, 1s);
  EXPECT_EQ(INFO.ofedVer, "MLNX_OFED_LINUX-23.10-1.1.9.0");
  EXPECT_EQ(INFO.nicRole, NicRole::Sriov);
  EXPECT_TRUE(INFO.hasNvidiaGpu);
  EXPECT_TRUE(INFO.isLoaded("mlx5_core"));
  EXPECT_FALSE(INFO.isLoaded("ib_core"));
}

/** @test Missing /proc files degrade to empty results. */
TEST_F(SoftwareInfoTest, MissingFiles) {
  EXPECT_TRUE(loadedModules(fs_.paths()).empty());
  EXPECT_FALSE(hasNvidiaGpu(fs_.paths()));
}
