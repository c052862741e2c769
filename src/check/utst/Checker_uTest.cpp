/**
 * @file Checker_uTest.cpp
 * @brief Unit tests for the check items and the registry.
 *
 * Notes:
 *  - Snapshots are built in memory; the RoCE tests substitute the probe.
 */

#include "src/check/inc/Checker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

using ibcheck::cache::LoadResult;
using ibcheck::check::CheckContext;
using ibcheck::check::CheckResult;
using ibcheck::check::Level;
using ibcheck::check::Status;
using ibcheck::inventory::AdapterSnapshot;
using ibcheck::inventory::InfinibandSnapshot;
using ibcheck::route::ConnectivityProber;
using ibcheck::route::GatewayResult;
using ibcheck::spec::AdapterSpec;
using ibcheck::spec::ClusterSpec;

namespace check = ibcheck::check;

namespace {

const char* const BOARD = "MT_0000000838";

AdapterSnapshot adapter(const std::string& ibDev, const std::string& netDev) {
  AdapterSnapshot a;
  auto& hw = a.hardware;
  hw.ibDev = ibDev;
  hw.netDev = netDev;
  hw.boardId = BOARD;
  hw.fwVer = "28.39.2048";
  hw.portState = "4: ACTIVE";
  hw.phyState = "5: LinkUp";
  hw.linkLayer = "InfiniBand";
  hw.netOperstate = "up";
  hw.portSpeed = "400 Gb/sec (4X NDR)";
  hw.pcieSpeed = "32.0 GT/s PCIe";
  hw.pcieWidth = "16";
  hw.pcieTreeSpeedMin = "32.0";
  hw.pcieTreeWidthMin = "16";
  hw.pcieMrr = "4096";
  return a;
}

AdapterSpec boardSpec() {
  AdapterSpec s;
  auto& hw = s.hardware;
  hw.boardId = BOARD;
  hw.fwVer = ">=28.39.2048";
  hw.portState = "ACTIVE";
  hw.phyState = "LinkUp";
  hw.portSpeed = "400 Gb/sec (4X NDR)";
  hw.pcieSpeed = "32.0 GT/s PCIe";
  hw.pcieWidth = "16";
  hw.pcieTreeSpeedMin = "32";
  hw.pcieTreeWidthMin = "16";
  hw.pcieMrr = "4096";
  return s;
}

} // namespace

class CheckerTest : public ::testing::Test {
protected:
  void SetUp() override {
    snap_.adapters["mlx5_0"] = adapter("mlx5_0", "ib0");
    snap_.adapters["mlx5_1"] = adapter("mlx5_1", "ib1");
    snap_.ibDevs = {{"mlx5_0", "ib0"}, {"mlx5_1", "ib1"}};
    snap_.pciAdapterCount = 2;
    snap_.software.ofedVer = "MLNX_OFED_LINUX-23.10-1.1.9.0";
    snap_.software.loadedModules = {"mlx5_core", "mlx5_ib", "ib_uverbs"};
    snap_.acsScanned = true;
    snap_.acs.scanned = 40;

    spec_.ibDevs = {{"mlx5_0", "ib0"}, {"mlx5_1", "ib1"}};
    spec_.swDeps.ofedVer = ">=MLNX_OFED_LINUX-23.10-1.1.9.0";
    spec_.swDeps.kernelModules = {"mlx5_core", "mlx5_ib", "ib_uverbs"};
    spec_.hcaSpecs[BOARD] = boardSpec();
  }

  CheckContext ctx(ConnectivityProber* prober = nullptr) const { return {snap_, spec_, prober}; }

  InfinibandSnapshot snap_;
  ClusterSpec spec_;
};

/* ----------------------------- Registry ----------------------------- */

/** @test A healthy node passes every item. */
TEST_F(CheckerTest, HealthyNodeAllNormal) {
  const std::vector<CheckResult> RESULTS = check::runChecks(ctx());
  EXPECT_EQ(RESULTS.size(), check::checkItems().size());
  for (const CheckResult& r : RESULTS) {
    EXPECT_TRUE(r.normal()) << r.name << ": " << r.detail;
  }
  EXPECT_TRUE(check::allNormal(RESULTS));
}

/** @test Every item reports no_ib_found for an empty snapshot. */
TEST_F(CheckerTest, EmptySnapshot) {
  snap_.adapters.clear();
  const std::vector<CheckResult> RESULTS = check::runChecks(ctx());
  ASSERT_FALSE(RESULTS.empty());
  for (const CheckResult& r : RESULTS) {
    EXPECT_EQ(r.status, Status::Abnormal) << r.name;
    EXPECT_EQ(r.detail, check::NO_IB_FOUND) << r.name;
    EXPECT_TRUE(r.suggestion.empty()) << r.name;
  }
}

/** @test Ignored items are not run. */
TEST_F(CheckerTest, IgnoredCheckers) {
  snap_.adapters["mlx5_0"].hardware.fwVer = "20.1.1";
  const std::vector<CheckResult> RESULTS =
      check::runChecks(ctx(), {check::CHECK_IB_FW, "check_does_not_exist"});
  EXPECT_EQ(RESULTS.size(), check::checkItems().size() - 1);
  EXPECT_TRUE(std::none_of(RESULTS.begin(), RESULTS.end(),
                           [](const CheckResult& r) { return r.name == check::CHECK_IB_FW; }));
  EXPECT_TRUE(check::allNormal(RESULTS));
}

/** @test Item metadata is looked up by name. */
TEST(CheckRegistryTest, FindItem) {
  const check::CheckItem* item = check::findItem(check::CHECK_PCIE_MRR);
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->level, Level::Info);
  EXPECT_EQ(check::findItem("nope"), nullptr);
  EXPECT_STREQ(check::toString(Level::Critical), "critical");
  EXPECT_STREQ(check::toString(Status::Abnormal), "abnormal");
}

/* ----------------------------- Adapter items ----------------------------- */

/** @test Old firmware fails and names the device. */
TEST_F(CheckerTest, FirmwareTooOld) {
  snap_.adapters["mlx5_1"].hardware.fwVer = "28.38.1000";
  const CheckResult R = check::checkFirmware(ctx());
  EXPECT_EQ(R.status, Status::Abnormal);
  EXPECT_EQ(R.level, Level::Warning);
  EXPECT_EQ(R.device, "mlx5_1");
  EXPECT_EQ(R.spec, ">=28.39.2048,>=28.39.2048");
  EXPECT_EQ(R.curr, "28.39.2048,28.38.1000");
}

/** @test A malformed firmware version is abnormal with the parse error as detail. */
TEST_F(CheckerTest, FirmwareFormatError) {
  snap_.adapters["mlx5_0"].hardware.fwVer = "28.x.1";
  const CheckResult R = check::checkFirmware(ctx());
  EXPECT_EQ(R.status, Status::Abnormal);
  EXPECT_NE(R.detail.find("invalid version component"), std::string::npos);
}

/** @test Port state matches by substring. */
TEST_F(CheckerTest, PortState) {
  EXPECT_TRUE(check::checkPortState(ctx()).normal());
  snap_.adapters["mlx5_0"].hardware.portState = "1: DOWN";
  const CheckResult R = check::checkPortState(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.device, "mlx5_0");
  EXPECT_EQ(R.level, Level::Critical);
}

/** @test Operstate defaults to "up" when the spec leaves it empty. */
TEST_F(CheckerTest, NetOperstateDefault) {
  snap_.adapters["mlx5_1"].hardware.netOperstate = "down";
  const CheckResult R = check::checkNetOperstate(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.device, "mlx5_1");
  EXPECT_EQ(R.spec, "up,up");
}

/** @test Items with no expected value are not evaluated. */
TEST_F(CheckerTest, EmptySpecFieldSkipped) {
  spec_.hcaSpecs[BOARD].hardware.portSpeed.clear();
  snap_.adapters["mlx5_0"].hardware.portSpeed = "200 Gb/sec (4X HDR)";
  const CheckResult R = check::checkPortSpeed(ctx());
  EXPECT_TRUE(R.normal());
  EXPECT_TRUE(R.spec.empty());
}

/** @test Adapters whose board has no spec are skipped. */
TEST_F(CheckerTest, UnknownBoardSkipped) {
  snap_.adapters["mlx5_1"].hardware.boardId = "MT_OTHER";
  snap_.adapters["mlx5_1"].hardware.pcieWidth = "8";
  const CheckResult R = check::checkPcieWidth(ctx());
  EXPECT_TRUE(R.normal());
  EXPECT_EQ(R.curr, "16");
}

/** @test MRR expects 4096 and is informational. */
TEST_F(CheckerTest, PcieMrr) {
  spec_.hcaSpecs[BOARD].hardware.pcieMrr.clear();
  snap_.adapters["mlx5_0"].hardware.pcieMrr = "512";
  const CheckResult R = check::checkPcieMrr(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.level, Level::Info);
  EXPECT_NE(R.detail.find("expect 4096, but get 512"), std::string::npos);
}

/** @test Tree minimum must reach the spec; unknown trees are skipped. */
TEST_F(CheckerTest, PcieTreeSpeed) {
  snap_.adapters["mlx5_0"].hardware.pcieTreeSpeedMin = "16.0";
  snap_.adapters["mlx5_1"].hardware.pcieTreeSpeedMin.clear();
  const CheckResult R = check::checkPcieTreeSpeed(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.device, "mlx5_0");
  EXPECT_EQ(R.curr, "16.0");

  snap_.adapters["mlx5_0"].hardware.pcieTreeSpeedMin = "64.0";
  EXPECT_TRUE(check::checkPcieTreeSpeed(ctx()).normal());
}

/* ----------------------------- Node items ----------------------------- */

/** @test OFED constraint violations and format errors are both abnormal. */
TEST_F(CheckerTest, Ofed) {
  snap_.software.ofedVer = "MLNX_OFED_LINUX-5.9-0.5.6.0";
  CheckResult r = check::checkOfed(ctx());
  EXPECT_FALSE(r.normal());
  EXPECT_NE(r.detail.find("mismatch"), std::string::npos);

  snap_.software.ofedVer = "Unknown";
  r = check::checkOfed(ctx());
  EXPECT_FALSE(r.normal());
  EXPECT_NE(r.detail.find("cannot be evaluated"), std::string::npos);
}

/** @test Adapter count must equal the PCI scan count. */
TEST_F(CheckerTest, IbNum) {
  snap_.pciAdapterCount = 3;
  const CheckResult R = check::checkIbNum(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.spec, "3");
  EXPECT_EQ(R.curr, "2");
}

/** @test Missing modules are listed; a GPU node also needs nvidia_peermem. */
TEST_F(CheckerTest, KernelModules) {
  snap_.software.hasNvidiaGpu = true;
  const CheckResult R = check::checkKernelModules(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.device, "nvidia_peermem");
  EXPECT_EQ(R.suggestion, "use modprobe to load: nvidia_peermem");
}

/** @test Without a module list the built-in required set applies. */
TEST_F(CheckerTest, KernelModulesDefaultList) {
  spec_.swDeps.kernelModules.clear();
  const CheckResult R = check::checkKernelModules(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_NE(R.device.find("rdma_ucm"), std::string::npos);
}

/** @test ibDev to netDev naming is compared against the spec map. */
TEST_F(CheckerTest, IbDevs) {
  snap_.ibDevs["mlx5_1"] = "ib7";
  spec_.ibDevs["mlx5_4"] = "";
  const CheckResult R = check::checkIbDevs(ctx());
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.device, "mlx5_1 -> ib7 (expected ib1),mlx5_4 (missing)");
}

/** @test ACS enabled functions are listed; a failed scan is abnormal. */
TEST_F(CheckerTest, PcieAcs) {
  snap_.acs.enabled.push_back({"0000:00:01.0", "001d"});
  CheckResult r = check::checkPcieAcs(ctx());
  EXPECT_FALSE(r.normal());
  EXPECT_EQ(r.device, "0000:00:01.0");
  EXPECT_EQ(r.curr, "0000:00:01.0:001d");

  snap_.acs.enabled.clear();
  snap_.acs.error = "setpci: command not found";
  r = check::checkPcieAcs(ctx());
  EXPECT_FALSE(r.normal());

  snap_.acsScanned = false;
  EXPECT_TRUE(check::checkPcieAcs(ctx()).normal());
}

/* ----------------------------- RoCE gateway ----------------------------- */

class RoceGatewayTest : public CheckerTest {
protected:
  void SetUp() override {
    CheckerTest::SetUp();
    auto& a = snap_.adapters["mlx5_1"];
    a.hardware.linkLayer = "Ethernet";
    a.hardware.netDev = "eth1";
    a.gateway = GatewayResult::resolved("10.0.0.1");
  }

  std::atomic<int> probes_{0};
  bool reachable_{true};
  ConnectivityProber prober_{std::chrono::seconds(30),
                             [this](const std::string& /*dev*/, const std::string& gw) {
                               probes_.fetch_add(1);
                               LoadResult<bool> r;
                               r.value = reachable_;
                               if (!reachable_) {
                                 r.error = "gateway '" + gw + "' is unreachable";
                               }
                               return r;
                             }};
};

/** @test Resolved gateways are probed; unreachable ones fail. */
TEST_F(RoceGatewayTest, Unreachable) {
  reachable_ = false;
  const CheckResult R = check::checkRoceGateway(ctx(&prober_));
  EXPECT_FALSE(R.normal());
  EXPECT_EQ(R.device, "mlx5_1");
  EXPECT_NE(R.detail.find("10.0.0.1"), std::string::npos);
  EXPECT_EQ(probes_.load(), 1);
}

/** @test Reachable gateways pass. */
TEST_F(RoceGatewayTest, Reachable) {
  const CheckResult R = check::checkRoceGateway(ctx(&prober_));
  EXPECT_TRUE(R.normal());
  EXPECT_EQ(R.curr, "eth1:10.0.0.1");
}

/** @test Resolution errors fail even without probing; IPv6-only is skipped. */
TEST_F(RoceGatewayTest, ErrorAndIpv6) {
  snap_.adapters["mlx5_1"].gateway = GatewayResult::failed("no route");
  CheckResult r = check::checkRoceGateway(ctx());
  EXPECT_FALSE(r.normal());
  EXPECT_NE(r.detail.find("no route"), std::string::npos);

  snap_.adapters["mlx5_1"].gateway = GatewayResult::ipv6Only();
  r = check::checkRoceGateway(ctx(&prober_));
  EXPECT_TRUE(r.normal());
  EXPECT_EQ(probes_.load(), 0);
}

/** @test InfiniBand-only nodes pass without probing. */
TEST_F(CheckerTest, RoceNotApplicable) {
  const CheckResult R = check::checkRoceGateway(ctx());
  EXPECT_TRUE(R.normal());
  EXPECT_EQ(R.detail, "no RoCE adapters");
}
