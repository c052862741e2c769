/**
 * @file ConnectivityProber_uTest.cpp
 * @brief Unit tests for ibcheck::route::ConnectivityProber and the TCP probe.
 *
 * Notes:
 *  - Cache tests substitute the probe function; TCP tests use a loopback listener.
 */

#include "src/route/inc/ConnectivityProber.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>

using ibcheck::cache::CacheEntry;
using ibcheck::cache::Clock;
using ibcheck::cache::LoadResult;
using ibcheck::route::ConnectivityProber;
using ibcheck::route::tcpReach;

namespace {

using namespace std::chrono_literals;

} // namespace

class ConnectivityProberTest : public ::testing::Test {
protected:
  std::atomic<Clock::rep> ticks_{0};
  std::atomic<int> probes_{0};
  bool reachable_{true};

  ConnectivityProber prober_{
      30s,
      [this](const std::string& /*dev*/, const std::string& gw) {
        probes_.fetch_add(1);
        LoadResult<bool> r;
        r.value = reachable_;
        if (!reachable_) {
          r.error = "gateway '" + gw + "' is unreachable";
        }
        return r;
      },
      [this] { return Clock::time_point(Clock::duration(ticks_.load())); }};
};

/** @test Results are cached per device and gateway. */
TEST_F(ConnectivityProberTest, CachedPerKey) {
  EXPECT_TRUE(prober_.probe("eth2", "10.0.0.1").value);
  EXPECT_TRUE(prober_.probe("eth2", "10.0.0.1").value);
  EXPECT_EQ(probes_.load(), 1);

  EXPECT_TRUE(prober_.probe("eth3", "10.0.0.1").value);
  EXPECT_EQ(probes_.load(), 2);
}

/** @test Unreachable results carry the reason and expire with the TTL. */
TEST_F(ConnectivityProberTest, FailureCachedUntilTtl) {
  reachable_ = false;
  const CacheEntry<bool> FIRST = prober_.probe("eth2", "10.0.0.1");
  EXPECT_FALSE(FIRST.value);
  EXPECT_FALSE(FIRST.ok());

  reachable_ = true;
  ticks_.fetch_add(std::chrono::duration_cast<Clock::duration>(29s).count());
  EXPECT_FALSE(prober_.probe("eth2", "10.0.0.1").value);

  ticks_.fetch_add(std::chrono::duration_cast<Clock::duration>(2s).count());
  EXPECT_TRUE(prober_.probe("eth2", "10.0.0.1").value);
  EXPECT_EQ(probes_.load(), 2);
}

/* ----------------------------- TCP ----------------------------- */

/** @test A listening loopback port is reachable. */
TEST(TcpReachTest, LoopbackListener) {
  const int FD = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(FD, 0);
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  sa.sin_port = 0;
  ASSERT_EQ(::bind(FD, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)), 0);
  ASSERT_EQ(::listen(FD, 1), 0);
  socklen_t len = sizeof(sa);
  ASSERT_EQ(::getsockname(FD, reinterpret_cast<sockaddr*>(&sa), &len), 0);

  std::string error;
  EXPECT_TRUE(tcpReach("", "127.0.0.1", ntohs(sa.sin_port), 2000ms, error)) << error;
  ::close(FD);
}

/** @test A non-IPv4 gateway string is rejected. */
TEST(TcpReachTest, BadAddress) {
  std::string error;
  EXPECT_FALSE(tcpReach("", "not-an-ip", 443, 100ms, error));
  EXPECT_FALSE(error.empty());
}
