/**
 * @file ConnectivityProber.cpp
 * @brief ICMP and TCP reachability probes.
 */

#include "src/route/inc/ConnectivityProber.hpp"
#include "src/helpers/inc/Log.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/core.h>

namespace ibcheck {

namespace route {

namespace {

/* ----------------------------- Helpers ----------------------------- */

struct FdGuard {
  int fd{-1};
  ~FdGuard() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};

constexpr std::uint16_t ECHO_SEQ = 1;
constexpr char ECHO_PAYLOAD[] = "ibcheck";

bool toSockaddr(const std::string& gateway, std::uint16_t port, sockaddr_in& out,
                std::string& error) {
  out = sockaddr_in{};
  out.sin_family = AF_INET;
  out.sin_port = htons(port);
  if (::inet_pton(AF_INET, gateway.c_str(), &out.sin_addr) != 1) {
    error = fmt::format("'{}' is not an IPv4 address", gateway);
    return false;
  }
  return true;
}

/// Bind @p fd to @p netDev. Failure is logged and tolerated.
void bindToDevice(int fd, const std::string& netDev) {
  if (netDev.empty()) {
    return;
  }
  if (::setsockopt(fd, SOL_SOCKET, SO_BINDTODEVICE, netDev.c_str(),
                   static_cast<socklen_t>(netDev.size())) != 0) {
    helpers::log::logger()->debug("SO_BINDTODEVICE {} failed: {}, probing unbound", netDev,
                                  std::strerror(errno));
  }
}

/// Wait for @p events on @p fd. Returns 1 ready, 0 timeout, -1 error.
int waitFor(int fd, short events, std::chrono::milliseconds timeout) {
  pollfd pfd{fd, events, 0};
  for (;;) {
    const int RC = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (RC < 0 && errno == EINTR) {
      continue;
    }
    return RC > 0 ? 1 : RC;
  }
}

} // namespace

/* ----------------------------- Probes ----------------------------- */

bool icmpEcho(const std::string& netDev, const std::string& gateway,
              std::chrono::milliseconds timeout, std::string& error) {
  sockaddr_in dst{};
  if (!toSockaddr(gateway, 0, dst, error)) {
    return false;
  }

  FdGuard sock{::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP)};
  if (sock.fd < 0) {
    error = fmt::format("icmp socket: {} (check net.ipv4.ping_group_range)", std::strerror(errno));
    return false;
  }
  bindToDevice(sock.fd, netDev);

  std::array<std::uint8_t, sizeof(icmphdr) + sizeof(ECHO_PAYLOAD)> packet{};
  icmphdr hdr{};
  hdr.type = ICMP_ECHO;
  hdr.un.echo.sequence = htons(ECHO_SEQ);
  std::memcpy(packet.data(), &hdr, sizeof(hdr));
  std::memcpy(packet.data() + sizeof(hdr), ECHO_PAYLOAD, sizeof(ECHO_PAYLOAD));

  if (::sendto(sock.fd, packet.data(), packet.size(), 0, reinterpret_cast<sockaddr*>(&dst),
               sizeof(dst)) < 0) {
    error = fmt::format("icmp send to {}: {}", gateway, std::strerror(errno));
    return false;
  }

  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  std::array<std::uint8_t, 1500> reply{};
  for (;;) {
    const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(
        DEADLINE - std::chrono::steady_clock::now());
    if (LEFT.count() <= 0 || waitFor(sock.fd, POLLIN, LEFT) <= 0) {
      error = fmt::format("icmp echo to {} timed out", gateway);
      return false;
    }
    const ssize_t N = ::recv(sock.fd, reply.data(), reply.size(), 0);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = fmt::format("icmp recv from {}: {}", gateway, std::strerror(errno));
      return false;
    }
    if (static_cast<std::size_t>(N) < sizeof(icmphdr)) {
      continue;
    }
    icmphdr got{};
    std::memcpy(&got, reply.data(), sizeof(got));
    if (got.type == ICMP_ECHOREPLY && ntohs(got.un.echo.sequence) == ECHO_SEQ) {
      return true;
    }
  }
}

bool tcpReach(const std::string& netDev, const std::string& gateway, std::uint16_t port,
              std::chrono::milliseconds timeout, std::string& error) {
  sockaddr_in dst{};
  if (!toSockaddr(gateway, port, dst, error)) {
    return false;
  }

  FdGuard sock{::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0)};
  if (sock.fd < 0) {
    error = fmt::format("tcp socket: {}", std::strerror(errno));
    return false;
  }
  bindToDevice(sock.fd, netDev);

  if (::connect(sock.fd, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) == 0) {
    return true;
  }
  if (errno == ECONNREFUSED) {
    return true;
  }
  if (errno != EINPROGRESS) {
    error = fmt::format("tcp {}:{}: {}", gateway, port, std::strerror(errno));
    return false;
  }

  if (waitFor(sock.fd, POLLOUT, timeout) <= 0) {
    error = fmt::format("tcp {}:{} timed out", gateway, port);
    return false;
  }

  int soError = 0;
  socklen_t len = sizeof(soError);
  if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
    error = fmt::format("tcp {}:{}: {}", gateway, port, std::strerror(errno));
    return false;
  }
  if (soError == 0 || soError == ECONNREFUSED) {
    return true;
  }
  error = fmt::format("tcp {}:{}: {}", gateway, port, std::strerror(soError));
  return false;
}

cache::LoadResult<bool> probeGateway(const std::string& netDev, const std::string& gateway,
                                     std::chrono::milliseconds timeout) {
  cache::LoadResult<bool> result;
  std::string icmpError;
  if (icmpEcho(netDev, gateway, timeout, icmpError)) {
    helpers::log::logger()->debug("{}: gateway {} answered ICMP", netDev, gateway);
    result.value = true;
    return result;
  }
  helpers::log::logger()->warn("{}: ICMP to gateway {} failed ({}), trying TCP", netDev, gateway,
                               icmpError);

  std::string tcpError;
  for (const std::uint16_t PORT : PROBE_TCP_PORTS) {
    if (tcpReach(netDev, gateway, PORT, timeout, tcpError)) {
      helpers::log::logger()->debug("{}: gateway {} reachable on tcp/{}", netDev, gateway, PORT);
      result.value = true;
      return result;
    }
  }

  result.value = false;
  result.error = fmt::format("gateway '{}' is unreachable: {}; {}", gateway, icmpError, tcpError);
  return result;
}

/* ----------------------------- ConnectivityProber ----------------------------- */

ConnectivityProber::ConnectivityProber(cache::Clock::duration ttl, ProbeFn probe, cache::NowFn now)
    : probe_(probe ? std::move(probe)
                   : ProbeFn([](const std::string& dev, const std::string& gw) {
                       return probeGateway(dev, gw);
                     })),
      cache_(ttl, std::move(now)) {}

cache::CacheEntry<bool> ConnectivityProber::probe(const std::string& netDev,
                                                  const std::string& gateway) {
  return cache_.get(netDev + ":" + gateway, [this, &netDev, &gateway] {
    return probe_(netDev, gateway);
  });
}

} // namespace route

} // namespace ibcheck
