#ifndef IBCHECK_ROUTE_CONNECTIVITY_PROBER_HPP
#define IBCHECK_ROUTE_CONNECTIVITY_PROBER_HPP
/**
 * @file ConnectivityProber.hpp
 * @brief Cached gateway reachability probes for RoCE interfaces.
 *
 * A probe first sends one ICMP echo over an unprivileged ping socket
 * (SOCK_DGRAM/IPPROTO_ICMP, subject to net.ipv4.ping_group_range). If that
 * fails it tries TCP connects to ports 443, 80 and 22. A refused connection
 * counts as reachable: the gateway answered.
 *
 * @note NOT RT-safe: Blocking socket I/O bounded by the probe timeout.
 */

#include "src/cache/inc/TtlCache.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ibcheck {
namespace route {

/* ----------------------------- Constants ----------------------------- */

/// Default freshness window for cached probe results.
inline constexpr std::chrono::seconds DEFAULT_CONNECTIVITY_TTL{30};

/// Timeout for each individual probe attempt.
inline constexpr std::chrono::milliseconds PROBE_TIMEOUT{2000};

/// TCP ports tried when ICMP fails, in order.
inline constexpr std::uint16_t PROBE_TCP_PORTS[] = {443, 80, 22};

/* ----------------------------- Probes ----------------------------- */

/**
 * @brief One ICMP echo to @p gateway, leaving through @p netDev.
 * @return false with @p error set on failure or timeout.
 */
[[nodiscard]] bool icmpEcho(const std::string& netDev, const std::string& gateway,
                            std::chrono::milliseconds timeout, std::string& error);

/**
 * @brief TCP connect to @p gateway:@p port through @p netDev.
 * @return true on connect or ECONNREFUSED.
 */
[[nodiscard]] bool tcpReach(const std::string& netDev, const std::string& gateway,
                            std::uint16_t port, std::chrono::milliseconds timeout,
                            std::string& error);

/**
 * @brief ICMP, then TCP fallback.
 * @return value true if reachable; otherwise false with error describing
 *         the last failure.
 */
[[nodiscard]] cache::LoadResult<bool> probeGateway(const std::string& netDev,
                                                   const std::string& gateway,
                                                   std::chrono::milliseconds timeout = PROBE_TIMEOUT);

/* ----------------------------- ConnectivityProber ----------------------------- */

/**
 * @brief probeGateway() behind a TTL cache keyed by "netDev:gateway".
 * @note Thread-safe.
 */
class ConnectivityProber {
public:
  using ProbeFn = std::function<cache::LoadResult<bool>(const std::string&, const std::string&)>;

  /**
   * @param ttl Freshness window.
   * @param probe Probe implementation; defaults to probeGateway().
   * @param now Cache clock.
   */
  explicit ConnectivityProber(cache::Clock::duration ttl = DEFAULT_CONNECTIVITY_TTL,
                              ProbeFn probe = nullptr, cache::NowFn now = nullptr);

  /**
   * @brief Reachability of @p gateway from @p netDev.
   * @return Entry whose value is true when reachable; error explains a failure.
   */
  [[nodiscard]] cache::CacheEntry<bool> probe(const std::string& netDev,
                                              const std::string& gateway);

  void close() { cache_.close(); }

private:
  ProbeFn probe_;
  cache::TtlCache<std::string, bool> cache_;
};

} // namespace route
} // namespace ibcheck

#endif // IBCHECK_ROUTE_CONNECTIVITY_PROBER_HPP
