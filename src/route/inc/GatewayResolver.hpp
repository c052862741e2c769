#ifndef IBCHECK_ROUTE_GATEWAY_RESOLVER_HPP
#define IBCHECK_ROUTE_GATEWAY_RESOLVER_HPP
/**
 * @file GatewayResolver.hpp
 * @brief Egress gateway of an RDMA adapter's network interface, following
 *        policy routing rules before the interface's own routes.
 *
 * Lookup order for an Ethernet (RoCE) adapter:
 *  1. IPv4 source addresses of the interface.
 *  2. Policy rules sorted by ascending priority.
 *  3. For each (source, matching rule): the rule's table is searched for a
 *     default route with a gateway; the first route with any gateway is
 *     kept as a fallback candidate.
 *  4. First default-route gateway across all pairs, else the first fallback.
 *  5. Same search over the interface's main-table routes.
 *
 * Results, including failures, are cached per interface name.
 */

#include "src/cache/inc/TtlCache.hpp"
#include "src/collect/inc/SysPaths.hpp"
#include "src/route/inc/RoutingSource.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace ibcheck {
namespace route {

/* ----------------------------- Constants ----------------------------- */

/// Default freshness window for cached gateway lookups.
inline constexpr std::chrono::minutes DEFAULT_GATEWAY_TTL{5};

/// Text placed in AdapterHardware::pfGateway for IPv6-only interfaces.
inline constexpr const char* IPV6_SENTINEL = "IPV6";

/* ----------------------------- GatewayResult ----------------------------- */

enum class GatewayKind : std::uint8_t {
  NoGateway = 0, ///< InfiniBand link layer, or interface down
  Ipv6Only,      ///< IPv6 addressing without a usable IPv4 path
  Resolved,      ///< address holds the gateway
  Error,         ///< error holds the reason
};

/// Human-readable name of a GatewayKind.
[[nodiscard]] const char* toString(GatewayKind kind) noexcept;

/**
 * @brief Outcome of a gateway lookup.
 */
struct GatewayResult {
  GatewayKind kind{GatewayKind::NoGateway};
  std::string address{}; ///< Set only for Resolved
  std::string error{};   ///< Set only for Error

  [[nodiscard]] static GatewayResult noGateway() { return {}; }
  [[nodiscard]] static GatewayResult ipv6Only() { return {GatewayKind::Ipv6Only, {}, {}}; }
  [[nodiscard]] static GatewayResult resolved(std::string addr) {
    return {GatewayKind::Resolved, std::move(addr), {}};
  }
  [[nodiscard]] static GatewayResult failed(std::string why) {
    return {GatewayKind::Error, {}, std::move(why)};
  }

  [[nodiscard]] bool ok() const noexcept { return kind != GatewayKind::Error; }

  /// Value recorded in the snapshot: the address, IPV6_SENTINEL, or "".
  [[nodiscard]] std::string fieldValue() const;
};

/* ----------------------------- Pure resolution ----------------------------- */

/**
 * @brief Resolve the IPv4 gateway of @p ifname from @p source.
 *
 * This is the cached part of the lookup; it does not consider link layer
 * or IPv6.
 *
 * @return false with @p error set if no gateway was found or a table could
 *         not be read.
 */
[[nodiscard]] bool resolveGatewayAddress(RoutingSource& source, const std::string& ifname,
                                         std::string& gateway, std::string& error);

/* ----------------------------- GatewayResolver ----------------------------- */

/**
 * @brief Link-layer-aware gateway lookup with a per-interface TTL cache.
 * @note Thread-safe: resolve() may be called from collector workers.
 */
class GatewayResolver {
public:
  using Cache = cache::TtlCache<std::string, std::string>;

  GatewayResolver(collect::SysPaths paths, RoutingSource& source,
                  cache::Clock::duration ttl = DEFAULT_GATEWAY_TTL, cache::NowFn now = nullptr);

  /**
   * @brief Gateway of @p netDev, the interface bound to @p ibDev.
   *
   * InfiniBand adapters and interfaces whose operstate is down get
   * NoGateway. Only global-scope addresses count toward a family.
   * IPv6-only interfaces get Ipv6Only. When an interface has both families
   * and IPv4 resolution fails, the result is Ipv6Only as well.
   */
  [[nodiscard]] GatewayResult resolve(const std::string& ibDev, const std::string& netDev);

  /// Drop cached lookups.
  void close() { cache_.close(); }

  [[nodiscard]] const Cache& cache() const noexcept { return cache_; }

private:
  collect::SysPaths paths_;
  RoutingSource& source_;
  Cache cache_;
};

} // namespace route
} // namespace ibcheck

#endif // IBCHECK_ROUTE_GATEWAY_RESOLVER_HPP
