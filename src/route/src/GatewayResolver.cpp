/**
 * @file GatewayResolver.cpp
 * @brief Policy-routing gateway lookup and the cached, link-layer-aware front end.
 */

#include "src/route/inc/GatewayResolver.hpp"
#include "src/collect/inc/AdapterInfo.hpp"
#include "src/helpers/inc/Log.hpp"

#include <algorithm>
#include <map>
#include <vector>

#include <fmt/core.h>

namespace ibcheck {

namespace route {

namespace {

/* ----------------------------- Helpers ----------------------------- */

/// Operstates that mean the interface cannot carry traffic.
bool isDownState(const std::string& operstate) noexcept {
  return operstate == "down" || operstate == "lowerlayerdown" || operstate == "notpresent";
}

/**
 * Scan @p routes for a default route with a gateway. The first route with
 * any gateway is stored in @p fallback if it is still empty.
 */
bool findDefaultGateway(const std::vector<RouteEntry>& routes, std::string& gateway,
                        std::string& fallback) {
  for (const RouteEntry& r : routes) {
    if (!r.hasGateway) {
      continue;
    }
    if (r.isDefault()) {
      gateway = r.gateway.toString();
      return true;
    }
    if (fallback.empty()) {
      fallback = r.gateway.toString();
    }
  }
  return false;
}

/// Addresses usable as a source: global scope only.
std::vector<InterfaceAddress> routableAddresses(RoutingSource& source, const std::string& ifname,
                                                int family) {
  std::vector<InterfaceAddress> all;
  std::string error;
  if (!source.addresses(ifname, family, all, error)) {
    helpers::log::logger()->debug("{}: address list (family {}) unavailable: {}", ifname, family,
                                  error);
    return {};
  }
  std::vector<InterfaceAddress> out;
  for (const InterfaceAddress& a : all) {
    if (a.scope != SCOPE_LINK && a.scope != SCOPE_HOST) {
      out.push_back(a);
    }
  }
  return out;
}

} // namespace

/* ----------------------------- GatewayResult ----------------------------- */

const char* toString(GatewayKind kind) noexcept {
  switch (kind) {
  case GatewayKind::NoGateway:
    return "no-gateway";
  case GatewayKind::Ipv6Only:
    return "ipv6-only";
  case GatewayKind::Resolved:
    return "resolved";
  case GatewayKind::Error:
    return "error";
  }
  return "unknown";
}

std::string GatewayResult::fieldValue() const {
  switch (kind) {
  case GatewayKind::Resolved:
    return address;
  case GatewayKind::Ipv6Only:
    return IPV6_SENTINEL;
  default:
    return {};
  }
}

/* ----------------------------- Pure resolution ----------------------------- */

bool resolveGatewayAddress(RoutingSource& source, const std::string& ifname, std::string& gateway,
                           std::string& error) {
  const std::vector<InterfaceAddress> SOURCES = routableAddresses(source, ifname, FAMILY_V4);

  std::string fallback;
  if (!SOURCES.empty()) {
    std::vector<RoutingRule> rules;
    std::string ruleError;
    if (!source.rules(FAMILY_V4, rules, ruleError)) {
      helpers::log::logger()->debug("{}: policy rules unavailable: {}", ifname, ruleError);
    }
    std::stable_sort(rules.begin(), rules.end(), [](const RoutingRule& a, const RoutingRule& b) {
      return a.priority < b.priority;
    });

    std::map<std::uint32_t, std::vector<RouteEntry>> tables;
    for (const InterfaceAddress& src : SOURCES) {
      for (const RoutingRule& rule : rules) {
        if (!rule.matchesSource(src.addr)) {
          continue;
        }
        auto it = tables.find(rule.table);
        if (it == tables.end()) {
          std::vector<RouteEntry> routes;
          std::string tableError;
          if (!source.routesInTable(rule.table, routes, tableError)) {
            helpers::log::logger()->debug("{}: table {} unavailable: {}", ifname, rule.table,
                                          tableError);
          }
          it = tables.emplace(rule.table, std::move(routes)).first;
        }
        if (findDefaultGateway(it->second, gateway, fallback)) {
          helpers::log::logger()->info(
              "{}: gateway {} via policy rule (src {}, priority {}, table {})", ifname, gateway,
              src.addr.toString(), rule.priority, rule.table);
          return true;
        }
      }
    }
    if (!fallback.empty()) {
      gateway = fallback;
      helpers::log::logger()->info("{}: fallback gateway {} from policy tables", ifname, gateway);
      return true;
    }
  } else {
    helpers::log::logger()->debug("{}: no IPv4 source address, skipping policy rules", ifname);
  }

  std::vector<RouteEntry> ifRoutes;
  std::string ifError;
  if (!source.routesOnInterface(ifname, ifRoutes, ifError)) {
    error = fmt::format("no gateway for '{}': {}", ifname, ifError);
    return false;
  }
  if (findDefaultGateway(ifRoutes, gateway, fallback)) {
    helpers::log::logger()->info("{}: gateway {} via interface routes", ifname, gateway);
    return true;
  }
  if (!fallback.empty()) {
    gateway = fallback;
    helpers::log::logger()->info("{}: fallback gateway {} via interface routes", ifname, gateway);
    return true;
  }

  error = fmt::format("no gateway found for interface '{}'", ifname);
  return false;
}

/* ----------------------------- GatewayResolver ----------------------------- */

GatewayResolver::GatewayResolver(collect::SysPaths paths, RoutingSource& source,
                                 cache::Clock::duration ttl, cache::NowFn now)
    : paths_(std::move(paths)), source_(source), cache_(ttl, std::move(now)) {}

GatewayResult GatewayResolver::resolve(const std::string& ibDev, const std::string& netDev) {
  const std::string LINK_LAYER = collect::readPortAttr(paths_, ibDev, "link_layer");
  if (LINK_LAYER == collect::LINK_LAYER_IB) {
    helpers::log::logger()->debug("{}: InfiniBand link layer, no gateway", ibDev);
    return GatewayResult::noGateway();
  }
  if (LINK_LAYER != collect::LINK_LAYER_ETH) {
    return GatewayResult::failed(
        fmt::format("{}: unsupported link layer '{}'", ibDev, LINK_LAYER));
  }
  if (netDev.empty()) {
    return GatewayResult::failed(fmt::format("{}: no network interface bound", ibDev));
  }

  const std::string OPERSTATE = collect::readOperstate(paths_, netDev);
  if (isDownState(OPERSTATE)) {
    helpers::log::logger()->warn("{}: interface {} is {}, no gateway", ibDev, netDev, OPERSTATE);
    return GatewayResult::noGateway();
  }

  const bool HAS_V4 = !routableAddresses(source_, netDev, FAMILY_V4).empty();
  const bool HAS_V6 = !routableAddresses(source_, netDev, FAMILY_V6).empty();
  if (HAS_V6 && !HAS_V4) {
    helpers::log::logger()->info("{}: {} has only IPv6 addresses", ibDev, netDev);
    return GatewayResult::ipv6Only();
  }

  const cache::CacheEntry<std::string> ENTRY = cache_.get(netDev, [this, &netDev] {
    cache::LoadResult<std::string> r;
    if (!resolveGatewayAddress(source_, netDev, r.value, r.error)) {
      r.value.clear();
    }
    return r;
  });

  if (ENTRY.ok()) {
    return GatewayResult::resolved(ENTRY.value);
  }
  if (HAS_V6) {
    helpers::log::logger()->info("{}: no IPv4 gateway on {}, treating as IPv6 ({})", ibDev, netDev,
                                 ENTRY.error);
    return GatewayResult::ipv6Only();
  }
  helpers::log::logger()->warn("{}: {}", ibDev, ENTRY.error);
  return GatewayResult::failed(ENTRY.error);
}

} // namespace route

} // namespace ibcheck
