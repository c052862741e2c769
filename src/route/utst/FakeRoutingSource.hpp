#ifndef IBCHECK_ROUTE_UTST_FAKE_ROUTING_SOURCE_HPP
#define IBCHECK_ROUTE_UTST_FAKE_ROUTING_SOURCE_HPP
/**
 * @file FakeRoutingSource.hpp
 * @brief In-memory RoutingSource for resolver tests.
 */

#include "src/route/inc/RoutingSource.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ibcheck {
namespace route {
namespace test {

inline IpAddr ip(const std::string& text) {
  IpAddr a;
  (void)IpAddr::parse(text, a);
  return a;
}

inline InterfaceAddress addr(const std::string& text, int prefixLen,
                             std::uint8_t scope = SCOPE_UNIVERSE) {
  InterfaceAddress a;
  a.addr = ip(text);
  a.prefixLen = prefixLen;
  a.scope = scope;
  return a;
}

inline RoutingRule rule(std::uint32_t priority, std::uint32_t table, const std::string& src = "",
                        int srcLen = 0) {
  RoutingRule r;
  r.priority = priority;
  r.table = table;
  if (!src.empty()) {
    r.hasSrc = true;
    r.src = ip(src);
    r.srcLen = srcLen;
  }
  return r;
}

/// Route; empty @p dst means default, empty @p gw means directly connected.
inline RouteEntry route(const std::string& dst, int dstLen, const std::string& gw,
                        std::uint32_t table = TABLE_MAIN, int oif = 0) {
  RouteEntry r;
  if (!dst.empty()) {
    r.hasDst = true;
    r.dst = ip(dst);
    r.dstLen = dstLen;
  }
  if (!gw.empty()) {
    r.hasGateway = true;
    r.gateway = ip(gw);
  }
  r.table = table;
  r.oif = oif;
  return r;
}

/**
 * @brief RoutingSource backed by maps. Counts calls so cache hits are visible.
 */
class FakeRoutingSource final : public RoutingSource {
public:
  std::map<std::string, int> indexes;
  std::map<std::string, std::vector<InterfaceAddress>> v4;
  std::map<std::string, std::vector<InterfaceAddress>> v6;
  std::vector<RoutingRule> ruleList;
  std::vector<RouteEntry> routes;
  bool failRules{false};

  std::atomic<int> ruleCalls{0};
  std::atomic<int> tableCalls{0};
  std::atomic<int> interfaceCalls{0};

  bool addresses(const std::string& ifname, int family, std::vector<InterfaceAddress>& out,
                 std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& m = family == FAMILY_V6 ? v6 : v4;
    if (indexes.count(ifname) == 0) {
      error = "no such interface";
      return false;
    }
    const auto IT = m.find(ifname);
    if (IT != m.end()) {
      out = IT->second;
    }
    return true;
  }

  bool rules(int /*family*/, std::vector<RoutingRule>& out, std::string& error) override {
    ruleCalls.fetch_add(1);
    if (failRules) {
      error = "rules unavailable";
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out = ruleList;
    return true;
  }

  bool routesInTable(std::uint32_t table, std::vector<RouteEntry>& out,
                     std::string& /*error*/) override {
    tableCalls.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const RouteEntry& r : routes) {
      if (r.table == table) {
        out.push_back(r);
      }
    }
    return true;
  }

  bool routesOnInterface(const std::string& ifname, std::vector<RouteEntry>& out,
                         std::string& error) override {
    interfaceCalls.fetch_add(1);
    int idx = 0;
    if (!interfaceIndex(ifname, idx, error)) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const RouteEntry& r : routes) {
      if (r.table == TABLE_MAIN && r.oif == idx) {
        out.push_back(r);
      }
    }
    return true;
  }

  bool interfaceIndex(const std::string& ifname, int& index, std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto IT = indexes.find(ifname);
    if (IT == indexes.end()) {
      error = "no such interface";
      return false;
    }
    index = IT->second;
    return true;
  }

private:
  std::mutex mutex_;
};

} // namespace test
} // namespace route
} // namespace ibcheck

#endif // IBCHECK_ROUTE_UTST_FAKE_ROUTING_SOURCE_HPP
