#ifndef IBCHECK_ROUTE_NETLINK_ROUTING_SOURCE_HPP
#define IBCHECK_ROUTE_NETLINK_ROUTING_SOURCE_HPP
/**
 * @file NetlinkRoutingSource.hpp
 * @brief RoutingSource over a NETLINK_ROUTE socket.
 * @note Linux-only. Each call opens a socket, performs one dump request
 *       (RTM_GETADDR, RTM_GETRULE or RTM_GETROUTE) and closes it.
 * @note NOT RT-safe: Socket I/O and allocation.
 */

#include "src/route/inc/RoutingSource.hpp"

#include <chrono>

namespace ibcheck {
namespace route {

/* ----------------------------- Constants ----------------------------- */

/// Receive timeout for one dump.
inline constexpr std::chrono::seconds NETLINK_RECV_TIMEOUT{2};

/// Receive buffer for one batch of netlink messages.
inline constexpr std::size_t NETLINK_RECV_BUFFER = 32 * 1024;

/* ----------------------------- NetlinkRoutingSource ----------------------------- */

class NetlinkRoutingSource final : public RoutingSource {
public:
  [[nodiscard]] bool addresses(const std::string& ifname, int family,
                               std::vector<InterfaceAddress>& out, std::string& error) override;

  [[nodiscard]] bool rules(int family, std::vector<RoutingRule>& out,
                           std::string& error) override;

  [[nodiscard]] bool routesInTable(std::uint32_t table, std::vector<RouteEntry>& out,
                                   std::string& error) override;

  [[nodiscard]] bool routesOnInterface(const std::string& ifname, std::vector<RouteEntry>& out,
                                       std::string& error) override;

  [[nodiscard]] bool interfaceIndex(const std::string& ifname, int& index,
                                    std::string& error) override;

private:
  /// All IPv4 unicast routes across tables.
  [[nodiscard]] bool allRoutes(std::vector<RouteEntry>& out, std::string& error);
};

} // namespace route
} // namespace ibcheck

#endif // IBCHECK_ROUTE_NETLINK_ROUTING_SOURCE_HPP
