#ifndef IBCHECK_ROUTE_ROUTING_SOURCE_HPP
#define IBCHECK_ROUTE_ROUTING_SOURCE_HPP
/**
 * @file RoutingSource.hpp
 * @brief Kernel routing state needed for gateway resolution: interface
 *        addresses, policy rules and routes.
 *
 * The resolver only talks to RoutingSource. NetlinkRoutingSource reads the
 * live kernel tables; tests supply fixed tables.
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ibcheck {
namespace route {

/* ----------------------------- Constants ----------------------------- */

/// Address families (values match AF_INET / AF_INET6).
inline constexpr int FAMILY_V4 = 2;
inline constexpr int FAMILY_V6 = 10;

/// Kernel main routing table.
inline constexpr std::uint32_t TABLE_MAIN = 254;

/// Address scope values (match RT_SCOPE_*).
inline constexpr std::uint8_t SCOPE_UNIVERSE = 0;
inline constexpr std::uint8_t SCOPE_LINK = 253;
inline constexpr std::uint8_t SCOPE_HOST = 254;

/* ----------------------------- IpAddr ----------------------------- */

/**
 * @brief IPv4 or IPv6 address in network byte order.
 *
 * IPv4 uses the first 4 bytes of @c bytes.
 */
struct IpAddr {
  int family{FAMILY_V4};
  std::array<std::uint8_t, 16> bytes{};

  [[nodiscard]] std::size_t length() const noexcept { return family == FAMILY_V6 ? 16 : 4; }

  /// Dotted or colon notation ("10.0.0.1", "fe80::1").
  [[nodiscard]] std::string toString() const;

  /// Parse @p text as IPv4 or IPv6.
  [[nodiscard]] static bool parse(std::string_view text, IpAddr& out);

  bool operator==(const IpAddr& other) const noexcept {
    return family == other.family && bytes == other.bytes;
  }
};

/**
 * @brief True if @p addr lies inside @p net / @p prefixLen.
 * @note Different families never match. A prefix of 0 matches everything.
 */
[[nodiscard]] bool prefixContains(const IpAddr& net, int prefixLen, const IpAddr& addr) noexcept;

/* ----------------------------- Tables ----------------------------- */

/// Address assigned to an interface.
struct InterfaceAddress {
  IpAddr addr;
  int prefixLen{0};
  std::uint8_t scope{SCOPE_UNIVERSE};
};

/// Policy routing rule that selects a table.
struct RoutingRule {
  std::uint32_t priority{0};
  std::uint32_t table{0};
  bool hasSrc{false}; ///< False for "from all"
  IpAddr src{};
  int srcLen{0};

  /// True if the rule's source selector matches @p source.
  [[nodiscard]] bool matchesSource(const IpAddr& source) const noexcept;
};

/// Unicast route.
struct RouteEntry {
  bool hasDst{false}; ///< False for the default route
  IpAddr dst{};
  int dstLen{0};
  bool hasGateway{false};
  IpAddr gateway{};
  std::uint32_t table{TABLE_MAIN};
  int oif{0}; ///< Output interface index, 0 if unknown

  [[nodiscard]] bool isDefault() const noexcept { return !hasDst || dstLen == 0; }
};

/* ----------------------------- RoutingSource ----------------------------- */

/**
 * @brief Read access to the kernel's addresses, rules and routes.
 *
 * Every call returns false with @p error set when the table cannot be read.
 */
class RoutingSource {
public:
  virtual ~RoutingSource() = default;

  /// Addresses of @p family assigned to @p ifname.
  [[nodiscard]] virtual bool addresses(const std::string& ifname, int family,
                                       std::vector<InterfaceAddress>& out,
                                       std::string& error) = 0;

  /// Policy rules of @p family that look up a table, in kernel order.
  [[nodiscard]] virtual bool rules(int family, std::vector<RoutingRule>& out,
                                   std::string& error) = 0;

  /// IPv4 unicast routes of table @p table.
  [[nodiscard]] virtual bool routesInTable(std::uint32_t table, std::vector<RouteEntry>& out,
                                           std::string& error) = 0;

  /// IPv4 unicast routes of the main table leaving through @p ifname.
  [[nodiscard]] virtual bool routesOnInterface(const std::string& ifname,
                                               std::vector<RouteEntry>& out,
                                               std::string& error) = 0;

  /// Kernel index of @p ifname.
  [[nodiscard]] virtual bool interfaceIndex(const std::string& ifname, int& index,
                                            std::string& error) = 0;
};

} // namespace route
} // namespace ibcheck

#endif // IBCHECK_ROUTE_ROUTING_SOURCE_HPP
