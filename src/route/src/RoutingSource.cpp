/**
 * @file RoutingSource.cpp
 * @brief Address helpers shared by routing sources.
 */

#include "src/route/inc/RoutingSource.hpp"

#include <arpa/inet.h>

#include <string>

namespace ibcheck {

namespace route {

/* ----------------------------- IpAddr ----------------------------- */

std::string IpAddr::toString() const {
  char buf[INET6_ADDRSTRLEN] = {};
  const int AF = family == FAMILY_V6 ? AF_INET6 : AF_INET;
  if (::inet_ntop(AF, bytes.data(), buf, sizeof(buf)) == nullptr) {
    return {};
  }
  return buf;
}

bool IpAddr::parse(std::string_view text, IpAddr& out) {
  const std::string S(text);
  IpAddr addr;
  if (::inet_pton(AF_INET, S.c_str(), addr.bytes.data()) == 1) {
    addr.family = FAMILY_V4;
    out = addr;
    return true;
  }
  if (::inet_pton(AF_INET6, S.c_str(), addr.bytes.data()) == 1) {
    addr.family = FAMILY_V6;
    out = addr;
    return true;
  }
  return false;
}

bool prefixContains(const IpAddr& net, int prefixLen, const IpAddr& addr) noexcept {
  if (net.family != addr.family) {
    return false;
  }
  const int MAX_BITS = static_cast<int>(net.length()) * 8;
  if (prefixLen < 0 || prefixLen > MAX_BITS) {
    return false;
  }
  const int FULL = prefixLen / 8;
  for (int i = 0; i < FULL; ++i) {
    if (net.bytes[i] != addr.bytes[i]) {
      return false;
    }
  }
  const int REM = prefixLen % 8;
  if (REM != 0) {
    const std::uint8_t MASK = static_cast<std::uint8_t>(0xFFU << (8 - REM));
    if ((net.bytes[FULL] & MASK) != (addr.bytes[FULL] & MASK)) {
      return false;
    }
  }
  return true;
}

/* ----------------------------- RoutingRule ----------------------------- */

bool RoutingRule::matchesSource(const IpAddr& source) const noexcept {
  if (!hasSrc) {
    return true;
  }
  if (src == source) {
    return true;
  }
  return prefixContains(src, srcLen, source);
}

} // namespace route

} // namespace ibcheck
