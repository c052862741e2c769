/**
 * @file NetlinkRoutingSource.cpp
 * @brief rtnetlink dump requests for addresses, policy rules and routes.
 */

#include "src/route/inc/NetlinkRoutingSource.hpp"

#include <linux/fib_rules.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <net/if.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <functional>

#include <fmt/core.h>

namespace ibcheck {

namespace route {

namespace {

/* ----------------------------- Socket ----------------------------- */

/// Closes a file descriptor on scope exit.
struct FdGuard {
  int fd{-1};
  ~FdGuard() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};

constexpr std::uint32_t DUMP_SEQ = 1;

using MessageFn = std::function<void(const nlmsghdr*)>;

/**
 * Send one NLM_F_DUMP request and feed every reply message to @p onMessage
 * until NLMSG_DONE.
 */
bool netlinkDump(std::uint16_t type, const void* req, std::size_t reqLen,
                 const MessageFn& onMessage, std::string& error) {
  FdGuard sock{::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_ROUTE)};
  if (sock.fd < 0) {
    error = fmt::format("netlink socket: {}", std::strerror(errno));
    return false;
  }

  sockaddr_nl local{};
  local.nl_family = AF_NETLINK;
  if (::bind(sock.fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
    error = fmt::format("netlink bind: {}", std::strerror(errno));
    return false;
  }

  timeval tv{};
  tv.tv_sec = NETLINK_RECV_TIMEOUT.count();
  if (::setsockopt(sock.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    error = fmt::format("netlink SO_RCVTIMEO: {}", std::strerror(errno));
    return false;
  }

  std::vector<char> msg(NLMSG_SPACE(reqLen), 0);
  auto* nlh = reinterpret_cast<nlmsghdr*>(msg.data());
  nlh->nlmsg_len = static_cast<std::uint32_t>(NLMSG_LENGTH(reqLen));
  nlh->nlmsg_type = type;
  nlh->nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
  nlh->nlmsg_seq = DUMP_SEQ;
  std::memcpy(NLMSG_DATA(nlh), req, reqLen);

  sockaddr_nl kernel{};
  kernel.nl_family = AF_NETLINK;
  if (::sendto(sock.fd, msg.data(), nlh->nlmsg_len, 0, reinterpret_cast<sockaddr*>(&kernel),
               sizeof(kernel)) < 0) {
    error = fmt::format("netlink send: {}", std::strerror(errno));
    return false;
  }

  std::vector<char> buf(NETLINK_RECV_BUFFER);
  for (;;) {
    const ssize_t N = ::recv(sock.fd, buf.data(), buf.size(), 0);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = fmt::format("netlink recv: {}", std::strerror(errno));
      return false;
    }
    if (N == 0) {
      error = "netlink socket closed during dump";
      return false;
    }

    unsigned int len = static_cast<unsigned int>(N);
    for (auto* h = reinterpret_cast<nlmsghdr*>(buf.data()); NLMSG_OK(h, len);
         h = NLMSG_NEXT(h, len)) {
      if (h->nlmsg_seq != DUMP_SEQ) {
        continue;
      }
      if (h->nlmsg_type == NLMSG_DONE) {
        return true;
      }
      if (h->nlmsg_type == NLMSG_ERROR) {
        const auto* ERR = reinterpret_cast<const nlmsgerr*>(NLMSG_DATA(h));
        if (ERR->error == 0) {
          continue;
        }
        error = fmt::format("netlink error: {}", std::strerror(-ERR->error));
        return false;
      }
      onMessage(h);
    }
  }
}

/* ----------------------------- Attributes ----------------------------- */

/// Copy an address attribute of @p family into @p out.
bool readAddrAttr(const rtattr* rta, int family, IpAddr& out) noexcept {
  IpAddr addr;
  addr.family = family;
  const std::size_t LEN = addr.length();
  if (RTA_PAYLOAD(rta) < LEN) {
    return false;
  }
  std::memcpy(addr.bytes.data(), RTA_DATA(rta), LEN);
  out = addr;
  return true;
}

std::uint32_t readU32Attr(const rtattr* rta) noexcept {
  std::uint32_t v = 0;
  if (RTA_PAYLOAD(rta) >= sizeof(v)) {
    std::memcpy(&v, RTA_DATA(rta), sizeof(v));
  }
  return v;
}

/// First gateway of an RTA_MULTIPATH nexthop list.
void readMultipath(const rtattr* rta, RouteEntry& route) noexcept {
  int remaining = static_cast<int>(RTA_PAYLOAD(rta));
  const auto* nh = reinterpret_cast<const rtnexthop*>(RTA_DATA(rta));
  while (remaining >= static_cast<int>(sizeof(rtnexthop)) && RTNH_OK(nh, remaining)) {
    int attrLen = static_cast<int>(nh->rtnh_len) - static_cast<int>(sizeof(rtnexthop));
    for (const rtattr* a = RTNH_DATA(nh); RTA_OK(a, attrLen); a = RTA_NEXT(a, attrLen)) {
      if (a->rta_type == RTA_GATEWAY && readAddrAttr(a, FAMILY_V4, route.gateway)) {
        route.hasGateway = true;
        if (route.oif == 0) {
          route.oif = nh->rtnh_ifindex;
        }
        return;
      }
    }
    remaining -= static_cast<int>(RTNH_ALIGN(nh->rtnh_len));
    nh = RTNH_NEXT(nh);
  }
}

} // namespace

/* ----------------------------- NetlinkRoutingSource ----------------------------- */

bool NetlinkRoutingSource::interfaceIndex(const std::string& ifname, int& index,
                                          std::string& error) {
  const unsigned int IDX = ::if_nametoindex(ifname.c_str());
  if (IDX == 0) {
    error = fmt::format("interface '{}' not found: {}", ifname, std::strerror(errno));
    return false;
  }
  index = static_cast<int>(IDX);
  return true;
}

bool NetlinkRoutingSource::addresses(const std::string& ifname, int family,
                                     std::vector<InterfaceAddress>& out, std::string& error) {
  int index = 0;
  if (!interfaceIndex(ifname, index, error)) {
    return false;
  }

  ifaddrmsg req{};
  req.ifa_family = static_cast<unsigned char>(family);

  return netlinkDump(
      RTM_GETADDR, &req, sizeof(req),
      [&out, index, family](const nlmsghdr* h) {
        if (h->nlmsg_type != RTM_NEWADDR) {
          return;
        }
        const auto* IFA = reinterpret_cast<const ifaddrmsg*>(NLMSG_DATA(h));
        if (static_cast<int>(IFA->ifa_index) != index || IFA->ifa_family != family) {
          return;
        }

        InterfaceAddress entry;
        entry.prefixLen = IFA->ifa_prefixlen;
        entry.scope = IFA->ifa_scope;
        bool haveLocal = false;
        bool haveAddress = false;
        IpAddr local;
        IpAddr address;

        int len = static_cast<int>(IFA_PAYLOAD(h));
        for (const rtattr* rta = IFA_RTA(IFA); RTA_OK(rta, len); rta = RTA_NEXT(rta, len)) {
          if (rta->rta_type == IFA_LOCAL) {
            haveLocal = readAddrAttr(rta, family, local);
          } else if (rta->rta_type == IFA_ADDRESS) {
            haveAddress = readAddrAttr(rta, family, address);
          }
        }
        // IFA_ADDRESS is the peer on point-to-point links; IFA_LOCAL is ours.
        if (haveLocal) {
          entry.addr = local;
        } else if (haveAddress) {
          entry.addr = address;
        } else {
          return;
        }
        out.push_back(entry);
      },
      error);
}

bool NetlinkRoutingSource::rules(int family, std::vector<RoutingRule>& out, std::string& error) {
  fib_rule_hdr req{};
  req.family = static_cast<std::uint8_t>(family);

  return netlinkDump(
      RTM_GETRULE, &req, sizeof(req),
      [&out, family](const nlmsghdr* h) {
        if (h->nlmsg_type != RTM_NEWRULE) {
          return;
        }
        const auto* HDR = reinterpret_cast<const fib_rule_hdr*>(NLMSG_DATA(h));
        if (HDR->action != FR_ACT_TO_TBL || HDR->family != family) {
          return;
        }

        RoutingRule rule;
        rule.table = HDR->table;
        rule.srcLen = HDR->src_len;

        const auto* first = reinterpret_cast<const rtattr*>(
            reinterpret_cast<const char*>(HDR) + NLMSG_ALIGN(sizeof(fib_rule_hdr)));
        int len = static_cast<int>(h->nlmsg_len - NLMSG_LENGTH(sizeof(fib_rule_hdr)));
        for (const rtattr* rta = first; RTA_OK(rta, len); rta = RTA_NEXT(rta, len)) {
          switch (rta->rta_type) {
          case FRA_SRC:
            rule.hasSrc = readAddrAttr(rta, family, rule.src);
            break;
          case FRA_PRIORITY:
            rule.priority = readU32Attr(rta);
            break;
          case FRA_TABLE:
            rule.table = readU32Attr(rta);
            break;
          default:
            break;
          }
        }
        out.push_back(rule);
      },
      error);
}

bool NetlinkRoutingSource::allRoutes(std::vector<RouteEntry>& out, std::string& error) {
  rtmsg req{};
  req.rtm_family = AF_INET;

  return netlinkDump(
      RTM_GETROUTE, &req, sizeof(req),
      [&out](const nlmsghdr* h) {
        if (h->nlmsg_type != RTM_NEWROUTE) {
          return;
        }
        const auto* RTM = reinterpret_cast<const rtmsg*>(NLMSG_DATA(h));
        if (RTM->rtm_family != AF_INET || RTM->rtm_type != RTN_UNICAST) {
          return;
        }

        RouteEntry route;
        route.table = RTM->rtm_table;
        route.dstLen = RTM->rtm_dst_len;

        int len = static_cast<int>(RTM_PAYLOAD(h));
        for (const rtattr* rta = RTM_RTA(RTM); RTA_OK(rta, len); rta = RTA_NEXT(rta, len)) {
          switch (rta->rta_type) {
          case RTA_DST:
            route.hasDst = readAddrAttr(rta, FAMILY_V4, route.dst);
            break;
          case RTA_GATEWAY:
            route.hasGateway = readAddrAttr(rta, FAMILY_V4, route.gateway);
            break;
          case RTA_OIF:
            route.oif = static_cast<int>(readU32Attr(rta));
            break;
          case RTA_TABLE:
            route.table = readU32Attr(rta);
            break;
          case RTA_MULTIPATH:
            if (!route.hasGateway) {
              readMultipath(rta, route);
            }
            break;
          default:
            break;
          }
        }
        out.push_back(route);
      },
      error);
}

bool NetlinkRoutingSource::routesInTable(std::uint32_t table, std::vector<RouteEntry>& out,
                                         std::string& error) {
  std::vector<RouteEntry> all;
  if (!allRoutes(all, error)) {
    return false;
  }
  for (const RouteEntry& r : all) {
    if (r.table == table) {
      out.push_back(r);
    }
  }
  return true;
}

bool NetlinkRoutingSource::routesOnInterface(const std::string& ifname,
                                             std::vector<RouteEntry>& out, std::string& error) {
  int index = 0;
  if (!interfaceIndex(ifname, index, error)) {
    return false;
  }
  std::vector<RouteEntry> all;
  if (!allRoutes(all, error)) {
    return false;
  }
  for (const RouteEntry& r : all) {
    if (r.table == TABLE_MAIN && r.oif == index) {
      out.push_back(r);
    }
  }
  return true;
}

} // namespace route

} // namespace ibcheck
