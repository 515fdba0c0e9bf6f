#include "dmxbridge/net/InterfaceList.hpp"
#include "dmxbridge/net/Ipv4.hpp"

#include <cerrno>
#include <system_error>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace dmxbridge::net {

namespace {
std::uint32_t hostOrder(const sockaddr* sa) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
    return ntohl(in->sin_addr.s_addr);
}
} // namespace

expected<std::vector<InterfaceInfo>> listIpv4Interfaces() {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        return unexpected(std::error_code(errno, std::generic_category()));
    }

    std::vector<InterfaceInfo> out;
    for (auto* iface = list; iface != nullptr; iface = iface->ifa_next) {
        if (!iface->ifa_addr || iface->ifa_addr->sa_family != AF_INET) continue;
        if (!iface->ifa_netmask) continue;
        if (!(iface->ifa_flags & IFF_UP)) continue;

        const auto address = hostOrder(iface->ifa_addr);
        const auto mask = hostOrder(iface->ifa_netmask);

        InterfaceInfo info;
        info.name = iface->ifa_name ? iface->ifa_name : "";
        info.address = formatIpv4(address);
        info.mask = formatIpv4(mask);
        info.cidr = info.address + "/" + std::to_string(prefixLength(mask));
        info.loopback = (iface->ifa_flags & IFF_LOOPBACK) != 0;
        out.push_back(std::move(info));
    }
    ::freeifaddrs(list);
    return out;
}

} // namespace dmxbridge::net
