#pragma once

#include "dmxbridge/core/Expected.hpp"

#include <string>
#include <vector>

namespace dmxbridge::net {

/// One IPv4 address bound to a host interface.
struct InterfaceInfo {
    std::string name;     // e.g. "eth0"
    std::string address;  // dotted quad
    std::string mask;     // dotted quad
    std::string cidr;     // "192.168.1.10/24"
    bool loopback = false;
};

/**
 * @brief Enumerate the host's IPv4 interface addresses via getifaddrs(3).
 *
 * Interfaces that are down are skipped. An interface with several IPv4
 * addresses yields one entry per address.
 */
expected<std::vector<InterfaceInfo>> listIpv4Interfaces();

} // namespace dmxbridge::net
