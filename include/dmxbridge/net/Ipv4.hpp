// Ipv4.hpp
// -----------------------------------------------------------------------------
// Dotted-quad parsing/formatting and subnet broadcast derivation.
// All arithmetic is done on std::uint32_t in host order with the most
// significant octet first, so `~mask` never sign-extends.

#pragma once

#include "dmxbridge/core/Expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dmxbridge::net {

/// Strict dotted-quad parse: exactly four decimal octets, each 0..255.
/// Fails with Errc::InvalidAddress.
expected<std::uint32_t> parseIpv4(std::string_view text);

std::string formatIpv4(std::uint32_t value);

/// Highest address of the subnet: (address & mask) | ~mask.
std::uint32_t broadcastOf(std::uint32_t address, std::uint32_t mask) noexcept;

/// resolve("192.168.1.10", "255.255.255.0") == "192.168.1.255".
expected<std::string> resolveBroadcast(std::string_view address, std::string_view netmask);

/// Count of leading one bits in `mask` (24 for 255.255.255.0).
int prefixLength(std::uint32_t mask) noexcept;

} // namespace dmxbridge::net
