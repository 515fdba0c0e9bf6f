#include "dmxbridge/net/Ipv4.hpp"
#include "dmxbridge/core/Errors.hpp"

#include <cctype>

namespace dmxbridge::net {

namespace {
constexpr int OCTET_COUNT = 4;
constexpr int OCTET_MAX_DIGITS = 3;
} // namespace

expected<std::uint32_t> parseIpv4(std::string_view text) {
    std::uint32_t value = 0;
    int octets = 0;
    std::size_t pos = 0;

    while (true) {
        unsigned octet = 0;
        int digits = 0;
        while (pos < text.size() && text[pos] != '.') {
            const auto c = static_cast<unsigned char>(text[pos]);
            if (!std::isdigit(c) || digits == OCTET_MAX_DIGITS) {
                return unexpected(make_error_code(Errc::InvalidAddress));
            }
            octet = octet * 10 + (c - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0 || octet > 255 || octets == OCTET_COUNT) {
            return unexpected(make_error_code(Errc::InvalidAddress));
        }
        value = (value << 8) | octet;
        ++octets;

        if (pos == text.size()) {
            break;
        }
        ++pos; // skip '.'
        if (pos == text.size()) {
            return unexpected(make_error_code(Errc::InvalidAddress)); // trailing dot
        }
    }

    if (octets != OCTET_COUNT) {
        return unexpected(make_error_code(Errc::InvalidAddress));
    }
    return value;
}

std::string formatIpv4(std::uint32_t value) {
    std::string out;
    out.reserve(15);
    for (int shift = 24; shift >= 0; shift -= 8) {
        out += std::to_string((value >> shift) & 0xFFu);
        if (shift) out += '.';
    }
    return out;
}

std::uint32_t broadcastOf(std::uint32_t address, std::uint32_t mask) noexcept {
    const std::uint32_t network = address & mask;
    return network | (~mask & 0xFFFFFFFFu);
}

expected<std::string> resolveBroadcast(std::string_view address, std::string_view netmask) {
    auto ip = parseIpv4(address);
    if (!ip) {
        return unexpected(ip.error());
    }
    auto mask = parseIpv4(netmask);
    if (!mask) {
        return unexpected(mask.error());
    }
    return formatIpv4(broadcastOf(*ip, *mask));
}

int prefixLength(std::uint32_t mask) noexcept {
    int bits = 0;
    while (bits < 32 && (mask & (0x80000000u >> bits))) {
        ++bits;
    }
    return bits;
}

} // namespace dmxbridge::net
