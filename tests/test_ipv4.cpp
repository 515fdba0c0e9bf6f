#include "dmxbridge/net/Ipv4.hpp"
#include "dmxbridge/core/Errors.hpp"
#include "dmxbridge/log/Log.hpp"

#include <cstdint>
#include <string>

using namespace dmxbridge;
using namespace dmxbridge::net;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { dmxbridge::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { dmxbridge::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static void expectBroadcast(const char* address, const char* mask, const std::string& expected) {
    auto result = resolveBroadcast(address, mask);
    ASSERT_TRUE(result.has_value(), std::string("resolve ") + address + "/" + mask);
    if (result) {
        ASSERT_EQ(*result, expected, std::string("broadcast of ") + address + "/" + mask);
    }
}

static void testResolve() {
    expectBroadcast("192.168.1.10", "255.255.255.0", "192.168.1.255");
    expectBroadcast("10.0.0.5", "255.0.0.0", "10.255.255.255");
    expectBroadcast("172.16.33.7", "255.255.240.0", "172.16.47.255");
    expectBroadcast("2.0.0.1", "255.0.0.0", "2.255.255.255");
}

static void testFullRangeMasks() {
    // /32: the address itself. /0: everything.
    expectBroadcast("192.168.1.10", "255.255.255.255", "192.168.1.10");
    expectBroadcast("192.168.1.10", "0.0.0.0", "255.255.255.255");
    // High bit set in both operands must not sign-extend.
    expectBroadcast("255.255.255.254", "255.255.255.254", "255.255.255.255");
    expectBroadcast("128.0.0.0", "128.0.0.0", "255.255.255.255");
}

static void testParse() {
    auto value = parseIpv4("192.168.1.10");
    ASSERT_TRUE(value.has_value(), "parse dotted quad");
    if (value) {
        ASSERT_EQ(*value, 0xC0A8010Au, "most significant octet first");
    }

    auto zero = parseIpv4("0.0.0.0");
    ASSERT_TRUE(zero && *zero == 0u, "all zero");

    auto ones = parseIpv4("255.255.255.255");
    ASSERT_TRUE(ones && *ones == 0xFFFFFFFFu, "all ones");

    auto padded = parseIpv4("010.001.000.009");
    ASSERT_TRUE(padded && *padded == 0x0A010009u, "leading zeros are decimal");
}

static void testParseRejectsMalformed() {
    const char* invalid[] = {
        "",
        "1.2.3",
        "1.2.3.4.5",
        "256.0.0.1",
        "1.2.3.999",
        "1..2.3",
        ".1.2.3",
        "1.2.3.",
        "a.b.c.d",
        "1.2.3.4 ",
        " 1.2.3.4",
        "1.2.3.-4",
        "0001.2.3.4",
        "1.2.3.4/24",
    };
    for (const char* text : invalid) {
        auto value = parseIpv4(text);
        ASSERT_TRUE(!value && value.error() == Errc::InvalidAddress,
                    std::string("expected InvalidAddress for '") + text + "'");
    }

    auto badMask = resolveBroadcast("192.168.1.10", "255.255.255");
    ASSERT_TRUE(!badMask && badMask.error() == Errc::InvalidAddress, "malformed netmask");
    auto badAddress = resolveBroadcast("192.168.1", "255.255.255.0");
    ASSERT_TRUE(!badAddress && badAddress.error() == Errc::InvalidAddress, "malformed address");
}

static void testFormatAndPrefix() {
    ASSERT_EQ(formatIpv4(0xC0A801FFu), std::string("192.168.1.255"), "format");
    ASSERT_EQ(formatIpv4(0u), std::string("0.0.0.0"), "format zero");

    ASSERT_EQ(prefixLength(0xFFFFFF00u), 24, "/24");
    ASSERT_EQ(prefixLength(0xFFFFFFFFu), 32, "/32");
    ASSERT_EQ(prefixLength(0u), 0, "/0");
    ASSERT_EQ(prefixLength(0xFFF00000u), 12, "/12");
}

static void testErrorCategory() {
    const std::error_code ec = make_error_code(Errc::InvalidAddress);
    ASSERT_EQ(std::string(ec.category().name()), std::string("dmxbridge"), "category name");
    ASSERT_TRUE(!ec.message().empty(), "category message");
}

int main() {
    testResolve();
    testFullRangeMasks();
    testParse();
    testParseRejectsMalformed();
    testFormatAndPrefix();
    testErrorCategory();

    if (g_failures) {
        dmxbridge::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    dmxbridge::logInfo("Ipv4 tests passed.\n");
    return 0;
}
