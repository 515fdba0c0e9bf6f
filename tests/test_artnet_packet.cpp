#include "dmxbridge/artnet/ArtNetPacket.hpp"
#include "dmxbridge/artnet/ArtNetConfig.hpp"
#include "dmxbridge/core/Errors.hpp"
#include "dmxbridge/log/Log.hpp"

#include <array>
#include <cstdint>
#include <thread>
#include <vector>

using namespace dmxbridge;
using namespace dmxbridge::artnet;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { dmxbridge::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { dmxbridge::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static std::vector<std::uint8_t> ramp(std::size_t n) {
    std::vector<std::uint8_t> out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<std::uint8_t>(i * 7);
    return out;
}

static void testEmptyPayloadHeader() {
    SequenceCounter seq;
    auto frame = encodeDmx(seq, 0, {});
    ASSERT_TRUE(frame.has_value(), "empty payload encodes");
    if (!frame) return;

    const std::array<std::uint8_t, 18> expected = {
        'A', 'r', 't', '-', 'N', 'e', 't', 0x00,
        0x00, 0x50,     // OpDmx, lo then hi
        0x00, 0x0E,     // version 14
        0x00,           // sequence
        0x00,           // physical
        0x00, 0x00,     // universe
        0x00, 0x00      // length
    };
    ASSERT_EQ(frame->size(), std::size_t{18}, "empty frame is header only");
    for (std::size_t i = 0; i < expected.size() && i < frame->size(); ++i) {
        ASSERT_EQ((*frame)[i], expected[i], "header byte");
    }
}

static void testFieldLayout() {
    SequenceCounter seq;
    const std::vector<std::uint8_t> data = {1, 2, 3};
    auto frame = encode(seq, static_cast<std::uint32_t>(OpCode::Nzs), 0x1234, data);
    ASSERT_TRUE(frame.has_value(), "encode succeeds");
    if (!frame) return;

    ASSERT_EQ(frame->size(), std::size_t{21}, "18 + payload");
    ASSERT_EQ((*frame)[8], 0x00, "opcode lo");
    ASSERT_EQ((*frame)[9], 0x51, "opcode hi");
    ASSERT_EQ((*frame)[14], 0x34, "universe lo (SubUni)");
    ASSERT_EQ((*frame)[15], 0x12, "universe hi (Net)");
    ASSERT_EQ((*frame)[16], 0x00, "length hi");
    ASSERT_EQ((*frame)[17], 0x03, "length lo");
    ASSERT_EQ((*frame)[18], 1, "data[0]");
    ASSERT_EQ((*frame)[20], 3, "data[2]");
    ASSERT_EQ(peekOpCode(frame->data(), frame->size()), 0x5100, "peek opcode");
    ASSERT_TRUE(hasArtNetId(frame->data(), frame->size()), "identifier present");
}

static void testFullUniverse() {
    SequenceCounter seq;
    auto frame = encodeDmx(seq, config::ARTNET_UNIVERSE_MAX, ramp(512));
    ASSERT_TRUE(frame.has_value(), "512 channels encode");
    if (!frame) return;
    ASSERT_EQ(frame->size(), std::size_t{530}, "18 + 512");
    ASSERT_EQ((*frame)[16], 0x02, "length hi for 512");
    ASSERT_EQ((*frame)[17], 0x00, "length lo for 512");
    ASSERT_EQ((*frame)[15], 0x7F, "max universe hi");
}

static void testEncodeRejectsOutOfRange() {
    SequenceCounter seq;

    auto bigUniverse = encodeDmx(seq, 0x8000, {});
    ASSERT_TRUE(!bigUniverse && bigUniverse.error() == Errc::EncodingError, "universe beyond 15 bits");

    auto bigOpcode = encode(seq, 0x10000, 0, std::vector<std::uint8_t>{});
    ASSERT_TRUE(!bigOpcode && bigOpcode.error() == Errc::EncodingError, "opcode beyond 16 bits");

    auto bigPayload = encodeDmx(seq, 0, ramp(513));
    ASSERT_TRUE(!bigPayload && bigPayload.error() == Errc::EncodingError, "payload beyond 512");

    ASSERT_EQ(seq.issued(), std::uint64_t{0}, "failed encodes take no sequence tick");
}

static void testSequenceCycles() {
    SequenceCounter seq;
    for (int n = 0; n < 700; ++n) {
        auto frame = encodeDmx(seq, 1, {});
        if (!frame) {
            ASSERT_TRUE(false, "encode in sequence loop");
            return;
        }
        ASSERT_EQ((*frame)[config::ARTNET_SEQUENCE_OFFSET], static_cast<std::uint8_t>(n % 255),
                  "sequence(n) == n mod 255");
    }
}

static void testSequenceIsAtomicAcrossThreads() {
    SequenceCounter seq;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 1000;

    std::array<std::vector<std::uint8_t>, kThreads> seen;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            seen[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                auto frame = encodeDmx(seq, 0, {});
                if (frame) seen[t].push_back((*frame)[config::ARTNET_SEQUENCE_OFFSET]);
            }
        });
    }
    for (auto& th : threads) th.join();

    std::array<int, 255> histogram{};
    for (const auto& list : seen) {
        for (auto s : list) {
            ASSERT_TRUE(s < 255, "sequence byte below 255");
            if (s < 255) ++histogram[s];
        }
    }

    // 4000 distinct ticks: values 0..174 appear 16 times, the rest 15 times.
    constexpr int total = kThreads * kPerThread;
    for (int v = 0; v < 255; ++v) {
        const int expected = total / 255 + (v < total % 255 ? 1 : 0);
        ASSERT_EQ(histogram[v], expected, "no tick handed out twice");
    }
    ASSERT_EQ(seq.issued(), std::uint64_t{total}, "every encode took one tick");
}

static void testDecodeRejectsShortFrames() {
    for (std::size_t n = 0; n < 18; ++n) {
        std::vector<std::uint8_t> shortFrame(n, 0xAA);
        auto decoded = decode(shortFrame);
        ASSERT_TRUE(!decoded && decoded.error() == Errc::DecodingError, "frame shorter than 18 bytes");
    }
    auto nullFrame = decode(nullptr, 100);
    ASSERT_TRUE(!nullFrame, "null frame rejected");
}

static void testDecodeIsPermissive() {
    // Wrong identifier and opcode still decode: only offsets matter.
    std::vector<std::uint8_t> frame(18, 0xFF);
    frame[14] = 0x05;
    frame[15] = 0x01;
    frame.push_back(42);

    auto decoded = decode(frame);
    ASSERT_TRUE(decoded.has_value(), "foreign header decodes");
    if (!decoded) return;
    ASSERT_EQ(decoded->universe, 0x0105, "universe lo | hi << 8");
    ASSERT_EQ(decoded->data.size(), std::size_t{1}, "payload is everything after offset 18");
    ASSERT_TRUE(!hasArtNetId(frame.data(), frame.size()), "identifier check reports foreign frame");
}

static void testRoundTrip() {
    SequenceCounter seq;
    const std::uint32_t universes[] = {0, 1, 255, 256, 0x1234, 0x7FFF};
    const std::size_t lengths[] = {0, 1, 2, 511, 512};

    for (auto universe : universes) {
        for (auto length : lengths) {
            const auto payload = ramp(length);
            auto frame = encodeDmx(seq, universe, payload);
            ASSERT_TRUE(frame.has_value(), "round trip encode");
            if (!frame) continue;
            auto decoded = decode(*frame);
            ASSERT_TRUE(decoded.has_value(), "round trip decode");
            if (!decoded) continue;
            ASSERT_EQ(decoded->universe, universe, "universe survives");
            ASSERT_TRUE(decoded->data == payload, "payload survives");
        }
    }
}

static void testByteHelpers() {
    ASSERT_EQ(lowByte(0xABCD), 0xCD, "low byte");
    ASSERT_EQ(highByte(0xABCD), 0xAB, "high byte");
    ASSERT_EQ(highByte(0x12345), 0x23, "high byte masks above 16 bits");
}

int main() {
    testEmptyPayloadHeader();
    testFieldLayout();
    testFullUniverse();
    testEncodeRejectsOutOfRange();
    testSequenceCycles();
    testSequenceIsAtomicAcrossThreads();
    testDecodeRejectsShortFrames();
    testDecodeIsPermissive();
    testRoundTrip();
    testByteHelpers();

    if (g_failures) {
        dmxbridge::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    dmxbridge::logInfo("ArtNetPacket tests passed.\n");
    return 0;
}
