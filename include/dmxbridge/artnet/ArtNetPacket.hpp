// ArtNetPacket.hpp
// -----------------------------------------------------------------------------
// Encoding and decoding of Art-Net streaming frames.
// Responsibilities:
//   * Expose the Art-Net opcode table.
//   * Serialise (opcode, universe, channel values) into the 18-byte header
//     layout plus payload, stamping a sequence byte from a caller-owned counter.
//   * Read universe and payload back out of a received frame.
// Decoding reads fixed offsets only; the identifier and opcode are not checked.

#pragma once

#include "dmxbridge/core/Expected.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dmxbridge::artnet {

enum class OpCode : std::uint16_t {
    // Device discovery
    Poll          = 0x2000,
    PollReply     = 0x2100,
    // Device configuration
    Address       = 0x6000,
    Input         = 0x7000,
    IpProg        = 0xF800,
    IpProgReply   = 0xF900,
    Command       = 0x2400,
    // Streaming control
    Dmx           = 0x5000,
    Nzs           = 0x5100,
    Sync          = 0x5200,
    // RDM
    TodRequest    = 0x8000,
    TodData       = 0x8100,
    TodControl    = 0x8200,
    Rdm           = 0x8300,
    RdmSub        = 0x8400,
    // Time keeping
    TimeCode      = 0x9700,
    TimeSync      = 0x9800,
    // Triggering
    Trigger       = 0x9900,
    // Diagnostics
    DiagData      = 0x2300
};

/**
 * @brief Process-scoped Art-Net sequence source.
 *
 * Every frame construction takes exactly one tick; the n-th tick yields
 * `n % 255`. Safe to share between threads: concurrent callers never obtain
 * the same tick.
 */
class SequenceCounter {
public:
    std::uint8_t next() noexcept;

    /// Number of ticks handed out so far.
    std::uint64_t issued() const noexcept { return ticks.load(std::memory_order_relaxed); }

private:
    std::atomic<std::uint64_t> ticks{0};
};

/// Universe and channel values recovered from a frame.
struct DmxFrame {
    std::uint16_t universe = 0;
    std::vector<std::uint8_t> data;
};

using WireFrame = std::vector<std::uint8_t>;

/**
 * @brief Build one Art-Net frame.
 *
 * Fails with Errc::EncodingError when `universe` exceeds 15 bits, `opcode`
 * exceeds 16 bits or `size` exceeds 512. No sequence tick is consumed on
 * failure.
 */
expected<WireFrame> encode(SequenceCounter& sequence,
                           std::uint32_t opcode,
                           std::uint32_t universe,
                           const std::uint8_t* data,
                           std::size_t size);

expected<WireFrame> encode(SequenceCounter& sequence,
                           std::uint32_t opcode,
                           std::uint32_t universe,
                           const std::vector<std::uint8_t>& data);

/// `encode` with OpCode::Dmx.
expected<WireFrame> encodeDmx(SequenceCounter& sequence,
                              std::uint32_t universe,
                              const std::vector<std::uint8_t>& data);

/**
 * @brief Read universe (offsets 14/15, low byte first) and payload (offset 18
 * to end). Fails with Errc::DecodingError when `size` < 18.
 */
expected<DmxFrame> decode(const std::uint8_t* frame, std::size_t size);

expected<DmxFrame> decode(const std::vector<std::uint8_t>& frame);

/// True when the frame starts with "Art-Net\0". Diagnostic only.
bool hasArtNetId(const std::uint8_t* frame, std::size_t size) noexcept;

/// Opcode field of a frame (lo byte first), or 0 if too short.
std::uint16_t peekOpCode(const std::uint8_t* frame, std::size_t size) noexcept;

constexpr std::uint8_t lowByte(std::uint32_t value) noexcept {
    return static_cast<std::uint8_t>(value & 0xFFu);
}

constexpr std::uint8_t highByte(std::uint32_t value) noexcept {
    return static_cast<std::uint8_t>((value >> 8) & 0xFFu);
}

} // namespace dmxbridge::artnet
