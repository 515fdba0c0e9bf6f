// ArtNetPacket.cpp
// -----------------------------------------------------------------------------
// Byte layout of an ArtDmx-style frame:
//   0..7   "Art-Net\0"
//   8..9   opcode, lo then hi
//   10..11 protocol version, hi then lo
//   12     sequence
//   13     physical port
//   14     universe lo (SubUni)
//   15     universe hi (Net)
//   16..17 data length, hi then lo
//   18..   channel values

#include "dmxbridge/artnet/ArtNetPacket.hpp"
#include "dmxbridge/artnet/ArtNetConfig.hpp"
#include "dmxbridge/core/ByteBuffer.hpp"
#include "dmxbridge/core/Errors.hpp"

#include <algorithm>

namespace dmxbridge::artnet {

using namespace config;

std::uint8_t SequenceCounter::next() noexcept {
    const auto tick = ticks.fetch_add(1, std::memory_order_relaxed);
    return static_cast<std::uint8_t>(tick % ARTNET_SEQUENCE_MODULO);
}

expected<WireFrame> encode(SequenceCounter& sequence,
                           std::uint32_t opcode,
                           std::uint32_t universe,
                           const std::uint8_t* data,
                           std::size_t size) {
    if (opcode > ARTNET_OPCODE_MAX || universe > ARTNET_UNIVERSE_MAX || size > DMX_UNIVERSE_SIZE) {
        return unexpected(make_error_code(Errc::EncodingError));
    }
    if (size > 0 && !data) {
        return unexpected(make_error_code(Errc::EncodingError));
    }

    core::ByteBuffer buffer(ARTNET_HEADER_SIZE + size);
    buffer.appendBytes(ARTNET_ID.data(), ARTNET_ID.size());
    buffer.appendUInt16LE(static_cast<std::uint16_t>(opcode));
    buffer.appendUInt8(ARTNET_PROTOCOL_VERSION_HI);
    buffer.appendUInt8(ARTNET_PROTOCOL_VERSION_LO);
    buffer.appendUInt8(sequence.next());
    buffer.appendUInt8(ARTNET_PHYSICAL_PORT);
    buffer.appendUInt8(lowByte(universe));
    buffer.appendUInt8(highByte(universe));
    buffer.appendUInt16BE(static_cast<std::uint16_t>(size));
    buffer.appendBytes(data, size);
    return buffer.release();
}

expected<WireFrame> encode(SequenceCounter& sequence,
                           std::uint32_t opcode,
                           std::uint32_t universe,
                           const std::vector<std::uint8_t>& data) {
    return encode(sequence, opcode, universe, data.data(), data.size());
}

expected<WireFrame> encodeDmx(SequenceCounter& sequence,
                              std::uint32_t universe,
                              const std::vector<std::uint8_t>& data) {
    return encode(sequence, static_cast<std::uint32_t>(OpCode::Dmx), universe, data);
}

expected<DmxFrame> decode(const std::uint8_t* frame, std::size_t size) {
    if (!frame || size < ARTNET_HEADER_SIZE) {
        return unexpected(make_error_code(Errc::DecodingError));
    }

    DmxFrame out;
    out.universe = static_cast<std::uint16_t>(
        frame[ARTNET_UNIVERSE_LOW_OFFSET] |
        (static_cast<std::uint16_t>(frame[ARTNET_UNIVERSE_HI_OFFSET]) << 8));
    out.data.assign(frame + ARTNET_DATA_OFFSET, frame + size);
    return out;
}

expected<DmxFrame> decode(const std::vector<std::uint8_t>& frame) {
    return decode(frame.data(), frame.size());
}

bool hasArtNetId(const std::uint8_t* frame, std::size_t size) noexcept {
    if (!frame || size < ARTNET_ID.size()) {
        return false;
    }
    return std::equal(ARTNET_ID.begin(), ARTNET_ID.end(), frame);
}

std::uint16_t peekOpCode(const std::uint8_t* frame, std::size_t size) noexcept {
    if (!frame || size < ARTNET_OPCODE_OFFSET + 2) {
        return 0;
    }
    return static_cast<std::uint16_t>(frame[ARTNET_OPCODE_OFFSET] |
        (static_cast<std::uint16_t>(frame[ARTNET_OPCODE_OFFSET + 1]) << 8));
}

} // namespace dmxbridge::artnet
