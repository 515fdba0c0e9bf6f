#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace dmxbridge::artnet::config {

/**
 * @brief Constants that define the Art-Net wire layout used by the bridge.
 *
 * Keeping the values here prevents magic numbers from drifting between the
 * encoder, the decoder and the tests.
 */

// Networking ------------------------------------------------------------------
constexpr std::uint16_t ARTNET_PORT_DEFAULT = 6454;

// Header ----------------------------------------------------------------------
constexpr std::array<std::uint8_t, 8> ARTNET_ID = {'A', 'r', 't', '-', 'N', 'e', 't', 0x00};
constexpr std::uint8_t ARTNET_PROTOCOL_VERSION_HI = 0;
constexpr std::uint8_t ARTNET_PROTOCOL_VERSION_LO = 14;
constexpr std::uint8_t ARTNET_PHYSICAL_PORT = 0;

// ArtDmx field offsets
constexpr std::size_t ARTNET_OPCODE_OFFSET = 8;
constexpr std::size_t ARTNET_SEQUENCE_OFFSET = 12;
constexpr std::size_t ARTNET_UNIVERSE_LOW_OFFSET = 14;   // SubUni
constexpr std::size_t ARTNET_UNIVERSE_HI_OFFSET = 15;    // Net
constexpr std::size_t ARTNET_LENGTH_OFFSET = 16;
constexpr std::size_t ARTNET_DATA_OFFSET = 18;
constexpr std::size_t ARTNET_HEADER_SIZE = ARTNET_DATA_OFFSET;

// Limits ----------------------------------------------------------------------
constexpr std::size_t DMX_UNIVERSE_SIZE = 512;
constexpr std::uint32_t ARTNET_UNIVERSE_MAX = 0x7FFF;   // 15-bit port address
constexpr std::uint32_t ARTNET_OPCODE_MAX = 0xFFFF;
constexpr std::uint32_t ARTNET_SEQUENCE_MODULO = 255;

} // namespace dmxbridge::artnet::config
