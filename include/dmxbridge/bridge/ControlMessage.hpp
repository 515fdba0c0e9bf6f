#pragma once

#include "dmxbridge/core/Expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dmxbridge::bridge {

/// Channel levels for one universe, as carried in a peer control message.
struct ControlPayload {
    std::uint32_t universe = 0;
    std::vector<std::uint8_t> channelValues;
};

/**
 * @brief JSON form of a ControlPayload.
 *
 *   {"universe": 1, "DMX512Buffer": [255, 0, 127]}
 *
 * `channelValues` is accepted in place of `DMX512Buffer`. Parsing checks shape
 * only (non-negative integer universe, array of 0..255 integers); range limits
 * of the wire format are enforced by the encoder.
 */
expected<ControlPayload> parseControlMessage(std::string_view text);

std::string serializeControlMessage(const ControlPayload& payload);

} // namespace dmxbridge::bridge
