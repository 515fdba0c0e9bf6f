#pragma once

#include "dmxbridge/artnet/ArtNetConfig.hpp"

#include <chrono>
#include <cstdint>

namespace dmxbridge::bridge {

namespace config {
constexpr std::chrono::milliseconds SEND_TIMEOUT_DEFAULT{1000};
} // namespace config

/**
 * @brief Runtime settings for one Bridge instance.
 *
 * Defaults match the stock Art-Net setup; the CLI overrides them from options.
 */
struct BridgeConfig {
    /// Port the shared socket binds to and the destination port of every output.
    std::uint16_t artnetPort = artnet::config::ARTNET_PORT_DEFAULT;

    /// Deadline for one datagram send; a miss is logged as an error.
    std::chrono::milliseconds sendTimeout = config::SEND_TIMEOUT_DEFAULT;

    /// Decode incoming Art-Net datagrams and relay them to open channels.
    /// Off by default: the socket also receives the bridge's own broadcasts.
    bool relayInbound = false;
};

} // namespace dmxbridge::bridge
