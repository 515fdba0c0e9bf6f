#pragma once

#include "dmxbridge/artnet/ArtNetPacket.hpp"
#include "dmxbridge/bridge/Channel.hpp"
#include "dmxbridge/bridge/ControlMessage.hpp"
#include "dmxbridge/bridge/DatagramSender.hpp"
#include "dmxbridge/core/Expected.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dmxbridge::bridge {

class ChannelRegistry;
class OutputSet;

/// What one forward did. Returned for diagnostics and tests.
struct ForwardReport {
    bool channelLive = true;             ///< false: the source channel was already gone, nothing sent
    std::size_t frameSize = 0;
    std::vector<std::string> outputs;    ///< names of the outputs attempted, in set order
    std::size_t failures = 0;            ///< outputs whose send failed or timed out
};

/**
 * @brief Turns peer control messages into Art-Net broadcasts.
 *
 * For each message: parse JSON, encode an ArtDmx frame (one sequence tick),
 * then send the same frame to the broadcast address of every output in one
 * OutputSet snapshot. A failed output is logged and the rest are still tried.
 * Nothing is retried and nothing is queued.
 *
 * Must not be driven from the NetService I/O thread (sends block on it).
 */
class ForwardingPipeline {
public:
    struct Stats {
        std::uint64_t framesForwarded = 0;
        std::uint64_t messagesDropped = 0;
        std::uint64_t sendFailures = 0;
    };

    ForwardingPipeline(ChannelRegistry& registry,
                       OutputSet& outputs,
                       artnet::SequenceCounter& sequence,
                       DatagramSender& sender,
                       std::uint16_t port);

    /**
     * Forward one raw message from `channelId`.
     * A channel that is no longer registered yields an empty report, not an
     * error. Parse failures return Errc::MalformedPayload, encode failures
     * Errc::EncodingError.
     */
    expected<ForwardReport> onMessage(ChannelId channelId, const std::string& rawMessage);

    /// Encode and fan out an already parsed payload.
    expected<ForwardReport> forward(const ControlPayload& payload);

    /// Subscribe to `registry` so every channel message is forwarded; errors are logged and dropped.
    void attach();

    Stats stats() const;

private:
    ChannelRegistry& registry_;
    OutputSet& outputs_;
    artnet::SequenceCounter& sequence_;
    DatagramSender& sender_;
    const std::uint16_t port_;

    std::atomic<std::uint64_t> framesForwarded_{0};
    std::atomic<std::uint64_t> messagesDropped_{0};
    std::atomic<std::uint64_t> sendFailures_{0};
};

} // namespace dmxbridge::bridge
