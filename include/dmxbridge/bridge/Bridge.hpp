#pragma once

#include "dmxbridge/artnet/ArtNetPacket.hpp"
#include "dmxbridge/bridge/BridgeConfig.hpp"
#include "dmxbridge/bridge/ChannelRegistry.hpp"
#include "dmxbridge/bridge/DatagramSender.hpp"
#include "dmxbridge/bridge/ForwardingPipeline.hpp"
#include "dmxbridge/bridge/OutputSet.hpp"
#include "dmxbridge/core/Expected.hpp"
#include "dmxbridge/net/NetConfig.hpp"
#include "dmxbridge/net/NetService.hpp"
#include "dmxbridge/net/UdpSocket.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace dmxbridge::bridge {

/**
 * @brief Process-scoped bridge context: everything that used to be ambient state.
 *
 * Owns the sequence counter, the output set, the channel registry, the
 * forwarding pipeline and the one shared UDP socket. Several Bridges can live in
 * one process (tests do this); they share nothing but the I/O thread.
 *
 * Lifecycle:
 * - `open()` binds the socket (broadcast enabled). Its failure is the only
 *   fatal condition and is left to the caller.
 * - Channels are attached by the transport adapter with `attachChannel()`.
 * - `close()` detaches all channels and closes the socket; idempotent, also run
 *   by the destructor.
 */
class Bridge {
public:
    explicit Bridge(BridgeConfig config = {},
                    std::shared_ptr<net::asio::io_context> io = net::shared_io_context());
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    expected<void> open();
    void close();
    bool isOpen() const { return socket_.is_open(); }

    std::shared_ptr<Channel> attachChannel(std::shared_ptr<DataChannelHandle> handle);
    expected<void> setOutputs(const std::vector<OutputSpec>& specs);

    /// Port actually bound (differs from config when configured as 0).
    std::uint16_t localPort() const;

    ChannelRegistry& channels() { return registry_; }
    OutputSet& outputs() { return outputs_; }
    ForwardingPipeline& pipeline() { return pipeline_; }

    /// Inbound frames relayed to channels so far.
    std::uint64_t inboundRelayed() const { return inboundRelayed_.load(); }

private:
    void relayInbound(const std::uint8_t* data, std::size_t size, const net::udp::endpoint& from);

    BridgeConfig config_;
    std::shared_ptr<net::asio::io_context> io_;
    net::UdpSocket socket_;
    UdpDatagramSender sender_;
    artnet::SequenceCounter sequence_;
    OutputSet outputs_;
    ChannelRegistry registry_;
    ForwardingPipeline pipeline_;
    std::atomic<std::uint64_t> inboundRelayed_{0};
};

} // namespace dmxbridge::bridge
