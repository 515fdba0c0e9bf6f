/**
 * @brief Wires the bridge components together and owns the shared socket.
 */
#include "dmxbridge/bridge/Bridge.hpp"
#include "dmxbridge/bridge/ControlMessage.hpp"
#include "dmxbridge/log/Log.hpp"

#include <utility>

namespace dmxbridge::bridge {

Bridge::Bridge(BridgeConfig config, std::shared_ptr<net::asio::io_context> io)
: config_(config)
, io_(std::move(io))
, socket_(io_)
, sender_(socket_, config_.sendTimeout)
, pipeline_(registry_, outputs_, sequence_, sender_, config_.artnetPort)
{
    pipeline_.attach();
}

Bridge::~Bridge() {
    close();
}

expected<void> Bridge::open() {
    if (socket_.is_open()) {
        return {};
    }

    if (auto ec = socket_.open_v4()) {
        logError("[Bridge] cannot open UDP socket: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (auto ec = socket_.reuse_address()) {
        logError("[Bridge] SO_REUSEADDR failed: ", ec.message(), "\n");
        socket_.close();
        return unexpected(ec);
    }
    if (auto ec = socket_.bind_any(config_.artnetPort)) {
        logError("[Bridge] cannot bind UDP port ", config_.artnetPort, ": ", ec.message(), "\n");
        socket_.close();
        return unexpected(ec);
    }
    if (auto ec = socket_.enable_broadcast()) {
        logError("[Bridge] cannot enable broadcast: ", ec.message(), "\n");
        socket_.close();
        return unexpected(ec);
    }

    logInfo("[Bridge] forwarding ArtDmx on UDP port ", localPort(), "\n");

    if (config_.relayInbound) {
        socket_.startReceiving([this](const std::uint8_t* data, std::size_t size,
                                      const net::udp::endpoint& from) {
            relayInbound(data, size, from);
        });
        logInfo("[Bridge] relaying inbound ArtDmx to data channels\n");
    }
    return {};
}

void Bridge::close() {
    registry_.detachAll();
    if (!socket_.is_open()) {
        return;
    }
    socket_.stopReceiving();
    socket_.close();
    logInfo("[Bridge] closed\n");
}

std::shared_ptr<Channel> Bridge::attachChannel(std::shared_ptr<DataChannelHandle> handle) {
    return registry_.registerChannel(std::move(handle));
}

expected<void> Bridge::setOutputs(const std::vector<OutputSpec>& specs) {
    return outputs_.replace(specs);
}

std::uint16_t Bridge::localPort() const {
    return socket_.local_endpoint().port();
}

void Bridge::relayInbound(const std::uint8_t* data, std::size_t size, const net::udp::endpoint& from) {
    if (artnet::peekOpCode(data, size) != static_cast<std::uint16_t>(artnet::OpCode::Dmx)) {
        return; // polls, syncs and other traffic are not channel data
    }

    auto frame = artnet::decode(data, size);
    if (!frame) {
        logError("[Bridge] undecodable datagram from ", from.address().to_string(), ": ",
                 frame.error().message(), "\n");
        return;
    }
    if (!artnet::hasArtNetId(data, size)) {
        logDebug("[Bridge] ArtDmx from ", from.address().to_string(), " without Art-Net id\n");
    }

    ControlPayload payload;
    payload.universe = frame->universe;
    payload.channelValues = std::move(frame->data);

    const auto delivered = registry_.broadcast(serializeControlMessage(payload));
    if (delivered > 0) {
        ++inboundRelayed_;
    }
}

} // namespace dmxbridge::bridge
