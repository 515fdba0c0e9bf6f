#include "dmxbridge/bridge/DatagramSender.hpp"
#include "dmxbridge/net/TimeoutConfig.hpp"

namespace dmxbridge::bridge {

namespace asio = net::asio;

UdpDatagramSender::UdpDatagramSender(net::UdpSocket& socket, std::chrono::milliseconds timeout)
: socket_(socket)
, timeout_(timeout)
{}

std::error_code UdpDatagramSender::sendTo(const Frame& frame,
                                          std::uint32_t address,
                                          std::uint16_t port) {
    const net::udp::endpoint endpoint(asio::ip::address_v4(address), port);
    return socket_.send_to(frame, endpoint, timeout());
}

std::chrono::milliseconds UdpDatagramSender::timeout() const {
    return timeout_.count() > 0 ? timeout_ : net::TimeoutConfig::defaultTimeout();
}

} // namespace dmxbridge::bridge
