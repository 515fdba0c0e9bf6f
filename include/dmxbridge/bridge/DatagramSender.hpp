#pragma once

#include "dmxbridge/net/UdpSocket.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace dmxbridge::bridge {

using Frame = net::UdpSocket::Frame;

/**
 * @brief Where forwarded frames go: one datagram per call.
 *
 * Implementations must accept concurrent calls; each call carries one complete
 * frame, so there is nothing to interleave.
 */
class DatagramSender {
public:
    virtual ~DatagramSender() = default;

    virtual std::error_code sendTo(const Frame& frame,
                                   std::uint32_t address,
                                   std::uint16_t port) = 0;
};

/**
 * @brief DatagramSender backed by the bridge's shared UdpSocket.
 *
 * Each send is bounded by the process default deadline (TimeoutConfig) unless
 * a timeout is given explicitly. A missed deadline is returned, never retried.
 */
class UdpDatagramSender : public DatagramSender {
public:
    explicit UdpDatagramSender(net::UdpSocket& socket,
                               std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    std::error_code sendTo(const Frame& frame,
                           std::uint32_t address,
                           std::uint16_t port) override;

    /// Deadline for the next send: the explicit timeout, else the process default.
    std::chrono::milliseconds timeout() const;

private:
    net::UdpSocket& socket_;
    std::chrono::milliseconds timeout_;
};

} // namespace dmxbridge::bridge
