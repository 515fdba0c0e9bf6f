#pragma once
#include "dmxbridge/net/NetConfig.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace dmxbridge::net {

using milliseconds = std::chrono::milliseconds;

/**
 * UdpSocket
 *
 * The one datagram socket the bridge owns: outbound Art-Net broadcasts and the
 * optional inbound receive loop both run through it.
 *
 * - Every socket operation after setup is serialised on a strand, so any number
 *   of forwarding threads may call `send_to` concurrently.
 * - `send_to` / `recv_from` block the caller with a deadline (see
 *   `with_deadline`); the owning `io_context` must be running on another thread.
 * - Socket state lives in a shared block captured by every completion handler,
 *   so destroying the `UdpSocket` while operations are pending is safe.
 */
class UdpSocket {
public:
    using Frame = std::shared_ptr<const std::vector<std::uint8_t>>;
    using ReceiveHandler = std::function<void(const std::uint8_t* data,
                                              std::size_t size,
                                              const udp::endpoint& from)>;

    /// Largest datagram the receive paths accept (one Ethernet MTU).
    static constexpr std::size_t MAX_DATAGRAM = 1500;

    explicit UdpSocket(std::shared_ptr<asio::io_context> io);
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Setup helpers: call before the socket is shared between threads.
    error_code open_v4();
    error_code reuse_address(bool on = true);
    error_code bind_any(std::uint16_t port);
    error_code bind(const asio::ip::address_v4& address, std::uint16_t port);
    error_code enable_broadcast(bool on = true);

    // Send one datagram, fail if not sent within timeout.
    error_code send_to(const Frame& frame, const udp::endpoint& ep, milliseconds timeout);

    // Receive one datagram, with timeout. Fills `out` and `out_ep` on success.
    error_code recv_from(std::vector<std::uint8_t>& out, udp::endpoint& out_ep,
                         milliseconds timeout);

    /**
     * Start a continuous receive loop that hands every datagram to `handler` on
     * the I/O thread. Timeouts of other operations on this socket do not touch
     * it; the loop ends on `stopReceiving()` or `close()`.
     */
    void startReceiving(ReceiveHandler handler);
    void stopReceiving();
    bool isReceiving() const;

    udp::endpoint local_endpoint() const;
    bool is_open() const;

    void close(); // idempotent

private:
    struct State;
    static void armReceive(const std::shared_ptr<State>& st);

    std::shared_ptr<State> state_;
};

} // namespace dmxbridge::net
