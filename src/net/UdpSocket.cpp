#include "dmxbridge/net/UdpSocket.hpp"
#include "dmxbridge/net/Deadline.hpp"
#include "dmxbridge/log/Log.hpp"

#include <algorithm>
#include <future>
#include <utility>

namespace dmxbridge::net {

struct UdpSocket::State {
    explicit State(std::shared_ptr<asio::io_context> ctx)
    : io(std::move(ctx))
    , strand(asio::make_strand(*io))
    , sock(strand)
    {}

    std::shared_ptr<asio::io_context> io;
    asio::strand<asio::io_context::executor_type> strand;
    udp::socket sock;

    // Receive loop state; touched only on the strand.
    std::array<std::uint8_t, MAX_DATAGRAM> rxBuffer{};
    udp::endpoint rxFrom;
    ReceiveHandler onReceive;
    asio::cancellation_signal rxCancel;

    std::atomic<bool> receiving{false};
    std::atomic<bool> open{false};
};

UdpSocket::UdpSocket(std::shared_ptr<asio::io_context> io)
: state_(std::make_shared<State>(std::move(io)))
{}

UdpSocket::~UdpSocket() {
    close();
}

error_code UdpSocket::open_v4() {
    error_code ec;
    state_->sock.open(udp::v4(), ec);
    if (!ec) {
        state_->open = true;
    }
    return ec;
}

error_code UdpSocket::reuse_address(bool on) {
    error_code ec;
    state_->sock.set_option(asio::socket_base::reuse_address(on), ec);
    return ec;
}

error_code UdpSocket::bind_any(std::uint16_t port) {
    error_code ec;
    state_->sock.bind(udp::endpoint(udp::v4(), port), ec);
    return ec;
}

error_code UdpSocket::bind(const asio::ip::address_v4& address, std::uint16_t port) {
    error_code ec;
    state_->sock.bind(udp::endpoint(address, port), ec);
    return ec;
}

error_code UdpSocket::enable_broadcast(bool on) {
    error_code ec;
    state_->sock.set_option(asio::socket_base::broadcast(on), ec);
    return ec;
}

error_code UdpSocket::send_to(const Frame& frame, const udp::endpoint& ep, milliseconds timeout) {
    if (!frame) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (!state_->open) {
        return asio::error::bad_descriptor;
    }
    auto st = state_;
    // Per-operation signal: a timeout aborts this send only, never the other
    // operations pending on the shared socket.
    auto signal = std::make_shared<asio::cancellation_signal>();
    return with_deadline(st->strand, timeout,
        [st, frame, ep, signal](auto cb){
            asio::post(st->strand, [st, frame, ep, signal, cb]{
                // `frame` rides along in the handler so the bytes outlive a timeout.
                st->sock.async_send_to(asio::buffer(*frame), ep,
                    asio::bind_cancellation_slot(signal->slot(),
                        [frame, cb](const error_code& ec, std::size_t n){ cb(ec, n); }));
            });
        },
        [st, signal]{
            asio::post(st->strand, [signal]{ signal->emit(asio::cancellation_type::all); });
        });
}

error_code UdpSocket::recv_from(std::vector<std::uint8_t>& out, udp::endpoint& out_ep,
                                milliseconds timeout) {
    if (!state_->open) {
        return asio::error::bad_descriptor;
    }

    struct Rx {
        std::array<std::uint8_t, MAX_DATAGRAM> bytes{};
        udp::endpoint from;
        std::size_t size = 0;
    };
    auto rx = std::make_shared<Rx>();
    auto st = state_;
    auto signal = std::make_shared<asio::cancellation_signal>();

    auto ec = with_deadline(st->strand, timeout,
        [st, rx, signal](auto cb){
            asio::post(st->strand, [st, rx, signal, cb]{
                st->sock.async_receive_from(asio::buffer(rx->bytes), rx->from,
                    asio::bind_cancellation_slot(signal->slot(),
                        [rx, cb](const error_code& rec, std::size_t n){
                            rx->size = n;
                            cb(rec);
                        }));
            });
        },
        [st, signal]{
            asio::post(st->strand, [signal]{ signal->emit(asio::cancellation_type::all); });
        });

    if (!ec) {
        out.assign(rx->bytes.begin(), rx->bytes.begin() + static_cast<std::ptrdiff_t>(rx->size));
        out_ep = rx->from;
    }
    return ec;
}

void UdpSocket::armReceive(const std::shared_ptr<State>& st) {
    st->sock.async_receive_from(asio::buffer(st->rxBuffer), st->rxFrom,
        asio::bind_cancellation_slot(st->rxCancel.slot(),
            [st](const error_code& ec, std::size_t n){
                // Aborted only by stopReceiving() or close(); a restarted loop
                // has already armed its own receive.
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (!st->receiving || !st->sock.is_open()) {
                    return;
                }
                if (ec) {
                    logError("[UdpSocket] receive failed: ", ec.message(), "\n");
                } else if (st->onReceive) {
                    st->onReceive(st->rxBuffer.data(), n, st->rxFrom);
                }
                armReceive(st);
            }));
}

void UdpSocket::startReceiving(ReceiveHandler handler) {
    auto st = state_;
    const bool wasReceiving = st->receiving.exchange(true);
    asio::post(st->strand, [st, handler = std::move(handler), wasReceiving]() mutable {
        st->onReceive = std::move(handler);
        if (!wasReceiving && st->sock.is_open()) {
            armReceive(st);
        }
    });
}

void UdpSocket::stopReceiving() {
    auto st = state_;
    if (!st->receiving.exchange(false)) {
        return;
    }
    asio::post(st->strand, [st]{
        st->onReceive = nullptr;
        st->rxCancel.emit(asio::cancellation_type::all);
    });
}

bool UdpSocket::isReceiving() const {
    return state_->receiving;
}

udp::endpoint UdpSocket::local_endpoint() const {
    error_code ignore;
    return state_->sock.local_endpoint(ignore);
}

bool UdpSocket::is_open() const {
    return state_->open;
}

void UdpSocket::close() {
    auto st = state_;
    st->receiving = false;
    if (!st->open.exchange(false)) {
        return;
    }

    auto doClose = [st]{
        st->onReceive = nullptr;
        error_code ignore;
        st->sock.close(ignore);
    };

    if (st->io->stopped() || st->strand.running_in_this_thread()) {
        doClose();
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto closed = done->get_future();
    asio::post(st->strand, [doClose, done]{
        doClose();
        done->set_value();
    });
    closed.wait();
}

} // namespace dmxbridge::net
