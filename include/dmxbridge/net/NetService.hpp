#pragma once
#include "dmxbridge/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace dmxbridge::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * All socket completions (outbound sends, the inbound receive loop, deadline
 * timers) run on this one thread. Callers on other threads post work to it and,
 * for the synchronous helpers in `UdpSocket`, block until it completes.
 *
 * Lifetime notes:
 * - Destroy sockets before `NetService` so their handlers complete while the
 *   `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 * - Never block on a deadline helper from the I/O thread itself: the wait would
 *   starve the loop that has to complete it.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

std::shared_ptr<asio::io_context> shared_io_context();

} // namespace dmxbridge::net
