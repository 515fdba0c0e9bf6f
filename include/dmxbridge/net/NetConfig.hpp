#pragma once

#include <asio.hpp>
#include <system_error>   // std::error_code

namespace dmxbridge::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `dmxbridge::net::asio` as the standalone Asio namespace.
 * - `dmxbridge::net::udp` as the datagram protocol alias.
 * - `dmxbridge::net::error_code` for socket-level results.
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using error_code = std::error_code;

} // namespace dmxbridge::net
