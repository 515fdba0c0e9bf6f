#pragma once

#include <system_error>

namespace dmxbridge {

/**
 * @brief Local, per-operation failures raised by the bridge core.
 *
 * None of these are fatal: callers log them and drop the offending frame,
 * message or configuration update.
 */
enum class Errc {
    EncodingError = 1,   ///< opcode, universe or payload size out of range at encode time
    DecodingError,       ///< frame too short to hold the fixed Art-Net header
    InvalidAddress,      ///< malformed dotted-decimal IPv4 text
    MalformedPayload     ///< unparseable or incomplete JSON message
};

const std::error_category& bridgeCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

} // namespace dmxbridge

namespace std {
template <>
struct is_error_code_enum<dmxbridge::Errc> : true_type {};
} // namespace std
