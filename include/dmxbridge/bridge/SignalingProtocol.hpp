#pragma once

#include "dmxbridge/core/Expected.hpp"
#include "dmxbridge/net/InterfaceList.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dmxbridge::bridge {

class OutputSet;

namespace signaling {
constexpr const char* TYPE_OFFER = "__WRTC_OFR";
constexpr const char* TYPE_OUTPUTS_LIST = "__OUTPUTS_LIST";
constexpr const char* TYPE_OUTPUTS_SET = "__OUTPUTS__SET";
} // namespace signaling

/**
 * @brief Hands a remote session description to the transport engine.
 *
 * The engine sets the offer as remote description, creates and applies an
 * answer, and returns the local description. Channels it opens afterwards are
 * attached to the bridge by the engine adapter. Both descriptions are opaque
 * JSON text to the bridge.
 */
class PeerConnector {
public:
    virtual ~PeerConnector() = default;
    virtual expected<std::string> answerOffer(const std::string& offerJson) = 0;
};

/**
 * @brief The JSON protocol spoken over the signaling relay.
 *
 * Every message is `{"type": ..., "data": ...}`:
 * - `__WRTC_OFR`     data = offer; reply carries the answer under the same type.
 * - `__OUTPUTS_LIST` reply data = [{name, cidr, address, mask}] of host interfaces.
 * - `__OUTPUTS__SET` data = [{name, address, mask}]; replaces the OutputSet, no reply.
 * Unknown types are ignored.
 */
class SignalingProtocol {
public:
    using InterfaceProvider = std::function<expected<std::vector<net::InterfaceInfo>>()>;

    /// `connector` may be null: offers are then rejected.
    SignalingProtocol(OutputSet& outputs,
                      PeerConnector* connector,
                      InterfaceProvider interfaces = net::listIpv4Interfaces);

    /**
     * Handle one relay message. Returns the reply to send back, if any.
     * Fails with Errc::MalformedPayload on bad JSON or shape, or with the
     * underlying error when an output update or offer is rejected.
     */
    expected<std::optional<std::string>> handleMessage(std::string_view text);

    /// Cheap check used to route mixed input: true when `text` is a JSON object with a string "type".
    static bool isSignalingMessage(std::string_view text);

private:
    expected<std::optional<std::string>> handleOffer(const std::string& offerJson);
    expected<std::optional<std::string>> handleOutputsList();

    OutputSet& outputs_;
    PeerConnector* connector_;
    InterfaceProvider interfaces_;
};

} // namespace dmxbridge::bridge
