#include "dmxbridge/bridge/SignalingProtocol.hpp"
#include "dmxbridge/bridge/OutputSet.hpp"
#include "dmxbridge/core/Errors.hpp"
#include "dmxbridge/log/Log.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace dmxbridge::bridge {

using json = nlohmann::json;

namespace {

std::error_code malformed() {
    return make_error_code(Errc::MalformedPayload);
}

json parseLenient(std::string_view text) {
    return json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
}

bool readString(const json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // namespace

SignalingProtocol::SignalingProtocol(OutputSet& outputs,
                                     PeerConnector* connector,
                                     InterfaceProvider interfaces)
: outputs_(outputs)
, connector_(connector)
, interfaces_(std::move(interfaces))
{}

bool SignalingProtocol::isSignalingMessage(std::string_view text) {
    const json doc = parseLenient(text);
    if (doc.is_discarded() || !doc.is_object()) {
        return false;
    }
    auto type = doc.find("type");
    return type != doc.end() && type->is_string();
}

expected<std::optional<std::string>> SignalingProtocol::handleMessage(std::string_view text) {
    const json doc = parseLenient(text);
    if (doc.is_discarded() || !doc.is_object()) {
        return unexpected(malformed());
    }

    std::string type;
    if (!readString(doc, "type", type)) {
        return unexpected(malformed());
    }

    if (type == signaling::TYPE_OFFER) {
        auto data = doc.find("data");
        if (data == doc.end() || data->is_null()) {
            return unexpected(malformed());
        }
        return handleOffer(data->dump());
    }

    if (type == signaling::TYPE_OUTPUTS_LIST) {
        return handleOutputsList();
    }

    if (type == signaling::TYPE_OUTPUTS_SET) {
        auto data = doc.find("data");
        if (data == doc.end() || !data->is_array()) {
            return unexpected(malformed());
        }
        std::vector<OutputSpec> specs;
        specs.reserve(data->size());
        for (const auto& entry : *data) {
            if (!entry.is_object()) {
                return unexpected(malformed());
            }
            OutputSpec spec;
            if (!readString(entry, "address", spec.address) || !readString(entry, "mask", spec.mask)) {
                return unexpected(malformed());
            }
            readString(entry, "name", spec.name); // optional
            specs.push_back(std::move(spec));
        }
        if (auto replaced = outputs_.replace(specs); !replaced) {
            return unexpected(replaced.error());
        }
        return std::optional<std::string>{};
    }

    logInfo("[SignalingProtocol] ignoring message of unknown type '", type, "'\n");
    return std::optional<std::string>{};
}

expected<std::optional<std::string>> SignalingProtocol::handleOffer(const std::string& offerJson) {
    if (!connector_) {
        logError("[SignalingProtocol] offer received but no transport engine is attached\n");
        return unexpected(std::make_error_code(std::errc::not_supported));
    }

    logInfo("[SignalingProtocol] offer received, preparing answer\n");
    auto answer = connector_->answerOffer(offerJson);
    if (!answer) {
        logError("[SignalingProtocol] transport engine rejected offer: ", answer.error().message(), "\n");
        return unexpected(answer.error());
    }

    const json answerDoc = parseLenient(*answer);
    json reply;
    reply["type"] = signaling::TYPE_OFFER;
    // Engines normally return a JSON description; pass anything else through as a string.
    reply["data"] = answerDoc.is_discarded() ? json(*answer) : answerDoc;
    return std::optional<std::string>{reply.dump()};
}

expected<std::optional<std::string>> SignalingProtocol::handleOutputsList() {
    if (!interfaces_) {
        return unexpected(std::make_error_code(std::errc::not_supported));
    }
    auto list = interfaces_();
    if (!list) {
        logError("[SignalingProtocol] interface enumeration failed: ", list.error().message(), "\n");
        return unexpected(list.error());
    }

    json data = json::array();
    for (const auto& info : *list) {
        data.push_back({
            {"name", info.name},
            {"cidr", info.cidr},
            {"address", info.address},
            {"mask", info.mask}
        });
    }

    json reply;
    reply["type"] = signaling::TYPE_OUTPUTS_LIST;
    reply["data"] = std::move(data);
    return std::optional<std::string>{reply.dump()};
}

} // namespace dmxbridge::bridge
