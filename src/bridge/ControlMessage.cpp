#include "dmxbridge/bridge/ControlMessage.hpp"
#include "dmxbridge/core/Errors.hpp"

#include <nlohmann/json.hpp>

namespace dmxbridge::bridge {

using json = nlohmann::json;

namespace {
constexpr const char* KEY_UNIVERSE = "universe";
constexpr const char* KEY_BUFFER = "DMX512Buffer";
constexpr const char* KEY_BUFFER_ALIAS = "channelValues";

std::error_code malformed() {
    return make_error_code(Errc::MalformedPayload);
}
} // namespace

expected<ControlPayload> parseControlMessage(std::string_view text) {
    const json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return unexpected(malformed());
    }

    auto universe = doc.find(KEY_UNIVERSE);
    if (universe == doc.end() || !universe->is_number_unsigned()) {
        return unexpected(malformed());
    }

    auto values = doc.find(KEY_BUFFER);
    if (values == doc.end()) {
        values = doc.find(KEY_BUFFER_ALIAS);
    }
    if (values == doc.end() || !values->is_array()) {
        return unexpected(malformed());
    }

    ControlPayload payload;
    const auto rawUniverse = universe->get<std::uint64_t>();
    // Values beyond 32 bits cannot be a universe; clamp so the encoder rejects them.
    payload.universe = rawUniverse > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<std::uint32_t>(rawUniverse);

    payload.channelValues.reserve(values->size());
    for (const auto& level : *values) {
        if (!level.is_number_unsigned() || level.get<std::uint64_t>() > 255) {
            return unexpected(malformed());
        }
        payload.channelValues.push_back(static_cast<std::uint8_t>(level.get<std::uint64_t>()));
    }
    return payload;
}

std::string serializeControlMessage(const ControlPayload& payload) {
    json doc;
    doc[KEY_UNIVERSE] = payload.universe;
    doc[KEY_BUFFER] = payload.channelValues;
    return doc.dump();
}

} // namespace dmxbridge::bridge
