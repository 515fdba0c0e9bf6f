#include "dmxbridge/core/Errors.hpp"

#include <string>

namespace dmxbridge {

namespace {

class BridgeCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "dmxbridge"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::EncodingError:    return "encoding error";
            case Errc::DecodingError:    return "decoding error";
            case Errc::InvalidAddress:   return "invalid address";
            case Errc::MalformedPayload: return "malformed payload";
        }
        return "unknown dmxbridge error";
    }
};

} // namespace

const std::error_category& bridgeCategory() noexcept {
    static BridgeCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), bridgeCategory()};
}

} // namespace dmxbridge
