#include "dmxbridge/bridge/OutputSet.hpp"
#include "dmxbridge/core/Errors.hpp"
#include "dmxbridge/net/Ipv4.hpp"
#include "dmxbridge/log/Log.hpp"

#include <exception>
#include <utility>

namespace dmxbridge::bridge {

expected<OutputSpec> parseOutputSpec(const std::string& text) {
    OutputSpec spec;
    std::string rest = text;
    if (auto colon = rest.find(':'); colon != std::string::npos) {
        spec.name = rest.substr(0, colon);
        rest = rest.substr(colon + 1);
    }
    const auto slash = rest.find('/');
    if (slash == std::string::npos) {
        return unexpected(make_error_code(Errc::InvalidAddress));
    }
    spec.address = rest.substr(0, slash);
    spec.mask = rest.substr(slash + 1);

    if (spec.mask.find('.') == std::string::npos) {
        int bits = -1;
        std::size_t used = 0;
        try {
            bits = std::stoi(spec.mask, &used);
        } catch (const std::exception&) {
            return unexpected(make_error_code(Errc::InvalidAddress));
        }
        // "24abc" parses as 24 with trailing junk.
        if (used != spec.mask.size() || bits < 0 || bits > 32) {
            return unexpected(make_error_code(Errc::InvalidAddress));
        }
        const std::uint32_t mask = bits == 0 ? 0u : (0xFFFFFFFFu << (32 - bits));
        spec.mask = net::formatIpv4(mask);
    }
    if (spec.name.empty()) {
        spec.name = spec.address;
    }
    return spec;
}

std::vector<OutputSpec> toOutputSpecs(const std::vector<net::InterfaceInfo>& interfaces,
                                      bool includeLoopback) {
    std::vector<OutputSpec> specs;
    specs.reserve(interfaces.size());
    for (const auto& info : interfaces) {
        if (info.loopback && !includeLoopback) continue;
        specs.push_back({info.name, info.address, info.mask});
    }
    return specs;
}

OutputSet::OutputSet()
: current_(std::make_shared<const std::vector<Output>>())
{}

expected<void> OutputSet::replace(const std::vector<OutputSpec>& specs) {
    auto next = std::make_shared<std::vector<Output>>();
    next->reserve(specs.size());

    for (const auto& spec : specs) {
        auto address = net::parseIpv4(spec.address);
        auto mask = net::parseIpv4(spec.mask);
        if (!address || !mask) {
            logError("[OutputSet] rejecting update: output '", spec.name,
                     "' has invalid address/mask ", spec.address, "/", spec.mask, "\n");
            return unexpected(address ? mask.error() : address.error());
        }

        Output output;
        output.name = spec.name;
        output.interfaceAddress = net::formatIpv4(*address);
        output.netmask = net::formatIpv4(*mask);
        output.broadcast = net::broadcastOf(*address, *mask);
        output.broadcastAddress = net::formatIpv4(output.broadcast);
        next->push_back(std::move(output));
    }

    Snapshot published = std::move(next);
    {
        std::lock_guard lock(mutex_);
        current_ = published;
        ++generation_;
    }

    logInfo("[OutputSet] ", published->size(), " output(s) configured\n");
    for (const auto& output : *published) {
        logDebug("[OutputSet] output '", output.name, "' ", output.interfaceAddress,
                "/", output.netmask, " -> broadcast ", output.broadcastAddress, "\n");
    }
    return {};
}

OutputSet::Snapshot OutputSet::snapshot() const {
    std::lock_guard lock(mutex_);
    return current_;
}

std::size_t OutputSet::size() const {
    return snapshot()->size();
}

std::uint64_t OutputSet::generation() const {
    std::lock_guard lock(mutex_);
    return generation_;
}

} // namespace dmxbridge::bridge
