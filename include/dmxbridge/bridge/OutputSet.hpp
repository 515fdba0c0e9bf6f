#pragma once

#include "dmxbridge/core/Expected.hpp"
#include "dmxbridge/net/InterfaceList.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dmxbridge::bridge {

/// One entry of a configuration update, as sent by the peer.
struct OutputSpec {
    std::string name;
    std::string address;
    std::string mask;
};

/**
 * Parse "[name:]address/mask", where mask is dotted or a prefix length 0..32.
 * The name defaults to the address. Fails with Errc::InvalidAddress; the
 * address itself is validated later by OutputSet::replace.
 */
expected<OutputSpec> parseOutputSpec(const std::string& text);

/// One output per host interface address, named after the interface.
std::vector<OutputSpec> toOutputSpecs(const std::vector<net::InterfaceInfo>& interfaces,
                                      bool includeLoopback);

/// A configured destination with its broadcast address already derived.
struct Output {
    std::string name;
    std::string interfaceAddress;
    std::string netmask;
    std::string broadcastAddress;
    std::uint32_t broadcast = 0;   // broadcastAddress in host order
};

/**
 * @brief The list of network outputs every forwarded frame is replicated to.
 *
 * The set is immutable once published. `replace` builds a complete new set and
 * swaps it in under one lock; `snapshot` hands out the current set by shared
 * pointer, so a forward that took a snapshot keeps iterating the same set even
 * if a replacement lands mid-flight.
 */
class OutputSet {
public:
    using Snapshot = std::shared_ptr<const std::vector<Output>>;

    OutputSet();

    /**
     * Recompute every broadcast address and publish the new set.
     * Any invalid entry rejects the whole update (Errc::InvalidAddress) and the
     * previous set stays in force.
     */
    expected<void> replace(const std::vector<OutputSpec>& specs);

    Snapshot snapshot() const;
    std::size_t size() const;

    /// Bumped on every successful replace.
    std::uint64_t generation() const;

private:
    mutable std::mutex mutex_;
    Snapshot current_;
    std::uint64_t generation_ = 0;
};

} // namespace dmxbridge::bridge
