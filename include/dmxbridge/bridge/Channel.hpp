#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace dmxbridge::bridge {

using ChannelId = std::uint64_t;

/// Transmission state as reported by the transport engine.
enum class ReadyState : std::uint8_t {
    Connecting = 0,
    Open = 1,
    Closing = 2,
    Closed = 3
};

/**
 * @brief An already-negotiated, message-oriented duplex channel to one peer.
 *
 * Implemented by the real-time transport adapter (or by tests). The bridge never
 * negotiates anything through it; it only subscribes to notifications and
 * sends opaque text messages.
 *
 * Contract for implementers:
 * - Message and close callbacks for one channel are invoked in arrival order and
 *   never concurrently with each other.
 * - `subscribe({}, {})` detaches the previous callbacks; after it returns no
 *   old callback may start.
 * - `close` is delivered at most once.
 */
class DataChannelHandle {
public:
    using MessageCallback = std::function<void(const std::string& message)>;
    using CloseCallback = std::function<void()>;

    virtual ~DataChannelHandle() = default;

    virtual ReadyState readyState() const = 0;
    virtual void send(const std::string& message) = 0;
    virtual void subscribe(MessageCallback onMessage, CloseCallback onClose) = 0;

    /// Human-readable label for logs (transport channel label, peer address...).
    virtual std::string label() const { return {}; }
};

enum class ChannelState : std::uint8_t {
    Connecting = 0,
    Open = 1,
    Closed = 2
};

/**
 * @brief One registered peer channel: a stable id plus the transport handle.
 *
 * Instances are created and owned by ChannelRegistry; other components hold
 * ids, not pointers.
 */
class Channel {
public:
    Channel(ChannelId id, std::shared_ptr<DataChannelHandle> handle);

    ChannelId id() const { return id_; }
    ChannelState state() const { return state_.load(); }
    const std::shared_ptr<DataChannelHandle>& handle() const { return handle_; }

    /// Best-effort send: delivered only while the transport reports Open.
    bool send(const std::string& message);

private:
    friend class ChannelRegistry;
    void setState(ChannelState state) { state_.store(state); }

    const ChannelId id_;
    const std::shared_ptr<DataChannelHandle> handle_;
    std::atomic<ChannelState> state_{ChannelState::Connecting};
};

} // namespace dmxbridge::bridge
