#pragma once

#include "dmxbridge/bridge/Channel.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dmxbridge::bridge {

/**
 * @brief Owns every open peer data channel and dispatches their events.
 *
 * Responsibilities:
 * - Assign process-unique, never reused ids from a monotonic counter.
 * - Subscribe to each handle and forward its messages (tagged with the id) to
 *   the registered message handlers.
 * - On close, mark the channel closed, drop it from the live set and notify
 *   close handlers. Closing an id that is already gone is a no-op.
 *
 * Threading model:
 * - All methods are safe to call from any thread.
 * - Handlers run on the transport thread that delivered the notification,
 *   outside the registry lock, so a handler may call back into the registry.
 * - Register handlers before the first channel is attached.
 *
 * Lifetime: the destructor detaches every live handle, so the registry may be
 * destroyed while the transport still holds its channels.
 */
class ChannelRegistry {
public:
    using MessageHandler = std::function<void(ChannelId id, const std::string& message)>;
    using CloseHandler = std::function<void(ChannelId id)>;

    ChannelRegistry() = default;
    ~ChannelRegistry();

    ChannelRegistry(const ChannelRegistry&) = delete;
    ChannelRegistry& operator=(const ChannelRegistry&) = delete;

    void addMessageHandler(MessageHandler handler);
    void addCloseHandler(CloseHandler handler);

    /// Wrap and subscribe to a transport channel. Returns the live Channel.
    std::shared_ptr<Channel> registerChannel(std::shared_ptr<DataChannelHandle> handle);

    /// Send to one channel if it is live and its transport is open; otherwise drop.
    bool send(ChannelId id, const std::string& message);

    /// `send` to every live channel. Returns how many accepted the message.
    std::size_t broadcast(const std::string& message);

    /// Detach from every live handle and forget all channels without firing close handlers.
    void detachAll();

    std::shared_ptr<Channel> find(ChannelId id) const;
    bool contains(ChannelId id) const;
    std::size_t size() const;
    std::vector<ChannelId> ids() const;

private:
    void handleMessage(ChannelId id, const std::string& message);
    void handleClose(ChannelId id);

    mutable std::mutex mutex_;
    std::map<ChannelId, std::shared_ptr<Channel>> channels_;
    std::vector<MessageHandler> messageHandlers_;
    std::vector<CloseHandler> closeHandlers_;
    std::atomic<ChannelId> nextId_{0};
};

} // namespace dmxbridge::bridge
