#include "dmxbridge/bridge/ChannelRegistry.hpp"
#include "dmxbridge/log/Log.hpp"

#include <utility>

namespace dmxbridge::bridge {

Channel::Channel(ChannelId id, std::shared_ptr<DataChannelHandle> handle)
: id_(id)
, handle_(std::move(handle))
{}

bool Channel::send(const std::string& message) {
    if (state() != ChannelState::Open || !handle_) {
        return false;
    }
    if (handle_->readyState() != ReadyState::Open) {
        return false;
    }
    handle_->send(message);
    return true;
}

ChannelRegistry::~ChannelRegistry() {
    detachAll();
}

void ChannelRegistry::detachAll() {
    std::map<ChannelId, std::shared_ptr<Channel>> remaining;
    {
        std::lock_guard lock(mutex_);
        remaining.swap(channels_);
    }
    for (auto& [id, channel] : remaining) {
        channel->handle()->subscribe({}, {});
        channel->setState(ChannelState::Closed);
    }
}

void ChannelRegistry::addMessageHandler(MessageHandler handler) {
    std::lock_guard lock(mutex_);
    messageHandlers_.push_back(std::move(handler));
}

void ChannelRegistry::addCloseHandler(CloseHandler handler) {
    std::lock_guard lock(mutex_);
    closeHandlers_.push_back(std::move(handler));
}

std::shared_ptr<Channel> ChannelRegistry::registerChannel(std::shared_ptr<DataChannelHandle> handle) {
    if (!handle) {
        logError("[ChannelRegistry] refusing to register a null channel handle\n");
        return nullptr;
    }

    const ChannelId id = nextId_.fetch_add(1);
    auto channel = std::make_shared<Channel>(id, handle);
    channel->setState(ChannelState::Open);
    {
        std::lock_guard lock(mutex_);
        channels_.emplace(id, channel);
    }

    // Stored before subscribing so the first message already finds the id.
    handle->subscribe(
        [this, id](const std::string& message) { handleMessage(id, message); },
        [this, id] { handleClose(id); });

    const auto label = handle->label();
    if (label.empty()) {
        logInfo("[ChannelRegistry] channel ", id, " open\n");
    } else {
        logInfo("[ChannelRegistry] channel ", id, " open (", label, ")\n");
    }
    return channel;
}

bool ChannelRegistry::send(ChannelId id, const std::string& message) {
    auto channel = find(id);
    if (!channel) {
        return false;
    }
    return channel->send(message);
}

std::size_t ChannelRegistry::broadcast(const std::string& message) {
    std::vector<std::shared_ptr<Channel>> live;
    {
        std::lock_guard lock(mutex_);
        live.reserve(channels_.size());
        for (const auto& entry : channels_) {
            live.push_back(entry.second);
        }
    }
    std::size_t delivered = 0;
    for (auto& channel : live) {
        if (channel->send(message)) {
            ++delivered;
        }
    }
    return delivered;
}

std::shared_ptr<Channel> ChannelRegistry::find(ChannelId id) const {
    std::lock_guard lock(mutex_);
    auto it = channels_.find(id);
    return it == channels_.end() ? nullptr : it->second;
}

bool ChannelRegistry::contains(ChannelId id) const {
    std::lock_guard lock(mutex_);
    return channels_.count(id) != 0;
}

std::size_t ChannelRegistry::size() const {
    std::lock_guard lock(mutex_);
    return channels_.size();
}

std::vector<ChannelId> ChannelRegistry::ids() const {
    std::lock_guard lock(mutex_);
    std::vector<ChannelId> out;
    out.reserve(channels_.size());
    for (const auto& entry : channels_) {
        out.push_back(entry.first);
    }
    return out;
}

void ChannelRegistry::handleMessage(ChannelId id, const std::string& message) {
    std::vector<MessageHandler> handlers;
    {
        std::lock_guard lock(mutex_);
        if (channels_.count(id) == 0) {
            return; // raced with close
        }
        handlers = messageHandlers_;
    }
    for (auto& handler : handlers) {
        handler(id, message);
    }
}

void ChannelRegistry::handleClose(ChannelId id) {
    std::shared_ptr<Channel> channel;
    std::vector<CloseHandler> handlers;
    {
        std::lock_guard lock(mutex_);
        auto it = channels_.find(id);
        if (it == channels_.end()) {
            return;
        }
        channel = std::move(it->second);
        channels_.erase(it);
        handlers = closeHandlers_;
    }
    channel->setState(ChannelState::Closed);
    logInfo("[ChannelRegistry] channel ", id, " closed\n");

    for (auto& handler : handlers) {
        handler(id);
    }
}

} // namespace dmxbridge::bridge
