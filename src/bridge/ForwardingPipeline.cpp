#include "dmxbridge/bridge/ForwardingPipeline.hpp"
#include "dmxbridge/bridge/ChannelRegistry.hpp"
#include "dmxbridge/bridge/OutputSet.hpp"
#include "dmxbridge/log/Log.hpp"

#include <memory>

namespace dmxbridge::bridge {

ForwardingPipeline::ForwardingPipeline(ChannelRegistry& registry,
                                       OutputSet& outputs,
                                       artnet::SequenceCounter& sequence,
                                       DatagramSender& sender,
                                       std::uint16_t port)
: registry_(registry)
, outputs_(outputs)
, sequence_(sequence)
, sender_(sender)
, port_(port)
{}

expected<ForwardReport> ForwardingPipeline::onMessage(ChannelId channelId, const std::string& rawMessage) {
    if (!registry_.contains(channelId)) {
        ForwardReport report;
        report.channelLive = false;
        return report;
    }

    auto payload = parseControlMessage(rawMessage);
    if (!payload) {
        ++messagesDropped_;
        return unexpected(payload.error());
    }
    return forward(*payload);
}

expected<ForwardReport> ForwardingPipeline::forward(const ControlPayload& payload) {
    auto encoded = artnet::encodeDmx(sequence_, payload.universe, payload.channelValues);
    if (!encoded) {
        ++messagesDropped_;
        return unexpected(encoded.error());
    }

    const Frame frame = std::make_shared<const artnet::WireFrame>(std::move(*encoded));
    const auto targets = outputs_.snapshot();

    ForwardReport report;
    report.frameSize = frame->size();
    report.outputs.reserve(targets->size());

    for (const auto& output : *targets) {
        report.outputs.push_back(output.name);
        if (auto ec = sender_.sendTo(frame, output.broadcast, port_)) {
            ++report.failures;
            ++sendFailures_;
            logError("[ForwardingPipeline] send to '", output.name, "' (",
                     output.broadcastAddress, ":", port_, ") failed: ", ec.message(), "\n");
        }
    }

    if (!targets->empty()) {
        ++framesForwarded_;
    }
    logDebug("[ForwardingPipeline] universe ", payload.universe, " (",
             payload.channelValues.size(), " ch) -> ", targets->size(), " output(s)\n");
    return report;
}

void ForwardingPipeline::attach() {
    registry_.addMessageHandler([this](ChannelId id, const std::string& message) {
        auto result = onMessage(id, message);
        if (!result) {
            logError("[ForwardingPipeline] dropped message from channel ", id, ": ",
                     result.error().message(), "\n");
        }
    });
}

ForwardingPipeline::Stats ForwardingPipeline::stats() const {
    Stats s;
    s.framesForwarded = framesForwarded_.load();
    s.messagesDropped = messagesDropped_.load();
    s.sendFailures = sendFailures_.load();
    return s;
}

} // namespace dmxbridge::bridge
