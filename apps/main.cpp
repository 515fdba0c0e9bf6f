// dmxbridge-cli
// -----------------------------------------------------------------------------
// Runs one Bridge with a data channel on stdio: every stdin line is either a
// signaling message ({"type": ...}) or a control message ({"universe": ...}).
// Replies and relayed inbound frames are written to stdout, one JSON document
// per line; all logging goes to stderr.

#include "dmxbridge/bridge/Bridge.hpp"
#include "dmxbridge/bridge/SignalingProtocol.hpp"
#include "dmxbridge/net/InterfaceList.hpp"
#include "dmxbridge/net/TimeoutConfig.hpp"
#include "dmxbridge/log/Log.hpp"

#include <argparse/argparse.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace dmxbridge;

namespace {

std::mutex stdoutMutex;

void writeLine(const std::string& line) {
    std::lock_guard lock(stdoutMutex);
    std::cout << line << '\n';
    std::cout.flush();
}

/// The process's own stdin/stdout exposed as one peer data channel.
class StdioChannel : public bridge::DataChannelHandle {
public:
    bridge::ReadyState readyState() const override {
        std::lock_guard lock(mutex_);
        return state_;
    }

    void send(const std::string& message) override {
        writeLine(message);
    }

    void subscribe(MessageCallback onMessage, CloseCallback onClose) override {
        std::lock_guard lock(mutex_);
        onMessage_ = std::move(onMessage);
        onClose_ = std::move(onClose);
    }

    std::string label() const override { return "stdio"; }

    void deliver(const std::string& line) {
        MessageCallback callback;
        {
            std::lock_guard lock(mutex_);
            callback = onMessage_;
        }
        if (callback) callback(line);
    }

    void finish() {
        CloseCallback callback;
        {
            std::lock_guard lock(mutex_);
            if (state_ == bridge::ReadyState::Closed) return;
            state_ = bridge::ReadyState::Closed;
            callback = onClose_;
        }
        if (callback) callback();
    }

private:
    mutable std::mutex mutex_;
    bridge::ReadyState state_ = bridge::ReadyState::Open;
    MessageCallback onMessage_;
    CloseCallback onClose_;
};

std::vector<bridge::OutputSpec> defaultOutputs(bool includeLoopback) {
    auto interfaces = net::listIpv4Interfaces();
    if (!interfaces) {
        logError("[dmxbridge] interface enumeration failed: ", interfaces.error().message(), "\n");
        return {};
    }
    return bridge::toOutputSpecs(*interfaces, includeLoopback);
}

} // namespace

int main(int argc, char** argv) {
    argparse::ArgumentParser program("dmxbridge", "1.0");
    program.add_argument("-u", "--udp-port")
        .help("Art-Net UDP port to bind and broadcast to")
        .default_value(static_cast<int>(artnet::config::ARTNET_PORT_DEFAULT))
        .scan<'i', int>();
    program.add_argument("-o", "--output")
        .help("output as [name:]address/mask (repeatable); defaults to every non-loopback IPv4 interface")
        .append();
    program.add_argument("--loopback")
        .help("include loopback interfaces in the default outputs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--relay-inbound")
        .help("relay received ArtDmx frames to the data channel as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-t", "--timeout-ms")
        .help("deadline for one datagram send, in milliseconds")
        .default_value(static_cast<int>(bridge::config::SEND_TIMEOUT_DEFAULT.count()))
        .scan<'i', int>();
    program.add_argument("-v", "--verbose")
        .help("log every forwarded frame")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << '\n' << program;
        return 1;
    }

    // stdout carries protocol output only.
    setLogSinks(
        [](std::string_view message) { std::cerr << message; std::cerr.flush(); },
        [](std::string_view message) { std::cerr << message; std::cerr.flush(); });
    dmxbridge::log::setVerbose(program.get<bool>("--verbose"));

    const int port = program.get<int>("--udp-port");
    if (port < 0 || port > 0xFFFF) {
        logError("[dmxbridge] invalid UDP port ", port, "\n");
        return 1;
    }

    bridge::BridgeConfig config;
    config.artnetPort = static_cast<std::uint16_t>(port);
    config.sendTimeout = std::chrono::milliseconds{program.get<int>("--timeout-ms")};
    config.relayInbound = program.get<bool>("--relay-inbound");
    net::TimeoutConfig::setDefault(config.sendTimeout);

    std::vector<bridge::OutputSpec> outputs;
    if (auto requested = program.present<std::vector<std::string>>("--output")) {
        for (const auto& text : *requested) {
            auto spec = bridge::parseOutputSpec(text);
            if (!spec) {
                logError("[dmxbridge] cannot parse output '", text, "': ", spec.error().message(), "\n");
                return 1;
            }
            outputs.push_back(*spec);
        }
    } else {
        outputs = defaultOutputs(program.get<bool>("--loopback"));
    }

    bridge::Bridge server(config);
    if (auto opened = server.open(); !opened) {
        logError("[dmxbridge] startup failed: ", opened.error().message(), "\n");
        return 2;
    }
    if (auto set = server.setOutputs(outputs); !set) {
        logError("[dmxbridge] invalid output configuration: ", set.error().message(), "\n");
        return 1;
    }

    bridge::SignalingProtocol signaling(server.outputs(), nullptr);
    auto channel = std::make_shared<StdioChannel>();
    server.attachChannel(channel);

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;

        if (bridge::SignalingProtocol::isSignalingMessage(line)) {
            auto reply = signaling.handleMessage(line);
            if (!reply) {
                logError("[dmxbridge] signaling message dropped: ", reply.error().message(), "\n");
            } else if (*reply) {
                writeLine(**reply);
            }
            continue;
        }
        channel->deliver(line);
    }

    channel->finish();
    const auto stats = server.pipeline().stats();
    logInfo("[dmxbridge] forwarded ", stats.framesForwarded, " frame(s), dropped ",
            stats.messagesDropped, " message(s), ", stats.sendFailures, " send failure(s)\n");
    server.close();
    return 0;
}
