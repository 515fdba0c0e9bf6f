#include "dmxbridge/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace dmxbridge::log {

namespace {

LogSink makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogSink makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogSink infoSink = makeDefaultInfoSink();
LogSink errorSink = makeDefaultErrorSink();
std::atomic<bool> verbose{false};

LogSink currentInfoSink() {
    std::lock_guard lock(sinkMutex);
    return infoSink;
}

} // namespace

void setInfoLogSink(LogSink sink) {
    std::lock_guard lock(sinkMutex);
    infoSink = sink ? std::move(sink) : makeDefaultInfoSink();
}

void setErrorLogSink(LogSink sink) {
    std::lock_guard lock(sinkMutex);
    errorSink = sink ? std::move(sink) : makeDefaultErrorSink();
}

void setLogSinks(LogSink newInfo, LogSink newError) {
    std::lock_guard lock(sinkMutex);
    infoSink = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorSink = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogSinks() {
    std::lock_guard lock(sinkMutex);
    infoSink = makeDefaultInfoSink();
    errorSink = makeDefaultErrorSink();
}

void setVerbose(bool on) {
    verbose.store(on, std::memory_order_relaxed);
}

bool isVerbose() {
    return verbose.load(std::memory_order_relaxed);
}

void logInfo(std::string_view message) {
    // Sinks run outside the lock so a sink may itself log.
    if (auto sink = currentInfoSink()) {
        sink(message);
    }
}

void logError(std::string_view message) {
    LogSink sink;
    {
        std::lock_guard lock(sinkMutex);
        sink = errorSink;
    }
    if (sink) {
        sink(message);
    }
}

void logDebug(std::string_view message) {
    if (!isVerbose()) {
        return;
    }
    logInfo(message);
}

} // namespace dmxbridge::log
