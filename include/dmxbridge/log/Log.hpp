#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace dmxbridge::log {

/// Receives one fully formatted message (callers include the trailing newline).
using LogSink = std::function<void(std::string_view)>;

void setInfoLogSink(LogSink sink);
void setErrorLogSink(LogSink sink);
void setLogSinks(LogSink infoSink, LogSink errorSink);
void resetLogSinks();

/// Debug messages go to the info sink, but only while verbose logging is on.
void setVerbose(bool on);
bool isVerbose();

void logInfo(std::string_view message);
void logError(std::string_view message);
void logDebug(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableIfFormatted = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

// Formatting is skipped while verbose logging is off.
template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!isVerbose()) {
        return;
    }
    logDebug(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

} // namespace dmxbridge::log

namespace dmxbridge {
using log::LogSink;
using log::setInfoLogSink;
using log::setErrorLogSink;
using log::setLogSinks;
using log::resetLogSinks;
using log::logInfo;
using log::logError;
using log::logDebug;
} // namespace dmxbridge
