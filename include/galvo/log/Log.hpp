#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace galvo::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(msg);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(msg);
}

/**
 * @brief Named diagnostic sink ("usb", "send", "recv", ...).
 *
 * Each message is written as one line prefixed with `[name] `. Without a
 * handler of its own the channel forwards to the process-wide info handler,
 * so a host application sees all traffic unless it redirects a channel.
 */
class LogChannel {
public:
    explicit LogChannel(std::string name);

    LogChannel(const LogChannel&) = delete;
    LogChannel& operator=(const LogChannel&) = delete;

    const std::string& name() const { return channelName; }

    /// Redirect this channel. An empty handler restores forwarding.
    void setHandler(LogHandler handler);
    bool hasHandler() const;

    void write(std::string_view message);

    template<typename... Args>
    void operator()(Args&&... args) {
        write(detail::buildLogMessage(std::forward<Args>(args)...));
    }

private:
    std::string channelName;
    mutable std::mutex handlerMutex;
    LogHandler handler{};
};

} // namespace galvo::log

namespace galvo {
using log::LogHandler;
using log::LogChannel;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logError;
} // namespace galvo
