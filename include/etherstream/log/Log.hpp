#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace etherstream::log {

enum class Level {
    Info,
    Warning,
    Error
};

using LogHandler = std::function<void(std::string_view)>;

/**
 * @brief Replace the sink for one level.
 *
 * Passing an empty handler restores the default sink for that level
 * (stdout for info, stderr for warnings and errors).
 */
void setLogHandler(Level level, LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler warningHandler, LogHandler errorHandler);
void resetLogHandlers();

void log(Level level, std::string_view message);
void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

const char* toString(Level level);

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

template<typename First, typename... Rest,
         typename = detail::EnableIfFormatted<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableIfFormatted<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    logWarning(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableIfFormatted<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace etherstream::log

namespace etherstream {
using log::LogHandler;
using log::setLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace etherstream
