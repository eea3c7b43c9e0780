#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace lumen::log {

enum class LogLevel {
    Info = 0,
    Warning = 1,
    Error = 2
};

const char* toString(LogLevel level);

/// Receives every message at or above the minimum level.
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a sink. Passing an empty handler restores the default console sink
/// (info to stdout, warnings and errors to stderr).
void setLogHandler(LogHandler handler);
void resetLogHandler();

void setMinimumLevel(LogLevel level);
LogLevel minimumLevel();

void logInfo(std::string_view message);
void logWarning(std::string_view message);
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

void write(LogLevel level, std::string_view message);

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    if (minimumLevel() > LogLevel::Info) return;
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(msg);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logWarning(First&& first, Rest&&... rest) {
    if (minimumLevel() > LogLevel::Warning) return;
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logWarning(msg);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(msg);
}

} // namespace lumen::log

namespace lumen {
using log::LogLevel;
using log::LogHandler;
using log::setLogHandler;
using log::resetLogHandler;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace lumen
