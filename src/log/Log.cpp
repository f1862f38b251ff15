#include "etherstream/log/Log.hpp"

#include <array>
#include <cstddef>
#include <iostream>
#include <mutex>

namespace etherstream::log {

namespace {

LogHandler makeStdoutSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeStderrSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

LogHandler makeDefaultSink(Level level) {
    return level == Level::Info ? makeStdoutSink() : makeStderrSink();
}

std::size_t slot(Level level) {
    return static_cast<std::size_t>(level);
}

std::mutex sinkMutex;
std::array<LogHandler, 3> handlers{
    makeDefaultSink(Level::Info),
    makeDefaultSink(Level::Warning),
    makeDefaultSink(Level::Error)
};

} // namespace

void setLogHandler(Level level, LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    handlers[slot(level)] = handler ? std::move(handler) : makeDefaultSink(level);
}

void setLogHandlers(LogHandler infoHandler, LogHandler warningHandler, LogHandler errorHandler) {
    setLogHandler(Level::Info, std::move(infoHandler));
    setLogHandler(Level::Warning, std::move(warningHandler));
    setLogHandler(Level::Error, std::move(errorHandler));
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    handlers[slot(Level::Info)] = makeDefaultSink(Level::Info);
    handlers[slot(Level::Warning)] = makeDefaultSink(Level::Warning);
    handlers[slot(Level::Error)] = makeDefaultSink(Level::Error);
}

void log(Level level, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = handlers[slot(level)];
    }
    // Invoke outside the lock so a handler may log again.
    if (handler) {
        handler(message);
    }
}

void logInfo(std::string_view message) {
    log(Level::Info, message);
}

void logWarning(std::string_view message) {
    log(Level::Warning, message);
}

void logError(std::string_view message) {
    log(Level::Error, message);
}

const char* toString(Level level) {
    switch (level) {
        case Level::Info:    return "info";
        case Level::Warning: return "warning";
        case Level::Error:   return "error";
    }
    return "unknown";
}

} // namespace etherstream::log
