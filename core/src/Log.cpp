#include "websink/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace websink {

namespace {

std::mutex gSinkMutex;
LogSink gSink;
std::atomic<int> gLevel{WEBSINK_LOG_INFO};

void defaultSink(websink_log_level_t level, const char* msg) {
    std::cerr << "[websink][" << logLevelName(level) << "] " << (msg ? msg : "(null)") << std::endl;
}

} // namespace

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(gSinkMutex);
    gSink = std::move(sink);
}

void setLogLevel(websink_log_level_t level) {
    gLevel.store(level);
}

websink_log_level_t logLevel() {
    return static_cast<websink_log_level_t>(gLevel.load());
}

websink_log_level_t parseLogLevel(const std::string& name) {
    if (name == "debug") return WEBSINK_LOG_DEBUG;
    if (name == "info") return WEBSINK_LOG_INFO;
    if (name == "warn" || name == "warning") return WEBSINK_LOG_WARN;
    if (name == "error") return WEBSINK_LOG_ERROR;
    throw std::invalid_argument("unknown log level: " + name);
}

const char* logLevelName(websink_log_level_t level) {
    switch (level) {
        case WEBSINK_LOG_DEBUG: return "DEBUG";
        case WEBSINK_LOG_INFO: return "INFO";
        case WEBSINK_LOG_WARN: return "WARN";
        case WEBSINK_LOG_ERROR: return "ERROR";
    }
    return "INFO";
}

void logf(websink_log_level_t level, const char* fmt, ...) {
    if (static_cast<int>(level) < gLevel.load()) return;

    char buf[512];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(gSinkMutex);
        sink = gSink;
    }
    if (sink) {
        sink(level, buf);
    } else {
        defaultSink(level, buf);
    }
}

} // namespace websink
