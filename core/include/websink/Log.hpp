#pragma once

#include <functional>
#include <string>
#include "websink_plugin.h"

namespace websink {

// Receives every formatted log line that passes the level threshold
using LogSink = std::function<void(websink_log_level_t, const char*)>;

// Replace the active sink; an empty sink restores the stderr default
void setLogSink(LogSink sink);

void setLogLevel(websink_log_level_t level);
websink_log_level_t logLevel();

// Parses "debug", "info", "warn"/"warning", "error"; throws std::invalid_argument otherwise
websink_log_level_t parseLogLevel(const std::string& name);
const char* logLevelName(websink_log_level_t level);

void logf(websink_log_level_t level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace websink
