#include "log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace Log {

static std::mutex             s_sinkMutex;
static LogSink                s_sink = nullptr;
static std::atomic<int>       s_minLevel{LOGL_INFO};

static void StderrSink(ELogLevel aLevel, const char* aChannel, const char* aMessage) {
    fprintf(stderr, "[%s] %s: %s\n", aChannel, LevelName(aLevel), aMessage);
    fflush(stderr);
}

void SetSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(s_sinkMutex);
    s_sink = sink;
}

void SetMinLevel(ELogLevel level) {
    s_minLevel = level;
}

ELogLevel GetMinLevel() {
    return static_cast<ELogLevel>(s_minLevel.load());
}

void Write(ELogLevel level, const char* channel, const std::string& message) {
    if (level > s_minLevel) return;

    // Held while the sink runs so lines from different threads don't interleave
    std::lock_guard<std::mutex> lock(s_sinkMutex);
    LogSink sink = s_sink ? s_sink : StderrSink;
    sink(level, channel ? channel : "", message.c_str());
}

void Writef(ELogLevel level, const char* channel, const char* format, ...) {
    if (level > s_minLevel) return;

    char msg[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(msg, sizeof(msg), format, args);
    va_end(args);

    Write(level, channel, msg);
}

const char* LevelName(ELogLevel level) {
    switch (level) {
        case LOGL_CRITICAL: return "CRITICAL";
        case LOGL_WARNING:  return "WARNING";
        case LOGL_INFO:     return "INFO";
        case LOGL_DEBUG:    return "DEBUG";
        case LOGL_TRACE:    return "TRACE";
    }
    return "UNKNOWN";
}

} // namespace Log
