#pragma once

#include <string>

// Host-side logging. Lines go to stderr unless the embedding application
// installs its own sink.
namespace Log {

enum ELogLevel {
    LOGL_CRITICAL = 1,
    LOGL_WARNING  = 2,
    LOGL_INFO     = 3,
    LOGL_DEBUG    = 4,
    LOGL_TRACE    = 5,
};

// Sink signature matches Write(): level, channel, message.
typedef void (*LogSink)(ELogLevel aLevel, const char* aChannel, const char* aMessage);

// Replace the active sink. Pass nullptr to restore the stderr sink.
void SetSink(LogSink sink);

// Messages above this level are discarded. Defaults to LOGL_INFO.
void SetMinLevel(ELogLevel level);
ELogLevel GetMinLevel();

void Write(ELogLevel level, const char* channel, const std::string& message);

// Printf-style convenience for messages with numeric fields.
void Writef(ELogLevel level, const char* channel, const char* format, ...);

const char* LevelName(ELogLevel level);

} // namespace Log
