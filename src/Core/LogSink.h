#pragma once
/**
 * @file LogSink.h
 * @brief Process-wide log level and output sink.
 *
 * Modules do not call this directly; they use the LOGx macros from
 * Core/ModuleLog.h with a file-local LOG_TAG.
 */

#include <stddef.h>
#include <stdint.h>

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

/** Receives one fully formatted line (no trailing newline). */
typedef void (*LogSinkFn)(void* ctx, LogLevel level, const char* tag, const char* line);

void logSetLevel(LogLevel level);
LogLevel logLevel();
bool logEnabled(LogLevel level);

/** Replace the output sink. Passing nullptr restores the stdio sink. */
void logSetSink(LogSinkFn fn, void* ctx);

void logWrite(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/** Debug hex dump, truncated to the first maxBytes bytes. */
void logHexDump(LogLevel level, const char* tag, const char* label, const uint8_t* data, size_t len, size_t maxBytes);

const char* logLevelStr(LogLevel level);
bool logLevelFromStr(const char* s, LogLevel& out);
