/**
 * @file LogSink.cpp
 * @brief Log formatting, level filter and sink dispatch.
 */

#include "Core/LogSink.h"

#include <atomic>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>

namespace {

constexpr size_t kLineMax = 256;

std::atomic<uint8_t> gLevel{(uint8_t)LogLevel::Info};
std::mutex gSinkMutex;
LogSinkFn gSink = nullptr;
void* gSinkCtx = nullptr;

char levelLetter_(LogLevel level)
{
    switch (level) {
    case LogLevel::Error: return 'E';
    case LogLevel::Warn: return 'W';
    case LogLevel::Info: return 'I';
    case LogLevel::Debug: return 'D';
    default: return '?';
    }
}

void stdioSink_(void*, LogLevel level, const char* tag, const char* line)
{
    FILE* out = (level <= LogLevel::Warn) ? stderr : stdout;
    fprintf(out, "[%c][%s] %s\n", levelLetter_(level), tag ? tag : "?", line);
    fflush(out);
}

void dispatch_(LogLevel level, const char* tag, const char* line)
{
    std::lock_guard<std::mutex> guard(gSinkMutex);
    if (gSink) {
        gSink(gSinkCtx, level, tag, line);
    } else {
        stdioSink_(nullptr, level, tag, line);
    }
}

}  // namespace

void logSetLevel(LogLevel level)
{
    gLevel.store((uint8_t)level);
}

LogLevel logLevel()
{
    return (LogLevel)gLevel.load();
}

bool logEnabled(LogLevel level)
{
    return (uint8_t)level <= gLevel.load();
}

void logSetSink(LogSinkFn fn, void* ctx)
{
    std::lock_guard<std::mutex> guard(gSinkMutex);
    gSink = fn;
    gSinkCtx = ctx;
}

void logWrite(LogLevel level, const char* tag, const char* fmt, ...)
{
    if (!logEnabled(level) || !fmt) return;

    char line[kLineMax];
    va_list ap;
    va_start(ap, fmt);
    const int n = vsnprintf(line, sizeof(line), fmt, ap);
    va_end(ap);
    if (n < 0) return;
    if ((size_t)n >= sizeof(line)) {
        // Mark truncation so long dumps are not mistaken for complete ones.
        memcpy(line + sizeof(line) - 4, "...", 4);
    }
    dispatch_(level, tag, line);
}

void logHexDump(LogLevel level, const char* tag, const char* label, const uint8_t* data, size_t len, size_t maxBytes)
{
    if (!logEnabled(level)) return;

    char line[kLineMax];
    int pos = snprintf(line, sizeof(line), "%s len=%u:", label ? label : "hex", (unsigned)len);
    if (pos < 0) return;

    const size_t shown = (len < maxBytes) ? len : maxBytes;
    for (size_t i = 0; data && i < shown; ++i) {
        if ((size_t)pos + 4 >= sizeof(line)) break;
        pos += snprintf(line + pos, sizeof(line) - (size_t)pos, " %02x", (unsigned)data[i]);
    }
    if (shown < len && (size_t)pos + 5 < sizeof(line)) {
        snprintf(line + pos, sizeof(line) - (size_t)pos, " ...");
    }
    dispatch_(level, tag, line);
}

const char* logLevelStr(LogLevel level)
{
    switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
    default: return "?";
    }
}

bool logLevelFromStr(const char* s, LogLevel& out)
{
    if (!s) return false;
    if (strcasecmp(s, "error") == 0) { out = LogLevel::Error; return true; }
    if (strcasecmp(s, "warn") == 0) { out = LogLevel::Warn; return true; }
    if (strcasecmp(s, "info") == 0) { out = LogLevel::Info; return true; }
    if (strcasecmp(s, "debug") == 0) { out = LogLevel::Debug; return true; }
    return false;
}
