#pragma once
/**
 * @file LogCapture.h
 * @brief Collects log lines for the lifetime of the object.
 */

#include <mutex>
#include <string>
#include <vector>

#include "Core/LogSink.h"

class LogCapture {
public:
    explicit LogCapture(LogLevel level = LogLevel::Debug)
        : previous_(logLevel())
    {
        logSetLevel(level);
        logSetSink(&LogCapture::sink_, this);
    }

    ~LogCapture()
    {
        logSetSink(nullptr, nullptr);
        logSetLevel(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(const std::string& needle) const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (const std::string& l : lines_) {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return lines_;
    }

private:
    LogLevel previous_;
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;

    static void sink_(void* ctx, LogLevel, const char* tag, const char* line)
    {
        LogCapture* self = static_cast<LogCapture*>(ctx);
        std::lock_guard<std::mutex> guard(self->mutex_);
        self->lines_.push_back(std::string("[") + tag + "] " + line);
    }
};
