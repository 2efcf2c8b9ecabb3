#pragma once
/**
 * @file ModuleLog.h
 * @brief Tagged log macros.
 *
 * Usage:
 *   #define LOG_TAG "TcpBrdg"
 *   #include "Core/ModuleLog.h"
 */

#include "Core/LogSink.h"

#ifndef LOG_TAG
#define LOG_TAG "app"
#endif

#define LOGE(...) logWrite(LogLevel::Error, LOG_TAG, __VA_ARGS__)
#define LOGW(...) logWrite(LogLevel::Warn, LOG_TAG, __VA_ARGS__)
#define LOGI(...) logWrite(LogLevel::Info, LOG_TAG, __VA_ARGS__)
#define LOGD(...)                                                  \
    do {                                                           \
        if (logEnabled(LogLevel::Debug)) {                         \
            logWrite(LogLevel::Debug, LOG_TAG, __VA_ARGS__);       \
        }                                                          \
    } while (0)

#define LOG_HEXD(label, data, len) \
    logHexDump(LogLevel::Debug, LOG_TAG, (label), (data), (len), 64U)
