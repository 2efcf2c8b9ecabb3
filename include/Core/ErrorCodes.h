#pragma once
/**
 * @file ErrorCodes.h
 * @brief Error taxonomy shared by the protocol core, backends and HTTP API.
 */

#include <stddef.h>
#include <stdint.h>

enum class ErrorCode : uint8_t {
    Ok = 0,
    Incomplete = 1,         ///< not enough bytes yet, never surfaced
    InvalidOpcode = 2,
    BackendFailure = 3,
    ConnectionClosed = 4,
    ConnectionIOError = 5,
    BadRequest = 6,
    Overflow = 7,
    NotReady = 8
};

const char* errorCodeStr(ErrorCode code);

/**
 * @brief Write `{"error":"<message>","code":"<code>"}` into out.
 *
 * Quotes, backslashes and control characters in message are replaced by
 * spaces. Returns false when out is too small (out is still terminated).
 */
bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* message);
