/**
 * @file ErrorCodes.cpp
 * @brief Error code names and JSON error bodies.
 */

#include "Core/ErrorCodes.h"

#include <stdio.h>

const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Ok: return "ok";
    case ErrorCode::Incomplete: return "incomplete";
    case ErrorCode::InvalidOpcode: return "invalid_opcode";
    case ErrorCode::BackendFailure: return "backend_failure";
    case ErrorCode::ConnectionClosed: return "connection_closed";
    case ErrorCode::ConnectionIOError: return "connection_io_error";
    case ErrorCode::BadRequest: return "bad_request";
    case ErrorCode::Overflow: return "overflow";
    case ErrorCode::NotReady: return "not_ready";
    default: return "unknown";
    }
}

bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* message)
{
    if (!out || outLen == 0) return false;

    char safe[160] = {0};
    size_t w = 0;
    if (message) {
        for (size_t i = 0; message[i] != '\0' && w + 1 < sizeof(safe); ++i) {
            const char c = message[i];
            if (c == '"' || c == '\\' || (unsigned char)c < 0x20) {
                safe[w++] = ' ';
            } else {
                safe[w++] = c;
            }
        }
    }
    safe[w] = '\0';

    const int n = snprintf(out, outLen, "{\"error\":\"%s\",\"code\":\"%s\"}", safe, errorCodeStr(code));
    if (n <= 0) {
        out[0] = '\0';
        return false;
    }
    return (size_t)n < outLen;
}
