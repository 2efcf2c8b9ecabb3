#pragma once
/**
 * @file SigmaCodec.h
 * @brief Stateless decoder/encoder for sigma TCP command and response frames.
 *
 * Every function here is a pure function of its arguments. Decoded write
 * payloads point into the caller's buffer and are valid only while that
 * buffer is left untouched.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/SigmaTcpProtocol.h"

enum class CommandKind : uint8_t {
    Read = 0,
    Write = 1,
    Unknown = 2
};

struct ReadCommand {
    uint8_t control = SigmaTcpProtocol::OpRead;
    uint32_t totalLen = 0;
    uint8_t chipAddr = 0;
    uint32_t dataLen = 0;
    uint16_t paramAddr = 0;
};

struct WriteCommand {
    uint8_t control = SigmaTcpProtocol::OpWrite;
    uint8_t safeload = 0;
    uint8_t channel = 0;
    uint32_t totalLen = 0;
    uint8_t chipAddr = 0;
    uint32_t dataLen = 0;
    uint16_t paramAddr = 0;
    const uint8_t* payload = nullptr;  ///< dataLen bytes inside the parsed buffer
};

struct Command {
    CommandKind kind = CommandKind::Unknown;
    ReadCommand read{};
    WriteCommand write{};
    uint8_t opcode = 0;  ///< first byte of the frame, kept for every kind
};

enum class ParseStatus : uint8_t {
    Complete = 0,
    Incomplete = 1,
    Invalid = 2
};

struct ParseResult {
    ParseStatus status = ParseStatus::Incomplete;
    Command command{};
    /** Bytes making up the command; 0 unless Complete. */
    size_t consumed = 0;
    /** Total frame size once known (Incomplete and Complete), 0 otherwise. */
    size_t required = 0;
    /** Trailer bytes a Read declared beyond its header via total_len. */
    size_t paddingDeclared = 0;
};

enum class ResponseKind : uint8_t {
    Read = 0,
    Write = 1,
    Error = 2
};

struct ResponseHeader {
    uint8_t control = SigmaTcpProtocol::OpResponse;
    uint32_t totalLen = SigmaTcpProtocol::ResponseDeclaredBase;
    uint8_t chipAddr = 0;
    uint32_t dataLen = 0;
    uint16_t paramAddr = 0;
    uint8_t success = SigmaTcpProtocol::SuccessOk;
    uint8_t reserved = 0;
};

struct Response {
    ResponseKind kind = ResponseKind::Error;
    ResponseHeader header{};
    const uint8_t* payload = nullptr;
    size_t payloadLen = 0;
    char message[96] = {0};  ///< Error responses only; never framed on the wire
};

namespace SigmaCodec {

/** Decode the command at the start of buf. */
ParseResult parse(const uint8_t* buf, size_t len);

Response makeReadResponse(uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr,
                          const uint8_t* payload, size_t payloadLen);
Response makeWriteResponse(uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr);
/** Header-only response with success = SuccessFailed. */
Response makeFailureResponse(uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr);
Response makeErrorResponse(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

/** Bytes encodeResponse() will produce; 0 for error responses. */
size_t encodedSize(const Response& resp);

/**
 * @brief Serialize resp into out.
 *
 * Returns the number of bytes written, or 0 when resp is an error response
 * or out is too small. resp.payload may already live at out + header size.
 */
size_t encodeResponse(const Response& resp, uint8_t* out, size_t outLen);

/** Serialize only the response header. Returns header size or 0. */
size_t encodeResponseHeader(const ResponseHeader& hdr, uint8_t* out, size_t outLen);

/**
 * @brief Decode a response frame (header + payload).
 *
 * The payload length is taken from totalLen - 13 so read and write responses
 * are both handled. Returns Incomplete until the whole frame is present and
 * Invalid when the opcode is not a response.
 */
ParseStatus parseResponse(const uint8_t* buf, size_t len, Response& out, size_t& consumed);

}  // namespace SigmaCodec
