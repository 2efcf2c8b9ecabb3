/**
 * @file SigmaCodec.cpp
 * @brief Sigma TCP frame decoding and response encoding.
 */

#include "Core/SigmaCodec.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

using namespace SigmaTcpProtocol;

namespace {

uint32_t readBe32_(const uint8_t* p)
{
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

uint16_t readBe16_(const uint8_t* p)
{
    return (uint16_t)(((uint16_t)p[0] << 8) | (uint16_t)p[1]);
}

void writeBe32_(uint8_t* p, uint32_t v)
{
    p[0] = (uint8_t)(v >> 24);
    p[1] = (uint8_t)(v >> 16);
    p[2] = (uint8_t)(v >> 8);
    p[3] = (uint8_t)v;
}

void writeBe16_(uint8_t* p, uint16_t v)
{
    p[0] = (uint8_t)(v >> 8);
    p[1] = (uint8_t)v;
}

ParseResult parseRead_(const uint8_t* buf, size_t len)
{
    ParseResult r{};
    r.command.opcode = buf[0];
    r.required = ReadHeaderSize;
    if (len < ReadHeaderSize) {
        r.status = ParseStatus::Incomplete;
        return r;
    }

    ReadCommand& cmd = r.command.read;
    cmd.control = buf[0];
    cmd.totalLen = readBe32_(buf + ReadOffTotalLen);
    cmd.chipAddr = buf[ReadOffChipAddr];
    cmd.dataLen = readBe32_(buf + ReadOffDataLen);
    cmd.paramAddr = readBe16_(buf + ReadOffParamAddr);

    r.command.kind = CommandKind::Read;
    r.status = ParseStatus::Complete;
    r.consumed = ReadHeaderSize;
    r.paddingDeclared = (cmd.totalLen > ReadHeaderSize) ? (size_t)(cmd.totalLen - ReadHeaderSize) : 0;
    return r;
}

ParseResult parseWrite_(const uint8_t* buf, size_t len)
{
    ParseResult r{};
    r.command.opcode = buf[0];
    r.required = WriteHeaderSize;
    if (len < WriteHeaderSize) {
        r.status = ParseStatus::Incomplete;
        return r;
    }

    const uint32_t dataLen = readBe32_(buf + WriteOffDataLen);
    // Widen before adding so a hostile data_len cannot wrap on 32-bit targets.
    const uint64_t frameLen = (uint64_t)WriteHeaderSize + (uint64_t)dataLen;
    r.required = (frameLen > (uint64_t)SIZE_MAX) ? SIZE_MAX : (size_t)frameLen;
    if ((uint64_t)len < frameLen) {
        r.status = ParseStatus::Incomplete;
        return r;
    }

    WriteCommand& cmd = r.command.write;
    cmd.control = buf[0];
    cmd.safeload = buf[WriteOffSafeload];
    cmd.channel = buf[WriteOffChannel];
    cmd.totalLen = readBe32_(buf + WriteOffTotalLen);
    cmd.chipAddr = buf[WriteOffChipAddr];
    cmd.dataLen = dataLen;
    cmd.paramAddr = readBe16_(buf + WriteOffParamAddr);
    cmd.payload = buf + WriteHeaderSize;

    r.command.kind = CommandKind::Write;
    r.status = ParseStatus::Complete;
    r.consumed = (size_t)frameLen;
    return r;
}

}  // namespace

namespace SigmaCodec {

ParseResult parse(const uint8_t* buf, size_t len)
{
    if (!buf || len == 0) {
        ParseResult r{};
        r.status = ParseStatus::Incomplete;
        return r;
    }

    switch (buf[0]) {
    case OpRead: return parseRead_(buf, len);
    case OpWrite: return parseWrite_(buf, len);
    default: {
        ParseResult r{};
        r.status = ParseStatus::Invalid;
        r.command.kind = CommandKind::Unknown;
        r.command.opcode = buf[0];
        return r;
    }
    }
}

Response makeReadResponse(uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr,
                          const uint8_t* payload, size_t payloadLen)
{
    Response resp{};
    resp.kind = ResponseKind::Read;
    resp.header.totalLen = ResponseDeclaredBase + (uint32_t)payloadLen;
    resp.header.chipAddr = chipAddr;
    resp.header.dataLen = dataLen;
    resp.header.paramAddr = paramAddr;
    resp.payload = payload;
    resp.payloadLen = payloadLen;
    return resp;
}

Response makeWriteResponse(uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr)
{
    Response resp{};
    resp.kind = ResponseKind::Write;
    resp.header.totalLen = ResponseDeclaredBase;
    resp.header.chipAddr = chipAddr;
    resp.header.dataLen = dataLen;
    resp.header.paramAddr = paramAddr;
    return resp;
}

Response makeFailureResponse(uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr)
{
    Response resp = makeWriteResponse(chipAddr, dataLen, paramAddr);
    resp.header.success = SuccessFailed;
    return resp;
}

Response makeErrorResponse(const char* fmt, ...)
{
    Response resp{};
    resp.kind = ResponseKind::Error;
    if (fmt) {
        va_list ap;
        va_start(ap, fmt);
        vsnprintf(resp.message, sizeof(resp.message), fmt, ap);
        va_end(ap);
    }
    return resp;
}

size_t encodedSize(const Response& resp)
{
    if (resp.kind == ResponseKind::Error) return 0;
    const size_t payloadLen = (resp.kind == ResponseKind::Read) ? resp.payloadLen : 0;
    return ResponseHeaderSize + payloadLen;
}

size_t encodeResponseHeader(const ResponseHeader& hdr, uint8_t* out, size_t outLen)
{
    if (!out || outLen < ResponseHeaderSize) return 0;
    out[0] = hdr.control;
    writeBe32_(out + RespOffTotalLen, hdr.totalLen);
    out[RespOffChipAddr] = hdr.chipAddr;
    writeBe32_(out + RespOffDataLen, hdr.dataLen);
    writeBe16_(out + RespOffParamAddr, hdr.paramAddr);
    out[RespOffSuccess] = hdr.success;
    out[RespOffReserved] = hdr.reserved;
    return ResponseHeaderSize;
}

size_t encodeResponse(const Response& resp, uint8_t* out, size_t outLen)
{
    const size_t total = encodedSize(resp);
    if (total == 0 || !out || outLen < total) return 0;

    if (resp.kind == ResponseKind::Read && resp.payloadLen > 0) {
        if (!resp.payload) return 0;
        uint8_t* dst = out + ResponseHeaderSize;
        if (resp.payload != dst) {
            memmove(dst, resp.payload, resp.payloadLen);
        }
    }
    (void)encodeResponseHeader(resp.header, out, outLen);
    return total;
}

ParseStatus parseResponse(const uint8_t* buf, size_t len, Response& out, size_t& consumed)
{
    consumed = 0;
    out = Response{};
    if (!buf || len == 0) return ParseStatus::Incomplete;
    if (buf[0] != OpResponse) return ParseStatus::Invalid;
    if (len < ResponseHeaderSize) return ParseStatus::Incomplete;

    ResponseHeader& hdr = out.header;
    hdr.control = buf[0];
    hdr.totalLen = readBe32_(buf + RespOffTotalLen);
    hdr.chipAddr = buf[RespOffChipAddr];
    hdr.dataLen = readBe32_(buf + RespOffDataLen);
    hdr.paramAddr = readBe16_(buf + RespOffParamAddr);
    hdr.success = buf[RespOffSuccess];
    hdr.reserved = buf[RespOffReserved];

    if (hdr.totalLen < ResponseDeclaredBase) return ParseStatus::Invalid;
    const size_t payloadLen = (size_t)(hdr.totalLen - ResponseDeclaredBase);
    if (len - ResponseHeaderSize < payloadLen) return ParseStatus::Incomplete;

    out.kind = (payloadLen > 0) ? ResponseKind::Read : ResponseKind::Write;
    out.payload = (payloadLen > 0) ? (buf + ResponseHeaderSize) : nullptr;
    out.payloadLen = payloadLen;
    consumed = ResponseHeaderSize + payloadLen;
    return ParseStatus::Complete;
}

}  // namespace SigmaCodec
