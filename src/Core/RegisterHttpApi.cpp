/**
 * @file RegisterHttpApi.cpp
 * @brief HTTP register API request handling.
 */

#include "Core/RegisterHttpApi.h"

#include <ArduinoJson.h>
#include <stdio.h>
#include <vector>

#include "Core/HexText.h"

#define LOG_TAG "HttpApi"
#include "Core/ModuleLog.h"

const HttpHeader RegisterHttpApi::CorsHeaders[3] = {
    {"Access-Control-Allow-Origin", "*"},
    {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
    {"Access-Control-Allow-Headers", "Content-Type"},
};

HttpReply RegisterHttpApi::health() const
{
    HttpReply reply{};
    reply.contentType = "text/plain";
    reply.body = "ok";
    return reply;
}

HttpReply RegisterHttpApi::error_(int status, ErrorCode code, const char* message)
{
    ++failures_;
    HttpReply reply{};
    reply.status = status;
    char body[224] = {0};
    (void)writeErrorJson(body, sizeof(body), code, message);
    reply.body = body;
    return reply;
}

HttpReply RegisterHttpApi::read(const char* addrText, const char* lenText)
{
    ++requests_;
    uint16_t addr = 0;
    uint16_t len = 0;
    if (!HexText::parseU16(addrText, addr)) {
        return error_(400, ErrorCode::BadRequest, "missing or invalid addr");
    }
    if (!HexText::parseU16(lenText, len)) {
        return error_(400, ErrorCode::BadRequest, "missing or invalid len");
    }
    if ((size_t)len > maxReadLen_) {
        char msg[64];
        snprintf(msg, sizeof(msg), "len %u exceeds limit %u", (unsigned)len, (unsigned)maxReadLen_);
        return error_(400, ErrorCode::Overflow, msg);
    }

    LOGI("Reading from address: 0x%04x length: %u", (unsigned)addr, (unsigned)len);

    std::vector<uint8_t> data(len);
    BackendError err{};
    if (!backend_.read(addr, data.data(), data.size(), err)) {
        char msg[160];
        snprintf(msg, sizeof(msg), "Failed to read from %s: %s", backend_.backendId(), err.message);
        LOGE("%s", msg);
        return error_(500, ErrorCode::BackendFailure, msg);
    }

    const std::string addrStr = HexText::toAddr(addr);
    const std::string dataStr = HexText::toByteList(data.data(), data.size());

    StaticJsonDocument<192> doc;
    doc["addr"] = addrStr.c_str();
    doc["len"] = len;
    doc["data"] = dataStr.c_str();

    HttpReply reply{};
    serializeJson(doc, reply.body);
    return reply;
}

HttpReply RegisterHttpApi::write(const char* addrText, const char* dataText)
{
    ++requests_;
    uint16_t addr = 0;
    if (!HexText::parseU16(addrText, addr)) {
        return error_(400, ErrorCode::BadRequest, "missing or invalid addr");
    }
    std::vector<uint8_t> data;
    if (!dataText || !HexText::parseHexBytes(dataText, data)) {
        return error_(400, ErrorCode::BadRequest, "missing or invalid data");
    }

    LOGI("Writing to address: 0x%04x length: %u", (unsigned)addr, (unsigned)data.size());

    BackendError err{};
    if (!backend_.write(addr, data.data(), data.size(), err)) {
        char msg[160];
        snprintf(msg, sizeof(msg), "Failed to write to %s: %s", backend_.backendId(), err.message);
        LOGE("%s", msg);
        return error_(500, ErrorCode::BackendFailure, msg);
    }

    const std::string addrStr = HexText::toAddr(addr);
    const std::string dataStr = HexText::toByteList(data.data(), data.size());

    StaticJsonDocument<256> doc;
    doc["status"] = "ok";
    doc["addr"] = addrStr.c_str();
    doc["data_written"] = dataStr.c_str();
    doc["length"] = (uint32_t)data.size();

    HttpReply reply{};
    serializeJson(doc, reply.body);
    return reply;
}
