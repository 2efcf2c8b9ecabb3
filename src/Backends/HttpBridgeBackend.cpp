/**
 * @file HttpBridgeBackend.cpp
 * @brief HTTP bridge backend implementation.
 */

#include "Backends/HttpBridgeBackend.h"

#include <ArduinoJson.h>
#include <string.h>
#include <vector>

#include "Core/HexText.h"

#define LOG_TAG "HttpBrdg"
#include "Core/ModuleLog.h"

HttpBridgeBackend::HttpBridgeBackend(IHttpTransport& transport, const char* baseUrl)
    : transport_(transport),
      baseUrl_(baseUrl ? baseUrl : "")
{
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

bool HttpBridgeBackend::fetchJson_(const std::string& url, std::string& body, BackendError& err)
{
    int status = 0;
    if (!transport_.get(url, status, body)) {
        err.set(ErrorCode::BackendFailure, "request failed");
        return false;
    }
    LOGD("GET %s -> %d", url.c_str(), status);
    if (status != 200) {
        // The bridge still sends a JSON error body; keep its message when present.
        StaticJsonDocument<512> doc;
        if (!deserializeJson(doc, body) && doc["error"].is<const char*>()) {
            err.set(ErrorCode::BackendFailure, "http %d: %s", status, doc["error"].as<const char*>());
        } else {
            err.set(ErrorCode::BackendFailure, "http %d", status);
        }
        return false;
    }
    return true;
}

bool HttpBridgeBackend::read(uint16_t address, uint8_t* out, size_t len, BackendError& err)
{
    if (len > 0xFFFFu) {
        err.set(ErrorCode::Overflow, "read of %lu bytes exceeds 65535", (unsigned long)len);
        return false;
    }
    if (!out && len > 0) {
        err.set(ErrorCode::BadRequest, "null read buffer");
        return false;
    }

    std::lock_guard<std::mutex> guard(mutex_);

    std::string url = baseUrl_;
    url += "/read?addr=";
    url += HexText::toAddr(address);
    url += "&len=";
    url += std::to_string((unsigned)len);

    std::string body;
    if (!fetchJson_(url, body, err)) return false;

    DynamicJsonDocument doc(512 + body.size());
    const DeserializationError jerr = deserializeJson(doc, body);
    if (jerr) {
        err.set(ErrorCode::BackendFailure, "bad json: %s", jerr.c_str());
        return false;
    }
    if (doc["error"].is<const char*>()) {
        err.set(ErrorCode::BackendFailure, "%s", doc["error"].as<const char*>());
        return false;
    }
    const char* dataText = doc["data"].as<const char*>();
    std::vector<uint8_t> bytes;
    if (!dataText || !HexText::parseByteList(dataText, bytes)) {
        err.set(ErrorCode::BackendFailure, "reply has no byte list");
        return false;
    }
    if (bytes.size() != len) {
        err.set(ErrorCode::BackendFailure, "reply has %u bytes, expected %u",
                (unsigned)bytes.size(),
                (unsigned)len);
        return false;
    }
    if (len > 0) memcpy(out, bytes.data(), len);
    return true;
}

bool HttpBridgeBackend::write(uint16_t address, const uint8_t* data, size_t len, BackendError& err)
{
    if (!data && len > 0) {
        err.set(ErrorCode::BadRequest, "null write buffer");
        return false;
    }

    std::lock_guard<std::mutex> guard(mutex_);

    std::string url = baseUrl_;
    url += "/write?addr=";
    url += HexText::toAddr(address);
    url += "&data=";
    url += HexText::toHexBytes(data, len);

    std::string body;
    if (!fetchJson_(url, body, err)) return false;

    // data_written echoes the whole payload; only the verdict matters here.
    StaticJsonDocument<64> filter;
    filter["status"] = true;
    filter["error"] = true;
    StaticJsonDocument<256> doc;
    const DeserializationError jerr = deserializeJson(doc, body, DeserializationOption::Filter(filter));
    if (jerr) {
        err.set(ErrorCode::BackendFailure, "bad json: %s", jerr.c_str());
        return false;
    }
    const char* status = doc["status"] | "";
    if (strcmp(status, "ok") != 0) {
        const char* msg = doc["error"] | "write not acknowledged";
        err.set(ErrorCode::BackendFailure, "%s", msg);
        return false;
    }
    return true;
}
