#pragma once
/**
 * @file RegisterHttpApi.h
 * @brief Request logic of the HTTP register API, independent of the web server.
 *
 * Routes (all GET):
 *   /                      -> "ok"
 *   /read?addr=&len=       -> {"addr":"0x003b","len":4,"data":"[0x01, 0x02, 0x03, 0x04]"}
 *   /write?addr=&data=     -> {"status":"ok","addr":"0x003b","data_written":"[0x01]","length":1}
 *
 * addr and len take "0x"-prefixed hex or decimal; data is contiguous hex.
 * Failures answer {"error":"..."}.
 */

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "Core/Services/IRegisterBackend.h"

struct HttpReply {
    int status = 200;
    const char* contentType = "application/json";
    std::string body;
};

struct HttpHeader {
    const char* name;
    const char* value;
};

class RegisterHttpApi {
public:
    static constexpr size_t DefaultMaxReadLen = 4096;

    static const HttpHeader CorsHeaders[3];

    explicit RegisterHttpApi(IRegisterBackend& backend, size_t maxReadLen = DefaultMaxReadLen)
        : backend_(backend), maxReadLen_(maxReadLen) {}

    HttpReply health() const;

    /** addr/len are raw query values, nullptr when absent. */
    HttpReply read(const char* addr, const char* len);
    HttpReply write(const char* addr, const char* data);

    uint32_t requestCount() const { return requests_; }
    uint32_t failureCount() const { return failures_; }

private:
    IRegisterBackend& backend_;
    size_t maxReadLen_;
    uint32_t requests_ = 0;
    uint32_t failures_ = 0;

    HttpReply error_(int status, ErrorCode code, const char* message);
};
