#pragma once
/**
 * @file HttpBridgeBackend.h
 * @brief Backend forwarding register access to a remote bridge's HTTP API.
 */

#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "Core/Services/IRegisterBackend.h"

/** Minimal blocking HTTP GET used by the bridge backend. */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * @brief Perform GET url.
     *
     * Returns false on transport failure (no HTTP status received); otherwise
     * statusOut and bodyOut hold the reply.
     */
    virtual bool get(const std::string& url, int& statusOut, std::string& bodyOut) = 0;
};

class HttpBridgeBackend final : public IRegisterBackend {
public:
    HttpBridgeBackend(IHttpTransport& transport, const char* baseUrl);

    const char* backendId() const override { return "http"; }
    bool read(uint16_t address, uint8_t* out, size_t len, BackendError& err) override;
    bool write(uint16_t address, const uint8_t* data, size_t len, BackendError& err) override;

    const std::string& baseUrl() const { return baseUrl_; }

private:
    IHttpTransport& transport_;
    std::string baseUrl_;
    std::mutex mutex_;

    bool fetchJson_(const std::string& url, std::string& body, BackendError& err);
};
