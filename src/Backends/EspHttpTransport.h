#pragma once
/**
 * @file EspHttpTransport.h
 * @brief IHttpTransport on the Arduino HTTPClient.
 */

#include <stdint.h>

#include "Backends/HttpBridgeBackend.h"

class EspHttpTransport final : public IHttpTransport {
public:
    explicit EspHttpTransport(uint16_t timeoutMs = 3000) : timeoutMs_(timeoutMs) {}

    bool get(const std::string& url, int& statusOut, std::string& bodyOut) override;

private:
    uint16_t timeoutMs_;
};
