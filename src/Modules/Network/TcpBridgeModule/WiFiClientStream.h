#pragma once
/**
 * @file WiFiClientStream.h
 * @brief IByteStream over an accepted WiFiClient.
 */

#include <WiFi.h>

#include "Core/ByteStream.h"

class WiFiClientStream final : public IByteStream {
public:
    explicit WiFiClientStream(WiFiClient& client);

    int read(uint8_t* out, size_t maxLen) override;
    bool writeAll(const uint8_t* data, size_t len) override;
    /** WiFiClient::flush() discards pending input on ESP32; output is unbuffered. */
    bool flush() override { return true; }
    const char* peerName() const override { return peer_; }

private:
    WiFiClient& client_;
    char peer_[24] = {0};
};
