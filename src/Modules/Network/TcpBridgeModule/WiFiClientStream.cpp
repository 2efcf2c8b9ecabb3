/**
 * @file WiFiClientStream.cpp
 */

#include "WiFiClientStream.h"

namespace {
constexpr uint32_t kIdlePollMs = 2;
}

WiFiClientStream::WiFiClientStream(WiFiClient& client)
    : client_(client)
{
    const IPAddress ip = client_.remoteIP();
    snprintf(peer_, sizeof(peer_), "%u.%u.%u.%u:%u", ip[0], ip[1], ip[2], ip[3], (unsigned)client_.remotePort());
}

int WiFiClientStream::read(uint8_t* out, size_t maxLen)
{
    for (;;) {
        const int avail = client_.available();
        if (avail > 0) {
            const size_t want = ((size_t)avail < maxLen) ? (size_t)avail : maxLen;
            const int n = client_.read(out, want);
            return (n < 0) ? -1 : n;
        }
        if (!client_.connected()) return 0;
        vTaskDelay(pdMS_TO_TICKS(kIdlePollMs));
    }
}

bool WiFiClientStream::writeAll(const uint8_t* data, size_t len)
{
    size_t off = 0;
    while (off < len) {
        const size_t n = client_.write(data + off, len - off);
        if (n == 0) {
            if (!client_.connected()) return false;
            vTaskDelay(pdMS_TO_TICKS(kIdlePollMs));
            continue;
        }
        off += n;
    }
    return true;
}
