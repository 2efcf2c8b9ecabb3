#pragma once
/**
 * @file PosixSocketStream.h
 * @brief IByteStream over a connected POSIX socket.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/ByteStream.h"

class PosixSocketStream final : public IByteStream {
public:
    /** Does not take ownership of fd. */
    explicit PosixSocketStream(int fd);

    int read(uint8_t* out, size_t maxLen) override;
    bool writeAll(const uint8_t* data, size_t len) override;
    bool flush() override { return true; }
    const char* peerName() const override { return peer_; }

private:
    int fd_;
    char peer_[48] = {0};
};
