#pragma once
/**
 * @file ByteStream.h
 * @brief Blocking byte stream seen by a connection handler.
 */

#include <stddef.h>
#include <stdint.h>

class IByteStream {
public:
    virtual ~IByteStream() = default;

    /**
     * @brief Block until at least one byte is available.
     *
     * Returns the number of bytes stored in out, 0 when the peer closed the
     * stream, or a negative value on I/O error.
     */
    virtual int read(uint8_t* out, size_t maxLen) = 0;

    /** Write every byte or fail. */
    virtual bool writeAll(const uint8_t* data, size_t len) = 0;

    /** Push buffered output to the peer. */
    virtual bool flush() = 0;

    /** Peer description for logs (address:port or similar). */
    virtual const char* peerName() const = 0;
};
