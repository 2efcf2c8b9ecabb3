#pragma once
/**
 * @file IRegisterBackend.h
 * @brief Register access capability shared by every connection.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"

/** Failure detail filled by a backend when read/write returns false. */
struct BackendError {
    ErrorCode code = ErrorCode::Ok;
    char message[96] = {0};

    void set(ErrorCode c, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
    void clear();
};

/**
 * @brief Register-addressable device reached through one shared handle.
 *
 * Implementations serialize whole transactions internally: a two-phase read
 * (address pointer then data) holds the same lock from start to end, so
 * callers never need their own locking.
 */
class IRegisterBackend {
public:
    virtual ~IRegisterBackend() = default;

    virtual const char* backendId() const = 0;

    /** Fill out[0..len) from the registers starting at address. */
    virtual bool read(uint16_t address, uint8_t* out, size_t len, BackendError& err) = 0;

    /** Store data[0..len) to the registers starting at address. */
    virtual bool write(uint16_t address, const uint8_t* data, size_t len, BackendError& err) = 0;
};
