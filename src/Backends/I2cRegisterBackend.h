#pragma once
/**
 * @file I2cRegisterBackend.h
 * @brief DSP register access over the I2C control port.
 *
 * Register addresses travel as a 2-byte big-endian pointer written ahead of
 * the data. Reads are pointer-write then data-read; writes send the pointer
 * and the payload in one transaction.
 */

#include <atomic>
#include <stddef.h>
#include <stdint.h>

#include "Core/I2cLink.h"
#include "Core/Services/IRegisterBackend.h"

class I2cRegisterBackend final : public IRegisterBackend {
public:
    I2cRegisterBackend(I2cLink& link, uint8_t deviceAddress)
        : link_(link), device_(deviceAddress) {}

    const char* backendId() const override { return "I2C"; }
    bool read(uint16_t address, uint8_t* out, size_t len, BackendError& err) override;
    bool write(uint16_t address, const uint8_t* data, size_t len, BackendError& err) override;

    uint8_t deviceAddress() const { return device_; }
    void setDeviceAddress(uint8_t address) { device_ = address; }

    /** Calls fail with NotReady until the device has been seen on the bus. */
    void setOnline(bool online) { online_.store(online); }
    bool online() const { return online_.load(); }

private:
    I2cLink& link_;
    uint8_t device_;
    std::atomic<bool> online_{false};
};
