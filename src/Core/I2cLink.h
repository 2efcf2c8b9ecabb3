#pragma once
/**
 * @file I2cLink.h
 * @brief Core I2C master helper shared by every register transaction.
 */

#include <Arduino.h>
#include <Wire.h>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

enum class I2cLinkStatus : uint8_t {
    Ok = 0,
    NotStarted = 1,
    TooLong = 2,
    Nack = 3,       ///< endTransmission() reported an error
    ShortRead = 4   ///< requestFrom() returned fewer bytes than asked
};

const char* i2cLinkStatusStr(I2cLinkStatus status);

class I2cLink {
public:
    I2cLink() = default;

    /** bufferSize bounds a single transfer (address pointer included). */
    bool beginMaster(uint8_t bus, int sda, int scl, uint32_t freqHz, size_t bufferSize);
    void end();

    bool started() const { return wire_ != nullptr; }
    size_t maxTransfer() const { return bufferSize_; }

    /**
     * @brief Write tx, then read rxLen bytes from the same device.
     *
     * The bus lock is held across both phases; no other transaction can run
     * between the address pointer and the data.
     */
    I2cLinkStatus writeThenRead(uint8_t address, const uint8_t* tx, size_t txLen, uint8_t* rx, size_t rxLen);

    /** One write transaction of len bytes. */
    I2cLinkStatus write(uint8_t address, const uint8_t* data, size_t len);

    /** Probe 0x01..0x7E with a one-byte read. Returns the number of devices found. */
    size_t scan(uint8_t* found, size_t maxFound);

    /** Blocks without a deadline. */
    void lock();
    void unlock();

private:
    TwoWire* selectWire_(uint8_t bus) const;
    I2cLinkStatus writeLocked_(uint8_t address, const uint8_t* data, size_t len, bool sendStop);

    TwoWire* wire_ = nullptr;
    SemaphoreHandle_t mutex_ = nullptr;
    uint8_t bus_ = 0;
    size_t bufferSize_ = 0;
};
