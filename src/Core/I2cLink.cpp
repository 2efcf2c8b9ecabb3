/**
 * @file I2cLink.cpp
 * @brief Core I2C master helper implementation.
 */

#include "Core/I2cLink.h"
#define LOG_TAG "I2cLink"
#include "Core/ModuleLog.h"

const char* i2cLinkStatusStr(I2cLinkStatus status)
{
    switch (status) {
    case I2cLinkStatus::Ok: return "ok";
    case I2cLinkStatus::NotStarted: return "bus not started";
    case I2cLinkStatus::TooLong: return "transfer exceeds i2c buffer";
    case I2cLinkStatus::Nack: return "device not responding";
    case I2cLinkStatus::ShortRead: return "short read";
    default: return "?";
    }
}

bool I2cLink::beginMaster(uint8_t bus, int sda, int scl, uint32_t freqHz, size_t bufferSize)
{
    end();
    wire_ = selectWire_(bus);
    if (!wire_) return false;

    bus_ = (bus == 0) ? 0 : 1;
    // Must run before begin(): the driver allocates its buffers there.
    const size_t granted = wire_->setBufferSize(bufferSize);
    if (granted == 0) {
        LOGE("Wire.setBufferSize(%u) refused, transfers above %u bytes will fail",
             (unsigned)bufferSize,
             (unsigned)I2C_BUFFER_LENGTH);
        bufferSize_ = I2C_BUFFER_LENGTH;
    } else {
        bufferSize_ = granted;
    }

    if (!wire_->begin(sda, scl, freqHz)) {
        wire_ = nullptr;
        return false;
    }
    if (!mutex_) mutex_ = xSemaphoreCreateMutex();
    LOGI("I2C master started bus=%u sda=%d scl=%d freq=%lu buffer=%u",
         (unsigned)bus_, sda, scl, (unsigned long)freqHz, (unsigned)bufferSize_);
    return true;
}

void I2cLink::end()
{
    if (wire_) {
        wire_->end();
    }
    wire_ = nullptr;
}

void I2cLink::lock()
{
    if (!mutex_) return;
    xSemaphoreTake(mutex_, portMAX_DELAY);
}

void I2cLink::unlock()
{
    if (!mutex_) return;
    xSemaphoreGive(mutex_);
}

I2cLinkStatus I2cLink::writeLocked_(uint8_t address, const uint8_t* data, size_t len, bool sendStop)
{
    wire_->beginTransmission((int)address);
    if (len > 0 && wire_->write(data, len) != len) {
        wire_->endTransmission(true);
        return I2cLinkStatus::TooLong;
    }
    const uint8_t err = wire_->endTransmission(sendStop);
    if (err != 0) {
        LOGD("endTransmission addr=0x%02X err=%u", (unsigned)address, (unsigned)err);
        return I2cLinkStatus::Nack;
    }
    return I2cLinkStatus::Ok;
}

I2cLinkStatus I2cLink::writeThenRead(uint8_t address, const uint8_t* tx, size_t txLen, uint8_t* rx, size_t rxLen)
{
    if (!wire_) return I2cLinkStatus::NotStarted;
    if (txLen > bufferSize_ || rxLen > bufferSize_) return I2cLinkStatus::TooLong;

    lock();
    I2cLinkStatus st = writeLocked_(address, tx, txLen, true);
    if (st == I2cLinkStatus::Ok && rxLen > 0) {
        const size_t got = wire_->requestFrom((uint16_t)address, rxLen, true);
        size_t n = 0;
        while (wire_->available() && n < got && n < rxLen) {
            rx[n++] = (uint8_t)wire_->read();
        }
        if (n != rxLen) st = I2cLinkStatus::ShortRead;
    }
    unlock();
    return st;
}

I2cLinkStatus I2cLink::write(uint8_t address, const uint8_t* data, size_t len)
{
    if (!wire_) return I2cLinkStatus::NotStarted;
    if (len > bufferSize_) return I2cLinkStatus::TooLong;

    lock();
    const I2cLinkStatus st = writeLocked_(address, data, len, true);
    unlock();
    return st;
}

size_t I2cLink::scan(uint8_t* found, size_t maxFound)
{
    if (!wire_) return 0;
    size_t count = 0;
    lock();
    for (uint8_t addr = 0x01; addr < 0x7F; ++addr) {
        const size_t got = wire_->requestFrom((uint16_t)addr, (size_t)1, true);
        while (wire_->available()) (void)wire_->read();
        if (got == 0) continue;
        LOGI("found I2C device at 0x%02X", (unsigned)addr);
        if (found && count < maxFound) found[count] = addr;
        ++count;
    }
    unlock();
    return count;
}

TwoWire* I2cLink::selectWire_(uint8_t bus) const
{
    if (bus == 0) return &Wire;
#if defined(ESP32)
    return &Wire1;
#else
    return nullptr;
#endif
}
