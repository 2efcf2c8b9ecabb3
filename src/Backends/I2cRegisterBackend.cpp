/**
 * @file I2cRegisterBackend.cpp
 */

#include "Backends/I2cRegisterBackend.h"

#include <string.h>
#include <vector>

#define LOG_TAG "I2cRegs"
#include "Core/ModuleLog.h"

namespace {

constexpr size_t kPointerSize = 2;

ErrorCode toErrorCode_(I2cLinkStatus st)
{
    switch (st) {
    case I2cLinkStatus::NotStarted: return ErrorCode::NotReady;
    case I2cLinkStatus::TooLong: return ErrorCode::Overflow;
    default: return ErrorCode::BackendFailure;
    }
}

}  // namespace

bool I2cRegisterBackend::read(uint16_t address, uint8_t* out, size_t len, BackendError& err)
{
    if (!online()) {
        err.set(ErrorCode::NotReady, "Device not found");
        return false;
    }
    if (len == 0) return true;
    const uint8_t ptr[kPointerSize] = {(uint8_t)(address >> 8), (uint8_t)(address & 0xFF)};

    const I2cLinkStatus st = link_.writeThenRead(device_, ptr, sizeof(ptr), out, len);
    if (st != I2cLinkStatus::Ok) {
        err.set(toErrorCode_(st), "%s", i2cLinkStatusStr(st));
        return false;
    }
    LOGD("read 0x%04X len=%u", (unsigned)address, (unsigned)len);
    return true;
}

bool I2cRegisterBackend::write(uint16_t address, const uint8_t* data, size_t len, BackendError& err)
{
    if (!online()) {
        err.set(ErrorCode::NotReady, "Device not found");
        return false;
    }
    if (len + kPointerSize > link_.maxTransfer()) {
        err.set(ErrorCode::Overflow, "write of %u bytes exceeds i2c buffer %u",
                (unsigned)len, (unsigned)link_.maxTransfer());
        return false;
    }

    std::vector<uint8_t> frame(kPointerSize + len);
    frame[0] = (uint8_t)(address >> 8);
    frame[1] = (uint8_t)(address & 0xFF);
    if (len > 0) memcpy(frame.data() + kPointerSize, data, len);

    const I2cLinkStatus st = link_.write(device_, frame.data(), frame.size());
    if (st != I2cLinkStatus::Ok) {
        err.set(toErrorCode_(st), "%s", i2cLinkStatusStr(st));
        return false;
    }
    LOGD("write 0x%04X len=%u", (unsigned)address, (unsigned)len);
    return true;
}
