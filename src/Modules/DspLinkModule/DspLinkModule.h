#pragma once
/**
 * @file DspLinkModule.h
 * @brief I2C master bring-up and DSP presence watch.
 */

#include "Backends/I2cRegisterBackend.h"
#include "Core/BridgeConfig.h"
#include "Core/I2cLink.h"
#include "Core/Module.h"

class DspLinkModule : public Module {
public:
    DspLinkModule() : backend_(link_, Board::PinMap::DspAddress) {}

    const char* moduleId() const override { return "dsplink"; }
    uint16_t taskStackSize() const override { return 3072; }

    /** Start the bus. The backend stays offline until the first scan succeeds. */
    bool init(const BridgeConfig& cfg);
    void loop() override;

    I2cRegisterBackend& backend() { return backend_; }
    bool online() const { return backend_.online(); }
    uint8_t devicesFound() const { return devicesFound_; }

private:
    static constexpr uint32_t kRescanMs = 1000;
    static constexpr uint32_t kIdleMs = 5000;

    I2cLink link_{};
    I2cRegisterBackend backend_;
    bool started_ = false;
    bool scanRequired_ = true;
    uint8_t dspAddress_ = Board::PinMap::DspAddress;
    uint8_t devicesFound_ = 0;
    uint32_t scanAttempts_ = 0;
};
