/**
 * @file DspLinkModule.cpp
 */

#include "DspLinkModule.h"
#define LOG_TAG "DspLink"
#include "Core/ModuleLog.h"

bool DspLinkModule::init(const BridgeConfig& cfg)
{
    scanRequired_ = cfg.scanRequired;
    dspAddress_ = cfg.dspAddress;
    backend_.setDeviceAddress(dspAddress_);

    started_ = link_.beginMaster(0, (int)cfg.i2cSda, (int)cfg.i2cScl, cfg.i2cFreqHz, cfg.i2cTransferSize());
    if (!started_) {
        LOGE("I2C master start failed sda=%d scl=%d", (int)cfg.i2cSda, (int)cfg.i2cScl);
        return false;
    }
    LOGI("I2C initialized, dsp=0x%02X scan_required=%d", (unsigned)dspAddress_, (int)scanRequired_);

    if (!scanRequired_) {
        backend_.setOnline(true);
    }
    return true;
}

void DspLinkModule::loop()
{
    if (!started_ || backend_.online()) {
        vTaskDelay(pdMS_TO_TICKS(kIdleMs));
        return;
    }

    ++scanAttempts_;
    uint8_t found[16] = {0};
    const size_t n = link_.scan(found, sizeof(found));
    devicesFound_ = (uint8_t)((n > 255) ? 255 : n);
    if (n == 0) {
        // Logged once per 10 attempts after the first to keep the console usable.
        if (scanAttempts_ == 1 || (scanAttempts_ % 10U) == 0) {
            LOGE("No I2C devices found (attempt %lu), retrying", (unsigned long)scanAttempts_);
        }
        vTaskDelay(pdMS_TO_TICKS(kRescanMs));
        return;
    }

    bool dspSeen = false;
    for (size_t i = 0; i < n && i < sizeof(found); ++i) {
        if (found[i] == dspAddress_) dspSeen = true;
    }
    if (!dspSeen) {
        LOGW("%u device(s) found but none at 0x%02X", (unsigned)n, (unsigned)dspAddress_);
    }
    backend_.setOnline(true);
    LOGI("DSP link online after %lu scan(s)", (unsigned long)scanAttempts_);
}
