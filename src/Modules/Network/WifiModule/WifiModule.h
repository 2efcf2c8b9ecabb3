#pragma once
/**
 * @file WifiModule.h
 * @brief Soft AP or station bring-up with reconnect.
 */

#include <Arduino.h>
#include <WiFi.h>
#include <atomic>

#include "Core/BridgeConfig.h"
#include "Core/Module.h"

enum class WifiState : uint8_t {
    Disabled = 0,
    Idle = 1,
    Connecting = 2,
    Connected = 3,
    ErrorWait = 4
};

class WifiModule : public Module {
public:
    const char* moduleId() const override { return "wifi"; }
    uint16_t taskStackSize() const override { return 4096; }

    void init(const BridgeConfig& cfg);
    void loop() override;

    WifiState state() const { return state_; }
    bool ready() const { return ready_.load(); }
    /** Address clients should use: soft AP IP in ap mode, DHCP lease in sta mode. */
    bool getIp(char* out, size_t len) const;

    static const char* stateName(WifiState s);

private:
    WifiMode mode_ = WifiMode::AccessPoint;
    char ssid_[33] = {0};
    char pass_[65] = {0};

    WifiState state_ = WifiState::Disabled;
    uint32_t stateTs_ = 0;
    uint32_t connectAttempt_ = 0;
    uint32_t lastConnectingLogMs_ = 0;
    bool reconnectKickSent_ = false;
    std::atomic<bool> ready_{false};

    void setState_(WifiState s);
    void startAccessPoint_();
    void startConnect_();
    static const char* wlStatusName_(wl_status_t st);
};
