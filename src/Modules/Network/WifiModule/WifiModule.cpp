/**
 * @file WifiModule.cpp
 * @brief Access point or station bring-up for the bridge.
 */
#include "WifiModule.h"
#define LOG_TAG "WifiModu"
#include "Core/ModuleLog.h"
#include <string.h>

namespace {
constexpr uint32_t kConnectTimeoutMs = 15000U;
constexpr uint32_t kErrorWaitMs = 5000U;
constexpr uint32_t kReconnectKickMs = 4000U;
}

const char* WifiModule::wlStatusName_(wl_status_t st)
{
    switch (st) {
    case WL_NO_SHIELD: return "NO_SHIELD";
    case WL_IDLE_STATUS: return "IDLE";
    case WL_NO_SSID_AVAIL: return "NO_SSID_AVAIL";
    case WL_SCAN_COMPLETED: return "SCAN_COMPLETED";
    case WL_CONNECTED: return "CONNECTED";
    case WL_CONNECT_FAILED: return "CONNECT_FAILED";
    case WL_CONNECTION_LOST: return "CONNECTION_LOST";
    case WL_DISCONNECTED: return "DISCONNECTED";
    default: return "UNKNOWN";
    }
}

const char* WifiModule::stateName(WifiState s)
{
    switch (s) {
    case WifiState::Disabled: return "Disabled";
    case WifiState::Idle: return "Idle";
    case WifiState::Connecting: return "Connecting";
    case WifiState::Connected: return "Connected";
    case WifiState::ErrorWait: return "ErrorWait";
    default: return "Unknown";
    }
}

bool WifiModule::getIp(char* out, size_t len) const
{
    if (!out || len == 0) return false;
    out[0] = '\0';
    if (!ready_.load()) return false;

    const IPAddress ip = (mode_ == WifiMode::AccessPoint) ? WiFi.softAPIP() : WiFi.localIP();
    snprintf(out, len, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return true;
}

void WifiModule::init(const BridgeConfig& cfg)
{
    mode_ = cfg.wifiMode;
    snprintf(ssid_, sizeof(ssid_), "%s", cfg.wifiSsid);
    snprintf(pass_, sizeof(pass_), "%s", cfg.wifiPass);
    LOGI("WiFi init mode=%s ssid='%s' pass_len=%u",
         wifiModeStr(mode_),
         ssid_,
         (unsigned)strnlen(pass_, sizeof(pass_)));
    setState_(WifiState::Idle);
}

void WifiModule::setState_(WifiState s)
{
    if (s == state_) return;
    state_ = s;
    stateTs_ = millis();
    if (state_ != WifiState::Connected) {
        ready_.store(false);
    }
}

void WifiModule::startAccessPoint_()
{
    WiFi.mode(WIFI_AP);
    // An empty password opens the AP; softAP() refuses 1..7 characters.
    const char* pass = (pass_[0] != '\0') ? pass_ : nullptr;
    if (!WiFi.softAP(ssid_, pass)) {
        LOGE("softAP start failed ssid='%s'", ssid_);
        setState_(WifiState::ErrorWait);
        return;
    }
    const IPAddress ip = WiFi.softAPIP();
    LOGI("Access point '%s' up IP=%u.%u.%u.%u", ssid_, ip[0], ip[1], ip[2], ip[3]);
    setState_(WifiState::Connected);
    ready_.store(true);
}

void WifiModule::startConnect_()
{
    ++connectAttempt_;
    LOGI("Connecting #%lu to ssid='%s' pass_len=%u",
         (unsigned long)connectAttempt_,
         ssid_,
         (unsigned)strnlen(pass_, sizeof(pass_)));
    reconnectKickSent_ = false;
    lastConnectingLogMs_ = millis();

    WiFi.disconnect(false, false);
    delay(50);
    if (!WiFi.mode(WIFI_STA)) {
        LOGE("WiFi.mode(STA) failed");
        setState_(WifiState::ErrorWait);
        return;
    }
    WiFi.setSleep(false);
    const wl_status_t beginStatus = WiFi.begin(ssid_, pass_);
    if (beginStatus == WL_CONNECT_FAILED) {
        LOGW("WiFi.begin returned CONNECT_FAILED for ssid='%s'", ssid_);
        setState_(WifiState::ErrorWait);
        return;
    }
    setState_(WifiState::Connecting);
}

void WifiModule::loop()
{
    switch (state_) {

    case WifiState::Disabled:
        vTaskDelay(pdMS_TO_TICKS(2000));
        break;

    case WifiState::Idle:
        if (mode_ == WifiMode::AccessPoint) {
            startAccessPoint_();
        } else {
            startConnect_();
        }
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::Connecting:
    {
        const wl_status_t wl = WiFi.status();
        const uint32_t now = millis();

        if ((now - lastConnectingLogMs_) >= 3000U) {
            lastConnectingLogMs_ = now;
            LOGI("Connecting status=%s(%d) elapsed_ms=%lu",
                 wlStatusName_(wl),
                 (int)wl,
                 (unsigned long)(now - stateTs_));
        }

        if (!reconnectKickSent_ && (now - stateTs_) > kReconnectKickMs && wl == WL_DISCONNECTED) {
            reconnectKickSent_ = true;
            WiFi.reconnect();
        }

        if (WiFi.isConnected()) {
            const IPAddress ip = WiFi.localIP();
            LOGI("Connected IP=%u.%u.%u.%u RSSI=%d", ip[0], ip[1], ip[2], ip[3], WiFi.RSSI());
            setState_(WifiState::Connected);
            ready_.store(true);
        } else if (now - stateTs_ > kConnectTimeoutMs) {
            LOGW("Connect timeout status=%s(%d)", wlStatusName_(wl), (int)wl);
            WiFi.disconnect(false, false);
            setState_(WifiState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(200));
        break;
    }

    case WifiState::Connected:
        if (mode_ == WifiMode::Station && !WiFi.isConnected()) {
            LOGW("Disconnected");
            setState_(WifiState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::ErrorWait:
        if (millis() - stateTs_ > kErrorWaitMs) {
            setState_(WifiState::Idle);
        }
        vTaskDelay(pdMS_TO_TICKS(500));
        break;
    }
}
