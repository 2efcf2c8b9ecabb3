#pragma once
/**
 * @file TcpBridgeModule.h
 * @brief Sigma TCP server: one FreeRTOS task per client.
 */

#include <WiFi.h>

#include "Core/BridgeConfig.h"
#include "Core/ConnectionHandler.h"
#include "Core/Module.h"
#include "Core/Services/IRegisterBackend.h"
#include "Modules/Network/WifiModule/WifiModule.h"

/** Totals over every finished session plus the live count. */
struct TcpBridgeTotals {
    uint32_t accepted = 0;
    uint32_t refused = 0;
    uint32_t active = 0;
    uint32_t commands = 0;
    uint32_t invalidOpcodes = 0;
    uint32_t backendFailures = 0;
    uint32_t oversizedFrames = 0;
};

class TcpBridgeModule : public Module {
public:
    const char* moduleId() const override { return "tcpbridge"; }
    uint16_t taskStackSize() const override { return 4096; }

    void init(const BridgeConfig& cfg, IRegisterBackend& backend, const WifiModule& wifi);
    void loop() override;

    TcpBridgeTotals totals() const;

private:
    static constexpr uint16_t kSessionStack = 6144;

    struct SessionCtx {
        TcpBridgeModule* owner;
        WiFiClient client;
    };

    IRegisterBackend* backend_ = nullptr;
    const WifiModule* wifi_ = nullptr;
    ConnectionOptions connOpts_{};
    uint16_t port_ = SigmaTcpProtocol::DefaultTcpPort;
    uint8_t maxClients_ = 2;

    WiFiServer server_;
    bool started_ = false;

    mutable portMUX_TYPE totalsMux_ = portMUX_INITIALIZER_UNLOCKED;
    TcpBridgeTotals totals_{};

    void startServer_();
    void accept_();
    void finishSession_(const ConnectionStats& st);
    static void sessionTask_(void* ctx);
};
