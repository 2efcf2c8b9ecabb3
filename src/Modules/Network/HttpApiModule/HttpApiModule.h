#pragma once
/**
 * @file HttpApiModule.h
 * @brief REST register API on ESPAsyncWebServer.
 *
 * Routes: GET / /read /write /config /status, POST /config (JSON body, saved
 * to NVS, applied on next boot), OPTIONS on any path for CORS preflight.
 */

#include <ESPAsyncWebServer.h>

#include "Core/BridgeConfig.h"
#include "Core/Module.h"
#include "Core/RegisterHttpApi.h"
#include "Core/Services/IRegisterBackend.h"
#include "Modules/Network/TcpBridgeModule/TcpBridgeModule.h"
#include "Modules/Network/WifiModule/WifiModule.h"

class HttpApiModule : public Module {
public:
    HttpApiModule(uint16_t port, IRegisterBackend& backend);

    const char* moduleId() const override { return "httpapi"; }
    uint16_t taskStackSize() const override { return 3072; }

    void init(BridgeConfig& cfg, const WifiModule& wifi, const TcpBridgeModule& tcp);
    void loop() override;

private:
    const uint16_t port_;
    IRegisterBackend& backend_;
    BridgeConfig* cfg_ = nullptr;
    const WifiModule* wifi_ = nullptr;
    const TcpBridgeModule* tcp_ = nullptr;

    RegisterHttpApi api_;
    AsyncWebServer server_;
    bool started_ = false;

    void startServer_();
    void sendReply_(AsyncWebServerRequest* request, const HttpReply& reply);
    bool buildStatusJson_(std::string& out) const;
};
