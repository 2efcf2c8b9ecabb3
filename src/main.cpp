/**
 * @file main.cpp
 * @brief Firmware entry: DSP link, WiFi, sigma TCP bridge and HTTP API.
 */

#include <Arduino.h>

#include "Backends/EspHttpTransport.h"
#include "Backends/HttpBridgeBackend.h"
#include "Backends/MockBackend.h"
#include "Board/BoardPinMap.h"
#include "Core/BridgeConfig.h"
#include "Core/ConfigNvs.h"
#include "Modules/DspLinkModule/DspLinkModule.h"
#include "Modules/Network/HttpApiModule/HttpApiModule.h"
#include "Modules/Network/TcpBridgeModule/TcpBridgeModule.h"
#include "Modules/Network/WifiModule/WifiModule.h"

#define LOG_TAG "Main"
#include "Core/ModuleLog.h"

static BridgeConfig gConfig;
static DspLinkModule gDspLink;
static WifiModule gWifi;
static TcpBridgeModule gTcpBridge;

static const char kLevelChar[] = {'E', 'W', 'I', 'D'};

static void serialSink(void* ctx, LogLevel level, const char* tag, const char* line)
{
    (void)ctx;
    const unsigned idx = (unsigned)level;
    Serial.printf("[%lu][%c][%s] %s\n",
                  (unsigned long)millis(),
                  (idx < sizeof(kLevelChar)) ? kLevelChar[idx] : '?',
                  tag,
                  line);
}

static IRegisterBackend& selectBackend(const BridgeConfig& cfg)
{
    // Built on first use, once the stored config is known.
    switch (cfg.backend) {
    case BackendKind::Mock: {
        static MockBackend mock(cfg.mockFill);
        return mock;
    }
    case BackendKind::Http: {
        static EspHttpTransport transport;
        static HttpBridgeBackend bridge(transport, cfg.httpBridgeUrl);
        return bridge;
    }
    case BackendKind::I2c:
    default:
        return gDspLink.backend();
    }
}

void setup()
{
    Serial.begin(Board::PinMap::LogBaud);
    delay(200);
    logSetSink(&serialSink, nullptr);

    (void)ConfigNvs::load(gConfig);
    char err[96] = {0};
    if (!validateConfig(gConfig, err, sizeof(err))) {
        LOGE("config invalid (%s), falling back to defaults", err);
        gConfig = BridgeConfig{};
    }
    logSetLevel(gConfig.logLevel);
    LOGI("SigmaLink boot backend=%s tcp=%u http=%u",
         backendKindStr(gConfig.backend),
         (unsigned)gConfig.tcpPort,
         (unsigned)gConfig.httpPort);

    if (gConfig.backend == BackendKind::I2c) {
        if (gDspLink.init(gConfig)) {
            gDspLink.startTask();
        }
    }
    IRegisterBackend& backend = selectBackend(gConfig);

    static HttpApiModule httpApi(gConfig.httpPort, backend);

    gWifi.init(gConfig);
    gTcpBridge.init(gConfig, backend, gWifi);
    httpApi.init(gConfig, gWifi, gTcpBridge);

    gWifi.startTask();
    gTcpBridge.startTask(2);
    httpApi.startTask();
}

void loop()
{
    vTaskDelay(pdMS_TO_TICKS(1000));
}
