/**
 * @file TcpBridgeModule.cpp
 */

#include "TcpBridgeModule.h"

#include <memory>

#include "WiFiClientStream.h"

#define LOG_TAG "TcpBrdg"
#include "Core/ModuleLog.h"

void TcpBridgeModule::init(const BridgeConfig& cfg, IRegisterBackend& backend, const WifiModule& wifi)
{
    backend_ = &backend;
    wifi_ = &wifi;
    connOpts_ = cfg.connectionOptions();
    port_ = cfg.tcpPort;
    maxClients_ = cfg.maxClients;
    LOGI("TCP bridge init port=%u max_clients=%u buffer=%u backend=%s (server deferred)",
         (unsigned)port_,
         (unsigned)maxClients_,
         (unsigned)connOpts_.bufferSize,
         backend.backendId());
}

TcpBridgeTotals TcpBridgeModule::totals() const
{
    portENTER_CRITICAL(&totalsMux_);
    const TcpBridgeTotals t = totals_;
    portEXIT_CRITICAL(&totalsMux_);
    return t;
}

void TcpBridgeModule::startServer_()
{
    if (started_) return;
    server_.begin(port_);
    server_.setNoDelay(true);
    started_ = true;

    char ip[16] = {0};
    wifi_->getIp(ip, sizeof(ip));
    LOGI("TCP server listening on %s:%u", ip, (unsigned)port_);
}

void TcpBridgeModule::loop()
{
    if (!started_) {
        if (wifi_ && wifi_->ready()) {
            startServer_();
        } else {
            vTaskDelay(pdMS_TO_TICKS(500));
            return;
        }
    }
    accept_();
    vTaskDelay(pdMS_TO_TICKS(20));
}

void TcpBridgeModule::accept_()
{
    WiFiClient client = server_.available();
    if (!client) return;

    const TcpBridgeTotals now = totals();
    if (maxClients_ != 0 && now.active >= maxClients_) {
        portENTER_CRITICAL(&totalsMux_);
        ++totals_.refused;
        portEXIT_CRITICAL(&totalsMux_);
        LOGW("refusing client, %u session(s) active", (unsigned)now.active);
        client.stop();
        return;
    }

    std::unique_ptr<SessionCtx> ctx = std::make_unique<SessionCtx>(SessionCtx{this, client});
    portENTER_CRITICAL(&totalsMux_);
    ++totals_.accepted;
    ++totals_.active;
    portEXIT_CRITICAL(&totalsMux_);

    char name[16] = {0};
    snprintf(name, sizeof(name), "tcp%lu", (unsigned long)now.accepted);
    if (xTaskCreate(&TcpBridgeModule::sessionTask_, name, kSessionStack, ctx.get(), 1, nullptr) != pdPASS) {
        LOGE("session task create failed, closing client");
        ctx->client.stop();
        portENTER_CRITICAL(&totalsMux_);
        --totals_.active;
        portEXIT_CRITICAL(&totalsMux_);
        return;
    }
    // The session task owns the context from here on.
    ctx.release();
}

void TcpBridgeModule::finishSession_(const ConnectionStats& st)
{
    portENTER_CRITICAL(&totalsMux_);
    if (totals_.active > 0) --totals_.active;
    totals_.commands += st.commands;
    totals_.invalidOpcodes += st.invalidOpcodes;
    totals_.backendFailures += st.backendFailures;
    totals_.oversizedFrames += st.oversizedFrames;
    portEXIT_CRITICAL(&totalsMux_);
}

void TcpBridgeModule::sessionTask_(void* arg)
{
    std::unique_ptr<SessionCtx> ctx(static_cast<SessionCtx*>(arg));
    TcpBridgeModule* self = ctx->owner;

    ctx->client.setNoDelay(true);
    {
        WiFiClientStream stream(ctx->client);
        LOGI("client connected %s", stream.peerName());

        ConnectionHandler handler(*self->backend_, self->connOpts_);
        const ErrorCode rc = handler.run(stream);
        LOGI("client disconnected %s (%s)", stream.peerName(), errorCodeStr(rc));
        self->finishSession_(handler.stats());
    }

    ctx->client.stop();
    ctx.reset();
    vTaskDelete(nullptr);
}
