/**
 * @file HttpApiModule.cpp
 * @brief Register API routes.
 */

#include "HttpApiModule.h"

#define LOG_TAG "HttpApi"
#include "Core/ModuleLog.h"

#include <Arduino.h>
#include <ArduinoJson.h>
#include <AsyncJson.h>
#include <esp_heap_caps.h>
#include <string>

#include "Core/BridgeConfigJson.h"
#include "Core/ConfigNvs.h"

namespace {
constexpr uint32_t kHttpLatencyInfoMs = 40U;
constexpr uint32_t kHttpLatencyWarnMs = 250U;

const char* httpMethodName_(uint8_t method)
{
    switch (method) {
    case HTTP_GET: return "GET";
    case HTTP_POST: return "POST";
    case HTTP_OPTIONS: return "OPTIONS";
    default: return "OTHER";
    }
}

// Register reads and writes block on the bus; slow ones are worth a log line.
struct HttpLatencyScope {
    AsyncWebServerRequest* req;
    const char* route;
    uint32_t startUs;

    HttpLatencyScope(AsyncWebServerRequest* request, const char* routePath)
        : req(request), route(routePath), startUs(micros()) {}

    ~HttpLatencyScope()
    {
        const uint32_t elapsedMs = (micros() - startUs) / 1000U;
        if (elapsedMs < kHttpLatencyInfoMs) return;
        const char* method = req ? httpMethodName_(req->method()) : "?";
        const uint32_t heapFree = (uint32_t)ESP.getFreeHeap();
        const uint32_t heapLargest = (uint32_t)heap_caps_get_largest_free_block(MALLOC_CAP_8BIT);
        if (elapsedMs >= kHttpLatencyWarnMs) {
            LOGW("HTTP slow %s %s latency=%lums heap=%lu largest=%lu",
                 method, route, (unsigned long)elapsedMs, (unsigned long)heapFree, (unsigned long)heapLargest);
        } else {
            LOGD("HTTP %s %s latency=%lums", method, route, (unsigned long)elapsedMs);
        }
    }
};

const char* queryParam_(AsyncWebServerRequest* request, const char* name)
{
    if (!request->hasParam(name)) return nullptr;
    return request->getParam(name)->value().c_str();
}

}  // namespace

HttpApiModule::HttpApiModule(uint16_t port, IRegisterBackend& backend)
    : port_(port),
      backend_(backend),
      api_(backend),
      server_(port)
{
}

void HttpApiModule::init(BridgeConfig& cfg, const WifiModule& wifi, const TcpBridgeModule& tcp)
{
    cfg_ = &cfg;
    wifi_ = &wifi;
    tcp_ = &tcp;
    LOGI("HTTP API init port=%u backend=%s read_limit=%u (server deferred)",
         (unsigned)port_,
         backend_.backendId(),
         (unsigned)RegisterHttpApi::DefaultMaxReadLen);
}

void HttpApiModule::sendReply_(AsyncWebServerRequest* request, const HttpReply& reply)
{
    request->send(reply.status, reply.contentType, String(reply.body.c_str()));
}

bool HttpApiModule::buildStatusJson_(std::string& out) const
{
    const TcpBridgeTotals t = tcp_->totals();
    char ip[16] = {0};
    wifi_->getIp(ip, sizeof(ip));

    StaticJsonDocument<512> doc;
    doc["uptime_ms"] = (uint32_t)millis();
    doc["free_heap"] = (uint32_t)ESP.getFreeHeap();
    doc["backend"] = backend_.backendId();
    doc["wifi_state"] = WifiModule::stateName(wifi_->state());
    doc["ip"] = (const char*)ip;
    doc["sessions"] = t.active;
    doc["accepted"] = t.accepted;
    doc["refused"] = t.refused;
    doc["commands"] = t.commands;
    doc["invalid_opcodes"] = t.invalidOpcodes;
    doc["backend_failures"] = t.backendFailures;
    doc["oversized_frames"] = t.oversizedFrames;
    doc["http_requests"] = api_.requestCount();
    doc["http_failures"] = api_.failureCount();
    if (doc.overflowed()) return false;
    out.clear();
    serializeJson(doc, out);
    return true;
}

void HttpApiModule::startServer_()
{
    if (started_) return;
    for (const HttpHeader& h : RegisterHttpApi::CorsHeaders) {
        DefaultHeaders::Instance().addHeader(h.name, h.value);
    }

    server_.on("/", HTTP_GET, [this](AsyncWebServerRequest* request) {
        sendReply_(request, api_.health());
    });

    server_.on("/read", HTTP_GET, [this](AsyncWebServerRequest* request) {
        HttpLatencyScope latency(request, "/read");
        sendReply_(request, api_.read(queryParam_(request, "addr"), queryParam_(request, "len")));
    });

    server_.on("/write", HTTP_GET, [this](AsyncWebServerRequest* request) {
        HttpLatencyScope latency(request, "/write");
        sendReply_(request, api_.write(queryParam_(request, "addr"), queryParam_(request, "data")));
    });

    server_.on("/config", HTTP_GET, [this](AsyncWebServerRequest* request) {
        std::string out;
        if (!BridgeConfigJson::toJson(*cfg_, out)) {
            request->send(500, "application/json", "{\"error\":\"config serialization failed\",\"code\":\"overflow\"}");
            return;
        }
        request->send(200, "application/json", String(out.c_str()));
    });

    // AsyncWebServer deletes its handlers.
    AsyncCallbackJsonWebHandler* cfgPost = new AsyncCallbackJsonWebHandler(
        "/config", [this](AsyncWebServerRequest* request, JsonVariant& json) {
            HttpLatencyScope latency(request, "/config");
            std::string patch;
            serializeJson(json, patch);

            char err[96] = {0};
            BridgeConfig next = *cfg_;
            const ErrorCode rc = BridgeConfigJson::apply(next, patch.c_str(), err, sizeof(err));
            char body[160] = {0};
            if (rc != ErrorCode::Ok) {
                (void)writeErrorJson(body, sizeof(body), rc, err);
                request->send(400, "application/json", body);
                return;
            }
            if (!ConfigNvs::save(next)) {
                (void)writeErrorJson(body, sizeof(body), ErrorCode::BackendFailure, "nvs write failed");
                request->send(500, "application/json", body);
                return;
            }
            LOGI("config updated via HTTP, restart to apply");
            request->send(200, "application/json", "{\"status\":\"ok\",\"restart_required\":true}");
        });
    cfgPost->setMethod(HTTP_POST);
    server_.addHandler(cfgPost);

    server_.on("/status", HTTP_GET, [this](AsyncWebServerRequest* request) {
        std::string out;
        if (!buildStatusJson_(out)) {
            request->send(500, "application/json", "{\"error\":\"status serialization failed\",\"code\":\"overflow\"}");
            return;
        }
        request->send(200, "application/json", String(out.c_str()));
    });

    server_.onNotFound([](AsyncWebServerRequest* request) {
        if (request->method() == HTTP_OPTIONS) {
            request->send(200);
            return;
        }
        request->send(404, "application/json", "{\"error\":\"Not found\",\"code\":\"bad_request\"}");
    });

    server_.begin();
    started_ = true;

    char ip[16] = {0};
    wifi_->getIp(ip, sizeof(ip));
    LOGI("HTTP server started, listening on %s:%u", ip, (unsigned)port_);
}

void HttpApiModule::loop()
{
    if (!started_ && wifi_ && wifi_->ready()) {
        startServer_();
    }
    vTaskDelay(pdMS_TO_TICKS(started_ ? 5000 : 500));
}
