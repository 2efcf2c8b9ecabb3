/**
 * @file BridgeConfigJson.cpp
 * @brief BridgeConfig <-> JSON.
 */

#include "Core/BridgeConfigJson.h"

#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

#define LOG_TAG "CfgJson"
#include "Core/ModuleLog.h"

namespace {

constexpr size_t kDocCapacity = 1024;

ErrorCode bad_(char* err, size_t errLen, const char* key)
{
    if (err && errLen > 0) snprintf(err, errLen, "invalid value for %s", key);
    return ErrorCode::BadRequest;
}

template <typename T>
bool readUInt_(JsonVariantConst v, uint32_t maxValue, T& out)
{
    if (!v.is<uint32_t>()) return false;
    const uint32_t value = v.as<uint32_t>();
    if (value > maxValue) return false;
    out = (T)value;
    return true;
}

bool readText_(JsonVariantConst v, char* out, size_t outLen)
{
    if (!v.is<const char*>()) return false;
    const char* s = v.as<const char*>();
    if (strlen(s) >= outLen) return false;
    snprintf(out, outLen, "%s", s);
    return true;
}

bool isMasked_(JsonVariantConst v)
{
    return v.is<const char*>() && strcmp(v.as<const char*>(), BridgeConfigJson::MaskedSecret) == 0;
}

}  // namespace

namespace BridgeConfigJson {

ErrorCode apply(BridgeConfig& cfg, const char* json, char* err, size_t errLen)
{
    if (!json) return bad_(err, errLen, "document");

    StaticJsonDocument<kDocCapacity> doc;
    const DeserializationError jerr = deserializeJson(doc, json);
    if (jerr) {
        if (err && errLen > 0) snprintf(err, errLen, "config json: %s", jerr.c_str());
        return ErrorCode::BadRequest;
    }
    if (!doc.is<JsonObject>()) return bad_(err, errLen, "document");
    const JsonObjectConst root = doc.as<JsonObjectConst>();

    BridgeConfig next = cfg;
    JsonVariantConst v;

    if (!(v = root["tcp_port"]).isNull() && !readUInt_(v, 0xFFFFu, next.tcpPort)) return bad_(err, errLen, "tcp_port");
    if (!(v = root["http_port"]).isNull() && !readUInt_(v, 0xFFFFu, next.httpPort)) return bad_(err, errLen, "http_port");
    if (!(v = root["buffer_size"]).isNull() && !readUInt_(v, 0xFFFFFFFFu, next.bufferSize)) return bad_(err, errLen, "buffer_size");
    if (!(v = root["max_clients"]).isNull() && !readUInt_(v, 0xFFu, next.maxClients)) return bad_(err, errLen, "max_clients");
    if (!(v = root["mock_fill"]).isNull() && !readUInt_(v, 0xFFu, next.mockFill)) return bad_(err, errLen, "mock_fill");
    if (!(v = root["i2c_freq_hz"]).isNull() && !readUInt_(v, 0xFFFFFFFFu, next.i2cFreqHz)) return bad_(err, errLen, "i2c_freq_hz");
    if (!(v = root["dsp_address"]).isNull() && !readUInt_(v, 0x7Fu, next.dspAddress)) return bad_(err, errLen, "dsp_address");
    if (!(v = root["i2c_buffer_size"]).isNull() && !readUInt_(v, 0xFFFFFFFFu, next.i2cBufferSize)) return bad_(err, errLen, "i2c_buffer_size");

    if (!(v = root["i2c_sda"]).isNull()) {
        if (!v.is<int32_t>()) return bad_(err, errLen, "i2c_sda");
        next.i2cSda = v.as<int32_t>();
    }
    if (!(v = root["i2c_scl"]).isNull()) {
        if (!v.is<int32_t>()) return bad_(err, errLen, "i2c_scl");
        next.i2cScl = v.as<int32_t>();
    }
    if (!(v = root["scan_required"]).isNull()) {
        if (!v.is<bool>()) return bad_(err, errLen, "scan_required");
        next.scanRequired = v.as<bool>();
    }

    if (!(v = root["resync"]).isNull() && !resyncPolicyFromStr(v.as<const char*>(), next.resync)) return bad_(err, errLen, "resync");
    if (!(v = root["read_padding"]).isNull() && !readPaddingPolicyFromStr(v.as<const char*>(), next.readPadding)) return bad_(err, errLen, "read_padding");
    if (!(v = root["failure_reply"]).isNull() && !failureReplyFromStr(v.as<const char*>(), next.failureReply)) return bad_(err, errLen, "failure_reply");
    if (!(v = root["backend"]).isNull() && !backendKindFromStr(v.as<const char*>(), next.backend)) return bad_(err, errLen, "backend");
    if (!(v = root["wifi_mode"]).isNull() && !wifiModeFromStr(v.as<const char*>(), next.wifiMode)) return bad_(err, errLen, "wifi_mode");
    if (!(v = root["log_level"]).isNull() && !logLevelFromStr(v.as<const char*>(), next.logLevel)) return bad_(err, errLen, "log_level");

    if (!(v = root["http_bridge_url"]).isNull() && !readText_(v, next.httpBridgeUrl, sizeof(next.httpBridgeUrl))) return bad_(err, errLen, "http_bridge_url");
    if (!(v = root["wifi_ssid"]).isNull() && !readText_(v, next.wifiSsid, sizeof(next.wifiSsid))) return bad_(err, errLen, "wifi_ssid");
    if (!(v = root["wifi_pass"]).isNull() && !isMasked_(v) && !readText_(v, next.wifiPass, sizeof(next.wifiPass))) {
        return bad_(err, errLen, "wifi_pass");
    }

    if (!validateConfig(next, err, errLen)) return ErrorCode::BadRequest;

    cfg = next;
    return ErrorCode::Ok;
}

bool toJson(const BridgeConfig& cfg, std::string& out, bool includeSecrets)
{
    StaticJsonDocument<kDocCapacity> doc;
    doc["tcp_port"] = cfg.tcpPort;
    doc["http_port"] = cfg.httpPort;
    doc["buffer_size"] = cfg.bufferSize;
    doc["max_clients"] = cfg.maxClients;
    doc["resync"] = resyncPolicyStr(cfg.resync);
    doc["read_padding"] = readPaddingPolicyStr(cfg.readPadding);
    doc["failure_reply"] = failureReplyStr(cfg.failureReply);
    doc["backend"] = backendKindStr(cfg.backend);
    doc["mock_fill"] = cfg.mockFill;
    doc["http_bridge_url"] = (const char*)cfg.httpBridgeUrl;
    doc["i2c_sda"] = cfg.i2cSda;
    doc["i2c_scl"] = cfg.i2cScl;
    doc["i2c_freq_hz"] = cfg.i2cFreqHz;
    doc["dsp_address"] = cfg.dspAddress;
    doc["i2c_buffer_size"] = cfg.i2cBufferSize;
    doc["scan_required"] = cfg.scanRequired;
    doc["wifi_mode"] = wifiModeStr(cfg.wifiMode);
    doc["wifi_ssid"] = (const char*)cfg.wifiSsid;
    doc["wifi_pass"] = includeSecrets ? (const char*)cfg.wifiPass : MaskedSecret;
    doc["log_level"] = logLevelStr(cfg.logLevel);

    if (doc.overflowed()) {
        LOGE("config json overflowed %u bytes", (unsigned)kDocCapacity);
        return false;
    }
    out.clear();
    serializeJson(doc, out);
    return true;
}

}  // namespace BridgeConfigJson
