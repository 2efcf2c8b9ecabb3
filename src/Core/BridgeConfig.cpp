/**
 * @file BridgeConfig.cpp
 * @brief Configuration enum names and validation.
 */

#include "Core/BridgeConfig.h"

#include <stdio.h>
#include <string.h>
#include <strings.h>

namespace {

bool eq_(const char* a, const char* b)
{
    return a && b && strcasecmp(a, b) == 0;
}

bool fail_(char* err, size_t errLen, const char* msg)
{
    if (err && errLen > 0) snprintf(err, errLen, "%s", msg);
    return false;
}

// 16-bit register pointer sent ahead of every bus write.
constexpr uint32_t kRegisterPointerBytes = 2;

}  // namespace

ConnectionOptions BridgeConfig::connectionOptions() const
{
    ConnectionOptions opts{};
    opts.bufferSize = bufferSize;
    opts.resync = resync;
    opts.readPadding = readPadding;
    opts.failureReply = failureReply;
    return opts;
}

uint32_t BridgeConfig::i2cTransferSize() const
{
    return (i2cBufferSize != 0) ? i2cBufferSize : bufferSize + kRegisterPointerBytes;
}

bool validateConfig(const BridgeConfig& cfg, char* err, size_t errLen)
{
    if (cfg.bufferSize < SigmaTcpProtocol::WriteHeaderSize) {
        return fail_(err, errLen, "buffer_size smaller than a write header");
    }
    if (cfg.bufferSize > SigmaTcpProtocol::MaxBufferSize) {
        if (err && errLen > 0) {
            snprintf(err, errLen, "buffer_size above %u", (unsigned)SigmaTcpProtocol::MaxBufferSize);
        }
        return false;
    }
    if (cfg.i2cFreqHz == 0 || cfg.i2cFreqHz > 1000000U) {
        return fail_(err, errLen, "i2c_freq_hz out of range");
    }
    if (cfg.dspAddress == 0 || cfg.dspAddress > 0x7F) {
        return fail_(err, errLen, "dsp_address must be a 7-bit address");
    }
    if (cfg.i2cBufferSize != 0 && cfg.i2cBufferSize <= kRegisterPointerBytes) {
        return fail_(err, errLen, "i2c_buffer_size too small");
    }
    // Every frame the bridge accepts must fit one bus transaction.
    if (cfg.backend == BackendKind::I2c && cfg.i2cTransferSize() < cfg.bufferSize + kRegisterPointerBytes) {
        return fail_(err, errLen, "i2c_buffer_size smaller than buffer_size + 2");
    }
    if (cfg.backend == BackendKind::Http && strncmp(cfg.httpBridgeUrl, "http://", 7) != 0) {
        return fail_(err, errLen, "http_bridge_url must start with http://");
    }
    if (cfg.wifiMode == WifiMode::AccessPoint) {
        const size_t passLen = strnlen(cfg.wifiPass, sizeof(cfg.wifiPass));
        if (passLen != 0 && passLen < 8) {
            return fail_(err, errLen, "wifi_pass needs 8+ characters for WPA2");
        }
    }
    if (cfg.wifiSsid[0] == '\0') {
        return fail_(err, errLen, "wifi_ssid is empty");
    }
    return true;
}

const char* backendKindStr(BackendKind kind)
{
    switch (kind) {
    case BackendKind::I2c: return "i2c";
    case BackendKind::Mock: return "mock";
    case BackendKind::Http: return "http";
    default: return "?";
    }
}

bool backendKindFromStr(const char* s, BackendKind& out)
{
    if (eq_(s, "i2c")) { out = BackendKind::I2c; return true; }
    if (eq_(s, "mock")) { out = BackendKind::Mock; return true; }
    if (eq_(s, "http")) { out = BackendKind::Http; return true; }
    return false;
}

const char* resyncPolicyStr(ResyncPolicy p)
{
    return (p == ResyncPolicy::DropBuffer) ? "drop_buffer" : "drop_byte";
}

bool resyncPolicyFromStr(const char* s, ResyncPolicy& out)
{
    if (eq_(s, "drop_byte")) { out = ResyncPolicy::DropByte; return true; }
    if (eq_(s, "drop_buffer")) { out = ResyncPolicy::DropBuffer; return true; }
    return false;
}

const char* readPaddingPolicyStr(ReadPaddingPolicy p)
{
    return (p == ReadPaddingPolicy::ParseAsFrame) ? "frame" : "skip";
}

bool readPaddingPolicyFromStr(const char* s, ReadPaddingPolicy& out)
{
    if (eq_(s, "skip")) { out = ReadPaddingPolicy::SkipDeclared; return true; }
    if (eq_(s, "frame")) { out = ReadPaddingPolicy::ParseAsFrame; return true; }
    return false;
}

const char* failureReplyStr(BackendFailureReply r)
{
    return (r == BackendFailureReply::FailureResponse) ? "response" : "log";
}

bool failureReplyFromStr(const char* s, BackendFailureReply& out)
{
    if (eq_(s, "log")) { out = BackendFailureReply::LogOnly; return true; }
    if (eq_(s, "response")) { out = BackendFailureReply::FailureResponse; return true; }
    return false;
}

const char* wifiModeStr(WifiMode m)
{
    return (m == WifiMode::Station) ? "sta" : "ap";
}

bool wifiModeFromStr(const char* s, WifiMode& out)
{
    if (eq_(s, "ap")) { out = WifiMode::AccessPoint; return true; }
    if (eq_(s, "sta")) { out = WifiMode::Station; return true; }
    return false;
}
