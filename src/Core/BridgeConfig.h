#pragma once
/**
 * @file BridgeConfig.h
 * @brief Runtime configuration shared by firmware and host builds.
 */

#include <stddef.h>
#include <stdint.h>

#include "Board/BoardPinMap.h"
#include "Core/ConnectionHandler.h"
#include "Core/LogSink.h"
#include "Core/SigmaTcpProtocol.h"

enum class BackendKind : uint8_t {
    I2c = 0,
    Mock = 1,
    Http = 2
};

enum class WifiMode : uint8_t {
    AccessPoint = 0,
    Station = 1
};

struct BridgeConfig {
    uint16_t tcpPort = SigmaTcpProtocol::DefaultTcpPort;
    uint16_t httpPort = 80;
    uint32_t bufferSize = (uint32_t)SigmaTcpProtocol::DefaultBufferSize;
    uint8_t maxClients = 2;  ///< 0 = unlimited

    ResyncPolicy resync = ResyncPolicy::DropByte;
    ReadPaddingPolicy readPadding = ReadPaddingPolicy::SkipDeclared;
    BackendFailureReply failureReply = BackendFailureReply::LogOnly;

    BackendKind backend = BackendKind::I2c;
    uint8_t mockFill = 12;
    char httpBridgeUrl[96] = "http://192.168.71.1";

    int32_t i2cSda = Board::PinMap::I2cSda;
    int32_t i2cScl = Board::PinMap::I2cScl;
    uint32_t i2cFreqHz = Board::PinMap::I2cFreqHz;
    uint8_t dspAddress = Board::PinMap::DspAddress;
    uint32_t i2cBufferSize = 0;  ///< Wire buffer, 0 = bufferSize + register pointer
    bool scanRequired = true;

    WifiMode wifiMode = WifiMode::AccessPoint;
    char wifiSsid[33] = "ESP32_SIGMADSP";
    char wifiPass[65] = "123456789";

    LogLevel logLevel = LogLevel::Info;

    ConnectionOptions connectionOptions() const;
    /** Largest single bus transaction: the Wire buffer to allocate. */
    uint32_t i2cTransferSize() const;
};

/** Range checks that the individual setters cannot express. */
bool validateConfig(const BridgeConfig& cfg, char* err, size_t errLen);

const char* backendKindStr(BackendKind kind);
bool backendKindFromStr(const char* s, BackendKind& out);

const char* resyncPolicyStr(ResyncPolicy p);
bool resyncPolicyFromStr(const char* s, ResyncPolicy& out);

const char* readPaddingPolicyStr(ReadPaddingPolicy p);
bool readPaddingPolicyFromStr(const char* s, ReadPaddingPolicy& out);

const char* failureReplyStr(BackendFailureReply r);
bool failureReplyFromStr(const char* s, BackendFailureReply& out);

const char* wifiModeStr(WifiMode m);
bool wifiModeFromStr(const char* s, WifiMode& out);
