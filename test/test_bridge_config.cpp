#include <gtest/gtest.h>

#include <string.h>

#include "Core/BridgeConfig.h"

TEST(BridgeConfig, DefaultsAreValid)
{
    const BridgeConfig cfg;
    char err[96] = {0};
    EXPECT_TRUE(validateConfig(cfg, err, sizeof(err))) << err;
    EXPECT_EQ(cfg.tcpPort, 8086);
    EXPECT_EQ(cfg.bufferSize, 20480u * 4u + 14u);
    EXPECT_EQ(cfg.mockFill, 12);
    EXPECT_EQ(cfg.dspAddress, 0x3B);
    EXPECT_STREQ(cfg.wifiSsid, "ESP32_SIGMADSP");

    const ConnectionOptions opts = cfg.connectionOptions();
    EXPECT_EQ(opts.bufferSize, cfg.bufferSize);
    EXPECT_EQ(opts.resync, ResyncPolicy::DropByte);
    EXPECT_EQ(opts.readPadding, ReadPaddingPolicy::SkipDeclared);
    EXPECT_EQ(opts.failureReply, BackendFailureReply::LogOnly);
}

TEST(BridgeConfig, ValidationRejectsOutOfRangeValues)
{
    char err[96] = {0};
    BridgeConfig cfg;
    cfg.bufferSize = 13;
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));
    EXPECT_NE(strstr(err, "buffer_size"), nullptr);

    cfg = BridgeConfig{};
    cfg.dspAddress = 0x80;
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));

    cfg = BridgeConfig{};
    strcpy(cfg.wifiPass, "short");
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));
    cfg.wifiPass[0] = '\0';
    EXPECT_TRUE(validateConfig(cfg, err, sizeof(err)));

    cfg = BridgeConfig{};
    cfg.backend = BackendKind::Http;
    strcpy(cfg.httpBridgeUrl, "ftp://x");
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));
}

TEST(BridgeConfig, EnumNamesRoundTrip)
{
    BackendKind kind = BackendKind::I2c;
    EXPECT_TRUE(backendKindFromStr("MOCK", kind));
    EXPECT_EQ(kind, BackendKind::Mock);
    EXPECT_STREQ(backendKindStr(BackendKind::Http), "http");
    EXPECT_FALSE(backendKindFromStr("spi", kind));

    ResyncPolicy resync = ResyncPolicy::DropByte;
    EXPECT_TRUE(resyncPolicyFromStr("drop_buffer", resync));
    EXPECT_EQ(resync, ResyncPolicy::DropBuffer);

    ReadPaddingPolicy padding = ReadPaddingPolicy::SkipDeclared;
    EXPECT_TRUE(readPaddingPolicyFromStr("frame", padding));
    EXPECT_EQ(padding, ReadPaddingPolicy::ParseAsFrame);

    BackendFailureReply reply = BackendFailureReply::LogOnly;
    EXPECT_TRUE(failureReplyFromStr("response", reply));
    EXPECT_EQ(reply, BackendFailureReply::FailureResponse);

    WifiMode mode = WifiMode::AccessPoint;
    EXPECT_TRUE(wifiModeFromStr("sta", mode));
    EXPECT_EQ(mode, WifiMode::Station);
}

TEST(BridgeConfig, BufferSizeHasAnUpperBound)
{
    char err[96] = {0};
    BridgeConfig cfg;
    cfg.bufferSize = (uint32_t)SigmaTcpProtocol::MaxBufferSize;
    EXPECT_TRUE(validateConfig(cfg, err, sizeof(err))) << err;

    cfg.bufferSize = (uint32_t)SigmaTcpProtocol::MaxBufferSize + 1;
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));
    EXPECT_NE(strstr(err, "buffer_size above"), nullptr);

    cfg.bufferSize = 0xFFFFFFF0u;
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));
}

TEST(BridgeConfig, I2cTransferCoversLargestFrame)
{
    char err[96] = {0};
    BridgeConfig cfg;
    EXPECT_EQ(cfg.backend, BackendKind::I2c);
    EXPECT_EQ(cfg.i2cTransferSize(), cfg.bufferSize + 2);
    EXPECT_TRUE(validateConfig(cfg, err, sizeof(err))) << err;

    cfg.i2cBufferSize = 4096;
    EXPECT_EQ(cfg.i2cTransferSize(), 4096u);
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));
    EXPECT_NE(strstr(err, "i2c_buffer_size"), nullptr);

    cfg.bufferSize = 4094;
    EXPECT_TRUE(validateConfig(cfg, err, sizeof(err))) << err;

    cfg = BridgeConfig{};
    cfg.i2cBufferSize = 4096;
    cfg.backend = BackendKind::Mock;
    EXPECT_TRUE(validateConfig(cfg, err, sizeof(err))) << err;

    cfg.i2cBufferSize = 2;
    EXPECT_FALSE(validateConfig(cfg, err, sizeof(err)));
}
