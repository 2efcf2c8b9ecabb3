#include <gtest/gtest.h>

#include <string.h>
#include <string>

#include "Core/BridgeConfig.h"
#include "Core/BridgeConfigJson.h"

TEST(BridgeConfigJson, AppliesSubsetAndIgnoresUnknownKeys)
{
    BridgeConfig cfg;
    char err[96] = {0};
    const char* json = R"({"tcp_port":9000,"backend":"mock","mock_fill":7,"resync":"drop_buffer",)"
                       R"("log_level":"debug","dsp_address":52,"future_key":true})";
    ASSERT_EQ(BridgeConfigJson::apply(cfg, json, err, sizeof(err)), ErrorCode::Ok) << err;
    EXPECT_EQ(cfg.tcpPort, 9000);
    EXPECT_EQ(cfg.backend, BackendKind::Mock);
    EXPECT_EQ(cfg.mockFill, 7);
    EXPECT_EQ(cfg.resync, ResyncPolicy::DropBuffer);
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
    EXPECT_EQ(cfg.dspAddress, 52);
    EXPECT_EQ(cfg.httpPort, 80);
}

TEST(BridgeConfigJson, BadValueLeavesConfigUntouched)
{
    BridgeConfig cfg;
    char err[96] = {0};
    EXPECT_EQ(BridgeConfigJson::apply(cfg, R"({"tcp_port":9000,"mock_fill":300})", err, sizeof(err)),
              ErrorCode::BadRequest);
    EXPECT_NE(strstr(err, "mock_fill"), nullptr);
    EXPECT_EQ(cfg.tcpPort, 8086);

    EXPECT_EQ(BridgeConfigJson::apply(cfg, R"({"backend":"spi"})", err, sizeof(err)), ErrorCode::BadRequest);
    EXPECT_EQ(BridgeConfigJson::apply(cfg, R"({"tcp_port":"80"})", err, sizeof(err)), ErrorCode::BadRequest);
    EXPECT_EQ(BridgeConfigJson::apply(cfg, R"({"buffer_size":4})", err, sizeof(err)), ErrorCode::BadRequest);
    EXPECT_EQ(BridgeConfigJson::apply(cfg, "[1,2]", err, sizeof(err)), ErrorCode::BadRequest);
    EXPECT_EQ(BridgeConfigJson::apply(cfg, "{", err, sizeof(err)), ErrorCode::BadRequest);
    EXPECT_EQ(cfg.backend, BackendKind::I2c);
    EXPECT_EQ(cfg.bufferSize, BridgeConfig{}.bufferSize);
}

TEST(BridgeConfigJson, DumpMasksPasswordUnlessAsked)
{
    BridgeConfig cfg;
    std::string out;
    ASSERT_TRUE(BridgeConfigJson::toJson(cfg, out));
    EXPECT_NE(out.find("\"tcp_port\":8086"), std::string::npos);
    EXPECT_NE(out.find("\"resync\":\"drop_byte\""), std::string::npos);
    EXPECT_NE(out.find("\"wifi_pass\":\"********\""), std::string::npos);
    EXPECT_EQ(out.find("123456789"), std::string::npos);

    ASSERT_TRUE(BridgeConfigJson::toJson(cfg, out, true));
    EXPECT_NE(out.find("\"wifi_pass\":\"123456789\""), std::string::npos);
}

TEST(BridgeConfigJson, DumpReloadsIntoEqualConfig)
{
    BridgeConfig src;
    src.tcpPort = 1234;
    src.readPadding = ReadPaddingPolicy::ParseAsFrame;
    src.failureReply = BackendFailureReply::FailureResponse;
    src.wifiMode = WifiMode::Station;
    strcpy(src.wifiSsid, "studio");
    strcpy(src.wifiPass, "longenough");

    std::string json;
    ASSERT_TRUE(BridgeConfigJson::toJson(src, json, true));

    BridgeConfig dst;
    char err[96] = {0};
    ASSERT_EQ(BridgeConfigJson::apply(dst, json.c_str(), err, sizeof(err)), ErrorCode::Ok) << err;
    EXPECT_EQ(dst.tcpPort, 1234);
    EXPECT_EQ(dst.readPadding, ReadPaddingPolicy::ParseAsFrame);
    EXPECT_EQ(dst.failureReply, BackendFailureReply::FailureResponse);
    EXPECT_EQ(dst.wifiMode, WifiMode::Station);
    EXPECT_STREQ(dst.wifiSsid, "studio");
    EXPECT_STREQ(dst.wifiPass, "longenough");
}

TEST(BridgeConfigJson, MaskedDumpPostedBackKeepsPassword)
{
    BridgeConfig cfg;
    strcpy(cfg.wifiPass, "studio-secret");

    std::string dump;
    ASSERT_TRUE(BridgeConfigJson::toJson(cfg, dump));
    ASSERT_NE(dump.find(BridgeConfigJson::MaskedSecret), std::string::npos);

    // Edit one field of the public dump and apply it, as a GET then POST of /config would.
    const std::string edited = dump.replace(dump.find("\"tcp_port\":8086"), 15, "\"tcp_port\":9001");
    char err[96] = {0};
    ASSERT_EQ(BridgeConfigJson::apply(cfg, edited.c_str(), err, sizeof(err)), ErrorCode::Ok) << err;
    EXPECT_EQ(cfg.tcpPort, 9001);
    EXPECT_STREQ(cfg.wifiPass, "studio-secret");

    ASSERT_EQ(BridgeConfigJson::apply(cfg, R"({"wifi_pass":"new-password"})", err, sizeof(err)), ErrorCode::Ok);
    EXPECT_STREQ(cfg.wifiPass, "new-password");
}

TEST(BridgeConfigJson, RejectsUnboundedBufferSize)
{
    BridgeConfig cfg;
    cfg.backend = BackendKind::Mock;
    char err[96] = {0};
    EXPECT_EQ(BridgeConfigJson::apply(cfg, R"({"buffer_size":4294967280})", err, sizeof(err)), ErrorCode::BadRequest);
    EXPECT_EQ(cfg.bufferSize, BridgeConfig{}.bufferSize);
}
