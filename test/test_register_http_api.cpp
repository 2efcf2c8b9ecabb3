#include <gtest/gtest.h>

#include <string>

#include "Backends/MockBackend.h"
#include "Core/RegisterHttpApi.h"
#include "support/TestBackends.h"

TEST(RegisterHttpApi, HealthIsPlainOk)
{
    MockBackend backend;
    RegisterHttpApi api(backend);
    const HttpReply r = api.health();
    EXPECT_EQ(r.status, 200);
    EXPECT_STREQ(r.contentType, "text/plain");
    EXPECT_EQ(r.body, "ok");
}

TEST(RegisterHttpApi, ReadReturnsByteList)
{
    MockBackend backend;
    RegisterHttpApi api(backend);
    const HttpReply r = api.read("0x0043", "4");
    EXPECT_EQ(r.status, 200);
    EXPECT_STREQ(r.contentType, "application/json");
    EXPECT_EQ(r.body, R"({"addr":"0x0043","len":4,"data":"[0x0c, 0x0c, 0x0c, 0x0c]"})");
    EXPECT_EQ(backend.readCount(), 1u);
}

TEST(RegisterHttpApi, WriteEchoesDecodedBytes)
{
    MockBackend backend;
    RegisterHttpApi api(backend);
    const HttpReply r = api.write("59", "0102");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, R"({"status":"ok","addr":"0x003b","data_written":"[0x01, 0x02]","length":2})");

    const std::vector<MockWriteRecord> journal = backend.journal();
    ASSERT_EQ(journal.size(), 1u);
    EXPECT_EQ(journal[0].address, 0x003B);
    EXPECT_EQ(journal[0].length, 2u);
}

TEST(RegisterHttpApi, MalformedParametersAreBadRequests)
{
    MockBackend backend;
    RegisterHttpApi api(backend);

    HttpReply r = api.read(nullptr, "4");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body, R"({"error":"missing or invalid addr","code":"bad_request"})");

    r = api.read("0x10", "four");
    EXPECT_EQ(r.status, 400);
    EXPECT_NE(r.body.find("invalid len"), std::string::npos);

    r = api.write("0x10", "zz");
    EXPECT_EQ(r.status, 400);
    EXPECT_NE(r.body.find("invalid data"), std::string::npos);

    r = api.write("0x10", nullptr);
    EXPECT_EQ(r.status, 400);

    EXPECT_EQ(backend.readCount(), 0u);
    EXPECT_EQ(backend.writeCount(), 0u);
    EXPECT_EQ(api.requestCount(), 4u);
    EXPECT_EQ(api.failureCount(), 4u);
}

TEST(RegisterHttpApi, ReadLengthIsBounded)
{
    MockBackend backend;
    RegisterHttpApi api(backend, 16);
    const HttpReply r = api.read("0x0000", "17");
    EXPECT_EQ(r.status, 400);
    EXPECT_NE(r.body.find("\"code\":\"overflow\""), std::string::npos);
    EXPECT_EQ(backend.readCount(), 0u);
}

TEST(RegisterHttpApi, BackendFailuresAreServerErrors)
{
    FailingBackend backend(ErrorCode::BackendFailure, "Device not found");
    RegisterHttpApi api(backend);

    HttpReply r = api.read("0x0043", "4");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body, R"({"error":"Failed to read from fail: Device not found","code":"backend_failure"})");

    r = api.write("0x0043", "00");
    EXPECT_EQ(r.status, 500);
    EXPECT_NE(r.body.find("Failed to write to fail: Device not found"), std::string::npos);
}

TEST(RegisterHttpApi, CorsHeadersCoverPreflight)
{
    bool origin = false;
    bool methods = false;
    for (const HttpHeader& h : RegisterHttpApi::CorsHeaders) {
        if (std::string(h.name) == "Access-Control-Allow-Origin") origin = (std::string(h.value) == "*");
        if (std::string(h.name) == "Access-Control-Allow-Methods") {
            methods = (std::string(h.value) == "GET, POST, OPTIONS");
        }
    }
    EXPECT_TRUE(origin);
    EXPECT_TRUE(methods);
}

TEST(RegisterHttpApi, DefaultReadLimitIsFixed)
{
    MockBackend backend;
    RegisterHttpApi api(backend);
    const HttpReply r = api.read("0x0000", "4097");
    EXPECT_EQ(r.status, 400);
    EXPECT_NE(r.body.find("exceeds limit 4096"), std::string::npos);
    EXPECT_EQ(backend.readCount(), 0u);
}
