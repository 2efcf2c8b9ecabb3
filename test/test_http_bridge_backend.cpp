#include <gtest/gtest.h>

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "Backends/HttpBridgeBackend.h"
#include "Backends/MockBackend.h"
#include "Core/RegisterHttpApi.h"

namespace {

/** Replays canned replies and records the requested URLs. */
class CannedTransport final : public IHttpTransport {
public:
    struct Reply {
        bool ok;
        int status;
        std::string body;
    };

    void push(bool ok, int status, const std::string& body) { replies_.push_back(Reply{ok, status, body}); }

    bool get(const std::string& url, int& statusOut, std::string& bodyOut) override
    {
        urls.push_back(url);
        if (replies_.empty()) return false;
        const Reply r = replies_.front();
        replies_.pop_front();
        statusOut = r.status;
        bodyOut = r.body;
        return r.ok;
    }

    std::vector<std::string> urls;

private:
    std::deque<Reply> replies_;
};

/** Serves the URLs through a RegisterHttpApi, as a remote bridge would. */
class LoopbackTransport final : public IHttpTransport {
public:
    explicit LoopbackTransport(RegisterHttpApi& api) : api_(api) {}

    bool get(const std::string& url, int& statusOut, std::string& bodyOut) override
    {
        const size_t q = url.find('?');
        const std::string path = url.substr(0, q);
        std::map<std::string, std::string> params;
        if (q != std::string::npos) {
            std::string query = url.substr(q + 1);
            size_t pos = 0;
            while (pos <= query.size()) {
                const size_t amp = query.find('&', pos);
                const std::string item = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
                const size_t eq = item.find('=');
                if (eq != std::string::npos) params[item.substr(0, eq)] = item.substr(eq + 1);
                if (amp == std::string::npos) break;
                pos = amp + 1;
            }
        }
        auto param = [&params](const char* k) -> const char* {
            auto it = params.find(k);
            return it == params.end() ? nullptr : it->second.c_str();
        };

        HttpReply reply;
        if (path.size() >= 5 && path.compare(path.size() - 5, 5, "/read") == 0) {
            reply = api_.read(param("addr"), param("len"));
        } else if (path.size() >= 6 && path.compare(path.size() - 6, 6, "/write") == 0) {
            reply = api_.write(param("addr"), param("data"));
        } else {
            reply.status = 404;
            reply.body = "{\"error\":\"Not found\"}";
        }
        statusOut = reply.status;
        bodyOut = reply.body;
        return true;
    }

private:
    RegisterHttpApi& api_;
};

}  // namespace

TEST(HttpBridgeBackend, BuildsReadAndWriteUrls)
{
    CannedTransport transport;
    transport.push(true, 200, R"({"addr":"0x0043","len":2,"data":"[0x01, 0xff]"})");
    transport.push(true, 200, R"({"status":"ok","addr":"0x0010","data_written":"[0x00, 0x08]","length":2})");

    HttpBridgeBackend backend(transport, "http://192.168.71.1/");
    uint8_t out[2] = {0};
    BackendError err{};
    ASSERT_TRUE(backend.read(0x0043, out, 2, err)) << err.message;
    EXPECT_EQ(out[0], 0x01);
    EXPECT_EQ(out[1], 0xFF);

    const uint8_t data[] = {0x00, 0x08};
    ASSERT_TRUE(backend.write(0x0010, data, 2, err)) << err.message;

    ASSERT_EQ(transport.urls.size(), 2u);
    EXPECT_EQ(transport.urls[0], "http://192.168.71.1/read?addr=0x0043&len=2");
    EXPECT_EQ(transport.urls[1], "http://192.168.71.1/write?addr=0x0010&data=0008");
}

TEST(HttpBridgeBackend, ErrorFieldFailsTheCall)
{
    CannedTransport transport;
    transport.push(true, 500, R"({"error":"Failed to read from I2C: Device not found"})");
    transport.push(true, 200, R"({"error":"busy"})");

    HttpBridgeBackend backend(transport, "http://bridge");
    uint8_t out[4];
    BackendError err{};
    EXPECT_FALSE(backend.read(0x0000, out, 4, err));
    EXPECT_EQ(err.code, ErrorCode::BackendFailure);
    EXPECT_STREQ(err.message, "http 500: Failed to read from I2C: Device not found");

    err.clear();
    EXPECT_FALSE(backend.read(0x0000, out, 4, err));
    EXPECT_STREQ(err.message, "busy");
}

TEST(HttpBridgeBackend, RejectsShortOrMalformedReplies)
{
    CannedTransport transport;
    transport.push(true, 200, R"({"addr":"0x0000","len":4,"data":"[0x01]"})");
    transport.push(true, 200, "not json");
    transport.push(true, 200, R"({"status":"nope"})");

    HttpBridgeBackend backend(transport, "http://bridge");
    uint8_t out[4];
    BackendError err{};
    EXPECT_FALSE(backend.read(0x0000, out, 4, err));
    EXPECT_NE(std::string(err.message).find("expected 4"), std::string::npos);

    EXPECT_FALSE(backend.read(0x0000, out, 4, err));
    EXPECT_NE(std::string(err.message).find("bad json"), std::string::npos);

    const uint8_t b = 1;
    EXPECT_FALSE(backend.write(0x0000, &b, 1, err));
    EXPECT_STREQ(err.message, "write not acknowledged");
}

TEST(HttpBridgeBackend, TransportFailureIsReported)
{
    CannedTransport transport;
    HttpBridgeBackend backend(transport, "http://bridge");
    uint8_t out[1];
    BackendError err{};
    EXPECT_FALSE(backend.read(0x0001, out, 1, err));
    EXPECT_STREQ(err.message, "request failed");
}

TEST(HttpBridgeBackend, TalksToARegisterApi)
{
    MockBackend remote(0x5A);
    RegisterHttpApi api(remote);
    LoopbackTransport transport(api);
    HttpBridgeBackend backend(transport, "http://bridge");

    std::vector<uint8_t> out(8, 0);
    BackendError err{};
    ASSERT_TRUE(backend.read(0x0100, out.data(), out.size(), err)) << err.message;
    EXPECT_EQ(out, std::vector<uint8_t>(8, 0x5A));

    const std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF};
    ASSERT_TRUE(backend.write(0x0200, data.data(), data.size(), err)) << err.message;
    const std::vector<MockWriteRecord> journal = remote.journal();
    ASSERT_EQ(journal.size(), 1u);
    EXPECT_EQ(journal[0].address, 0x0200);
    EXPECT_EQ(journal[0].length, 4u);
    EXPECT_EQ(journal[0].head[0], 0xDE);
    EXPECT_EQ(journal[0].head[3], 0xEF);
}
