#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <chrono>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "Backends/MockBackend.h"
#include "Host/PosixTcpServer.h"
#include "support/Frames.h"
#include "support/TestBackends.h"

namespace {

class Client {
public:
    explicit Client(uint16_t port)
    {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        timeval tv{};
        tv.tv_sec = 5;
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        connected_ = connect(fd_, (sockaddr*)&addr, sizeof(addr)) == 0;
    }

    ~Client()
    {
        if (fd_ >= 0) close(fd_);
    }

    bool connected() const { return connected_; }

    bool send(const std::vector<uint8_t>& bytes)
    {
        size_t off = 0;
        while (off < bytes.size()) {
            const ssize_t n = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
            if (n <= 0) return false;
            off += (size_t)n;
        }
        return true;
    }

    /** Read exactly n bytes; returns fewer on EOF, error or timeout. */
    std::vector<uint8_t> recvExactly(size_t n)
    {
        std::vector<uint8_t> out(n);
        size_t got = 0;
        while (got < n) {
            const ssize_t r = ::recv(fd_, out.data() + got, n - got, 0);
            if (r <= 0) break;
            got += (size_t)r;
        }
        out.resize(got);
        return out;
    }

    /** True once the server closed its side. */
    bool closedByPeer()
    {
        uint8_t b;
        return ::recv(fd_, &b, 1, 0) == 0;
    }

    void shutdownWrite() { shutdown(fd_, SHUT_WR); }

private:
    int fd_ = -1;
    bool connected_ = false;
};

TcpServerOptions loopbackOptions(uint8_t maxClients = 0)
{
    TcpServerOptions opts;
    opts.bindAddress = "127.0.0.1";
    opts.port = 0;
    opts.maxClients = maxClients;
    opts.connection.bufferSize = 4096;
    return opts;
}

template <typename Pred>
bool waitFor(Pred pred, int timeoutMs = 2000)
{
    for (int waited = 0; waited < timeoutMs; waited += 10) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

}  // namespace

TEST(PosixTcpServer, ServesReadOverLoopback)
{
    MockBackend backend;
    PosixTcpServer server(backend, loopbackOptions());
    char err[128] = {0};
    ASSERT_TRUE(server.start(err, sizeof(err))) << err;
    ASSERT_NE(server.boundPort(), 0);

    Client client(server.boundPort());
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send(Frames::read(0x01, 4, 0x0043)));

    const std::vector<uint8_t> resp = client.recvExactly(18);
    ASSERT_EQ(resp.size(), 18u);
    EXPECT_EQ(resp[0], 0x0B);
    EXPECT_EQ(resp[4], 13 + 4);
    EXPECT_EQ(resp[10], 0x00);
    EXPECT_EQ(resp[11], 0x43);
    for (size_t i = 14; i < 18; ++i) EXPECT_EQ(resp[i], 12);

    server.stop();
    EXPECT_FALSE(server.running());
}

TEST(PosixTcpServer, ConcurrentClientsNeverInterleaveTransactions)
{
    MockBackend backend;
    OverlapMonitor monitor(backend);
    PosixTcpServer server(backend, loopbackOptions());
    char err[128] = {0};
    ASSERT_TRUE(server.start(err, sizeof(err))) << err;

    // Both bursts must fit the journal so every record can be checked.
    constexpr int kWrites = (int)MockBackend::JournalDepth / 2;
    auto session = [&server](uint16_t base, uint8_t pattern, int* acked) {
        Client client(server.boundPort());
        if (!client.connected()) return;
        std::vector<uint8_t> burst;
        for (int i = 0; i < kWrites; ++i) {
            const std::vector<uint8_t> frame =
                Frames::write(0x01, (uint16_t)(base + i), std::vector<uint8_t>(32, pattern));
            burst.insert(burst.end(), frame.begin(), frame.end());
        }
        if (!client.send(burst)) return;
        for (int i = 0; i < kWrites; ++i) {
            const std::vector<uint8_t> resp = client.recvExactly(14);
            if (resp.size() != 14) return;
            const uint16_t addr = (uint16_t)((resp[10] << 8) | resp[11]);
            if (addr != base + i || resp[12] != 0) return;
            ++*acked;
        }
    };

    int ackedA = 0;
    int ackedB = 0;
    std::thread a(session, 0x1000, 0xAA, &ackedA);
    std::thread b(session, 0x2000, 0xBB, &ackedB);
    a.join();
    b.join();

    EXPECT_EQ(ackedA, kWrites);
    EXPECT_EQ(ackedB, kWrites);
    EXPECT_EQ(monitor.overlaps(), 0);
    EXPECT_EQ(monitor.transactions(), 2 * kWrites);
    EXPECT_EQ(backend.writeCount(), (uint32_t)(2 * kWrites));

    const std::vector<MockWriteRecord> journal = backend.journal();
    ASSERT_EQ(journal.size(), (size_t)(2 * kWrites));
    for (const MockWriteRecord& rec : journal) {
        const uint8_t expected = (rec.address >= 0x2000) ? 0xBB : 0xAA;
        EXPECT_EQ(rec.length, 32u);
        EXPECT_EQ(rec.head[0], expected);
        EXPECT_EQ(rec.head[7], expected);
    }
    server.stop();
}

TEST(PosixTcpServer, RefusesClientsAboveLimit)
{
    MockBackend backend;
    PosixTcpServer server(backend, loopbackOptions(1));
    char err[128] = {0};
    ASSERT_TRUE(server.start(err, sizeof(err))) << err;

    Client first(server.boundPort());
    ASSERT_TRUE(first.connected());
    ASSERT_TRUE(first.send(Frames::read(0x01, 1, 0x0000)));
    ASSERT_EQ(first.recvExactly(15).size(), 15u);

    Client second(server.boundPort());
    ASSERT_TRUE(second.connected());
    EXPECT_TRUE(second.closedByPeer());
    EXPECT_TRUE(waitFor([&server] { return server.stats().refused == 1; }));
    EXPECT_EQ(server.activeSessions(), 1u);

    server.stop();
}

TEST(PosixTcpServer, ReapsFinishedSessions)
{
    MockBackend backend;
    PosixTcpServer server(backend, loopbackOptions(1));
    char err[128] = {0};
    ASSERT_TRUE(server.start(err, sizeof(err))) << err;

    {
        Client client(server.boundPort());
        ASSERT_TRUE(client.connected());
        ASSERT_TRUE(client.send(Frames::read(0x01, 1, 0x0000)));
        ASSERT_EQ(client.recvExactly(15).size(), 15u);
    }
    EXPECT_TRUE(waitFor([&server] { return server.stats().closed == 1 && server.activeSessions() == 0; }));

    Client again(server.boundPort());
    ASSERT_TRUE(again.connected());
    ASSERT_TRUE(again.send(Frames::read(0x01, 1, 0x0000)));
    EXPECT_EQ(again.recvExactly(15).size(), 15u);
    server.stop();
}

TEST(PosixTcpServer, StopClosesLiveSessions)
{
    MockBackend backend;
    PosixTcpServer server(backend, loopbackOptions());
    char err[128] = {0};
    ASSERT_TRUE(server.start(err, sizeof(err))) << err;

    Client client(server.boundPort());
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(waitFor([&server] { return server.activeSessions() == 1; }));

    server.stop();
    EXPECT_TRUE(client.closedByPeer());
    EXPECT_EQ(server.activeSessions(), 0u);
}
