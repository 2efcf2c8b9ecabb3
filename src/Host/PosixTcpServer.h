#pragma once
/**
 * @file PosixTcpServer.h
 * @brief Host TCP server: one thread per accepted connection.
 *
 * Every session runs its own ConnectionHandler against the shared backend.
 * Finished sessions are joined by the accept loop; stop() shuts down the
 * listener and every live session.
 */

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <thread>

#include "Core/ConnectionHandler.h"
#include "Core/Services/IRegisterBackend.h"

struct TcpServerOptions {
    const char* bindAddress = "0.0.0.0";
    uint16_t port = SigmaTcpProtocol::DefaultTcpPort;  ///< 0 = pick an ephemeral port
    uint8_t maxClients = 0;                            ///< 0 = unlimited
    ConnectionOptions connection{};
};

struct TcpServerStats {
    uint32_t accepted = 0;
    uint32_t refused = 0;
    uint32_t closed = 0;
    uint32_t ioErrors = 0;
};

class PosixTcpServer {
public:
    PosixTcpServer(IRegisterBackend& backend, const TcpServerOptions& opts);
    ~PosixTcpServer();

    PosixTcpServer(const PosixTcpServer&) = delete;
    PosixTcpServer& operator=(const PosixTcpServer&) = delete;

    /** Bind, listen and start the accept thread. */
    bool start(char* err, size_t errLen);
    void stop();

    bool running() const { return running_.load(); }
    uint16_t boundPort() const { return boundPort_; }
    size_t activeSessions() const;
    TcpServerStats stats() const;

private:
    struct Session {
        int fd = -1;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    IRegisterBackend& backend_;
    TcpServerOptions opts_;
    int listenFd_ = -1;
    uint16_t boundPort_ = 0;
    std::atomic<bool> running_{false};
    std::thread acceptThread_;

    mutable std::mutex mutex_;
    std::list<std::unique_ptr<Session>> sessions_;
    TcpServerStats stats_{};

    void acceptLoop_();
    void serveSession_(Session* session);
    void reapFinished_();
};
