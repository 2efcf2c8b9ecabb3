/**
 * @file PosixTcpServer.cpp
 */

#include "Host/PosixTcpServer.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Host/PosixSocketStream.h"

#define LOG_TAG "TcpSrv"
#include "Core/ModuleLog.h"

namespace {

constexpr int kAcceptPollMs = 100;
constexpr int kListenBacklog = 8;

bool fail_(char* err, size_t errLen, const char* what)
{
    if (err && errLen > 0) snprintf(err, errLen, "%s: %s", what, strerror(errno));
    return false;
}

}  // namespace

PosixTcpServer::PosixTcpServer(IRegisterBackend& backend, const TcpServerOptions& opts)
    : backend_(backend),
      opts_(opts)
{
}

PosixTcpServer::~PosixTcpServer()
{
    stop();
}

bool PosixTcpServer::start(char* err, size_t errLen)
{
    if (running_.load()) return true;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(opts_.port);
    if (inet_pton(AF_INET, opts_.bindAddress ? opts_.bindAddress : "0.0.0.0", &addr.sin_addr) != 1) {
        if (err && errLen > 0) snprintf(err, errLen, "invalid bind address");
        return false;
    }

    listenFd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) return fail_(err, errLen, "socket");

    const int one = 1;
    setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (bind(listenFd_, (sockaddr*)&addr, sizeof(addr)) != 0) {
        fail_(err, errLen, "bind");
        close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    if (listen(listenFd_, kListenBacklog) != 0) {
        fail_(err, errLen, "listen");
        close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    getsockname(listenFd_, (sockaddr*)&bound, &boundLen);
    boundPort_ = ntohs(bound.sin_port);

    running_.store(true);
    acceptThread_ = std::thread(&PosixTcpServer::acceptLoop_, this);
    LOGI("listening on %s:%u", opts_.bindAddress ? opts_.bindAddress : "0.0.0.0", (unsigned)boundPort_);
    return true;
}

void PosixTcpServer::stop()
{
    if (!running_.exchange(false)) return;

    if (acceptThread_.joinable()) acceptThread_.join();
    if (listenFd_ >= 0) {
        close(listenFd_);
        listenFd_ = -1;
    }

    std::list<std::unique_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    // Wake every blocked recv(); handlers then see EOF and return.
    for (auto& s : sessions) shutdown(s->fd, SHUT_RDWR);
    for (auto& s : sessions) {
        if (s->thread.joinable()) s->thread.join();
        close(s->fd);
    }
    LOGI("stopped, %u session(s) closed", (unsigned)sessions.size());
}

size_t PosixTcpServer::activeSessions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& s : sessions_) {
        if (!s->done.load()) ++n;
    }
    return n;
}

TcpServerStats PosixTcpServer::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void PosixTcpServer::acceptLoop_()
{
    while (running_.load()) {
        pollfd pfd{};
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        const int ready = poll(&pfd, 1, kAcceptPollMs);
        reapFinished_();
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOGE("poll failed: %s", strerror(errno));
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) continue;

        const int fd = accept(listenFd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN) LOGW("accept failed: %s", strerror(errno));
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (opts_.maxClients != 0 && sessions_.size() >= opts_.maxClients) {
            ++stats_.refused;
            LOGW("refusing client, %u session(s) active", (unsigned)sessions_.size());
            close(fd);
            continue;
        }

        ++stats_.accepted;
        std::unique_ptr<Session> session = std::make_unique<Session>();
        session->fd = fd;
        Session* raw = session.get();
        sessions_.push_back(std::move(session));
        raw->thread = std::thread(&PosixTcpServer::serveSession_, this, raw);
    }
}

void PosixTcpServer::serveSession_(Session* session)
{
    PosixSocketStream stream(session->fd);
    LOGI("client connected %s", stream.peerName());

    ConnectionHandler handler(backend_, opts_.connection);
    const ErrorCode rc = handler.run(stream);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rc == ErrorCode::ConnectionIOError) {
            ++stats_.ioErrors;
        } else {
            ++stats_.closed;
        }
    }
    LOGI("client disconnected %s (%s)", stream.peerName(), errorCodeStr(rc));
    session->done.store(true);
}

void PosixTcpServer::reapFinished_()
{
    std::list<std::unique_ptr<Session>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if ((*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& s : finished) {
        if (s->thread.joinable()) s->thread.join();
        close(s->fd);
    }
}
