/**
 * @file PosixSocketStream.cpp
 */

#include "Host/PosixSocketStream.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <stdio.h>
#include <sys/socket.h>

PosixSocketStream::PosixSocketStream(int fd)
    : fd_(fd)
{
    sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getpeername(fd_, (sockaddr*)&addr, &addrLen) == 0 && addr.sin_family == AF_INET) {
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        snprintf(peer_, sizeof(peer_), "%s:%u", ip, (unsigned)ntohs(addr.sin_port));
    } else {
        snprintf(peer_, sizeof(peer_), "fd%d", fd_);
    }
}

int PosixSocketStream::read(uint8_t* out, size_t maxLen)
{
    for (;;) {
        const ssize_t n = recv(fd_, out, maxLen, 0);
        if (n >= 0) return (int)n;
        if (errno == EINTR) continue;
        return -1;
    }
}

bool PosixSocketStream::writeAll(const uint8_t* data, size_t len)
{
    size_t off = 0;
    while (off < len) {
        const ssize_t n = send(fd_, data + off, len - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += (size_t)n;
    }
    return true;
}
