// POSIX socket plumbing: resolve, bounded connect, keepalive, timed send/recv.
#include "ftpdeck/Net.hpp"
#include "ftpdeck/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace ftpdeck {
namespace net {

static ErrorCode codeForConnectErrno(int e) {
    switch (e) {
        case ECONNREFUSED: return ErrorCode::Refused;
        case ETIMEDOUT:    return ErrorCode::Timeout;
        default:           return ErrorCode::Unreachable;
    }
}

static void enableKeepalive(int s) {
    int opt = 1;
    ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
    int idle = 60;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
    int idle = 60, intvl = 10, cnt = 3;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
}

// Non-blocking connect bounded by poll(); the socket is back in blocking mode on return.
static int connectBounded(int s, const sockaddr* addr, socklen_t len, int timeoutMs) {
    const int flags = ::fcntl(s, F_GETFL, 0);
    ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(s, addr, len);
    int result = 0;
    if (rc != 0) {
        if (errno != EINPROGRESS) {
            result = errno;
        } else {
            pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            int pr = ::poll(&pfd, 1, timeoutMs);
            if (pr == 0) {
                result = ETIMEDOUT;
            } else if (pr < 0) {
                result = errno;
            } else {
                int soerr = 0;
                socklen_t sl = sizeof(soerr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &sl);
                result = soerr;
            }
        }
    }
    ::fcntl(s, F_SETFL, flags);
    return result;
}

bool tcpConnect(const std::string& host, std::uint16_t port, int timeoutMs,
                int& fdOut, Error& err) {
    fdOut = -1;
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorCode::Unreachable, std::string("cannot resolve ") + host + ": " + gai_strerror(gai));
        return false;
    }

    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        enableKeepalive(s);
        int rc = connectBounded(s, rp->ai_addr, rp->ai_addrlen, timeoutMs);
        if (rc == 0) {
            ::freeaddrinfo(res);
            setIoTimeout(s, timeoutMs);
            fdOut = s;
            return true;
        }
        lastErrno = rc;
        ::close(s);
    }
    ::freeaddrinfo(res);
    err.set(codeForConnectErrno(lastErrno),
            host + ":" + portStr + ": " + std::strerror(lastErrno ? lastErrno : EHOSTUNREACH));
    LOGW("connect %s:%s failed: %s", host.c_str(), portStr, std::strerror(lastErrno));
    return false;
}

void setIoTimeout(int fd, int ms) {
    if (fd < 0) return;
    timeval tv{};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool sendAll(int fd, const char* data, std::size_t len, Error& err) {
    while (len > 0) {
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                err.set(ErrorCode::Timeout, "send timed out");
            } else {
                err.set(ErrorCode::ConnectionLost, std::string("send: ") + std::strerror(errno));
            }
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

long recvSome(int fd, char* buf, std::size_t len, Error& err) {
    for (;;) {
        ssize_t n = ::recv(fd, buf, len, 0);
        if (n >= 0) return static_cast<long>(n);
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            err.set(ErrorCode::Timeout, "no data from server");
        } else {
            err.set(ErrorCode::ConnectionLost, std::string("recv: ") + std::strerror(errno));
        }
        return -1;
    }
}

std::string peerHost(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return {};
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        auto* in = reinterpret_cast<sockaddr_in*>(&ss);
        ::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&ss);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

void closeSocket(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace net
} // namespace ftpdeck
