// =============================================================================
// mirrorhub - Socket Stream
// =============================================================================
#include "socket_stream.hpp"
#include "mirrorhub_log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mirrorhub {

namespace {

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

SocketStream::SocketStream(int fd) : fd_(fd) {}

SocketStream::~SocketStream() {
    close();
}

Result<size_t> SocketStream::read(uint8_t* buf, size_t len, int timeout_ms) {
    int fd = fd_.load();
    if (fd < 0) return Err<size_t>(ErrorCode::Disconnected, "socket closed");

    for (;;) {
        struct pollfd pfd{fd, POLLIN, 0};
        int pr = poll(&pfd, 1, timeout_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            return Err<size_t>(ErrorCode::IoError, std::string("poll: ") + strerror(errno));
        }
        if (pr == 0) return Err<size_t>(ErrorCode::Timeout, "read timeout");

        ssize_t n = ::recv(fd, buf, len, 0);
        if (n > 0) return Ok(static_cast<size_t>(n));
        if (n == 0) return Ok(static_cast<size_t>(0));
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        if (errno == ECONNRESET || errno == EPIPE) {
            return Err<size_t>(ErrorCode::Disconnected, "connection reset");
        }
        return Err<size_t>(ErrorCode::IoError, std::string("recv: ") + strerror(errno));
    }
}

Result<void> SocketStream::writeAll(const uint8_t* data, size_t len, int timeout_ms) {
    int fd = fd_.load();
    if (fd < 0) return Err<void>(ErrorCode::Disconnected, "socket closed");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t sent = 0;
    while (sent < len) {
        struct pollfd pfd{fd, POLLOUT, 0};
        int pr = poll(&pfd, 1, remainingMs(deadline));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return Err<void>(ErrorCode::IoError, std::string("poll: ") + strerror(errno));
        }
        if (pr == 0) return Err<void>(ErrorCode::Timeout, "write timeout");

        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
        if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
            return Err<void>(ErrorCode::Disconnected, "peer closed");
        }
        return Err<void>(ErrorCode::IoError, std::string("send: ") + strerror(errno));
    }
    return Ok();
}

void SocketStream::interrupt() {
    int fd = fd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void SocketStream::close() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) ::close(fd);
}

Result<std::unique_ptr<SocketStream>> connectTcp(const std::string& host, int port,
                                                 int timeout_ms) {
    using R = Result<std::unique_ptr<SocketStream>>;

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        return R(Error(ErrorCode::IoError, std::string("socket: ") + strerror(errno)));
    }
    auto stream = std::make_unique<SocketStream>(fd);

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return R(Error(ErrorCode::ValidationError, "bad address " + host, "host"));
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc != 0 && errno != EINPROGRESS) {
        int err = errno;
        if (err == ECONNREFUSED) {
            return R(Error(ErrorCode::Disconnected, "connection refused on port " + std::to_string(port)));
        }
        return R(Error(ErrorCode::IoError, std::string("connect: ") + strerror(err)));
    }
    if (rc != 0) {
        struct pollfd pfd{fd, POLLOUT, 0};
        int pr = poll(&pfd, 1, timeout_ms);
        if (pr == 0) {
            return R(Error(ErrorCode::Timeout, "connect timeout on port " + std::to_string(port)));
        }
        int so_error = 0;
        socklen_t slen = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &slen);
        if (pr < 0 || so_error != 0) {
            int err = pr < 0 ? errno : so_error;
            ErrorCode code = err == ECONNREFUSED ? ErrorCode::Disconnected : ErrorCode::IoError;
            return R(Error(code, std::string("connect: ") + strerror(err)));
        }
    }

    fcntl(fd, F_SETFL, flags);
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    MHLOG_DEBUG("socket", "Connected to %s:%d", host.c_str(), port);
    return R(std::move(stream));
}

} // namespace mirrorhub
