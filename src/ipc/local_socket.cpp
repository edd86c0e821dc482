// src/ipc/local_socket.cpp
#include "ipc/local_socket.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>
#include <vector>

namespace kiosk_payment::ipc {

namespace {

#ifdef MSG_NOSIGNAL
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
        return 0;
    }
    return left > 60000 ? 60000 : static_cast<int>(left);
}

} // namespace

bool makeLocalAddress(const std::string& path, void* address, size_t& addressLength) {
    auto* addr = static_cast<sockaddr_un*>(address);
    std::memset(addr, 0, sizeof(sockaddr_un));
    if (path.empty() || path.size() >= sizeof(addr->sun_path)) {
        return false;
    }
    addr->sun_family = AF_UNIX;
    std::memcpy(addr->sun_path, path.c_str(), path.size());
    addressLength = offsetof(sockaddr_un, sun_path) + path.size() + 1;
    return true;
}

bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

LocalSocket::LocalSocket()
    : fd_(-1) {
}

LocalSocket::LocalSocket(int fd)
    : fd_(fd) {
    if (fd_ >= 0 && !setNonBlocking(fd_)) {
        setErrno("fcntl(O_NONBLOCK)");
        close();
    }
}

LocalSocket::~LocalSocket() {
    close();
}

LocalSocket::LocalSocket(LocalSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , lastError_(std::move(other.lastError_)) {
}

LocalSocket& LocalSocket::operator=(LocalSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        lastError_ = std::move(other.lastError_);
    }
    return *this;
}

void LocalSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

bool LocalSocket::connectTo(const std::string& path, std::chrono::milliseconds timeout) {
    close();

    sockaddr_un addr{};
    size_t addrLen = 0;
    if (!makeLocalAddress(path, &addr, addrLen)) {
        lastError_ = "Invalid endpoint path: " + path;
        return false;
    }

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        setErrno("socket");
        return false;
    }
    if (!setNonBlocking(fd_)) {
        setErrno("fcntl(O_NONBLOCK)");
        close();
        return false;
    }

    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), static_cast<socklen_t>(addrLen)) == 0) {
            return true;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EINPROGRESS) {
            if (!waitFor(POLLOUT, deadline)) {
                close();
                return false;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                errno = soError;
                setErrno("connect");
                close();
                return false;
            }
            return true;
        }
        if (errno == EAGAIN && std::chrono::steady_clock::now() < deadline) {
            // Listener backlog full
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        setErrno("connect(" + path + ")");
        close();
        return false;
    }
}

bool LocalSocket::sendMessage(const std::string& message, std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        lastError_ = "Socket is not open";
        return false;
    }
    if (message.size() > MAX_MESSAGE_SIZE) {
        lastError_ = "Message too large: " + std::to_string(message.size());
        return false;
    }

    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    uint32_t size = htonl(static_cast<uint32_t>(message.size()));
    if (!sendAll(reinterpret_cast<const char*>(&size), sizeof(size), deadline)) {
        return false;
    }
    return message.empty() || sendAll(message.data(), message.size(), deadline);
}

bool LocalSocket::receiveMessage(std::string& message, std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        lastError_ = "Socket is not open";
        return false;
    }

    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    uint32_t size = 0;
    if (!recvAll(reinterpret_cast<char*>(&size), sizeof(size), deadline)) {
        return false;
    }
    size = ntohl(size);
    if (size > MAX_MESSAGE_SIZE) {
        lastError_ = "Invalid message size: " + std::to_string(size);
        return false;
    }

    std::vector<char> buffer(size);
    if (size > 0 && !recvAll(buffer.data(), size, deadline)) {
        return false;
    }
    message.assign(buffer.data(), size);
    return true;
}

bool LocalSocket::sendAll(const char* data, size_t length, Deadline deadline) {
    size_t sent = 0;
    while (sent < length) {
        const ssize_t n = ::send(fd_, data + sent, length - sent, SEND_FLAGS);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!waitFor(POLLOUT, deadline)) {
                return false;
            }
            continue;
        }
        setErrno("send");
        return false;
    }
    return true;
}

bool LocalSocket::recvAll(char* data, size_t length, Deadline deadline) {
    size_t received = 0;
    while (received < length) {
        const ssize_t n = ::recv(fd_, data + received, length - received, 0);
        if (n > 0) {
            received += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            lastError_ = "Connection closed by peer";
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!waitFor(POLLIN, deadline)) {
                return false;
            }
            continue;
        }
        setErrno("recv");
        return false;
    }
    return true;
}

bool LocalSocket::waitFor(short events, Deadline deadline) {
    for (;;) {
        const int waitMs = remainingMs(deadline);
        if (waitMs == 0 && std::chrono::steady_clock::now() >= deadline) {
            lastError_ = "Timed out";
            return false;
        }

        pollfd fds{};
        fds.fd = fd_;
        fds.events = events;
        const int rc = ::poll(&fds, 1, waitMs);
        if (rc > 0) {
            // POLLHUP/POLLERR fall through to the next send/recv, which reports them
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            setErrno("poll");
            return false;
        }
    }
}

void LocalSocket::setErrno(const std::string& what) {
    lastError_ = what + ": " + std::strerror(errno);
}

} // namespace kiosk_payment::ipc
