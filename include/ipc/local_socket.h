// include/ipc/local_socket.h
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kiosk_payment::ipc {

// Stream socket on a filesystem endpoint (AF_UNIX) carrying length-prefixed
// messages: a 4-byte big-endian size followed by the message body.
// The descriptor is non-blocking; every blocking step waits with poll()
// against a per-call deadline.
class LocalSocket {
public:
    LocalSocket();
    explicit LocalSocket(int fd);
    ~LocalSocket();

    LocalSocket(const LocalSocket&) = delete;
    LocalSocket& operator=(const LocalSocket&) = delete;
    LocalSocket(LocalSocket&& other) noexcept;
    LocalSocket& operator=(LocalSocket&& other) noexcept;

    /// Fails immediately when nothing listens on `path`; waits up to
    /// `timeout` while the listener's backlog is full.
    bool connectTo(const std::string& path, std::chrono::milliseconds timeout);

    bool sendMessage(const std::string& message, std::chrono::milliseconds timeout);
    bool receiveMessage(std::string& message, std::chrono::milliseconds timeout);

    bool isOpen() const { return fd_ >= 0; }
    int getFd() const { return fd_; }
    void close();

    const std::string& getLastError() const { return lastError_; }

    static constexpr uint32_t MAX_MESSAGE_SIZE = 1024 * 1024;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    bool sendAll(const char* data, size_t length, Deadline deadline);
    bool recvAll(char* data, size_t length, Deadline deadline);
    bool waitFor(short events, Deadline deadline);
    void setErrno(const std::string& what);

    int fd_;
    std::string lastError_;
};

// Fills a sockaddr_un for `path`; false when the path does not fit.
bool makeLocalAddress(const std::string& path, void* address, size_t& addressLength);

bool setNonBlocking(int fd);

} // namespace kiosk_payment::ipc
