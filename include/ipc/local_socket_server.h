// include/ipc/local_socket_server.h
#pragma once

#include "ipc/local_socket.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace kiosk_payment::ipc {

// Request/response server on a local endpoint.
//
// Each accepted connection is one call activation: a worker thread reads a
// single request, passes it to the handler, writes the reply and closes the
// connection. Calls therefore never share connection state, and a long Pay
// does not block Test.
class LocalSocketServer {
public:
    /// Returns the serialized reply for one serialized request.
    using RequestHandler = std::function<std::string(const std::string& request)>;

    explicit LocalSocketServer(const std::string& socketPath,
                               std::chrono::milliseconds ioTimeout = std::chrono::milliseconds(30000));
    ~LocalSocketServer();

    LocalSocketServer(const LocalSocketServer&) = delete;
    LocalSocketServer& operator=(const LocalSocketServer&) = delete;

    // Binds (replacing a stale endpoint file) and starts accepting.
    bool start(RequestHandler handler);

    // Stops accepting, waits for in-flight calls and removes the endpoint.
    // Must not be called from inside the handler.
    void stop();

    bool isRunning() const { return running_; }
    size_t getActiveCallCount() const;
    const std::string& getSocketPath() const { return socketPath_; }
    std::string getLastError() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void acceptThread();
    void serveConnection(LocalSocket client);
    void reapFinishedWorkers();

    std::string socketPath_;
    std::chrono::milliseconds ioTimeout_;
    int listenFd_;
    std::atomic<bool> running_;
    std::thread acceptThread_;
    RequestHandler handler_;

    std::list<Worker> workers_;
    mutable std::mutex workersMutex_;

    mutable std::mutex errorMutex_;
    std::string lastError_;

    static constexpr int LISTEN_BACKLOG = 16;
    static constexpr int ACCEPT_POLL_MS = 200;
};

} // namespace kiosk_payment::ipc
