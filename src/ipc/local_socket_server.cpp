// src/ipc/local_socket_server.cpp
#include "ipc/local_socket_server.h"
#include "logging/logger.h"

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace kiosk_payment::ipc {

LocalSocketServer::LocalSocketServer(const std::string& socketPath, std::chrono::milliseconds ioTimeout)
    : socketPath_(socketPath)
    , ioTimeout_(ioTimeout)
    , listenFd_(-1)
    , running_(false) {
}

LocalSocketServer::~LocalSocketServer() {
    stop();
}

bool LocalSocketServer::start(RequestHandler handler) {
    if (running_) {
        return true;
    }
    if (!handler) {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = "No request handler";
        return false;
    }

    auto fail = [this](const std::string& what) {
        {
            std::lock_guard<std::mutex> lock(errorMutex_);
            lastError_ = what + ": " + std::strerror(errno);
            logging::Logger::getInstance().error("Local socket server: " + lastError_);
        }
        if (listenFd_ >= 0) {
            ::close(listenFd_);
            listenFd_ = -1;
        }
        return false;
    };

    sockaddr_un addr{};
    size_t addrLen = 0;
    if (!makeLocalAddress(socketPath_, &addr, addrLen)) {
        errno = ENAMETOOLONG;
        return fail("Invalid endpoint path " + socketPath_);
    }

    // A previous driver that was killed leaves its endpoint file behind
    ::unlink(socketPath_.c_str());

    listenFd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listenFd_ < 0) {
        return fail("socket");
    }
    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), static_cast<socklen_t>(addrLen)) != 0) {
        return fail("bind(" + socketPath_ + ")");
    }
    if (::chmod(socketPath_.c_str(), S_IRUSR | S_IWUSR) != 0) {
        logging::Logger::getInstance().warn("Cannot restrict endpoint permissions: " + std::string(std::strerror(errno)));
    }
    if (::listen(listenFd_, LISTEN_BACKLOG) != 0) {
        return fail("listen");
    }
    if (!setNonBlocking(listenFd_)) {
        return fail("fcntl(O_NONBLOCK)");
    }

    handler_ = std::move(handler);
    running_ = true;
    acceptThread_ = std::thread(&LocalSocketServer::acceptThread, this);

    logging::Logger::getInstance().info("Local socket server listening on " + socketPath_);
    return true;
}

void LocalSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }
    ::unlink(socketPath_.c_str());

    std::list<Worker> remaining;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        remaining.swap(workers_);
    }
    for (auto& worker : remaining) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    logging::Logger::getInstance().info("Local socket server stopped");
}

size_t LocalSocketServer::getActiveCallCount() const {
    std::lock_guard<std::mutex> lock(workersMutex_);
    size_t active = 0;
    for (const auto& worker : workers_) {
        if (!worker.finished->load()) {
            ++active;
        }
    }
    return active;
}

std::string LocalSocketServer::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

void LocalSocketServer::acceptThread() {
    while (running_) {
        pollfd fds{};
        fds.fd = listenFd_;
        fds.events = POLLIN;
        const int rc = ::poll(&fds, 1, ACCEPT_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            logging::Logger::getInstance().error("Accept poll failed: " + std::string(std::strerror(errno)));
            break;
        }

        reapFinishedWorkers();

        if (rc == 0) {
            continue;
        }

        const int clientFd = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (clientFd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logging::Logger::getInstance().warn("accept failed: " + std::string(std::strerror(errno)));
            }
            continue;
        }

        LocalSocket client(clientFd);
        if (!client.isOpen()) {
            logging::Logger::getInstance().warn("Dropping client: " + client.getLastError());
            continue;
        }

        auto finished = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workersMutex_);
        Worker worker;
        worker.finished = finished;
        worker.thread = std::thread([this, finished](LocalSocket socket) {
            serveConnection(std::move(socket));
            finished->store(true);
        }, std::move(client));
        workers_.push_back(std::move(worker));
    }
}

void LocalSocketServer::serveConnection(LocalSocket client) {
    auto& logger = logging::Logger::getInstance();

    std::string request;
    if (!client.receiveMessage(request, ioTimeout_)) {
        // Readiness probes connect and close without a request
        logger.debug("Connection closed without request: " + client.getLastError());
        return;
    }

    std::string reply;
    try {
        reply = handler_(request);
    } catch (const std::exception& e) {
        logger.error("Request handler threw: " + std::string(e.what()));
        return;
    }

    if (!client.sendMessage(reply, ioTimeout_)) {
        logger.warn("Failed to send reply: " + client.getLastError());
    }
}

void LocalSocketServer::reapFinishedWorkers() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace kiosk_payment::ipc
