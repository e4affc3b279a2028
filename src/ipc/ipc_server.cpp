/**
 * @file ipc_server.cpp
 * @brief Implementation of Unix Domain Socket server
 */

#include "snipq/ipc_server.h"
#include "snipq/errors.h"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace snipq {

// Connection backlog
constexpr int LISTEN_BACKLOG = 16;

// Poll timeout in milliseconds
constexpr int POLL_TIMEOUT_MS = 100;

// Idle connections are dropped after this many seconds
constexpr int CLIENT_TIMEOUT_SECONDS = 30;

IPCServer::IPCServer(const std::string& socket_path)
    : socket_path_(socket_path) {
}

IPCServer::~IPCServer() {
    stop();
}

void IPCServer::start(RequestHandler handler) {
    if (running_.load()) {
        return;  // Already running
    }

    handler_ = std::move(handler);

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (socket_path_.length() >= sizeof(addr.sun_path)) {
        throw SnipqException(ErrorCode::IPC_CONNECTION_FAILED,
            "Socket path too long: " + socket_path_);
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket file if present
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw SnipqException(ErrorCode::IPC_CONNECTION_FAILED,
            "Failed to create socket: " + std::string(strerror(errno)));
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(server_fd_);
        server_fd_ = -1;
        throw SnipqException(ErrorCode::IPC_CONNECTION_FAILED,
            "Failed to bind socket: " + std::string(strerror(err)));
    }

    // Only the owning user may talk to the daemon
    chmod(socket_path_.c_str(), 0600);

    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        int err = errno;
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        throw SnipqException(ErrorCode::IPC_CONNECTION_FAILED,
            "Failed to listen on socket: " + std::string(strerror(err)));
    }

    running_ = true;
    accept_thread_ = std::thread(&IPCServer::acceptLoop, this);
}

void IPCServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wait for accept thread to notice running_ and exit
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }

    // Unblock connection threads waiting in read()
    std::list<std::unique_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto& conn : connections_) {
            if (conn->fd >= 0) {
                shutdown(conn->fd, SHUT_RDWR);
            }
        }
        connections.swap(connections_);
    }

    for (auto& conn : connections) {
        if (conn->thread.joinable()) {
            conn->thread.join();
        }
    }

    unlink(socket_path_.c_str());
}

size_t IPCServer::connectionCount() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return connections_.size();
}

void IPCServer::acceptLoop() {
    while (running_.load()) {
        reapFinished();

        // Use poll to allow periodic checking of running_ flag
        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, POLL_TIMEOUT_MS);

        if (ret < 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, check running_ and retry
            }
            break;  // Error
        }

        if (ret == 0 || !(pfd.revents & POLLIN)) {
            continue;  // Timeout, check running_ and retry
        }

        int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            continue;  // EINTR, EAGAIN or a connection that went away
        }

        struct timeval tv;
        tv.tv_sec = CLIENT_TIMEOUT_SECONDS;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto conn = std::make_unique<Connection>();
        conn->fd = client_fd;
        Connection* raw = conn.get();
        connections_.push_back(std::move(conn));
        raw->thread = std::thread(&IPCServer::handleClient, this, raw);
    }
}

void IPCServer::reapFinished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& conn : finished) {
        if (conn->thread.joinable()) {
            conn->thread.join();
        }
    }
}

void IPCServer::handleClient(Connection* conn) {
    int fd;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        fd = conn->fd;
    }

    while (running_.load()) {
        MsgType type;
        std::string payload;

        // Read request
        if (!readFrame(fd, type, payload)) {
            break;  // Connection closed or error
        }

        std::string response;
        MsgType response_type = dispatch(type, payload, response);

        // Send response
        if (!writeFrame(fd, response_type, response)) {
            break;  // Connection closed or error
        }

        // Handle shutdown request
        if (type == MsgType::SHUTDOWN) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        close(conn->fd);
        conn->fd = -1;
    }
    conn->done = true;
}

MsgType IPCServer::dispatch(MsgType type, const std::string& payload, std::string& response) {
    ErrorResponse err;

    try {
        if (handler_) {
            response = handler_(type, payload);
            if (response.size() > MAX_PAYLOAD_SIZE) {
                throw SnipqException(ErrorCode::IPC_SEND_FAILED,
                    "response of " + std::to_string(response.size()) +
                    " bytes exceeds the frame limit");
            }
            return MsgType::OK;
        }
        err.code = static_cast<int>(ErrorCode::IPC_PROTOCOL_ERROR);
        err.message = "No handler registered";
    } catch (const SnipqException& e) {
        err.code = static_cast<int>(e.code());
        err.message = e.what();
    } catch (const std::exception& e) {
        err.code = static_cast<int>(ErrorCode::IPC_PROTOCOL_ERROR);
        err.message = e.what();
    }

    response = err.toJson();
    return MsgType::ERROR;
}

} // namespace snipq
