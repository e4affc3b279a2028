/**
 * @file ipc_client.cpp
 * @brief Implementation of Unix Domain Socket client
 */

#include "snipq/ipc_client.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace snipq {

// Read/Write timeout in seconds
constexpr int IO_TIMEOUT_SEC = 30;

IPCClient::IPCClient(const std::string& socket_path)
    : socket_path_(socket_path) {
}

IPCClient::~IPCClient() {
    disconnect();
}

IPCClient::IPCClient(IPCClient&& other) noexcept
    : socket_path_(std::move(other.socket_path_))
    , fd_(other.fd_)
    , last_error_(std::move(other.last_error_))
    , last_error_code_(other.last_error_code_) {
    other.fd_ = -1;
}

IPCClient& IPCClient::operator=(IPCClient&& other) noexcept {
    if (this != &other) {
        disconnect();
        socket_path_ = std::move(other.socket_path_);
        fd_ = other.fd_;
        last_error_ = std::move(other.last_error_);
        last_error_code_ = other.last_error_code_;
        other.fd_ = -1;
    }
    return *this;
}

bool IPCClient::connect() {
    if (fd_ >= 0) {
        return true;  // Already connected
    }

    last_error_.clear();
    last_error_code_ = ErrorCode::SUCCESS;

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (socket_path_.length() >= sizeof(addr.sun_path)) {
        last_error_ = "Socket path too long";
        last_error_code_ = ErrorCode::IPC_CONNECTION_FAILED;
        return false;
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        last_error_ = "Failed to create socket: " + std::string(strerror(errno));
        last_error_code_ = ErrorCode::IPC_CONNECTION_FAILED;
        return false;
    }

    // Set socket timeouts
    struct timeval tv;
    tv.tv_sec = IO_TIMEOUT_SEC;
    tv.tv_usec = 0;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd_);
        fd_ = -1;

        if (err == ENOENT || err == ECONNREFUSED) {
            last_error_ = "Server is not running";
            last_error_code_ = ErrorCode::IPC_SERVER_NOT_RUNNING;
        } else {
            last_error_ = "Failed to connect: " + std::string(strerror(err));
            last_error_code_ = ErrorCode::IPC_CONNECTION_FAILED;
        }
        return false;
    }

    return true;
}

void IPCClient::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

std::optional<std::string> IPCClient::call(MsgType type, const std::string& payload) {
    last_error_.clear();
    last_error_code_ = ErrorCode::SUCCESS;

    if (!isConnected()) {
        last_error_ = "Not connected to server";
        last_error_code_ = ErrorCode::IPC_CONNECTION_FAILED;
        return std::nullopt;
    }

    if (!writeFrame(fd_, type, payload)) {
        last_error_ = "Failed to send " + msgTypeToString(type) + " request";
        last_error_code_ = ErrorCode::IPC_SEND_FAILED;
        disconnect();
        return std::nullopt;
    }

    MsgType response_type;
    std::string response_payload;
    if (!readFrame(fd_, response_type, response_payload)) {
        last_error_ = "Failed to read response";
        last_error_code_ = ErrorCode::IPC_RECEIVE_FAILED;
        disconnect();
        return std::nullopt;
    }

    if (response_type == MsgType::ERROR) {
        try {
            ErrorResponse err = ErrorResponse::fromJson(response_payload);
            last_error_ = err.message;
            last_error_code_ = static_cast<ErrorCode>(err.code);
        } catch (const SnipqException&) {
            last_error_ = "Server returned error";
            last_error_code_ = ErrorCode::IPC_PROTOCOL_ERROR;
        }
        return std::nullopt;
    }

    if (response_type != MsgType::OK) {
        last_error_ = "Unexpected response type: " + msgTypeToString(response_type);
        last_error_code_ = ErrorCode::IPC_PROTOCOL_ERROR;
        return std::nullopt;
    }

    return response_payload;
}

std::optional<SubmitResponse> IPCClient::submit(const SubmitRequest& req) {
    auto payload = call(MsgType::SUBMIT, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return SubmitResponse::fromJson(*payload);
    } catch (const SnipqException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        last_error_code_ = e.code();
        return std::nullopt;
    }
}

std::optional<Task> IPCClient::getTask(int64_t user_id, const std::string& task_id) {
    TaskRequest req;
    req.user_id = user_id;
    req.task_id = task_id;

    auto payload = call(MsgType::GET_TASK, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return Task::fromJson(*payload);
    } catch (const SnipqException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        last_error_code_ = e.code();
        return std::nullopt;
    }
}

std::optional<std::vector<Task>> IPCClient::callForTasks(MsgType type, const ListRequest& req) {
    auto payload = call(type, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return TaskListResponse::fromJson(*payload).tasks;
    } catch (const SnipqException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        last_error_code_ = e.code();
        return std::nullopt;
    }
}

std::optional<std::vector<Task>> IPCClient::listMine(int64_t user_id, size_t limit) {
    ListRequest req;
    req.user_id = user_id;
    req.limit = limit;
    return callForTasks(MsgType::LIST_MINE, req);
}

std::optional<std::vector<Task>> IPCClient::listRecent(int64_t user_id, size_t limit) {
    ListRequest req;
    req.user_id = user_id;
    req.limit = limit;
    return callForTasks(MsgType::LIST_RECENT, req);
}

std::optional<StatsResponse> IPCClient::stats(int64_t user_id) {
    UserRequest req;
    req.user_id = user_id;

    auto payload = call(MsgType::STATS, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return StatsResponse::fromJson(*payload);
    } catch (const SnipqException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        last_error_code_ = e.code();
        return std::nullopt;
    }
}

std::optional<size_t> IPCClient::cleanup(int64_t user_id, int64_t older_than_seconds) {
    CleanupRequest req;
    req.user_id = user_id;
    req.older_than_seconds = older_than_seconds;

    auto payload = call(MsgType::CLEANUP, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return CleanupResponse::fromJson(*payload).removed;
    } catch (const SnipqException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        last_error_code_ = e.code();
        return std::nullopt;
    }
}

bool IPCClient::resetStats(int64_t user_id) {
    UserRequest req;
    req.user_id = user_id;
    return call(MsgType::RESET_STATS, req.toJson()).has_value();
}

bool IPCClient::shutdown() {
    return call(MsgType::SHUTDOWN, "{}").has_value();
}

} // namespace snipq
