/**
 * @file server.cpp
 * @brief Implementation of Server class
 *
 * Main server daemon that integrates all snipq components.
 */

#include "snipq/server.h"
#include "snipq/errors.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace snipq {

// Global server instance for signal handling
Server* g_server_instance = nullptr;

namespace {

/// Room for {"tasks": [...], "truncated": ...} around the task objects
constexpr size_t LIST_ENVELOPE_BYTES = 64;

} // anonymous namespace

// Signal handler
static void signalHandler(int /* signum */) {
    if (g_server_instance) {
        g_server_instance->requestShutdown();
    }
}

Server::Server(const Config& config)
    : config_(config) {
    logger_ = std::make_unique<Logger>(config_.enable_logging ? config_.log_dir : "");
    service_ = std::make_unique<ExecutionService>(config_, logger_.get());
    ipc_server_ = std::make_unique<IPCServer>(config_.socket_path);

    log("INFO", "Server initialized");
    std::ostringstream oss;
    oss << "Config: socket_path=" << config_.socket_path
        << ", interpreter=" << config_.interpreter
        << ", timeout=" << config_.execution_timeout_seconds << "s"
        << ", workers=" << config_.worker_count
        << ", history=" << config_.history_capacity
        << ", max_code=" << config_.max_code_length
        << ", admins=" << config_.admin_ids.size();
    log("DEBUG", oss.str());
}

Server::~Server() {
    stop();
    if (g_server_instance == this) {
        g_server_instance = nullptr;
    }
}

bool Server::start() {
    if (running_.exchange(true)) {
        return true;  // Already running
    }

    log("INFO", "Starting server...");

    // Set global instance for signal handling
    g_server_instance = this;
    setupSignalHandlers();

    service_->start();
    log("INFO", "Dispatcher started");

    try {
        ipc_server_->start([this](MsgType type, const std::string& data) {
            return handleRequest(type, data);
        });
    } catch (const SnipqException& e) {
        log("ERROR", e.what());
        running_ = false;
        service_->shutdown();
        throw;
    }
    log("INFO", "IPC server started on " + config_.socket_path);

    log("INFO", "Server started successfully");
    return true;
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    log("INFO", "Stopping server...");
    shutdown_requested_ = true;

    // Stop IPC server first (stop accepting new requests)
    ipc_server_->stop();
    log("DEBUG", "IPC server stopped");

    service_->shutdown();
    log("DEBUG", "Execution service stopped");

    log("INFO", "Server stopped");
}

bool Server::isRunning() const {
    return running_.load();
}

void Server::run() {
    if (!start()) {
        return;
    }

    // Wait for shutdown signal
    while (running_.load() && !shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    stop();
}

void Server::requestShutdown() noexcept {
    shutdown_requested_ = true;
}

bool Server::daemonize() {
    pid_t pid = fork();

    if (pid < 0) {
        return false;  // Fork failed
    }

    if (pid > 0) {
        // Parent process - exit
        _exit(0);
    }

    // Child process - become session leader
    if (setsid() < 0) {
        return false;
    }

    // Fork again to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) {
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    if (chdir("/") != 0) {
        log("WARN", "Could not change directory to /");
    }

    // Redirect standard streams to /dev/null
    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        if (null_fd > 2) {
            close(null_fd);
        }
    }

    return true;
}

const Config& Server::getConfig() const {
    return config_;
}

ExecutionService& Server::getService() {
    return *service_;
}

void Server::log(const std::string& level, const std::string& message) {
    logger_->log(level, message);
}

std::string Server::handleRequest(MsgType type, const std::string& data) {
    log("DEBUG", "Received request: " + msgTypeToString(type));

    switch (type) {
        case MsgType::SUBMIT:
            return handleSubmit(data);
        case MsgType::GET_TASK:
            return handleGetTask(data);
        case MsgType::LIST_MINE:
            return handleList(data, false);
        case MsgType::LIST_RECENT:
            return handleList(data, true);
        case MsgType::STATS:
            return handleStats(data);
        case MsgType::CLEANUP:
            return handleCleanup(data);
        case MsgType::RESET_STATS:
            return handleResetStats(data);
        case MsgType::SHUTDOWN:
            return handleShutdown();
        default:
            throw SnipqException(ErrorCode::IPC_PROTOCOL_ERROR,
                "Unexpected request type " + msgTypeToString(type));
    }
}

std::string Server::handleSubmit(const std::string& data) {
    auto req = SubmitRequest::fromJson(data);

    SubmitResponse resp;
    resp.task_id = service_->submit(req.user_id, req.label, req.code);
    resp.queue_depth = service_->queueDepth();
    return resp.toJson();
}

std::string Server::handleGetTask(const std::string& data) {
    auto req = TaskRequest::fromJson(data);
    return service_->getTask(req.user_id, req.task_id).toJson();
}

std::string Server::handleList(const std::string& data, bool everyone) {
    auto req = ListRequest::fromJson(data);

    std::vector<TaskView> tasks = everyone
        ? service_->getRecentTasks(req.user_id, req.limit)
        : service_->getUserTasks(req.user_id, req.limit);

    // Keep the newest tasks that fit one frame
    TaskListResponse resp;
    size_t used = LIST_ENVELOPE_BYTES;
    for (auto& task : tasks) {
        size_t size = task.toJson().size() + 1;
        if (used + size > MAX_PAYLOAD_SIZE) {
            resp.truncated = true;
            break;
        }
        used += size;
        resp.tasks.push_back(std::move(task));
    }
    if (resp.truncated) {
        log("WARN", "List for " + std::to_string(req.user_id) + " cut to " +
                    std::to_string(resp.tasks.size()) + " of " +
                    std::to_string(tasks.size()) + " tasks");
    }
    return resp.toJson();
}

std::string Server::handleStats(const std::string& data) {
    auto req = UserRequest::fromJson(data);

    StatsResponse resp;
    resp.user = service_->getUserStats(req.user_id);
    resp.is_admin = service_->isAdmin(req.user_id);
    if (resp.is_admin) {
        resp.system = service_->getSystemStats(req.user_id);
    }
    resp.queue_depth = service_->queueDepth();
    return resp.toJson();
}

std::string Server::handleCleanup(const std::string& data) {
    auto req = CleanupRequest::fromJson(data);
    if (req.older_than_seconds < 0) {
        throw SnipqException(ErrorCode::INVALID_ARGUMENT, "older_than_seconds must not be negative");
    }

    CleanupResponse resp;
    resp.removed = service_->cleanup(req.user_id, std::chrono::seconds(req.older_than_seconds));
    return resp.toJson();
}

std::string Server::handleResetStats(const std::string& data) {
    auto req = UserRequest::fromJson(data);
    service_->resetStats(req.user_id);
    return "{}";
}

std::string Server::handleShutdown() {
    log("INFO", "Shutdown request received");

    nlohmann::json response;
    response["message"] = "Server shutting down";

    // Processed by run() after the response is sent
    shutdown_requested_ = true;

    return response.dump();
}

void Server::setupSignalHandlers() {
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    // Ignore SIGPIPE (broken pipe)
    signal(SIGPIPE, SIG_IGN);
}

} // namespace snipq
