/**
 * @file execution_service.cpp
 * @brief Implementation of ExecutionService class
 */

#include "snipq/execution_service.h"
#include "snipq/errors.h"

namespace snipq {

namespace {

/// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

/// Cut to MAX_LABEL_BYTES without splitting a UTF-8 sequence
std::string clipLabel(const std::string& label) {
    if (label.size() <= MAX_LABEL_BYTES) {
        return label;
    }
    size_t cut = MAX_LABEL_BYTES;
    while (cut > 0 && (static_cast<unsigned char>(label[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return label.substr(0, cut);
}

} // anonymous namespace

ExecutionService::ExecutionService(const Config& config, Logger* logger)
    : config_(config)
    , logger_(logger)
    , store_(config.history_capacity, config.max_stored_tasks)
    , runner_(RunnerOptions::fromConfig(config))
    , dispatcher_(store_, queue_, runner_,
                  config.execution_timeout_seconds,
                  config.worker_count,
                  config.queue_poll_interval_ms,
                  logger) {
}

ExecutionService::~ExecutionService() {
    shutdown();
}

void ExecutionService::start() {
    dispatcher_.start();
}

void ExecutionService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(submit_mutex_);
        if (!accepting_.exchange(false)) {
            return;  // Already shut down
        }
    }
    log("INFO", "Execution service shutting down");
    dispatcher_.stop();
}

bool ExecutionService::isAccepting() const {
    return accepting_.load();
}

std::string ExecutionService::submit(int64_t submitter_id,
                                     const std::string& label,
                                     const std::string& code) {
    std::string source = stripCodeFence(code);
    size_t length = utf8Length(source);

    if (length < config_.min_code_length) {
        log("INFO", "Rejected submission from " + std::to_string(submitter_id) +
                    ": " + std::to_string(length) + " characters");
        throw SnipqException(ErrorCode::CODE_TOO_SHORT,
                             "got " + std::to_string(length) + " characters, need at least " +
                             std::to_string(config_.min_code_length));
    }
    if (config_.max_code_length > 0 && length > config_.max_code_length) {
        log("INFO", "Rejected submission from " + std::to_string(submitter_id) +
                    ": " + std::to_string(length) + " characters");
        throw SnipqException(ErrorCode::CODE_TOO_LONG,
                             "got " + std::to_string(length) + " characters, limit is " +
                             std::to_string(config_.max_code_length));
    }

    std::lock_guard<std::mutex> lock(submit_mutex_);

    if (!accepting_.load()) {
        throw SnipqException(ErrorCode::SERVICE_STOPPED);
    }

    Task task;
    task.id = generateTaskId(submitter_id);
    task.submitter_id = submitter_id;
    task.submitter_label = clipLabel(label);
    task.source_code = source;
    task.state = TaskState::PENDING;
    task.created_at = std::chrono::system_clock::now();

    store_.insert(task);
    if (!queue_.push(task.id)) {
        // Dispatcher was stopped directly; the task can never run
        TaskResult result;
        result.state = TaskState::FAILED;
        result.stderr_text = ABORTED_MESSAGE;
        store_.finish(task.id, result);
        throw SnipqException(ErrorCode::SERVICE_STOPPED);
    }

    log("INFO", "Task " + task.id + " submitted by " + std::to_string(submitter_id) +
                (label.empty() ? "" : " (" + task.submitter_label + ")") +
                ", " + std::to_string(source.size()) + " bytes");
    return task.id;
}

TaskView ExecutionService::getTask(int64_t requester_id, const std::string& task_id) const {
    auto task = store_.getTask(task_id);
    if (!task.has_value()) {
        throw SnipqException(ErrorCode::TASK_NOT_FOUND, task_id);
    }
    if (task->submitter_id != requester_id && !isAdmin(requester_id)) {
        throw SnipqException(ErrorCode::UNAUTHORIZED,
                             "task " + task_id + " belongs to another user");
    }
    return *task;
}

std::vector<TaskView> ExecutionService::getUserTasks(int64_t submitter_id, size_t limit) const {
    return store_.userHistory(submitter_id, limit);
}

std::vector<TaskView> ExecutionService::getRecentTasks(int64_t requester_id, size_t limit) const {
    requireAdmin(requester_id, "list recent tasks");
    return store_.history(limit);
}

SystemStats ExecutionService::getSystemStats(int64_t requester_id) const {
    requireAdmin(requester_id, "read system statistics");
    return store_.systemStats();
}

UserStats ExecutionService::getUserStats(int64_t submitter_id) const {
    return store_.userStats(submitter_id);
}

size_t ExecutionService::cleanup(int64_t requester_id, std::chrono::seconds older_than) {
    requireAdmin(requester_id, "clean up tasks");

    auto cutoff = std::chrono::system_clock::now() - older_than;
    size_t removed = store_.cleanup(cutoff);
    log("INFO", "Cleanup by " + std::to_string(requester_id) + " removed " +
                std::to_string(removed) + " task(s)");
    return removed;
}

void ExecutionService::resetStats(int64_t requester_id) {
    requireAdmin(requester_id, "reset statistics");
    store_.resetStats();
    log("INFO", "Statistics reset by " + std::to_string(requester_id));
}

bool ExecutionService::isAdmin(int64_t user_id) const {
    return config_.isAdmin(user_id);
}

size_t ExecutionService::queueDepth() const {
    return queue_.size();
}

void ExecutionService::requireAdmin(int64_t requester_id, const std::string& action) const {
    if (!isAdmin(requester_id)) {
        log("WARN", "User " + std::to_string(requester_id) + " may not " + action);
        throw SnipqException(ErrorCode::UNAUTHORIZED, "only administrators may " + action);
    }
}

void ExecutionService::log(const std::string& level, const std::string& message) const {
    if (logger_ != nullptr) {
        logger_->log(level, message);
    }
}

} // namespace snipq
