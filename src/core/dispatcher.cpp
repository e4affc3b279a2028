/**
 * @file dispatcher.cpp
 * @brief Implementation of Dispatcher class
 *
 * Manages the worker threads and the task execution lifecycle.
 */

#include "snipq/dispatcher.h"

#include <sstream>

namespace snipq {

namespace {

/// Keeps the running-task counter accurate on every exit path
class RunningScope {
public:
    explicit RunningScope(std::atomic<size_t>& counter) : counter_(counter) { ++counter_; }
    ~RunningScope() { --counter_; }

    RunningScope(const RunningScope&) = delete;
    RunningScope& operator=(const RunningScope&) = delete;

private:
    std::atomic<size_t>& counter_;
};

} // anonymous namespace

Dispatcher::Dispatcher(TaskStore& store,
                       PendingQueue& queue,
                       const ProcessRunner& runner,
                       double timeout_seconds,
                       int worker_count,
                       int poll_interval_ms,
                       Logger* logger)
    : store_(store)
    , queue_(queue)
    , runner_(runner)
    , timeout_seconds_(timeout_seconds)
    , worker_count_(worker_count < 1 ? 1 : worker_count)
    , poll_interval_ms_(poll_interval_ms < 1 ? 1 : poll_interval_ms)
    , logger_(logger) {
}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    // A previous stop() leaves both set
    abort_.store(false);
    queue_.reopen();

    for (int i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&Dispatcher::workerLoop, this);
    }
    log("INFO", "Dispatcher started with " + std::to_string(worker_count_) + " worker(s)");
}

void Dispatcher::stop() {
    queue_.close();
    abort_.store(true);

    if (running_.exchange(false)) {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        log("INFO", "Dispatcher stopped");
    }

    failPending();
}

bool Dispatcher::isRunning() const {
    return running_.load();
}

void Dispatcher::setStateCallback(TaskStateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

size_t Dispatcher::runningCount() const {
    return running_count_.load();
}

void Dispatcher::workerLoop() {
    while (running_.load()) {
        auto task_id = queue_.popFor(std::chrono::milliseconds(poll_interval_ms_));
        if (!task_id.has_value()) {
            if (queue_.isClosed()) {
                break;
            }
            continue;
        }
        processTask(*task_id);
    }
}

bool Dispatcher::dispatchOnce(std::chrono::milliseconds wait) {
    auto task_id = queue_.popFor(wait);
    if (!task_id.has_value()) {
        return false;
    }
    processTask(*task_id);
    return true;
}

void Dispatcher::processTask(const std::string& task_id) {
    try {
        auto task = store_.markRunning(task_id);
        if (!task.has_value()) {
            log("WARN", "Dropping task " + task_id + ": not found or not pending");
            return;
        }
        notifyStateChange(task_id, TaskState::PENDING, TaskState::RUNNING);
        log("INFO", "Task " + task_id + " running");

        RunOutcome outcome;
        {
            RunningScope scope(running_count_);
            outcome = runner_.run(task->source_code, timeout_seconds_, &abort_);
        }

        TaskResult result = mapOutcome(outcome, timeout_seconds_);
        auto finished = store_.finish(task_id, result);
        if (!finished.has_value()) {
            log("WARN", "Task " + task_id + " vanished before its result was stored");
            return;
        }
        notifyStateChange(task_id, TaskState::RUNNING, result.state);

        std::ostringstream msg;
        msg << "Task " << task_id << " " << taskStateToString(result.state)
            << " (" << runResultKindToString(outcome.kind);
        if (outcome.kind == RunResultKind::EXITED) {
            msg << " code " << outcome.exit_code;
        }
        msg << ") in " << outcome.elapsed_seconds << "s";
        if (outcome.kind == RunResultKind::SPAWN_ERROR) {
            msg << ": " << outcome.error_message;
        }
        log(result.state == TaskState::COMPLETED ? "INFO" : "WARN", msg.str());

    } catch (const std::exception& e) {
        log("ERROR", "Dispatcher fault on task " + task_id + ": " + e.what());

        auto current = store_.getTask(task_id);
        TaskResult result;
        result.state = TaskState::FAILED;
        result.stderr_text = std::string("System error: ") + e.what();
        if (current.has_value() && store_.finish(task_id, result).has_value()) {
            notifyStateChange(task_id, current->state, TaskState::FAILED);
        }
    }
}

void Dispatcher::failPending() {
    for (const auto& task_id : queue_.drain()) {
        TaskResult result;
        result.state = TaskState::FAILED;
        result.stderr_text = ABORTED_MESSAGE;
        if (store_.finish(task_id, result).has_value()) {
            notifyStateChange(task_id, TaskState::PENDING, TaskState::FAILED);
            log("WARN", "Task " + task_id + " aborted before it ran");
        }
    }
}

TaskResult Dispatcher::mapOutcome(const RunOutcome& outcome, double timeout_seconds) {
    TaskResult result;
    result.duration_seconds = outcome.elapsed_seconds;
    result.output_truncated = outcome.output_truncated;
    result.stdout_text = outcome.stdout_text;

    switch (outcome.kind) {
        case RunResultKind::EXITED:
            result.state = outcome.exit_code == 0 ? TaskState::COMPLETED : TaskState::FAILED;
            result.exit_code = outcome.exit_code;
            result.stderr_text = outcome.stderr_text;
            if (outcome.no_output) {
                result.no_output = true;
                result.stdout_text = NO_OUTPUT_MARKER;
            }
            break;

        case RunResultKind::TIMED_OUT:
            result.state = TaskState::TIMED_OUT;
            result.stderr_text = timeoutMessage(timeout_seconds);
            break;

        case RunResultKind::SPAWN_ERROR:
            result.state = TaskState::FAILED;
            result.stderr_text = "System error: " + outcome.error_message;
            break;

        case RunResultKind::ABORTED:
            result.state = TaskState::FAILED;
            result.stderr_text = ABORTED_MESSAGE;
            break;
    }

    return result;
}

std::string Dispatcher::timeoutMessage(double timeout_seconds) {
    std::ostringstream oss;
    oss << "Execution timed out after " << timeout_seconds << " seconds";
    return oss.str();
}

void Dispatcher::notifyStateChange(const std::string& task_id,
                                   TaskState old_state,
                                   TaskState new_state) {
    TaskStateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = state_callback_;
    }
    if (callback) {
        callback(task_id, old_state, new_state);
    }
}

void Dispatcher::log(const std::string& level, const std::string& message) {
    if (logger_ != nullptr) {
        logger_->log(level, message);
    }
}

} // namespace snipq
