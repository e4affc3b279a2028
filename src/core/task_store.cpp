/**
 * @file task_store.cpp
 * @brief Implementation of TaskStore class
 */

#include "snipq/task_store.h"
#include "snipq/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace snipq {

// ========== UserStats ==========

std::string UserStats::toJson() const {
    nlohmann::json j;
    j["submitted"] = submitted;
    j["succeeded"] = succeeded;
    j["failed"] = failed;
    return j.dump();
}

UserStats UserStats::fromJson(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);
        UserStats stats;
        stats.submitted = j.value("submitted", uint64_t{0});
        stats.succeeded = j.value("succeeded", uint64_t{0});
        stats.failed = j.value("failed", uint64_t{0});
        return stats;
    } catch (const nlohmann::json::exception& e) {
        throw SnipqException(ErrorCode::IPC_PROTOCOL_ERROR,
                             std::string("UserStats JSON parse error: ") + e.what());
    }
}

// ========== SystemStats ==========

std::string SystemStats::toJson() const {
    nlohmann::json j;
    j["total_submitted"] = total_submitted;
    j["total_succeeded"] = total_succeeded;
    j["total_failed"] = total_failed;
    j["total_timed_out"] = total_timed_out;
    j["cumulative_execution_seconds"] = cumulative_execution_seconds;
    return j.dump();
}

SystemStats SystemStats::fromJson(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);
        SystemStats stats;
        stats.total_submitted = j.value("total_submitted", uint64_t{0});
        stats.total_succeeded = j.value("total_succeeded", uint64_t{0});
        stats.total_failed = j.value("total_failed", uint64_t{0});
        stats.total_timed_out = j.value("total_timed_out", uint64_t{0});
        stats.cumulative_execution_seconds = j.value("cumulative_execution_seconds", 0.0);
        return stats;
    } catch (const nlohmann::json::exception& e) {
        throw SnipqException(ErrorCode::IPC_PROTOCOL_ERROR,
                             std::string("SystemStats JSON parse error: ") + e.what());
    }
}

// ========== TaskStore ==========

TaskStore::TaskStore(size_t history_capacity, size_t max_stored_tasks)
    : history_capacity_(history_capacity), max_stored_tasks_(max_stored_tasks) {
}

void TaskStore::insert(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);

    tasks_[task.id] = task;

    user_stats_[task.submitter_id].submitted++;
    system_stats_.total_submitted++;

    evictLocked();
}

std::optional<Task> TaskStore::getTask(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tasks_.find(id);
    if (it != tasks_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Task> TaskStore::markRunning(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second.state != TaskState::PENDING) {
        return std::nullopt;
    }

    it->second.state = TaskState::RUNNING;
    it->second.started_at = std::chrono::system_clock::now();
    return it->second;
}

std::optional<Task> TaskStore::finish(const std::string& id, const TaskResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second.isTerminal()) {
        return std::nullopt;
    }

    Task& task = it->second;
    task.state = result.state;
    task.stdout_text = result.stdout_text;
    task.stderr_text = result.stderr_text;
    task.exit_code = result.exit_code;
    task.no_output = result.no_output;
    task.output_truncated = result.output_truncated;
    task.duration_seconds = result.duration_seconds;
    task.finished_at = std::chrono::system_clock::now();

    UserStats& user = user_stats_[task.submitter_id];
    switch (result.state) {
        case TaskState::COMPLETED:
            user.succeeded++;
            system_stats_.total_succeeded++;
            break;
        case TaskState::TIMED_OUT:
            system_stats_.total_timed_out++;
            user.failed++;
            system_stats_.total_failed++;
            break;
        default:
            user.failed++;
            system_stats_.total_failed++;
            break;
    }
    system_stats_.cumulative_execution_seconds += result.duration_seconds;

    Task finished = task;

    if (history_capacity_ > 0) {
        history_.push_back(finished);
        while (history_.size() > history_capacity_) {
            history_.pop_front();
        }
    }

    finished_order_.push_back(id);
    evictLocked();

    return finished;
}

void TaskStore::evictLocked() {
    if (max_stored_tasks_ == 0) {
        return;
    }
    while (tasks_.size() > max_stored_tasks_ && !finished_order_.empty()) {
        tasks_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

std::vector<Task> TaskStore::history(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Task> result;
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (limit > 0 && result.size() >= limit) {
            break;
        }
        result.push_back(*it);
    }
    return result;
}

std::vector<Task> TaskStore::userHistory(int64_t submitter_id, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Task> result;
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (limit > 0 && result.size() >= limit) {
            break;
        }
        if (it->submitter_id == submitter_id) {
            result.push_back(*it);
        }
    }
    return result;
}

UserStats TaskStore::userStats(int64_t submitter_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = user_stats_.find(submitter_id);
    if (it != user_stats_.end()) {
        return it->second;
    }
    return UserStats();
}

SystemStats TaskStore::systemStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return system_stats_;
}

size_t TaskStore::cleanup(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const Task& task = it->second;
        if (task.isTerminal() && task.finished_at.has_value() && *task.finished_at < cutoff) {
            it = tasks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        finished_order_.erase(
            std::remove_if(finished_order_.begin(), finished_order_.end(),
                           [this](const std::string& id) { return tasks_.count(id) == 0; }),
            finished_order_.end());
    }

    return removed;
}

void TaskStore::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    user_stats_.clear();
    system_stats_ = SystemStats();
}

size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t TaskStore::historySize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

} // namespace snipq
