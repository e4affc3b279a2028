/**
 * @file task_store.h
 * @brief TaskStore class holding tasks, history and statistics
 *
 * Provides thread-safe task bookkeeping: the id-indexed task map, the
 * bounded history of finished tasks, and per-user and system counters.
 */

#ifndef SNIPQ_TASK_STORE_H
#define SNIPQ_TASK_STORE_H

#include "snipq/task.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace snipq {

/**
 * @brief Counters for one submitter
 *
 * A timed-out run counts as failed.
 */
struct UserStats {
    uint64_t submitted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;

    std::string toJson() const;
    static UserStats fromJson(const std::string& json);

    bool operator==(const UserStats& other) const {
        return submitted == other.submitted && succeeded == other.succeeded &&
               failed == other.failed;
    }
};

/**
 * @brief Process-wide counters
 *
 * A timed-out run counts in both total_failed and total_timed_out.
 */
struct SystemStats {
    uint64_t total_submitted = 0;
    uint64_t total_succeeded = 0;
    uint64_t total_failed = 0;
    uint64_t total_timed_out = 0;
    double cumulative_execution_seconds = 0.0;

    std::string toJson() const;
    static SystemStats fromJson(const std::string& json);
};

/**
 * @brief Terminal result recorded by TaskStore::finish
 */
struct TaskResult {
    TaskState state = TaskState::FAILED;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    bool no_output = false;
    bool output_truncated = false;
    double duration_seconds = 0.0;
};

/**
 * @brief Thread-safe store of tasks and their bookkeeping
 *
 * The id map holds at most max_stored_tasks entries; when it grows past
 * that, the tasks that finished earliest are evicted. Pending and running
 * tasks are never evicted. The history keeps its own copies of the last
 * history_capacity finished tasks.
 *
 * All public methods are thread-safe and return copies.
 */
class TaskStore {
public:
    /**
     * @brief Construct a TaskStore
     * @param history_capacity Finished tasks kept in history
     * @param max_stored_tasks Bound on the id map (0 = unbounded)
     */
    explicit TaskStore(size_t history_capacity = 100, size_t max_stored_tasks = 10000);

    ~TaskStore() = default;

    // Disable copy
    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    /**
     * @brief Add a new pending task and count the submission
     * @param task Task in PENDING state with a unique id
     */
    void insert(const Task& task);

    /**
     * @brief Get a task by id
     * @return Copy of the task, or nullopt if unknown or evicted
     */
    std::optional<Task> getTask(const std::string& id) const;

    /**
     * @brief Move a task from PENDING to RUNNING and stamp started_at
     * @return Copy of the updated task, or nullopt if the task is unknown
     *         or not pending
     */
    std::optional<Task> markRunning(const std::string& id);

    /**
     * @brief Record the terminal result of a task
     *
     * Stores outputs, exit code and duration, stamps finished_at, appends
     * to history and updates the counters. Pending tasks are accepted so
     * that shutdown can fail tasks that never ran.
     *
     * @param id Task id
     * @param result Terminal state and outputs
     * @return Copy of the finished task, or nullopt if the task is unknown
     *         or already terminal
     */
    std::optional<Task> finish(const std::string& id, const TaskResult& result);

    /**
     * @brief Finished tasks, most recent first
     * @param limit Maximum number of tasks (0 = all in history)
     */
    std::vector<Task> history(size_t limit = 0) const;

    /**
     * @brief Finished tasks of one submitter, most recent first
     * @param submitter_id User to filter by
     * @param limit Maximum number of tasks (0 = all in history)
     */
    std::vector<Task> userHistory(int64_t submitter_id, size_t limit = 0) const;

    /// Counters for one user (all zero if the user never submitted)
    UserStats userStats(int64_t submitter_id) const;

    SystemStats systemStats() const;

    /**
     * @brief Remove finished tasks from the id map
     *
     * History and counters are not touched.
     *
     * @param cutoff Tasks that finished before this time are removed
     * @return Number of tasks removed
     */
    size_t cleanup(std::chrono::system_clock::time_point cutoff);

    /**
     * @brief Zero all user and system counters
     */
    void resetStats();

    /// Number of tasks in the id map
    size_t size() const;

    /// Number of tasks in history
    size_t historySize() const;

    size_t historyCapacity() const { return history_capacity_; }

private:
    /// Drop the earliest finished tasks while over the bound
    void evictLocked();

    size_t history_capacity_;
    size_t max_stored_tasks_;

    /// Task id to Task
    std::unordered_map<std::string, Task> tasks_;

    /// Ids of finished tasks in completion order (may hold removed ids)
    std::deque<std::string> finished_order_;

    /// Copies of finished tasks, oldest first
    std::deque<Task> history_;

    std::map<int64_t, UserStats> user_stats_;
    SystemStats system_stats_;

    /// Mutex for thread safety
    mutable std::mutex mutex_;
};

} // namespace snipq

#endif // SNIPQ_TASK_STORE_H
