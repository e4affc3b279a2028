/**
 * @file execution_service.h
 * @brief ExecutionService: submission and query entry points
 *
 * Owns the task store, the pending queue, the process runner and the
 * dispatcher, and is the object adapters talk to.
 */

#ifndef SNIPQ_EXECUTION_SERVICE_H
#define SNIPQ_EXECUTION_SERVICE_H

#include "snipq/config.h"
#include "snipq/dispatcher.h"
#include "snipq/logger.h"
#include "snipq/pending_queue.h"
#include "snipq/process_runner.h"
#include "snipq/task.h"
#include "snipq/task_store.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace snipq {

/**
 * @brief Task queue and execution worker behind one interface
 *
 * Submission validates the text, records a pending task and returns
 * immediately; execution happens on the dispatcher's workers. Queries
 * read consistent copies from the store and never wait on the queue.
 *
 * Validation and authorization failures are thrown as SnipqException.
 * Execution failures are recorded on the task instead.
 */
class ExecutionService {
public:
    /**
     * @brief Construct a service; workers are not started yet
     * @param config Configuration (copied)
     * @param logger Optional log sink (not owned, must outlive the service)
     */
    explicit ExecutionService(const Config& config, Logger* logger = nullptr);

    /**
     * @brief Destructor - shuts down if still running
     */
    ~ExecutionService();

    // Disable copy
    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    /**
     * @brief Start the dispatcher workers
     */
    void start();

    /**
     * @brief Stop accepting tasks, kill running children and fail
     *        whatever is still queued
     */
    void shutdown();

    /// false once shutdown() has been called
    bool isAccepting() const;

    // ========== Submission ==========

    /**
     * @brief Queue a snippet for execution
     *
     * A surrounding ``` fence is removed first.
     *
     * @param submitter_id Submitting user
     * @param label Display name of the user
     * @param code Submitted text
     * @return Id of the new pending task
     * @throws SnipqException CODE_TOO_SHORT, CODE_TOO_LONG or SERVICE_STOPPED;
     *         no task is created in that case
     */
    std::string submit(int64_t submitter_id, const std::string& label, const std::string& code);

    // ========== Queries ==========

    /**
     * @brief Look up one task
     * @param requester_id Asking user; must be the submitter or an admin
     * @param task_id Task to read
     * @throws SnipqException TASK_NOT_FOUND or UNAUTHORIZED
     */
    TaskView getTask(int64_t requester_id, const std::string& task_id) const;

    /**
     * @brief Finished tasks of a user, most recent first (history only)
     * @param limit Maximum number returned (0 = all)
     */
    std::vector<TaskView> getUserTasks(int64_t submitter_id, size_t limit = 0) const;

    /**
     * @brief Finished tasks of everyone, most recent first
     * @throws SnipqException UNAUTHORIZED for non-admins
     */
    std::vector<TaskView> getRecentTasks(int64_t requester_id, size_t limit = 0) const;

    /**
     * @brief Process-wide counters
     * @throws SnipqException UNAUTHORIZED for non-admins
     */
    SystemStats getSystemStats(int64_t requester_id) const;

    UserStats getUserStats(int64_t submitter_id) const;

    /**
     * @brief Drop finished tasks older than older_than from the id map
     * @return Number of tasks removed
     * @throws SnipqException UNAUTHORIZED for non-admins
     */
    size_t cleanup(int64_t requester_id, std::chrono::seconds older_than);

    /**
     * @brief Zero all user and system counters
     * @throws SnipqException UNAUTHORIZED for non-admins
     */
    void resetStats(int64_t requester_id);

    bool isAdmin(int64_t user_id) const;

    /// Number of tasks waiting to run
    size_t queueDepth() const;

    const Config& config() const { return config_; }

    /// Access to the dispatcher (state callback, manual dispatch)
    Dispatcher& dispatcher() { return dispatcher_; }

private:
    void requireAdmin(int64_t requester_id, const std::string& action) const;

    void log(const std::string& level, const std::string& message) const;

    Config config_;
    Logger* logger_;

    TaskStore store_;
    PendingQueue queue_;
    ProcessRunner runner_;
    Dispatcher dispatcher_;

    std::atomic<bool> accepting_{true};

    /// Serializes submissions against shutdown
    std::mutex submit_mutex_;
};

} // namespace snipq

#endif // SNIPQ_EXECUTION_SERVICE_H
