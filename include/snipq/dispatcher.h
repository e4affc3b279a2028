/**
 * @file dispatcher.h
 * @brief Dispatcher class that turns queued tasks into process runs
 *
 * Takes task ids off the PendingQueue, runs the source through the
 * ProcessRunner and records the result in the TaskStore.
 */

#ifndef SNIPQ_DISPATCHER_H
#define SNIPQ_DISPATCHER_H

#include "snipq/logger.h"
#include "snipq/pending_queue.h"
#include "snipq/process_runner.h"
#include "snipq/task.h"
#include "snipq/task_store.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace snipq {

/**
 * @brief Callback type for task state changes
 */
using TaskStateCallback = std::function<void(const std::string& task_id,
                                             TaskState old_state,
                                             TaskState new_state)>;

/// stderr recorded for tasks cut short by shutdown
constexpr const char* ABORTED_MESSAGE = "Execution aborted: server shutting down";

/**
 * @brief Runs queued tasks on a fixed number of worker threads
 *
 * The Dispatcher is responsible for:
 * - Waiting on the PendingQueue in bounded slices so shutdown is noticed
 * - Moving each task PENDING -> RUNNING -> terminal in the TaskStore
 * - Mapping process outcomes to task states and messages
 * - Killing running children and failing leftover tasks on stop()
 *
 * With worker_count K at most K children run at once, and tasks start
 * in submission order.
 */
class Dispatcher {
public:
    /**
     * @brief Construct a Dispatcher
     * @param store Task bookkeeping
     * @param queue Ids of tasks waiting to run
     * @param runner Process runner used for every task
     * @param timeout_seconds Wall-clock limit per run
     * @param worker_count Number of worker threads (default 1)
     * @param poll_interval_ms Longest single wait on the queue (default 1000ms)
     * @param logger Optional log sink (not owned)
     */
    Dispatcher(TaskStore& store,
               PendingQueue& queue,
               const ProcessRunner& runner,
               double timeout_seconds,
               int worker_count = 1,
               int poll_interval_ms = 1000,
               Logger* logger = nullptr);

    /**
     * @brief Destructor - stops the dispatcher
     */
    ~Dispatcher();

    // Disable copy
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Start the worker threads
     *
     * After stop() this reopens the queue and clears the abort flag, so
     * a stopped dispatcher can be started again.
     */
    void start();

    /**
     * @brief Shut down
     *
     * Closes the queue, kills running children, joins the workers and
     * marks every task still waiting as FAILED. Safe to call repeatedly.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Set callback for task state changes
     * @param callback Function called on each transition
     */
    void setStateCallback(TaskStateCallback callback);

    /**
     * @brief Process at most one queued task on the calling thread
     * @param wait How long to wait for a task to arrive
     * @return true if a task was taken off the queue
     */
    bool dispatchOnce(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    /// Number of tasks currently executing
    size_t runningCount() const;

    /**
     * @brief Translate a process outcome into the task's terminal result
     * @param outcome Result of ProcessRunner::run
     * @param timeout_seconds Limit that was applied (used in the message)
     */
    static TaskResult mapOutcome(const RunOutcome& outcome, double timeout_seconds);

    /// "Execution timed out after <T> seconds"
    static std::string timeoutMessage(double timeout_seconds);

private:
    void workerLoop();

    /**
     * @brief Run one task end to end; never throws
     */
    void processTask(const std::string& task_id);

    /**
     * @brief Mark tasks left in the queue as aborted
     */
    void failPending();

    void notifyStateChange(const std::string& task_id, TaskState old_state, TaskState new_state);

    void log(const std::string& level, const std::string& message);

    TaskStore& store_;
    PendingQueue& queue_;
    const ProcessRunner& runner_;
    double timeout_seconds_;
    int worker_count_;
    int poll_interval_ms_;
    Logger* logger_;

    /// Whether the workers are running
    std::atomic<bool> running_{false};

    /// Raised by stop(); running children are killed when set
    std::atomic<bool> abort_{false};

    std::atomic<size_t> running_count_{0};

    std::vector<std::thread> workers_;

    /// Callback for state changes
    TaskStateCallback state_callback_;

    /// Mutex for callback access
    std::mutex callback_mutex_;
};

} // namespace snipq

#endif // SNIPQ_DISPATCHER_H
