/**
 * @file pending_queue.h
 * @brief PendingQueue class holding ids of tasks waiting to run
 *
 * Multi-producer, multi-consumer FIFO shared between the submission
 * path and the dispatcher workers.
 */

#ifndef SNIPQ_PENDING_QUEUE_H
#define SNIPQ_PENDING_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace snipq {

/**
 * @brief Thread-safe FIFO of task ids
 *
 * Every pushed id is popped by exactly one consumer, in push order.
 * After close() pushes are rejected and waiting consumers wake up;
 * ids already queued can still be popped or drained.
 */
class PendingQueue {
public:
    PendingQueue() = default;
    ~PendingQueue() = default;

    // Disable copy
    PendingQueue(const PendingQueue&) = delete;
    PendingQueue& operator=(const PendingQueue&) = delete;

    /**
     * @brief Append a task id
     * @param task_id Id to append
     * @return false if the queue is closed (nothing was added)
     */
    bool push(const std::string& task_id);

    /**
     * @brief Remove the oldest id, waiting up to timeout for one to arrive
     * @param timeout Maximum wait (zero = do not wait)
     * @return The id, or nullopt on timeout or when closed and empty
     */
    std::optional<std::string> popFor(std::chrono::milliseconds timeout);

    /**
     * @brief Reject further pushes and wake all waiting consumers
     */
    void close();

    /// Accept pushes again after close()
    void reopen();

    bool isClosed() const;

    /// Number of ids waiting
    size_t size() const;

    /**
     * @brief Remove and return every queued id, oldest first
     */
    std::vector<std::string> drain();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> ids_;
    bool closed_ = false;
};

} // namespace snipq

#endif // SNIPQ_PENDING_QUEUE_H
