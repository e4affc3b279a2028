/**
 * @file pending_queue.cpp
 * @brief Implementation of PendingQueue class
 */

#include "snipq/pending_queue.h"

namespace snipq {

bool PendingQueue::push(const std::string& task_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        ids_.push_back(task_id);
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> PendingQueue::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    cv_.wait_for(lock, timeout, [this] { return !ids_.empty() || closed_; });

    if (ids_.empty()) {
        return std::nullopt;
    }

    std::string id = std::move(ids_.front());
    ids_.pop_front();
    return id;
}

void PendingQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void PendingQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool PendingQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t PendingQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.size();
}

std::vector<std::string> PendingQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result(ids_.begin(), ids_.end());
    ids_.clear();
    return result;
}

} // namespace snipq
