/**
 * @file task.h
 * @brief Task data structure and state definitions for snipq
 *
 * Defines the Task struct which represents one submitted snippet and
 * its execution outcome, plus helpers for task ids and submitted text.
 */

#ifndef SNIPQ_TASK_H
#define SNIPQ_TASK_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace snipq {

/**
 * @brief Task execution state
 *
 * Represents the lifecycle states of a task:
 * - PENDING: Waiting in queue
 * - RUNNING: Child process is executing
 * - COMPLETED: Child exited with code 0
 * - FAILED: Non-zero exit, or the process could not be run
 * - TIMED_OUT: Killed after exceeding the wall-clock limit
 *
 * States only move forward; the last three are terminal.
 */
enum class TaskState {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMED_OUT
};

/**
 * @brief Convert TaskState to string representation
 * @param state The task state to convert
 * @return String representation ("pending", "running", etc.)
 */
inline std::string taskStateToString(TaskState state) {
    switch (state) {
        case TaskState::PENDING:   return "pending";
        case TaskState::RUNNING:   return "running";
        case TaskState::COMPLETED: return "completed";
        case TaskState::FAILED:    return "failed";
        case TaskState::TIMED_OUT: return "timed_out";
        default:                   return "unknown";
    }
}

/**
 * @brief Parse TaskState from string
 * @param str String representation of state
 * @return Corresponding TaskState enum value
 * @throws std::invalid_argument if string is not recognized
 */
inline TaskState taskStateFromString(const std::string& str) {
    if (str == "pending")   return TaskState::PENDING;
    if (str == "running")   return TaskState::RUNNING;
    if (str == "completed") return TaskState::COMPLETED;
    if (str == "failed")    return TaskState::FAILED;
    if (str == "timed_out") return TaskState::TIMED_OUT;
    throw std::invalid_argument("Unknown task state: " + str);
}

/// Text stored in stdout_text when a successful run printed nothing
constexpr const char* NO_OUTPUT_MARKER = "(no output)";

/**
 * @brief One submitted snippet and its execution outcome
 *
 * stdout_text and stderr_text hold the full captured text; truncation
 * for display is left to the presentation layer.
 */
struct Task {
    /// Unique opaque task identifier
    std::string id;

    /// Numeric id of the submitting user
    int64_t submitter_id = 0;

    /// Display name of the submitting user
    std::string submitter_label;

    /// Source text after fence stripping
    std::string source_code;

    /// Current state
    TaskState state = TaskState::PENDING;

    /// Captured standard output (empty until terminal)
    std::string stdout_text;

    /// Captured standard error (empty until terminal)
    std::string stderr_text;

    /// Exit code (128 + signal if killed by a signal); unset if never exited
    std::optional<int> exit_code;

    /// true if the run exited 0 and printed nothing at all
    bool no_output = false;

    /// true if capture hit the configured output cap
    bool output_truncated = false;

    /// Time when task was submitted
    std::chrono::system_clock::time_point created_at;

    /// Time when execution started (nullopt while pending)
    std::optional<std::chrono::system_clock::time_point> started_at;

    /// Time when task reached a terminal state
    std::optional<std::chrono::system_clock::time_point> finished_at;

    /// Wall-clock seconds spent in the process runner (0 until terminal)
    double duration_seconds = 0.0;

    /**
     * @brief Serialize task to JSON string
     * @return JSON string representation of the task
     */
    std::string toJson() const;

    /**
     * @brief Deserialize task from JSON string
     * @param json JSON string to parse
     * @return Task object
     * @throws SnipqException if JSON is invalid
     */
    static Task fromJson(const std::string& json);

    /**
     * @brief Check if task is in a terminal state
     * @return true if task is COMPLETED, FAILED, or TIMED_OUT
     */
    bool isTerminal() const {
        return state == TaskState::COMPLETED ||
               state == TaskState::FAILED ||
               state == TaskState::TIMED_OUT;
    }

    /**
     * @brief Check equality of two tasks
     *
     * Timestamps are compared with millisecond precision, which is what
     * survives serialization.
     */
    bool operator==(const Task& other) const;

    bool operator!=(const Task& other) const {
        return !(*this == other);
    }
};

/// Read-only snapshot of a Task handed out by queries
using TaskView = Task;

/**
 * @brief Generate a new unique task id
 *
 * Format: t_<epoch-ms>_<submitter mod 10000>_<sequence>_<salt>.
 * The sequence number is process-wide and monotonic, so ids are unique
 * even for concurrent submissions within the same millisecond.
 *
 * @param submitter_id Submitting user
 * @return New task id
 */
std::string generateTaskId(int64_t submitter_id);

/**
 * @brief Remove a fenced-code wrapper from submitted text
 *
 * Text that starts and ends with ``` has the first line (fence plus
 * optional language tag) and the closing fence removed. The result is
 * trimmed of surrounding whitespace either way.
 *
 * @param text Submitted text
 * @return Source code
 */
std::string stripCodeFence(const std::string& text);

/**
 * @brief Shorten text for display
 *
 * Text within budget is returned unchanged. Longer text is cut at a
 * UTF-8 character boundary and "\n... [truncated N bytes]" is appended.
 *
 * @param text Full text
 * @param budget Maximum number of bytes of text to keep
 * @return Display text
 */
std::string truncateForDisplay(const std::string& text, size_t budget);

/**
 * @brief Format a time point as ISO 8601 UTC with milliseconds
 * @param tp Time point to convert
 * @return e.g. "2024-01-15T10:30:00.123Z"
 */
std::string formatTimestamp(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Parse a string produced by formatTimestamp
 * @param str ISO 8601 string (milliseconds optional)
 * @return Parsed time point
 * @throws std::runtime_error if parsing fails
 */
std::chrono::system_clock::time_point parseTimestamp(const std::string& str);

} // namespace snipq

#endif // SNIPQ_TASK_H
