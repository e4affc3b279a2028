/**
 * @file protocol.h
 * @brief IPC protocol definitions for snipq
 *
 * Defines the message types and data structures used for communication
 * between the command-line client and the server daemon via Unix Domain
 * Socket. All messages are serialized as JSON.
 *
 * Wire format of one frame:
 * - 4 bytes: body length (network byte order)
 * - N bytes: JSON body {"type": "<MsgType>", "payload": {...}}
 */

#ifndef SNIPQ_PROTOCOL_H
#define SNIPQ_PROTOCOL_H

#include "snipq/task.h"
#include "snipq/task_store.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snipq {

/// Largest accepted frame body (16 MiB)
constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

/// Largest payload that still fits a frame once wrapped in {"type", "payload"}
constexpr size_t MAX_PAYLOAD_SIZE = MAX_MESSAGE_SIZE - 64;

/**
 * @brief Message types for IPC communication
 *
 * Request types (1-99):
 * - SUBMIT: Queue a snippet
 * - GET_TASK: Read one task
 * - LIST_MINE: Caller's finished tasks
 * - LIST_RECENT: Everyone's finished tasks (admin)
 * - STATS: Caller's counters, plus system counters for admins
 * - CLEANUP: Drop old finished tasks (admin)
 * - RESET_STATS: Zero counters (admin)
 * - SHUTDOWN: Request server shutdown
 *
 * Response types (100+):
 * - OK: Operation succeeded
 * - ERROR: Operation failed
 */
enum class MsgType : uint8_t {
    // Request types
    SUBMIT = 1,
    GET_TASK = 2,
    LIST_MINE = 3,
    LIST_RECENT = 4,
    STATS = 5,
    CLEANUP = 6,
    RESET_STATS = 7,
    SHUTDOWN = 8,

    // Response types
    OK = 100,
    ERROR = 101,
};

/**
 * @brief Convert MsgType to string representation
 * @param type The message type to convert
 * @return String representation
 */
std::string msgTypeToString(MsgType type);

/**
 * @brief Parse MsgType from string
 * @param str String representation
 * @return Corresponding MsgType enum value
 * @throws std::invalid_argument if string is not recognized
 */
MsgType msgTypeFromString(const std::string& str);

/**
 * @brief Request to queue a snippet
 */
struct SubmitRequest {
    /// Submitting user
    int64_t user_id = 0;

    /// Display name of the user
    std::string label;

    /// Submitted text (may still carry a ``` fence)
    std::string code;

    std::string toJson() const;

    /**
     * @brief Deserialize request from JSON string
     * @throws SnipqException if JSON is invalid
     */
    static SubmitRequest fromJson(const std::string& json);

    bool operator==(const SubmitRequest& other) const {
        return user_id == other.user_id && label == other.label && code == other.code;
    }

    bool operator!=(const SubmitRequest& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Response to submit request
 */
struct SubmitResponse {
    /// Assigned task id
    std::string task_id;

    /// Tasks waiting ahead of and including this one
    size_t queue_depth = 0;

    std::string toJson() const;
    static SubmitResponse fromJson(const std::string& json);
};

/**
 * @brief Request naming one task
 */
struct TaskRequest {
    int64_t user_id = 0;
    std::string task_id;

    std::string toJson() const;
    static TaskRequest fromJson(const std::string& json);
};

/**
 * @brief Request for a list of finished tasks (LIST_MINE, LIST_RECENT)
 */
struct ListRequest {
    int64_t user_id = 0;

    /// Maximum number of tasks (0 = all)
    size_t limit = 10;

    std::string toJson() const;
    static ListRequest fromJson(const std::string& json);
};

/**
 * @brief List of tasks, most recent first
 */
struct TaskListResponse {
    std::vector<Task> tasks;

    /// Older tasks were left out to keep the response within one frame
    bool truncated = false;

    std::string toJson() const;
    static TaskListResponse fromJson(const std::string& json);
};

/**
 * @brief Request carrying only the caller (STATS, RESET_STATS)
 */
struct UserRequest {
    int64_t user_id = 0;

    std::string toJson() const;
    static UserRequest fromJson(const std::string& json);
};

/**
 * @brief Response to stats request
 *
 * system is only present when the caller is an administrator.
 */
struct StatsResponse {
    UserStats user;
    bool is_admin = false;
    std::optional<SystemStats> system;
    size_t queue_depth = 0;

    std::string toJson() const;
    static StatsResponse fromJson(const std::string& json);
};

/**
 * @brief Request to drop old finished tasks
 */
struct CleanupRequest {
    int64_t user_id = 0;

    /// Tasks that finished more than this many seconds ago are removed
    int64_t older_than_seconds = 3600;

    std::string toJson() const;
    static CleanupRequest fromJson(const std::string& json);
};

/**
 * @brief Response to cleanup request
 */
struct CleanupResponse {
    size_t removed = 0;

    std::string toJson() const;
    static CleanupResponse fromJson(const std::string& json);
};

/**
 * @brief Error response
 *
 * Contains error code and message when an operation fails.
 */
struct ErrorResponse {
    /// Numeric ErrorCode
    int code = 0;

    /// Error message
    std::string message;

    std::string toJson() const;
    static ErrorResponse fromJson(const std::string& json);

    bool operator==(const ErrorResponse& other) const {
        return code == other.code && message == other.message;
    }

    bool operator!=(const ErrorResponse& other) const {
        return !(*this == other);
    }
};

// ========== Framing ==========

/**
 * @brief Build a frame body {"type": ..., "payload": ...}
 *
 * A payload that is valid JSON is embedded as-is, anything else as a
 * JSON string.
 */
std::string encodeMessage(MsgType type, const std::string& payload);

/**
 * @brief Split a frame body into type and payload
 * @param body Frame body
 * @param[out] type Message type
 * @param[out] payload Payload as a JSON string ("{}" if absent)
 * @return false if the body is not a valid message
 */
bool decodeMessage(const std::string& body, MsgType& type, std::string& payload);

/**
 * @brief Read exactly n bytes, retrying on EINTR
 * @return false on EOF or error
 */
bool readExact(int fd, void* buffer, size_t n);

/**
 * @brief Write exactly n bytes, retrying on EINTR
 * @return false on error
 */
bool writeExact(int fd, const void* buffer, size_t n);

/**
 * @brief Read one complete frame
 * @return false on EOF, I/O error, bad length or malformed body
 */
bool readFrame(int fd, MsgType& type, std::string& payload);

/**
 * @brief Write one complete frame
 * @return false on I/O error or if the body exceeds MAX_MESSAGE_SIZE
 */
bool writeFrame(int fd, MsgType type, const std::string& payload);

} // namespace snipq

#endif // SNIPQ_PROTOCOL_H
