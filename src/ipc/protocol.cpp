/**
 * @file protocol.cpp
 * @brief Implementation of IPC protocol message serialization and framing
 */

#include "snipq/protocol.h"
#include "snipq/errors.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>  // for htonl, ntohl
#include <cerrno>
#include <stdexcept>
#include <unistd.h>

namespace snipq {

using json = nlohmann::json;

namespace {

[[noreturn]] void throwParseError(const char* what, const json::exception& e) {
    throw SnipqException(ErrorCode::IPC_PROTOCOL_ERROR,
        std::string("Failed to parse ") + what + " JSON: " + e.what());
}

void requireFields(const json& j, std::initializer_list<const char*> fields, const char* what) {
    for (const char* field : fields) {
        if (!j.contains(field)) {
            throw SnipqException(ErrorCode::IPC_PROTOCOL_ERROR,
                std::string(what) + " missing required field: " + field);
        }
    }
}

} // anonymous namespace

// ============================================================================
// MsgType conversion functions
// ============================================================================

std::string msgTypeToString(MsgType type) {
    switch (type) {
        case MsgType::SUBMIT:      return "SUBMIT";
        case MsgType::GET_TASK:    return "GET_TASK";
        case MsgType::LIST_MINE:   return "LIST_MINE";
        case MsgType::LIST_RECENT: return "LIST_RECENT";
        case MsgType::STATS:       return "STATS";
        case MsgType::CLEANUP:     return "CLEANUP";
        case MsgType::RESET_STATS: return "RESET_STATS";
        case MsgType::SHUTDOWN:    return "SHUTDOWN";
        case MsgType::OK:          return "OK";
        case MsgType::ERROR:       return "ERROR";
        default:                   return "UNKNOWN";
    }
}

MsgType msgTypeFromString(const std::string& str) {
    if (str == "SUBMIT")      return MsgType::SUBMIT;
    if (str == "GET_TASK")    return MsgType::GET_TASK;
    if (str == "LIST_MINE")   return MsgType::LIST_MINE;
    if (str == "LIST_RECENT") return MsgType::LIST_RECENT;
    if (str == "STATS")       return MsgType::STATS;
    if (str == "CLEANUP")     return MsgType::CLEANUP;
    if (str == "RESET_STATS") return MsgType::RESET_STATS;
    if (str == "SHUTDOWN")    return MsgType::SHUTDOWN;
    if (str == "OK")          return MsgType::OK;
    if (str == "ERROR")       return MsgType::ERROR;
    throw std::invalid_argument("Unknown message type: " + str);
}

// ============================================================================
// SubmitRequest
// ============================================================================

std::string SubmitRequest::toJson() const {
    json j;
    j["user_id"] = user_id;
    j["label"] = label;
    j["code"] = code;
    return j.dump();
}

SubmitRequest SubmitRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        requireFields(j, {"user_id", "code"}, "SubmitRequest");

        SubmitRequest req;
        req.user_id = j["user_id"].get<int64_t>();
        req.code = j["code"].get<std::string>();
        req.label = j.value("label", "");
        return req;
    } catch (const json::exception& e) {
        throwParseError("SubmitRequest", e);
    }
}

// ============================================================================
// SubmitResponse
// ============================================================================

std::string SubmitResponse::toJson() const {
    json j;
    j["task_id"] = task_id;
    j["queue_depth"] = queue_depth;
    return j.dump();
}

SubmitResponse SubmitResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        requireFields(j, {"task_id"}, "SubmitResponse");

        SubmitResponse resp;
        resp.task_id = j["task_id"].get<std::string>();
        resp.queue_depth = j.value("queue_depth", size_t{0});
        return resp;
    } catch (const json::exception& e) {
        throwParseError("SubmitResponse", e);
    }
}

// ============================================================================
// TaskRequest
// ============================================================================

std::string TaskRequest::toJson() const {
    json j;
    j["user_id"] = user_id;
    j["task_id"] = task_id;
    return j.dump();
}

TaskRequest TaskRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        requireFields(j, {"user_id", "task_id"}, "TaskRequest");

        TaskRequest req;
        req.user_id = j["user_id"].get<int64_t>();
        req.task_id = j["task_id"].get<std::string>();
        return req;
    } catch (const json::exception& e) {
        throwParseError("TaskRequest", e);
    }
}

// ============================================================================
// ListRequest
// ============================================================================

std::string ListRequest::toJson() const {
    json j;
    j["user_id"] = user_id;
    j["limit"] = limit;
    return j.dump();
}

ListRequest ListRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        requireFields(j, {"user_id"}, "ListRequest");

        ListRequest req;
        req.user_id = j["user_id"].get<int64_t>();
        req.limit = j.value("limit", size_t{10});
        return req;
    } catch (const json::exception& e) {
        throwParseError("ListRequest", e);
    }
}

// ============================================================================
// TaskListResponse
// ============================================================================

std::string TaskListResponse::toJson() const {
    json j;
    j["tasks"] = json::array();
    for (const auto& task : tasks) {
        j["tasks"].push_back(json::parse(task.toJson()));
    }
    j["truncated"] = truncated;
    return j.dump();
}

TaskListResponse TaskListResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        TaskListResponse resp;
        if (j.contains("tasks")) {
            for (const auto& item : j["tasks"]) {
                resp.tasks.push_back(Task::fromJson(item.dump()));
            }
        }
        resp.truncated = j.value("truncated", false);
        return resp;
    } catch (const json::exception& e) {
        throwParseError("TaskListResponse", e);
    }
}

// ============================================================================
// UserRequest
// ============================================================================

std::string UserRequest::toJson() const {
    json j;
    j["user_id"] = user_id;
    return j.dump();
}

UserRequest UserRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        requireFields(j, {"user_id"}, "UserRequest");

        UserRequest req;
        req.user_id = j["user_id"].get<int64_t>();
        return req;
    } catch (const json::exception& e) {
        throwParseError("UserRequest", e);
    }
}

// ============================================================================
// StatsResponse
// ============================================================================

std::string StatsResponse::toJson() const {
    json j;
    j["user"] = json::parse(user.toJson());
    j["is_admin"] = is_admin;
    if (system.has_value()) {
        j["system"] = json::parse(system->toJson());
    } else {
        j["system"] = nullptr;
    }
    j["queue_depth"] = queue_depth;
    return j.dump();
}

StatsResponse StatsResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        requireFields(j, {"user"}, "StatsResponse");

        StatsResponse resp;
        resp.user = UserStats::fromJson(j["user"].dump());
        resp.is_admin = j.value("is_admin", false);
        if (j.contains("system") && !j["system"].is_null()) {
            resp.system = SystemStats::fromJson(j["system"].dump());
        }
        resp.queue_depth = j.value("queue_depth", size_t{0});
        return resp;
    } catch (const json::exception& e) {
        throwParseError("StatsResponse", e);
    }
}

// ============================================================================
// CleanupRequest / CleanupResponse
// ============================================================================

std::string CleanupRequest::toJson() const {
    json j;
    j["user_id"] = user_id;
    j["older_than_seconds"] = older_than_seconds;
    return j.dump();
}

CleanupRequest CleanupRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        requireFields(j, {"user_id"}, "CleanupRequest");

        CleanupRequest req;
        req.user_id = j["user_id"].get<int64_t>();
        req.older_than_seconds = j.value("older_than_seconds", int64_t{3600});
        return req;
    } catch (const json::exception& e) {
        throwParseError("CleanupRequest", e);
    }
}

std::string CleanupResponse::toJson() const {
    json j;
    j["removed"] = removed;
    return j.dump();
}

CleanupResponse CleanupResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        CleanupResponse resp;
        resp.removed = j.value("removed", size_t{0});
        return resp;
    } catch (const json::exception& e) {
        throwParseError("CleanupResponse", e);
    }
}

// ============================================================================
// ErrorResponse
// ============================================================================

std::string ErrorResponse::toJson() const {
    json j;
    j["code"] = code;
    j["message"] = message;
    return j.dump();
}

ErrorResponse ErrorResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        ErrorResponse resp;
        resp.code = j.value("code", 0);
        resp.message = j.value("message", "");
        return resp;
    } catch (const json::exception& e) {
        throwParseError("ErrorResponse", e);
    }
}

// ============================================================================
// Framing
// ============================================================================

std::string encodeMessage(MsgType type, const std::string& payload) {
    json j;
    j["type"] = msgTypeToString(type);

    // Embed JSON payloads as objects, anything else as a string
    json parsed = json::parse(payload, nullptr, false);
    if (parsed.is_discarded()) {
        j["payload"] = payload;
    } else {
        j["payload"] = parsed;
    }

    return j.dump();
}

bool decodeMessage(const std::string& body, MsgType& type, std::string& payload) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return false;
    }

    try {
        type = msgTypeFromString(j["type"].get<std::string>());
    } catch (const std::invalid_argument&) {
        return false;
    }

    if (j.contains("payload")) {
        if (j["payload"].is_string()) {
            payload = j["payload"].get<std::string>();
        } else {
            payload = j["payload"].dump();
        }
    } else {
        payload = "{}";
    }

    return true;
}

bool readExact(int fd, void* buffer, size_t n) {
    char* buf = static_cast<char*>(buffer);
    size_t total_read = 0;

    while (total_read < n) {
        ssize_t bytes_read = read(fd, buf + total_read, n - total_read);

        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, retry
            }
            return false;  // Error
        }

        if (bytes_read == 0) {
            return false;  // Connection closed
        }

        total_read += static_cast<size_t>(bytes_read);
    }

    return true;
}

bool writeExact(int fd, const void* buffer, size_t n) {
    const char* buf = static_cast<const char*>(buffer);
    size_t total_written = 0;

    while (total_written < n) {
        ssize_t bytes_written = write(fd, buf + total_written, n - total_written);

        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, retry
            }
            return false;  // Error
        }

        total_written += static_cast<size_t>(bytes_written);
    }

    return true;
}

bool readFrame(int fd, MsgType& type, std::string& payload) {
    // Read 4-byte length header
    uint32_t length_net;
    if (!readExact(fd, &length_net, sizeof(length_net))) {
        return false;
    }

    uint32_t length = ntohl(length_net);

    // Validate length
    if (length == 0 || length > MAX_MESSAGE_SIZE) {
        return false;
    }

    // Read message body
    std::string body(length, '\0');
    if (!readExact(fd, &body[0], length)) {
        return false;
    }

    return decodeMessage(body, type, payload);
}

bool writeFrame(int fd, MsgType type, const std::string& payload) {
    std::string body = encodeMessage(type, payload);
    if (body.size() > MAX_MESSAGE_SIZE) {
        return false;
    }

    // Write 4-byte length header
    uint32_t length_net = htonl(static_cast<uint32_t>(body.size()));
    if (!writeExact(fd, &length_net, sizeof(length_net))) {
        return false;
    }

    // Write message body
    return writeExact(fd, body.data(), body.size());
}

} // namespace snipq
