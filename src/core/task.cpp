/**
 * @file task.cpp
 * @brief Implementation of Task JSON serialization and task text helpers
 *
 * Uses nlohmann/json library for JSON handling.
 */

#include "snipq/task.h"
#include "snipq/errors.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace snipq {

namespace {

/// Process-wide sequence used to make task ids unique
std::atomic<uint64_t> g_task_sequence{0};

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t_val -= 1;
    }

    std::tm tm_val;
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::chrono::system_clock::time_point parseTimestamp(const std::string& str) {
    std::tm tm_val = {};
    std::istringstream iss(str);
    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");

    if (iss.fail()) {
        throw std::runtime_error("Failed to parse time string: " + str);
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits += static_cast<char>(iss.get());
        }
        digits = digits.substr(0, 3);
        while (digits.size() < 3) {
            digits += '0';
        }
        millis = std::stoi(digits);
    }

    time_t time_t_val = timegm(&tm_val);
    return std::chrono::system_clock::from_time_t(time_t_val) +
           std::chrono::milliseconds(millis);
}

std::string generateTaskId(int64_t submitter_id) {
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> salt_dist(0, 0xffff);

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t seq = ++g_task_sequence;
    int64_t user_part = submitter_id % 10000;
    if (user_part < 0) {
        user_part = -user_part;
    }

    std::ostringstream oss;
    oss << "t_" << now_ms << '_' << user_part << '_' << seq << '_'
        << std::hex << std::setfill('0') << std::setw(4) << salt_dist(rng);
    return oss.str();
}

std::string stripCodeFence(const std::string& text) {
    std::string trimmed = trim(text);

    // Need room for both an opening and a closing fence
    if (trimmed.size() < 6 || !startsWith(trimmed, "```") || !endsWith(trimmed, "```")) {
        return trimmed;
    }

    std::string inner = trimmed.substr(0, trimmed.size() - 3);

    size_t newline = inner.find('\n');
    if (newline == std::string::npos) {
        // Single line: ```code```
        return trim(inner.substr(3));
    }

    // First line holds the fence and an optional language tag
    return trim(inner.substr(newline + 1));
}

std::string truncateForDisplay(const std::string& text, size_t budget) {
    if (text.size() <= budget) {
        return text;
    }

    size_t cut = budget;
    // Do not split a multi-byte UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }

    std::ostringstream oss;
    oss << text.substr(0, cut) << "\n... [truncated " << (text.size() - cut) << " bytes]";
    return oss.str();
}

std::string Task::toJson() const {
    nlohmann::json j;

    j["id"] = id;
    j["submitter_id"] = submitter_id;
    j["submitter_label"] = submitter_label;
    j["source_code"] = source_code;

    j["state"] = taskStateToString(state);
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    if (exit_code.has_value()) {
        j["exit_code"] = *exit_code;
    } else {
        j["exit_code"] = nullptr;
    }
    j["no_output"] = no_output;
    j["output_truncated"] = output_truncated;

    j["created_at"] = formatTimestamp(created_at);
    j["started_at"] = started_at.has_value()
        ? nlohmann::json(formatTimestamp(*started_at)) : nlohmann::json(nullptr);
    j["finished_at"] = finished_at.has_value()
        ? nlohmann::json(formatTimestamp(*finished_at)) : nlohmann::json(nullptr);
    j["duration_seconds"] = duration_seconds;

    return j.dump();
}

Task Task::fromJson(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);

        Task task;

        task.id = j.at("id").get<std::string>();
        task.submitter_id = j.at("submitter_id").get<int64_t>();
        task.submitter_label = j.value("submitter_label", "");
        task.source_code = j.value("source_code", "");

        task.state = taskStateFromString(j.at("state").get<std::string>());
        task.stdout_text = j.value("stdout", "");
        task.stderr_text = j.value("stderr", "");
        if (j.contains("exit_code") && !j["exit_code"].is_null()) {
            task.exit_code = j["exit_code"].get<int>();
        }
        task.no_output = j.value("no_output", false);
        task.output_truncated = j.value("output_truncated", false);

        task.created_at = parseTimestamp(j.at("created_at").get<std::string>());
        if (j.contains("started_at") && !j["started_at"].is_null()) {
            task.started_at = parseTimestamp(j["started_at"].get<std::string>());
        }
        if (j.contains("finished_at") && !j["finished_at"].is_null()) {
            task.finished_at = parseTimestamp(j["finished_at"].get<std::string>());
        }
        task.duration_seconds = j.value("duration_seconds", 0.0);

        return task;

    } catch (const nlohmann::json::exception& e) {
        throw SnipqException(ErrorCode::FILE_PARSE_ERROR,
                             std::string("Task JSON parse error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw SnipqException(ErrorCode::FILE_PARSE_ERROR, e.what());
    } catch (const std::runtime_error& e) {
        throw SnipqException(ErrorCode::FILE_PARSE_ERROR, e.what());
    }
}

bool Task::operator==(const Task& other) const {
    if (id != other.id) return false;
    if (submitter_id != other.submitter_id) return false;
    if (submitter_label != other.submitter_label) return false;
    if (source_code != other.source_code) return false;

    if (state != other.state) return false;
    if (stdout_text != other.stdout_text) return false;
    if (stderr_text != other.stderr_text) return false;
    if (exit_code != other.exit_code) return false;
    if (no_output != other.no_output) return false;
    if (output_truncated != other.output_truncated) return false;
    if (duration_seconds != other.duration_seconds) return false;

    auto toMillis = [](const std::chrono::system_clock::time_point& tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count();
    };
    auto sameOptional = [&](const std::optional<std::chrono::system_clock::time_point>& a,
                            const std::optional<std::chrono::system_clock::time_point>& b) {
        if (a.has_value() != b.has_value()) return false;
        return !a.has_value() || toMillis(*a) == toMillis(*b);
    };

    if (toMillis(created_at) != toMillis(other.created_at)) return false;
    if (!sameOptional(started_at, other.started_at)) return false;
    if (!sameOptional(finished_at, other.finished_at)) return false;

    return true;
}

} // namespace snipq
