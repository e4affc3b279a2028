/**
 * @file config.cpp
 * @brief Implementation of Config class
 *
 * Handles command-line and environment parsing, JSON serialization,
 * and automatic path detection based on system environment.
 */

#include "snipq/config.h"
#include "snipq/errors.h"
#include "snipq/protocol.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <pwd.h>
#include <sstream>
#include <unistd.h>

namespace snipq {

namespace {

/**
 * @brief Expand ~ to home directory in path
 * @param path Path that may contain ~
 * @return Expanded path
 */
std::string expandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::string(home) + path.substr(1);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::string(pw->pw_dir) + path.substr(1);
    }
    return path;
}

double parseDouble(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw SnipqException(ErrorCode::CONFIG_INVALID,
                             name + " expects a number, got '" + value + "'");
    }
}

long long parseInteger(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        long long result = std::stoll(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw SnipqException(ErrorCode::CONFIG_INVALID,
                             name + " expects an integer, got '" + value + "'");
    }
}

size_t parseCount(const std::string& name, const std::string& value) {
    long long result = parseInteger(name, value);
    if (result < 0) {
        throw SnipqException(ErrorCode::CONFIG_INVALID,
                             name + " must not be negative");
    }
    return static_cast<size_t>(result);
}

const char* getEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return nullptr;
    }
    return value;
}

} // anonymous namespace

std::string Config::getUsername() {
    const char* user = std::getenv("USER");
    if (user != nullptr && user[0] != '\0') {
        return std::string(user);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_name != nullptr) {
        return std::string(pw->pw_name);
    }

    return "unknown";
}

void Config::initDefaultPaths() {
    if (socket_path.empty()) {
        socket_path = "/tmp/snipq_" + getUsername() + ".sock";
    }
    if (temp_dir.empty()) {
        const char* tmpdir = getEnv("TMPDIR");
        temp_dir = tmpdir != nullptr ? tmpdir : "/tmp";
    }
}

std::vector<int64_t> Config::parseIdList(const std::string& str) {
    std::vector<int64_t> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) {
            continue;
        }
        size_t end = item.find_last_not_of(" \t");
        item = item.substr(start, end - start + 1);
        try {
            size_t used = 0;
            long long value = std::stoll(item, &used);
            if (used == item.size()) {
                result.push_back(static_cast<int64_t>(value));
            }
        } catch (const std::exception&) {
            // Skip invalid entries
        }
    }
    return result;
}

void Config::applyEnv() {
    if (const char* v = getEnv("SNIPQ_TIMEOUT")) {
        execution_timeout_seconds = parseDouble("SNIPQ_TIMEOUT", v);
    }
    if (const char* v = getEnv("SNIPQ_MAX_CODE")) {
        max_code_length = parseCount("SNIPQ_MAX_CODE", v);
    }
    if (const char* v = getEnv("SNIPQ_HISTORY")) {
        history_capacity = parseCount("SNIPQ_HISTORY", v);
    }
    if (const char* v = getEnv("SNIPQ_WORKERS")) {
        worker_count = static_cast<int>(parseInteger("SNIPQ_WORKERS", v));
    }
    if (const char* v = getEnv("SNIPQ_INTERPRETER")) {
        interpreter = v;
    }
    if (const char* v = getEnv("SNIPQ_SOCKET")) {
        socket_path = v;
    }
    if (const char* v = getEnv("SNIPQ_LOG_DIR")) {
        enable_logging = true;
        log_dir = expandPath(v);
    }
    if (const char* v = getEnv("ADMIN_IDS")) {
        admin_ids = parseIdList(v);
    }
}

Config Config::fromEnv() {
    Config config;
    config.applyEnv();
    config.initDefaultPaths();
    return config;
}

Config Config::fromArgs(int argc, char* argv[]) {
    Config config;

    // A config file is the lowest layer above defaults
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config = load(expandPath(argv[i + 1]));
            break;
        }
    }

    config.applyEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            ++i;  // Already applied
        } else if (arg == "--timeout" && has_value) {
            config.execution_timeout_seconds = parseDouble(arg, argv[++i]);
        } else if (arg == "--workers" && has_value) {
            config.worker_count = static_cast<int>(parseInteger(arg, argv[++i]));
        } else if (arg == "--history" && has_value) {
            config.history_capacity = parseCount(arg, argv[++i]);
        } else if (arg == "--max-code" && has_value) {
            config.max_code_length = parseCount(arg, argv[++i]);
        } else if (arg == "--max-stored" && has_value) {
            config.max_stored_tasks = parseCount(arg, argv[++i]);
        } else if (arg == "--interpreter" && has_value) {
            config.interpreter = argv[++i];
        } else if (arg == "--socket" && has_value) {
            config.socket_path = expandPath(argv[++i]);
        } else if (arg == "--log" && has_value) {
            config.enable_logging = true;
            config.log_dir = expandPath(argv[++i]);
        } else if (arg == "--admins" && has_value) {
            config.admin_ids = parseIdList(argv[++i]);
        } else if (arg == "--merge-output") {
            config.merge_output = true;
        }
        // Other arguments are ignored (handled by CLI)
    }

    config.initDefaultPaths();
    return config;
}

std::string Config::toJson() const {
    nlohmann::json j;

    // Execution
    j["execution_timeout_seconds"] = execution_timeout_seconds;
    j["interpreter"] = interpreter;
    j["interpreter_args"] = interpreter_args;
    j["source_extension"] = source_extension;
    j["temp_dir"] = temp_dir;
    j["merge_output"] = merge_output;
    j["max_output_bytes"] = max_output_bytes;

    // Submission
    j["min_code_length"] = min_code_length;
    j["max_code_length"] = max_code_length;

    // Queue and store
    j["history_capacity"] = history_capacity;
    j["max_stored_tasks"] = max_stored_tasks;
    j["worker_count"] = worker_count;
    j["queue_poll_interval_ms"] = queue_poll_interval_ms;

    // Child process limits
    j["memory_limit_mb"] = memory_limit_mb;
    j["cpu_limit_seconds"] = cpu_limit_seconds;
    j["max_file_size_mb"] = max_file_size_mb;
    j["max_open_files"] = max_open_files;
    j["max_processes"] = max_processes;
    j["run_as_uid"] = run_as_uid;
    j["run_as_gid"] = run_as_gid;

    // Access
    j["admin_ids"] = admin_ids;

    // Paths
    j["socket_path"] = socket_path;
    j["log_dir"] = log_dir;
    j["enable_logging"] = enable_logging;

    return j.dump(2);
}

Config Config::fromJson(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);

        Config config;

        config.execution_timeout_seconds =
            j.value("execution_timeout_seconds", config.execution_timeout_seconds);
        config.interpreter = j.value("interpreter", config.interpreter);
        if (j.contains("interpreter_args")) {
            config.interpreter_args = j["interpreter_args"].get<std::vector<std::string>>();
        }
        config.source_extension = j.value("source_extension", config.source_extension);
        config.temp_dir = j.value("temp_dir", config.temp_dir);
        config.merge_output = j.value("merge_output", config.merge_output);
        config.max_output_bytes = j.value("max_output_bytes", config.max_output_bytes);

        config.min_code_length = j.value("min_code_length", config.min_code_length);
        config.max_code_length = j.value("max_code_length", config.max_code_length);

        config.history_capacity = j.value("history_capacity", config.history_capacity);
        config.max_stored_tasks = j.value("max_stored_tasks", config.max_stored_tasks);
        config.worker_count = j.value("worker_count", config.worker_count);
        config.queue_poll_interval_ms =
            j.value("queue_poll_interval_ms", config.queue_poll_interval_ms);

        config.memory_limit_mb = j.value("memory_limit_mb", config.memory_limit_mb);
        config.cpu_limit_seconds = j.value("cpu_limit_seconds", config.cpu_limit_seconds);
        config.max_file_size_mb = j.value("max_file_size_mb", config.max_file_size_mb);
        config.max_open_files = j.value("max_open_files", config.max_open_files);
        config.max_processes = j.value("max_processes", config.max_processes);
        config.run_as_uid = j.value("run_as_uid", config.run_as_uid);
        config.run_as_gid = j.value("run_as_gid", config.run_as_gid);

        if (j.contains("admin_ids")) {
            config.admin_ids = j["admin_ids"].get<std::vector<int64_t>>();
        }

        config.socket_path = j.value("socket_path", config.socket_path);
        config.log_dir = j.value("log_dir", config.log_dir);
        config.enable_logging = j.value("enable_logging", config.enable_logging);

        return config;

    } catch (const nlohmann::json::exception& e) {
        throw SnipqException(ErrorCode::FILE_PARSE_ERROR,
                             std::string("Config JSON parse error: ") + e.what());
    }
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SnipqException(ErrorCode::FILE_NOT_FOUND, path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    if (file.fail() && !file.eof()) {
        throw SnipqException(ErrorCode::FILE_READ_ERROR,
                             "Failed to read config file: " + path);
    }

    return fromJson(content);
}

void Config::validate() const {
    auto fail = [](const std::string& what) {
        throw SnipqException(ErrorCode::CONFIG_INVALID, what);
    };

    if (!(execution_timeout_seconds > 0.0)) {
        fail("execution_timeout_seconds must be positive");
    }
    if (worker_count < 1) {
        fail("worker_count must be at least 1");
    }
    if (history_capacity == 0) {
        fail("history_capacity must be at least 1");
    }
    if (max_stored_tasks == 0) {
        fail("max_stored_tasks must be at least 1");
    }
    if (max_code_length != 0 && max_code_length < min_code_length) {
        fail("max_code_length is smaller than min_code_length");
    }
    if (queue_poll_interval_ms <= 0) {
        fail("queue_poll_interval_ms must be positive");
    }
    if (interpreter.empty()) {
        fail("interpreter must not be empty");
    }
    if (cpu_limit_seconds < 0 || max_open_files < 0 || max_processes < 0) {
        fail("resource limits must not be negative");
    }

    // One task, escaped to JSON, has to fit a single IPC frame
    if (max_output_bytes == 0) {
        fail("max_output_bytes must be positive");
    }
    if (max_output_bytes > MAX_PAYLOAD_SIZE || max_code_length > MAX_PAYLOAD_SIZE ||
        worstCaseTaskBytes(max_output_bytes, max_code_length) > MAX_PAYLOAD_SIZE) {
        fail("max_output_bytes and max_code_length let one task exceed " +
             std::to_string(MAX_PAYLOAD_SIZE) + " bytes");
    }
}

size_t Config::worstCaseTaskBytes(size_t max_output_bytes, size_t max_code_length) {
    // A control byte dumps as a six-byte escape; a code point is at most 4 bytes
    const size_t escape_factor = 6;
    return escape_factor * (2 * max_output_bytes + 4 * max_code_length + MAX_LABEL_BYTES) +
           TASK_ENVELOPE_BYTES;
}

bool Config::isAdmin(int64_t user_id) const {
    return std::find(admin_ids.begin(), admin_ids.end(), user_id) != admin_ids.end();
}

bool Config::operator==(const Config& other) const {
    return execution_timeout_seconds == other.execution_timeout_seconds &&
           interpreter == other.interpreter &&
           interpreter_args == other.interpreter_args &&
           source_extension == other.source_extension &&
           temp_dir == other.temp_dir &&
           merge_output == other.merge_output &&
           max_output_bytes == other.max_output_bytes &&
           min_code_length == other.min_code_length &&
           max_code_length == other.max_code_length &&
           history_capacity == other.history_capacity &&
           max_stored_tasks == other.max_stored_tasks &&
           worker_count == other.worker_count &&
           queue_poll_interval_ms == other.queue_poll_interval_ms &&
           memory_limit_mb == other.memory_limit_mb &&
           cpu_limit_seconds == other.cpu_limit_seconds &&
           max_file_size_mb == other.max_file_size_mb &&
           max_open_files == other.max_open_files &&
           max_processes == other.max_processes &&
           run_as_uid == other.run_as_uid &&
           run_as_gid == other.run_as_gid &&
           admin_ids == other.admin_ids &&
           socket_path == other.socket_path &&
           log_dir == other.log_dir &&
           enable_logging == other.enable_logging;
}

} // namespace snipq
