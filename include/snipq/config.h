/**
 * @file config.h
 * @brief Configuration management for snipq
 *
 * Defines the Config struct which holds all configuration parameters
 * for the snipq system: execution limits, queue sizing, child process
 * hardening, administrators, and paths.
 */

#ifndef SNIPQ_CONFIG_H
#define SNIPQ_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace snipq {

/// Submitter labels are cut to this many bytes
constexpr size_t MAX_LABEL_BYTES = 256;

/// JSON keys, ids, timestamps and counters of one task
constexpr size_t TASK_ENVELOPE_BYTES = 4096;

/**
 * @brief Configuration parameters for snipq system
 *
 * Values are layered in this order, later sources overriding earlier ones:
 * built-in defaults, JSON file (--config), environment, command line.
 */
struct Config {
    // ========== Execution ==========

    /// Wall-clock limit for a single run, in seconds.
    /// Can be set via --timeout or SNIPQ_TIMEOUT
    double execution_timeout_seconds = 45.0;

    /// Interpreter executable, looked up on PATH.
    /// Can be set via --interpreter or SNIPQ_INTERPRETER
    std::string interpreter = "python3";

    /// Arguments placed before the source file path.
    std::vector<std::string> interpreter_args = {"-u"};

    /// Extension given to the temporary source file.
    std::string source_extension = ".py";

    /// Directory for temporary source files (also the child's cwd).
    std::string temp_dir;

    /// Send the child's stderr into the stdout pipe.
    bool merge_output = false;

    /// Per-stream capture cap in bytes (1 MiB). Must keep one task within
    /// an IPC frame, see validate().
    size_t max_output_bytes = 1024 * 1024;

    // ========== Submission ==========

    /// Submissions shorter than this are rejected.
    size_t min_code_length = 3;

    /// Submissions longer than this are rejected (0 = unlimited).
    /// Can be set via --max-code or SNIPQ_MAX_CODE
    size_t max_code_length = 5000;

    // ========== Queue and Store ==========

    /// Number of finished tasks kept in history.
    /// Can be set via --history or SNIPQ_HISTORY
    size_t history_capacity = 100;

    /// Upper bound on tasks in the id-indexed store; oldest finished
    /// tasks are evicted first.
    size_t max_stored_tasks = 10000;

    /// Number of dispatcher workers (concurrent child processes).
    /// Can be set via --workers or SNIPQ_WORKERS
    int worker_count = 1;

    /// How long a worker waits on an empty queue before rechecking
    /// for shutdown, in milliseconds.
    int queue_poll_interval_ms = 1000;

    // ========== Child Process Limits ==========

    /// Address space limit in MB (0 = unchanged).
    size_t memory_limit_mb = 512;

    /// CPU time limit in seconds (0 = derived from the timeout).
    int cpu_limit_seconds = 0;

    /// Largest file the child may write, in MB (0 = unchanged).
    size_t max_file_size_mb = 16;

    /// Open file descriptor limit (0 = unchanged).
    int max_open_files = 64;

    /// Process count limit for the child's user (0 = unchanged).
    int max_processes = 0;

    /// Drop to this uid/gid before exec (-1 = keep current).
    int64_t run_as_uid = -1;
    int64_t run_as_gid = -1;

    // ========== Access ==========

    /// Users allowed to see every task and the statistics.
    /// Can be set via --admins or ADMIN_IDS (comma-separated)
    std::vector<int64_t> admin_ids;

    // ========== Paths ==========

    /// Path to Unix domain socket for IPC.
    /// Format: /tmp/snipq_<username>.sock
    std::string socket_path;

    /// Directory for log files (empty if logging disabled).
    /// Set via --log or SNIPQ_LOG_DIR
    std::string log_dir;

    /// Whether logging is enabled.
    bool enable_logging = false;

    // ========== Methods ==========

    /**
     * @brief Parse configuration from command-line arguments
     *
     * Starts from defaults, then applies --config <file>, then the
     * environment (fromEnv), then the remaining flags:
     * --timeout, --workers, --history, --max-code, --max-stored,
     * --interpreter, --socket, --log, --admins, --merge-output.
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Configured Config object
     * @throws SnipqException on unreadable config file or bad values
     */
    static Config fromArgs(int argc, char* argv[]);

    /**
     * @brief Apply environment variables on top of this configuration
     *
     * Reads SNIPQ_TIMEOUT, SNIPQ_MAX_CODE, SNIPQ_HISTORY, SNIPQ_WORKERS,
     * SNIPQ_INTERPRETER, SNIPQ_SOCKET, SNIPQ_LOG_DIR and ADMIN_IDS.
     */
    void applyEnv();

    /**
     * @brief Defaults plus environment
     * @return Config object
     */
    static Config fromEnv();

    /**
     * @brief Serialize configuration to JSON string
     * @return JSON string representation
     */
    std::string toJson() const;

    /**
     * @brief Deserialize configuration from JSON string
     *
     * Missing keys keep their default values.
     *
     * @param json JSON string to parse
     * @return Config object
     * @throws SnipqException if JSON is invalid
     */
    static Config fromJson(const std::string& json);

    /**
     * @brief Load configuration from a JSON file
     * @param path Path to the file
     * @return Config object
     * @throws SnipqException if the file is missing or invalid
     */
    static Config load(const std::string& path);

    /**
     * @brief Check value ranges
     * @throws SnipqException(CONFIG_INVALID) on the first bad value
     */
    void validate() const;

    /**
     * @brief Largest JSON size one task can reach under these limits
     *
     * Assumes every output byte needs escaping. A max_code_length of 0
     * contributes nothing; such tasks rely on the IPC size check.
     */
    static size_t worstCaseTaskBytes(size_t max_output_bytes, size_t max_code_length);

    /**
     * @brief Check whether a user is an administrator
     * @param user_id User to check
     * @return true if user_id is listed in admin_ids
     */
    bool isAdmin(int64_t user_id) const;

    bool operator==(const Config& other) const;

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }

    /**
     * @brief Parse comma-separated integers ("1, 2,3")
     * @param str Input string
     * @return Parsed values; malformed entries are skipped
     */
    static std::vector<int64_t> parseIdList(const std::string& str);

private:
    /**
     * @brief Initialize default paths based on environment
     *
     * Sets socket_path and temp_dir when they are empty.
     */
    void initDefaultPaths();

    static std::string getUsername();
};

} // namespace snipq

#endif // SNIPQ_CONFIG_H
