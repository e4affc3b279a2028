/**
 * @file process_runner.h
 * @brief ProcessRunner class for running one snippet in a child process
 *
 * Handles the temporary source file, process creation, resource limits,
 * output capture, the wall-clock deadline and killing.
 */

#ifndef SNIPQ_PROCESS_RUNNER_H
#define SNIPQ_PROCESS_RUNNER_H

#include "snipq/config.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace snipq {

/**
 * @brief How a run ended
 */
enum class RunResultKind {
    EXITED,         ///< Child exited on its own (or was killed by a signal it caused)
    TIMED_OUT,      ///< Deadline passed; process group was killed
    SPAWN_ERROR,    ///< Temp file, pipe, fork or exec failed
    ABORTED         ///< Abort flag was raised; process group was killed
};

/**
 * @brief Convert RunResultKind to string representation
 */
inline std::string runResultKindToString(RunResultKind kind) {
    switch (kind) {
        case RunResultKind::EXITED:      return "exited";
        case RunResultKind::TIMED_OUT:   return "timed_out";
        case RunResultKind::SPAWN_ERROR: return "spawn_error";
        case RunResultKind::ABORTED:     return "aborted";
        default:                         return "unknown";
    }
}

/**
 * @brief Result of ProcessRunner::run
 */
struct RunOutcome {
    RunResultKind kind = RunResultKind::SPAWN_ERROR;
    std::string stdout_text;        ///< Captured stdout, valid UTF-8
    std::string stderr_text;        ///< Captured stderr, valid UTF-8
    int exit_code = -1;             ///< Exit code, or 128 + signal (EXITED only)
    bool signaled = false;          ///< true if the child died from a signal
    int signal_number = 0;          ///< Signal number if signaled
    bool no_output = false;         ///< Exit code 0 and both streams empty
    bool output_truncated = false;  ///< A stream hit max_output_bytes
    double elapsed_seconds = 0.0;   ///< Wall-clock time of the run call
    std::string error_message;      ///< Detail for SPAWN_ERROR
};

/**
 * @brief Settings for the child command and its sandbox
 */
struct RunnerOptions {
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args = {"-u"};
    std::string source_extension = ".py";
    std::string temp_dir = "/tmp";
    bool merge_output = false;
    size_t max_output_bytes = 1024 * 1024;  ///< 0 = unlimited

    size_t memory_limit_mb = 512;
    int cpu_limit_seconds = 0;
    size_t max_file_size_mb = 16;
    int max_open_files = 64;
    int max_processes = 0;
    int64_t run_as_uid = -1;
    int64_t run_as_gid = -1;

    /**
     * @brief Take the execution settings from a Config
     */
    static RunnerOptions fromConfig(const Config& config);
};

/**
 * @brief Uniquely named source file that is unlinked on destruction
 */
class TempSourceFile {
public:
    /**
     * @brief Create <dir>/snipq_XXXXXX<extension> holding contents
     * @throws SnipqException(TEMPFILE_FAILED) if the file cannot be written
     */
    TempSourceFile(const std::string& dir, const std::string& extension,
                   const std::string& contents);

    ~TempSourceFile();

    TempSourceFile(const TempSourceFile&) = delete;
    TempSourceFile& operator=(const TempSourceFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Runs source code through the configured interpreter
 *
 * Each call writes the code to a temporary file, forks a child in its own
 * process group, applies rlimits and an optional uid/gid drop, and execs
 * the interpreter with a minimal environment. The parent polls the
 * output pipes until the child is gone or the deadline passes, in which
 * case the whole process group receives SIGKILL.
 *
 * run() never throws for execution problems; they are reported through
 * RunOutcome. It is safe to call from several threads at once.
 */
class ProcessRunner {
public:
    explicit ProcessRunner(RunnerOptions options = RunnerOptions());

    /**
     * @brief Execute code and wait for the result
     * @param code Source code
     * @param timeout_seconds Wall-clock limit
     * @param abort Optional flag; when it becomes true the child is killed
     * @return Outcome of the run
     */
    RunOutcome run(const std::string& code, double timeout_seconds,
                   const std::atomic<bool>* abort = nullptr) const;

    const RunnerOptions& options() const { return options_; }

    /**
     * @brief Replace invalid UTF-8 sequences with U+FFFD
     * @param bytes Raw bytes
     * @return Valid UTF-8 text
     */
    static std::string sanitizeUtf8(const std::string& bytes);

    /// Longest time between two abort-flag checks, in milliseconds
    static constexpr int POLL_TICK_MS = 100;

private:
    RunnerOptions options_;
};

} // namespace snipq

#endif // SNIPQ_PROCESS_RUNNER_H
