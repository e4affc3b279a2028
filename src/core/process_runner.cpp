/**
 * @file process_runner.cpp
 * @brief Implementation of ProcessRunner class
 *
 * Handles process creation, capture and termination for snippet runs.
 */

#include "snipq/process_runner.h"
#include "snipq/errors.h"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace snipq {

namespace {

/// Failure report sent from the child over the status pipe
struct ChildFailure {
    int stage;
    int error;
};

enum ChildStage {
    STAGE_LIMITS = 1,
    STAGE_SETGID = 2,
    STAGE_SETUID = 3,
    STAGE_CHDIR = 4,
    STAGE_EXEC = 5
};

const char* stageDescription(int stage) {
    switch (stage) {
        case STAGE_LIMITS: return "Failed to apply resource limits";
        case STAGE_SETGID: return "Failed to change group";
        case STAGE_SETUID: return "Failed to change user";
        case STAGE_CHDIR:  return "Failed to enter working directory";
        case STAGE_EXEC:   return "Failed to execute interpreter";
        default:           return "Child setup failed";
    }
}

/**
 * @brief Pipe whose ends are closed when it goes out of scope
 */
class Pipe {
public:
    Pipe() = default;
    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool open() { return pipe2(fds_, O_CLOEXEC) == 0; }

    int readFd() const { return fds_[0]; }
    int writeFd() const { return fds_[1]; }

    void closeRead() {
        if (fds_[0] >= 0) {
            close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void closeWrite() {
        if (fds_[1] >= 0) {
            close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

/**
 * @brief Accumulates one output stream up to a byte cap
 */
struct StreamCapture {
    int fd = -1;
    std::string data;
    size_t cap = 0;
    bool truncated = false;

    bool open() const { return fd >= 0; }

    void append(const char* buf, size_t n) {
        if (cap == 0) {
            data.append(buf, n);
            return;
        }
        if (data.size() < cap) {
            size_t room = cap - data.size();
            data.append(buf, n < room ? n : room);
            if (n > room) {
                truncated = true;
            }
        } else {
            truncated = true;
        }
    }

    /// Read what is available; returns false once the stream is finished
    bool readAvailable() {
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return true;
            }
            // EOF or a hard error
            return false;
        }
    }
};

bool writeAll(int fd, const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool setLimit(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = value;
    rl.rlim_max = value;
    return setrlimit(resource, &rl) == 0;
}

/// Kill the process group, falling back to the single process
void killGroup(pid_t pid) {
    if (killpg(pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
}

/// Blocking waitpid that retries on EINTR
int reap(pid_t pid) {
    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return wstatus;
}

void decodeStatus(int wstatus, RunOutcome& outcome) {
    if (WIFEXITED(wstatus)) {
        outcome.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        outcome.signaled = true;
        outcome.signal_number = WTERMSIG(wstatus);
        outcome.exit_code = 128 + outcome.signal_number;
    }
}

} // anonymous namespace

// ========== RunnerOptions ==========

RunnerOptions RunnerOptions::fromConfig(const Config& config) {
    RunnerOptions options;
    options.interpreter = config.interpreter;
    options.interpreter_args = config.interpreter_args;
    options.source_extension = config.source_extension;
    options.temp_dir = config.temp_dir.empty() ? "/tmp" : config.temp_dir;
    options.merge_output = config.merge_output;
    options.max_output_bytes = config.max_output_bytes;
    options.memory_limit_mb = config.memory_limit_mb;
    options.cpu_limit_seconds = config.cpu_limit_seconds;
    options.max_file_size_mb = config.max_file_size_mb;
    options.max_open_files = config.max_open_files;
    options.max_processes = config.max_processes;
    options.run_as_uid = config.run_as_uid;
    options.run_as_gid = config.run_as_gid;
    return options;
}

// ========== TempSourceFile ==========

TempSourceFile::TempSourceFile(const std::string& dir, const std::string& extension,
                               const std::string& contents) {
    std::string pattern = dir + "/snipq_XXXXXX" + extension;
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), static_cast<int>(extension.size()));
    if (fd < 0) {
        throw SnipqException(ErrorCode::TEMPFILE_FAILED,
                             pattern + ": " + std::strerror(errno));
    }
    path_ = buf.data();

    bool ok = writeAll(fd, contents.data(), contents.size());
    int saved_errno = errno;
    if (close(fd) != 0 && ok) {
        ok = false;
        saved_errno = errno;
    }

    if (!ok) {
        unlink(path_.c_str());
        throw SnipqException(ErrorCode::TEMPFILE_FAILED,
                             path_ + ": " + std::strerror(saved_errno));
    }

    // Readable by a dropped-privilege child
    chmod(path_.c_str(), 0644);
}

TempSourceFile::~TempSourceFile() {
    if (!path_.empty()) {
        unlink(path_.c_str());
    }
}

// ========== ProcessRunner ==========

ProcessRunner::ProcessRunner(RunnerOptions options)
    : options_(std::move(options)) {
}

RunOutcome ProcessRunner::run(const std::string& code, double timeout_seconds,
                              const std::atomic<bool>* abort) const {
    using Clock = std::chrono::steady_clock;

    RunOutcome outcome;
    auto start = Clock::now();
    auto finishWith = [&](RunResultKind kind) {
        outcome.kind = kind;
        outcome.elapsed_seconds =
            std::chrono::duration<double>(Clock::now() - start).count();
        return outcome;
    };

    std::unique_ptr<TempSourceFile> source;
    try {
        source = std::make_unique<TempSourceFile>(
            options_.temp_dir, options_.source_extension, code);
    } catch (const SnipqException& e) {
        outcome.error_message = e.what();
        return finishWith(RunResultKind::SPAWN_ERROR);
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> args;
    args.push_back(options_.interpreter);
    for (const auto& arg : options_.interpreter_args) {
        args.push_back(arg);
    }
    args.push_back(source->path());

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const char* parent_path = std::getenv("PATH");
    std::vector<std::string> env = {
        std::string("PATH=") + (parent_path ? parent_path : "/usr/local/bin:/usr/bin:/bin"),
        "HOME=" + options_.temp_dir,
        "LANG=C.UTF-8",
        "PYTHONIOENCODING=utf-8"
    };
    std::vector<char*> envp;
    for (auto& var : env) {
        envp.push_back(const_cast<char*>(var.c_str()));
    }
    envp.push_back(nullptr);

    rlim_t cpu_limit = options_.cpu_limit_seconds > 0
        ? static_cast<rlim_t>(options_.cpu_limit_seconds)
        : static_cast<rlim_t>(std::ceil(timeout_seconds)) + 1;
    const rlim_t mb = 1024 * 1024;

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe status_pipe;
    if (!out_pipe.open() || (!options_.merge_output && !err_pipe.open()) ||
        !status_pipe.open()) {
        outcome.error_message = std::string("Failed to create pipes: ") + std::strerror(errno);
        return finishWith(RunResultKind::SPAWN_ERROR);
    }

    pid_t pid = fork();

    if (pid < 0) {
        outcome.error_message = std::string("Failed to fork: ") + std::strerror(errno);
        return finishWith(RunResultKind::SPAWN_ERROR);
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        setpgid(0, 0);

        // Ignored dispositions and the mask survive exec; the daemon ignores SIGPIPE
        signal(SIGPIPE, SIG_DFL);
        signal(SIGXFSZ, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe.writeFd(), STDOUT_FILENO);
        dup2(options_.merge_output ? out_pipe.writeFd() : err_pipe.writeFd(), STDERR_FILENO);

        auto fail = [&](int stage) {
            ChildFailure failure{stage, errno};
            ssize_t ignored = write(status_pipe.writeFd(), &failure, sizeof(failure));
            (void)ignored;
            _exit(127);
        };

        bool limits_ok = setLimit(RLIMIT_CPU, cpu_limit);
        if (options_.memory_limit_mb > 0) {
            limits_ok = limits_ok && setLimit(RLIMIT_AS, options_.memory_limit_mb * mb);
        }
        if (options_.max_file_size_mb > 0) {
            limits_ok = limits_ok && setLimit(RLIMIT_FSIZE, options_.max_file_size_mb * mb);
        }
        if (options_.max_open_files > 0) {
            limits_ok = limits_ok &&
                setLimit(RLIMIT_NOFILE, static_cast<rlim_t>(options_.max_open_files));
        }
        if (options_.max_processes > 0) {
            limits_ok = limits_ok &&
                setLimit(RLIMIT_NPROC, static_cast<rlim_t>(options_.max_processes));
        }
        if (!limits_ok) {
            fail(STAGE_LIMITS);
        }

        // Group first; setgid is not permitted once the uid is dropped
        if (options_.run_as_gid >= 0 && setgid(static_cast<gid_t>(options_.run_as_gid)) != 0) {
            fail(STAGE_SETGID);
        }
        if (options_.run_as_uid >= 0 && setuid(static_cast<uid_t>(options_.run_as_uid)) != 0) {
            fail(STAGE_SETUID);
        }

        if (chdir(options_.temp_dir.c_str()) != 0) {
            fail(STAGE_CHDIR);
        }

        execvpe(argv[0], argv.data(), envp.data());
        fail(STAGE_EXEC);
        _exit(127);
    }

    // Parent process
    // Also call setpgid here so the group exists before we might kill it
    setpgid(pid, pid);

    out_pipe.closeWrite();
    err_pipe.closeWrite();
    status_pipe.closeWrite();

    // Blocks until exec succeeds (CLOEXEC closes the pipe) or the child reports
    ChildFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(status_pipe.readFd(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    status_pipe.closeRead();

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        reap(pid);
        outcome.error_message = std::string(stageDescription(failure.stage)) +
                                " (" + options_.interpreter + "): " +
                                std::strerror(failure.error);
        return finishWith(RunResultKind::SPAWN_ERROR);
    }

    StreamCapture out;
    out.fd = out_pipe.readFd();
    out.cap = options_.max_output_bytes;
    StreamCapture err;
    err.fd = options_.merge_output ? -1 : err_pipe.readFd();
    err.cap = options_.max_output_bytes;

    fcntl(out.fd, F_SETFL, O_NONBLOCK);
    if (err.open()) {
        fcntl(err.fd, F_SETFL, O_NONBLOCK);
    }

    auto deadline = start + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(timeout_seconds));

    bool reaped = false;
    int wstatus = 0;
    RunResultKind kind = RunResultKind::EXITED;

    while (true) {
        if (!reaped) {
            siginfo_t info;
            info.si_pid = 0;
            if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
                info.si_pid == pid) {
                // Leader is a zombie, so the group id is still ours. Background
                // children left behind would hold the pipes open.
                killpg(pid, SIGKILL);
                wstatus = reap(pid);
                reaped = true;
            }
        }

        if (reaped && !out.open() && !err.open()) {
            break;
        }

        if (abort != nullptr && abort->load()) {
            kind = RunResultKind::ABORTED;
            break;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            // A reaped child only has stray descendants left holding the pipes
            if (!reaped) {
                kind = RunResultKind::TIMED_OUT;
            }
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(remaining.count()) + 1;
        if (wait_ms > POLL_TICK_MS) {
            wait_ms = POLL_TICK_MS;
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        StreamCapture* streams[2];
        for (StreamCapture* stream : {&out, &err}) {
            if (stream->open()) {
                fds[nfds].fd = stream->fd;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                streams[nfds] = stream;
                ++nfds;
            }
        }

        if (nfds == 0) {
            // Pipes are closed but the child is still running
            poll(nullptr, 0, reaped ? 0 : (wait_ms < 10 ? wait_ms : 10));
            continue;
        }

        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            outcome.error_message = std::string("poll failed: ") + std::strerror(errno);
            killGroup(pid);
            if (!reaped) {
                reap(pid);
            }
            return finishWith(RunResultKind::SPAWN_ERROR);
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (!streams[i]->readAvailable()) {
                    // Owned by the Pipe guard; just stop polling it
                    streams[i]->fd = -1;
                }
            }
        }
    }

    if (kind != RunResultKind::EXITED) {
        killGroup(pid);
        if (!reaped) {
            wstatus = reap(pid);
            reaped = true;
        }
        // Keep whatever is already buffered
        if (out.open()) {
            out.readAvailable();
        }
        if (err.open()) {
            err.readAvailable();
        }
    }

    if (kind == RunResultKind::EXITED) {
        decodeStatus(wstatus, outcome);
    }

    outcome.stdout_text = sanitizeUtf8(out.data);
    outcome.stderr_text = sanitizeUtf8(err.data);
    outcome.output_truncated = out.truncated || err.truncated;
    outcome.no_output = kind == RunResultKind::EXITED && outcome.exit_code == 0 &&
                        outcome.stdout_text.empty() && outcome.stderr_text.empty();

    return finishWith(kind);
}

std::string ProcessRunner::sanitizeUtf8(const std::string& bytes) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string result;
    result.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);

        if (c < 0x80) {
            result += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;   // overlong
            if (c == 0xED) hi = 0x9F;   // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;   // overlong
            if (c == 0xF4) hi = 0x8F;   // above U+10FFFF
        }

        bool valid = len > 0 && i + len <= n;
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            unsigned char min = (k == 1) ? lo : 0x80;
            unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) {
                valid = false;
            }
        }

        if (valid) {
            result.append(bytes, i, len);
            i += len;
        } else {
            result += REPLACEMENT;
            ++i;
        }
    }

    return result;
}

} // namespace snipq
