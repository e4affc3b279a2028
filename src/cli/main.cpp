/**
 * @file main.cpp
 * @brief snipq - Snippet Execution Queue CLI Entry Point
 *
 * Commands:
 *   snipq server [--foreground] [--config FILE] [--log DIR] [--timeout S] [--workers N]
 *                [--history N] [--max-code N] [--admins 1,2]
 *   snipq stop
 *   snipq submit --user ID [--label NAME] (FILE | -)
 *   snipq status TASK_ID --user ID [--full] [--inline-budget N]
 *   snipq mine --user ID [-n N]
 *   snipq recent --user ID [-n N]
 *   snipq stats --user ID
 *   snipq cleanup --user ID --older-than SECONDS
 *   snipq reset-stats --user ID
 */

#include "snipq/config.h"
#include "snipq/errors.h"
#include "snipq/ipc_client.h"
#include "snipq/protocol.h"
#include "snipq/server.h"
#include "snipq/task.h"

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace snipq {

// Version information
const char* VERSION = "1.0.0";

// Default inline budget for task output, in bytes
constexpr size_t DEFAULT_INLINE_BUDGET = 500;

// ANSI color codes
namespace Color {
    // Check if output is a terminal
    inline bool isTerminal() {
        return isatty(fileno(stdout)) != 0;
    }

    inline std::string green() { return isTerminal() ? "\033[32m" : ""; }
    inline std::string yellow() { return isTerminal() ? "\033[33m" : ""; }
    inline std::string red() { return isTerminal() ? "\033[31m" : ""; }
    inline std::string cyan() { return isTerminal() ? "\033[36m" : ""; }
    inline std::string gray() { return isTerminal() ? "\033[90m" : ""; }
    inline std::string reset() { return isTerminal() ? "\033[0m" : ""; }
}

void printVersion() {
    std::cout << "snipq version " << VERSION << "\n"
              << "A queue that runs short code snippets under a timeout\n";
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  server       Start the background daemon service\n"
              << "  stop         Stop the running server\n"
              << "  submit       Queue a snippet read from FILE (or - for stdin)\n"
              << "  status       Show one task with its output\n"
              << "  mine         List your finished tasks, most recent first\n"
              << "  recent       List everyone's finished tasks (admin)\n"
              << "  stats        Show your counters (and system counters for admins)\n"
              << "  cleanup      Drop finished tasks older than N seconds (admin)\n"
              << "  reset-stats  Zero all counters (admin)\n"
              << "\n"
              << "Common options:\n"
              << "  --socket <path>      Control socket (default: /tmp/snipq_<user>.sock)\n"
              << "  --user <id>          Numeric id of the requesting user\n"
              << "\n"
              << "Server options:\n"
              << "  --config <file>      JSON configuration file\n"
              << "  --log <dir>          Write server.log to the specified directory\n"
              << "  --timeout <s>        Wall-clock limit per run (default: 45)\n"
              << "  --workers <n>        Concurrent children (default: 1)\n"
              << "  --history <n>        Finished tasks kept in history (default: 100)\n"
              << "  --max-code <n>       Longest accepted snippet in characters (default: 5000)\n"
              << "  --admins <1,2>       Administrator user ids\n"
              << "  --interpreter <cmd>  Interpreter executable (default: python3)\n"
              << "  --merge-output       Send the child's stderr into stdout\n"
              << "  --foreground         Run in foreground (don't daemonize)\n"
              << "\n"
              << "Submit options:\n"
              << "  --label <name>       Display name stored with the task\n"
              << "\n"
              << "Status options:\n"
              << "  --full               Print output without truncation\n"
              << "  --inline-budget <n>  Bytes of each stream shown inline (default: 500)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " server --admins 1 --log ~/.snipq/logs\n"
              << "  " << program << " submit --user 7 --label alice hello.py\n"
              << "  echo 'print(1+1)' | " << program << " submit --user 7 -\n"
              << "  " << program << " status t_1700000000000_7_1_ab12 --user 7\n"
              << "  " << program << " mine --user 7 -n 5\n"
              << "  " << program << " recent --user 1\n"
              << "  " << program << " cleanup --user 1 --older-than 3600\n"
              << "  " << program << " stop\n"
              << "  " << program << " --version\n";
}

// Options that consume the following argument
const std::set<std::string> VALUE_OPTIONS = {
    "--socket", "--user", "--label", "--config", "--log", "--timeout", "--workers",
    "--history", "--max-code", "--max-stored", "--admins", "--interpreter",
    "--inline-budget", "--older-than", "-n",
};

// Parse a whole-string integer
bool parseInt64(const std::string& str, int64_t& out) {
    if (str.empty()) {
        return false;
    }
    try {
        size_t pos = 0;
        long long value = std::stoll(str, &pos);
        if (pos != str.size()) {
            return false;
        }
        out = static_cast<int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Value following an option, if present
std::optional<std::string> findOption(int argc, char* argv[], const std::string& name) {
    for (int i = 2; i + 1 < argc; ++i) {
        if (argv[i] == name) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

bool hasFlag(int argc, char* argv[], const std::string& name) {
    for (int i = 2; i < argc; ++i) {
        if (argv[i] == name) {
            return true;
        }
    }
    return false;
}

// Arguments after the command that are neither options nor option values
std::vector<std::string> positionals(int argc, char* argv[]) {
    std::vector<std::string> result;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (VALUE_OPTIONS.count(arg) && i + 1 < argc) {
            ++i;
        } else if (arg == "-" || arg.empty() || arg[0] != '-') {
            result.push_back(arg);
        }
    }
    return result;
}

// Read an integer option; prints the error and returns false if malformed
bool readIntOption(int argc, char* argv[], const std::string& name, int64_t& out) {
    auto value = findOption(argc, argv, name);
    if (!value) {
        return true;  // Keep default
    }
    if (!parseInt64(*value, out)) {
        std::cerr << "Error: Invalid value for " << name << ": " << *value << "\n";
        return false;
    }
    return true;
}

// Required --user option
std::optional<int64_t> requireUser(int argc, char* argv[], const std::string& usage) {
    auto value = findOption(argc, argv, "--user");
    if (!value) {
        std::cerr << "Error: Missing --user\n";
        std::cerr << "Usage: " << usage << "\n";
        return std::nullopt;
    }
    int64_t user_id = 0;
    if (!parseInt64(*value, user_id)) {
        std::cerr << "Error: Invalid user id: " << *value << "\n";
        return std::nullopt;
    }
    return user_id;
}

// Client-side configuration: socket path from --socket, SNIPQ_SOCKET or the default
Config clientConfig(int argc, char* argv[]) {
    return Config::fromArgs(argc, argv);
}

bool connectClient(IPCClient& client) {
    if (!client.connect()) {
        std::cerr << "Error: Cannot connect to server. Is the server running?\n";
        if (client.lastErrorCode() != ErrorCode::IPC_SERVER_NOT_RUNNING) {
            std::cerr << "  " << client.lastError() << "\n";
        }
        return false;
    }
    return true;
}

int reportFailure(const IPCClient& client, const std::string& what) {
    std::cerr << "Error: " << what << ": " << client.lastError() << "\n";
    return 1;
}

std::string stateColor(TaskState state) {
    switch (state) {
        case TaskState::PENDING:
            return Color::yellow();
        case TaskState::RUNNING:
            return Color::cyan();
        case TaskState::COMPLETED:
            return Color::green();
        case TaskState::FAILED:
        case TaskState::TIMED_OUT:
            return Color::red();
    }
    return "";
}

std::string formatSeconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds << "s";
    return oss.str();
}

// Server command
int handleServer(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    config.validate();
    bool foreground = hasFlag(argc, argv, "--foreground") || hasFlag(argc, argv, "-f");

    // Check if server is already running
    IPCClient client(config.socket_path);
    if (client.connect()) {
        std::cerr << "Error: Server is already running\n";
        return 1;
    }

    std::cout << "Starting snipq server...\n";
    std::cout << "  Socket: " << config.socket_path << "\n";
    if (config.enable_logging) {
        std::cout << "  Log dir: " << config.log_dir << "\n";
    }
    std::cout << "  Interpreter: " << config.interpreter << "\n";
    std::cout << "  Timeout: " << config.execution_timeout_seconds << "s\n";
    std::cout << "  Workers: " << config.worker_count << "\n";
    std::cout << "  History: " << config.history_capacity << "\n";
    std::cout << "  Administrators: " << config.admin_ids.size() << "\n";

    Server server(config);

    if (!foreground) {
        std::cout << "Daemonizing...\n";
        std::cout.flush();
        if (!server.daemonize()) {
            std::cerr << "Error: Failed to daemonize\n";
            return 1;
        }
    }

    server.run();
    return 0;
}

// Stop command
int handleStop(int argc, char* argv[]) {
    Config config = clientConfig(argc, argv);
    IPCClient client(config.socket_path);

    if (!client.connect()) {
        std::cerr << "Server is not running\n";
        return 1;
    }

    if (!client.shutdown()) {
        return reportFailure(client, "Failed to stop server");
    }

    std::cout << "Server stopped\n";
    return 0;
}

// Submit command
int handleSubmit(int argc, char* argv[]) {
    const std::string usage = "snipq submit --user ID [--label NAME] (FILE | -)";
    auto user_id = requireUser(argc, argv, usage);
    if (!user_id) {
        return 1;
    }

    auto files = positionals(argc, argv);
    if (files.size() != 1) {
        std::cerr << "Error: Expected exactly one FILE (or - for stdin)\n";
        std::cerr << "Usage: " << usage << "\n";
        return 1;
    }

    std::string code;
    if (files[0] == "-") {
        code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(files[0], std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot read " << files[0] << "\n";
            return 1;
        }
        code.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    SubmitRequest req;
    req.user_id = *user_id;
    req.label = findOption(argc, argv, "--label").value_or("");
    req.code = code;

    Config config = clientConfig(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectClient(client)) {
        return 1;
    }

    auto resp = client.submit(req);
    if (!resp) {
        return reportFailure(client, "Failed to submit snippet");
    }

    std::cout << "Task " << resp->task_id << " submitted";
    if (resp->queue_depth > 0) {
        std::cout << " (" << resp->queue_depth << " waiting)";
    }
    std::cout << "\n";
    return 0;
}

// Print one output stream inside a ruled block
void printStream(const std::string& title, const std::string& text, bool full, size_t budget) {
    std::cout << "\n" << title << ":\n";
    std::cout << Color::gray() << std::string(40, '-') << Color::reset() << "\n";
    std::cout << (full ? text : truncateForDisplay(text, budget));
    if (!text.empty() && text.back() != '\n') {
        std::cout << "\n";
    }
    std::cout << Color::gray() << std::string(40, '-') << Color::reset() << "\n";
}

// Status command - show one task
int handleStatus(int argc, char* argv[]) {
    const std::string usage = "snipq status TASK_ID --user ID [--full] [--inline-budget N]";
    auto user_id = requireUser(argc, argv, usage);
    if (!user_id) {
        return 1;
    }

    auto args = positionals(argc, argv);
    if (args.size() != 1) {
        std::cerr << "Error: Missing task ID\n";
        std::cerr << "Usage: " << usage << "\n";
        return 1;
    }

    bool full = hasFlag(argc, argv, "--full");
    int64_t budget = static_cast<int64_t>(DEFAULT_INLINE_BUDGET);
    if (!readIntOption(argc, argv, "--inline-budget", budget)) {
        return 1;
    }
    if (budget < 0) {
        std::cerr << "Error: --inline-budget must not be negative\n";
        return 1;
    }

    Config config = clientConfig(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectClient(client)) {
        return 1;
    }

    auto task = client.getTask(*user_id, args[0]);
    if (!task) {
        return reportFailure(client, "Failed to get task");
    }

    std::cout << "=== Task " << task->id << " ===\n";
    std::cout << std::left << std::setw(16) << "Status:"
              << stateColor(task->state) << taskStateToString(task->state) << Color::reset() << "\n";
    std::cout << std::setw(16) << "User:";
    if (!task->submitter_label.empty()) {
        std::cout << task->submitter_label << " (" << task->submitter_id << ")\n";
    } else {
        std::cout << task->submitter_id << "\n";
    }
    std::cout << std::setw(16) << "Submitted:" << formatTimestamp(task->created_at) << "\n";
    if (task->started_at) {
        std::cout << std::setw(16) << "Started:" << formatTimestamp(*task->started_at) << "\n";
    }
    if (task->finished_at) {
        std::cout << std::setw(16) << "Finished:" << formatTimestamp(*task->finished_at) << "\n";
    }
    if (task->isTerminal()) {
        std::cout << std::setw(16) << "Duration:" << formatSeconds(task->duration_seconds) << "\n";
    }
    if (task->exit_code) {
        std::cout << std::setw(16) << "Exit code:" << *task->exit_code << "\n";
    }
    if (task->output_truncated) {
        std::cout << std::setw(16) << "Note:" << "output exceeded the capture limit\n";
    }

    size_t inline_budget = static_cast<size_t>(budget);
    if (!task->stdout_text.empty()) {
        printStream("Output", task->stdout_text, full, inline_budget);
    }
    if (!task->stderr_text.empty()) {
        printStream("Errors", task->stderr_text, full, inline_budget);
    }

    return 0;
}

// Print a task table
void printTasks(const std::vector<Task>& tasks, bool show_user) {
    if (tasks.empty()) {
        std::cout << "No finished tasks\n";
        return;
    }

    std::cout << std::left
              << std::setw(36) << "ID"
              << std::setw(12) << "STATUS"
              << std::setw(6) << "EXIT"
              << std::setw(10) << "DURATION"
              << std::setw(26) << "FINISHED";
    if (show_user) {
        std::cout << "USER";
    }
    std::cout << "\n";
    std::cout << std::string(show_user ? 110 : 90, '-') << "\n";

    for (const auto& task : tasks) {
        std::string exit_str = task.exit_code ? std::to_string(*task.exit_code) : "-";
        std::string finished = task.finished_at ? formatTimestamp(*task.finished_at) : "-";

        std::cout << std::left << std::setw(36) << task.id
                  << stateColor(task.state) << std::setw(12) << taskStateToString(task.state)
                  << Color::reset()
                  << std::setw(6) << exit_str
                  << std::setw(10) << formatSeconds(task.duration_seconds)
                  << std::setw(26) << finished;
        if (show_user) {
            if (task.submitter_label.empty()) {
                std::cout << task.submitter_id;
            } else {
                std::cout << task.submitter_label << " (" << task.submitter_id << ")";
            }
        }
        std::cout << "\n";
    }

    std::cout << "\nTotal: " << tasks.size() << " tasks\n";
}

// mine / recent commands
int handleList(int argc, char* argv[], bool everyone) {
    const std::string usage = everyone ? "snipq recent --user ID [-n N]"
                                       : "snipq mine --user ID [-n N]";
    auto user_id = requireUser(argc, argv, usage);
    if (!user_id) {
        return 1;
    }

    int64_t limit = 10;
    if (!readIntOption(argc, argv, "-n", limit)) {
        return 1;
    }
    if (limit < 0) {
        std::cerr << "Error: -n must not be negative\n";
        return 1;
    }

    Config config = clientConfig(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectClient(client)) {
        return 1;
    }

    auto tasks = everyone ? client.listRecent(*user_id, static_cast<size_t>(limit))
                          : client.listMine(*user_id, static_cast<size_t>(limit));
    if (!tasks) {
        return reportFailure(client, "Failed to list tasks");
    }

    printTasks(*tasks, everyone);
    return 0;
}

// Stats command
int handleStats(int argc, char* argv[]) {
    auto user_id = requireUser(argc, argv, "snipq stats --user ID");
    if (!user_id) {
        return 1;
    }

    Config config = clientConfig(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectClient(client)) {
        return 1;
    }

    auto stats = client.stats(*user_id);
    if (!stats) {
        return reportFailure(client, "Failed to get statistics");
    }

    std::cout << "=== Your tasks ===\n";
    std::cout << std::left << std::setw(20) << "Submitted:" << stats->user.submitted << "\n";
    std::cout << std::setw(20) << "Succeeded:"
              << Color::green() << stats->user.succeeded << Color::reset() << "\n";
    std::cout << std::setw(20) << "Failed:"
              << Color::red() << stats->user.failed << Color::reset() << "\n";
    std::cout << std::setw(20) << "Waiting in queue:" << stats->queue_depth << "\n";

    if (stats->system) {
        const auto& sys = *stats->system;
        std::cout << "\n=== System ===\n";
        std::cout << std::setw(20) << "Submitted:" << sys.total_submitted << "\n";
        std::cout << std::setw(20) << "Succeeded:" << sys.total_succeeded << "\n";
        std::cout << std::setw(20) << "Failed:" << sys.total_failed << "\n";
        std::cout << std::setw(20) << "Timed out:" << sys.total_timed_out << "\n";
        std::cout << std::setw(20) << "Execution time:"
                  << formatSeconds(sys.cumulative_execution_seconds) << "\n";
    }

    return 0;
}

// Cleanup command
int handleCleanup(int argc, char* argv[]) {
    const std::string usage = "snipq cleanup --user ID --older-than SECONDS";
    auto user_id = requireUser(argc, argv, usage);
    if (!user_id) {
        return 1;
    }

    if (!findOption(argc, argv, "--older-than")) {
        std::cerr << "Error: Missing --older-than\n";
        std::cerr << "Usage: " << usage << "\n";
        return 1;
    }
    int64_t older_than = 0;
    if (!readIntOption(argc, argv, "--older-than", older_than)) {
        return 1;
    }

    Config config = clientConfig(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectClient(client)) {
        return 1;
    }

    auto removed = client.cleanup(*user_id, older_than);
    if (!removed) {
        return reportFailure(client, "Cleanup failed");
    }

    std::cout << "Removed " << *removed << " tasks\n";
    return 0;
}

// Reset-stats command
int handleResetStats(int argc, char* argv[]) {
    auto user_id = requireUser(argc, argv, "snipq reset-stats --user ID");
    if (!user_id) {
        return 1;
    }

    Config config = clientConfig(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectClient(client)) {
        return 1;
    }

    if (!client.resetStats(*user_id)) {
        return reportFailure(client, "Failed to reset statistics");
    }

    std::cout << "Statistics reset\n";
    return 0;
}

int run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "server") {
        return handleServer(argc, argv);
    } else if (command == "stop") {
        return handleStop(argc, argv);
    } else if (command == "submit") {
        return handleSubmit(argc, argv);
    } else if (command == "status") {
        return handleStatus(argc, argv);
    } else if (command == "mine") {
        return handleList(argc, argv, false);
    } else if (command == "recent") {
        return handleList(argc, argv, true);
    } else if (command == "stats") {
        return handleStats(argc, argv);
    } else if (command == "cleanup") {
        return handleCleanup(argc, argv);
    } else if (command == "reset-stats") {
        return handleResetStats(argc, argv);
    } else if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return 0;
    } else if (command == "-v" || command == "--version") {
        printVersion();
        return 0;
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }
}

} // namespace snipq

int main(int argc, char* argv[]) {
    // A server that disappears mid-request must not kill the client
    signal(SIGPIPE, SIG_IGN);

    try {
        return snipq::run(argc, argv);
    } catch (const snipq::SnipqException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
