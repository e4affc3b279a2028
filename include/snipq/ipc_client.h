/**
 * @file ipc_client.h
 * @brief Unix Domain Socket client for IPC communication
 *
 * Implements a client that connects to the snipq server daemon and sends
 * requests via Unix Domain Socket.
 */

#ifndef SNIPQ_IPC_CLIENT_H
#define SNIPQ_IPC_CLIENT_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "snipq/errors.h"
#include "snipq/protocol.h"
#include "snipq/task.h"

namespace snipq {

/**
 * @brief Unix Domain Socket client for communicating with the server
 *
 * Every request method returns nullopt (or false) on failure; the reason
 * is then available from lastError() and, for errors reported by the
 * server, lastErrorCode().
 *
 * Usage:
 * @code
 * IPCClient client("/tmp/snipq_user.sock");
 * if (client.connect()) {
 *     SubmitRequest req;
 *     req.user_id = 42;
 *     req.code = "print(1+1)";
 *     auto resp = client.submit(req);
 *     if (resp) {
 *         std::cout << "Task id: " << resp->task_id << std::endl;
 *     }
 * }
 * @endcode
 */
class IPCClient {
public:
    /**
     * @brief Construct an IPC client
     * @param socket_path Path to the Unix Domain Socket
     */
    explicit IPCClient(const std::string& socket_path);

    /**
     * @brief Destructor - disconnects if connected
     */
    ~IPCClient();

    // Non-copyable
    IPCClient(const IPCClient&) = delete;
    IPCClient& operator=(const IPCClient&) = delete;

    // Movable
    IPCClient(IPCClient&& other) noexcept;
    IPCClient& operator=(IPCClient&& other) noexcept;

    /**
     * @brief Connect to the server
     * @return true if connection was successful
     */
    bool connect();

    void disconnect();

    bool isConnected() const { return fd_ >= 0; }

    /**
     * @brief Queue a snippet
     * @return Assigned task id and queue depth, or nullopt on error
     */
    std::optional<SubmitResponse> submit(const SubmitRequest& req);

    /**
     * @brief Read one task
     * @return The task, or nullopt on error (e.g. TASK_NOT_FOUND, UNAUTHORIZED)
     */
    std::optional<Task> getTask(int64_t user_id, const std::string& task_id);

    /**
     * @brief Caller's finished tasks, most recent first
     */
    std::optional<std::vector<Task>> listMine(int64_t user_id, size_t limit = 10);

    /**
     * @brief Everyone's finished tasks, most recent first (admin)
     */
    std::optional<std::vector<Task>> listRecent(int64_t user_id, size_t limit = 10);

    /**
     * @brief Caller's counters, and system counters for admins
     */
    std::optional<StatsResponse> stats(int64_t user_id);

    /**
     * @brief Drop old finished tasks (admin)
     * @return Number of tasks removed, or nullopt on error
     */
    std::optional<size_t> cleanup(int64_t user_id, int64_t older_than_seconds);

    /**
     * @brief Zero all counters (admin)
     * @return true on success
     */
    bool resetStats(int64_t user_id);

    /**
     * @brief Request server shutdown
     * @return true if shutdown request was acknowledged
     */
    bool shutdown();

    const std::string& socketPath() const { return socket_path_; }

    /// Description of the last failure
    const std::string& lastError() const { return last_error_; }

    /// Server-side code of the last failure (SUCCESS if none was reported)
    ErrorCode lastErrorCode() const { return last_error_code_; }

private:
    /**
     * @brief Send a request and wait for the OK payload
     * @return Response payload, or nullopt with last_error_ set
     */
    std::optional<std::string> call(MsgType type, const std::string& payload);

    std::optional<std::vector<Task>> callForTasks(MsgType type, const ListRequest& req);

    std::string socket_path_;
    int fd_ = -1;
    std::string last_error_;
    ErrorCode last_error_code_ = ErrorCode::SUCCESS;
};

} // namespace snipq

#endif // SNIPQ_IPC_CLIENT_H
