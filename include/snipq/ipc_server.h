/**
 * @file ipc_server.h
 * @brief Unix Domain Socket server for IPC communication
 *
 * Implements a server that listens on a Unix Domain Socket and handles
 * incoming requests from command-line clients, one thread per connection.
 */

#ifndef SNIPQ_IPC_SERVER_H
#define SNIPQ_IPC_SERVER_H

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "snipq/protocol.h"

namespace snipq {

/**
 * @brief Unix Domain Socket server for handling IPC requests
 *
 * The IPCServer listens on a Unix Domain Socket and accepts connections
 * from clients. Each connection is handled in a separate thread; threads
 * of closed connections are joined by the accept loop.
 *
 * A handler that throws SnipqException produces an ERROR response with
 * the exception's code; other exceptions map to IPC_PROTOCOL_ERROR.
 *
 * Usage:
 * @code
 * IPCServer server("/tmp/snipq.sock");
 * server.start([](MsgType type, const std::string& payload) {
 *     // Handle request and return response JSON
 *     return response_json;
 * });
 * // ... later
 * server.stop();
 * @endcode
 */
class IPCServer {
public:
    /**
     * @brief Request handler function type
     *
     * The handler receives the message type and payload, and returns
     * a JSON string response.
     */
    using RequestHandler = std::function<std::string(MsgType, const std::string&)>;

    /**
     * @brief Construct an IPC server
     * @param socket_path Path to the Unix Domain Socket
     */
    explicit IPCServer(const std::string& socket_path);

    /**
     * @brief Destructor - stops the server if running
     */
    ~IPCServer();

    // Non-copyable
    IPCServer(const IPCServer&) = delete;
    IPCServer& operator=(const IPCServer&) = delete;

    /**
     * @brief Start the server
     *
     * Creates the Unix Domain Socket (mode 0600), binds to it, and starts
     * accepting connections in a background thread.
     *
     * @param handler Function to handle incoming requests
     * @throws SnipqException if server cannot be started
     */
    void start(RequestHandler handler);

    /**
     * @brief Stop the server
     *
     * Stops accepting new connections, shuts down existing connections,
     * joins all threads and removes the socket file.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    const std::string& socketPath() const { return socket_path_; }

    /// Number of connection threads not yet joined
    size_t connectionCount();

private:
    /// One connection and the thread serving it
    struct Connection {
        std::thread thread;
        int fd = -1;
        std::atomic<bool> done{false};
    };

    /**
     * @brief Main accept loop running in background thread
     */
    void acceptLoop();

    /**
     * @brief Serve requests on one connection until it closes
     */
    void handleClient(Connection* conn);

    /**
     * @brief Run the handler and build the response frame contents
     */
    MsgType dispatch(MsgType type, const std::string& payload, std::string& response);

    /**
     * @brief Join threads of finished connections
     */
    void reapFinished();

    std::string socket_path_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    RequestHandler handler_;

    // Active connections (std::list keeps element addresses stable)
    std::mutex clients_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;
};

} // namespace snipq

#endif // SNIPQ_IPC_SERVER_H
