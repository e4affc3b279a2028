/**
 * @file server.h
 * @brief Main server daemon class for snipq
 *
 * The Server class wires the execution service to the IPC server and
 * manages the daemon lifecycle.
 */

#ifndef SNIPQ_SERVER_H
#define SNIPQ_SERVER_H

#include "snipq/config.h"
#include "snipq/execution_service.h"
#include "snipq/ipc_server.h"
#include "snipq/logger.h"
#include "snipq/protocol.h"

#include <atomic>
#include <memory>
#include <string>

namespace snipq {

/**
 * @brief Main server daemon for snipq
 *
 * The Server:
 * - Owns the ExecutionService (queue, store, dispatcher)
 * - Runs the IPC server and routes each request type to the service
 * - Handles SIGINT/SIGTERM and SHUTDOWN requests
 * - Writes the server log
 *
 * Usage:
 * @code
 * Config config = Config::fromArgs(argc, argv);
 * Server server(config);
 * server.run();  // Blocks until shutdown
 * @endcode
 */
class Server {
public:
    /**
     * @brief Construct a server with the given configuration
     * @param config Server configuration
     */
    explicit Server(const Config& config);

    /**
     * @brief Destructor - stops the server if running
     */
    ~Server();

    // Disable copy
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Start the dispatcher and the IPC server
     * @return true if server started successfully
     * @throws SnipqException if the socket cannot be created
     */
    bool start();

    /**
     * @brief Stop the server
     *
     * Stops the IPC server, then shuts the execution service down
     * (running children are killed, queued tasks fail).
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Start and block until a signal or SHUTDOWN request arrives
     */
    void run();

    /**
     * @brief Ask run() to return; safe to call from a signal handler
     */
    void requestShutdown() noexcept;

    /**
     * @brief Daemonize the process
     *
     * Forks the process and detaches from the terminal. Must be called
     * before start().
     *
     * @return true in the daemon process, false on failure
     */
    bool daemonize();

    const Config& getConfig() const;

    ExecutionService& getService();

    /**
     * @brief Write a message to the server log
     * @param level Log level (INFO, WARN, ERROR, DEBUG)
     * @param message Log message
     */
    void log(const std::string& level, const std::string& message);

private:
    /**
     * @brief Route one request to its handler
     * @return JSON response payload
     * @throws SnipqException on validation, authorization or parse errors
     */
    std::string handleRequest(MsgType type, const std::string& data);

    std::string handleSubmit(const std::string& data);
    std::string handleGetTask(const std::string& data);
    std::string handleList(const std::string& data, bool everyone);
    std::string handleStats(const std::string& data);
    std::string handleCleanup(const std::string& data);
    std::string handleResetStats(const std::string& data);
    std::string handleShutdown();

    void setupSignalHandlers();

    /// Server configuration
    Config config_;

    /// Server log
    std::unique_ptr<Logger> logger_;

    /// Queue, store and dispatcher
    std::unique_ptr<ExecutionService> service_;

    /// IPC server
    std::unique_ptr<IPCServer> ipc_server_;

    /// Running flag
    std::atomic<bool> running_{false};

    /// Shutdown requested flag
    std::atomic<bool> shutdown_requested_{false};
};

/// Server receiving SIGINT/SIGTERM (set by start())
extern Server* g_server_instance;

} // namespace snipq

#endif // SNIPQ_SERVER_H
