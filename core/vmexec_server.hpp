#pragma once

#include "vmexec/config/agent_config.h"
#include "vmexec/http/request.h"
#include "vmexec/http/response.h"
#include "vmexec/routing/router.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>

namespace vmexec {

// A single accepted client socket, closed on destruction
class Connection {
public:
    static constexpr size_t MAX_LINGER_BYTES = 1024 * 1024;

    explicit Connection(int socket_fd);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Reads one request: the head (bounded by MAX_REQUEST_HEAD_SIZE),
     * then exactly Content-Length body bytes.
     *
     * @return CONNECTION_CLOSED if the peer sent nothing at all
     */
    std::expected<Request, NetworkError> read_request();

    /**
     * @brief Writes the whole response or fails.
     */
    std::expected<void, NetworkError> write_response(const Response& response);

    [[nodiscard]] int get_socket() const { return socket_fd_; }

private:
    int socket_fd_;

    std::expected<size_t, NetworkError> receive_some(std::string& buffer);
};

/**
 * @brief Blocking HTTP/1.1 server, one thread per connection.
 *
 * Every response is sent with "Connection: close". Post-send hooks of a
 * response run after it has been fully written, before the socket closes.
 */
class Server {
public:
    static constexpr std::chrono::seconds READ_TIMEOUT{30};

    Server(ServerConfig config, std::shared_ptr<Router> router);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Binds and listens. Called by run() when needed; call it first to
     * learn an ephemeral port before the accept loop starts.
     */
    std::expected<void, NetworkError> bind();

    /**
     * @brief Accept loop; returns after shutdown().
     */
    std::expected<void, NetworkError> run();

    /**
     * @brief Stops accepting and waits for in-flight connections. Idempotent.
     */
    void shutdown();

    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    struct Stats {
        size_t active_connections = 0;
        uint64_t total_requests = 0;
        uint64_t rejected_requests = 0;   ///< malformed or oversized HTTP
    };
    [[nodiscard]] Stats get_stats() const;

private:
    ServerConfig config_;
    std::shared_ptr<Router> router_;

    std::atomic<int> listen_fd_{-1};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    size_t active_connections_ = 0;
    mutable std::mutex connections_mutex_;
    std::condition_variable connections_done_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> rejected_requests_{0};

    void handle_connection(int client_fd);
    Response process(Connection& connection, bool& has_request);
    void connection_finished();
    void close_listener();
};

} // namespace vmexec
