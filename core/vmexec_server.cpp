#include "vmexec_server.hpp"
#include "vmexec/utils/logger.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace vmexec {

namespace {

Logger& server_logger() {
    return LoggerFactory::get_logger("vmexec.server");
}

} // namespace

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(int socket_fd) : socket_fd_(socket_fd) {
    timeval timeout{};
    timeout.tv_sec = Server::READ_TIMEOUT.count();
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
        server_logger().debug(std::string("SO_RCVTIMEO not set: ") + std::strerror(errno));
    }
}

Connection::~Connection() {
    if (socket_fd_ == -1) {
        return;
    }

    // Lingering close: closing with unread input would reset the connection
    // and could destroy a response the peer has not read yet
    ::shutdown(socket_fd_, SHUT_WR);
    timeval linger{};
    linger.tv_usec = 500 * 1000;
    setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &linger, sizeof(linger));

    std::array<char, 4096> discard;
    size_t discarded = 0;
    while (discarded < MAX_LINGER_BYTES) {
        ssize_t n = recv(socket_fd_, discard.data(), discard.size(), 0);
        if (n <= 0) {
            break;
        }
        discarded += static_cast<size_t>(n);
    }
    ::close(socket_fd_);
}

std::expected<size_t, NetworkError> Connection::receive_some(std::string& buffer) {
    std::array<char, 8192> chunk;
    while (true) {
        ssize_t bytes_read = recv(socket_fd_, chunk.data(), chunk.size(), 0);
        if (bytes_read > 0) {
            buffer.append(chunk.data(), static_cast<size_t>(bytes_read));
            return static_cast<size_t>(bytes_read);
        }
        if (bytes_read == 0) {
            return 0;
        }
        if (errno == EINTR) {
            continue;
        }
        return std::unexpected(NetworkError::READ_FAILED);
    }
}

std::expected<Request, NetworkError> Connection::read_request() {
    std::string buffer;
    std::optional<size_t> head_end;

    while (!(head_end = find_head_end(buffer))) {
        if (buffer.size() > MAX_REQUEST_HEAD_SIZE) {
            return std::unexpected(NetworkError::REQUEST_TOO_LARGE);
        }
        auto received = receive_some(buffer);
        if (!received) {
            return std::unexpected(received.error());
        }
        if (*received == 0) {
            return std::unexpected(buffer.empty() ? NetworkError::CONNECTION_CLOSED
                                                  : NetworkError::INVALID_REQUEST);
        }
    }

    if (*head_end > MAX_REQUEST_HEAD_SIZE) {
        return std::unexpected(NetworkError::REQUEST_TOO_LARGE);
    }

    auto head = parse_request_head(std::string_view(buffer).substr(0, *head_end));
    if (!head) {
        return std::unexpected(head.error());
    }

    std::string body = buffer.substr(*head_end);
    while (body.size() < head->content_length) {
        auto received = receive_some(body);
        if (!received) {
            return std::unexpected(received.error());
        }
        if (*received == 0) {
            // Declared body never arrived
            return std::unexpected(NetworkError::INVALID_REQUEST);
        }
    }
    body.resize(head->content_length);

    return make_request(std::move(*head), std::move(body));
}

std::expected<void, NetworkError> Connection::write_response(const Response& response) {
    std::string http_response = response.to_http_string();

    size_t sent = 0;
    while (sent < http_response.size()) {
        ssize_t bytes_sent = send(socket_fd_, http_response.data() + sent, http_response.size() - sent, MSG_NOSIGNAL);
        if (bytes_sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(NetworkError::WRITE_FAILED);
        }
        sent += static_cast<size_t>(bytes_sent);
    }
    return {};
}

// ============================================================================
// Server
// ============================================================================

Server::Server(ServerConfig config, std::shared_ptr<Router> router)
    : config_(std::move(config))
    , router_(std::move(router)) {}

Server::~Server() {
    shutdown();
    close_listener();
}

std::expected<void, NetworkError> Server::bind() {
    if (listen_fd_.load() != -1) {
        return {};
    }

    int server_socket = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_socket == -1) {
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    int opt = 1;
    setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &server_addr.sin_addr) != 1) {
        server_logger().error("Invalid bind address '" + config_.bind_address + "'");
        ::close(server_socket);
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    if (::bind(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == -1) {
        server_logger().error("Cannot bind " + config_.bind_address + ":" + std::to_string(config_.port) +
                              ": " + std::strerror(errno));
        ::close(server_socket);
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    if (listen(server_socket, SOMAXCONN) == -1) {
        ::close(server_socket);
        return std::unexpected(NetworkError::LISTEN_FAILED);
    }

    sockaddr_in actual{};
    socklen_t actual_len = sizeof(actual);
    if (getsockname(server_socket, reinterpret_cast<sockaddr*>(&actual), &actual_len) == 0) {
        bound_port_ = ntohs(actual.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    listen_fd_ = server_socket;
    return {};
}

std::expected<void, NetworkError> Server::run() {
    if (!router_) {
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    auto bind_result = bind();
    if (!bind_result) {
        return bind_result;
    }

    running_ = true;
    server_logger().info("vmexec agent listening on " + config_.bind_address + ":" + std::to_string(bound_port()));

    while (!stop_requested_) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_socket = accept4(listen_fd_.load(), reinterpret_cast<sockaddr*>(&client_addr), &client_len,
                                    SOCK_CLOEXEC);
        if (client_socket == -1) {
            if (stop_requested_) {
                break;
            }
            int err = errno;
            if (err == EINTR || err == ECONNABORTED) {
                continue;
            }
            server_logger().warn(error_to_string(NetworkError::ACCEPT_FAILED) + ": " + std::strerror(err));
            if (err == EBADF || err == EINVAL) {
                break;
            }
            // Out of descriptors or memory; back off instead of spinning
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            ++active_connections_;
        }

        try {
            std::thread([this, client_socket]() {
                handle_connection(client_socket);
            }).detach();
        } catch (const std::system_error& e) {
            server_logger().error(std::string("Cannot start connection thread: ") + e.what());
            ::close(client_socket);
            connection_finished();
        }
    }

    running_ = false;
    close_listener();
    server_logger().info("Server stopped accepting connections");
    return {};
}

void Server::shutdown() {
    if (!stop_requested_.exchange(true)) {
        int fd = listen_fd_.load();
        if (fd != -1) {
            // Wakes a blocked accept(); the accept loop closes the descriptor
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    std::unique_lock<std::mutex> lock(connections_mutex_);
    connections_done_.wait(lock, [this] { return active_connections_ == 0; });
}

Server::Stats Server::get_stats() const {
    Stats stats;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        stats.active_connections = active_connections_;
    }
    stats.total_requests = total_requests_.load();
    stats.rejected_requests = rejected_requests_.load();
    return stats;
}

void Server::handle_connection(int client_fd) {
    try {
        Connection connection(client_fd);

        Response response;
        std::string summary;
        auto request = connection.read_request();
        if (request) {
            total_requests_.fetch_add(1, std::memory_order_relaxed);
            summary = request->summary();
            response = router_->dispatch(*request);
        } else {
            switch (request.error()) {
                case NetworkError::CONNECTION_CLOSED:
                    connection_finished();
                    return;
                case NetworkError::READ_FAILED:
                    server_logger().debug(error_to_string(request.error()));
                    connection_finished();
                    return;
                case NetworkError::REQUEST_TOO_LARGE:
                    rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                    response = Response::bad_request("Request header too large");
                    break;
                default:
                    rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                    response = Response::bad_request("Malformed HTTP request");
                    break;
            }
            summary = error_to_string(request.error());
        }

        response.with_header("Connection", "close");

        auto written = connection.write_response(response);
        if (!written) {
            server_logger().warn(summary + " -> " + std::to_string(response.status_code()) + " not delivered: " +
                                 error_to_string(written.error()));
        } else {
            server_logger().debug(summary + " -> " + std::to_string(response.status_code()));
            response.notify_sent();
        }
    } catch (const std::exception& e) {
        server_logger().error(std::string("Connection handler failed: ") + e.what());
    }

    connection_finished();
}

void Server::connection_finished() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (--active_connections_ == 0) {
        connections_done_.notify_all();
    }
}

void Server::close_listener() {
    int fd = listen_fd_.exchange(-1);
    if (fd != -1) {
        ::close(fd);
    }
}

} // namespace vmexec
