#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace vmexec {

// ============================================================================
// Network errors
// ============================================================================

enum class NetworkError {
    BIND_FAILED,
    LISTEN_FAILED,
    ACCEPT_FAILED,
    READ_FAILED,
    WRITE_FAILED,
    CONNECTION_CLOSED,
    INVALID_REQUEST,
    REQUEST_TOO_LARGE
};

[[nodiscard]] std::string error_to_string(NetworkError error);

// ============================================================================
// Request
// ============================================================================

/**
 * @brief An HTTP request as delivered to a handler.
 *
 * Header names are stored lower-cased, so lookups are case-insensitive. The
 * path never contains the query string.
 */
class Request {
public:
    Request() = default;
    Request(std::string method,
            std::string path,
            std::string query_string,
            std::unordered_map<std::string, std::string> headers,
            std::string body);

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query_string() const noexcept { return query_string_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    [[nodiscard]] bool has_body() const noexcept { return !body_.empty(); }

    [[nodiscard]] std::optional<std::string> header(const std::string& key) const;
    [[nodiscard]] const std::unordered_map<std::string, std::string>& headers() const noexcept { return headers_; }
    [[nodiscard]] bool has_header(const std::string& key) const;
    [[nodiscard]] std::optional<std::string> content_type() const;

    /**
     * @brief Parses the body as JSON.
     * @throws nlohmann::json::parse_error on malformed input (including invalid UTF-8)
     */
    [[nodiscard]] nlohmann::json json_body() const;

    /**
     * @brief "POST /execute (42 bytes)"
     */
    [[nodiscard]] std::string summary() const;

    static std::string normalize_header_name(std::string_view header_name);

private:
    std::string method_;
    std::string path_;
    std::string query_string_;
    std::unordered_map<std::string, std::string> headers_;
    std::string body_;
};

// ============================================================================
// Wire parsing
// ============================================================================

/**
 * @brief Incremental HTTP/1.x request head parser.
 *
 * The head is everything up to and including the blank line; the body length
 * comes from Content-Length (chunked bodies are not accepted).
 */
struct RequestHead {
    std::string method;
    std::string target;
    std::string version;
    std::unordered_map<std::string, std::string> headers;
    size_t content_length = 0;
};

/// Upper bound on the size of the request line plus headers
inline constexpr size_t MAX_REQUEST_HEAD_SIZE = 64 * 1024;

/**
 * @return the offset one past "\r\n\r\n", or std::nullopt when the head is
 * not complete yet
 */
[[nodiscard]] std::optional<size_t> find_head_end(std::string_view data);

[[nodiscard]] std::expected<RequestHead, NetworkError> parse_request_head(std::string_view head);

/**
 * @brief Builds a Request from a parsed head and its body, splitting the
 * query string off the target.
 */
[[nodiscard]] Request make_request(RequestHead head, std::string body);

/**
 * @brief Parses a complete request (head and full body) held in memory.
 */
[[nodiscard]] std::expected<Request, NetworkError> parse_http_request(std::string_view data);

} // namespace vmexec
