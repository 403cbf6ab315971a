#include "vmexec/http/request.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>

namespace vmexec {

std::string error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::BIND_FAILED: return "Failed to bind socket";
        case NetworkError::LISTEN_FAILED: return "Failed to listen on socket";
        case NetworkError::ACCEPT_FAILED: return "Failed to accept connection";
        case NetworkError::READ_FAILED: return "Failed to read from socket";
        case NetworkError::WRITE_FAILED: return "Failed to write to socket";
        case NetworkError::CONNECTION_CLOSED: return "Connection closed";
        case NetworkError::INVALID_REQUEST: return "Invalid HTTP request";
        case NetworkError::REQUEST_TOO_LARGE: return "Request header too large";
        default: return "Unknown error";
    }
}

// ============================================================================
// Request
// ============================================================================

Request::Request(std::string method,
                 std::string path,
                 std::string query_string,
                 std::unordered_map<std::string, std::string> headers,
                 std::string body)
    : method_(std::move(method))
    , path_(std::move(path))
    , query_string_(std::move(query_string))
    , body_(std::move(body)) {
    for (auto& [key, value] : headers) {
        headers_[normalize_header_name(key)] = std::move(value);
    }
}

std::optional<std::string> Request::header(const std::string& key) const {
    auto it = headers_.find(normalize_header_name(key));
    return it != headers_.end() ? std::optional<std::string>(it->second) : std::nullopt;
}

bool Request::has_header(const std::string& key) const {
    return headers_.contains(normalize_header_name(key));
}

std::optional<std::string> Request::content_type() const {
    return header("content-type");
}

nlohmann::json Request::json_body() const {
    return nlohmann::json::parse(body_);
}

std::string Request::summary() const {
    std::ostringstream oss;
    oss << method_ << " " << path_;
    if (!query_string_.empty()) {
        oss << "?" << query_string_;
    }
    oss << " (" << body_.size() << " bytes)";
    return oss.str();
}

std::string Request::normalize_header_name(std::string_view header_name) {
    std::string normalized(header_name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

// ============================================================================
// Wire parsing
// ============================================================================

std::optional<size_t> find_head_end(std::string_view data) {
    auto pos = data.find("\r\n\r\n");
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return pos + 4;
}

std::expected<RequestHead, NetworkError> parse_request_head(std::string_view head) {
    auto line_end = head.find("\r\n");
    if (line_end == std::string_view::npos) {
        return std::unexpected(NetworkError::INVALID_REQUEST);
    }

    // Request line: METHOD TARGET HTTP/VERSION
    static const std::regex request_regex(R"(([A-Z]+) ([^\s]+) HTTP/([0-9]\.[0-9]))");
    std::string request_line(head.substr(0, line_end));
    std::smatch match;
    if (!std::regex_match(request_line, match, request_regex)) {
        return std::unexpected(NetworkError::INVALID_REQUEST);
    }

    RequestHead result;
    result.method = match[1].str();
    result.target = match[2].str();
    result.version = match[3].str();

    size_t pos = line_end + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        if (next == std::string_view::npos) {
            next = head.size();
        }
        std::string_view line = head.substr(pos, next - pos);
        pos = next + 2;

        if (line.empty()) {
            break;
        }

        auto colon_pos = line.find(':');
        if (colon_pos == std::string_view::npos || colon_pos == 0) {
            return std::unexpected(NetworkError::INVALID_REQUEST);
        }

        std::string key = Request::normalize_header_name(line.substr(0, colon_pos));
        std::string value(line.substr(colon_pos + 1));

        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        if (key.find_first_of(" \t") != std::string::npos) {
            return std::unexpected(NetworkError::INVALID_REQUEST);
        }

        result.headers[key] = std::move(value);
    }

    if (result.headers.contains("transfer-encoding")) {
        // Only identity bodies with an explicit length are supported
        return std::unexpected(NetworkError::INVALID_REQUEST);
    }

    if (auto it = result.headers.find("content-length"); it != result.headers.end()) {
        const auto& text = it->second;
        size_t length = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
        if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
            return std::unexpected(NetworkError::INVALID_REQUEST);
        }
        result.content_length = length;
    }

    return result;
}

Request make_request(RequestHead head, std::string body) {
    std::string path = std::move(head.target);
    std::string query_string;

    if (auto query_pos = path.find('?'); query_pos != std::string::npos) {
        query_string = path.substr(query_pos + 1);
        path.erase(query_pos);
    }

    return Request(std::move(head.method), std::move(path), std::move(query_string),
                   std::move(head.headers), std::move(body));
}

std::expected<Request, NetworkError> parse_http_request(std::string_view data) {
    auto head_end = find_head_end(data);
    if (!head_end) {
        return std::unexpected(NetworkError::INVALID_REQUEST);
    }

    auto head = parse_request_head(data.substr(0, *head_end));
    if (!head) {
        return std::unexpected(head.error());
    }

    std::string_view body = data.substr(*head_end);
    if (body.size() < head->content_length) {
        return std::unexpected(NetworkError::CONNECTION_CLOSED);
    }

    return make_request(std::move(*head), std::string(body.substr(0, head->content_length)));
}

} // namespace vmexec
