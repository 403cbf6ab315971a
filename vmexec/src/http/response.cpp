#include "vmexec/http/response.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace vmexec {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

} // anonymous namespace

Response::Response()
    : status_code_(200) {
    with_header("Server", "vmexec-agent");
    update_content_length();
}

Response::Response(int status_code, std::string body)
    : status_code_(status_code)
    , body_(std::move(body)) {
    with_header("Server", "vmexec-agent");
    update_content_length();
}

// ============================================================================
// Factories
// ============================================================================

Response Response::json(int status_code, const nlohmann::json& body) {
    // Output of user programs is not guaranteed to be valid UTF-8
    return Response(status_code, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace))
        .with_content_type("application/json");
}

Response Response::error(int status_code, const std::string& message) {
    return json(status_code, nlohmann::json{{"error", message}});
}

Response Response::bad_request(const std::string& message) {
    return error(400, message);
}

Response Response::not_found(const std::string& message) {
    return error(404, message);
}

Response Response::internal_error(const std::string& message) {
    return error(500, message);
}

// ============================================================================
// Fluent setters
// ============================================================================

Response& Response::with_body(std::string body) {
    body_ = std::move(body);
    update_content_length();
    return *this;
}

Response& Response::with_header(const std::string& key, const std::string& value) {
    for (auto it = headers_.begin(); it != headers_.end(); ++it) {
        if (iequals(it->first, key)) {
            headers_.erase(it);
            break;
        }
    }
    headers_[key] = value;
    return *this;
}

Response& Response::with_content_type(const std::string& content_type) {
    return with_header("Content-Type", content_type);
}

Response& Response::on_sent(SentHook hook) {
    if (hook) {
        sent_hooks_.push_back(std::move(hook));
    }
    return *this;
}

// ============================================================================
// Accessors
// ============================================================================

std::optional<std::string> Response::header(const std::string& key) const {
    for (const auto& [name, value] : headers_) {
        if (iequals(name, key)) {
            return value;
        }
    }
    return std::nullopt;
}

void Response::notify_sent() const {
    for (const auto& hook : sent_hooks_) {
        hook();
    }
}

std::string Response::to_http_string() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code_ << " " << status_text(status_code_) << "\r\n";

    for (const auto& [key, value] : headers_) {
        oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n";
    oss << body_;
    return oss.str();
}

std::string Response::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

void Response::update_content_length() {
    with_header("Content-Length", std::to_string(body_.size()));
}

} // namespace vmexec
