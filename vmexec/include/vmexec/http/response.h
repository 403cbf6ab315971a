#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vmexec {

/**
 * @brief HTTP response returned by every handler.
 *
 * Factories produce JSON bodies; error factories wrap the message as
 * `{"error": "<message>"}`. Content-Length is kept in sync with the body.
 *
 * @example
 * ```cpp
 * return Response::json(200, {{"status", "healthy"}});
 * return Response::bad_request("Missing 'code' field");
 * ```
 */
class Response {
public:
    using SentHook = std::function<void()>;

    Response();
    explicit Response(int status_code, std::string body = "");

    // ========================================================================
    // Factories
    // ========================================================================

    static Response json(int status_code, const nlohmann::json& body);
    static Response error(int status_code, const std::string& message);
    static Response bad_request(const std::string& message = "Bad Request");
    static Response not_found(const std::string& message = "Not Found");
    static Response internal_error(const std::string& message = "Internal Server Error");

    // ========================================================================
    // Fluent setters
    // ========================================================================

    Response& with_body(std::string body);
    Response& with_header(const std::string& key, const std::string& value);
    Response& with_content_type(const std::string& content_type);

    /**
     * @brief Registers a callback the server runs once the response has been
     * completely written to the client. Hooks never run for a response that
     * failed to send.
     */
    Response& on_sent(SentHook hook);

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] int status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    [[nodiscard]] std::optional<std::string> header(const std::string& key) const;
    [[nodiscard]] const std::unordered_map<std::string, std::string>& headers() const noexcept { return headers_; }
    [[nodiscard]] const std::vector<SentHook>& sent_hooks() const noexcept { return sent_hooks_; }

    /**
     * @brief Runs the post-send hooks, in registration order.
     */
    void notify_sent() const;

    /**
     * @brief Serializes status line, headers and body for the wire.
     */
    [[nodiscard]] std::string to_http_string() const;

    [[nodiscard]] static std::string status_text(int status_code);

private:
    int status_code_ = 200;
    std::unordered_map<std::string, std::string> headers_;
    std::string body_;
    std::vector<SentHook> sent_hooks_;

    void update_content_length();
};

} // namespace vmexec
