#pragma once

#include "vmexec/http/request.h"
#include "vmexec/http/response.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace vmexec {

/**
 * @brief Exact-match router keyed by "METHOD:/path".
 *
 * Unknown method/path combinations get 404. An exception escaping a handler
 * becomes a 500 response and never reaches the connection loop.
 */
class Router {
public:
    using Handler = std::function<Response(const Request&)>;

    Router() = default;

    void get(const std::string& path, Handler handler);
    void post(const std::string& path, Handler handler);
    void add_route(const std::string& method, const std::string& path, Handler handler);

    [[nodiscard]] bool has_route(const std::string& method, const std::string& path) const;

    /**
     * @brief Routes the request and always produces a response.
     */
    [[nodiscard]] Response dispatch(const Request& request) const;

    struct RouterMetrics {
        uint64_t total_requests = 0;
        uint64_t not_found = 0;
        uint64_t failed_requests = 0;
    };
    [[nodiscard]] RouterMetrics get_metrics() const;

private:
    std::unordered_map<std::string, Handler> handlers_;
    mutable std::shared_mutex handlers_mutex_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> not_found_{0};
    mutable std::atomic<uint64_t> failed_requests_{0};

    static std::string route_key(const std::string& method, const std::string& path);
};

} // namespace vmexec
