#include "vmexec/routing/router.h"
#include "vmexec/utils/logger.h"

#include <mutex>
#include <stdexcept>

namespace vmexec {

void Router::get(const std::string& path, Handler handler) {
    add_route("GET", path, std::move(handler));
}

void Router::post(const std::string& path, Handler handler) {
    add_route("POST", path, std::move(handler));
}

void Router::add_route(const std::string& method, const std::string& path, Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Handler for " + method + " " + path + " is empty");
    }

    std::unique_lock lock(handlers_mutex_);
    handlers_[route_key(method, path)] = std::move(handler);
}

bool Router::has_route(const std::string& method, const std::string& path) const {
    std::shared_lock lock(handlers_mutex_);
    return handlers_.contains(route_key(method, path));
}

Response Router::dispatch(const Request& request) const {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    Handler handler;
    {
        std::shared_lock lock(handlers_mutex_);
        auto it = handlers_.find(route_key(request.method(), request.path()));
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        not_found_.fetch_add(1, std::memory_order_relaxed);
        return Response::not_found();
    }

    try {
        return handler(request);
    } catch (const std::exception& e) {
        failed_requests_.fetch_add(1, std::memory_order_relaxed);
        LoggerFactory::get_logger("vmexec.router")
            .error("Handler for " + request.summary() + " failed: " + e.what());
        return Response::internal_error(std::string("Internal server error: ") + e.what());
    } catch (...) {
        failed_requests_.fetch_add(1, std::memory_order_relaxed);
        LoggerFactory::get_logger("vmexec.router")
            .error("Handler for " + request.summary() + " failed with a non-standard exception");
        return Response::internal_error("Internal server error: unknown exception");
    }
}

Router::RouterMetrics Router::get_metrics() const {
    RouterMetrics metrics;
    metrics.total_requests = total_requests_.load(std::memory_order_relaxed);
    metrics.not_found = not_found_.load(std::memory_order_relaxed);
    metrics.failed_requests = failed_requests_.load(std::memory_order_relaxed);
    return metrics;
}

std::string Router::route_key(const std::string& method, const std::string& path) {
    return method + ":" + path;
}

} // namespace vmexec
