#include "handlers.hpp"
#include "vmexec/utils/logger.h"

#include <nlohmann/json.hpp>

#include <expected>

namespace vmexec {
namespace handlers {

    namespace {

        // The 400 response to send when the body is not a valid request
        std::expected<ExecutionRequest, Response> parse_execution_request(const Request& req) {
            nlohmann::json payload;
            try {
                payload = req.json_body();
            } catch (const nlohmann::json::parse_error&) {
                return std::unexpected(Response::bad_request("Invalid JSON"));
            }

            if (!payload.is_object() || !payload.contains("code")) {
                return std::unexpected(Response::bad_request("Missing 'code' field"));
            }
            const auto& code = payload["code"];
            if (!code.is_string()) {
                return std::unexpected(Response::bad_request("'code' must be a string"));
            }
            return ExecutionRequest{code.get<std::string>()};
        }

    } // namespace

    Response execute_code(const Request& req, ExecutionEngine& engine) {
        auto request = parse_execution_request(req);
        if (!request) {
            return std::move(request.error());
        }

        ExecutionResult result = engine.execute(request->code);
        LoggerFactory::get_logger("vmexec.handlers")
            .debug("Execution finished with exit code " + std::to_string(result.exit_code));
        return Response::json(200, result);
    }

    Response get_health(const Request&, const LifecycleController& lifecycle) {
        return Response::json(200, lifecycle.health());
    }

    Response request_shutdown(const Request&, LifecycleController& lifecycle) {
        LoggerFactory::get_logger("vmexec.handlers").info("Shutdown requested");
        Response response = Response::json(200, lifecycle.request_shutdown());
        response.on_sent([&lifecycle] {
            lifecycle.schedule_termination();
        });
        return response;
    }

    void register_routes(Router& router, ExecutionEngine& engine, LifecycleController& lifecycle) {
        router.post("/execute", [&engine](const Request& req) {
            return execute_code(req, engine);
        });
        router.get("/health", [&lifecycle](const Request& req) {
            return get_health(req, lifecycle);
        });
        router.post("/shutdown", [&lifecycle](const Request& req) {
            return request_shutdown(req, lifecycle);
        });
    }

} // namespace handlers
} // namespace vmexec
