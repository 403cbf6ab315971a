#pragma once

#include "vmexec/execution/execution_engine.h"
#include "vmexec/http/request.h"
#include "vmexec/http/response.h"
#include "vmexec/lifecycle/lifecycle_controller.h"
#include "vmexec/routing/router.h"

namespace vmexec {
namespace handlers {

    // POST /execute {"code": "..."} -> ExecutionResult
    Response execute_code(const Request& req, ExecutionEngine& engine);

    // GET /health
    Response get_health(const Request& req, const LifecycleController& lifecycle);

    // POST /shutdown; termination is armed only once the ack has been sent
    Response request_shutdown(const Request& req, LifecycleController& lifecycle);

    /**
     * @brief Installs the three agent endpoints. engine and lifecycle must
     * outlive the router.
     */
    void register_routes(Router& router, ExecutionEngine& engine, LifecycleController& lifecycle);

} // namespace handlers
} // namespace vmexec
