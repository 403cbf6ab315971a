#include "vmexec/execution/execution_result.h"

namespace vmexec {

void to_json(nlohmann::json& j, const ExecutionResult& result) {
    j = nlohmann::json{
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exit_code", result.exit_code},
        {"success", result.success},
    };
}

std::string_view to_string(ExecutionError::Kind kind) {
    switch (kind) {
        case ExecutionError::Kind::UNAVAILABLE: return "unavailable";
        case ExecutionError::Kind::IO_FAILURE: return "io_failure";
        case ExecutionError::Kind::SPAWN_FAILURE: return "spawn_failure";
        case ExecutionError::Kind::INTERNAL: return "internal";
        default: return "unknown";
    }
}

std::string ExecutionError::to_string() const {
    return std::string(vmexec::to_string(kind)) + ": " + message;
}

} // namespace vmexec
