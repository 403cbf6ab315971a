#include "vmexec/execution/in_process_executor.h"
#include "vmexec/execution/embedded_interpreter.h"

namespace vmexec {

InProcessExecutor::InProcessExecutor(bool enabled)
    : InProcessExecutor(EmbeddedInterpreter::instance(), enabled) {}

InProcessExecutor::InProcessExecutor(EmbeddedInterpreter& interpreter, bool enabled)
    : interpreter_(interpreter)
    , enabled_(enabled) {}

std::expected<ExecutionResult, ExecutionError> InProcessExecutor::run(const std::string& code) {
    if (!enabled_) {
        return std::unexpected(ExecutionError{ExecutionError::Kind::UNAVAILABLE,
                                              "in-process execution disabled by configuration"});
    }
    return interpreter_.evaluate(code);
}

} // namespace vmexec
