#pragma once

#include "vmexec/execution/execution_result.h"

namespace vmexec {

class EmbeddedInterpreter;

/**
 * @brief Runs code inside the agent's own embedded interpreter.
 *
 * Fast and dependency-free at request time, but unavailable when the
 * interpreter cannot start or is busy with another request.
 */
class InProcessExecutor : public ICodeExecutor {
public:
    explicit InProcessExecutor(bool enabled = true);
    InProcessExecutor(EmbeddedInterpreter& interpreter, bool enabled);

    std::expected<ExecutionResult, ExecutionError> run(const std::string& code) override;
    [[nodiscard]] std::string_view name() const override { return "in_process"; }

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

private:
    EmbeddedInterpreter& interpreter_;
    bool enabled_;
};

} // namespace vmexec
