#pragma once

#include "vmexec/config/agent_config.h"
#include "vmexec/execution/execution_result.h"

namespace vmexec {

/**
 * @brief Runs code as a script in a fresh interpreter process.
 *
 * The safety net of the engine: per-request problems (scratch file, spawn,
 * timeout) come back as failed results, never as ExecutionError.
 */
class SubprocessExecutor : public ICodeExecutor {
public:
    explicit SubprocessExecutor(ExecutionConfig config);

    std::expected<ExecutionResult, ExecutionError> run(const std::string& code) override;
    [[nodiscard]] std::string_view name() const override { return "subprocess"; }

    [[nodiscard]] static std::string timeout_message(std::chrono::milliseconds timeout);

private:
    ExecutionConfig config_;
};

} // namespace vmexec
