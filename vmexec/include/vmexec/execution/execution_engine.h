#pragma once

#include "vmexec/config/agent_config.h"
#include "vmexec/execution/execution_result.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace vmexec {

/**
 * @brief Runs untrusted code with a primary strategy and a fallback.
 *
 * The fallback runs only when the primary strategy could not execute the
 * code at all. Code that ran and failed is a final answer.
 */
class ExecutionEngine {
public:
    ExecutionEngine(std::shared_ptr<ICodeExecutor> primary, std::shared_ptr<ICodeExecutor> fallback);

    /**
     * @brief In-process primary (unless disabled) with the subprocess fallback.
     */
    [[nodiscard]] static std::unique_ptr<ExecutionEngine> create(const ExecutionConfig& config);

    /**
     * @brief Never throws; every failure is folded into the result.
     */
    [[nodiscard]] ExecutionResult execute(const std::string& code) noexcept;

    struct EngineMetrics {
        uint64_t executions = 0;
        uint64_t fallbacks = 0;
        uint64_t failures = 0;   ///< neither strategy could run the code
    };
    [[nodiscard]] EngineMetrics get_metrics() const;

private:
    ExecutionResult run_strategies(const std::string& code);

    std::shared_ptr<ICodeExecutor> primary_;
    std::shared_ptr<ICodeExecutor> fallback_;

    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace vmexec
