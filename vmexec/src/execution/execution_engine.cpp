#include "vmexec/execution/execution_engine.h"
#include "vmexec/execution/in_process_executor.h"
#include "vmexec/execution/subprocess_executor.h"
#include "vmexec/utils/logger.h"

#include <stdexcept>

namespace vmexec {

namespace {

Logger& engine_logger() {
    return LoggerFactory::get_logger("vmexec.engine");
}

} // namespace

ExecutionEngine::ExecutionEngine(std::shared_ptr<ICodeExecutor> primary, std::shared_ptr<ICodeExecutor> fallback)
    : primary_(std::move(primary))
    , fallback_(std::move(fallback)) {
    if (!fallback_) {
        throw std::invalid_argument("ExecutionEngine requires a fallback executor");
    }
}

std::unique_ptr<ExecutionEngine> ExecutionEngine::create(const ExecutionConfig& config) {
    return std::make_unique<ExecutionEngine>(
        std::make_shared<InProcessExecutor>(config.in_process),
        std::make_shared<SubprocessExecutor>(config));
}

ExecutionResult ExecutionEngine::execute(const std::string& code) noexcept {
    executions_.fetch_add(1, std::memory_order_relaxed);
    try {
        return run_strategies(code);
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        try {
            engine_logger().error(std::string("Execution aborted: ") + e.what());
            return ExecutionResult::failure(std::string("Execution error: ") + e.what());
        } catch (const std::exception&) {
            return ExecutionResult("", "Execution error", 1);
        }
    } catch (...) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        try {
            engine_logger().error("Execution aborted by a non-standard exception");
            return ExecutionResult::failure("Execution error: unknown exception");
        } catch (const std::exception&) {
            return ExecutionResult("", "Execution error", 1);
        }
    }
}

ExecutionResult ExecutionEngine::run_strategies(const std::string& code) {
    if (primary_) {
        auto result = primary_->run(code);
        if (result) {
            return std::move(*result);
        }
        fallbacks_.fetch_add(1, std::memory_order_relaxed);
        engine_logger().warn(std::string(primary_->name()) + " execution unavailable (" +
                             result.error().to_string() + "), falling back to " +
                             std::string(fallback_->name()));
    }

    auto result = fallback_->run(code);
    if (result) {
        return std::move(*result);
    }

    failures_.fetch_add(1, std::memory_order_relaxed);
    engine_logger().error(std::string(fallback_->name()) + " execution failed: " + result.error().to_string());
    return ExecutionResult::failure("Execution error: " + result.error().message);
}

ExecutionEngine::EngineMetrics ExecutionEngine::get_metrics() const {
    EngineMetrics metrics;
    metrics.executions = executions_.load(std::memory_order_relaxed);
    metrics.fallbacks = fallbacks_.load(std::memory_order_relaxed);
    metrics.failures = failures_.load(std::memory_order_relaxed);
    return metrics;
}

} // namespace vmexec
