#include "vmexec/execution/subprocess_executor.h"
#include "vmexec/execution/process_runner.h"
#include "vmexec/utils/logger.h"

namespace vmexec {

SubprocessExecutor::SubprocessExecutor(ExecutionConfig config)
    : config_(std::move(config)) {}

std::string SubprocessExecutor::timeout_message(std::chrono::milliseconds timeout) {
    std::string amount;
    if (timeout.count() % 1000 == 0) {
        auto seconds = timeout.count() / 1000;
        amount = std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
    } else {
        amount = std::to_string(timeout.count()) + " ms";
    }
    return "Code execution timed out (" + amount + ")";
}

std::expected<ExecutionResult, ExecutionError> SubprocessExecutor::run(const std::string& code) {
    auto& logger = LoggerFactory::get_logger("vmexec.subprocess");

    if (auto prepared = prepare_scratch_dir(config_.scratch_dir); !prepared) {
        return ExecutionResult::failure("Failed to create temporary file: " + prepared.error().message);
    }

    auto script = TempScriptFile::create(config_.scratch_dir, code);
    if (!script) {
        return ExecutionResult::failure("Failed to create temporary file: " + script.error().message);
    }

    ProcessOptions options;
    options.argv = {config_.interpreter, script->path().string()};
    options.timeout = config_.timeout;

    logger.debug("Running " + script->path().string() + " with " + config_.interpreter);
    auto output = run_process(options);
    if (!output) {
        return ExecutionResult::failure("Execution error: " + output.error().message);
    }

    if (output->timed_out) {
        return ExecutionResult::failure(timeout_message(config_.timeout));
    }
    return ExecutionResult(std::move(output->stdout_text), std::move(output->stderr_text), output->exit_code);
}

} // namespace vmexec
