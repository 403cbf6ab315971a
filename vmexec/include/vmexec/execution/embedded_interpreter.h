#pragma once

#include "vmexec/execution/execution_result.h"

#include <atomic>
#include <expected>
#include <mutex>
#include <optional>
#include <string>

struct _object;

namespace vmexec {

/**
 * @brief The process-wide embedded Python interpreter.
 *
 * Initialized lazily on first use and kept alive until the process exits.
 * sys.stdout and sys.stderr are process-global, so only one evaluation
 * captures them at a time; a caller that finds the interpreter busy gets
 * UNAVAILABLE instead of waiting.
 *
 * Code that leaves its own threads running could write into the capture of
 * a later evaluation. Once that happens the interpreter is tainted and every
 * further evaluate() reports UNAVAILABLE.
 */
class EmbeddedInterpreter {
public:
    static EmbeddedInterpreter& instance();

    EmbeddedInterpreter(const EmbeddedInterpreter&) = delete;
    EmbeddedInterpreter& operator=(const EmbeddedInterpreter&) = delete;

    /**
     * @brief Starts the interpreter once. Later calls return the first outcome.
     */
    std::expected<void, ExecutionError> ensure_initialized();

    /**
     * @brief Runs code as a module body in a fresh namespace.
     *
     * Exceptions raised by the code, SystemExit included, are part of the
     * result. An ExecutionError means the capture machinery itself failed.
     */
    std::expected<ExecutionResult, ExecutionError> evaluate(const std::string& code);

    [[nodiscard]] bool tainted() const noexcept { return tainted_.load(); }

private:
    EmbeddedInterpreter() = default;

    void taint(const std::string& reason);

    std::once_flag init_once_;
    std::optional<ExecutionError> init_error_;
    std::mutex evaluation_mutex_;
    std::atomic<bool> tainted_{false};
    _object* pristine_builtins_ = nullptr;  ///< copy of builtins.__dict__ before any user code
};

} // namespace vmexec
