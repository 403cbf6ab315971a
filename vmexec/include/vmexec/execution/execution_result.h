#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace vmexec {

// ============================================================================
// Data model
// ============================================================================

struct ExecutionRequest {
    std::string code;
};

/**
 * @brief Outcome of running one piece of code.
 *
 * success is derived from exit_code and cannot disagree with it.
 */
struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool success = true;

    ExecutionResult() = default;
    ExecutionResult(std::string out, std::string err, int code)
        : stdout_text(std::move(out))
        , stderr_text(std::move(err))
        , exit_code(code)
        , success(code == 0) {}

    /**
     * @brief {stdout: "", stderr: message, exit_code: 1, success: false}
     */
    static ExecutionResult failure(std::string message) {
        return ExecutionResult("", std::move(message), 1);
    }
};

void to_json(nlohmann::json& j, const ExecutionResult& result);

// ============================================================================
// Infrastructure errors
// ============================================================================

/**
 * @brief A strategy could not run the code at all.
 *
 * Distinct from the code itself failing, which is an ExecutionResult with
 * success == false.
 */
struct ExecutionError {
    enum class Kind {
        UNAVAILABLE,    ///< mechanism not usable in this environment
        IO_FAILURE,     ///< scratch directory or temporary file problem
        SPAWN_FAILURE,  ///< child process could not be started or reaped
        INTERNAL
    };

    Kind kind = Kind::INTERNAL;
    std::string message;

    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view to_string(ExecutionError::Kind kind);

// ============================================================================
// Strategy interface
// ============================================================================

class ICodeExecutor {
public:
    virtual ~ICodeExecutor() = default;

    /**
     * @return a result for every run that took place (whatever the code did),
     * or an ExecutionError when the strategy itself failed
     */
    virtual std::expected<ExecutionResult, ExecutionError> run(const std::string& code) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace vmexec
