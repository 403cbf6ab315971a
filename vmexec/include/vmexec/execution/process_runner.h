#pragma once

#include "vmexec/execution/execution_result.h"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace vmexec {

// ============================================================================
// Child processes
// ============================================================================

struct ProcessOptions {
    std::vector<std::string> argv;              ///< argv[0] is looked up in PATH
    std::chrono::milliseconds timeout{30000};   ///< wall-clock limit
};

struct ProcessOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;        ///< exit status, or -signal when killed by a signal
    bool timed_out = false;   ///< output is incomplete when set
};

/**
 * @brief Runs a program to completion with both output streams captured.
 *
 * The child gets its own process group, /dev/null as stdin and default
 * signal dispositions. Both pipes are drained concurrently so a chatty child
 * cannot deadlock on a full pipe. When the timeout expires the whole process
 * group is killed with SIGKILL and reaped before returning.
 *
 * @return SPAWN_FAILURE when the process cannot be started or reaped
 */
[[nodiscard]] std::expected<ProcessOutput, ExecutionError> run_process(const ProcessOptions& options);

// ============================================================================
// Scratch files
// ============================================================================

/**
 * @brief Creates the scratch directory if needed and makes it world-writable
 * with the sticky bit (mode 01777).
 *
 * Failing to change the mode of an existing directory is logged, not fatal.
 */
[[nodiscard]] std::expected<void, ExecutionError> prepare_scratch_dir(const std::filesystem::path& dir);

/**
 * @brief A uniquely named script file that is removed when the object dies.
 *
 * Names come from mkstemps(), so concurrent requests never share a file.
 */
class TempScriptFile {
public:
    static constexpr const char* NAME_PREFIX = "vmexec_";
    static constexpr const char* NAME_SUFFIX = ".py";

    /**
     * @return IO_FAILURE when the file cannot be created or written
     */
    [[nodiscard]] static std::expected<TempScriptFile, ExecutionError> create(
        const std::filesystem::path& dir, std::string_view contents);

    TempScriptFile(const TempScriptFile&) = delete;
    TempScriptFile& operator=(const TempScriptFile&) = delete;
    TempScriptFile(TempScriptFile&& other) noexcept;
    TempScriptFile& operator=(TempScriptFile&& other) noexcept;
    ~TempScriptFile();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief Unlinks the file now. Safe to call more than once.
     * @return false if the file existed and could not be removed
     */
    bool remove() noexcept;

private:
    explicit TempScriptFile(std::filesystem::path path) noexcept
        : path_(std::move(path)) {}

    std::filesystem::path path_;
};

} // namespace vmexec
