#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vmexec {

// ============================================================================
// Configuration sections
// ============================================================================

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8080;                      ///< 0 picks an ephemeral port
};

struct ExecutionConfig {
    bool in_process = true;                    ///< try the embedded interpreter first
    std::string interpreter = "python3";       ///< program used by the fallback child process
    std::filesystem::path scratch_dir = "/tmp";
    std::chrono::milliseconds timeout{30000};  ///< wall-clock limit of the child process
};

struct LifecycleConfig {
    std::chrono::milliseconds shutdown_delay{1000};
    std::string shutdown_command = "reboot -f";
};

struct LoggingConfig {
    std::string level = "info";
    std::string format = "text";               ///< "text" or "json"
    std::string file;                          ///< extra file sink when not empty

    [[nodiscard]] bool json_format() const;   ///< case-insensitive
};

/**
 * @brief Complete agent configuration.
 *
 * Sources, lowest precedence first: built-in defaults, TOML file, VMEXEC_*
 * environment variables, command line. Loading never throws; a file that
 * cannot be parsed yields std::nullopt and is logged.
 *
 * @example
 * ```toml
 * [server]
 * port = 8080
 *
 * [execution]
 * timeout = "30s"
 * ```
 */
struct AgentConfig {
    ServerConfig server;
    ExecutionConfig execution;
    LifecycleConfig lifecycle;
    LoggingConfig logging;

    static constexpr const char* DEFAULT_CONFIG_PATH = "/etc/vmexec/agent.toml";

    [[nodiscard]] static AgentConfig defaults();

    [[nodiscard]] static std::optional<AgentConfig> from_toml_file(const std::filesystem::path& config_path);
    [[nodiscard]] static std::optional<AgentConfig> from_toml_string(const std::string& toml_content);

    /**
     * @brief Applies VMEXEC_* variables on top of this configuration.
     * Malformed values are ignored with a warning.
     */
    void apply_environment();

    /**
     * @brief Defaults, then the file (explicit path, or DEFAULT_CONFIG_PATH if it
     * exists), then the environment.
     * @return std::nullopt if an explicitly requested file is missing or invalid
     */
    [[nodiscard]] static std::optional<AgentConfig> load(const std::optional<std::filesystem::path>& config_path);

    /**
     * @return human readable problems, empty when the configuration is usable
     */
    [[nodiscard]] std::vector<std::string> validate() const;

    [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Parsing helpers (exposed for tests)
// ============================================================================

// Longest duration any setting accepts
inline constexpr std::chrono::milliseconds MAX_DURATION = std::chrono::hours(24);

/**
 * @brief Parses "250ms", "30s", "30sec", "2m" or "2min".
 * @return std::nullopt when malformed or longer than MAX_DURATION
 */
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str);

/**
 * @brief Accepts true/false, yes/no, on/off, 1/0 (case-insensitive).
 */
[[nodiscard]] std::optional<bool> parse_bool(const std::string& value);

} // namespace vmexec
