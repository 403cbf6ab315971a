#include "vmexec/config/agent_config.h"
#include "vmexec/utils/logger.h"

#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>

namespace vmexec {

namespace {

// ============================================================================
// Helpers
// ============================================================================

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::optional<std::string>(value) : std::nullopt;
}

std::string format_duration(std::chrono::milliseconds duration) {
    if (duration.count() % 1000 == 0) {
        return std::to_string(duration.count() / 1000) + "s";
    }
    return std::to_string(duration.count()) + "ms";
}

Logger& config_logger() {
    return LoggerFactory::get_logger("vmexec.config");
}

/**
 * @brief Reads a duration key that may be written as a string ("30s") or
 * as an integer number of seconds.
 */
std::optional<std::chrono::milliseconds> find_duration(const toml::value& section, const std::string& key) {
    const auto& value = toml::find(section, key);
    if (value.is_integer()) {
        auto seconds = value.as_integer();
        if (seconds < 0 || seconds > std::chrono::duration_cast<std::chrono::seconds>(MAX_DURATION).count()) {
            throw std::out_of_range("duration out of range for '" + key + "'");
        }
        return std::chrono::seconds(seconds);
    }
    auto parsed = parse_duration(toml::get<std::string>(value));
    if (!parsed) {
        throw std::invalid_argument("invalid duration for '" + key + "'");
    }
    return parsed;
}

AgentConfig from_toml_data(const toml::value& toml_data) {
    AgentConfig config;

    if (toml_data.contains("server")) {
        const auto& server_section = toml::find(toml_data, "server");

        if (server_section.contains("bind_address")) {
            config.server.bind_address = toml::find<std::string>(server_section, "bind_address");
        }

        if (server_section.contains("port")) {
            auto port = toml::find<int64_t>(server_section, "port");
            if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
                throw std::out_of_range("server.port out of range: " + std::to_string(port));
            }
            config.server.port = static_cast<uint16_t>(port);
        }
    }

    if (toml_data.contains("execution")) {
        const auto& exec_section = toml::find(toml_data, "execution");

        if (exec_section.contains("in_process")) {
            config.execution.in_process = toml::find<bool>(exec_section, "in_process");
        }

        if (exec_section.contains("interpreter")) {
            config.execution.interpreter = toml::find<std::string>(exec_section, "interpreter");
        }

        if (exec_section.contains("scratch_dir")) {
            config.execution.scratch_dir = toml::find<std::string>(exec_section, "scratch_dir");
        }

        if (exec_section.contains("timeout")) {
            config.execution.timeout = *find_duration(exec_section, "timeout");
        }
    }

    if (toml_data.contains("lifecycle")) {
        const auto& lifecycle_section = toml::find(toml_data, "lifecycle");

        if (lifecycle_section.contains("shutdown_delay")) {
            config.lifecycle.shutdown_delay = *find_duration(lifecycle_section, "shutdown_delay");
        }

        if (lifecycle_section.contains("shutdown_command")) {
            config.lifecycle.shutdown_command = toml::find<std::string>(lifecycle_section, "shutdown_command");
        }
    }

    if (toml_data.contains("logging")) {
        const auto& logging_section = toml::find(toml_data, "logging");

        if (logging_section.contains("level")) {
            config.logging.level = toml::find<std::string>(logging_section, "level");
        }

        if (logging_section.contains("format")) {
            config.logging.format = toml::find<std::string>(logging_section, "format");
        }

        if (logging_section.contains("file")) {
            config.logging.file = toml::find<std::string>(logging_section, "file");
        }
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// Parsing helpers
// ============================================================================

std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str) {
    static const std::regex duration_regex(R"(^(\d+)\s*(ms|s|sec|m|min)$)");
    std::smatch match;

    std::string input = to_lower(trim(duration_str));
    if (!std::regex_match(input, match, duration_regex)) {
        return std::nullopt;
    }

    long long value = 0;
    try {
        value = std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    const std::string unit = match[2].str();

    long long factor = 1;
    if (unit == "s" || unit == "sec") {
        factor = 1000;
    } else if (unit == "m" || unit == "min") {
        factor = 60 * 1000;
    }

    if (value > MAX_DURATION.count() / factor) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(value * factor);
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower_value = to_lower(trim(value));

    if (lower_value == "true" || lower_value == "yes" || lower_value == "1" || lower_value == "on") {
        return true;
    } else if (lower_value == "false" || lower_value == "no" || lower_value == "0" || lower_value == "off") {
        return false;
    }

    return std::nullopt;
}

// ============================================================================
// AgentConfig
// ============================================================================

bool LoggingConfig::json_format() const {
    return to_lower(trim(format)) == "json";
}

AgentConfig AgentConfig::defaults() {
    return AgentConfig{};
}

std::optional<AgentConfig> AgentConfig::from_toml_file(const std::filesystem::path& config_path) {
    try {
        if (!std::filesystem::exists(config_path)) {
            config_logger().error("Configuration file not found: " + config_path.string());
            return std::nullopt;
        }

        auto toml_data = toml::parse(config_path.string());
        return from_toml_data(toml_data);
    } catch (const std::exception& e) {
        config_logger().error("Failed to load " + config_path.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<AgentConfig> AgentConfig::from_toml_string(const std::string& toml_content) {
    try {
        std::istringstream iss(toml_content);
        auto toml_data = toml::parse(iss, "inline-config");
        return from_toml_data(toml_data);
    } catch (const std::exception& e) {
        config_logger().error(std::string("Failed to parse configuration: ") + e.what());
        return std::nullopt;
    }
}

void AgentConfig::apply_environment() {
    auto& logger = config_logger();

    if (auto value = get_env("VMEXEC_BIND_ADDRESS")) {
        server.bind_address = *value;
    }

    if (auto value = get_env("VMEXEC_PORT")) {
        try {
            auto port = std::stol(*value);
            if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
                throw std::out_of_range(*value);
            }
            server.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            logger.warn("Ignoring invalid VMEXEC_PORT: " + *value);
        }
    }

    if (auto value = get_env("VMEXEC_IN_PROCESS")) {
        if (auto flag = parse_bool(*value)) {
            execution.in_process = *flag;
        } else {
            logger.warn("Ignoring invalid VMEXEC_IN_PROCESS: " + *value);
        }
    }

    if (auto value = get_env("VMEXEC_INTERPRETER")) {
        execution.interpreter = *value;
    }

    if (auto value = get_env("VMEXEC_SCRATCH_DIR")) {
        execution.scratch_dir = *value;
    }

    if (auto value = get_env("VMEXEC_EXEC_TIMEOUT")) {
        if (auto timeout = parse_duration(*value)) {
            execution.timeout = *timeout;
        } else {
            logger.warn("Ignoring invalid VMEXEC_EXEC_TIMEOUT: " + *value);
        }
    }

    if (auto value = get_env("VMEXEC_SHUTDOWN_DELAY")) {
        if (auto delay = parse_duration(*value)) {
            lifecycle.shutdown_delay = *delay;
        } else {
            logger.warn("Ignoring invalid VMEXEC_SHUTDOWN_DELAY: " + *value);
        }
    }

    if (auto value = get_env("VMEXEC_SHUTDOWN_COMMAND")) {
        lifecycle.shutdown_command = *value;
    }

    if (auto value = get_env("VMEXEC_LOG_LEVEL")) {
        logging.level = *value;
    }

    if (auto value = get_env("VMEXEC_LOG_FORMAT")) {
        logging.format = *value;
    }
}

std::optional<AgentConfig> AgentConfig::load(const std::optional<std::filesystem::path>& config_path) {
    AgentConfig config = defaults();

    if (config_path) {
        auto from_file = from_toml_file(*config_path);
        if (!from_file) {
            return std::nullopt;
        }
        config = std::move(*from_file);
    } else {
        std::error_code ec;
        if (std::filesystem::exists(DEFAULT_CONFIG_PATH, ec)) {
            auto from_file = from_toml_file(DEFAULT_CONFIG_PATH);
            if (!from_file) {
                return std::nullopt;
            }
            config = std::move(*from_file);
        }
    }

    config.apply_environment();
    return config;
}

std::vector<std::string> AgentConfig::validate() const {
    std::vector<std::string> problems;

    if (server.bind_address.empty()) {
        problems.emplace_back("server.bind_address must not be empty");
    }
    if (execution.interpreter.empty()) {
        problems.emplace_back("execution.interpreter must not be empty");
    }
    if (execution.scratch_dir.empty()) {
        problems.emplace_back("execution.scratch_dir must not be empty");
    }
    if (execution.timeout <= std::chrono::milliseconds::zero()) {
        problems.emplace_back("execution.timeout must be positive");
    }
    if (execution.timeout > MAX_DURATION) {
        problems.emplace_back("execution.timeout must not exceed 24 hours");
    }
    if (lifecycle.shutdown_delay < std::chrono::milliseconds::zero()) {
        problems.emplace_back("lifecycle.shutdown_delay must not be negative");
    }
    if (lifecycle.shutdown_delay > MAX_DURATION) {
        problems.emplace_back("lifecycle.shutdown_delay must not exceed 24 hours");
    }

    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "fatal", "off"};
    if (std::find(levels.begin(), levels.end(), to_lower(logging.level)) == levels.end()) {
        problems.emplace_back("logging.level must be one of trace, debug, info, warn, error, fatal, off");
    }

    const auto format = to_lower(trim(logging.format));
    if (format != "text" && format != "json") {
        problems.emplace_back("logging.format must be \"text\" or \"json\"");
    }

    return problems;
}

std::string AgentConfig::to_string() const {
    std::ostringstream oss;
    oss << "[server]\n"
        << "bind_address = \"" << server.bind_address << "\"\n"
        << "port = " << server.port << "\n\n"
        << "[execution]\n"
        << "in_process = " << (execution.in_process ? "true" : "false") << "\n"
        << "interpreter = \"" << execution.interpreter << "\"\n"
        << "scratch_dir = \"" << execution.scratch_dir.string() << "\"\n"
        << "timeout = \"" << format_duration(execution.timeout) << "\"\n\n"
        << "[lifecycle]\n"
        << "shutdown_delay = \"" << format_duration(lifecycle.shutdown_delay) << "\"\n"
        << "shutdown_command = \"" << lifecycle.shutdown_command << "\"\n\n"
        << "[logging]\n"
        << "level = \"" << logging.level << "\"\n"
        << "format = \"" << logging.format << "\"\n"
        << "file = \"" << logging.file << "\"\n";
    return oss.str();
}

} // namespace vmexec
