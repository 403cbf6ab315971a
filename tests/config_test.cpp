#include "vmexec/config/agent_config.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace vmexec;
using namespace std::chrono_literals;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(ParseDurationTest, AcceptsAllUnits) {
    EXPECT_EQ(parse_duration("250ms"), 250ms);
    EXPECT_EQ(parse_duration("30s"), 30s);
    EXPECT_EQ(parse_duration("30sec"), 30s);
    EXPECT_EQ(parse_duration("2m"), 2min);
    EXPECT_EQ(parse_duration("2min"), 2min);
    EXPECT_EQ(parse_duration(" 5 S "), 5s);
}

TEST(ParseDurationTest, RejectsGarbage) {
    EXPECT_FALSE(parse_duration("").has_value());
    EXPECT_FALSE(parse_duration("fast").has_value());
    EXPECT_FALSE(parse_duration("-1s").has_value());
    EXPECT_FALSE(parse_duration("10h").has_value());
    EXPECT_FALSE(parse_duration("1.5s").has_value());
}

TEST(ParseDurationTest, RejectsValuesBeyondOneDay) {
    EXPECT_EQ(parse_duration("1440m"), 24h);
    EXPECT_EQ(parse_duration("86400s"), MAX_DURATION);
    EXPECT_FALSE(parse_duration("1441min").has_value());
    EXPECT_FALSE(parse_duration("86400001ms").has_value());
    EXPECT_FALSE(parse_duration("9223372036854775807m").has_value());
    EXPECT_FALSE(parse_duration("99999999999999999999s").has_value());
}

TEST(ParseBoolTest, RecognizesCommonSpellings) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool("YES"), true);
    EXPECT_EQ(parse_bool("on"), true);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_EQ(parse_bool("False"), false);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(AgentConfigTest, DefaultsMatchDocumentedValues) {
    auto config = AgentConfig::defaults();
    EXPECT_EQ(config.server.bind_address, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_TRUE(config.execution.in_process);
    EXPECT_EQ(config.execution.interpreter, "python3");
    EXPECT_EQ(config.execution.scratch_dir, std::filesystem::path("/tmp"));
    EXPECT_EQ(config.execution.timeout, 30s);
    EXPECT_EQ(config.lifecycle.shutdown_delay, 1s);
    EXPECT_EQ(config.lifecycle.shutdown_command, "reboot -f");
    EXPECT_TRUE(config.validate().empty());
}

TEST(AgentConfigTest, ParsesEverySection) {
    auto config = AgentConfig::from_toml_string(R"(
[server]
bind_address = "127.0.0.1"
port = 9000

[execution]
in_process = false
interpreter = "/usr/bin/python3"
scratch_dir = "/var/tmp/vmexec"
timeout = "5s"

[lifecycle]
shutdown_delay = "250ms"
shutdown_command = "poweroff"

[logging]
level = "debug"
format = "json"
)");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server.bind_address, "127.0.0.1");
    EXPECT_EQ(config->server.port, 9000);
    EXPECT_FALSE(config->execution.in_process);
    EXPECT_EQ(config->execution.interpreter, "/usr/bin/python3");
    EXPECT_EQ(config->execution.scratch_dir, std::filesystem::path("/var/tmp/vmexec"));
    EXPECT_EQ(config->execution.timeout, 5s);
    EXPECT_EQ(config->lifecycle.shutdown_delay, 250ms);
    EXPECT_EQ(config->lifecycle.shutdown_command, "poweroff");
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_EQ(config->logging.format, "json");
}

TEST(AgentConfigTest, IntegerDurationMeansSeconds) {
    auto config = AgentConfig::from_toml_string("[execution]\ntimeout = 12\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->execution.timeout, 12s);
}

TEST(AgentConfigTest, IntegerDurationOutOfRangeIsRejected) {
    EXPECT_FALSE(AgentConfig::from_toml_string("[execution]\ntimeout = 86401\n").has_value());
    EXPECT_FALSE(AgentConfig::from_toml_string("[execution]\ntimeout = 9223372036854775807\n").has_value());
    EXPECT_FALSE(AgentConfig::from_toml_string("[lifecycle]\nshutdown_delay = -1\n").has_value());
}

TEST(AgentConfigTest, MissingSectionsKeepDefaults) {
    auto config = AgentConfig::from_toml_string("[server]\nport = 1234\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server.port, 1234);
    EXPECT_EQ(config->execution.timeout, 30s);
    EXPECT_EQ(config->lifecycle.shutdown_command, "reboot -f");
}

TEST(AgentConfigTest, InvalidInputYieldsNullopt) {
    EXPECT_FALSE(AgentConfig::from_toml_string("[server\nport = ").has_value());
    EXPECT_FALSE(AgentConfig::from_toml_string("[server]\nport = 70000\n").has_value());
    EXPECT_FALSE(AgentConfig::from_toml_string("[execution]\ntimeout = \"soon\"\n").has_value());
    EXPECT_FALSE(AgentConfig::from_toml_file("/nonexistent/vmexec.toml").has_value());
}

TEST(AgentConfigTest, EnvironmentOverridesFile) {
    auto path = std::filesystem::temp_directory_path() / "vmexec_config_test.toml";
    {
        std::ofstream out(path);
        out << "[server]\nport = 9000\n\n[execution]\ntimeout = \"5s\"\n";
    }

    ScopedEnv port("VMEXEC_PORT", "9100");
    ScopedEnv in_process("VMEXEC_IN_PROCESS", "no");
    ScopedEnv timeout("VMEXEC_EXEC_TIMEOUT", "not-a-duration");

    auto config = AgentConfig::load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server.port, 9100);
    EXPECT_FALSE(config->execution.in_process);
    // Malformed environment values are ignored
    EXPECT_EQ(config->execution.timeout, 5s);
}

TEST(AgentConfigTest, ExplicitMissingFileFailsToLoad) {
    EXPECT_FALSE(AgentConfig::load(std::filesystem::path("/nonexistent/agent.toml")).has_value());
}

TEST(AgentConfigTest, ValidateReportsProblems) {
    auto config = AgentConfig::defaults();
    config.execution.interpreter.clear();
    config.execution.timeout = 0ms;
    config.logging.format = "xml";

    auto problems = config.validate();
    EXPECT_EQ(problems.size(), 3u);
}

TEST(AgentConfigTest, ValidateRejectsOverlongDurations) {
    auto config = AgentConfig::defaults();
    config.execution.timeout = MAX_DURATION + 1ms;
    config.lifecycle.shutdown_delay = 25h;
    EXPECT_EQ(config.validate().size(), 2u);
}

TEST(AgentConfigTest, ValidateChecksLogLevelAndFormatCaseInsensitively) {
    auto config = AgentConfig::defaults();
    config.logging.level = "WARNING";
    config.logging.format = "JSON";
    EXPECT_TRUE(config.validate().empty());

    EXPECT_TRUE(config.logging.json_format());

    config.logging.level = "verbose";
    auto problems = config.validate();
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("logging.level"), std::string::npos);
}

TEST(AgentConfigTest, ToStringRoundTripsThroughParser) {
    auto original = AgentConfig::defaults();
    original.server.port = 8181;
    original.execution.timeout = 1500ms;

    auto reparsed = AgentConfig::from_toml_string(original.to_string());
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(reparsed->server.port, 8181);
    EXPECT_EQ(reparsed->execution.timeout, 1500ms);
}
