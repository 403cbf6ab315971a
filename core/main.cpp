#include "vmexec_server.hpp"
#include "handlers/handlers.hpp"
#include "vmexec/config/agent_config.h"
#include "vmexec/execution/execution_engine.h"
#include "vmexec/lifecycle/lifecycle_controller.h"
#include "vmexec/utils/logger.h"

#include <charconv>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <pthread.h>

namespace {

struct CommandLine {
    std::optional<std::filesystem::path> config_path;
    std::optional<uint16_t> port;
    bool show_help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file>] [--port <n>] [--help]\n"
              << "\n"
              << "  --config <file>  TOML configuration (default: " << vmexec::AgentConfig::DEFAULT_CONFIG_PATH
              << " if present)\n"
              << "  --port <n>       listening port, overrides file and environment\n"
              << "  --help           show this message\n";
}

std::optional<CommandLine> parse_command_line(int argc, char** argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
        } else if (arg == "--config" && i + 1 < argc) {
            cli.config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            std::string value = argv[++i];
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                std::cerr << "Invalid port: " << value << "\n";
                return std::nullopt;
            }
            cli.port = port;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return cli;
}

bool configure_logging(const vmexec::LoggingConfig& logging) {
    using namespace vmexec;

    LoggerFactory::set_global_level(log_level_from_string(logging.level));
    if (logging.json_format()) {
        LoggerFactory::set_default_formatter(std::make_shared<JsonFormatter>());
    }
    if (!logging.file.empty()) {
        try {
            LoggerFactory::add_default_sink(std::make_shared<FileSink>(logging.file));
        } catch (const std::runtime_error& e) {
            std::cerr << "Cannot open log file: " << e.what() << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using namespace vmexec;

    auto cli = parse_command_line(argc, argv);
    if (!cli) {
        print_usage(argv[0]);
        return 1;
    }
    if (cli->show_help) {
        print_usage(argv[0]);
        return 0;
    }

    auto config = AgentConfig::load(cli->config_path);
    if (!config) {
        std::cerr << "Failed to load configuration\n";
        return 1;
    }
    if (cli->port) {
        config->server.port = *cli->port;
    }

    auto problems = config->validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Invalid configuration: " << problem << "\n";
        }
        return 1;
    }

    if (!configure_logging(config->logging)) {
        return 1;
    }
    auto& logger = LoggerFactory::get_logger("vmexec.main");

    // Block termination signals in every thread; a dedicated thread waits for them
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    auto engine = ExecutionEngine::create(config->execution);
    LifecycleController lifecycle(config->lifecycle);

    auto router = std::make_shared<Router>();
    handlers::register_routes(*router, *engine, lifecycle);

    Server server(config->server, router);
    if (auto bound = server.bind(); !bound) {
        logger.fatal("Cannot start server: " + error_to_string(bound.error()));
        LoggerFactory::flush_all();
        return 1;
    }

    logger.with_field("address", config->server.bind_address)
        .with_field("port", server.bound_port())
        .with_field("strategy", config->execution.in_process ? "in_process" : "subprocess")
        .with_field("interpreter", config->execution.interpreter)
        .with_field("timeout_ms", config->execution.timeout.count());
    logger.info("Starting vmexec agent on " + config->server.bind_address + ":" +
                std::to_string(server.bound_port()));
    logger.clear_fields();

    std::thread signal_waiter([&server, &logger, stop_signals] {
        int signal_number = 0;
        if (sigwait(&stop_signals, &signal_number) == 0) {
            logger.info(std::string("Received ") + strsignal(signal_number) + ", stopping");
            server.shutdown();
        }
    });

    auto result = server.run();

    // Release the waiter if the server stopped on its own
    pthread_kill(signal_waiter.native_handle(), SIGTERM);
    signal_waiter.join();

    if (!result) {
        logger.fatal("Server failed: " + error_to_string(result.error()));
        LoggerFactory::flush_all();
        return 1;
    }

    logger.info("vmexec agent stopped");
    LoggerFactory::flush_all();
    return 0;
}
