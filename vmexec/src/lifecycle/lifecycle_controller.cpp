#include "vmexec/lifecycle/lifecycle_controller.h"
#include "vmexec/utils/logger.h"

#include <cstdlib>
#include <stdexcept>
#include <thread>

#include <sys/wait.h>

namespace vmexec {

void to_json(nlohmann::json& j, const HealthStatus& health) {
    j = nlohmann::json{{"status", health.status}, {"message", health.message}};
}

void to_json(nlohmann::json& j, const ShutdownAck& ack) {
    j = nlohmann::json{{"status", ack.status}, {"message", ack.message}};
}

LifecycleController::LifecycleController(const LifecycleConfig& config)
    : LifecycleController(config.shutdown_delay, make_command_action(config.shutdown_command)) {}

LifecycleController::LifecycleController(std::chrono::milliseconds delay, TerminationAction action)
    : delay_(delay)
    , action_(std::move(action)) {
    if (!action_) {
        throw std::invalid_argument("LifecycleController requires a termination action");
    }
}

bool LifecycleController::schedule_termination() {
    auto& logger = LoggerFactory::get_logger("vmexec.lifecycle");

    bool expected = false;
    if (!scheduled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        logger.info("Termination already scheduled, ignoring repeated request");
        return false;
    }

    logger.info("Termination scheduled in " + std::to_string(delay_.count()) + "ms");

    // The timer owns copies so it outlives the controller
    std::thread([delay = delay_, action = action_] {
        std::this_thread::sleep_for(delay);
        LoggerFactory::get_logger("vmexec.lifecycle").warn("Terminating now");
        LoggerFactory::flush_all();
        try {
            action();
        } catch (const std::exception& e) {
            LoggerFactory::get_logger("vmexec.lifecycle").error(std::string("Termination action failed: ") + e.what());
        }
    }).detach();

    return true;
}

LifecycleController::TerminationAction LifecycleController::make_command_action(std::string command) {
    return [command = std::move(command)] {
        auto& logger = LoggerFactory::get_logger("vmexec.lifecycle");
        int status = std::system(command.c_str());
        if (status == -1) {
            logger.error("Could not run '" + command + "'");
        } else if (WIFEXITED(status)) {
            logger.info("'" + command + "' exited with status " + std::to_string(WEXITSTATUS(status)));
        } else {
            logger.error("'" + command + "' terminated abnormally (wait status " + std::to_string(status) + ")");
        }
        LoggerFactory::flush_all();
    };
}

} // namespace vmexec
