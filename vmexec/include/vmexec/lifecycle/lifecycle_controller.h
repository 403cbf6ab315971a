#pragma once

#include "vmexec/config/agent_config.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace vmexec {

struct HealthStatus {
    std::string status = "healthy";
    std::string message = "VM API server is running";
};

struct ShutdownAck {
    std::string status = "shutting_down";
    std::string message = "VM is shutting down";
};

void to_json(nlohmann::json& j, const HealthStatus& health);
void to_json(nlohmann::json& j, const ShutdownAck& ack);

/**
 * @brief Health reporting and the one-shot, delayed self-termination.
 *
 * The delay lets the acknowledgement reach the caller before the VM goes
 * down. Once scheduled, termination cannot be cancelled.
 */
class LifecycleController {
public:
    using TerminationAction = std::function<void()>;

    /**
     * @brief Terminates by running config.shutdown_command.
     */
    explicit LifecycleController(const LifecycleConfig& config);
    LifecycleController(std::chrono::milliseconds delay, TerminationAction action);

    [[nodiscard]] HealthStatus health() const { return HealthStatus{}; }
    [[nodiscard]] ShutdownAck request_shutdown() const { return ShutdownAck{}; }

    /**
     * @brief Starts the termination timer. Only the first call has an effect.
     * @return true if this call armed the timer
     */
    bool schedule_termination();

    [[nodiscard]] bool termination_scheduled() const noexcept {
        return scheduled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::chrono::milliseconds delay() const noexcept { return delay_; }

    /**
     * @brief Action that runs a shell command and logs its exit status.
     */
    [[nodiscard]] static TerminationAction make_command_action(std::string command);

private:
    std::chrono::milliseconds delay_;
    TerminationAction action_;
    std::atomic<bool> scheduled_{false};
};

} // namespace vmexec
