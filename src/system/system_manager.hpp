#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <atomic>
#include <memory>
#include "system/command_line.hpp"
#include "system/system_state.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace GiftSniper {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<GiftSniper::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// System initialization - configuration, overrides and logging foundation
SystemInitializationResult initialize(const CommandLineOptions& options);

// System lifecycle management
void startup(SystemState& system_state, std::shared_ptr<GiftSniper::Logging::AsyncLogger> logger);
int run_command(SystemState& system_state);
int balance_command(SystemState& system_state);
int login_command(SystemState& system_state, const CommandLineOptions& options);
void shutdown(SystemState& system_state, std::shared_ptr<GiftSniper::Logging::AsyncLogger> logger);

// Dispatches the parsed command; returns the process exit code.
int execute_command(SystemState& system_state, const CommandLineOptions& options);

// 0 for success or cancellation, 1 for an error outcome.
int exit_code_for(const GiftSniper::Core::RunResult& run_result);

} // namespace System
} // namespace GiftSniper

#endif // SYSTEM_MANAGER_HPP
