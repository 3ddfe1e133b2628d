#include "system_manager.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include "api/gateway/gateway_platform_client.hpp"
#include "api/gateway/session_authenticator.hpp"
#include "configs/config_loader.hpp"
#include "logging/logs/system_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "trader/acquisition/balance_check.hpp"
#include "trader/acquisition/run_controller.hpp"

using namespace GiftSniper::Logging;

namespace GiftSniper {
namespace System {

namespace {

std::string read_console_line(SystemState& system_state, const std::string& prompt) {
    {
        std::lock_guard<std::mutex> console_guard(system_state.logging_context->console_mutex);
        std::cout << prompt << std::flush;
    }
    std::string input_line;
    if (!std::getline(std::cin, input_line)) {
        throw std::runtime_error("Input closed while waiting for: " + prompt);
    }
    return input_line;
}

Core::RunController::WorkerInitializer make_buyer_thread_initializer(SystemState& system_state) {
    std::shared_ptr<LoggingContext> logging_context = system_state.logging_context;
    return [logging_context]() {
        set_logging_context(*logging_context);
        set_log_thread_tag("BUYER");
    };
}

bool require_api_credentials(const SystemState& system_state) {
    if (!Config::has_api_credentials(system_state.config.api)) {
        SystemLogs::log_fatal_error("TG_API_ID and TG_API_HASH must be set (environment or api.* config keys)");
        return false;
    }
    return true;
}

} // anonymous namespace

SystemInitializationResult initialize(const CommandLineOptions& options) {
    SystemInitializationResult initialization_result;

    try {
        // Initialize minimal logging context early - required before any logging calls
        auto early_logging_context = std::make_shared<LoggingContext>();
        set_logging_context(*early_logging_context);

        // Load system configuration (may call log_message during loading)
        Config::SystemConfig initial_config;
        int config_load_result = Config::load_system_config(initial_config, options.config_path);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error(std::string("Config load failed with result: ") + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }
        apply_command_line_overrides(initial_config, options);

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->logging_context = early_logging_context;

        // Validates configuration and installs the async logger
        initialization_result.logger = initialize_async_logger(initialization_result.system_state->config);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        throw;
    }

    return initialization_result;
}

void startup(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }

    try {
        system_state.logger_thread = std::thread(Threads::LoggingThread(logger, *system_state.logging_context, system_state.config.timing));
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(std::string("Failed to start logging thread: ") + exception_error.what());
        throw;
    }

    SystemLogs::log_api_status(Config::has_api_credentials(system_state.config.api), system_state.config.api.api_id);
}

int exit_code_for(const Core::RunResult& run_result) {
    return run_result.outcome == Core::RunOutcome::ERROR ? 1 : 0;
}

int run_command(SystemState& system_state) {
    const Config::RunConfig& run_config = system_state.config.run;
    SystemLogs::log_run_configuration(run_config.session, run_config.recipient,
                                      run_config.max_price_stars, run_config.poll_interval_sec);

    Core::RunController run_controller(system_state.config.api,
                                       API::make_gateway_client_factory(system_state.config.api),
                                       make_console_log_sink(),
                                       make_buyer_thread_initializer(system_state));

    SystemLogs::log_start_requested();
    Core::StartResult start_result = run_controller.start(run_config);
    if (!start_result.accepted) {
        return 1;
    }

    const std::chrono::milliseconds control_poll_interval(system_state.config.timing.control_poll_interval_ms);
    bool stop_requested = false;
    std::optional<Core::RunResult> run_result;

    while (!(run_result = run_controller.wait_for(start_result.handle, control_poll_interval))) {
        if (!stop_requested && system_state.shutdown_requested.load()) {
            SystemLogs::log_shutdown_signal_received();
            SystemLogs::log_stop_requested();
            run_controller.stop(start_result.handle);
            stop_requested = true;
        }
    }

    return exit_code_for(*run_result);
}

int balance_command(SystemState& system_state) {
    if (!require_api_credentials(system_state)) {
        return 1;
    }

    Core::BalanceCheck balance_check(API::make_gateway_client_factory(system_state.config.api), make_console_log_sink());
    std::optional<double> balance = balance_check.run(system_state.config.run.session);
    return balance ? 0 : 1;
}

int login_command(SystemState& system_state, const CommandLineOptions& options) {
    if (!require_api_credentials(system_state)) {
        return 1;
    }

    const std::string& session = system_state.config.run.session;
    try {
        API::SessionAuthenticator session_authenticator(system_state.config.api, session);

        std::string phone_number = options.phone_number;
        if (phone_number.empty()) {
            phone_number = read_console_line(system_state, "Phone number: ");
        }

        std::string phone_code_hash = session_authenticator.send_code(phone_number);
        SystemLogs::log_login_code_sent(phone_number);

        std::string phone_code = read_console_line(system_state, "Login code: ");
        API::SignInResult sign_in_result = session_authenticator.sign_in(phone_number, phone_code_hash, phone_code);

        if (sign_in_result == API::SignInResult::PASSWORD_REQUIRED) {
            SystemLogs::log_login_password_required();
            std::string password = read_console_line(system_state, "Password: ");
            session_authenticator.check_password(password);
        }

        SystemLogs::log_login_complete(session);
        return 0;
    } catch (const std::exception& exception_error) {
        SystemLogs::log_login_failed(exception_error.what());
        return 1;
    }
}

int execute_command(SystemState& system_state, const CommandLineOptions& options) {
    SystemLogs::log_startup(to_string(options.command), options.config_path);
    switch (options.command) {
        case CommandKind::BALANCE:
            return balance_command(system_state);
        case CommandKind::LOGIN:
            return login_command(system_state, options);
        case CommandKind::RUN:
        default:
            return run_command(system_state);
    }
}

void shutdown(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    try {
        if (logger) {
            logger->stop();
        }
        if (system_state.logger_thread.joinable()) {
            system_state.logger_thread.join();
        }
        // Later lines go straight to the console
        if (system_state.logging_context) {
            system_state.logging_context->async_logger.reset();
        }
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_shutdown_error(exception_error.what());
    }
}

} // namespace System
} // namespace GiftSniper
