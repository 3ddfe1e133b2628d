// main.cpp
#include "system/command_line.hpp"
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include "utils/http_utils.hpp"
#include <atomic>
#include <csignal>
#include <iostream>

using namespace GiftSniper::System;

namespace {

// Written from the signal handler, so only lock-free atomics live here
std::atomic<bool> signal_received{false};
std::atomic<SystemState*> signalled_system_state{nullptr};

static_assert(std::atomic<SystemState*>::is_always_lock_free, "signal handler needs a lock-free state pointer");

void handle_shutdown_signal(int signal_number) {
    if (signal_number != SIGINT && signal_number != SIGTERM) {
        return;
    }
    signal_received.store(true);
    SystemState* system_state = signalled_system_state.load();
    if (system_state) {
        system_state->shutdown_requested.store(true);
    }
}

// libcurl globals live exactly as long as main's work
class HttpGlobalsGuard {
public:
    HttpGlobalsGuard() { GiftSniper::HttpUtils::initialize_http_globals(); }
    ~HttpGlobalsGuard() { GiftSniper::HttpUtils::cleanup_http_globals(); }

    HttpGlobalsGuard(const HttpGlobalsGuard&) = delete;
    HttpGlobalsGuard& operator=(const HttpGlobalsGuard&) = delete;
};

int run_application(const CommandLineOptions& options) {
    HttpGlobalsGuard http_globals;

    SystemInitializationResult initialization_result = initialize(options);
    SystemState& system_state = *initialization_result.system_state;

    signalled_system_state.store(&system_state);
    if (signal_received.load()) {
        system_state.shutdown_requested.store(true);
    }

    startup(system_state, initialization_result.logger);

    // Logging thread has to be joined on every path from here on
    int exit_code = 1;
    try {
        exit_code = execute_command(system_state, options);
    } catch (const std::exception& command_exception_error) {
        GiftSniper::Logging::SystemLogs::log_fatal_error(command_exception_error.what());
    }

    shutdown(system_state, initialization_result.logger);
    signalled_system_state.store(nullptr);
    return exit_code;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CommandLineParseResult parse_result = parse_command_line(argc, argv);
    if (parse_result.should_exit) {
        return parse_result.exit_code;
    }

    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);

    try {
        return run_application(parse_result.options);
    } catch (const std::exception& exception_error) {
        std::cerr << (signal_received.load() ? "Fatal error during shutdown: " : "Fatal error: ")
                  << exception_error.what() << std::endl;
        return 1;
    }
}
