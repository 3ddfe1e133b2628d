#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <iostream>

namespace GiftSniper {
namespace Logging {

void SystemLogs::log_startup(const std::string& command_name, const std::string& config_path) {
    log_message("gift_sniper " + command_name + " (config: " + config_path + ")");
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message);
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message);
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message);
}

void SystemLogs::log_run_configuration(const std::string& session, const std::string& recipient,
                                       int max_price_stars, int poll_interval_sec) {
    log_message("Session: " + session + " | Recipient: " + recipient +
                " | Max price: " + std::to_string(max_price_stars) + " stars" +
                " | Poll interval: " + std::to_string(poll_interval_sec) + "s");
}

void SystemLogs::log_api_status(bool credentials_present, long long api_id) {
    if (credentials_present) {
        log_message("API status: TG_API_ID=" + std::to_string(api_id) + ", TG_API_HASH=*** ok");
    } else {
        log_message("API status: TG_API_ID / TG_API_HASH are not set");
    }
}

void SystemLogs::log_start_requested() {
    log_message("Starting gift buyer...");
}

void SystemLogs::log_stop_requested() {
    log_message("Stop requested...");
}

void SystemLogs::log_shutdown_signal_received() {
    log_message("Shutdown signal received");
}

void SystemLogs::log_logging_thread_exception(const std::string& error_message) {
    std::cerr << "LoggingThread exception: " << error_message << std::endl;
}

void SystemLogs::log_login_code_sent(const std::string& phone_number) {
    log_message("Login code sent to " + phone_number);
}

void SystemLogs::log_login_password_required() {
    log_message("Two-step verification is enabled for this account");
}

void SystemLogs::log_login_complete(const std::string& session) {
    log_message("Authorization complete for session " + session + ". Restart the buyer.");
}

void SystemLogs::log_login_failed(const std::string& error_message) {
    log_message("Login failed: " + error_message);
}

} // namespace Logging
} // namespace GiftSniper
