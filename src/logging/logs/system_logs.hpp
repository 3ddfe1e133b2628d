#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

namespace GiftSniper {
namespace Logging {

/**
 * Specialized logging for the control surface and system management.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_startup(const std::string& command_name, const std::string& config_path);
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);

    // Configuration
    static void log_run_configuration(const std::string& session, const std::string& recipient,
                                      int max_price_stars, int poll_interval_sec);
    static void log_api_status(bool credentials_present, long long api_id);

    // Run control
    static void log_start_requested();
    static void log_stop_requested();
    static void log_shutdown_signal_received();

    // Logging thread
    static void log_logging_thread_exception(const std::string& error_message);

    // Login command
    static void log_login_code_sent(const std::string& phone_number);
    static void log_login_password_required();
    static void log_login_complete(const std::string& session);
    static void log_login_failed(const std::string& error_message);
};

} // namespace Logging
} // namespace GiftSniper

#endif // SYSTEM_LOGS_HPP
