#ifndef ACQUISITION_LOGS_HPP
#define ACQUISITION_LOGS_HPP

#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <cstdint>
#include <string>

namespace GiftSniper {
namespace Logging {

/**
 * Lines emitted by an acquisition run. Lines carry no timestamp; the sink
 * supplied by the control surface adds one.
 */
class AcquisitionLogs {
public:
    explicit AcquisitionLogs(LogSink sink);

    // Setup
    void log_balance(double balance);
    void log_recipient(const std::string& recipient);
    void log_auth_required();
    void log_session_rejected(const std::string& error_message);
    void log_setup_error(const std::string& error_message);

    // Polling
    void log_catalog_fetch_error(const std::string& error_message);
    void log_balance_fetch_error(const std::string& error_message);
    void log_insufficient_balance(std::int64_t offer_id, double balance, double price);

    // Purchase
    void log_payment_form_error(std::int64_t offer_id, const std::string& error_message);
    void log_unexpected_form_type(std::int64_t offer_id, const std::string& type_name);
    void log_payment_error(std::int64_t offer_id, const std::string& error_message);
    void log_payment_verification_required(std::int64_t offer_id, const std::string& verification_url);
    void log_purchase_success(std::int64_t offer_id, double price);

    // Termination
    void log_cancelled();
    void log_run_finished(const Core::RunResult& run_result);

    // Run control
    void log_start_rejected(const std::string& notice);
    void log_run_exception(const std::string& error_message);
    void log_background_task_finished();
    void log_session_close_error(const std::string& error_message);

    // Balance check outside a run
    void log_balance_check_error(const std::string& error_message);

private:
    LogSink sink;

    void emit(const std::string& line);
};

} // namespace Logging
} // namespace GiftSniper

#endif // ACQUISITION_LOGS_HPP
