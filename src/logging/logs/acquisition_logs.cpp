#include "acquisition_logs.hpp"
#include <iostream>

namespace GiftSniper {
namespace Logging {

using Core::format_stars;

AcquisitionLogs::AcquisitionLogs(LogSink log_sink) : sink(std::move(log_sink)) {}

void AcquisitionLogs::emit(const std::string& line) {
    if (!sink) {
        std::cerr << line << std::endl;
        return;
    }
    sink(line);
}

void AcquisitionLogs::log_balance(double balance) {
    emit("Balance: " + format_stars(balance) + " stars");
}

void AcquisitionLogs::log_recipient(const std::string& recipient) {
    emit("Recipient: " + recipient);
}

void AcquisitionLogs::log_auth_required() {
    emit("Authorization required: run `gift_sniper login` for this session, then restart the buyer.");
}

void AcquisitionLogs::log_session_rejected(const std::string& error_message) {
    emit("Session rejected by the service (" + error_message + "): run `gift_sniper login`, then restart the buyer.");
}

void AcquisitionLogs::log_setup_error(const std::string& error_message) {
    emit("Setup failed: " + error_message);
}

void AcquisitionLogs::log_catalog_fetch_error(const std::string& error_message) {
    emit("Failed to fetch the gift catalog: " + error_message);
}

void AcquisitionLogs::log_balance_fetch_error(const std::string& error_message) {
    emit("Failed to read the balance: " + error_message);
}

void AcquisitionLogs::log_insufficient_balance(std::int64_t offer_id, double balance, double price) {
    emit("Skipping gift " + std::to_string(offer_id) + ": not enough stars (" +
         format_stars(balance) + " < " + format_stars(price) + ")");
}

void AcquisitionLogs::log_payment_form_error(std::int64_t offer_id, const std::string& error_message) {
    emit("Payment form error for gift " + std::to_string(offer_id) + ": " + error_message);
}

void AcquisitionLogs::log_unexpected_form_type(std::int64_t offer_id, const std::string& type_name) {
    emit("Unexpected payment form type for gift " + std::to_string(offer_id) + ": " + type_name);
}

void AcquisitionLogs::log_payment_error(std::int64_t offer_id, const std::string& error_message) {
    emit("Payment failed for gift " + std::to_string(offer_id) + ": " + error_message);
}

void AcquisitionLogs::log_payment_verification_required(std::int64_t offer_id, const std::string& verification_url) {
    emit("Payment for gift " + std::to_string(offer_id) + " requires verification at " + verification_url + ", skipped");
}

void AcquisitionLogs::log_purchase_success(std::int64_t offer_id, double price) {
    emit("Purchased gift " + std::to_string(offer_id) + " for " + format_stars(price) + " stars");
}

void AcquisitionLogs::log_cancelled() {
    emit("Cancellation observed, stopping.");
}

void AcquisitionLogs::log_run_finished(const Core::RunResult& run_result) {
    std::string line = std::string("Run finished: ") + Core::to_string(run_result.outcome);
    if (!run_result.reason.empty()) {
        line += " (" + run_result.reason + ")";
    }
    emit(line);
}

void AcquisitionLogs::log_start_rejected(const std::string& notice) {
    emit("Start rejected: " + notice);
}

void AcquisitionLogs::log_run_exception(const std::string& error_message) {
    emit("Run aborted by unexpected error: " + error_message);
}

void AcquisitionLogs::log_background_task_finished() {
    emit("Background task finished.");
}

void AcquisitionLogs::log_session_close_error(const std::string& error_message) {
    emit("Failed to close the session: " + error_message);
}

void AcquisitionLogs::log_balance_check_error(const std::string& error_message) {
    emit("Failed to get the balance: " + error_message);
}

} // namespace Logging
} // namespace GiftSniper
