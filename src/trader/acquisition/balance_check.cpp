#include "balance_check.hpp"
#include "logging/logs/acquisition_logs.hpp"
#include <utility>

namespace GiftSniper {
namespace Core {

BalanceCheck::BalanceCheck(API::PlatformClientFactory platform_client_factory, Logging::LogSink log_sink_value)
    : client_factory(std::move(platform_client_factory)), log_sink(std::move(log_sink_value)) {}

std::optional<double> BalanceCheck::run(const std::string& session) {
    Logging::AcquisitionLogs acquisition_logs(log_sink);

    try {
        API::PlatformClientPtr platform_client = client_factory(session, nullptr);
        if (!platform_client) {
            acquisition_logs.log_balance_check_error("platform client factory returned no client");
            return std::nullopt;
        }

        if (platform_client->try_open() == API::SessionStatus::AUTH_REQUIRED) {
            acquisition_logs.log_auth_required();
            return std::nullopt;
        }

        double balance = stars_value(platform_client->get_balance(PeerRef::self()));
        acquisition_logs.log_balance(balance);

        try {
            platform_client->close();
        } catch (const API::PlatformError& close_exception_error) {
            acquisition_logs.log_session_close_error(close_exception_error.what());
        }
        return balance;
    } catch (const API::AuthRequiredError&) {
        acquisition_logs.log_auth_required();
        return std::nullopt;
    } catch (const std::exception& exception_error) {
        acquisition_logs.log_balance_check_error(exception_error.what());
        return std::nullopt;
    }
}

} // namespace Core
} // namespace GiftSniper
