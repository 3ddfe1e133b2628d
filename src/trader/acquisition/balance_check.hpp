#ifndef BALANCE_CHECK_HPP
#define BALANCE_CHECK_HPP

#include "api/general/platform_client_interface.hpp"
#include "logging/logger/async_logger.hpp"
#include <optional>
#include <string>

namespace GiftSniper {
namespace Core {

/**
 * Reads the stars balance in a short-lived session of its own, never the
 * session held by an active run.
 */
class BalanceCheck {
public:
    BalanceCheck(API::PlatformClientFactory platform_client_factory, Logging::LogSink log_sink_value);

    // Empty on any failure; the cause is logged as one line.
    std::optional<double> run(const std::string& session);

private:
    API::PlatformClientFactory client_factory;
    Logging::LogSink log_sink;
};

} // namespace Core
} // namespace GiftSniper

#endif // BALANCE_CHECK_HPP
