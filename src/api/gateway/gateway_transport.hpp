#ifndef GATEWAY_TRANSPORT_HPP
#define GATEWAY_TRANSPORT_HPP

#include "configs/api_config.hpp"
#include "trader/acquisition/cancellation_signal.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace GiftSniper {
namespace API {

/**
 * Authenticated JSON calls to the gateway for one session.
 *
 * call() returns the parsed response object or throws: AuthRequiredError when
 * the session is not (or no longer) authorized, PlatformError for every other
 * failure including transport errors and unparseable bodies. With a
 * cancellation signal attached, CANCELLABLE calls throw OperationCancelledError
 * as soon as the signal is set, even mid-transfer or between retries.
 */
class GatewayTransport {
public:
    enum class CallMode {
        CANCELLABLE,
        RUN_TO_COMPLETION
    };

    GatewayTransport(const Config::ApiConfig& api_config_ref, const std::string& session_name,
                     Core::CancellationSignal* cancellation_signal_ptr = nullptr);

    nlohmann::json call(const std::string& method_name, const nlohmann::json& request_body,
                        CallMode call_mode = CallMode::CANCELLABLE) const;

    const std::string& get_session() const { return session; }

    // Error messages that mean the stored session cannot be used.
    static bool is_authorization_error(const std::string& error_message);

private:
    Config::ApiConfig config;
    std::string session;
    Core::CancellationSignal* cancellation_signal;

    std::string build_method_url(const std::string& method_name) const;
};

} // namespace API
} // namespace GiftSniper

#endif // GATEWAY_TRANSPORT_HPP
