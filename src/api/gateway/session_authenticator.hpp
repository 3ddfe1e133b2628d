#ifndef SESSION_AUTHENTICATOR_HPP
#define SESSION_AUTHENTICATOR_HPP

#include "api/gateway/gateway_transport.hpp"
#include "configs/api_config.hpp"
#include <string>

namespace GiftSniper {
namespace API {

enum class SignInResult {
    AUTHORIZED,
    PASSWORD_REQUIRED   // Two-step verification enabled; call check_password next
};

/**
 * Interactive login of a gateway session. Runs only from the console login
 * command, never from an acquisition run.
 */
class SessionAuthenticator {
public:
    SessionAuthenticator(const Config::ApiConfig& api_config, const std::string& session_name);

    // Returns the phone code hash to pass back to sign_in.
    std::string send_code(const std::string& phone_number);

    SignInResult sign_in(const std::string& phone_number, const std::string& phone_code_hash,
                         const std::string& phone_code);

    void check_password(const std::string& password);

private:
    GatewayTransport transport;
};

} // namespace API
} // namespace GiftSniper

#endif // SESSION_AUTHENTICATOR_HPP
