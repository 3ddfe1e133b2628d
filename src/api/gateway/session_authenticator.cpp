#include "session_authenticator.hpp"
#include "api/gateway/gateway_schema.hpp"
#include "api/general/platform_errors.hpp"

using json = nlohmann::json;

namespace GiftSniper {
namespace API {

namespace {

constexpr const char* PASSWORD_NEEDED_ERROR = "SESSION_PASSWORD_NEEDED";

} // anonymous namespace

SessionAuthenticator::SessionAuthenticator(const Config::ApiConfig& api_config, const std::string& session_name)
    : transport(api_config, session_name) {}

std::string SessionAuthenticator::send_code(const std::string& phone_number) {
    if (phone_number.empty()) {
        throw PlatformError("Phone number is required to request a login code");
    }
    json response_json = transport.call(GatewayMethods::SEND_CODE, GatewaySchema::build_send_code_request(phone_number));
    return GatewaySchema::parse_sent_code(response_json);
}

SignInResult SessionAuthenticator::sign_in(const std::string& phone_number, const std::string& phone_code_hash,
                                           const std::string& phone_code) {
    json response_json;
    try {
        response_json = transport.call(GatewayMethods::SIGN_IN,
                                       GatewaySchema::build_sign_in_request(phone_number, phone_code_hash, phone_code));
    } catch (const PlatformError& platform_exception_error) {
        if (platform_exception_error.get_remote_error() == PASSWORD_NEEDED_ERROR) {
            return SignInResult::PASSWORD_REQUIRED;
        }
        throw;
    }

    if (!GatewaySchema::parse_authorization(response_json)) {
        throw PlatformError("No account is registered for " + phone_number);
    }
    return SignInResult::AUTHORIZED;
}

void SessionAuthenticator::check_password(const std::string& password) {
    json response_json = transport.call(GatewayMethods::CHECK_PASSWORD, GatewaySchema::build_check_password_request(password));
    if (!GatewaySchema::parse_authorization(response_json)) {
        throw PlatformError("Password accepted but the account is not authorized");
    }
}

} // namespace API
} // namespace GiftSniper
