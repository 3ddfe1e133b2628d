#include "gateway_transport.hpp"
#include "api/gateway/gateway_schema.hpp"
#include "api/general/platform_errors.hpp"
#include "utils/http_utils.hpp"
#include <chrono>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace GiftSniper {
namespace API {

namespace {

constexpr long HTTP_UNAUTHORIZED = 401;

const char* const AUTHORIZATION_ERROR_MESSAGES[] = {
    "AUTH_KEY_UNREGISTERED",
    "AUTH_KEY_INVALID",
    "SESSION_REVOKED",
    "SESSION_EXPIRED",
    "USER_DEACTIVATED"
};

} // anonymous namespace

GatewayTransport::GatewayTransport(const Config::ApiConfig& api_config_ref, const std::string& session_name,
                                   Core::CancellationSignal* cancellation_signal_ptr)
    : config(api_config_ref), session(session_name), cancellation_signal(cancellation_signal_ptr) {
    if (config.gateway_url.empty()) {
        throw std::runtime_error("Gateway URL is required but not provided");
    }
}

bool GatewayTransport::is_authorization_error(const std::string& error_message) {
    for (const char* authorization_message : AUTHORIZATION_ERROR_MESSAGES) {
        if (error_message == authorization_message) {
            return true;
        }
    }
    return false;
}

std::string GatewayTransport::build_method_url(const std::string& method_name) const {
    std::string method_url = config.gateway_url;
    if (!method_url.empty() && method_url.back() == '/') {
        method_url.pop_back();
    }
    return method_url + "/" + method_name;
}

json GatewayTransport::call(const std::string& method_name, const json& request_body, CallMode call_mode) const {
    const bool cancellable = cancellation_signal && call_mode == CallMode::CANCELLABLE;
    if (cancellable && cancellation_signal->is_requested()) {
        throw OperationCancelledError(method_name + ": cancelled before the request was sent");
    }

    std::vector<std::string> request_headers = {
        "X-Api-Id: " + std::to_string(config.api_id),
        "X-Api-Hash: " + config.api_hash,
        "X-Session: " + session
    };

    HttpUtils::HttpRequest http_request(build_method_url(method_name), request_headers, request_body.dump(),
                                        config.retry_count, config.timeout_seconds,
                                        config.enable_ssl_verification, config.retry_delay_ms);
    if (cancellable) {
        Core::CancellationSignal* signal = cancellation_signal;
        http_request.abort_check = [signal](std::chrono::milliseconds wait_duration) {
            return signal->wait_for(wait_duration);
        };
    }

    HttpUtils::HttpResponse http_response;
    try {
        http_response = HttpUtils::http_post_json(http_request);
    } catch (const HttpUtils::HttpAbortedError& aborted_exception_error) {
        throw OperationCancelledError(method_name + ": " + aborted_exception_error.what());
    } catch (const std::runtime_error& transport_exception_error) {
        throw PlatformError(method_name + ": " + transport_exception_error.what());
    }

    if (!http_response.is_success()) {
        GatewayErrorBody error_body;
        bool has_error_body = GatewaySchema::parse_error_body(http_response.body, error_body);
        std::string remote_error = has_error_body ? error_body.error_message : "";
        std::string error_message = has_error_body
            ? error_body.error_message
            : "HTTP " + std::to_string(http_response.status_code);

        if (http_response.status_code == HTTP_UNAUTHORIZED || is_authorization_error(remote_error)) {
            throw AuthRequiredError(method_name + ": " + error_message, remote_error);
        }
        throw PlatformError(method_name + ": " + error_message, remote_error);
    }

    json response_json = json::parse(http_response.body, nullptr, false);
    if (response_json.is_discarded()) {
        throw PlatformError(method_name + ": response is not valid JSON");
    }
    return response_json;
}

} // namespace API
} // namespace GiftSniper
