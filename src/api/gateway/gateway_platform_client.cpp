#include "gateway_platform_client.hpp"
#include "api/gateway/gateway_schema.hpp"
#include <memory>

using json = nlohmann::json;

namespace GiftSniper {
namespace API {

GatewayPlatformClient::GatewayPlatformClient(const Config::ApiConfig& api_config, const std::string& session_name,
                                             Core::CancellationSignal* cancellation_signal)
    : transport(api_config, session_name, cancellation_signal), opened(false) {}

GatewayPlatformClient::~GatewayPlatformClient() {
    close();
}

SessionStatus GatewayPlatformClient::try_open() {
    try {
        // Any authorized call proves the session; the stars status is the cheapest one
        transport.call(GatewayMethods::GET_STARS_STATUS, GatewaySchema::build_stars_status_request(Core::PeerRef::self()));
    } catch (const AuthRequiredError&) {
        opened = false;
        return SessionStatus::AUTH_REQUIRED;
    }
    opened = true;
    return SessionStatus::OPENED;
}

void GatewayPlatformClient::close() {
    opened = false;
}

void GatewayPlatformClient::require_open(const char* operation_name) const {
    if (!opened) {
        throw PlatformError(std::string(operation_name) + ": session " + transport.get_session() + " is not open");
    }
}

Core::StarsAmount GatewayPlatformClient::get_balance(const Core::PeerRef& peer) {
    require_open(GatewayMethods::GET_STARS_STATUS);
    json response_json = transport.call(GatewayMethods::GET_STARS_STATUS, GatewaySchema::build_stars_status_request(peer));
    return GatewaySchema::parse_stars_status(response_json);
}

Core::PeerRef GatewayPlatformClient::resolve_recipient(const std::string& recipient) {
    require_open(GatewayMethods::GET_INPUT_ENTITY);
    json response_json = transport.call(GatewayMethods::GET_INPUT_ENTITY, GatewaySchema::build_input_entity_request(recipient));
    return GatewaySchema::parse_input_peer(response_json);
}

Core::CatalogResponse GatewayPlatformClient::get_catalog(std::int64_t continuation_hash) {
    require_open(GatewayMethods::GET_STAR_GIFTS);
    json response_json = transport.call(GatewayMethods::GET_STAR_GIFTS, GatewaySchema::build_catalog_request(continuation_hash));
    return GatewaySchema::parse_catalog(response_json);
}

Core::PaymentForm GatewayPlatformClient::create_payment_form(const Core::PeerRef& recipient, std::int64_t offer_id) {
    require_open(GatewayMethods::GET_PAYMENT_FORM);
    json response_json = transport.call(GatewayMethods::GET_PAYMENT_FORM,
                                        GatewaySchema::build_payment_form_request(recipient, offer_id));
    return GatewaySchema::parse_payment_form(response_json, recipient, offer_id);
}

Core::SubmissionResult GatewayPlatformClient::submit_payment_form(const Core::PaymentForm& payment_form) {
    require_open(GatewayMethods::SEND_STARS_FORM);
    // An in-flight payment is never abandoned
    json response_json = transport.call(GatewayMethods::SEND_STARS_FORM,
                                        GatewaySchema::build_send_stars_form_request(payment_form),
                                        GatewayTransport::CallMode::RUN_TO_COMPLETION);
    return GatewaySchema::parse_submission_result(response_json);
}

PlatformClientFactory make_gateway_client_factory(const Config::ApiConfig& api_config) {
    return [api_config](const std::string& session, Core::CancellationSignal* cancellation_signal) -> PlatformClientPtr {
        return std::make_unique<GatewayPlatformClient>(api_config, session, cancellation_signal);
    };
}

} // namespace API
} // namespace GiftSniper
