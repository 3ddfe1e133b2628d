#ifndef GATEWAY_SCHEMA_HPP
#define GATEWAY_SCHEMA_HPP

#include "trader/data_structures/data_structures.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace GiftSniper {
namespace API {

// Remote method names relayed by the gateway
namespace GatewayMethods {
constexpr const char* GET_STARS_STATUS = "payments.getStarsStatus";
constexpr const char* GET_STAR_GIFTS = "payments.getStarGifts";
constexpr const char* GET_PAYMENT_FORM = "payments.getPaymentForm";
constexpr const char* SEND_STARS_FORM = "payments.sendStarsForm";
constexpr const char* GET_INPUT_ENTITY = "contacts.getInputEntity";
constexpr const char* SEND_CODE = "auth.sendCode";
constexpr const char* SIGN_IN = "auth.signIn";
constexpr const char* CHECK_PASSWORD = "auth.checkPassword";
} // namespace GatewayMethods

// Error reported by the gateway in a non-2xx body
struct GatewayErrorBody {
    int error_code = 0;
    std::string error_message;
};

/**
 * JSON shapes exchanged with the gateway. Objects carry their type name in
 * the "_" field.
 *
 * Parsers throw PlatformError when a required field is missing or has the
 * wrong type. Optional fields map to std::optional.
 */
class GatewaySchema {
public:
    // Requests
    static nlohmann::json build_input_peer(const Core::PeerRef& peer);
    static nlohmann::json build_stars_status_request(const Core::PeerRef& peer);
    static nlohmann::json build_catalog_request(std::int64_t continuation_hash);
    static nlohmann::json build_star_gift_invoice(const Core::PeerRef& recipient, std::int64_t offer_id);
    static nlohmann::json build_payment_form_request(const Core::PeerRef& recipient, std::int64_t offer_id);
    static nlohmann::json build_send_stars_form_request(const Core::PaymentForm& payment_form);
    static nlohmann::json build_input_entity_request(const std::string& recipient);
    static nlohmann::json build_send_code_request(const std::string& phone_number);
    static nlohmann::json build_sign_in_request(const std::string& phone_number, const std::string& phone_code_hash,
                                                const std::string& phone_code);
    static nlohmann::json build_check_password_request(const std::string& password);

    // Responses
    static Core::StarsAmount parse_stars_amount(const nlohmann::json& amount_json);
    static Core::StarsAmount parse_stars_status(const nlohmann::json& response_json);
    static Core::CatalogResponse parse_catalog(const nlohmann::json& response_json);
    static Core::Offer parse_offer(const nlohmann::json& gift_json);
    static Core::PeerRef parse_input_peer(const nlohmann::json& peer_json);
    static Core::PaymentForm parse_payment_form(const nlohmann::json& response_json,
                                                const Core::PeerRef& recipient, std::int64_t offer_id);
    static Core::SubmissionResult parse_submission_result(const nlohmann::json& response_json);
    static std::string parse_sent_code(const nlohmann::json& response_json);
    static bool parse_authorization(const nlohmann::json& response_json);

    // Errors; false when the body is not a gateway error object
    static bool parse_error_body(const std::string& response_body, GatewayErrorBody& error_body);

    static std::string type_name_of(const nlohmann::json& object_json);
};

} // namespace API
} // namespace GiftSniper

#endif // GATEWAY_SCHEMA_HPP
