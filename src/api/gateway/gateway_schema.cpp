#include "gateway_schema.hpp"
#include "api/general/platform_errors.hpp"
#include <cmath>

using json = nlohmann::json;

namespace GiftSniper {
namespace API {

namespace {

const json& require_field(const json& object_json, const char* field_name, const std::string& context) {
    if (!object_json.is_object() || !object_json.contains(field_name) || object_json[field_name].is_null()) {
        throw PlatformError("Malformed " + context + ": missing field '" + field_name + "'");
    }
    return object_json[field_name];
}

std::int64_t require_int64(const json& object_json, const char* field_name, const std::string& context) {
    const json& field_json = require_field(object_json, field_name, context);
    if (!field_json.is_number_integer()) {
        throw PlatformError("Malformed " + context + ": field '" + field_name + "' is not an integer");
    }
    return field_json.get<std::int64_t>();
}

std::optional<std::int64_t> optional_int64(const json& object_json, const char* field_name) {
    if (!object_json.contains(field_name) || !object_json[field_name].is_number_integer()) {
        return std::nullopt;
    }
    return object_json[field_name].get<std::int64_t>();
}

bool optional_flag(const json& object_json, const char* field_name) {
    if (!object_json.contains(field_name) || !object_json[field_name].is_boolean()) {
        return false;
    }
    return object_json[field_name].get<bool>();
}

} // anonymous namespace

std::string GatewaySchema::type_name_of(const json& object_json) {
    if (!object_json.is_object() || !object_json.contains("_") || !object_json["_"].is_string()) {
        return "";
    }
    return object_json["_"].get<std::string>();
}

// =============================================================================
// REQUESTS
// =============================================================================

json GatewaySchema::build_input_peer(const Core::PeerRef& peer) {
    switch (peer.kind) {
        case Core::PeerKind::USER:
            return json{{"_", "InputPeerUser"}, {"user_id", peer.id}, {"access_hash", peer.access_hash}};
        case Core::PeerKind::CHAT:
            return json{{"_", "InputPeerChat"}, {"chat_id", peer.id}};
        case Core::PeerKind::CHANNEL:
            return json{{"_", "InputPeerChannel"}, {"channel_id", peer.id}, {"access_hash", peer.access_hash}};
        case Core::PeerKind::SELF:
        default:
            return json{{"_", "InputPeerSelf"}};
    }
}

json GatewaySchema::build_stars_status_request(const Core::PeerRef& peer) {
    return json{{"peer", build_input_peer(peer)}};
}

json GatewaySchema::build_catalog_request(std::int64_t continuation_hash) {
    return json{{"hash", continuation_hash}};
}

json GatewaySchema::build_star_gift_invoice(const Core::PeerRef& recipient, std::int64_t offer_id) {
    return json{{"_", "InputInvoiceStarGift"}, {"peer", build_input_peer(recipient)}, {"gift_id", offer_id}};
}

json GatewaySchema::build_payment_form_request(const Core::PeerRef& recipient, std::int64_t offer_id) {
    return json{{"invoice", build_star_gift_invoice(recipient, offer_id)}};
}

json GatewaySchema::build_send_stars_form_request(const Core::PaymentForm& payment_form) {
    return json{
        {"form_id", payment_form.form_id},
        {"invoice", build_star_gift_invoice(payment_form.recipient, payment_form.offer_id)}
    };
}

json GatewaySchema::build_input_entity_request(const std::string& recipient) {
    return json{{"peer", recipient}};
}

json GatewaySchema::build_send_code_request(const std::string& phone_number) {
    return json{{"phone_number", phone_number}};
}

json GatewaySchema::build_sign_in_request(const std::string& phone_number, const std::string& phone_code_hash,
                                          const std::string& phone_code) {
    return json{{"phone_number", phone_number}, {"phone_code_hash", phone_code_hash}, {"phone_code", phone_code}};
}

json GatewaySchema::build_check_password_request(const std::string& password) {
    return json{{"password", password}};
}

// =============================================================================
// RESPONSES
// =============================================================================

Core::StarsAmount GatewaySchema::parse_stars_amount(const json& amount_json) {
    Core::StarsAmount stars_amount;

    if (amount_json.is_null()) {
        return stars_amount;
    }
    if (amount_json.is_number_integer()) {
        stars_amount.amount = amount_json.get<std::int64_t>();
        return stars_amount;
    }
    if (amount_json.is_number_float()) {
        double amount_value = amount_json.get<double>();
        double whole_stars = std::floor(amount_value);
        stars_amount.amount = static_cast<std::int64_t>(whole_stars);
        stars_amount.nanos = static_cast<std::int32_t>(std::llround((amount_value - whole_stars) * Core::NANOS_PER_STAR));
        return stars_amount;
    }
    if (amount_json.is_object()) {
        stars_amount.amount = require_int64(amount_json, "amount", "StarsAmount");
        std::optional<std::int64_t> nanos_value = optional_int64(amount_json, "nanos");
        if (nanos_value) {
            stars_amount.nanos = static_cast<std::int32_t>(*nanos_value);
        }
        return stars_amount;
    }
    throw PlatformError("Malformed StarsAmount: unsupported JSON type");
}

Core::StarsAmount GatewaySchema::parse_stars_status(const json& response_json) {
    if (!response_json.is_object()) {
        throw PlatformError("Malformed payments.StarsStatus: not an object");
    }
    // An absent balance reads as zero stars
    if (!response_json.contains("balance")) {
        return Core::StarsAmount{};
    }
    return parse_stars_amount(response_json["balance"]);
}

Core::CatalogResponse GatewaySchema::parse_catalog(const json& response_json) {
    std::string type_name = type_name_of(response_json);

    if (type_name == "payments.StarGiftsNotModified") {
        return Core::CatalogResponse::not_modified();
    }
    if (type_name != "payments.StarGifts") {
        throw PlatformError("Unexpected catalog response type: " + (type_name.empty() ? std::string("<none>") : type_name));
    }

    Core::CatalogSnapshot catalog_snapshot;
    std::optional<std::int64_t> hash_value = optional_int64(response_json, "hash");
    catalog_snapshot.hash = hash_value ? *hash_value : 0;

    const json& gifts_json = require_field(response_json, "gifts", "payments.StarGifts");
    if (!gifts_json.is_array()) {
        throw PlatformError("Malformed payments.StarGifts: 'gifts' is not an array");
    }

    for (const json& gift_json : gifts_json) {
        // Other gift kinds are not sold from the catalog
        if (type_name_of(gift_json) != "StarGift") {
            continue;
        }
        catalog_snapshot.offers.push_back(parse_offer(gift_json));
    }

    return Core::CatalogResponse::from_snapshot(std::move(catalog_snapshot));
}

Core::Offer GatewaySchema::parse_offer(const json& gift_json) {
    Core::Offer offer;
    offer.id = require_int64(gift_json, "id", "StarGift");
    offer.price = Core::stars_value(parse_stars_amount(require_field(gift_json, "stars", "StarGift")));
    offer.limited = optional_flag(gift_json, "limited");
    offer.sold_out = optional_flag(gift_json, "sold_out");
    offer.availability_remains = optional_int64(gift_json, "availability_remains");
    offer.availability_total = optional_int64(gift_json, "availability_total");
    if (gift_json.contains("title") && gift_json["title"].is_string()) {
        offer.title = gift_json["title"].get<std::string>();
    }
    return offer;
}

Core::PeerRef GatewaySchema::parse_input_peer(const json& peer_json) {
    std::string type_name = type_name_of(peer_json);
    Core::PeerRef peer;

    if (type_name == "InputPeerSelf") {
        return Core::PeerRef::self();
    }
    if (type_name == "InputPeerUser") {
        peer.kind = Core::PeerKind::USER;
        peer.id = require_int64(peer_json, "user_id", type_name);
        peer.access_hash = require_int64(peer_json, "access_hash", type_name);
        return peer;
    }
    if (type_name == "InputPeerChat") {
        peer.kind = Core::PeerKind::CHAT;
        peer.id = require_int64(peer_json, "chat_id", type_name);
        return peer;
    }
    if (type_name == "InputPeerChannel") {
        peer.kind = Core::PeerKind::CHANNEL;
        peer.id = require_int64(peer_json, "channel_id", type_name);
        peer.access_hash = require_int64(peer_json, "access_hash", type_name);
        return peer;
    }
    throw PlatformError("Cannot send gifts to peer of type: " + (type_name.empty() ? std::string("<none>") : type_name));
}

Core::PaymentForm GatewaySchema::parse_payment_form(const json& response_json,
                                                    const Core::PeerRef& recipient, std::int64_t offer_id) {
    Core::PaymentForm payment_form;
    payment_form.type_name = type_name_of(response_json);
    payment_form.recipient = recipient;
    payment_form.offer_id = offer_id;

    if (payment_form.type_name == "payments.PaymentFormStarGift") {
        payment_form.kind = Core::PaymentFormKind::STAR_GIFT;
    } else if (payment_form.type_name == "payments.PaymentFormStars") {
        payment_form.kind = Core::PaymentFormKind::STARS;
    } else {
        payment_form.kind = Core::PaymentFormKind::UNEXPECTED;
        if (payment_form.type_name.empty()) {
            payment_form.type_name = "<none>";
        }
        return payment_form;
    }

    payment_form.form_id = require_int64(response_json, "form_id", payment_form.type_name);
    return payment_form;
}

Core::SubmissionResult GatewaySchema::parse_submission_result(const json& response_json) {
    std::string type_name = type_name_of(response_json);
    Core::SubmissionResult submission_result;

    if (type_name == "payments.PaymentResult") {
        return submission_result;
    }
    if (type_name == "payments.PaymentVerificationNeeded") {
        submission_result.verification_needed = true;
        const json& url_json = require_field(response_json, "url", type_name);
        if (!url_json.is_string()) {
            throw PlatformError("Malformed payments.PaymentVerificationNeeded: 'url' is not a string");
        }
        submission_result.verification_url = url_json.get<std::string>();
        return submission_result;
    }
    throw PlatformError("Unexpected payment result type: " + (type_name.empty() ? std::string("<none>") : type_name));
}

std::string GatewaySchema::parse_sent_code(const json& response_json) {
    const json& hash_json = require_field(response_json, "phone_code_hash", "auth.SentCode");
    if (!hash_json.is_string()) {
        throw PlatformError("Malformed auth.SentCode: 'phone_code_hash' is not a string");
    }
    return hash_json.get<std::string>();
}

bool GatewaySchema::parse_authorization(const json& response_json) {
    std::string type_name = type_name_of(response_json);
    if (type_name == "auth.Authorization") {
        return true;
    }
    if (type_name == "auth.AuthorizationSignUpRequired") {
        return false;
    }
    throw PlatformError("Unexpected authorization response type: " + (type_name.empty() ? std::string("<none>") : type_name));
}

bool GatewaySchema::parse_error_body(const std::string& response_body, GatewayErrorBody& error_body) {
    json error_json = json::parse(response_body, nullptr, false);
    if (error_json.is_discarded() || !error_json.is_object()) {
        return false;
    }
    if (!error_json.contains("error_message") || !error_json["error_message"].is_string()) {
        return false;
    }
    error_body.error_message = error_json["error_message"].get<std::string>();
    if (error_json.contains("error_code") && error_json["error_code"].is_number_integer()) {
        error_body.error_code = error_json["error_code"].get<int>();
    }
    return true;
}

} // namespace API
} // namespace GiftSniper
