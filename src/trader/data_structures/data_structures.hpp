#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace GiftSniper {
namespace Core {

// =============================================================================
// CURRENCY
// =============================================================================

/**
 * Stars amount as reported by the platform: whole stars plus a fractional
 * part in nanostars.
 */
struct StarsAmount {
    std::int64_t amount = 0;
    std::int32_t nanos = 0;
};

constexpr double NANOS_PER_STAR = 1000000000.0;

// Normalized decimal-equivalent quantity used for every price/balance comparison.
inline double stars_value(const StarsAmount& stars_amount) {
    return static_cast<double>(stars_amount.amount) + static_cast<double>(stars_amount.nanos) / NANOS_PER_STAR;
}

// Whole stars print without decimals, fractional amounts keep up to nine digits.
std::string format_stars(double stars);

// =============================================================================
// CATALOG
// =============================================================================

struct Offer {
    std::int64_t id = 0;
    double price = 0.0;                                  // Normalized stars
    bool limited = false;
    bool sold_out = false;
    std::optional<std::int64_t> availability_remains;    // Absent = unconstrained
    std::optional<std::int64_t> availability_total;
    std::optional<std::string> title;
};

struct CatalogSnapshot {
    std::int64_t hash = 0;                               // Continuation token for the next poll
    std::vector<Offer> offers;
};

enum class CatalogStatus {
    SNAPSHOT,
    NOT_MODIFIED
};

struct CatalogResponse {
    CatalogStatus status = CatalogStatus::NOT_MODIFIED;
    CatalogSnapshot snapshot;                            // Only meaningful for SNAPSHOT

    static CatalogResponse not_modified() {
        return CatalogResponse{};
    }

    static CatalogResponse from_snapshot(CatalogSnapshot catalog_snapshot) {
        CatalogResponse response;
        response.status = CatalogStatus::SNAPSHOT;
        response.snapshot = std::move(catalog_snapshot);
        return response;
    }

    bool is_not_modified() const { return status == CatalogStatus::NOT_MODIFIED; }
};

// =============================================================================
// PEERS AND PAYMENTS
// =============================================================================

enum class PeerKind {
    SELF,
    USER,
    CHAT,
    CHANNEL
};

struct PeerRef {
    PeerKind kind = PeerKind::SELF;
    std::int64_t id = 0;
    std::int64_t access_hash = 0;

    static PeerRef self() { return PeerRef{}; }
};

enum class PaymentFormKind {
    STAR_GIFT,     // payments.PaymentFormStarGift
    STARS,         // payments.PaymentFormStars
    UNEXPECTED     // Any other form type; cannot be paid with stars
};

struct PaymentForm {
    PaymentFormKind kind = PaymentFormKind::UNEXPECTED;
    std::int64_t form_id = 0;
    std::string type_name;
    PeerRef recipient;
    std::int64_t offer_id = 0;
};

struct SubmissionResult {
    bool verification_needed = false;
    std::string verification_url;
};

// =============================================================================
// RUN STATE
// =============================================================================

enum class AcquisitionState {
    AUTHENTICATING,
    POLLING_CATALOG,
    EVALUATING_OFFERS,
    VERIFYING_BALANCE,
    ATTEMPTING_PURCHASE,
    DONE
};

enum class RunOutcome {
    SUCCESS,
    CANCELLED,
    ERROR
};

struct PurchaseRecord {
    std::int64_t offer_id = 0;
    double price = 0.0;
};

struct RunResult {
    RunOutcome outcome = RunOutcome::ERROR;
    std::optional<PurchaseRecord> purchase;
    std::string reason;
};

const char* to_string(AcquisitionState state);
const char* to_string(RunOutcome outcome);

} // namespace Core
} // namespace GiftSniper

#endif // DATA_STRUCTURES_HPP
