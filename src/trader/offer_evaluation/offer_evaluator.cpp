#include "offer_evaluator.hpp"
#include <algorithm>

namespace GiftSniper {
namespace Core {

bool OfferEvaluator::is_eligible(const Offer& offer, int max_price_stars) {
    if (!offer.limited || offer.sold_out) {
        return false;
    }
    if (offer.availability_remains.has_value() && *offer.availability_remains <= 0) {
        return false;
    }
    return offer.price <= static_cast<double>(max_price_stars);
}

std::vector<Offer> OfferEvaluator::select_candidates(const std::vector<Offer>& offers, int max_price_stars) {
    std::vector<Offer> candidates;
    for (const Offer& offer : offers) {
        if (is_eligible(offer, max_price_stars)) {
            candidates.push_back(offer);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Offer& left_offer, const Offer& right_offer) {
        return left_offer.price < right_offer.price;
    });
    return candidates;
}

std::vector<Offer> OfferEvaluator::select_candidates(const CatalogSnapshot& catalog_snapshot, int max_price_stars) {
    return select_candidates(catalog_snapshot.offers, max_price_stars);
}

bool OfferEvaluator::has_sufficient_balance(double balance, double price) {
    return !(balance < price);
}

} // namespace Core
} // namespace GiftSniper
