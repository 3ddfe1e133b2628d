#ifndef OFFER_EVALUATOR_HPP
#define OFFER_EVALUATOR_HPP

#include "trader/data_structures/data_structures.hpp"
#include <vector>

namespace GiftSniper {
namespace Core {

/**
 * Offer filtering and ordering. Stateless; every function depends only on
 * its arguments.
 */
class OfferEvaluator {
public:
    // limited, not sold out, remaining absent or positive, price <= ceiling
    static bool is_eligible(const Offer& offer, int max_price_stars);

    // Eligible offers, cheapest first; equal prices keep catalog order.
    static std::vector<Offer> select_candidates(const std::vector<Offer>& offers, int max_price_stars);
    static std::vector<Offer> select_candidates(const CatalogSnapshot& catalog_snapshot, int max_price_stars);

    // A balance equal to the price is sufficient.
    static bool has_sufficient_balance(double balance, double price);
};

} // namespace Core
} // namespace GiftSniper

#endif // OFFER_EVALUATOR_HPP
