#include <iostream>
#include <vector>

#include "common/test_check.hpp"
#include "common/scripted_platform_client.hpp"
#include "trader/offer_evaluation/offer_evaluator.hpp"

using namespace GiftSniper::Core;
using GiftSniper::Testing::make_offer;

void test_eligibility_predicate() {
    std::cout << "[TEST] Eligibility predicate" << std::endl;

    TEST_CHECK(OfferEvaluator::is_eligible(make_offer(1, 100), 500));
    TEST_CHECK(!OfferEvaluator::is_eligible(make_offer(2, 100, false), 500));        // not limited
    TEST_CHECK(!OfferEvaluator::is_eligible(make_offer(3, 100, true, true), 500));   // sold out
    TEST_CHECK(!OfferEvaluator::is_eligible(make_offer(4, 100, true, false, 0), 500));
    TEST_CHECK(OfferEvaluator::is_eligible(make_offer(5, 100, true, false, 1), 500));
    TEST_CHECK(OfferEvaluator::is_eligible(make_offer(6, 100, true, false, std::nullopt), 500));
}

void test_price_ceiling_boundaries() {
    std::cout << "[TEST] Price ceiling boundaries" << std::endl;

    const int ceiling = 500;
    TEST_CHECK(OfferEvaluator::is_eligible(make_offer(1, ceiling - 1), ceiling));
    TEST_CHECK(OfferEvaluator::is_eligible(make_offer(2, ceiling), ceiling));
    TEST_CHECK(!OfferEvaluator::is_eligible(make_offer(3, ceiling + 1), ceiling));

    // Fractional prices compare on the normalized value
    TEST_CHECK(!OfferEvaluator::is_eligible(make_offer(4, ceiling + 0.5), ceiling));
    TEST_CHECK(OfferEvaluator::is_eligible(make_offer(5, ceiling - 0.5), ceiling));
}

void test_candidates_sorted_cheapest_first() {
    std::cout << "[TEST] Candidates sorted cheapest first" << std::endl;

    std::vector<Offer> offers = {
        make_offer(10, 300),
        make_offer(11, 100),
        make_offer(12, 700),              // above ceiling
        make_offer(13, 50, false),        // not limited
        make_offer(14, 200, true, true),  // sold out
        make_offer(15, 250, true, false, 0),
        make_offer(16, 150, true, false, 3)
    };

    std::vector<Offer> candidates = OfferEvaluator::select_candidates(offers, 500);
    TEST_CHECK(candidates.size() == 3);
    TEST_CHECK(candidates[0].id == 11);
    TEST_CHECK(candidates[1].id == 16);
    TEST_CHECK(candidates[2].id == 10);

    for (size_t candidate_index = 0; candidate_index < candidates.size(); ++candidate_index) {
        TEST_CHECK(OfferEvaluator::is_eligible(candidates[candidate_index], 500));
        if (candidate_index > 0) {
            TEST_CHECK(candidates[candidate_index - 1].price <= candidates[candidate_index].price);
        }
    }
}

void test_equal_prices_keep_catalog_order() {
    std::cout << "[TEST] Equal prices keep catalog order" << std::endl;

    std::vector<Offer> offers = {
        make_offer(3, 200),
        make_offer(1, 100),
        make_offer(7, 200),
        make_offer(5, 100),
        make_offer(2, 200)
    };

    std::vector<Offer> candidates = OfferEvaluator::select_candidates(offers, 500);
    TEST_CHECK(candidates.size() == 5);
    TEST_CHECK(candidates[0].id == 1);
    TEST_CHECK(candidates[1].id == 5);
    TEST_CHECK(candidates[2].id == 3);
    TEST_CHECK(candidates[3].id == 7);
    TEST_CHECK(candidates[4].id == 2);
}

void test_empty_and_ineligible_catalogs() {
    std::cout << "[TEST] Empty and fully ineligible catalogs" << std::endl;

    TEST_CHECK(OfferEvaluator::select_candidates(std::vector<Offer>(), 500).empty());

    CatalogSnapshot catalog_snapshot;
    catalog_snapshot.hash = 42;
    catalog_snapshot.offers = {make_offer(1, 900), make_offer(2, 100, false)};
    TEST_CHECK(OfferEvaluator::select_candidates(catalog_snapshot, 500).empty());
}

void test_balance_sufficiency() {
    std::cout << "[TEST] Balance sufficiency" << std::endl;

    TEST_CHECK(OfferEvaluator::has_sufficient_balance(100, 100));
    TEST_CHECK(!OfferEvaluator::has_sufficient_balance(99, 100));
    TEST_CHECK(OfferEvaluator::has_sufficient_balance(101, 100));
    TEST_CHECK(!OfferEvaluator::has_sufficient_balance(99.999999999, 100));
}

void test_stars_numerics() {
    std::cout << "[TEST] Stars amount normalization and formatting" << std::endl;

    TEST_CHECK(stars_value(StarsAmount{250, 0}) == 250.0);
    TEST_CHECK(stars_value(StarsAmount{1, 500000000}) == 1.5);
    TEST_CHECK(stars_value(StarsAmount{0, 0}) == 0.0);

    TEST_CHECK(format_stars(250.0) == "250");
    TEST_CHECK(format_stars(1.5) == "1.5");
    TEST_CHECK(format_stars(0.0) == "0");
    TEST_CHECK(format_stars(stars_value(StarsAmount{3, 250000000})) == "3.25");
}

int main() {
    test_eligibility_predicate();
    test_price_ceiling_boundaries();
    test_candidates_sorted_cheapest_first();
    test_equal_prices_keep_catalog_order();
    test_empty_and_ineligible_catalogs();
    test_balance_sufficiency();
    test_stars_numerics();

    std::cout << "[TEST] All offer evaluator tests passed" << std::endl;
    return 0;
}
