#ifndef RUN_CONFIG_HPP
#define RUN_CONFIG_HPP

#include <string>

namespace GiftSniper {
namespace Config {

// Defaults applied when a field is left blank by the control surface
constexpr const char* DEFAULT_SESSION_NAME = "tg_gifts.session";
constexpr const char* DEFAULT_RECIPIENT = "me";
constexpr int DEFAULT_MAX_PRICE_STARS = 500;
constexpr int DEFAULT_POLL_INTERVAL_SEC = 15;
constexpr int MIN_POLL_INTERVAL_SEC = 2;

/**
 * Parameters of one acquisition run. Copied into the loop on start and never
 * mutated afterwards.
 */
struct RunConfig {
    std::string session = DEFAULT_SESSION_NAME;       // Session identity on the gateway
    std::string recipient = DEFAULT_RECIPIENT;        // @username, numeric id or "me"
    int max_price_stars = DEFAULT_MAX_PRICE_STARS;    // Price ceiling, inclusive
    int poll_interval_sec = DEFAULT_POLL_INTERVAL_SEC; // Wait between catalog polls
};

} // namespace Config
} // namespace GiftSniper

#endif // RUN_CONFIG_HPP
