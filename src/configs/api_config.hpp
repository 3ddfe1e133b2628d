#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace GiftSniper {
namespace Config {

struct ApiConfig {
    // Process-wide application credentials
    long long api_id = 0;
    std::string api_hash;

    // Gateway that relays the platform's remote calls
    std::string gateway_url = "http://127.0.0.1:8081";

    // HTTP configuration
    int retry_count = 1;
    int timeout_seconds = 30;
    int retry_delay_ms = 250;
    bool enable_ssl_verification = true;
};

} // namespace Config
} // namespace GiftSniper

#endif // API_CONFIG_HPP
