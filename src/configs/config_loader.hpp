#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "system_config.hpp"
#include <string>

namespace GiftSniper {
namespace Config {

constexpr const char* DEFAULT_CONFIG_PATH = "config/runtime_config.csv";

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns true on success.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Override loaded values with TG_API_ID, TG_API_HASH, TG_SESSION, TG_GATEWAY_URL,
// RECIPIENT, MAX_PRICE_STARS and POLL_INTERVAL when they are set.
void apply_environment_overrides(SystemConfig& cfg);

// Load complete system configuration (CSV file then environment). A missing CSV file
// leaves the defaults in place. Returns 0 on success, 1 on failure.
int load_system_config(SystemConfig& config, const std::string& csv_path);

// Replace blank session and recipient with their defaults.
RunConfig normalize_run_config(const RunConfig& run_config);

// Both application credentials present.
bool has_api_credentials(const ApiConfig& api_config);

// Validate run parameters. Returns true if valid, false otherwise with error message.
bool validate_run_config(const RunConfig& run_config, std::string& errorMessage);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& errorMessage);

} // namespace Config
} // namespace GiftSniper

#endif // CONFIG_LOADER_HPP
