#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "api_config.hpp"
#include "run_config.hpp"
#include "timing_config.hpp"
#include "logging_config.hpp"

namespace GiftSniper {
namespace Config {

/**
 * Complete application configuration.
 * Loaded from config/runtime_config.csv, then overridden by the environment
 * and finally by command line options.
 */
struct SystemConfig {
    ApiConfig api;             // Credentials and gateway connection
    RunConfig run;             // Acquisition run parameters
    TimingConfig timing;       // Internal thread intervals
    LoggingConfig logging;     // Log file location
};

} // namespace Config
} // namespace GiftSniper

#endif // SYSTEM_CONFIG_HPP
