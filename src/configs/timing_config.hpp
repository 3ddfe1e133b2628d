// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace GiftSniper {
namespace Config {

struct TimingConfig {
    // ========================================================================
    // THREAD POLLING INTERVALS
    // ========================================================================

    int logging_flush_interval_ms = 100;      // Logging thread queue wait before a flush check
    int control_poll_interval_ms = 200;       // Control thread check for shutdown signals while a run is active
};

} // namespace Config
} // namespace GiftSniper

#endif // TIMING_CONFIG_HPP
