#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <memory>
#include <thread>
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"

namespace GiftSniper {
namespace System {

/**
 * @brief Central system state container
 *
 * Holds the loaded configuration, the logging context shared by every thread
 * and the flags written by the signal handler.
 */
struct SystemState {
    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> shutdown_requested{false};  // Set from the signal handler only

    // =========================================================================
    // CONFIGURATION AND THREADS
    // =========================================================================
    GiftSniper::Config::SystemConfig config;                                // Complete system configuration
    std::shared_ptr<GiftSniper::Logging::LoggingContext> logging_context;   // Logging context
    std::thread logger_thread;                                              // Drains the async logger

    explicit SystemState(const GiftSniper::Config::SystemConfig& initial) : config(initial) {}
};

} // namespace System
} // namespace GiftSniper

#endif // SYSTEM_STATE_HPP
