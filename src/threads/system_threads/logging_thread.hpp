#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "configs/timing_config.hpp"

namespace GiftSniper {
namespace Threads {

// Drains the async logger to the console and the run's log file until the logger stops.
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<GiftSniper::Logging::AsyncLogger> logger,
                  GiftSniper::Logging::LoggingContext& context,
                  const GiftSniper::Config::TimingConfig& timing_config)
        : logger_ptr(logger), logging_context(context), flush_interval_ms(timing_config.logging_flush_interval_ms) {}

    void operator()();

private:
    std::shared_ptr<GiftSniper::Logging::AsyncLogger> logger_ptr;
    GiftSniper::Logging::LoggingContext& logging_context;
    int flush_interval_ms;

    void drain_until_stopped(std::ofstream& log_file);
    void write_lines(std::vector<std::string>& lines, std::ofstream& log_file);
};

} // namespace Threads
} // namespace GiftSniper

#endif // LOGGING_THREAD_HPP
