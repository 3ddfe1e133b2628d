#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "configs/system_config.hpp"

namespace GiftSniper {
namespace Logging {

constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

// Receives one timestamp-free line; the sink decides how it is displayed.
using LogSink = std::function<void(const std::string&)>;

/**
 * Line queue shared by every producer thread and drained by the logging thread.
 * Lines are already formatted (timestamp, tag, newline) when they arrive.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }

    void start();
    void stop();
    bool is_running() const { return running.load(); }

    void enqueue(const std::string& formatted_line);

    // Blocks up to max_wait for lines (or stop), then moves every queued line into lines_out.
    size_t drain(std::vector<std::string>& lines_out, std::chrono::milliseconds max_wait);

private:
    std::string file_path;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{false};
};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);
};

// Tag printed after the timestamp, padded or cut to LOG_TAG_WIDTH
void set_log_thread_tag(const std::string& thread_tag_value);

// Formats "timestamp [TAG   ]   message" and hands it to the async logger,
// or prints it directly when no logger is installed.
void log_message(const std::string& message);

LogSink make_console_log_sink();

// base.ext -> base_YYYYMMDD-HHMMSS.ext
std::string generate_timestamped_log_filename(const std::string& base_filename);

// Validates the configuration, creates the log folder and installs a running logger
std::shared_ptr<AsyncLogger> initialize_async_logger(const GiftSniper::Config::SystemConfig& config);

LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace GiftSniper

#endif // ASYNC_LOGGER_HPP
