#include "async_logger.hpp"
#include "configs/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <filesystem>
#include <system_error>
#include <iostream>
#include <stdexcept>

namespace GiftSniper {
namespace Logging {

namespace {

thread_local LoggingContext* current_logging_context = nullptr;

const char* const DEFAULT_THREAD_TAG = "MAIN  ";

std::string fit_tag_width(const std::string& tag_value) {
    std::string fitted_tag = tag_value.substr(0, LOG_TAG_WIDTH);
    fitted_tag.append(LOG_TAG_WIDTH - fitted_tag.size(), ' ');
    return fitted_tag;
}

std::string current_timestamp() {
    try {
        return TimeUtils::get_current_human_readable_time();
    } catch (const std::exception& time_exception_error) {
        std::cerr << "ERROR: timestamp unavailable: " << time_exception_error.what() << std::endl;
        return "ERROR-TIME";
    }
}

} // anonymous namespace

LoggingContext* get_logging_context() {
    if (!current_logging_context) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return current_logging_context;
}

void set_logging_context(LoggingContext& context) {
    current_logging_context = &context;
}

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    auto thread_tag_iterator = thread_tags.find(std::this_thread::get_id());
    if (thread_tag_iterator != thread_tags.end()) {
        return thread_tag_iterator->second;
    }
    return DEFAULT_THREAD_TAG;
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = fit_tag_width(tag_value);
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message) {
    LoggingContext* logging_context = current_logging_context;
    if (!logging_context) {
        // Nothing to format against yet
        std::cerr << message << std::endl;
        return;
    }

    std::string formatted_line = current_timestamp() + " [" + logging_context->get_thread_tag() + "]   " + message + "\n";

    std::shared_ptr<AsyncLogger> async_logger = logging_context->async_logger;
    if (async_logger && async_logger->is_running()) {
        async_logger->enqueue(formatted_line);
        return;
    }

    std::lock_guard<std::mutex> console_guard(logging_context->console_mutex);
    std::cout << formatted_line << std::flush;
}

LogSink make_console_log_sink() {
    return [](const std::string& line) {
        log_message(line);
    };
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::filesystem::path log_path(base_filename);
    std::string extension = log_path.extension().string();
    log_path.replace_extension();
    return log_path.string() + "_" + TimeUtils::get_current_log_filename_time() + extension;
}

void AsyncLogger::start() {
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        pending_lines.push_back(formatted_line);
    }
    queue_cv.notify_one();
}

size_t AsyncLogger::drain(std::vector<std::string>& lines_out, std::chrono::milliseconds max_wait) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    queue_cv.wait_for(queue_lock, max_wait, [this] { return !pending_lines.empty() || !running.load(); });

    size_t drained_count = pending_lines.size();
    for (std::string& pending_line : pending_lines) {
        lines_out.push_back(std::move(pending_line));
    }
    pending_lines.clear();
    return drained_count;
}

std::shared_ptr<AsyncLogger> initialize_async_logger(const GiftSniper::Config::SystemConfig& config) {
    LoggingContext* logging_context = get_logging_context();

    std::string configuration_error_message;
    if (!GiftSniper::Config::validate_config(config, configuration_error_message)) {
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    const std::string& log_directory = config.logging.log_directory;
    std::filesystem::path log_file_path(config.logging.log_file);
    if (!log_directory.empty()) {
        std::error_code create_error;
        std::filesystem::create_directories(log_directory, create_error);
        if (create_error) {
            throw std::runtime_error("Failed to create log folder " + log_directory + ": " + create_error.message());
        }
        log_file_path = std::filesystem::path(log_directory) / log_file_path.filename();
    }

    auto async_logger = std::make_shared<AsyncLogger>(generate_timestamped_log_filename(log_file_path.string()));
    // Running before the logging thread exists so early lines are queued, not printed twice
    async_logger->start();

    logging_context->async_logger = async_logger;
    set_log_thread_tag(DEFAULT_THREAD_TAG);

    return async_logger;
}

} // namespace Logging
} // namespace GiftSniper
