#include "logging_thread.hpp"
#include "logging/logs/system_logs.hpp"
#include <chrono>
#include <iostream>

using namespace GiftSniper::Threads;
using namespace GiftSniper::Logging;

void LoggingThread::operator()() {
    try {
        set_logging_context(logging_context);
        set_log_thread_tag("LOGGER");

        std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            // Console output continues without the file
            SystemLogs::log_logging_thread_exception("Failed to open log file: " + logger_ptr->get_file_path());
        }
        drain_until_stopped(log_file);
    } catch (const std::exception& exception) {
        SystemLogs::log_logging_thread_exception(exception.what());
    }
}

void LoggingThread::drain_until_stopped(std::ofstream& log_file) {
    const std::chrono::milliseconds max_wait(flush_interval_ms);
    std::vector<std::string> lines;

    while (logger_ptr->is_running()) {
        if (logger_ptr->drain(lines, max_wait) > 0) {
            write_lines(lines, log_file);
        }
    }

    // Lines enqueued between the last drain and stop()
    if (logger_ptr->drain(lines, std::chrono::milliseconds(0)) > 0) {
        write_lines(lines, log_file);
    }
}

void LoggingThread::write_lines(std::vector<std::string>& lines, std::ofstream& log_file) {
    {
        std::lock_guard<std::mutex> console_guard(logging_context.console_mutex);
        for (const std::string& line : lines) {
            std::cout << line;
        }
        std::cout << std::flush;
    }

    if (log_file.is_open()) {
        for (const std::string& line : lines) {
            log_file << line;
        }
        log_file.flush();
    }
    lines.clear();
}
