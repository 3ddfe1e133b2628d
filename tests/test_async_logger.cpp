#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/test_check.hpp"
#include "logging/logger/async_logger.hpp"

using namespace GiftSniper::Logging;
using clock_type = std::chrono::steady_clock;

void test_drain_moves_queued_lines_in_order() {
    std::cout << "[TEST] Drain moves queued lines in order" << std::endl;

    AsyncLogger async_logger("unused.log");
    async_logger.start();
    async_logger.enqueue("first\n");
    async_logger.enqueue("second\n");

    std::vector<std::string> lines;
    TEST_CHECK(async_logger.drain(lines, std::chrono::milliseconds(0)) == 2);
    TEST_CHECK(lines.size() == 2);
    TEST_CHECK(lines[0] == "first\n");
    TEST_CHECK(lines[1] == "second\n");

    TEST_CHECK(async_logger.drain(lines, std::chrono::milliseconds(10)) == 0);
    TEST_CHECK(lines.size() == 2);
}

void test_stop_wakes_waiting_drain() {
    std::cout << "[TEST] Stop wakes a waiting drain" << std::endl;

    AsyncLogger async_logger("unused.log");
    async_logger.start();
    std::thread stopper([&async_logger]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        async_logger.stop();
    });

    std::vector<std::string> lines;
    auto start_time = clock_type::now();
    async_logger.drain(lines, std::chrono::seconds(10));
    auto elapsed = clock_type::now() - start_time;
    stopper.join();

    TEST_CHECK(!async_logger.is_running());
    TEST_CHECK(elapsed < std::chrono::seconds(5));
}

void test_log_message_enqueues_formatted_line() {
    std::cout << "[TEST] log_message enqueues a tagged line while the logger runs" << std::endl;

    LoggingContext logging_context;
    set_logging_context(logging_context);
    logging_context.async_logger = std::make_shared<AsyncLogger>("unused.log");
    logging_context.async_logger->start();
    set_log_thread_tag("BUYER");

    log_message("Recipient: me");

    std::vector<std::string> lines;
    TEST_CHECK(logging_context.async_logger->drain(lines, std::chrono::milliseconds(0)) == 1);
    TEST_CHECK(lines[0].find(" [BUYER ]   Recipient: me\n") != std::string::npos);

    // Stopped logger means the line goes to the console instead of the queue
    logging_context.async_logger->stop();
    log_message("after stop");
    lines.clear();
    TEST_CHECK(logging_context.async_logger->drain(lines, std::chrono::milliseconds(0)) == 0);
}

void test_thread_tags_are_fitted_per_thread() {
    std::cout << "[TEST] Thread tags are padded or cut per thread" << std::endl;

    LoggingContext logging_context;
    set_logging_context(logging_context);
    TEST_CHECK(logging_context.get_thread_tag() == "MAIN  ");

    set_log_thread_tag("LOGGER-THREAD");
    TEST_CHECK(logging_context.get_thread_tag() == "LOGGER");

    std::string worker_tag;
    std::thread worker([&logging_context, &worker_tag]() {
        set_logging_context(logging_context);
        set_log_thread_tag("BUY");
        worker_tag = logging_context.get_thread_tag();
    });
    worker.join();

    TEST_CHECK(worker_tag == "BUY   ");
    TEST_CHECK(logging_context.get_thread_tag() == "LOGGER");
}

void test_timestamped_log_filename_keeps_extension() {
    std::cout << "[TEST] Timestamped log filename keeps folder and extension" << std::endl;

    std::string file_name = generate_timestamped_log_filename("runtime_logs/gift_sniper.log");
    TEST_CHECK(file_name.rfind("runtime_logs/gift_sniper_", 0) == 0);
    TEST_CHECK(file_name.size() == std::string("runtime_logs/gift_sniper_YYYYMMDD-HHMMSS.log").size());
    TEST_CHECK(file_name.substr(file_name.size() - 4) == ".log");

    std::string bare_name = generate_timestamped_log_filename("buyer");
    TEST_CHECK(bare_name.rfind("buyer_", 0) == 0);
    TEST_CHECK(bare_name.find('.') == std::string::npos);
}

void test_initialize_places_log_file_in_log_directory() {
    std::cout << "[TEST] Initialize creates the log directory and names the file inside it" << std::endl;

    std::filesystem::path log_directory = std::filesystem::temp_directory_path() / "gift_sniper_logger_test" / "nested";
    std::filesystem::remove_all(log_directory.parent_path());

    GiftSniper::Config::SystemConfig config;
    config.logging.log_directory = log_directory.string();
    config.logging.log_file = "elsewhere/buyer.log";

    LoggingContext logging_context;
    set_logging_context(logging_context);
    std::shared_ptr<AsyncLogger> async_logger = initialize_async_logger(config);

    TEST_CHECK(std::filesystem::is_directory(log_directory));
    std::filesystem::path file_path(async_logger->get_file_path());
    TEST_CHECK(file_path.parent_path() == log_directory);
    TEST_CHECK(file_path.filename().string().rfind("buyer_", 0) == 0);
    TEST_CHECK(file_path.extension() == ".log");
    TEST_CHECK(async_logger->is_running());
    TEST_CHECK(logging_context.async_logger == async_logger);

    async_logger->stop();
    std::filesystem::remove_all(log_directory.parent_path());
}

int main() {
    test_drain_moves_queued_lines_in_order();
    test_stop_wakes_waiting_drain();
    test_log_message_enqueues_formatted_line();
    test_thread_tags_are_fitted_per_thread();
    test_timestamped_log_filename_keeps_extension();
    test_initialize_places_log_file_in_log_directory();

    std::cout << "[TEST] All async logger tests passed" << std::endl;
    return 0;
}
