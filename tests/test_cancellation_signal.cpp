#include <chrono>
#include <iostream>
#include <thread>

#include "common/test_check.hpp"
#include "trader/acquisition/cancellation_signal.hpp"

using GiftSniper::Core::CancellationSignal;
using clock_type = std::chrono::steady_clock;

void test_request_is_one_shot() {
    std::cout << "[TEST] Request is one-shot" << std::endl;

    CancellationSignal cancellation_signal;
    TEST_CHECK(!cancellation_signal.is_requested());
    TEST_CHECK(cancellation_signal.request());
    TEST_CHECK(cancellation_signal.is_requested());
    TEST_CHECK(!cancellation_signal.request());
    TEST_CHECK(cancellation_signal.is_requested());
}

void test_wait_times_out_without_request() {
    std::cout << "[TEST] Wait times out without a request" << std::endl;

    CancellationSignal cancellation_signal;
    auto start_time = clock_type::now();
    TEST_CHECK(!cancellation_signal.wait_for(std::chrono::milliseconds(100)));
    auto elapsed = clock_type::now() - start_time;
    TEST_CHECK(elapsed >= std::chrono::milliseconds(100));
}

void test_wait_returns_immediately_when_already_requested() {
    std::cout << "[TEST] Wait returns immediately when already requested" << std::endl;

    CancellationSignal cancellation_signal;
    cancellation_signal.request();
    auto start_time = clock_type::now();
    TEST_CHECK(cancellation_signal.wait_for(std::chrono::seconds(5)));
    TEST_CHECK(clock_type::now() - start_time < std::chrono::seconds(1));
}

void test_request_from_other_thread_wakes_waiter() {
    std::cout << "[TEST] Request from another thread wakes the waiter" << std::endl;

    CancellationSignal cancellation_signal;
    std::thread requester([&cancellation_signal]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancellation_signal.request();
    });

    auto start_time = clock_type::now();
    bool cancelled = cancellation_signal.wait_for(std::chrono::seconds(10));
    auto elapsed = clock_type::now() - start_time;
    requester.join();

    TEST_CHECK(cancelled);
    TEST_CHECK(elapsed < std::chrono::seconds(5));
}

int main() {
    test_request_is_one_shot();
    test_wait_times_out_without_request();
    test_wait_returns_immediately_when_already_requested();
    test_request_from_other_thread_wakes_waiter();

    std::cout << "[TEST] All cancellation signal tests passed" << std::endl;
    return 0;
}
