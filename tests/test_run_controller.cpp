#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "common/test_check.hpp"
#include "common/scripted_platform_client.hpp"
#include "trader/acquisition/balance_check.hpp"
#include "trader/acquisition/run_controller.hpp"

using namespace GiftSniper;
using namespace GiftSniper::Core;
using namespace GiftSniper::Testing;

namespace {

Config::ApiConfig make_api_config() {
    Config::ApiConfig api_config;
    api_config.api_id = 12345;
    api_config.api_hash = "0123456789abcdef";
    return api_config;
}

Config::RunConfig make_run_config(int poll_interval_sec = 2) {
    Config::RunConfig run_config;
    run_config.session = "controller.session";
    run_config.recipient = "me";
    run_config.max_price_stars = 500;
    run_config.poll_interval_sec = poll_interval_sec;
    return run_config;
}

// Endless NotModified catalog: the run only ends through stop().
API::PlatformClientFactory make_idle_factory(std::shared_ptr<ScriptedCallLog> call_log) {
    return [call_log](const std::string&, CancellationSignal*) -> API::PlatformClientPtr {
        std::unique_ptr<ScriptedPlatformClient> platform_client = std::make_unique<ScriptedPlatformClient>(nullptr, call_log);
        for (int poll_index = 0; poll_index < 1000; ++poll_index) {
            platform_client->catalog_steps.push_back(not_modified_step());
        }
        return platform_client;
    };
}

// One affordable offer: the run buys it right away.
API::PlatformClientFactory make_buying_factory(std::shared_ptr<ScriptedCallLog> call_log) {
    return [call_log](const std::string&, CancellationSignal*) -> API::PlatformClientPtr {
        std::unique_ptr<ScriptedPlatformClient> platform_client = std::make_unique<ScriptedPlatformClient>(nullptr, call_log);
        platform_client->catalog_steps.push_back(snapshot_step(1, {make_offer(77, 100)}));
        return platform_client;
    };
}

} // anonymous namespace

void test_start_and_finish_with_purchase() {
    std::cout << "[TEST] Run starts on a worker and finishes with a purchase" << std::endl;

    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), make_buying_factory(call_log), recording_sink.sink());

    StartResult start_result = run_controller.start(make_run_config());
    TEST_CHECK(start_result.accepted);
    TEST_CHECK(start_result.handle != 0);

    RunResult run_result = run_controller.wait(start_result.handle);
    TEST_CHECK(run_result.outcome == RunOutcome::SUCCESS);
    TEST_CHECK(run_result.purchase->offer_id == 77);
    TEST_CHECK(run_controller.status(start_result.handle) == RunStatus::FINISHED);
    TEST_CHECK(!run_controller.is_active());
    TEST_CHECK(call_log->close_calls == 1);
    TEST_CHECK(recording_sink.contains("Background task finished."));
}

void test_second_start_rejected_while_active() {
    std::cout << "[TEST] Second start is rejected while a run is active" << std::endl;

    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), make_idle_factory(call_log), recording_sink.sink());

    StartResult first_start = run_controller.start(make_run_config());
    TEST_CHECK(first_start.accepted);
    TEST_CHECK(run_controller.is_active());

    StartResult second_start = run_controller.start(make_run_config());
    TEST_CHECK(!second_start.accepted);
    TEST_CHECK(!second_start.notice.empty());
    TEST_CHECK(recording_sink.contains("Start rejected"));

    run_controller.stop(first_start.handle);
    RunResult run_result = run_controller.wait(first_start.handle);
    TEST_CHECK(run_result.outcome == RunOutcome::CANCELLED);

    // A new run is accepted once the previous one is terminal
    StartResult third_start = run_controller.start(make_run_config());
    TEST_CHECK(third_start.accepted);
    TEST_CHECK(third_start.handle != first_start.handle);
    run_controller.stop(third_start.handle);
    TEST_CHECK(run_controller.wait(third_start.handle).outcome == RunOutcome::CANCELLED);
}

void test_stop_is_idempotent() {
    std::cout << "[TEST] Stop is idempotent and safe on finished or unknown runs" << std::endl;

    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), make_idle_factory(call_log), recording_sink.sink());

    run_controller.stop(999);   // never started
    TEST_CHECK(run_controller.status(999) == RunStatus::NOT_FOUND);
    TEST_CHECK(!run_controller.result(999).has_value());

    StartResult start_result = run_controller.start(make_run_config());
    TEST_CHECK(start_result.accepted);
    run_controller.stop(start_result.handle);
    run_controller.stop(start_result.handle);
    RunResult run_result = run_controller.wait(start_result.handle);
    TEST_CHECK(run_result.outcome == RunOutcome::CANCELLED);

    run_controller.stop(start_result.handle);   // already terminal
    TEST_CHECK(run_controller.status(start_result.handle) == RunStatus::FINISHED);
    TEST_CHECK(run_controller.result(start_result.handle)->outcome == RunOutcome::CANCELLED);
}

void test_stop_wakes_run_promptly() {
    std::cout << "[TEST] Stop wakes a waiting run well before the interval ends" << std::endl;

    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), make_idle_factory(call_log), recording_sink.sink());

    const int poll_interval_sec = 30;
    StartResult start_result = run_controller.start(make_run_config(poll_interval_sec));
    TEST_CHECK(start_result.accepted);
    TEST_CHECK(!run_controller.wait_for(start_result.handle, std::chrono::milliseconds(200)).has_value());

    auto stop_time = std::chrono::steady_clock::now();
    run_controller.stop(start_result.handle);
    std::optional<RunResult> run_result = run_controller.wait_for(start_result.handle, std::chrono::seconds(5));
    auto elapsed = std::chrono::steady_clock::now() - stop_time;

    TEST_CHECK(run_result.has_value());
    TEST_CHECK(run_result->outcome == RunOutcome::CANCELLED);
    TEST_CHECK(elapsed < std::chrono::seconds(poll_interval_sec));
}

void test_missing_credentials_refuse_start() {
    std::cout << "[TEST] Missing credentials refuse every start, notice logged once" << std::endl;

    std::atomic<int> factory_calls{0};
    API::PlatformClientFactory counting_factory = [&factory_calls](const std::string&, CancellationSignal*) -> API::PlatformClientPtr {
        ++factory_calls;
        return std::make_unique<ScriptedPlatformClient>();
    };

    RecordingSink recording_sink;
    Config::ApiConfig api_config = make_api_config();
    api_config.api_hash.clear();
    RunController run_controller(api_config, counting_factory, recording_sink.sink());

    StartResult first_start = run_controller.start(make_run_config());
    StartResult second_start = run_controller.start(make_run_config());

    TEST_CHECK(!first_start.accepted);
    TEST_CHECK(!second_start.accepted);
    TEST_CHECK(!second_start.notice.empty());
    TEST_CHECK(recording_sink.count_containing("TG_API_ID") == 1);
    TEST_CHECK(factory_calls.load() == 0);
    TEST_CHECK(!run_controller.is_active());
}

void test_invalid_run_config_refused() {
    std::cout << "[TEST] Invalid run parameters are refused" << std::endl;

    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), make_idle_factory(call_log), recording_sink.sink());

    Config::RunConfig short_interval = make_run_config();
    short_interval.poll_interval_sec = 1;
    TEST_CHECK(!run_controller.start(short_interval).accepted);

    Config::RunConfig zero_price = make_run_config();
    zero_price.max_price_stars = 0;
    TEST_CHECK(!run_controller.start(zero_price).accepted);

    TEST_CHECK(recording_sink.count_containing("Start rejected") == 2);
    TEST_CHECK(call_log->try_open_calls == 0);
}

void test_blank_fields_use_defaults() {
    std::cout << "[TEST] Blank session and recipient fall back to defaults" << std::endl;

    std::string opened_session;
    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    API::PlatformClientFactory recording_factory = [&opened_session, call_log](const std::string& session, CancellationSignal*) -> API::PlatformClientPtr {
        opened_session = session;
        return std::make_unique<ScriptedPlatformClient>(nullptr, call_log);
    };

    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), recording_factory, recording_sink.sink());
    Config::RunConfig blank_config = make_run_config();
    blank_config.session = "  ";
    blank_config.recipient = "";

    StartResult start_result = run_controller.start(blank_config);
    TEST_CHECK(start_result.accepted);
    run_controller.stop(start_result.handle);
    run_controller.wait(start_result.handle);

    TEST_CHECK(opened_session == Config::DEFAULT_SESSION_NAME);
    TEST_CHECK(call_log->resolved_recipients.size() == 1);
    TEST_CHECK(call_log->resolved_recipients[0] == Config::DEFAULT_RECIPIENT);
}

void test_run_client_bound_to_run_signal() {
    std::cout << "[TEST] Run client receives the run's cancellation signal" << std::endl;

    std::atomic<CancellationSignal*> client_signal{nullptr};
    std::atomic<bool> fetch_started{false};
    API::PlatformClientFactory binding_factory = [&client_signal, &fetch_started](const std::string&,
                                                                                 CancellationSignal* cancellation_signal) -> API::PlatformClientPtr {
        client_signal.store(cancellation_signal);
        std::unique_ptr<ScriptedPlatformClient> platform_client = std::make_unique<ScriptedPlatformClient>();
        // Blocks like a request in flight until the run is stopped
        ScriptedPlatformClient::CatalogStep slow_fetch = slow_catalog_step(*cancellation_signal, std::chrono::seconds(30));
        platform_client->catalog_steps.push_back([slow_fetch, &fetch_started]() {
            fetch_started.store(true);
            return slow_fetch();
        });
        return platform_client;
    };

    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), binding_factory, recording_sink.sink());
    StartResult start_result = run_controller.start(make_run_config(60));
    TEST_CHECK(start_result.accepted);

    while (!fetch_started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto stop_time = std::chrono::steady_clock::now();
    run_controller.stop(start_result.handle);
    RunResult run_result = run_controller.wait(start_result.handle);
    auto stop_latency = std::chrono::steady_clock::now() - stop_time;

    TEST_CHECK(client_signal.load() != nullptr);
    TEST_CHECK(client_signal.load()->is_requested());
    TEST_CHECK(run_result.outcome == RunOutcome::CANCELLED);
    TEST_CHECK(stop_latency < std::chrono::seconds(5));
}

void test_factory_failure_reports_error() {
    std::cout << "[TEST] Client factory failure ends the run with an error" << std::endl;

    API::PlatformClientFactory failing_factory = [](const std::string&, CancellationSignal*) -> API::PlatformClientPtr {
        throw std::runtime_error("gateway unreachable");
    };

    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), failing_factory, recording_sink.sink());
    StartResult start_result = run_controller.start(make_run_config());
    TEST_CHECK(start_result.accepted);

    RunResult run_result = run_controller.wait(start_result.handle);
    TEST_CHECK(run_result.outcome == RunOutcome::ERROR);
    TEST_CHECK(recording_sink.count_containing("gateway unreachable") == 2);   // cause + termination line
}

void test_worker_initializer_runs_on_worker() {
    std::cout << "[TEST] Worker initializer runs on the worker thread" << std::endl;

    std::thread::id initializer_thread_id;
    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    RecordingSink recording_sink;
    RunController run_controller(make_api_config(), make_buying_factory(call_log), recording_sink.sink(),
                                 [&initializer_thread_id]() { initializer_thread_id = std::this_thread::get_id(); });

    StartResult start_result = run_controller.start(make_run_config());
    run_controller.wait(start_result.handle);

    TEST_CHECK(initializer_thread_id != std::thread::id());
    TEST_CHECK(initializer_thread_id != std::this_thread::get_id());
}

void test_balance_check_uses_own_session() {
    std::cout << "[TEST] Balance check opens and closes its own session" << std::endl;

    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    bool received_signal = true;
    API::PlatformClientFactory balance_factory = [call_log, &received_signal](const std::string&,
                                                                             CancellationSignal* cancellation_signal) -> API::PlatformClientPtr {
        received_signal = cancellation_signal != nullptr;
        std::unique_ptr<ScriptedPlatformClient> platform_client = std::make_unique<ScriptedPlatformClient>(nullptr, call_log);
        platform_client->default_balance = StarsAmount{42, 500000000};
        return platform_client;
    };

    RecordingSink recording_sink;
    BalanceCheck balance_check(balance_factory, recording_sink.sink());
    std::optional<double> balance = balance_check.run("balance.session");

    TEST_CHECK(balance.has_value());
    TEST_CHECK(*balance == 42.5);
    TEST_CHECK(call_log->try_open_calls == 1);
    TEST_CHECK(call_log->close_calls == 1);
    TEST_CHECK(recording_sink.contains("Balance: 42.5 stars"));
    TEST_CHECK(!received_signal);
}

void test_balance_check_failure_is_empty() {
    std::cout << "[TEST] Balance check failure returns no value" << std::endl;

    API::PlatformClientFactory failing_factory = [](const std::string&, CancellationSignal*) -> API::PlatformClientPtr {
        std::unique_ptr<ScriptedPlatformClient> platform_client = std::make_unique<ScriptedPlatformClient>();
        platform_client->balance_steps.push_back([]() -> StarsAmount {
            throw API::PlatformError("payments.getStarsStatus: HTTP 502");
        });
        return platform_client;
    };

    RecordingSink recording_sink;
    BalanceCheck balance_check(failing_factory, recording_sink.sink());
    TEST_CHECK(!balance_check.run("balance.session").has_value());
    TEST_CHECK(recording_sink.count_containing("Failed to get the balance") == 1);

    API::PlatformClientFactory unauthorized_factory = [](const std::string&, CancellationSignal*) -> API::PlatformClientPtr {
        std::unique_ptr<ScriptedPlatformClient> platform_client = std::make_unique<ScriptedPlatformClient>();
        platform_client->open_status = API::SessionStatus::AUTH_REQUIRED;
        return platform_client;
    };
    BalanceCheck unauthorized_check(unauthorized_factory, recording_sink.sink());
    TEST_CHECK(!unauthorized_check.run("balance.session").has_value());
    TEST_CHECK(recording_sink.count_containing("Authorization required") == 1);
}

void test_destructor_stops_active_run() {
    std::cout << "[TEST] Destroying the controller stops the active run" << std::endl;

    std::shared_ptr<ScriptedCallLog> call_log = std::make_shared<ScriptedCallLog>();
    RecordingSink recording_sink;
    auto start_time = std::chrono::steady_clock::now();
    {
        RunController run_controller(make_api_config(), make_idle_factory(call_log), recording_sink.sink());
        StartResult start_result = run_controller.start(make_run_config(30));
        TEST_CHECK(start_result.accepted);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    TEST_CHECK(std::chrono::steady_clock::now() - start_time < std::chrono::seconds(10));
    TEST_CHECK(call_log->close_calls == 1);
}

int main() {
    test_start_and_finish_with_purchase();
    test_second_start_rejected_while_active();
    test_stop_is_idempotent();
    test_stop_wakes_run_promptly();
    test_missing_credentials_refuse_start();
    test_invalid_run_config_refused();
    test_blank_fields_use_defaults();
    test_run_client_bound_to_run_signal();
    test_factory_failure_reports_error();
    test_worker_initializer_runs_on_worker();
    test_balance_check_uses_own_session();
    test_balance_check_failure_is_empty();
    test_destructor_stops_active_run();

    std::cout << "[TEST] All run controller tests passed" << std::endl;
    return 0;
}
