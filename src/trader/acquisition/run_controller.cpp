#include "run_controller.hpp"
#include "configs/config_loader.hpp"
#include "logging/logs/acquisition_logs.hpp"
#include "trader/acquisition/acquisition_loop.hpp"
#include <stdexcept>
#include <utility>

namespace GiftSniper {
namespace Core {

RunController::RunController(const Config::ApiConfig& api_config_ref,
                             API::PlatformClientFactory platform_client_factory,
                             Logging::LogSink log_sink_value,
                             WorkerInitializer worker_initializer_value)
    : api_config(api_config_ref), client_factory(std::move(platform_client_factory)),
      log_sink(std::move(log_sink_value)), worker_initializer(std::move(worker_initializer_value)) {}

RunController::~RunController() {
    std::lock_guard<std::mutex> registry_lock(registry_mutex);
    for (auto& registry_entry : run_registry) {
        registry_entry.second->cancellation_signal.request();
    }
    for (auto& registry_entry : run_registry) {
        if (registry_entry.second->worker_thread.joinable()) {
            registry_entry.second->worker_thread.join();
        }
    }
}

StartResult RunController::start(const Config::RunConfig& run_config) {
    StartResult start_result;
    std::lock_guard<std::mutex> registry_lock(registry_mutex);

    if (!Config::has_api_credentials(api_config)) {
        start_result.notice = "TG_API_ID and TG_API_HASH must be set before a run can start";
        if (!credentials_notice_logged) {
            reject_start(start_result, start_result.notice);
            credentials_notice_logged = true;
        }
        return start_result;
    }

    Config::RunConfig normalized_config = Config::normalize_run_config(run_config);
    std::string validation_error;
    if (!Config::validate_run_config(normalized_config, validation_error)) {
        reject_start(start_result, validation_error);
        return start_result;
    }

    for (const auto& registry_entry : run_registry) {
        if (!is_slot_finished(*registry_entry.second)) {
            reject_start(start_result, "a run is already active");
            return start_result;
        }
    }

    join_finished_workers();

    std::shared_ptr<RunSlot> run_slot = std::make_shared<RunSlot>();
    RunHandle handle = next_handle++;
    run_registry[handle] = run_slot;
    run_slot->worker_thread = std::thread(&RunController::execute_run, this, run_slot, normalized_config);

    start_result.accepted = true;
    start_result.handle = handle;
    return start_result;
}

void RunController::stop(RunHandle handle) {
    std::shared_ptr<RunSlot> run_slot = find_slot(handle);
    if (!run_slot || is_slot_finished(*run_slot)) {
        return;
    }
    run_slot->cancellation_signal.request();
}

RunResult RunController::wait(RunHandle handle) {
    std::shared_ptr<RunSlot> run_slot = find_slot(handle);
    if (!run_slot) {
        throw std::runtime_error("Unknown run handle: " + std::to_string(handle));
    }
    std::unique_lock<std::mutex> result_lock(run_slot->result_mutex);
    run_slot->result_cv.wait(result_lock, [&run_slot]{ return run_slot->finished; });
    return run_slot->run_result;
}

std::optional<RunResult> RunController::wait_for(RunHandle handle, std::chrono::milliseconds wait_duration) {
    std::shared_ptr<RunSlot> run_slot = find_slot(handle);
    if (!run_slot) {
        throw std::runtime_error("Unknown run handle: " + std::to_string(handle));
    }
    std::unique_lock<std::mutex> result_lock(run_slot->result_mutex);
    if (!run_slot->result_cv.wait_for(result_lock, wait_duration, [&run_slot]{ return run_slot->finished; })) {
        return std::nullopt;
    }
    return run_slot->run_result;
}

RunStatus RunController::status(RunHandle handle) const {
    std::shared_ptr<RunSlot> run_slot = find_slot(handle);
    if (!run_slot) {
        return RunStatus::NOT_FOUND;
    }
    return is_slot_finished(*run_slot) ? RunStatus::FINISHED : RunStatus::ACTIVE;
}

std::optional<RunResult> RunController::result(RunHandle handle) const {
    std::shared_ptr<RunSlot> run_slot = find_slot(handle);
    if (!run_slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> result_lock(run_slot->result_mutex);
    if (!run_slot->finished) {
        return std::nullopt;
    }
    return run_slot->run_result;
}

bool RunController::is_active() const {
    std::lock_guard<std::mutex> registry_lock(registry_mutex);
    for (const auto& registry_entry : run_registry) {
        if (!is_slot_finished(*registry_entry.second)) {
            return true;
        }
    }
    return false;
}

void RunController::execute_run(std::shared_ptr<RunSlot> run_slot, Config::RunConfig run_config) {
    Logging::AcquisitionLogs acquisition_logs(log_sink);
    RunResult run_result;

    try {
        if (worker_initializer) {
            worker_initializer();
        }

        API::PlatformClientPtr platform_client = client_factory(run_config.session, &run_slot->cancellation_signal);
        if (!platform_client) {
            throw std::runtime_error("Platform client factory returned no client");
        }

        AcquisitionLoop acquisition_loop(run_config, *platform_client, run_slot->cancellation_signal, acquisition_logs);
        run_result = acquisition_loop.run();

        try {
            platform_client->close();
        } catch (const API::PlatformError& close_exception_error) {
            acquisition_logs.log_session_close_error(close_exception_error.what());
        }
    } catch (const std::exception& exception_error) {
        acquisition_logs.log_run_exception(exception_error.what());
        run_result.outcome = RunOutcome::ERROR;
        run_result.purchase.reset();
        run_result.reason = exception_error.what();
        acquisition_logs.log_run_finished(run_result);
    } catch (...) {
        acquisition_logs.log_run_exception("unknown error");
        run_result.outcome = RunOutcome::ERROR;
        run_result.purchase.reset();
        run_result.reason = "unknown error";
        acquisition_logs.log_run_finished(run_result);
    }

    acquisition_logs.log_background_task_finished();

    {
        std::lock_guard<std::mutex> result_lock(run_slot->result_mutex);
        run_slot->run_result = run_result;
        run_slot->finished = true;
    }
    run_slot->result_cv.notify_all();
}

void RunController::reject_start(StartResult& start_result, const std::string& notice) {
    start_result.accepted = false;
    start_result.notice = notice;
    Logging::AcquisitionLogs(log_sink).log_start_rejected(notice);
}

std::shared_ptr<RunController::RunSlot> RunController::find_slot(RunHandle handle) const {
    std::lock_guard<std::mutex> registry_lock(registry_mutex);
    auto registry_iterator = run_registry.find(handle);
    if (registry_iterator == run_registry.end()) {
        return nullptr;
    }
    return registry_iterator->second;
}

void RunController::join_finished_workers() {
    for (auto& registry_entry : run_registry) {
        if (registry_entry.second->worker_thread.joinable() && is_slot_finished(*registry_entry.second)) {
            registry_entry.second->worker_thread.join();
        }
    }
}

bool RunController::is_slot_finished(RunSlot& run_slot) {
    std::lock_guard<std::mutex> result_lock(run_slot.result_mutex);
    return run_slot.finished;
}

} // namespace Core
} // namespace GiftSniper
