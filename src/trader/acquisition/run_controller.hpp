#ifndef RUN_CONTROLLER_HPP
#define RUN_CONTROLLER_HPP

#include "api/general/platform_client_interface.hpp"
#include "configs/api_config.hpp"
#include "configs/run_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/acquisition/cancellation_signal.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace GiftSniper {
namespace Core {

using RunHandle = std::uint64_t;

enum class RunStatus {
    NOT_FOUND,
    ACTIVE,
    FINISHED
};

struct StartResult {
    bool accepted = false;
    RunHandle handle = 0;
    std::string notice;   // Human-readable reason when not accepted
};

/**
 * Starts acquisition runs on a dedicated worker thread and stops them.
 *
 * At most one run is active at a time. Each run creates its own platform
 * session through the injected factory, bound to the run's cancellation
 * signal so stop() also abandons a request in flight, and owns it until the
 * run ends.
 * Finished runs stay queryable by handle for the lifetime of the controller.
 */
class RunController {
public:
    // Invoked first on every worker thread (logging context, thread tag).
    using WorkerInitializer = std::function<void()>;

    RunController(const Config::ApiConfig& api_config_ref,
                  API::PlatformClientFactory platform_client_factory,
                  Logging::LogSink log_sink_value,
                  WorkerInitializer worker_initializer_value = WorkerInitializer());
    ~RunController();

    RunController(const RunController&) = delete;
    RunController& operator=(const RunController&) = delete;

    StartResult start(const Config::RunConfig& run_config);

    // Requests cancellation. No-op for unknown or finished handles.
    void stop(RunHandle handle);

    // Blocks until the run is terminal. Throws std::runtime_error for an unknown handle.
    RunResult wait(RunHandle handle);

    // Empty when the run is still active after wait_duration.
    std::optional<RunResult> wait_for(RunHandle handle, std::chrono::milliseconds wait_duration);

    RunStatus status(RunHandle handle) const;
    std::optional<RunResult> result(RunHandle handle) const;
    bool is_active() const;

private:
    struct RunSlot {
        std::thread worker_thread;
        CancellationSignal cancellation_signal;
        std::mutex result_mutex;
        std::condition_variable result_cv;
        bool finished = false;
        RunResult run_result;
    };

    const Config::ApiConfig api_config;
    API::PlatformClientFactory client_factory;
    Logging::LogSink log_sink;
    WorkerInitializer worker_initializer;

    mutable std::mutex registry_mutex;
    std::map<RunHandle, std::shared_ptr<RunSlot>> run_registry;
    RunHandle next_handle = 1;
    bool credentials_notice_logged = false;

    void execute_run(std::shared_ptr<RunSlot> run_slot, Config::RunConfig run_config);
    void reject_start(StartResult& start_result, const std::string& notice);
    std::shared_ptr<RunSlot> find_slot(RunHandle handle) const;
    void join_finished_workers();

    static bool is_slot_finished(RunSlot& run_slot);
};

} // namespace Core
} // namespace GiftSniper

#endif // RUN_CONTROLLER_HPP
