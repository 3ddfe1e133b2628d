#ifndef ACQUISITION_LOOP_HPP
#define ACQUISITION_LOOP_HPP

#include "api/general/platform_client_interface.hpp"
#include "configs/run_config.hpp"
#include "logging/logs/acquisition_logs.hpp"
#include "trader/acquisition/cancellation_signal.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace GiftSniper {
namespace Core {

/**
 * Polls the gift catalog and buys the cheapest affordable eligible offer.
 *
 * AUTHENTICATING -> POLLING_CATALOG -> EVALUATING_OFFERS -> VERIFYING_BALANCE
 * -> ATTEMPTING_PURCHASE -> DONE. The run ends after the first successful
 * purchase, when cancellation is observed, or on a setup/authorization error.
 * Catalog, balance and payment failures are logged and retried on the next
 * poll without limit.
 *
 * run() blocks the calling thread; request cancellation from any other thread
 * through the CancellationSignal passed in. A call the client abandons with
 * OperationCancelledError ends the run as cancelled, not as a failure.
 */
class AcquisitionLoop {
public:
    AcquisitionLoop(const Config::RunConfig& run_config,
                    API::PlatformClientInterface& platform_client_ref,
                    CancellationSignal& cancellation_signal_ref,
                    Logging::AcquisitionLogs& acquisition_logs_ref);

    RunResult run();

    AcquisitionState get_state() const { return state.load(); }
    std::int64_t get_continuation_hash() const { return continuation_hash.load(); }

private:
    enum class SetupResult {
        READY,
        FAILED,
        CANCELLED
    };

    enum class PollResult {
        WAIT,
        EVALUATE,
        CANCELLED
    };

    enum class PurchaseResult {
        PURCHASED,
        FAILED,
        CANCELLED
    };

    enum class BatchResult {
        PURCHASED,
        EXHAUSTED,
        CANCELLED
    };

    const Config::RunConfig config;
    API::PlatformClientInterface& platform_client;
    CancellationSignal& cancellation_signal;
    Logging::AcquisitionLogs& logs;

    std::atomic<AcquisitionState> state{AcquisitionState::AUTHENTICATING};
    std::atomic<std::int64_t> continuation_hash{0};
    PeerRef recipient_peer;

    SetupResult authenticate(RunResult& run_result);
    PollResult poll_catalog(CatalogSnapshot& catalog_snapshot);
    BatchResult attempt_candidates(const std::vector<Offer>& candidates, RunResult& run_result);
    PurchaseResult attempt_purchase(const Offer& candidate);

    // Interruptible wait of one poll interval. Returns true when cancelled.
    bool wait_poll_interval();

    RunResult finish(RunResult run_result);
    RunResult finish_cancelled();
};

} // namespace Core
} // namespace GiftSniper

#endif // ACQUISITION_LOOP_HPP
