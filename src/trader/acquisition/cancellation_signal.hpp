#ifndef CANCELLATION_SIGNAL_HPP
#define CANCELLATION_SIGNAL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace GiftSniper {
namespace Core {

/**
 * One-shot cancellation flag shared between the control thread and a run's
 * worker thread. Once requested it stays set.
 */
class CancellationSignal {
public:
    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    // Returns true only for the call that actually set the flag.
    bool request();
    bool is_requested() const;

    // Sleeps up to wait_duration. Returns true as soon as cancellation is requested.
    bool wait_for(std::chrono::milliseconds wait_duration);

private:
    std::atomic<bool> requested{false};
    std::mutex wait_mutex;
    std::condition_variable wait_cv;
};

} // namespace Core
} // namespace GiftSniper

#endif // CANCELLATION_SIGNAL_HPP
