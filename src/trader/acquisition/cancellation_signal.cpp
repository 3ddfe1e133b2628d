#include "cancellation_signal.hpp"

namespace GiftSniper {
namespace Core {

bool CancellationSignal::request() {
    bool was_set = false;
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        was_set = requested.exchange(true);
    }
    wait_cv.notify_all();
    return !was_set;
}

bool CancellationSignal::is_requested() const {
    return requested.load();
}

bool CancellationSignal::wait_for(std::chrono::milliseconds wait_duration) {
    std::unique_lock<std::mutex> lock(wait_mutex);
    return wait_cv.wait_for(lock, wait_duration, [this]{ return requested.load(); });
}

} // namespace Core
} // namespace GiftSniper
