#include "parkspot/monitor/stop_flag.hpp"

namespace parkspot {

void StopFlag::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool StopFlag::stopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

bool StopFlag::waitFor(std::chrono::steady_clock::duration d) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (d <= std::chrono::steady_clock::duration::zero()) return !stopped_;
    return !cv_.wait_for(lock, d, [this] { return stopped_; });
}

} // namespace parkspot
