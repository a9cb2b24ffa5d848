#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace parkspot {

// Cooperative cancellation shared between the service thread and the monitor loop.
class StopFlag {
public:
    StopFlag() = default;
    StopFlag(const StopFlag&) = delete;
    StopFlag& operator=(const StopFlag&) = delete;

    void requestStop();
    bool stopRequested() const;

    // Blocks for at most d. Returns false when a stop was requested before d elapsed.
    bool waitFor(std::chrono::steady_clock::duration d);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

} // namespace parkspot
