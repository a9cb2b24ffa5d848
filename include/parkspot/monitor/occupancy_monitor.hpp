#ifndef PARKSPOT_OCCUPANCY_MONITOR_HPP
#define PARKSPOT_OCCUPANCY_MONITOR_HPP

#include "data_structures.hpp"
#include "devices.hpp"
#include "stop_flag.hpp"

#include <chrono>
#include <optional>

namespace parkspot {

struct MonitorSettings {
    double distance_threshold_cm = 10.0;
    double check_interval_s      = 0.2;
    int    max_retry_attempts    = 3;
    double sensor_retry_delay_s  = 0.1;
    int    debounce_readings     = 1;     // consecutive agreeing readings to confirm a transition

    // outbox: keep the last failed event and resend it until acknowledged
    bool   retry_failed_events   = false;
    double retry_backoff_s       = 1.0;
    double max_retry_backoff_s   = 60.0;
};

struct PollResult {
    enum Outcome {
        Skipped = 0,    // every read attempt failed (or stop requested while retrying)
        Unchanged,      // reading agrees with the confirmed state
        Debouncing,     // differing reading, not yet confirmed
        Baseline,       // Unknown -> Empty, no event
        Transition      // confirmed transition, event handed to the reporter
    } outcome = Skipped;
    int read_attempts = 0;
    std::optional<Reading> reading;     // accepted sample, empty when skipped
    std::optional<Event> event;
};

struct MonitorStats {
    long long polls = 0;
    long long skipped_cycles = 0;
    long long sensor_failures = 0;
    long long events_emitted = 0;
    long long events_acknowledged = 0;
    long long events_rejected = 0;
    long long report_failures = 0;
    long long events_cancelled = 0;     // pending event and its reversal, both dropped
    long long events_dropped = 0;
    long long indicator_failures = 0;
};

class OccupancyMonitor {
public:
    OccupancyMonitor(const MonitorSettings& settings,
                     IDistanceReader& reader,
                     IIndicator& indicator,
                     IEventReporter& reporter,
                     StopFlag& stop);
    ~OccupancyMonitor() = default;

    OccupancyMonitor(const OccupancyMonitor&) = delete;
    OccupancyMonitor& operator=(const OccupancyMonitor&) = delete;

    // One cycle: resend a due pending event, read (with retries), classify, act.
    PollResult poll();

    // poll() on a fixed interval until the stop flag is raised, then switch the indicator off.
    void run();

    OccupancyState state() const { return state_; }
    const MonitorStats& stats() const { return stats_; }
    bool hasPendingEvent() const { return pending_.has_value(); }
    const MonitorSettings& settings() const { return settings_; }

    OccupancyState classify(double distance_cm) const;

private:
    struct PendingEvent {
        Event event;
        int attempts = 0;
        std::chrono::steady_clock::time_point next_attempt;
    };

    bool acquireReading(Reading& reading, int& attempts);
    void updateIndicator(OccupancyState state);
    void deliver(const Event& event);
    void retryPending();
    void schedule(const Event& event, int attempts);
    std::chrono::steady_clock::duration backoffFor(int attempts) const;
    void shutdown();

    MonitorSettings settings_;
    IDistanceReader& reader_;
    IIndicator& indicator_;
    IEventReporter& reporter_;
    StopFlag& stop_;

    OccupancyState state_ = OccupancyState::Unknown;
    OccupancyState candidate_ = OccupancyState::Unknown;
    int candidate_streak_ = 0;
    std::optional<PendingEvent> pending_;
    MonitorStats stats_;
};

std::chrono::steady_clock::duration secondsToDuration(double seconds);

} // namespace parkspot

#endif
