#include "parkspot/monitor/occupancy_monitor.hpp"
#include "parkspot/time_utils.hpp"

#include <QDebug>
#include <QString>

#include <algorithm>
#include <cmath>
#include <exception>

using namespace std;

namespace parkspot {

namespace {

QString cm(double distance_cm) {
    return QString::number(distance_cm, 'f', 1) + QStringLiteral(" cm");
}

} // namespace

chrono::steady_clock::duration secondsToDuration(double seconds) {
    if (!(seconds > 0.0)) return chrono::steady_clock::duration::zero();
    return chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(seconds));
}

OccupancyMonitor::OccupancyMonitor(const MonitorSettings& settings,
                                   IDistanceReader& reader,
                                   IIndicator& indicator,
                                   IEventReporter& reporter,
                                   StopFlag& stop)
    : settings_(settings),
      reader_(reader),
      indicator_(indicator),
      reporter_(reporter),
      stop_(stop)
{
}

OccupancyState OccupancyMonitor::classify(double distance_cm) const {
    return distance_cm <= settings_.distance_threshold_cm ? OccupancyState::Occupied
                                                          : OccupancyState::Empty;
}

bool OccupancyMonitor::acquireReading(Reading& reading, int& attempts) {
    attempts = 0;
    const int max_attempts = max(1, settings_.max_retry_attempts);
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        attempts = attempt;
        double distance_cm = -1.0;
        SensorError err;
        if (reader_.read(distance_cm, err)) {
            if (isfinite(distance_cm) && distance_cm >= 0.0) {
                reading.distance_cm = distance_cm;
                reading.timestamp = chrono::system_clock::now();
                return true;
            }
            // readers that pass the raw sensor value through still report errors as negatives
            err = {SensorError::OutOfRange, "sensor error or out of range, distance " + to_string(distance_cm)};
        }

        ++stats_.sensor_failures;
        qWarning() << "[Monitor] Sensor reading attempt" << attempt << "/" << max_attempts
                   << "failed (" << toString(err.kind).c_str() << "):" << err.message.c_str();

        if (attempt < max_attempts && !stop_.waitFor(secondsToDuration(settings_.sensor_retry_delay_s))) {
            qInfo() << "[Monitor] Stop requested during sensor retries";
            return false;
        }
    }
    qCritical() << "[Monitor] All" << max_attempts << "sensor reading attempts failed";
    return false;
}

void OccupancyMonitor::updateIndicator(OccupancyState state) {
    // LED lit while the spot is free
    const bool on = (state == OccupancyState::Empty);
    IndicatorError err;
    if (!indicator_.set(on, err)) {
        ++stats_.indicator_failures;
        qWarning() << "[Monitor] Failed to update indicator (" << (on ? "on" : "off") << "):"
                   << err.message.c_str();
    }
}

PollResult OccupancyMonitor::poll() {
    PollResult result;
    ++stats_.polls;

    if (pending_) retryPending();

    Reading reading;
    if (!acquireReading(reading, result.read_attempts)) {
        ++stats_.skipped_cycles;
        qWarning() << "[Monitor] Failed to get sensor reading, skipping this cycle";
        result.outcome = PollResult::Skipped;
        return result;
    }
    result.reading = reading;
    const double distance_cm = reading.distance_cm;

    const OccupancyState candidate = classify(distance_cm);
    if (candidate == state_) {
        candidate_ = state_;
        candidate_streak_ = 0;
        result.outcome = PollResult::Unchanged;
        return result;
    }

    if (candidate != candidate_) {
        candidate_ = candidate;
        candidate_streak_ = 0;
    }
    ++candidate_streak_;
    if (candidate_streak_ < settings_.debounce_readings) {
        qDebug() << "[Monitor] Distance:" << cm(distance_cm) << "-" << toString(candidate).c_str()
                 << "reading" << candidate_streak_ << "/" << settings_.debounce_readings
                 << ", waiting for confirmation";
        result.outcome = PollResult::Debouncing;
        return result;
    }
    candidate_streak_ = 0;

    const OccupancyState previous = state_;
    updateIndicator(candidate);

    if (previous == OccupancyState::Unknown && candidate == OccupancyState::Empty) {
        state_ = candidate;
        qInfo() << "[Monitor] Initial state: Spot EMPTY (Distance:" << cm(distance_cm) << ")";
        result.outcome = PollResult::Baseline;
        return result;
    }

    Event event;
    event.type = (candidate == OccupancyState::Occupied) ? EventType::Arrival : EventType::Departure;
    event.occurred_at = reading.timestamp;
    event.distance_cm = distance_cm;

    // local state advances whether or not the report gets through
    state_ = candidate;
    ++stats_.events_emitted;
    qInfo() << "[Monitor] Distance:" << cm(distance_cm) << "- State changed:"
            << toString(previous).c_str() << "->" << toString(candidate).c_str();

    result.outcome = PollResult::Transition;
    result.event = event;
    deliver(event);
    return result;
}

void OccupancyMonitor::deliver(const Event& event) {
    const string type = toString(event.type);
    if (pending_) {
        // the server never saw the pending event, so it and its reversal cancel out
        const string pending_type = toString(pending_->event.type);
        pending_.reset();
        if (pending_type != type) {
            stats_.events_cancelled += 2;
            qInfo() << "[Monitor]" << type.c_str() << "cancels undelivered" << pending_type.c_str()
                    << ", nothing to report";
            return;
        }
    }

    Acknowledgement ack;
    ReportError err;
    if (reporter_.report(event, ack, err)) {
        if (ack.success) {
            ++stats_.events_acknowledged;
            qInfo() << "[Monitor] Event" << type.c_str() << "acknowledged:" << ack.message.c_str();
        } else {
            ++stats_.events_rejected;
            qWarning() << "[Monitor] Event" << type.c_str() << "rejected by server:" << ack.message.c_str();
        }
        return;
    }

    ++stats_.report_failures;
    qWarning() << "[Monitor] Event" << type.c_str() << "not delivered (" << toString(err.kind).c_str()
               << "):" << err.message.c_str();

    if (settings_.retry_failed_events && err.isTransient()) {
        schedule(event, 1);
    } else {
        ++stats_.events_dropped;
    }
}

void OccupancyMonitor::retryPending() {
    if (chrono::steady_clock::now() < pending_->next_attempt) return;

    const PendingEvent pending = *pending_;
    pending_.reset();
    const string type = toString(pending.event.type);
    qInfo() << "[Monitor] Resending" << type.c_str() << "from"
            << TimeUtils::toIso8601Utc(pending.event.occurred_at).c_str()
            << "(attempt" << pending.attempts + 1 << ")";

    Acknowledgement ack;
    ReportError err;
    if (reporter_.report(pending.event, ack, err)) {
        if (ack.success) {
            ++stats_.events_acknowledged;
            qInfo() << "[Monitor] Event" << type.c_str() << "acknowledged on retry:" << ack.message.c_str();
        } else {
            ++stats_.events_rejected;
            qWarning() << "[Monitor] Event" << type.c_str() << "rejected on retry:" << ack.message.c_str();
        }
        return;
    }

    ++stats_.report_failures;
    if (!err.isTransient()) {
        ++stats_.events_dropped;
        qWarning() << "[Monitor] Dropping" << type.c_str() << "after" << toString(err.kind).c_str()
                   << ":" << err.message.c_str();
        return;
    }
    qWarning() << "[Monitor] Retry of" << type.c_str() << "failed (" << toString(err.kind).c_str()
               << "):" << err.message.c_str();
    schedule(pending.event, pending.attempts + 1);
}

chrono::steady_clock::duration OccupancyMonitor::backoffFor(int attempts) const {
    double delay = settings_.retry_backoff_s * pow(2.0, max(0, attempts - 1));
    delay = min(delay, settings_.max_retry_backoff_s);
    return secondsToDuration(delay);
}

void OccupancyMonitor::schedule(const Event& event, int attempts) {
    PendingEvent pending;
    pending.event = event;
    pending.attempts = attempts;
    pending.next_attempt = chrono::steady_clock::now() + backoffFor(attempts);
    pending_ = pending;
    qInfo() << "[Monitor]" << toString(event.type).c_str() << "queued for retry in"
            << chrono::duration<double>(backoffFor(attempts)).count() << "s";
}

void OccupancyMonitor::run() {
    qInfo() << "[Monitor] Monitoring for objects within" << cm(settings_.distance_threshold_cm)
            << "every" << settings_.check_interval_s << "s";

    const auto interval = secondsToDuration(settings_.check_interval_s);
    while (!stop_.stopRequested()) {
        const auto cycle_start = chrono::steady_clock::now();
        try {
            poll();
        } catch (const exception& e) {
            qCritical() << "[Monitor] Unexpected error in poll cycle:" << e.what();
        }

        auto remaining = (cycle_start + interval) - chrono::steady_clock::now();
        if (remaining < chrono::steady_clock::duration::zero()) remaining = chrono::steady_clock::duration::zero();
        stop_.waitFor(remaining);
    }

    shutdown();
}

void OccupancyMonitor::shutdown() {
    IndicatorError err;
    if (!indicator_.set(false, err)) {
        qWarning() << "[Monitor] Error during cleanup:" << err.message.c_str();
    }
    if (pending_) {
        qWarning() << "[Monitor] Stopping with undelivered" << toString(pending_->event.type).c_str();
    }
    qInfo() << "[Monitor] Stopped. polls=" << stats_.polls << "skipped=" << stats_.skipped_cycles
            << "events=" << stats_.events_emitted << "acked=" << stats_.events_acknowledged
            << "rejected=" << stats_.events_rejected << "failed=" << stats_.report_failures;
}

} // namespace parkspot
