#ifndef PARKSPOT_DATA_STRUCTURES_HPP
#define PARKSPOT_DATA_STRUCTURES_HPP
#pragma once
#include <chrono>
#include <string>
#include <optional>

namespace parkspot {

// Confirmed occupancy of the spot. Unknown only before the first confirmed reading.
enum class OccupancyState : int {
    Unknown  = 0,
    Empty    = 1,
    Occupied = 2
};

enum class EventType : int {
    Arrival   = 0,
    Departure = 1
};

inline std::string toString(OccupancyState s) {
    switch (s) {
        case OccupancyState::Empty:    return "EMPTY";
        case OccupancyState::Occupied: return "OCCUPIED";
        default:                       return "UNKNOWN";
    }
}

// Also the path segment of the API endpoint.
inline std::string toString(EventType t) {
    return t == EventType::Arrival ? "arrival" : "departure";
}

inline std::optional<EventType> eventTypeFromString(const std::string& s) {
    if (s == "arrival") return EventType::Arrival;
    if (s == "departure") return EventType::Departure;
    return std::nullopt;
}

// accepted sensor sample (finite, >= 0), consumed immediately by the monitor
struct Reading {
    double distance_cm = -1.0;
    std::chrono::system_clock::time_point timestamp;
};

// confirmed transition, handed to the reporter
struct Event {
    EventType type = EventType::Arrival;
    std::chrono::system_clock::time_point occurred_at;
    double distance_cm = -1.0;          // reading that confirmed the transition
};

struct SensorError {
    enum Kind {
        Timeout = 0,
        OutOfRange,
        DeviceFailure
    } kind = DeviceFailure;
    std::string message;
};

struct IndicatorError {
    std::string message;
};

struct ReportError {
    enum Kind {
        Network = 0,
        Timeout,
        HttpStatus,
        InvalidResponse
    } kind = Network;
    int http_status = 0;
    std::string message;

    // worth sending the same event again later
    bool isTransient() const {
        if (kind == Network || kind == Timeout) return true;
        return kind == HttpStatus && http_status >= 500;
    }
};

// remote sink's answer to a report
struct Acknowledgement {
    bool success = false;
    std::string message;
    std::optional<long long> event_id;  // data.id
    std::string event_time;             // data.event_time (ISO8601, as sent by the server)
};

inline std::string toString(SensorError::Kind k) {
    switch (k) {
        case SensorError::Timeout:    return "timeout";
        case SensorError::OutOfRange: return "out of range";
        default:                      return "device failure";
    }
}

inline std::string toString(ReportError::Kind k) {
    switch (k) {
        case ReportError::Timeout:         return "timeout";
        case ReportError::HttpStatus:      return "http status";
        case ReportError::InvalidResponse: return "invalid response";
        default:                           return "network";
    }
}

} // namespace parkspot

#endif
