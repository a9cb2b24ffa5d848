#pragma once
// Capabilities the occupancy monitor drives. Implementations live in devices/ and api/.

#include "data_structures.hpp"

namespace parkspot {

class IDistanceReader {
public:
    virtual ~IDistanceReader() = default;

    // Single measurement in cm. On failure returns false and fills err.
    virtual bool read(double& distance_cm, SensorError& err) = 0;
};

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Idempotent: setting the current value again has no further effect.
    virtual bool set(bool on, IndicatorError& err) = 0;
};

class IEventReporter {
public:
    virtual ~IEventReporter() = default;

    // Returns true when the sink answered (ack.success may still be false),
    // false on transport, timeout or HTTP level failures.
    virtual bool report(const Event& event, Acknowledgement& ack, ReportError& err) = 0;
};

} // namespace parkspot
