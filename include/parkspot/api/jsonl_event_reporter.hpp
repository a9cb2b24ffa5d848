#pragma once
#include "parkspot/monitor/devices.hpp"

#include <nlohmann/json.hpp>

#include <ostream>

namespace parkspot {

using json = nlohmann::json;

json eventToJson(const Event& event);

// Offline sink: one JSON object per line, always acknowledged.
class JsonlEventReporter : public IEventReporter {
public:
    explicit JsonlEventReporter(std::ostream& out) : out_(out) {}

    bool report(const Event& event, Acknowledgement& ack, ReportError& err) override;

    long long count() const { return next_id_ - 1; }

private:
    std::ostream& out_;
    long long next_id_ = 1;
};

} // namespace parkspot
