#include "parkspot/api/jsonl_event_reporter.hpp"
#include "parkspot/time_utils.hpp"

#include <cmath>

namespace parkspot {

json eventToJson(const Event& event) {
    json j;
    j["event_type"] = toString(event.type);
    j["event_time"] = TimeUtils::toIso8601Utc(event.occurred_at);
    j["distance_cm"] = std::round(event.distance_cm * 10.0) / 10.0;
    return j;
}

bool JsonlEventReporter::report(const Event& event, Acknowledgement& ack, ReportError& err) {
    json j = eventToJson(event);
    j["id"] = next_id_;
    out_ << j.dump() << std::endl;
    if (!out_) {
        err = {ReportError::Network, 0, "output stream closed"};
        return false;
    }

    ack.success = true;
    ack.message = "Recorded " + toString(event.type) + " event";
    ack.event_id = next_id_++;
    ack.event_time = j["event_time"].get<std::string>();
    return true;
}

} // namespace parkspot
