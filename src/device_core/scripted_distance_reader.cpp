#include "parkspot/devices/scripted_distance_reader.hpp"

namespace parkspot {

ScriptedDistanceReader::ScriptedDistanceReader(std::initializer_list<double> distances) {
    for (double d : distances) pushDistance(d);
}

void ScriptedDistanceReader::pushFailure(int count) {
    for (int i = 0; i < count; ++i) steps_.push_back(Step::failure());
}

bool ScriptedDistanceReader::read(double& distance_cm, SensorError& err) {
    ++reads_;
    if (steps_.empty()) {
        if (on_exhausted_) {
            auto cb = std::move(on_exhausted_);
            on_exhausted_ = nullptr;
            cb();
        }
        err = {SensorError::DeviceFailure, "script exhausted"};
        return false;
    }

    const Step step = steps_.front();
    steps_.pop_front();
    if (!step.ok) {
        err = step.error;
        return false;
    }
    distance_cm = step.distance_cm;
    return true;
}

} // namespace parkspot
