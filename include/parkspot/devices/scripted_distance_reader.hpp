#pragma once
#include "parkspot/monitor/devices.hpp"

#include <deque>
#include <functional>

namespace parkspot {

// Replays recorded readings in order. Once the script runs dry every read fails.
class ScriptedDistanceReader : public IDistanceReader {
public:
    struct Step {
        bool ok = true;
        double distance_cm = 0.0;
        SensorError error;

        static Step distance(double cm) { Step s; s.distance_cm = cm; return s; }
        static Step failure(SensorError::Kind kind = SensorError::DeviceFailure, const std::string& msg = "no echo") {
            Step s; s.ok = false; s.error = {kind, msg}; return s;
        }
    };

    ScriptedDistanceReader() = default;
    explicit ScriptedDistanceReader(std::initializer_list<double> distances);

    void push(const Step& step) { steps_.push_back(step); }
    void pushDistance(double cm) { steps_.push_back(Step::distance(cm)); }
    void pushFailure(int count = 1);

    // called once when a read finds the script empty
    void onExhausted(std::function<void()> cb) { on_exhausted_ = std::move(cb); }

    bool read(double& distance_cm, SensorError& err) override;

    bool exhausted() const { return steps_.empty(); }
    int readCount() const { return reads_; }

private:
    std::deque<Step> steps_;
    std::function<void()> on_exhausted_;
    int reads_ = 0;
};

} // namespace parkspot
