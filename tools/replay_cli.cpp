// Feeds recorded readings through the occupancy monitor and prints the events it emits.
//   parkspot_replay readings.jsonl [--threshold 10] [--debounce 1]
// One reading per line: {"distance_cm": 8.2} or {"error": "timeout"}
#include <QDebug>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "parkspot/api/jsonl_event_reporter.hpp"
#include "parkspot/devices/scripted_distance_reader.hpp"
#include "parkspot/logging.hpp"
#include "parkspot/monitor/occupancy_monitor.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace parkspot;

namespace {

class LogIndicator : public IIndicator {
public:
    bool set(bool on, IndicatorError&) override {
        if (state_ != on) qInfo() << "[Indicator] LED" << (on ? "ON" : "OFF");
        state_ = on;
        return true;
    }
private:
    bool state_ = false;
};

bool readReadings(const std::string& path, ScriptedDistanceReader& reader, int& count) {
    count = 0;
    if (!fs::exists(path) || !fs::is_regular_file(path)) {
        std::cerr << "[Replay] Error: JSONL file not found: " << path << std::endl;
        return false;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Replay] Error: Failed to open JSONL file: " << path << std::endl;
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            json j = json::parse(line);
            if (j.contains("distance_cm") && j["distance_cm"].is_number()) {
                reader.pushDistance(j["distance_cm"].get<double>());
            } else {
                const std::string why = j.value("error", std::string("no reading"));
                reader.push(ScriptedDistanceReader::Step::failure(
                    why == "timeout" ? SensorError::Timeout : SensorError::DeviceFailure, why));
            }
            ++count;
        } catch (const json::exception& e) {
            std::cerr << "[Replay] Error: line " << line_no << ": " << e.what() << std::endl;
        }
    }
    return count > 0;
}

} // namespace

int main(int argc, char* argv[]) {
    logging::installDefault();

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <readings.jsonl> [--threshold cm] [--debounce n]" << std::endl;
        return 2;
    }

    MonitorSettings settings;
    settings.check_interval_s = 0.0;
    settings.sensor_retry_delay_s = 0.0;
    settings.max_retry_attempts = 1;   // one recorded line per cycle
    for (int i = 2; i + 1 < argc; i += 2) {
        const std::string opt = argv[i];
        try {
            if (opt == "--threshold") settings.distance_threshold_cm = std::stod(argv[i + 1]);
            else if (opt == "--debounce") settings.debounce_readings = std::stoi(argv[i + 1]);
            else { std::cerr << "[Replay] unknown option " << opt << std::endl; return 2; }
        } catch (const std::exception&) {
            std::cerr << "[Replay] bad value for " << opt << ": " << argv[i + 1] << std::endl;
            return 2;
        }
    }
    if (settings.debounce_readings < 1) settings.debounce_readings = 1;

    ScriptedDistanceReader reader;
    int count = 0;
    if (!readReadings(argv[1], reader, count)) return 1;

    LogIndicator led;
    JsonlEventReporter reporter(std::cout);
    StopFlag stop;
    OccupancyMonitor monitor(settings, reader, led, reporter, stop);

    for (int i = 0; i < count; ++i) monitor.poll();

    const MonitorStats& s = monitor.stats();
    std::cerr << "[Replay] readings=" << count << " skipped=" << s.skipped_cycles
              << " events=" << s.events_emitted << " final=" << toString(monitor.state()) << std::endl;
    return 0;
}
