#include "parkspot/service/monitor_thread.hpp"

#include "parkspot/api/jsonl_event_reporter.hpp"
#include "parkspot/api/parking_api_client.hpp"
#include "parkspot/devices/command_distance_reader.hpp"
#include "parkspot/devices/sysfs_indicator.hpp"
#include "parkspot/monitor/occupancy_monitor.hpp"

#include <QDebug>

#include <exception>
#include <iostream>
#include <memory>

namespace parkspot {

MonitorThread::MonitorThread(const AppConfig& config, StopFlag& stop, bool dry_run, QObject* parent)
    : QThread(parent), config_(config), stop_(stop), dry_run_(dry_run)
{
}

void MonitorThread::run() {
    try {
        CommandDistanceReader sonar(config_.sonarCommandLine(), config_.hardware.sonar_timeout_s);
        std::string why;
        if (!sonar.isValid(&why)) {
            qCritical() << "[Service]" << why.c_str();
            result_ = 1;
            return;
        }
        SysfsIndicator led(config_.ledValuePath());

        // created here so the network manager lives on this thread
        std::unique_ptr<IEventReporter> reporter;
        if (dry_run_) reporter = std::make_unique<JsonlEventReporter>(std::cout);
        else reporter = std::make_unique<ParkingApiClient>(config_.api.base_url, config_.api.timeout_s);

        qInfo() << "[Service] Sonar:" << config_.sonarCommandLine().c_str();
        qInfo() << "[Service] LED:" << led.path().c_str();
        qInfo() << "[Service] Events:" << (dry_run_ ? "stdout (dry run)" : config_.api.base_url.c_str());

        OccupancyMonitor monitor(config_.monitorSettings(), sonar, led, *reporter, stop_);
        monitor.run();
        result_ = 0;
    } catch (const std::exception& e) {
        qCritical() << "[Service] Unexpected error in monitor thread:" << e.what();
        result_ = 1;
    }
}

} // namespace parkspot
