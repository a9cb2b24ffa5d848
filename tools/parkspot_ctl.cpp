// Bring-up and inspection tool: query the API, sample the sonar, drive the LED.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QThread>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include "parkspot/api/parking_api_client.hpp"
#include "parkspot/config.hpp"
#include "parkspot/devices/command_distance_reader.hpp"
#include "parkspot/devices/sysfs_indicator.hpp"
#include "parkspot/logging.hpp"
#include "parkspot/time_utils.hpp"

using namespace parkspot;

static void printEvent(const EventRecord& e) {
    std::cout << "  #" << e.id << " " << std::left << std::setw(10) << toString(e.type)
              << " " << e.event_time << "\n";
}

static int cmdStatus(const AppConfig& cfg) {
    ParkingApiClient api(cfg.api.base_url, cfg.api.timeout_s);
    StatusReport status;
    ReportError err;
    if (!api.fetchStatus(status, err)) {
        std::cerr << "[ctl] status failed (" << toString(err.kind) << "): " << err.message << "\n";
        return 1;
    }
    std::cout << "Spot: " << (status.occupied ? "OCCUPIED" : "EMPTY")
              << " (" << status.status << ")\n";
    if (status.last_event) {
        std::cout << "Last event:\n";
        printEvent(*status.last_event);
    }
    return 0;
}

static int cmdEvents(const AppConfig& cfg, int limit) {
    ParkingApiClient api(cfg.api.base_url, cfg.api.timeout_s);
    EventList list;
    ReportError err;
    if (!api.fetchEvents(list, err)) {
        std::cerr << "[ctl] events failed (" << toString(err.kind) << "): " << err.message << "\n";
        return 1;
    }
    std::cout << "Events (" << list.total << " total):\n";
    int shown = 0;
    for (const auto& e : list.events) {
        if (limit > 0 && shown++ >= limit) break;
        printEvent(e);
    }
    return 0;
}

static int cmdProbe(const AppConfig& cfg, int count, double interval_s) {
    CommandDistanceReader sonar(cfg.sonarCommandLine(), cfg.hardware.sonar_timeout_s);
    std::string why;
    if (!sonar.isValid(&why)) {
        std::cerr << "[ctl] " << why << "\n";
        return 1;
    }
    std::cout << "--- Ultrasonic sensor test: " << cfg.sonarCommandLine() << " ---\n";
    int failures = 0;
    for (int i = 0; i < count; ++i) {
        double cm = 0.0;
        SensorError err;
        const std::string ts = TimeUtils::getCurrentTimestamp();
        if (sonar.read(cm, err)) {
            std::cout << "[" << ts << "] Distance: " << std::fixed << std::setprecision(1) << cm << " cm"
                      << (cm <= cfg.sensor.distance_threshold_cm ? "  (taken)" : "") << "\n";
        } else {
            ++failures;
            std::cout << "[" << ts << "] Sensor error (" << toString(err.kind) << "): " << err.message << "\n";
        }
        if (i + 1 < count) QThread::msleep(static_cast<unsigned long>(interval_s * 1000.0));
    }
    return failures == count ? 1 : 0;
}

static int cmdLed(const AppConfig& cfg, const QString& value) {
    if (value != QLatin1String("on") && value != QLatin1String("off")) {
        std::cerr << "[ctl] led expects 'on' or 'off'\n";
        return 2;
    }
    SysfsIndicator led(cfg.ledValuePath());
    IndicatorError err;
    if (!led.set(value == QLatin1String("on"), err)) {
        std::cerr << "[ctl] " << err.message << "\n";
        return 1;
    }
    std::cout << "LED " << value.toStdString() << " (" << led.path() << ")\n";
    return 0;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("parkspot_ctl"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PARKSPOT_VERSION));
    logging::installDefault();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Parking spot monitor control tool"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("status | events | probe | led on|off"));
    QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
                                 QStringLiteral("Configuration file."), QStringLiteral("file"),
                                 QStringLiteral("config/parkspot.yml"));
    QCommandLineOption countOpt(QStringLiteral("count"), QStringLiteral("Readings for probe."),
                                QStringLiteral("n"), QStringLiteral("10"));
    QCommandLineOption limitOpt(QStringLiteral("limit"), QStringLiteral("Events to print (0 = all)."),
                                QStringLiteral("n"), QStringLiteral("20"));
    parser.addOptions({configOpt, countOpt, limitOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) parser.showHelp(2);

    AppConfig cfg;
    const std::string config_path = parser.value(configOpt).toStdString();
    try {
        if (std::filesystem::exists(config_path)) cfg = AppConfig::fromYaml(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ctl] " << e.what() << "\n";
        return 1;
    }
    std::string why;
    if (!cfg.isValid(&why, false)) {
        std::cerr << "[ctl] Invalid configuration: " << why << "\n";
        return 1;
    }

    const QString cmd = args.first();
    if (cmd == QLatin1String("status")) return cmdStatus(cfg);
    if (cmd == QLatin1String("events")) return cmdEvents(cfg, parser.value(limitOpt).toInt());
    if (cmd == QLatin1String("probe")) {
        const int count = parser.value(countOpt).toInt();
        return cmdProbe(cfg, count > 0 ? count : 10, 0.5);
    }
    if (cmd == QLatin1String("led")) {
        if (args.size() < 2) parser.showHelp(2);
        return cmdLed(cfg, args.at(1));
    }
    std::cerr << "[ctl] unknown command: " << cmd.toStdString() << "\n";
    return 2;
}
