#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QString>

#include <csignal>
#include <filesystem>
#include <string>

#include "parkspot/config.hpp"
#include "parkspot/logging.hpp"
#include "parkspot/service/monitor_thread.hpp"
#include "parkspot/service/signal_watcher.hpp"

using namespace parkspot;

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("parkspot_monitor"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PARKSPOT_VERSION));
    logging::installDefault();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Parking spot occupancy monitor"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
                                 QStringLiteral("Configuration file."), QStringLiteral("file"),
                                 QStringLiteral("config/parkspot.yml"));
    QCommandLineOption dryRunOpt(QStringLiteral("dry-run"),
                                 QStringLiteral("Print events as JSON lines instead of calling the API."));
    QCommandLineOption checkOpt(QStringLiteral("check-config"),
                                QStringLiteral("Validate the configuration and exit."));
    parser.addOptions({configOpt, dryRunOpt, checkOpt});
    parser.process(app);

    const std::string config_path = parser.value(configOpt).toStdString();
    AppConfig config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = AppConfig::fromYaml(config_path);
            qInfo() << "[Config] Loaded" << config_path.c_str();
        } else {
            qWarning() << "[Config]" << config_path.c_str() << "not found, using defaults";
        }
    } catch (const ConfigError& e) {
        qCritical() << "[Config]" << e.what();
        return 1;
    }

    std::string why;
    if (!config.isValid(&why)) {
        qCritical() << "[Config] Invalid configuration:" << why.c_str();
        return 1;
    }
    if (parser.isSet(checkOpt)) {
        qInfo() << "[Config] Configuration OK";
        return 0;
    }

    if (!logging::install(config.logging.level, config.logging.file_path, &why)) {
        qWarning() << "[Config]" << why.c_str() << "- logging to stderr only";
    }

    qInfo() << "[Service] Parking Spot Light System Ready (with API integration)";
    qInfo() << "[Service] Checking for objects within"
            << QString::number(config.sensor.distance_threshold_cm, 'f', 1) << "cm (Spot Taken)";

    StopFlag stop;
    SignalWatcher watcher({SIGINT, SIGTERM});
    if (!watcher.isActive()) {
        qWarning() << "[Service] Termination signals are not watched, SIGINT/SIGTERM will kill the process"
                   << "without switching the LED off";
    }
    QObject::connect(&watcher, &SignalWatcher::terminationRequested, [&stop](int signo) {
        qInfo() << "[Service] Signal" << signo << "received, stopping";
        stop.requestStop();
    });

    MonitorThread worker(config, stop, parser.isSet(dryRunOpt));
    QObject::connect(&worker, &QThread::finished, &app, &QCoreApplication::quit);
    worker.start();

    app.exec();
    stop.requestStop();
    worker.wait();

    qInfo() << "[Service] Parking Spot Light System stopped";
    logging::uninstall();
    return worker.result();
}
