#pragma once
#include "parkspot/monitor/occupancy_monitor.hpp"

#include <stdexcept>
#include <string>

namespace parkspot {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Process-wide settings (loaded once from parkspot.yml)
struct AppConfig {
    // ===================== hardware ===================== //
    struct Hardware {
        int sonar_pin = 12;
        int led_pin   = 16;
        std::string sonar_command;                              // external distance helper, "{pin}" -> sonar_pin
        double sonar_timeout_s = 2.0;
        std::string led_path = "/sys/class/gpio/gpio{pin}/value";  // "{pin}" -> led_pin
    } hardware;

    // ===================== sensor policy ===================== //
    struct Sensor {
        double distance_threshold_cm = 10.0;   // <= threshold: spot taken
        double check_interval_s      = 0.2;
        int    max_retry_attempts    = 3;
        double sensor_retry_delay_s  = 0.1;
        int    debounce_readings     = 1;
    } sensor;

    // ===================== reporting policy ===================== //
    struct Api {
        std::string base_url = "https://dpo.been-jammin.ch/api/parking";
        double timeout_s = 5.0;
        bool   retry_failed_events = false;
        double retry_backoff_s     = 1.0;
        double max_retry_backoff_s = 60.0;
    } api;

    // ===================== logging ===================== //
    struct Logging {
        std::string level     = "INFO";        // DEBUG, INFO, WARNING, ERROR
        std::string file_path = "parking_spot.log";
    } logging;

    // Missing keys keep their defaults. Throws ConfigError on unreadable YAML or mistyped values.
    static AppConfig fromYaml(const std::string& yaml_path);
    static AppConfig fromYamlString(const std::string& yaml_text, const std::string& base_dir = "");

    // require_sonar: the live monitor needs a sonar_command, offline tools do not
    bool isValid(std::string* err = nullptr, bool require_sonar = true) const;

    MonitorSettings monitorSettings() const;
    std::string sonarCommandLine() const;
    std::string ledValuePath() const;
};

} // namespace parkspot
