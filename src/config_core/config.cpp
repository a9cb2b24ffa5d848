#include "parkspot/config.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace parkspot {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, double& v)      { if (n[key]) v = n[key].as<double>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

static std::string replacePin(std::string text, int pin) {
    const std::string token = "{pin}";
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos)) {
        const std::string value = std::to_string(pin);
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
    return text;
}

static AppConfig fromNode(const YAML::Node& r, const std::string& base_dir) {
    AppConfig c;
    if (!r || r.IsNull()) return c;
    if (!r.IsMap()) throw ConfigError("top level of the configuration must be a mapping");

    try {
        if (const YAML::Node h = r["hardware"]) {
            try_get(h, "sonar_pin",       c.hardware.sonar_pin);
            try_get(h, "led_pin",         c.hardware.led_pin);
            try_get(h, "sonar_command",   c.hardware.sonar_command);
            try_get(h, "sonar_timeout_s", c.hardware.sonar_timeout_s);
            try_get(h, "led_path",        c.hardware.led_path);
        }
        if (const YAML::Node s = r["sensor"]) {
            try_get(s, "distance_threshold_cm", c.sensor.distance_threshold_cm);
            try_get(s, "check_interval_s",      c.sensor.check_interval_s);
            try_get(s, "max_retry_attempts",    c.sensor.max_retry_attempts);
            try_get(s, "sensor_retry_delay_s",  c.sensor.sensor_retry_delay_s);
            try_get(s, "debounce_readings",     c.sensor.debounce_readings);
        }
        if (const YAML::Node a = r["api"]) {
            try_get(a, "base_url",            c.api.base_url);
            try_get(a, "timeout_s",           c.api.timeout_s);
            try_get(a, "retry_failed_events", c.api.retry_failed_events);
            try_get(a, "retry_backoff_s",     c.api.retry_backoff_s);
            try_get(a, "max_retry_backoff_s", c.api.max_retry_backoff_s);
        }
        if (const YAML::Node l = r["logging"]) {
            try_get(l, "level",     c.logging.level);
            try_get(l, "file_path", c.logging.file_path);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    // log file is relative to the configuration file, not the working directory
    if (!c.logging.file_path.empty() && !base_dir.empty()) {
        fs::path log_path(c.logging.file_path);
        if (log_path.is_relative()) c.logging.file_path = (fs::path(base_dir) / log_path).lexically_normal().string();
    }
    return c;
}

AppConfig AppConfig::fromYaml(const std::string& yaml_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot open configuration file: " + yaml_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot parse " + yaml_path + ": " + e.what());
    }
    const fs::path parent = fs::absolute(fs::path(yaml_path)).parent_path();
    return fromNode(root, parent.string());
}

AppConfig AppConfig::fromYamlString(const std::string& yaml_text, const std::string& base_dir) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("cannot parse configuration: ") + e.what());
    }
    return fromNode(root, base_dir);
}

bool AppConfig::isValid(std::string* err, bool require_sonar) const {
    auto fail = [err](const std::string& msg) { if (err) *err = msg; return false; };

    if (!(sensor.distance_threshold_cm > 0.0)) return fail("sensor.distance_threshold_cm must be > 0");
    if (sensor.check_interval_s < 0.0)         return fail("sensor.check_interval_s must be >= 0");
    if (sensor.max_retry_attempts < 1)         return fail("sensor.max_retry_attempts must be >= 1");
    if (sensor.sensor_retry_delay_s < 0.0)     return fail("sensor.sensor_retry_delay_s must be >= 0");
    if (sensor.debounce_readings < 1)          return fail("sensor.debounce_readings must be >= 1");

    if (api.base_url.rfind("http://", 0) != 0 && api.base_url.rfind("https://", 0) != 0)
        return fail("api.base_url must start with http:// or https://");
    if (!(api.timeout_s > 0.0))                     return fail("api.timeout_s must be > 0");
    if (api.retry_backoff_s < 0.0)                  return fail("api.retry_backoff_s must be >= 0");
    if (api.max_retry_backoff_s < api.retry_backoff_s)
        return fail("api.max_retry_backoff_s must be >= api.retry_backoff_s");

    if (logging.level != "DEBUG" && logging.level != "INFO" &&
        logging.level != "WARNING" && logging.level != "ERROR")
        return fail("logging.level must be one of DEBUG, INFO, WARNING, ERROR");

    if (hardware.sonar_pin < 0 || hardware.led_pin < 0) return fail("hardware pins must be >= 0");
    if (!(hardware.sonar_timeout_s > 0.0))              return fail("hardware.sonar_timeout_s must be > 0");
    if (require_sonar && hardware.sonar_command.empty())
        return fail("hardware.sonar_command is required");
    return true;
}

MonitorSettings AppConfig::monitorSettings() const {
    MonitorSettings m;
    m.distance_threshold_cm = sensor.distance_threshold_cm;
    m.check_interval_s      = sensor.check_interval_s;
    m.max_retry_attempts    = sensor.max_retry_attempts;
    m.sensor_retry_delay_s  = sensor.sensor_retry_delay_s;
    m.debounce_readings     = sensor.debounce_readings;
    m.retry_failed_events   = api.retry_failed_events;
    m.retry_backoff_s       = api.retry_backoff_s;
    m.max_retry_backoff_s   = api.max_retry_backoff_s;
    return m;
}

std::string AppConfig::sonarCommandLine() const {
    return replacePin(hardware.sonar_command, hardware.sonar_pin);
}

std::string AppConfig::ledValuePath() const {
    return replacePin(hardware.led_path, hardware.led_pin);
}

} // namespace parkspot
