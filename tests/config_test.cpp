#include <gtest/gtest.h>

#include "parkspot/config.hpp"

#include <filesystem>
#include <fstream>

using namespace parkspot;
namespace fs = std::filesystem;

TEST(ConfigTest, DefaultsMatchDeployment) {
    AppConfig c;
    EXPECT_EQ(c.hardware.sonar_pin, 12);
    EXPECT_EQ(c.hardware.led_pin, 16);
    EXPECT_DOUBLE_EQ(c.sensor.distance_threshold_cm, 10.0);
    EXPECT_DOUBLE_EQ(c.sensor.check_interval_s, 0.2);
    EXPECT_EQ(c.sensor.max_retry_attempts, 3);
    EXPECT_DOUBLE_EQ(c.sensor.sensor_retry_delay_s, 0.1);
    EXPECT_EQ(c.api.base_url, "https://dpo.been-jammin.ch/api/parking");
    EXPECT_DOUBLE_EQ(c.api.timeout_s, 5.0);
    EXPECT_EQ(c.logging.level, "INFO");
    EXPECT_EQ(c.ledValuePath(), "/sys/class/gpio/gpio16/value");
    EXPECT_TRUE(c.isValid(nullptr, false));
}

TEST(ConfigTest, ParsesAllSections) {
    const AppConfig c = AppConfig::fromYamlString(R"(
hardware:
  sonar_pin: 5
  led_pin: 6
  sonar_command: "read_sonar --pin {pin} --echo {pin}"
  led_path: /sys/class/leds/spot{pin}/brightness
sensor:
  distance_threshold_cm: 25.5
  check_interval_s: 1
  max_retry_attempts: 5
  sensor_retry_delay_s: 0.25
  debounce_readings: 3
api:
  base_url: http://localhost:8080/api/parking
  timeout_s: 2
  retry_failed_events: true
  retry_backoff_s: 0.5
  max_retry_backoff_s: 8
logging:
  level: DEBUG
  file_path: /var/log/parkspot.log
)");
    EXPECT_EQ(c.sonarCommandLine(), "read_sonar --pin 5 --echo 5");
    EXPECT_EQ(c.ledValuePath(), "/sys/class/leds/spot6/brightness");
    EXPECT_DOUBLE_EQ(c.sensor.distance_threshold_cm, 25.5);
    EXPECT_EQ(c.sensor.debounce_readings, 3);
    EXPECT_EQ(c.logging.file_path, "/var/log/parkspot.log");
    ASSERT_TRUE(c.isValid());

    const MonitorSettings m = c.monitorSettings();
    EXPECT_DOUBLE_EQ(m.distance_threshold_cm, 25.5);
    EXPECT_DOUBLE_EQ(m.check_interval_s, 1.0);
    EXPECT_EQ(m.max_retry_attempts, 5);
    EXPECT_DOUBLE_EQ(m.sensor_retry_delay_s, 0.25);
    EXPECT_EQ(m.debounce_readings, 3);
    EXPECT_TRUE(m.retry_failed_events);
    EXPECT_DOUBLE_EQ(m.retry_backoff_s, 0.5);
    EXPECT_DOUBLE_EQ(m.max_retry_backoff_s, 8.0);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    const AppConfig c = AppConfig::fromYamlString("sensor:\n  distance_threshold_cm: 12\n");
    EXPECT_DOUBLE_EQ(c.sensor.distance_threshold_cm, 12.0);
    EXPECT_EQ(c.sensor.max_retry_attempts, 3);
    EXPECT_EQ(c.api.base_url, AppConfig().api.base_url);
}

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    const AppConfig c = AppConfig::fromYamlString("");
    EXPECT_EQ(c.hardware.sonar_pin, 12);
}

TEST(ConfigTest, WrongTypeThrows) {
    EXPECT_THROW(AppConfig::fromYamlString("sensor:\n  max_retry_attempts: lots\n"), ConfigError);
    EXPECT_THROW(AppConfig::fromYamlString("- just\n- a list\n"), ConfigError);
    EXPECT_THROW(AppConfig::fromYamlString("sensor: [unclosed\n"), ConfigError);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(AppConfig::fromYaml("/nonexistent/parkspot.yml"), ConfigError);
}

TEST(ConfigTest, RelativeLogPathFollowsConfigFile) {
    const fs::path dir = fs::temp_directory_path() / "parkspot_config_test";
    fs::create_directories(dir);
    const fs::path file = dir / "parkspot.yml";
    {
        std::ofstream ofs(file);
        ofs << "logging:\n  file_path: logs/spot.log\n";
    }
    const AppConfig c = AppConfig::fromYaml(file.string());
    EXPECT_EQ(fs::path(c.logging.file_path), (fs::absolute(dir) / "logs" / "spot.log").lexically_normal());
    fs::remove_all(dir);
}

TEST(ConfigTest, ValidationRejectsBadValues) {
    std::string why;
    AppConfig c;
    c.hardware.sonar_command = "echo 20";
    ASSERT_TRUE(c.isValid(&why)) << why;

    AppConfig bad = c;
    bad.sensor.max_retry_attempts = 0;
    EXPECT_FALSE(bad.isValid(&why));
    EXPECT_NE(why.find("max_retry_attempts"), std::string::npos);

    bad = c; bad.sensor.distance_threshold_cm = 0.0;
    EXPECT_FALSE(bad.isValid());
    bad = c; bad.sensor.debounce_readings = 0;
    EXPECT_FALSE(bad.isValid());
    bad = c; bad.api.base_url = "ftp://example.org";
    EXPECT_FALSE(bad.isValid());
    bad = c; bad.api.timeout_s = 0.0;
    EXPECT_FALSE(bad.isValid());
    bad = c; bad.api.max_retry_backoff_s = 0.1;
    EXPECT_FALSE(bad.isValid());
    bad = c; bad.logging.level = "VERBOSE";
    EXPECT_FALSE(bad.isValid());

    bad = c; bad.hardware.sonar_command.clear();
    EXPECT_FALSE(bad.isValid(&why));
    EXPECT_TRUE(bad.isValid(&why, false));
}
