#pragma once
#include "parkspot/monitor/devices.hpp"

#include <optional>
#include <string>

namespace parkspot {

// LED behind a sysfs value file (/sys/class/gpio/gpioN/value or /sys/class/leds/<name>/brightness).
class SysfsIndicator : public IIndicator {
public:
    explicit SysfsIndicator(const std::string& value_path);

    bool set(bool on, IndicatorError& err) override;

    const std::string& path() const { return path_; }
    std::optional<bool> lastWritten() const { return last_; }

private:
    std::string path_;
    std::optional<bool> last_;
};

} // namespace parkspot
