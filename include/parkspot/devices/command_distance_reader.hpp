#pragma once
#include "parkspot/monitor/devices.hpp"

#include <QString>
#include <QStringList>

#include <string>

namespace parkspot {

// Runs an external helper that prints the distance in cm on stdout (last line wins).
class CommandDistanceReader : public IDistanceReader {
public:
    CommandDistanceReader(const std::string& command_line, double timeout_s);

    bool read(double& distance_cm, SensorError& err) override;

    bool isValid(std::string* err = nullptr) const;

private:
    QString program_;
    QStringList arguments_;
    int timeout_ms_;
};

} // namespace parkspot
