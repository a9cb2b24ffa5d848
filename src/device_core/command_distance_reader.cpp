#include "parkspot/devices/command_distance_reader.hpp"

#include <QProcess>

#include <cmath>

namespace parkspot {

CommandDistanceReader::CommandDistanceReader(const std::string& command_line, double timeout_s)
    : timeout_ms_(static_cast<int>(std::lround(timeout_s * 1000.0)))
{
    QStringList parts = QProcess::splitCommand(QString::fromStdString(command_line));
    if (!parts.isEmpty()) {
        program_ = parts.takeFirst();
        arguments_ = parts;
    }
    if (timeout_ms_ < 1) timeout_ms_ = 1;
}

bool CommandDistanceReader::isValid(std::string* err) const {
    if (program_.isEmpty()) {
        if (err) *err = "empty sonar command";
        return false;
    }
    return true;
}

bool CommandDistanceReader::read(double& distance_cm, SensorError& err) {
    if (program_.isEmpty()) {
        err = {SensorError::DeviceFailure, "no sonar command configured"};
        return false;
    }

    QProcess proc;
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.start(program_, arguments_);
    if (!proc.waitForStarted(timeout_ms_)) {
        err = {SensorError::DeviceFailure, "failed to start " + program_.toStdString() + ": " + proc.errorString().toStdString()};
        return false;
    }
    if (!proc.waitForFinished(timeout_ms_)) {
        proc.kill();
        proc.waitForFinished(1000);
        err = {SensorError::Timeout, "no reading within " + std::to_string(timeout_ms_) + " ms"};
        return false;
    }
    if (proc.exitStatus() != QProcess::NormalExit) {
        err = {SensorError::DeviceFailure, "sonar helper crashed"};
        return false;
    }
    if (proc.exitCode() != 0) {
        const QString stderr_text = QString::fromUtf8(proc.readAllStandardError()).trimmed();
        err = {SensorError::DeviceFailure,
               "sonar helper exited with code " + std::to_string(proc.exitCode())
               + (stderr_text.isEmpty() ? std::string() : ": " + stderr_text.toStdString())};
        return false;
    }

    const QStringList lines = QString::fromUtf8(proc.readAllStandardOutput())
                                  .split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    QString last;
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        if (!it->trimmed().isEmpty()) { last = it->trimmed(); break; }
    }

    bool ok = false;
    const double value = last.toDouble(&ok);
    if (!ok || !std::isfinite(value)) {
        err = {SensorError::DeviceFailure, "unparseable sonar output: '" + last.toStdString() + "'"};
        return false;
    }
    if (value < 0.0) {
        err = {SensorError::OutOfRange, "sensor error or out of range, distance " + last.toStdString()};
        return false;
    }
    distance_cm = value;
    return true;
}

} // namespace parkspot
