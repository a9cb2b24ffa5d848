#pragma once
#include <QThread>

#include "parkspot/config.hpp"
#include "parkspot/monitor/stop_flag.hpp"

namespace parkspot {

// Owns the collaborators and runs the occupancy loop off the GUI-less main thread,
// which stays free for signal handling.
class MonitorThread : public QThread {
    Q_OBJECT
public:
    MonitorThread(const AppConfig& config, StopFlag& stop, bool dry_run, QObject* parent = nullptr);

    int result() const { return result_; }

protected:
    void run() override;

private:
    AppConfig config_;
    StopFlag& stop_;
    bool dry_run_;
    int result_ = 0;
};

} // namespace parkspot
