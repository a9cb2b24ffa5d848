#pragma once
#include "parkspot/api/net_types.hpp"
#include "parkspot/monitor/devices.hpp"

#include <QByteArray>
#include <QString>

#include <memory>
#include <string>

class QNetworkAccessManager;

namespace parkspot {

// Blocking client for the parking API. Every request runs a local event loop bounded by
// timeout_s, so it must be created and used on one thread.
class ParkingApiClient : public IEventReporter {
public:
    ParkingApiClient(const std::string& base_url, double timeout_s);
    ~ParkingApiClient() override;

    ParkingApiClient(const ParkingApiClient&) = delete;
    ParkingApiClient& operator=(const ParkingApiClient&) = delete;

    // POST {base_url}/arrival or /departure, no body
    bool report(const Event& event, Acknowledgement& ack, ReportError& err) override;

    bool fetchStatus(StatusReport& out, ReportError& err);
    bool fetchEvents(EventList& out, ReportError& err);

    QString endpoint(const QString& path) const;

private:
    struct Response {
        int status = 0;
        QByteArray body;
    };

    bool send(const QByteArray& verb, const QString& path, Response& out, ReportError& err);

    QString base_url_;
    int timeout_ms_;
    std::unique_ptr<QNetworkAccessManager> nam_;
};

} // namespace parkspot
