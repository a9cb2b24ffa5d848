#include "parkspot/api/parking_api_client.hpp"

#include <QDebug>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <cmath>

namespace parkspot {

ParkingApiClient::ParkingApiClient(const std::string& base_url, double timeout_s)
    : base_url_(QString::fromStdString(base_url)),
      timeout_ms_(static_cast<int>(std::lround(timeout_s * 1000.0))),
      nam_(std::make_unique<QNetworkAccessManager>())
{
    while (base_url_.endsWith(QLatin1Char('/'))) base_url_.chop(1);
    if (timeout_ms_ < 1) timeout_ms_ = 1;
}

ParkingApiClient::~ParkingApiClient() = default;

QString ParkingApiClient::endpoint(const QString& path) const {
    return base_url_ + QLatin1Char('/') + path;
}

bool ParkingApiClient::send(const QByteArray& verb, const QString& path, Response& out, ReportError& err) {
    const QUrl url(endpoint(path));
    if (!url.isValid()) {
        err = {ReportError::Network, 0, "invalid url " + url.toString().toStdString()};
        return false;
    }

    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");

    std::unique_ptr<QNetworkReply> reply(verb == "POST" ? nam_->post(request, QByteArray())
                                                        : nam_->get(request));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(timeout_ms_);
    if (!reply->isFinished()) loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        err = {ReportError::Timeout, 0, verb.toStdString() + " " + url.toString().toStdString()
                                        + " timed out after " + std::to_string(timeout_ms_) + " ms"};
        return false;
    }
    timer.stop();

    const QVariant status_attr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status_attr.isValid()) {
        err = {ReportError::Network, 0, "unable to connect to server: " + reply->errorString().toStdString()};
        return false;
    }

    out.status = status_attr.toInt();
    out.body = reply->readAll();
    return true;
}

bool ParkingApiClient::report(const Event& event, Acknowledgement& ack, ReportError& err) {
    const QString path = QString::fromStdString(toString(event.type));
    Response response;
    if (!send("POST", path, response, err)) {
        qWarning() << "[Api] API call" << path << "failed:" << err.message.c_str();
        return false;
    }

    if (response.status < 200 || response.status >= 300) {
        err = {ReportError::HttpStatus, response.status, messageFromBody(response.body)};
        qWarning() << "[Api] API call" << path << "failed. Status:" << response.status
                   << "Response:" << response.body.constData();
        return false;
    }

    ack = acknowledgementFromBody(response.body);
    qInfo() << "[Api] API call" << path << "answered" << response.status << ":" << response.body.constData();
    return true;
}

bool ParkingApiClient::fetchStatus(StatusReport& out, ReportError& err) {
    Response response;
    if (!send("GET", QStringLiteral("status"), response, err)) return false;
    if (response.status < 200 || response.status >= 300) {
        err = {ReportError::HttpStatus, response.status, messageFromBody(response.body)};
        return false;
    }
    std::string why;
    if (!statusFromBody(response.body, out, &why)) {
        err = {ReportError::InvalidResponse, response.status, why};
        return false;
    }
    return true;
}

bool ParkingApiClient::fetchEvents(EventList& out, ReportError& err) {
    Response response;
    if (!send("GET", QStringLiteral("events"), response, err)) return false;
    if (response.status < 200 || response.status >= 300) {
        err = {ReportError::HttpStatus, response.status, messageFromBody(response.body)};
        return false;
    }
    std::string why;
    if (!eventsFromBody(response.body, out, &why)) {
        err = {ReportError::InvalidResponse, response.status, why};
        return false;
    }
    return true;
}

} // namespace parkspot
