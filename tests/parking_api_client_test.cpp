#include <gtest/gtest.h>

#include "parkspot/api/parking_api_client.hpp"

#include <QHostAddress>
#include <QNetworkProxy>
#include <QTcpServer>
#include <QTcpSocket>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace parkspot;

namespace {

// Minimal HTTP/1.1 responder living on the test thread. The client's local event loop
// drives it while a request is in flight.
class FakeParkingServer {
public:
    struct Canned {
        int status = 200;
        std::string body;
        bool hang = false;      // accept the request, never answer
    };

    FakeParkingServer() {
        server_.listen(QHostAddress::LocalHost, 0);
        QObject::connect(&server_, &QTcpServer::newConnection, [this] { onConnection(); });
    }

    std::string baseUrl() const {
        return "http://127.0.0.1:" + std::to_string(server_.serverPort()) + "/api/parking";
    }

    void on(const std::string& path, Canned canned) { routes_[path] = std::move(canned); }

    const std::vector<std::string>& requests() const { return requests_; }

private:
    void onConnection() {
        while (QTcpSocket* socket = server_.nextPendingConnection()) {
            auto buffer = std::make_shared<QByteArray>();
            QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket, buffer] {
                buffer->append(socket->readAll());
                if (!buffer->contains("\r\n\r\n")) return;
                const QList<QByteArray> request_line = buffer->left(buffer->indexOf("\r\n")).split(' ');
                buffer->clear();
                if (request_line.size() < 2) return;
                const std::string method = request_line[0].toStdString();
                const std::string path = request_line[1].toStdString();
                requests_.push_back(method + " " + path);
                answer(socket, path);
            });
            QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

    void answer(QTcpSocket* socket, const std::string& path) {
        Canned canned{404, R"({"success": false, "message": "Not found"})", false};
        auto it = routes_.find(path);
        if (it != routes_.end()) canned = it->second;
        if (canned.hang) return;

        const std::string response =
            "HTTP/1.1 " + std::to_string(canned.status) + " Canned\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + std::to_string(canned.body.size()) + "\r\n"
            "Connection: close\r\n\r\n" + canned.body;
        socket->write(response.data(), static_cast<qint64>(response.size()));
        socket->disconnectFromHost();
    }

    QTcpServer server_;
    std::map<std::string, Canned> routes_;
    std::vector<std::string> requests_;
};

Event makeEvent(EventType type) {
    Event e;
    e.type = type;
    e.occurred_at = std::chrono::system_clock::now();
    e.distance_cm = type == EventType::Arrival ? 6.0 : 80.0;
    return e;
}

class ParkingApiClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        QNetworkProxy::setApplicationProxy(QNetworkProxy::NoProxy);
    }

    FakeParkingServer server;
};

} // namespace

TEST_F(ParkingApiClientTest, ArrivalIsPostedAndAcknowledged) {
    server.on("/api/parking/arrival", {200, R"({"success": true, "message": "Arrival recorded",
        "data": {"event_type": "arrival", "event_time": "2025-07-02T10:00:00Z", "id": 5}})"});
    ParkingApiClient client(server.baseUrl(), 2.0);

    Acknowledgement ack;
    ReportError err;
    ASSERT_TRUE(client.report(makeEvent(EventType::Arrival), ack, err)) << err.message;
    EXPECT_TRUE(ack.success);
    EXPECT_EQ(ack.message, "Arrival recorded");
    ASSERT_TRUE(ack.event_id.has_value());
    EXPECT_EQ(*ack.event_id, 5);
    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0], "POST /api/parking/arrival");
}

TEST_F(ParkingApiClientTest, DepartureUsesItsOwnEndpoint) {
    server.on("/api/parking/departure", {201, R"({"success": true, "message": "Departure recorded"})"});
    ParkingApiClient client(server.baseUrl() + "/", 2.0);

    Acknowledgement ack;
    ReportError err;
    ASSERT_TRUE(client.report(makeEvent(EventType::Departure), ack, err)) << err.message;
    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0], "POST /api/parking/departure");
}

TEST_F(ParkingApiClientTest, SuccessFalseIsAnAnsweredRejection) {
    server.on("/api/parking/arrival", {200, R"({"success": false, "message": "Spot already occupied"})"});
    ParkingApiClient client(server.baseUrl(), 2.0);

    Acknowledgement ack;
    ReportError err;
    ASSERT_TRUE(client.report(makeEvent(EventType::Arrival), ack, err));
    EXPECT_FALSE(ack.success);
    EXPECT_EQ(ack.message, "Spot already occupied");
}

TEST_F(ParkingApiClientTest, ClientErrorIsNotTransient) {
    server.on("/api/parking/departure", {400, R"({"success": false, "message": "Invalid event"})"});
    ParkingApiClient client(server.baseUrl(), 2.0);

    Acknowledgement ack;
    ReportError err;
    EXPECT_FALSE(client.report(makeEvent(EventType::Departure), ack, err));
    EXPECT_EQ(err.kind, ReportError::HttpStatus);
    EXPECT_EQ(err.http_status, 400);
    EXPECT_EQ(err.message, "Invalid event");
    EXPECT_FALSE(err.isTransient());
}

TEST_F(ParkingApiClientTest, ServerErrorIsTransient) {
    server.on("/api/parking/arrival", {503, "Service Unavailable"});
    ParkingApiClient client(server.baseUrl(), 2.0);

    Acknowledgement ack;
    ReportError err;
    EXPECT_FALSE(client.report(makeEvent(EventType::Arrival), ack, err));
    EXPECT_EQ(err.kind, ReportError::HttpStatus);
    EXPECT_EQ(err.http_status, 503);
    EXPECT_TRUE(err.isTransient());
}

TEST_F(ParkingApiClientTest, SilentServerTimesOut) {
    FakeParkingServer::Canned hang;
    hang.hang = true;
    server.on("/api/parking/arrival", hang);
    ParkingApiClient client(server.baseUrl(), 0.3);

    Acknowledgement ack;
    ReportError err;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.report(makeEvent(EventType::Arrival), ack, err));
    EXPECT_EQ(err.kind, ReportError::Timeout);
    EXPECT_TRUE(err.isTransient());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST_F(ParkingApiClientTest, RefusedConnectionIsNetworkError) {
    quint16 port = 0;
    {
        QTcpServer probe;
        ASSERT_TRUE(probe.listen(QHostAddress::LocalHost, 0));
        port = probe.serverPort();
    }
    ParkingApiClient client("http://127.0.0.1:" + std::to_string(port) + "/api/parking", 2.0);

    Acknowledgement ack;
    ReportError err;
    EXPECT_FALSE(client.report(makeEvent(EventType::Arrival), ack, err));
    EXPECT_EQ(err.kind, ReportError::Network);
    EXPECT_TRUE(err.isTransient());
}

TEST_F(ParkingApiClientTest, FetchesStatus) {
    server.on("/api/parking/status", {200, R"({"success": true, "data": {"occupied": true, "status": "occupied",
        "last_event": {"event_type": "arrival", "event_time": "2025-07-02T10:00:00Z", "id": 9}}})"});
    ParkingApiClient client(server.baseUrl(), 2.0);

    StatusReport status;
    ReportError err;
    ASSERT_TRUE(client.fetchStatus(status, err)) << err.message;
    EXPECT_TRUE(status.occupied);
    ASSERT_TRUE(status.last_event.has_value());
    EXPECT_EQ(status.last_event->id, 9);
    EXPECT_EQ(server.requests()[0], "GET /api/parking/status");
}

TEST_F(ParkingApiClientTest, FetchesEvents) {
    server.on("/api/parking/events", {200, R"({"success": true, "total": 2, "data": [
        {"event_type": "departure", "event_time": "2025-07-02T11:00:00Z", "id": 2},
        {"event_type": "arrival", "event_time": "2025-07-02T10:00:00Z", "id": 1}]})"});
    ParkingApiClient client(server.baseUrl(), 2.0);

    EventList list;
    ReportError err;
    ASSERT_TRUE(client.fetchEvents(list, err)) << err.message;
    ASSERT_EQ(list.events.size(), 2u);
    EXPECT_EQ(list.events[0].type, EventType::Departure);
    EXPECT_EQ(list.total, 2);
}

TEST_F(ParkingApiClientTest, MalformedStatusIsInvalidResponse) {
    server.on("/api/parking/status", {200, "<html>maintenance</html>"});
    ParkingApiClient client(server.baseUrl(), 2.0);

    StatusReport status;
    ReportError err;
    EXPECT_FALSE(client.fetchStatus(status, err));
    EXPECT_EQ(err.kind, ReportError::InvalidResponse);
}
