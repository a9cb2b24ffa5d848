#pragma once
// Payloads of the parking API (responses of /arrival, /departure, /status, /events)

#include "parkspot/monitor/data_structures.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

#include <optional>
#include <string>
#include <vector>

namespace parkspot {

// one stored event as the server returns it
struct EventRecord {
    long long   id = -1;
    EventType   type = EventType::Arrival;
    std::string event_time;              // ISO8601

    static std::optional<EventRecord> fromJson(const QJsonObject& o) {
        const auto type = eventTypeFromString(o.value("event_type").toString().toStdString());
        if (!type) return std::nullopt;
        EventRecord r;
        r.type = *type;
        r.id = static_cast<long long>(o.value("id").toDouble(-1));
        r.event_time = o.value("event_time").toString().toStdString();
        return r;
    }

    QJsonObject toJson() const {
        return {
            {"id", static_cast<qint64>(id)},
            {"event_type", QString::fromStdString(toString(type))},
            {"event_time", QString::fromStdString(event_time)}
        };
    }
};

// GET /status
struct StatusReport {
    bool        occupied = false;
    std::string status;
    std::optional<EventRecord> last_event;
};

// GET /events
struct EventList {
    std::vector<EventRecord> events;
    long long total = 0;
};

// Body of a POST /arrival or /departure. A body that is not a JSON object yields
// success with the raw text as message (the server answered 2xx).
inline Acknowledgement acknowledgementFromBody(const QByteArray& body) {
    Acknowledgement ack;
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        ack.success = true;
        ack.message = QString::fromUtf8(body).trimmed().toStdString();
        return ack;
    }

    const QJsonObject o = doc.object();
    ack.success = o.value("success").toBool(true);
    ack.message = o.value("message").toString().toStdString();
    const QJsonObject data = o.value("data").toObject();
    if (data.contains("id")) ack.event_id = static_cast<long long>(data.value("id").toDouble());
    ack.event_time = data.value("event_time").toString().toStdString();
    return ack;
}

// "message" of an error body, or the trimmed body itself
inline std::string messageFromBody(const QByteArray& body) {
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (doc.isObject() && doc.object().contains("message"))
        return doc.object().value("message").toString().toStdString();
    return QString::fromUtf8(body).trimmed().left(200).toStdString();
}

inline bool statusFromBody(const QByteArray& body, StatusReport& out, std::string* err = nullptr) {
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = "status response is not a JSON object";
        return false;
    }
    const QJsonObject o = doc.object();
    if (!o.value("success").toBool(false)) {
        if (err) *err = "status request failed: " + o.value("message").toString().toStdString();
        return false;
    }
    const QJsonObject data = o.value("data").toObject();
    out.occupied = data.value("occupied").toBool(false);
    out.status = data.value("status").toString().toStdString();
    out.last_event.reset();
    if (data.value("last_event").isObject()) out.last_event = EventRecord::fromJson(data.value("last_event").toObject());
    return true;
}

inline bool eventsFromBody(const QByteArray& body, EventList& out, std::string* err = nullptr) {
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = "events response is not a JSON object";
        return false;
    }
    const QJsonObject o = doc.object();
    if (!o.value("success").toBool(false)) {
        if (err) *err = "events request failed: " + o.value("message").toString().toStdString();
        return false;
    }
    out.events.clear();
    const QJsonArray items = o.value("data").toArray();
    for (const auto& item : items) {
        if (!item.isObject()) continue;
        if (auto rec = EventRecord::fromJson(item.toObject())) out.events.push_back(*rec);
    }
    out.total = o.contains("total") ? static_cast<long long>(o.value("total").toDouble())
                                    : static_cast<long long>(out.events.size());
    return true;
}

} // namespace parkspot
