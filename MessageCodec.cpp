#include "MessageCodec.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <QVariant>
#include <cmath>

namespace MessageCodec {

std::string name_for(StationState state) {
    switch (state) {
        case StationState::Active: return "ACTIVE";
        case StationState::Standby: return "STANDBY";
        case StationState::Maintenance: return "MAINTENANCE";
        case StationState::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

StationState state_from_name(const std::string& name) {
    for (StationState s : STATE_CYCLE) {
        if (name_for(s) == name) return s;
    }
    return StationState::Unknown;
}

bool encode(const BroadcastMessage& msg, std::string& out) {
    QJsonObject obj;
    obj.insert(QStringLiteral("message_id"), QJsonValue(static_cast<qint64>(msg.message_id)));
    obj.insert(QStringLiteral("timestamp"), QString::fromStdString(msg.timestamp));
    obj.insert(QStringLiteral("state"), QString::fromStdString(name_for(msg.state)));
    if (msg.response_port != 0) {
        obj.insert(QLatin1String(RESPONSE_PORT_KEY), static_cast<int>(msg.response_port));
    }

    QByteArray bytes = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    if (static_cast<std::size_t>(bytes.size()) > MAX_DATAGRAM_SIZE) return false;
    out.assign(bytes.constData(), static_cast<std::size_t>(bytes.size()));
    return true;
}

bool decode(const char* data, std::size_t len, BroadcastMessage& out, std::string& error) {
    if (data == nullptr || len == 0) {
        error = "empty datagram";
        return false;
    }

    // the parser rejects invalid UTF-8 as well as malformed JSON
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray(data, static_cast<int>(len)), &perr);
    if (perr.error != QJsonParseError::NoError) {
        error = "invalid JSON: " + perr.errorString().toStdString();
        return false;
    }
    if (!doc.isObject()) {
        error = "payload is not a JSON object";
        return false;
    }

    const QJsonObject obj = doc.object();
    BroadcastMessage msg;

    const QJsonValue id = obj.value(QStringLiteral("message_id"));
    if (!id.isUndefined() && !id.isNull()) {
        if (!id.isDouble()) {
            error = "message_id is not a number";
            return false;
        }
        double d = id.toDouble();
        if (std::trunc(d) != d || std::fabs(d) > static_cast<double>(MAX_MESSAGE_ID)) {
            error = "message_id is not an integer in the protocol range";
            return false;
        }
        msg.message_id = id.toVariant().toLongLong();
    }

    const QJsonValue ts = obj.value(QStringLiteral("timestamp"));
    if (ts.isString()) msg.timestamp = ts.toString().toStdString();

    const QJsonValue st = obj.value(QStringLiteral("state"));
    if (st.isString()) {
        msg.state_name = st.toString().toStdString();
        msg.state = state_from_name(msg.state_name);
    } else {
        msg.state_name = "unknown";
    }

    const QJsonValue rp = obj.value(QLatin1String(RESPONSE_PORT_KEY));
    if (rp.isDouble()) {
        int port = rp.toInt(0);
        if (port > 0 && port <= 65535) msg.response_port = static_cast<uint16_t>(port);
    }

    out = msg;
    return true;
}

std::string make_ack(const std::string& client_id, int64_t message_id) {
    return "Client " + client_id + " received message " + std::to_string(message_id);
}

std::string now_iso8601() {
    return QDateTime::currentDateTime().toString(Qt::ISODateWithMs).toStdString();
}

} // namespace MessageCodec
