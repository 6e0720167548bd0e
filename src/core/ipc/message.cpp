#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace dd {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    QJsonDocument doc(json);
    QByteArray payload = doc.toJson(QJsonDocument::Compact);

    if (payload.size() > kMaxMessageSize) {
        qCWarning(ddIpc, "Message exceeds max size: %d > %d",
                  static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray msg;
    msg.reserve(4 + payload.size());

    // 4-byte big-endian length prefix
    quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    msg.append(reinterpret_cast<const char*>(&len), 4);
    msg.append(payload);

    return msg;
}

IpcMessage::DecodeResult IpcMessage::decode(const QByteArray& buffer)
{
    DecodeResult result;

    // Need at least 4 bytes for the length prefix
    if (buffer.size() < 4) {
        return result;
    }

    quint32 rawLen;
    memcpy(&rawLen, buffer.constData(), 4);
    quint32 payloadLen = qFromBigEndian(rawLen);

    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        qCWarning(ddIpc, "Received message length exceeds max: %u > %d",
                  payloadLen, kMaxMessageSize);
        result.status = DecodeResult::Status::Oversized;
        result.error = QStringLiteral("Message length %1 exceeds limit %2")
                           .arg(payloadLen).arg(kMaxMessageSize);
        return result;
    }

    // Check if the full payload has arrived
    const int totalLen = 4 + static_cast<int>(payloadLen);
    if (buffer.size() < totalLen) {
        return result;
    }

    result.bytesConsumed = totalLen;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(buffer.mid(4, static_cast<int>(payloadLen)),
                                                &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCWarning(ddIpc, "JSON parse error: %s", qPrintable(parseError.errorString()));
        result.status = DecodeResult::Status::Malformed;
        result.error = QStringLiteral("Malformed JSON: %1").arg(parseError.errorString());
        return result;
    }

    if (!doc.isObject()) {
        qCWarning(ddIpc, "Expected JSON object, got something else");
        result.status = DecodeResult::Status::Malformed;
        result.error = QStringLiteral("Message must be a JSON object");
        return result;
    }

    result.status = DecodeResult::Status::Complete;
    result.json = doc.object();
    return result;
}

QJsonObject IpcMessage::makeRequest(const QString& type, const QJsonObject& data,
                                    std::optional<qint64> id)
{
    QJsonObject json;
    json[QStringLiteral("type")] = type;
    json[QStringLiteral("data")] = data;
    if (id.has_value()) {
        json[QStringLiteral("id")] = id.value();
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(const QJsonObject& result, std::optional<qint64> id)
{
    QJsonObject json = result;
    json[QStringLiteral("status")] = QStringLiteral("ok");
    if (id.has_value()) {
        json[QStringLiteral("id")] = id.value();
    }
    return json;
}

QJsonObject IpcMessage::makeError(IpcErrorCode code, const QString& message,
                                  std::optional<qint64> id)
{
    QJsonObject json;
    json[QStringLiteral("status")] = QStringLiteral("error");
    json[QStringLiteral("message")] = message;
    json[QStringLiteral("code")] = static_cast<int>(code);
    json[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    json[QStringLiteral("fatal")] = ipcErrorCodeIsFatal(code);
    if (id.has_value()) {
        json[QStringLiteral("id")] = id.value();
    }
    return json;
}

QJsonValue IpcMessage::valueCaseInsensitive(const QJsonObject& object, const QString& key)
{
    const auto exact = object.constFind(key);
    if (exact != object.constEnd()) {
        return exact.value();
    }
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        if (it.key().compare(key, Qt::CaseInsensitive) == 0) {
            return it.value();
        }
    }
    return QJsonValue(QJsonValue::Undefined);
}

QString IpcMessage::requestType(const QJsonObject& request)
{
    return valueCaseInsensitive(request, QStringLiteral("type")).toString();
}

std::optional<qint64> IpcMessage::requestId(const QJsonObject& request)
{
    const QJsonValue id = valueCaseInsensitive(request, QStringLiteral("id"));
    if (!id.isDouble()) {
        return std::nullopt;
    }
    return id.toInteger();
}

QJsonObject IpcMessage::requestData(const QJsonObject& request)
{
    const QJsonObject raw = valueCaseInsensitive(request, QStringLiteral("data")).toObject();
    QJsonObject normalized;
    for (auto it = raw.constBegin(); it != raw.constEnd(); ++it) {
        normalized.insert(it.key().toLower(), it.value());
    }
    return normalized;
}

bool IpcMessage::isOk(const QJsonObject& response)
{
    return response.value(QStringLiteral("status")).toString() == QLatin1String("ok");
}

bool IpcMessage::isError(const QJsonObject& response)
{
    return response.value(QStringLiteral("status")).toString() == QLatin1String("error");
}

} // namespace dd
