#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <optional>

namespace dd {

// Wire format: 4-byte big-endian payload length, then a UTF-8 JSON object.
//
//   request:  {"type": "suggest", "data": {...}, "id": 7}
//   success:  {"status": "ok", ...result fields..., "id": 7}
//   error:    {"status": "error", "message": "...", "code": 1,
//              "codeString": "INVALID_PARAMS", "fatal": false, "id": 7}
//
// "id" is optional and echoed back when present.
class IpcMessage {
public:
    // Encode a JSON object to a length-prefixed message. Empty on oversize.
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        enum class Status {
            Complete,     // json holds the message, bytesConsumed > 0
            Incomplete,   // wait for more bytes
            Malformed,    // frame complete but not a JSON object; skip bytesConsumed
            Oversized,    // declared length exceeds kMaxMessageSize; stream unusable
        };

        Status status = Status::Incomplete;
        QJsonObject json;
        int bytesConsumed = 0;
        QString error;
    };
    static DecodeResult decode(const QByteArray& buffer);

    static QJsonObject makeRequest(const QString& type,
                                   const QJsonObject& data = {},
                                   std::optional<qint64> id = std::nullopt);

    // result fields are merged next to "status":"ok".
    static QJsonObject makeResponse(const QJsonObject& result,
                                    std::optional<qint64> id = std::nullopt);

    static QJsonObject makeError(IpcErrorCode code,
                                 const QString& message,
                                 std::optional<qint64> id = std::nullopt);

    // Request accessors. Keys are matched case-insensitively.
    static QJsonValue valueCaseInsensitive(const QJsonObject& object, const QString& key);
    static QString requestType(const QJsonObject& request);
    static std::optional<qint64> requestId(const QJsonObject& request);

    // "data" payload with top-level keys lowercased. Missing data is {}.
    static QJsonObject requestData(const QJsonObject& request);

    static bool isOk(const QJsonObject& response);
    static bool isError(const QJsonObject& response);

    // Max message size: 16MB
    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;
};

} // namespace dd
