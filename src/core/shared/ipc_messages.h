#pragma once

#include <QString>
#include <cstdint>

namespace dd {

// Wire error codes carried in every error response.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    NotFound           = 4,
    AlreadyRunning     = 5,
    InternalError      = 6,
    Unsupported        = 7,
    CorruptedIndex     = 8,
    ServiceUnavailable = 9,
    StoreFailed        = 10,
    RetrievalFailed    = 11,
};

QString ipcErrorCodeToString(IpcErrorCode code);

// Fatal errors mean the client should not retry against this instance.
bool ipcErrorCodeIsFatal(IpcErrorCode code);

// Request discriminator. Unknown covers anything the daemon does not route.
enum class MessageType {
    Ping,
    Status,
    Shutdown,
    LogCommand,
    Suggest,
    GetHistory,
    GetAnalytics,
    GetConfig,
    SetConfig,
    ExplainCommand,
    RebuildIndex,
    Unknown,
};

// Case-insensitive. "search" maps to GetHistory and "complete" to Suggest.
MessageType messageTypeFromString(const QString& type);
QString messageTypeToString(MessageType type);

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::AlreadyRunning:     return QStringLiteral("ALREADY_RUNNING");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::CorruptedIndex:     return QStringLiteral("CORRUPTED_INDEX");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    case IpcErrorCode::StoreFailed:        return QStringLiteral("STORE_FAILED");
    case IpcErrorCode::RetrievalFailed:    return QStringLiteral("RETRIEVAL_FAILED");
    }
    return QStringLiteral("UNKNOWN");
}

inline bool ipcErrorCodeIsFatal(IpcErrorCode code)
{
    return code == IpcErrorCode::AlreadyRunning
        || code == IpcErrorCode::CorruptedIndex;
}

inline MessageType messageTypeFromString(const QString& type)
{
    const QString key = type.trimmed().toLower();
    if (key == QLatin1String("ping"))            return MessageType::Ping;
    if (key == QLatin1String("status"))          return MessageType::Status;
    if (key == QLatin1String("shutdown"))        return MessageType::Shutdown;
    if (key == QLatin1String("log_command"))     return MessageType::LogCommand;
    if (key == QLatin1String("suggest"))         return MessageType::Suggest;
    if (key == QLatin1String("complete"))        return MessageType::Suggest;
    if (key == QLatin1String("get_history"))     return MessageType::GetHistory;
    if (key == QLatin1String("search"))          return MessageType::GetHistory;
    if (key == QLatin1String("get_analytics"))   return MessageType::GetAnalytics;
    if (key == QLatin1String("get_config"))      return MessageType::GetConfig;
    if (key == QLatin1String("set_config"))      return MessageType::SetConfig;
    if (key == QLatin1String("explain_command")) return MessageType::ExplainCommand;
    if (key == QLatin1String("rebuild_index"))   return MessageType::RebuildIndex;
    return MessageType::Unknown;
}

inline QString messageTypeToString(MessageType type)
{
    switch (type) {
    case MessageType::Ping:           return QStringLiteral("ping");
    case MessageType::Status:         return QStringLiteral("status");
    case MessageType::Shutdown:       return QStringLiteral("shutdown");
    case MessageType::LogCommand:     return QStringLiteral("log_command");
    case MessageType::Suggest:        return QStringLiteral("suggest");
    case MessageType::GetHistory:     return QStringLiteral("get_history");
    case MessageType::GetAnalytics:   return QStringLiteral("get_analytics");
    case MessageType::GetConfig:      return QStringLiteral("get_config");
    case MessageType::SetConfig:      return QStringLiteral("set_config");
    case MessageType::ExplainCommand: return QStringLiteral("explain_command");
    case MessageType::RebuildIndex:   return QStringLiteral("rebuild_index");
    case MessageType::Unknown:        break;
    }
    return QStringLiteral("unknown");
}

} // namespace dd
