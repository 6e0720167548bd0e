#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>
#include <mutex>
#include <shared_mutex>

namespace dd {

// ConfigProvider -- thread-safe access to live tunables.
//
// Keys are dotted "section.name" paths over the SettingsManager JSON form
// ("suggestions.max_suggestions"). A bare name ("max_suggestions") resolves
// when it is unique across sections. Matching is case-insensitive.
class ConfigProvider {
public:
    struct SetResult {
        enum class Status {
            Ok,
            UnknownKey,
            InvalidValue,
            ReadOnly,
            PersistFailed,
        };

        Status status = Status::Ok;
        QString key;            // canonical dotted key when resolved
        QString message;

        bool ok() const { return status == Status::Ok; }
    };

    // An empty persistPath keeps changes in memory only.
    explicit ConfigProvider(Settings settings = {}, QString persistPath = {});

    Settings snapshot() const;

    std::optional<QJsonValue> get(const QString& key) const;
    QJsonObject all() const;

    // Validates, applies and (when configured) persists one key.
    SetResult set(const QString& key, const QJsonValue& value);

    // Resolves "max_suggestions" -> "suggestions.max_suggestions".
    static std::optional<QString> canonicalKey(const QString& key);

private:
    mutable std::shared_mutex m_mutex;
    std::mutex m_persistMutex;
    Settings m_settings;
    QString m_persistPath;
};

} // namespace dd
