#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace dd {

namespace {

QStringList stringListFromJson(const QJsonValue& value, const QStringList& fallback)
{
    if (!value.isArray()) {
        return fallback;
    }
    QStringList list;
    const QJsonArray array = value.toArray();
    list.reserve(array.size());
    for (const QJsonValue& item : array) {
        const QString text = item.toString().trimmed();
        if (!text.isEmpty()) {
            list.append(text);
        }
    }
    return list;
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(ddCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(ddCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ddCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ddCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0 || !file.commit()) {
        LOG_ERROR(ddCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    QFile::setPermissions(filePath, QFile::ReadOwner | QFile::WriteOwner);
    return true;
}

QString SettingsManager::dataDirectory()
{
    const QString override = qEnvironmentVariable("DAEDALUS_DATA_DIR").trimmed();
    if (!override.isEmpty()) {
        return QDir::cleanPath(override);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/daedalus");
}

QString SettingsManager::settingsFilePath()
{
    return dataDirectory() + QStringLiteral("/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject suggestions;
    suggestions.insert(QStringLiteral("max_suggestions"), settings.maxSuggestions);
    suggestions.insert(QStringLiteral("min_confidence"), settings.minConfidence);
    suggestions.insert(QStringLiteral("fuzzy_threshold"), settings.fuzzyThreshold);
    suggestions.insert(QStringLiteral("fuzzy_pool_size"), settings.fuzzyPoolSize);
    suggestions.insert(QStringLiteral("semantic_k"), settings.semanticK);

    QJsonObject privacy;
    privacy.insert(QStringLiteral("retention_days"), settings.retentionDays);
    privacy.insert(QStringLiteral("excluded_paths"), QJsonArray::fromStringList(settings.excludedPaths));
    privacy.insert(QStringLiteral("excluded_patterns"),
                   QJsonArray::fromStringList(settings.excludedPatterns));

    QJsonObject index;
    index.insert(QStringLiteral("dimensions"), settings.embeddingDimensions);
    index.insert(QStringLiteral("build_batch_size"), settings.buildBatchSize);
    index.insert(QStringLiteral("build_interval_ms"), settings.buildIntervalMs);

    QJsonObject daemon;
    daemon.insert(QStringLiteral("request_timeout_ms"), settings.requestTimeoutMs);
    daemon.insert(QStringLiteral("read_timeout_ms"), settings.readTimeoutMs);
    daemon.insert(QStringLiteral("write_timeout_ms"), settings.writeTimeoutMs);
    daemon.insert(QStringLiteral("idle_timeout_ms"), settings.idleTimeoutMs);
    daemon.insert(QStringLiteral("grace_period_ms"), settings.gracePeriodMs);
    daemon.insert(QStringLiteral("max_connections"), settings.maxConnections);

    QJsonObject json;
    json.insert(QStringLiteral("suggestions"), suggestions);
    json.insert(QStringLiteral("privacy"), privacy);
    json.insert(QStringLiteral("index"), index);
    json.insert(QStringLiteral("daemon"), daemon);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    const QJsonObject suggestions = json.value(QStringLiteral("suggestions")).toObject();
    settings.maxSuggestions = suggestions.value(QStringLiteral("max_suggestions"))
                                  .toInt(settings.maxSuggestions);
    settings.minConfidence = suggestions.value(QStringLiteral("min_confidence"))
                                 .toDouble(settings.minConfidence);
    settings.fuzzyThreshold = suggestions.value(QStringLiteral("fuzzy_threshold"))
                                  .toInt(settings.fuzzyThreshold);
    settings.fuzzyPoolSize = suggestions.value(QStringLiteral("fuzzy_pool_size"))
                                 .toInt(settings.fuzzyPoolSize);
    settings.semanticK = suggestions.value(QStringLiteral("semantic_k")).toInt(settings.semanticK);

    const QJsonObject privacy = json.value(QStringLiteral("privacy")).toObject();
    settings.retentionDays = privacy.value(QStringLiteral("retention_days"))
                                 .toInt(settings.retentionDays);
    settings.excludedPaths = stringListFromJson(privacy.value(QStringLiteral("excluded_paths")),
                                                settings.excludedPaths);
    settings.excludedPatterns = stringListFromJson(
        privacy.value(QStringLiteral("excluded_patterns")), settings.excludedPatterns);

    const QJsonObject index = json.value(QStringLiteral("index")).toObject();
    settings.embeddingDimensions = index.value(QStringLiteral("dimensions"))
                                       .toInt(settings.embeddingDimensions);
    settings.buildBatchSize = index.value(QStringLiteral("build_batch_size"))
                                  .toInt(settings.buildBatchSize);
    settings.buildIntervalMs = index.value(QStringLiteral("build_interval_ms"))
                                   .toInt(settings.buildIntervalMs);

    const QJsonObject daemon = json.value(QStringLiteral("daemon")).toObject();
    settings.requestTimeoutMs = daemon.value(QStringLiteral("request_timeout_ms"))
                                    .toInt(settings.requestTimeoutMs);
    settings.readTimeoutMs = daemon.value(QStringLiteral("read_timeout_ms"))
                                 .toInt(settings.readTimeoutMs);
    settings.writeTimeoutMs = daemon.value(QStringLiteral("write_timeout_ms"))
                                  .toInt(settings.writeTimeoutMs);
    settings.idleTimeoutMs = daemon.value(QStringLiteral("idle_timeout_ms"))
                                 .toInt(settings.idleTimeoutMs);
    settings.gracePeriodMs = daemon.value(QStringLiteral("grace_period_ms"))
                                 .toInt(settings.gracePeriodMs);
    settings.maxConnections = daemon.value(QStringLiteral("max_connections"))
                                  .toInt(settings.maxConnections);

    return settings;
}

} // namespace dd
