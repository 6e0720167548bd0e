#include "core/shared/config_provider.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QJsonArray>
#include <QRegularExpression>

#include <cmath>
#include <mutex>
#include <utility>

namespace dd {

namespace {

enum class ValueKind {
    Integer,
    Real,
    StringList,
    PatternList,
};

struct KeySpec {
    const char* section;
    const char* name;
    ValueKind kind;
    double minValue;
    double maxValue;
    bool readOnly;
};

// Every tunable exposed through get_config / set_config.
constexpr KeySpec kKeySpecs[] = {
    {"suggestions", "max_suggestions",   ValueKind::Integer,     1, 100,     false},
    {"suggestions", "min_confidence",    ValueKind::Real,        0, 1,       false},
    {"suggestions", "fuzzy_threshold",   ValueKind::Integer,     0, 100,     false},
    {"suggestions", "fuzzy_pool_size",   ValueKind::Integer,     1, 100000,  false},
    {"suggestions", "semantic_k",        ValueKind::Integer,     1, 1000,    false},
    {"privacy",     "retention_days",    ValueKind::Integer,     0, 36500,   false},
    {"privacy",     "excluded_paths",    ValueKind::StringList,  0, 0,       false},
    {"privacy",     "excluded_patterns", ValueKind::PatternList, 0, 0,       false},
    {"index",       "dimensions",        ValueKind::Integer,     1, 4096,    true},
    {"index",       "build_batch_size",  ValueKind::Integer,     1, 100000,  false},
    {"index",       "build_interval_ms", ValueKind::Integer,     100, 3600000, false},
    {"daemon",      "request_timeout_ms", ValueKind::Integer,    100, 600000, false},
    {"daemon",      "read_timeout_ms",   ValueKind::Integer,     100, 600000, false},
    {"daemon",      "write_timeout_ms",  ValueKind::Integer,     100, 600000, false},
    {"daemon",      "idle_timeout_ms",   ValueKind::Integer,     1000, 86400000, false},
    {"daemon",      "grace_period_ms",   ValueKind::Integer,     0, 60000,   false},
    {"daemon",      "max_connections",   ValueKind::Integer,     1, 4096,    false},
};

const KeySpec* findSpec(const QString& canonical)
{
    for (const KeySpec& spec : kKeySpecs) {
        const QString full = QLatin1String(spec.section) + QLatin1Char('.') + QLatin1String(spec.name);
        if (full == canonical) {
            return &spec;
        }
    }
    return nullptr;
}

QString validate(const KeySpec& spec, const QJsonValue& value)
{
    switch (spec.kind) {
    case ValueKind::Integer: {
        if (!value.isDouble()) {
            return QStringLiteral("expected an integer");
        }
        const double number = value.toDouble();
        if (std::floor(number) != number) {
            return QStringLiteral("expected an integer");
        }
        if (number < spec.minValue || number > spec.maxValue) {
            return QStringLiteral("must be between %1 and %2")
                .arg(spec.minValue).arg(spec.maxValue);
        }
        return {};
    }
    case ValueKind::Real: {
        if (!value.isDouble()) {
            return QStringLiteral("expected a number");
        }
        const double number = value.toDouble();
        if (!std::isfinite(number) || number < spec.minValue || number > spec.maxValue) {
            return QStringLiteral("must be between %1 and %2")
                .arg(spec.minValue).arg(spec.maxValue);
        }
        return {};
    }
    case ValueKind::StringList:
    case ValueKind::PatternList: {
        if (!value.isArray()) {
            return QStringLiteral("expected an array of strings");
        }
        for (const QJsonValue& item : value.toArray()) {
            if (!item.isString()) {
                return QStringLiteral("expected an array of strings");
            }
            if (spec.kind == ValueKind::PatternList) {
                const QRegularExpression re(item.toString());
                if (!re.isValid()) {
                    return QStringLiteral("invalid pattern '%1': %2")
                        .arg(item.toString(), re.errorString());
                }
            }
        }
        return {};
    }
    }
    return QStringLiteral("unsupported value");
}

} // namespace

ConfigProvider::ConfigProvider(Settings settings, QString persistPath)
    : m_settings(std::move(settings))
    , m_persistPath(std::move(persistPath))
{
}

Settings ConfigProvider::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_settings;
}

std::optional<QString> ConfigProvider::canonicalKey(const QString& key)
{
    const QString normalized = key.trimmed().toLower();
    if (normalized.isEmpty()) {
        return std::nullopt;
    }

    if (normalized.contains(QLatin1Char('.'))) {
        if (findSpec(normalized)) {
            return normalized;
        }
        return std::nullopt;
    }

    std::optional<QString> match;
    for (const KeySpec& spec : kKeySpecs) {
        if (normalized == QLatin1String(spec.name)) {
            if (match.has_value()) {
                return std::nullopt;    // ambiguous
            }
            match = QLatin1String(spec.section) + QLatin1Char('.') + QLatin1String(spec.name);
        }
    }
    return match;
}

std::optional<QJsonValue> ConfigProvider::get(const QString& key) const
{
    const auto canonical = canonicalKey(key);
    if (!canonical) {
        return std::nullopt;
    }

    const QJsonObject json = all();
    const int dot = canonical->indexOf(QLatin1Char('.'));
    const QJsonObject section = json.value(canonical->left(dot)).toObject();
    return section.value(canonical->mid(dot + 1));
}

QJsonObject ConfigProvider::all() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return SettingsManager::toJson(m_settings);
}

ConfigProvider::SetResult ConfigProvider::set(const QString& key, const QJsonValue& value)
{
    SetResult result;

    const auto canonical = canonicalKey(key);
    if (!canonical) {
        result.status = SetResult::Status::UnknownKey;
        result.message = QStringLiteral("Unknown config key: %1").arg(key);
        return result;
    }
    result.key = canonical.value();

    const KeySpec* spec = findSpec(canonical.value());
    if (spec->readOnly) {
        result.status = SetResult::Status::ReadOnly;
        result.message = QStringLiteral("%1 is fixed for the lifetime of the index").arg(result.key);
        return result;
    }

    const QString problem = validate(*spec, value);
    if (!problem.isEmpty()) {
        result.status = SetResult::Status::InvalidValue;
        result.message = QStringLiteral("%1: %2").arg(result.key, problem);
        return result;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        QJsonObject json = SettingsManager::toJson(m_settings);
        QJsonObject section = json.value(QLatin1String(spec->section)).toObject();
        section.insert(QLatin1String(spec->name), value);
        json.insert(QLatin1String(spec->section), section);
        m_settings = SettingsManager::fromJson(json);
    }

    LOG_INFO(ddCore, "Config updated: %s", qUtf8Printable(result.key));

    if (m_persistPath.isEmpty()) {
        return result;
    }

    // Saves are serialized and always write the newest settings, so the
    // file never ends up behind memory.
    std::lock_guard<std::mutex> persistLock(m_persistMutex);
    if (!SettingsManager::save(snapshot(), m_persistPath)) {
        result.status = SetResult::Status::PersistFailed;
        result.message = QStringLiteral("Applied %1 but failed to persist settings").arg(result.key);
    }
    return result;
}

} // namespace dd
