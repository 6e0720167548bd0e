#include "daemon_service.h"
#include "index_worker.h"
#include "core/embedding/hashing_embedder.h"
#include "core/history/command_store.h"
#include "core/privacy/privacy_filter.h"
#include "core/shared/command_explainer.h"
#include "core/shared/config_provider.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/suggest/suggestion_cascade.h"
#include "core/vector/vector_index.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QSet>

#include <algorithm>
#include <limits>

namespace dd {

namespace {

QString indexStateToString(VectorIndex::State state)
{
    switch (state) {
    case VectorIndex::State::Empty:        return QStringLiteral("empty");
    case VectorIndex::State::Accumulating: return QStringLiteral("accumulating");
    case VectorIndex::State::Built:        return QStringLiteral("built");
    }
    return QStringLiteral("unknown");
}

QJsonObject statisticsToJson(const CommandStore::Statistics& stats)
{
    QJsonObject json;
    json[QStringLiteral("total_commands")] = static_cast<qint64>(stats.totalCommands);
    json[QStringLiteral("successful_commands")] = static_cast<qint64>(stats.successfulCommands);
    json[QStringLiteral("success_rate")] = stats.successRate;
    json[QStringLiteral("unique_commands")] = static_cast<qint64>(stats.uniqueCommands);
    json[QStringLiteral("sessions")] = static_cast<qint64>(stats.sessions);
    json[QStringLiteral("oldest_timestamp")] = stats.oldestTimestamp;
    json[QStringLiteral("newest_timestamp")] = stats.newestTimestamp;
    json[QStringLiteral("database_bytes")] = static_cast<qint64>(stats.databaseBytes);
    return json;
}

QJsonArray recordsToJson(const std::vector<CommandRecord>& records)
{
    QJsonArray array;
    for (const CommandRecord& record : records) {
        array.append(commandRecordToJson(record));
    }
    return array;
}

int boundedLimit(const QJsonObject& data, int fallback, int maximum)
{
    const QJsonValue value = data.value(QStringLiteral("limit"));
    if (!value.isDouble()) {
        return fallback;
    }
    return std::clamp(value.toInt(fallback), 1, maximum);
}

} // namespace

DaemonService::DaemonService(QObject* parent)
    : DaemonService(DaemonOptions{}, parent)
{
}

DaemonService::DaemonService(const DaemonOptions& options, QObject* parent)
    : ServiceBase(QStringLiteral("daemon"), parent)
    , m_options(options)
    , m_dataDirectory(options.dataDirectory.isEmpty() ? SettingsManager::dataDirectory()
                                                      : QDir::cleanPath(options.dataDirectory))
{
    m_retentionTimer.setInterval(kRetentionIntervalMs);
    connect(&m_retentionTimer, &QTimer::timeout, this, [this]() { runRetentionPass(); });
}

DaemonService::~DaemonService()
{
    // Handlers reference members below; drain the socket before they go.
    stop();
    m_server->close();
    if (m_indexWorker) {
        m_indexWorker->stop();
    }
}

void DaemonService::setEmbedder(std::unique_ptr<Embedder> embedder)
{
    m_embedder = std::move(embedder);
}

void DaemonService::setExplainer(std::unique_ptr<CommandExplainer> explainer)
{
    m_explainer = std::move(explainer);
}

QString DaemonService::databasePath() const
{
    return m_dataDirectory + QStringLiteral("/history.db");
}

QString DaemonService::indexPath() const
{
    return m_dataDirectory + QStringLiteral("/commands.hnsw");
}

QString DaemonService::indexMetaPath() const
{
    return m_dataDirectory + QStringLiteral("/commands.hnsw.meta.json");
}

bool DaemonService::initialize()
{
    if (m_initialized) {
        return true;
    }

    if (!QDir().mkpath(m_dataDirectory)) {
        LOG_ERROR(ddCore, "Failed to create data directory: %s", qUtf8Printable(m_dataDirectory));
        return false;
    }
    QFile::setPermissions(m_dataDirectory, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                               | QFileDevice::ExeOwner);

    // Configuration
    const QString settingsPath = m_dataDirectory + QStringLiteral("/settings.json");
    Settings settings;
    if (m_options.settings.has_value()) {
        settings = m_options.settings.value();
    } else if (auto loaded = SettingsManager::load(settingsPath)) {
        settings = loaded.value();
    } else if (QFile::exists(settingsPath)) {
        LOG_WARN(ddCore, "Ignoring unreadable settings file, using defaults");
    }
    m_config = std::make_unique<ConfigProvider>(
        settings, m_options.persistSettings ? settingsPath : QString());

    // History
    m_store = CommandStore::open(databasePath());
    if (!m_store) {
        LOG_ERROR(ddCore, "Failed to open command store at %s", qUtf8Printable(databasePath()));
        return false;
    }

    // Vector index
    m_index = std::make_unique<VectorIndex>(settings.embeddingDimensions);
    if (!m_index->load(indexPath().toStdString(), indexMetaPath().toStdString())) {
        LOG_WARN(ddIndex, "Saved index unusable, rebuilding from history");
        m_index = std::make_unique<VectorIndex>(settings.embeddingDimensions);
    }

    if (!m_embedder) {
        m_embedder = std::make_unique<HashingEmbedder>(settings.embeddingDimensions);
    } else if (m_embedder->dimensions() != settings.embeddingDimensions) {
        LOG_WARN(ddIndex, "Embedder produces %d dimensions but index.dimensions is %d",
                 m_embedder->dimensions(), settings.embeddingDimensions);
    }

    m_cascade = std::make_unique<SuggestionCascade>(*m_store, *m_index, *m_config,
                                                    m_embedder.get());
    rebuildPrivacyFilter();

    m_indexWorker = std::make_unique<IndexWorker>(*m_index, *m_embedder,
                                                  indexPath().toStdString(),
                                                  indexMetaPath().toStdString(),
                                                  settings.buildBatchSize,
                                                  settings.buildIntervalMs);

    // Prune first so expired history is neither restored nor bootstrapped.
    runRetentionPass();
    bootstrapIndex();
    m_indexWorker->start();

    applyTransportSettings(settings);
    m_retentionTimer.start();

    m_startedAt = QDateTime::currentDateTimeUtc();
    m_initialized = true;
    LOG_INFO(ddCore, "Daemon initialized (data=%s, index=%s, %d entries)",
             qUtf8Printable(m_dataDirectory),
             qUtf8Printable(indexStateToString(m_index->state())),
             m_index->size());
    return true;
}

void DaemonService::bootstrapIndex()
{
    if (m_index->size() > 0) {
        return;
    }

    auto summaries = m_store->distinctRecent(kBootstrapLimit, true);
    if (!summaries) {
        LOG_WARN(ddIndex, "Index bootstrap skipped: history unavailable");
        return;
    }

    int queued = 0;
    for (const CommandStore::CommandSummary& summary : summaries.value()) {
        if (m_indexWorker->enqueue(summary.lastId, summary.command)) {
            ++queued;
        }
    }
    if (queued >= kMinBootstrapCommands) {
        m_indexWorker->requestBuild();
    }
    LOG_INFO(ddIndex, "Index bootstrap queued %d command(s)", queued);
}

void DaemonService::applyTransportSettings(const Settings& settings)
{
    SocketServer::Limits limits;
    limits.readTimeoutMs = settings.readTimeoutMs;
    limits.writeTimeoutMs = settings.writeTimeoutMs;
    limits.idleTimeoutMs = settings.idleTimeoutMs;
    limits.requestTimeoutMs = settings.requestTimeoutMs;
    limits.maxConnections = settings.maxConnections;
    m_server->setLimits(limits);
    m_gracePeriodMs = settings.gracePeriodMs;
}

void DaemonService::rebuildPrivacyFilter()
{
    const Settings settings = m_config->snapshot();
    auto filter = std::make_shared<const PrivacyFilter>(settings.excludedPaths,
                                                        settings.excludedPatterns);
    LOG_DEBUG(ddPrivacy, "Privacy filter: %d path rule(s), %d pattern(s)",
              filter->pathRuleCount(), filter->patternCount());

    std::lock_guard<std::mutex> lock(m_privacyMutex);
    m_privacy = std::move(filter);
}

std::shared_ptr<const PrivacyFilter> DaemonService::privacyFilter() const
{
    std::lock_guard<std::mutex> lock(m_privacyMutex);
    return m_privacy;
}

std::optional<int> DaemonService::runRetentionPass()
{
    if (!m_store || !m_config) {
        return std::nullopt;
    }

    const int retentionDays = m_config->snapshot().retentionDays;
    if (retentionDays <= 0) {
        return 0;
    }

    const double cutoff = static_cast<double>(QDateTime::currentSecsSinceEpoch())
        - static_cast<double>(retentionDays) * 86400.0;
    auto removed = m_store->prune(cutoff);
    if (!removed) {
        LOG_WARN(ddStore, "Retention pass failed");
        return std::nullopt;
    }
    if (removed.value() > 0) {
        LOG_INFO(ddStore, "Retention removed %d record(s) older than %d day(s)",
                 removed.value(), retentionDays);
    }
    discardPrunedFromIndex();
    return removed;
}

void DaemonService::discardPrunedFromIndex()
{
    if (!m_indexWorker) {
        return;
    }

    // Only successful commands are indexed.
    auto live = m_store->distinctRecent(std::numeric_limits<int>::max(), true);
    if (!live) {
        LOG_WARN(ddIndex, "Index retention skipped: history unavailable");
        return;
    }

    QSet<QString> commands;
    commands.reserve(static_cast<int>(live->size()));
    for (const CommandStore::CommandSummary& summary : live.value()) {
        commands.insert(summary.command.trimmed());
    }
    m_indexWorker->discardStale(commands);
}

void DaemonService::onShutdown()
{
    m_retentionTimer.stop();
    if (m_indexWorker) {
        // Final build and save happen on the worker before it exits.
        m_indexWorker->stop();
    }
    LOG_INFO(ddCore, "Daemon shut down (requests=%lld logged=%lld filtered=%lld)",
             static_cast<long long>(m_requestsHandled.load()),
             static_cast<long long>(m_commandsLogged.load()),
             static_cast<long long>(m_commandsFiltered.load()));
}

QJsonObject DaemonService::handleRequest(const QJsonObject& request)
{
    ++m_requestsHandled;
    const std::optional<qint64> id = IpcMessage::requestId(request);

    const QJsonValue typeValue = IpcMessage::valueCaseInsensitive(request, QStringLiteral("type"));
    if (!typeValue.isString() || typeValue.toString().trimmed().isEmpty()) {
        ++m_errors;
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing message type"), id);
    }
    const QJsonValue dataValue = IpcMessage::valueCaseInsensitive(request, QStringLiteral("data"));
    if (!dataValue.isUndefined() && !dataValue.isNull() && !dataValue.isObject()) {
        ++m_errors;
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'data' must be an object"), id);
    }

    const QString type = typeValue.toString();
    const MessageType messageType = messageTypeFromString(type);
    if (!m_initialized && messageType != MessageType::Ping
        && messageType != MessageType::Shutdown) {
        return IpcMessage::makeError(IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Daemon is not initialized"), id);
    }

    QJsonObject data = IpcMessage::requestData(request);
    if (type.trimmed().compare(QLatin1String("search"), Qt::CaseInsensitive) == 0
        && !data.contains(QStringLiteral("search"))) {
        data[QStringLiteral("search")] = data.value(QStringLiteral("query"));
    }

    QJsonObject response;
    switch (messageType) {
    case MessageType::Status:         response = handleStatus(data, id); break;
    case MessageType::LogCommand:     response = handleLogCommand(data, id); break;
    case MessageType::Suggest:        response = handleSuggest(data, id); break;
    case MessageType::GetHistory:     response = handleGetHistory(data, id); break;
    case MessageType::GetAnalytics:   response = handleGetAnalytics(data, id); break;
    case MessageType::GetConfig:      response = handleGetConfig(data, id); break;
    case MessageType::SetConfig:      response = handleSetConfig(data, id); break;
    case MessageType::ExplainCommand: response = handleExplainCommand(data, id); break;
    case MessageType::RebuildIndex:   response = handleRebuildIndex(data, id); break;
    default:
        response = ServiceBase::handleRequest(request);
        break;
    }

    if (IpcMessage::isError(response)) {
        ++m_errors;
    }
    return response;
}

QJsonObject DaemonService::handleStatus(const QJsonObject& /*data*/, std::optional<qint64> id)
{
    QJsonObject result;
    result[QStringLiteral("pid")] = QCoreApplication::applicationPid();
    result[QStringLiteral("version")] = QCoreApplication::applicationVersion();
    result[QStringLiteral("uptime_seconds")] = m_startedAt.secsTo(QDateTime::currentDateTimeUtc());
    result[QStringLiteral("socket")] = m_server->socketPath();
    result[QStringLiteral("data_directory")] = m_dataDirectory;
    result[QStringLiteral("counters")] = countersJson();
    result[QStringLiteral("index")] = indexJson();

    if (auto stats = m_store->statistics()) {
        result[QStringLiteral("store")] = statisticsToJson(stats.value());
    } else {
        result[QStringLiteral("store")] = QJsonObject{{QStringLiteral("available"), false}};
    }
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleLogCommand(const QJsonObject& data, std::optional<qint64> id)
{
    const QJsonValue commandValue = data.value(QStringLiteral("command"));
    if (!commandValue.isString() || commandValue.toString().trimmed().isEmpty()) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'command' must be a non-empty string"), id);
    }
    const QJsonValue cwdValue = data.value(QStringLiteral("cwd"));
    if (!cwdValue.isUndefined() && !cwdValue.isNull() && !cwdValue.isString()) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'cwd' must be a string"), id);
    }
    const QJsonValue exitValue = data.value(QStringLiteral("exit_code"));
    if (!exitValue.isUndefined() && !exitValue.isNull() && !exitValue.isDouble()) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'exit_code' must be an integer"), id);
    }
    const QJsonValue durationValue = data.value(QStringLiteral("duration"));
    if (!durationValue.isUndefined() && !durationValue.isNull() && !durationValue.isDouble()) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'duration' must be a number"), id);
    }

    const QString command = commandValue.toString();
    const QString cwd = cwdValue.toString();

    const auto filter = privacyFilter();
    const PrivacyFilter::Decision decision = filter->evaluate(command, cwd);
    if (decision != PrivacyFilter::Decision::Allow) {
        ++m_commandsFiltered;
        LOG_DEBUG(ddPrivacy, "Command not recorded: %s",
                  qUtf8Printable(privacyDecisionToString(decision)));
        QJsonObject result;
        result[QStringLiteral("filtered")] = true;
        result[QStringLiteral("reason")] = privacyDecisionToString(decision);
        return IpcMessage::makeResponse(result, id);
    }

    std::optional<double> timestamp;
    const QJsonValue timestampValue = data.value(QStringLiteral("timestamp"));
    if (timestampValue.isDouble()) {
        timestamp = timestampValue.toDouble();
    }

    const int exitCode = exitValue.toInt(0);
    auto recordId = m_store->log(command, cwd, exitCode, durationValue.toDouble(0.0),
                                 data.value(QStringLiteral("session_id")).toString(),
                                 timestamp);
    if (!recordId) {
        return IpcMessage::makeError(IpcErrorCode::StoreFailed,
                                     QStringLiteral("Failed to record command"), id);
    }
    ++m_commandsLogged;

    if (exitCode == 0) {
        m_indexWorker->enqueue(recordId.value(), command);
    }

    QJsonObject result;
    result[QStringLiteral("id")] = static_cast<qint64>(recordId.value());
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleSuggest(const QJsonObject& data, std::optional<qint64> id)
{
    const QJsonValue partialValue = data.value(QStringLiteral("partial"));
    if (!partialValue.isString()) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'partial' must be a string"), id);
    }

    QStringList history;
    const QJsonValue historyValue = data.value(QStringLiteral("history"));
    if (historyValue.isArray()) {
        for (const QJsonValue& entry : historyValue.toArray()) {
            if (entry.isString()) {
                history.append(entry.toString());
            }
        }
    } else if (!historyValue.isUndefined() && !historyValue.isNull()) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'history' must be an array of strings"), id);
    }

    const SuggestionCascade::Outcome outcome =
        m_cascade->suggest(partialValue.toString(), data.value(QStringLiteral("cwd")).toString(),
                           history);
    if (!outcome.ok()) {
        return IpcMessage::makeError(IpcErrorCode::RetrievalFailed, outcome.message, id);
    }

    QJsonArray suggestions;
    for (const SuggestionCandidate& candidate : outcome.suggestions) {
        suggestions.append(suggestionCandidateToJson(candidate));
    }
    m_suggestionsGenerated += static_cast<qint64>(outcome.suggestions.size());

    QJsonObject result;
    result[QStringLiteral("suggestions")] = suggestions;
    result[QStringLiteral("semantic")] = outcome.semanticConsulted;
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleGetHistory(const QJsonObject& data, std::optional<qint64> id)
{
    const int limit = boundedLimit(data, kDefaultHistoryLimit, kMaxHistoryLimit);
    const QString search = data.value(QStringLiteral("search")).toString().trimmed();

    auto records = search.isEmpty()
        ? m_store->recent(limit, data.value(QStringLiteral("cwd")).toString())
        : m_store->searchText(search, limit);
    if (!records) {
        return IpcMessage::makeError(IpcErrorCode::StoreFailed,
                                     QStringLiteral("Failed to read history"), id);
    }

    QJsonObject result;
    result[QStringLiteral("history")] = recordsToJson(records.value());
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleGetAnalytics(const QJsonObject& data, std::optional<qint64> id)
{
    const int limit = boundedLimit(data, 10, 100);

    auto stats = m_store->statistics();
    auto topCommands = m_store->topCommands(limit);
    auto topDirectories = m_store->topDirectories(limit);
    if (!stats || !topCommands || !topDirectories) {
        return IpcMessage::makeError(IpcErrorCode::StoreFailed,
                                     QStringLiteral("Failed to compute analytics"), id);
    }

    QJsonArray commands;
    for (const CommandStore::CommandSummary& summary : topCommands.value()) {
        QJsonObject entry;
        entry[QStringLiteral("command")] = summary.command;
        entry[QStringLiteral("count")] = summary.useCount;
        entry[QStringLiteral("last_used")] = summary.lastUsed;
        commands.append(entry);
    }

    QJsonArray directories;
    for (const CommandStore::DirectoryUsage& usage : topDirectories.value()) {
        QJsonObject entry;
        entry[QStringLiteral("cwd")] = usage.cwd;
        entry[QStringLiteral("count")] = usage.useCount;
        directories.append(entry);
    }

    QJsonObject result;
    result[QStringLiteral("statistics")] = statisticsToJson(stats.value());
    result[QStringLiteral("top_commands")] = commands;
    result[QStringLiteral("top_directories")] = directories;
    result[QStringLiteral("counters")] = countersJson();
    result[QStringLiteral("index")] = indexJson();
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleGetConfig(const QJsonObject& data, std::optional<qint64> id)
{
    const QString key = data.value(QStringLiteral("key")).toString().trimmed();
    if (key.isEmpty()) {
        QJsonObject result;
        result[QStringLiteral("config")] = m_config->all();
        return IpcMessage::makeResponse(result, id);
    }

    const auto canonical = ConfigProvider::canonicalKey(key);
    const auto value = m_config->get(key);
    if (!canonical || !value) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("Unknown config key: %1").arg(key), id);
    }

    QJsonObject result;
    result[QStringLiteral("key")] = canonical.value();
    result[QStringLiteral("value")] = value.value();
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleSetConfig(const QJsonObject& data, std::optional<qint64> id)
{
    const QString key = data.value(QStringLiteral("key")).toString().trimmed();
    if (key.isEmpty() || !data.contains(QStringLiteral("value"))) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("set_config requires 'key' and 'value'"), id);
    }

    const ConfigProvider::SetResult set = m_config->set(key, data.value(QStringLiteral("value")));
    switch (set.status) {
    case ConfigProvider::SetResult::Status::Ok:
        break;
    case ConfigProvider::SetResult::Status::PersistFailed:
        return IpcMessage::makeError(IpcErrorCode::InternalError, set.message, id);
    default:
        return IpcMessage::makeError(IpcErrorCode::InvalidParams, set.message, id);
    }

    const Settings settings = m_config->snapshot();
    if (set.key.startsWith(QLatin1String("privacy.excluded"))) {
        rebuildPrivacyFilter();
    } else if (set.key.startsWith(QLatin1String("daemon."))) {
        applyTransportSettings(settings);
    } else if (set.key.startsWith(QLatin1String("index.build_"))) {
        m_indexWorker->setBatching(settings.buildBatchSize, settings.buildIntervalMs);
    }
    LOG_INFO(ddCore, "Config updated: %s", qUtf8Printable(set.key));

    QJsonObject result;
    result[QStringLiteral("key")] = set.key;
    result[QStringLiteral("value")] = m_config->get(set.key).value_or(QJsonValue());
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleExplainCommand(const QJsonObject& data, std::optional<qint64> id)
{
    const QString command = data.value(QStringLiteral("command")).toString().trimmed();
    if (command.isEmpty()) {
        return IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                     QStringLiteral("'command' must be a non-empty string"), id);
    }
    if (!m_explainer) {
        return IpcMessage::makeError(IpcErrorCode::Unsupported,
                                     QStringLiteral("No command explainer is configured"), id);
    }

    const std::optional<QString> explanation = m_explainer->explain(command);
    if (!explanation) {
        return IpcMessage::makeError(IpcErrorCode::InternalError,
                                     QStringLiteral("Could not explain command"), id);
    }

    QJsonObject result;
    result[QStringLiteral("command")] = command;
    result[QStringLiteral("explanation")] = explanation.value();
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::handleRebuildIndex(const QJsonObject& data, std::optional<qint64> id)
{
    const IndexWorker::Stats before = m_indexWorker->stats();
    m_indexWorker->requestBuild();

    bool completed = false;
    if (data.value(QStringLiteral("wait")).toBool(false)) {
        const int budgetMs = std::max(100, m_server->limits().requestTimeoutMs - 500);
        completed = m_indexWorker->waitForIdle(budgetMs);

        const IndexWorker::Stats after = m_indexWorker->stats();
        if (after.buildFailures > before.buildFailures) {
            return IpcMessage::makeError(IpcErrorCode::CorruptedIndex,
                                         QStringLiteral("Vector index build failed"), id);
        }
        if (after.saveFailures > before.saveFailures) {
            return IpcMessage::makeError(IpcErrorCode::InternalError,
                                         QStringLiteral("Vector index built but not saved"), id);
        }
    }

    QJsonObject result;
    result[QStringLiteral("queued")] = true;
    result[QStringLiteral("completed")] = completed;
    result[QStringLiteral("index")] = indexJson();
    return IpcMessage::makeResponse(result, id);
}

QJsonObject DaemonService::countersJson() const
{
    QJsonObject json;
    json[QStringLiteral("requests_handled")] = m_requestsHandled.load();
    json[QStringLiteral("commands_logged")] = m_commandsLogged.load();
    json[QStringLiteral("commands_filtered")] = m_commandsFiltered.load();
    json[QStringLiteral("suggestions_generated")] = m_suggestionsGenerated.load();
    json[QStringLiteral("errors")] = m_errors.load();
    return json;
}

QJsonObject DaemonService::indexJson() const
{
    QJsonObject json;
    json[QStringLiteral("state")] = indexStateToString(m_index->state());
    json[QStringLiteral("generation")] = static_cast<qint64>(m_index->generation());
    json[QStringLiteral("size")] = m_index->size();
    json[QStringLiteral("built_size")] = m_index->builtSize();
    json[QStringLiteral("pending")] = m_index->pendingCount();
    json[QStringLiteral("dimensions")] = m_index->dimensions();

    const IndexWorker::Stats stats = m_indexWorker->stats();
    json[QStringLiteral("builds")] = stats.builds;
    json[QStringLiteral("embed_failures")] = stats.embedFailures;
    return json;
}

} // namespace dd
