#pragma once

#include "core/ipc/service_base.h"
#include "core/shared/settings.h"

#include <QDateTime>
#include <QTimer>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace dd {

class CommandExplainer;
class CommandStore;
class ConfigProvider;
class Embedder;
class IndexWorker;
class PrivacyFilter;
class SuggestionCascade;
class VectorIndex;

struct DaemonOptions {
    QString dataDirectory;              // empty: SettingsManager::dataDirectory()
    std::optional<Settings> settings;   // overrides settings.json when set
    bool persistSettings = true;        // set_config writes settings.json
};

// DaemonService -- the shell-history suggestion daemon.
//
// Owns the command store, the vector index with its background builder, the
// suggestion cascade, the privacy filter and the live configuration, and
// answers the socket protocol on top of ServiceBase.
class DaemonService : public ServiceBase {
    Q_OBJECT
public:
    static constexpr int kBootstrapLimit = 1000;
    static constexpr int kMinBootstrapCommands = 10;
    static constexpr int kRetentionIntervalMs = 60 * 60 * 1000;
    static constexpr int kDefaultHistoryLimit = 20;
    static constexpr int kMaxHistoryLimit = 1000;

    explicit DaemonService(QObject* parent = nullptr);
    explicit DaemonService(const DaemonOptions& options, QObject* parent = nullptr);
    ~DaemonService() override;

    // Collaborators must be injected before initialize().
    void setEmbedder(std::unique_ptr<Embedder> embedder);
    void setExplainer(std::unique_ptr<CommandExplainer> explainer);

    // Opens storage, restores the index and starts background work.
    // Returns false when the service cannot run.
    bool initialize();

    // Deletes records older than privacy.retention_days, then drops their
    // commands from the vector index and rebuilds it.
    std::optional<int> runRetentionPass();

    QString dataDirectory() const { return m_dataDirectory; }
    QString databasePath() const;
    QString indexPath() const;
    QString indexMetaPath() const;

    // Exposed for in-process tests.
    IndexWorker* indexWorker() const { return m_indexWorker.get(); }
    VectorIndex* vectorIndex() const { return m_index.get(); }

protected:
    QJsonObject handleRequest(const QJsonObject& request) override;
    void onShutdown() override;

private:
    QJsonObject handleStatus(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleLogCommand(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleSuggest(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleGetHistory(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleGetAnalytics(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleGetConfig(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleSetConfig(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleExplainCommand(const QJsonObject& data, std::optional<qint64> id);
    QJsonObject handleRebuildIndex(const QJsonObject& data, std::optional<qint64> id);

    void rebuildPrivacyFilter();
    std::shared_ptr<const PrivacyFilter> privacyFilter() const;
    void applyTransportSettings(const Settings& settings);
    void bootstrapIndex();
    void discardPrunedFromIndex();
    QJsonObject countersJson() const;
    QJsonObject indexJson() const;

    DaemonOptions m_options;
    QString m_dataDirectory;
    QDateTime m_startedAt;
    std::atomic<bool> m_initialized{false};

    std::unique_ptr<ConfigProvider> m_config;
    std::unique_ptr<CommandStore> m_store;
    std::unique_ptr<VectorIndex> m_index;
    std::unique_ptr<Embedder> m_embedder;
    std::unique_ptr<CommandExplainer> m_explainer;
    std::unique_ptr<SuggestionCascade> m_cascade;
    std::unique_ptr<IndexWorker> m_indexWorker;

    mutable std::mutex m_privacyMutex;
    std::shared_ptr<const PrivacyFilter> m_privacy;

    QTimer m_retentionTimer;

    std::atomic<qint64> m_requestsHandled{0};
    std::atomic<qint64> m_commandsLogged{0};
    std::atomic<qint64> m_commandsFiltered{0};
    std::atomic<qint64> m_suggestionsGenerated{0};
    std::atomic<qint64> m_errors{0};
};

} // namespace dd
