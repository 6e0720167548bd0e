#include "index_worker.h"
#include "core/embedding/embedder.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <QElapsedTimer>
#include <QJsonObject>

#include <algorithm>
#include <chrono>
#include <utility>

namespace dd {

IndexWorker::IndexWorker(VectorIndex& index,
                         Embedder& embedder,
                         std::string indexPath,
                         std::string metaPath,
                         int buildBatchSize,
                         int buildIntervalMs)
    : m_index(index)
    , m_embedder(embedder)
    , m_indexPath(std::move(indexPath))
    , m_metaPath(std::move(metaPath))
    , m_buildBatchSize(std::max(1, buildBatchSize))
    , m_buildIntervalMs(std::max(100, buildIntervalMs))
{
    // Commands restored from a saved index are not embedded again.
    for (const QJsonObject& metadata : m_index.entryMetadata()) {
        const QString command = metadata.value(QStringLiteral("command")).toString();
        if (!command.isEmpty()) {
            m_known.insert(command);
        }
    }
}

IndexWorker::~IndexWorker()
{
    stop();
}

void IndexWorker::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) {
        return;
    }
    m_stop = false;
    m_thread = std::thread(&IndexWorker::run, this);
    LOG_INFO(ddIndex, "Index worker started (batch=%d interval=%dms known=%d)",
             m_buildBatchSize, m_buildIntervalMs, static_cast<int>(m_known.size()));
}

void IndexWorker::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_thread.joinable()) {
            return;
        }
        m_stop = true;
    }
    m_wake.notify_all();
    m_thread.join();
    LOG_INFO(ddIndex, "Index worker stopped");
}

bool IndexWorker::enqueue(int64_t id, const QString& command)
{
    const QString text = command.trimmed();
    if (text.isEmpty()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop || m_known.contains(text)) {
            return false;
        }
        m_known.insert(text);
        m_queue.push_back({id, text});
        ++m_stats.queued;
    }
    m_wake.notify_one();
    return true;
}

void IndexWorker::requestBuild()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buildRequested = true;
    }
    m_wake.notify_one();
}

int IndexWorker::discardStale(const QSet<QString>& liveCommands)
{
    QSet<QString> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto stale = std::remove_if(m_queue.begin(), m_queue.end(),
                                          [&liveCommands](const Job& job) {
                                              return !liveCommands.contains(job.command);
                                          });
        for (auto it = stale; it != m_queue.end(); ++it) {
            dropped.insert(it->command);
        }
        m_queue.erase(stale, m_queue.end());
    }

    const int removed = m_index.retain([&](const QJsonObject& metadata) {
        const QString command = metadata.value(QStringLiteral("command")).toString();
        if (liveCommands.contains(command)) {
            return true;
        }
        dropped.insert(command);
        return false;
    });

    if (dropped.isEmpty()) {
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const QString& command : dropped) {
            m_known.remove(command);
        }
        if (removed > 0) {
            m_buildRequested = true;
        }
    }
    if (removed > 0) {
        m_wake.notify_one();
    }
    LOG_INFO(ddIndex, "Discarded %d stale command(s), %d from the index",
             static_cast<int>(dropped.size()), removed);
    return removed;
}

bool IndexWorker::waitForIdle(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this]() {
        return m_queue.empty() && !m_busy && !m_buildRequested;
    });
}

void IndexWorker::setBatching(int buildBatchSize, int buildIntervalMs)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buildBatchSize = std::max(1, buildBatchSize);
        m_buildIntervalMs = std::max(100, buildIntervalMs);
    }
    m_wake.notify_one();
}

IndexWorker::Stats IndexWorker::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void IndexWorker::run()
{
    QElapsedTimer sinceBuild;
    sinceBuild.start();

    while (true) {
        std::deque<Job> jobs;
        bool forced = false;
        bool stopping = false;
        int batchSize = 0;
        int intervalMs = 0;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait_for(lock, std::chrono::milliseconds(m_buildIntervalMs), [this]() {
                return m_stop || m_buildRequested || !m_queue.empty();
            });
            jobs.swap(m_queue);
            forced = m_buildRequested;
            stopping = m_stop;
            batchSize = m_buildBatchSize;
            intervalMs = m_buildIntervalMs;
            m_busy = true;
        }

        for (const Job& job : jobs) {
            embed(job);
        }

        const int pending = m_index.pendingCount();
        const bool due = pending >= batchSize || sinceBuild.elapsed() >= intervalMs;
        if (m_index.hasUnbuiltChanges() && (due || forced || stopping)) {
            buildAndSave();
            sinceBuild.restart();
        } else if (forced) {
            LOG_DEBUG(ddIndex, "Build requested with nothing pending");
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
            if (forced) {
                m_buildRequested = false;
            }
        }
        m_idle.notify_all();

        if (stopping) {
            break;
        }
    }
}

void IndexWorker::embed(const Job& job)
{
    const std::vector<float> vector = m_embedder.encode(job.command);
    if (vector.empty()) {
        LOG_WARN(ddIndex, "Embedding failed for command id=%lld",
                 static_cast<long long>(job.id));
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stats.embedFailures;
        m_known.remove(job.command);
        return;
    }

    QJsonObject metadata;
    metadata[QStringLiteral("command")] = job.command;
    metadata[QStringLiteral("id")] = static_cast<qint64>(job.id);

    const VectorIndex::AddResult added = m_index.add(vector, metadata);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (added.status != VectorIndex::AddResult::Status::Ok) {
        LOG_WARN(ddIndex, "Embedding for id=%lld has %d dimensions, index expects %d",
                 static_cast<long long>(job.id), static_cast<int>(vector.size()),
                 m_index.dimensions());
        ++m_stats.embedFailures;
        m_known.remove(job.command);
        return;
    }
    ++m_stats.embedded;
}

void IndexWorker::buildAndSave()
{
    const VectorIndex::BuildResult result = m_index.build();
    if (result.status == VectorIndex::BuildResult::Status::Failed) {
        LOG_ERROR(ddIndex, "Index build failed");
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stats.buildFailures;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (result.status == VectorIndex::BuildResult::Status::Built) {
            ++m_stats.builds;
        }
    }

    if (m_indexPath.empty()) {
        return;
    }
    if (!m_index.save(m_indexPath, m_metaPath)) {
        LOG_ERROR(ddIndex, "Failed to save index to %s", m_indexPath.c_str());
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stats.saveFailures;
        return;
    }
    LOG_INFO(ddIndex, "Index generation %llu saved (%d entries)",
             static_cast<unsigned long long>(result.generation), result.entries);
}

} // namespace dd
