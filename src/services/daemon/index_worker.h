#pragma once

#include <QSet>
#include <QString>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace dd {

class Embedder;
class VectorIndex;

// IndexWorker -- background thread that embeds newly logged commands and
// rebuilds the vector index.
//
// Commands are embedded as they arrive. A build (followed by a save) runs
// once buildBatchSize vectors are pending, when buildIntervalMs has passed
// with vectors pending, on requestBuild(), and at stop(). Each distinct
// command text is indexed once.
class IndexWorker {
public:
    struct Stats {
        int queued = 0;
        int embedded = 0;
        int embedFailures = 0;
        int builds = 0;
        int buildFailures = 0;
        int saveFailures = 0;
    };

    IndexWorker(VectorIndex& index,
                Embedder& embedder,
                std::string indexPath,
                std::string metaPath,
                int buildBatchSize,
                int buildIntervalMs);
    ~IndexWorker();

    IndexWorker(const IndexWorker&) = delete;
    IndexWorker& operator=(const IndexWorker&) = delete;

    void start();

    // Embeds whatever is queued, builds, saves, then joins the thread.
    void stop();

    // Returns false when the command is already indexed or queued.
    bool enqueue(int64_t id, const QString& command);

    void requestBuild();

    // Drops queued and indexed commands missing from liveCommands and, when
    // anything was dropped, schedules a rebuild and save. Returns the number
    // of index entries removed.
    int discardStale(const QSet<QString>& liveCommands);

    // Blocks until the queue is drained and no build is running.
    bool waitForIdle(int timeoutMs);

    void setBatching(int buildBatchSize, int buildIntervalMs);

    Stats stats() const;

private:
    struct Job {
        int64_t id = 0;
        QString command;
    };

    void run();
    void embed(const Job& job);
    void buildAndSave();

    VectorIndex& m_index;
    Embedder& m_embedder;
    const std::string m_indexPath;
    const std::string m_metaPath;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::deque<Job> m_queue;
    QSet<QString> m_known;
    bool m_stop = false;
    bool m_buildRequested = false;
    bool m_busy = false;
    int m_buildBatchSize;
    int m_buildIntervalMs;
    Stats m_stats;

    std::thread m_thread;
};

} // namespace dd
