#pragma once

#include <QJsonObject>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hnswlib {
class L2Space;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace dd {

// VectorIndex -- approximate nearest neighbour search over command
// embeddings, backed by an hnswlib HNSW graph.
//
// add() only appends to the pending entry table. build() constructs a fresh
// graph over every entry and publishes it as an immutable snapshot; queries
// copy the current snapshot pointer and search it without further locking,
// so a build never disturbs in-flight queries.
//
// retain() discards stale entries from the table; the published snapshot
// keeps serving them until the next build.
//
// Entry labels are the dense insertion order [0, N).
class VectorIndex {
public:
    enum class State {
        Empty,
        Accumulating,
        Built,
    };

    struct AddResult {
        enum class Status {
            Ok,
            DimensionMismatch,
        };

        Status status = Status::Ok;
        uint64_t localIndex = 0;
    };

    struct BuildResult {
        enum class Status {
            Built,
            Unchanged,
            Failed,
        };

        Status status = Status::Unchanged;
        uint64_t generation = 0;
        int entries = 0;
    };

    struct QueryHit {
        uint64_t localIndex = 0;
        float distance = 0.0f;     // Euclidean
        QJsonObject metadata;
    };

    struct QueryResult {
        enum class Status {
            Ok,
            NotBuilt,
            DimensionMismatch,
            Failed,
        };

        Status status = Status::Ok;
        uint64_t generation = 0;
        std::vector<QueryHit> hits;  // ascending distance
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr size_t kRandomSeed = 100;

    explicit VectorIndex(int dimensions);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    AddResult add(const std::vector<float>& vector, const QJsonObject& metadata);
    BuildResult build();
    QueryResult query(const std::vector<float>& vector, int k) const;

    // Drops every entry whose metadata fails keep() and compacts the rest,
    // preserving insertion order. Returns the number removed.
    int retain(const std::function<bool(const QJsonObject&)>& keep);

    // Persists the published snapshot. Returns false when nothing is built.
    bool save(const std::string& indexPath, const std::string& metaPath) const;

    // A missing index file is not an error: the index stays unbuilt.
    bool load(const std::string& indexPath, const std::string& metaPath);

    State state() const;
    bool isBuilt() const;
    uint64_t generation() const;
    int dimensions() const { return m_dimensions; }
    int size() const;
    int builtSize() const;
    int pendingCount() const;

    // True when a build() would publish a different snapshot.
    bool hasUnbuiltChanges() const;

    // Metadata of every entry, built or pending, by local index.
    std::vector<QJsonObject> entryMetadata() const;

private:
    struct Entry {
        std::vector<float> vector;
        QJsonObject metadata;
    };

    struct Snapshot;

    std::shared_ptr<const Snapshot> currentSnapshot() const;
    void publish(std::shared_ptr<const Snapshot> snapshot);

    const int m_dimensions;

    mutable std::mutex m_writeMutex;
    std::vector<Entry> m_entries;
    int m_pending = 0;       // trailing entries added since the last build
    bool m_dirty = false;    // entries removed since the last build

    std::mutex m_buildMutex;

    mutable std::shared_mutex m_snapshotMutex;
    std::shared_ptr<const Snapshot> m_snapshot;
};

} // namespace dd
