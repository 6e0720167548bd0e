#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace dd {

namespace {

constexpr int kMetaVersion = 1;

} // namespace

struct VectorIndex::Snapshot {
    uint64_t generation = 0;
    std::unique_ptr<hnswlib::L2Space> space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
    std::vector<QJsonObject> metadata;
};

VectorIndex::VectorIndex(int dimensions)
    : m_dimensions(std::max(dimensions, 1))
{
    if (dimensions <= 0) {
        qCWarning(ddIndex) << "VectorIndex created with invalid dimensions" << dimensions
                           << "- using 1";
    }
}

VectorIndex::~VectorIndex() = default;

std::shared_ptr<const VectorIndex::Snapshot> VectorIndex::currentSnapshot() const
{
    std::shared_lock<std::shared_mutex> lock(m_snapshotMutex);
    return m_snapshot;
}

void VectorIndex::publish(std::shared_ptr<const Snapshot> snapshot)
{
    std::unique_lock<std::shared_mutex> lock(m_snapshotMutex);
    m_snapshot = std::move(snapshot);
}

VectorIndex::AddResult VectorIndex::add(const std::vector<float>& vector, const QJsonObject& metadata)
{
    AddResult result;
    if (static_cast<int>(vector.size()) != m_dimensions) {
        qCWarning(ddIndex) << "VectorIndex::add dimension mismatch:" << vector.size()
                           << "expected" << m_dimensions;
        result.status = AddResult::Status::DimensionMismatch;
        return result;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    result.localIndex = static_cast<uint64_t>(m_entries.size());
    m_entries.push_back(Entry{vector, metadata});
    ++m_pending;
    return result;
}

VectorIndex::BuildResult VectorIndex::build()
{
    std::lock_guard<std::mutex> buildLock(m_buildMutex);

    BuildResult result;
    const auto previous = currentSnapshot();
    result.generation = previous ? previous->generation : 0;

    std::vector<Entry> entries;
    int pendingAtCopy = 0;
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        const bool changed = previous ? (m_pending > 0 || m_dirty) : !m_entries.empty();
        if (!changed) {
            result.status = BuildResult::Status::Unchanged;
            result.entries = previous ? static_cast<int>(previous->metadata.size()) : 0;
            return result;
        }
        entries = m_entries;
        pendingAtCopy = m_pending;
    }

    auto snapshot = std::make_shared<Snapshot>();
    snapshot->generation = result.generation + 1;
    snapshot->metadata.reserve(entries.size());

    try {
        snapshot->space = std::make_unique<hnswlib::L2Space>(static_cast<size_t>(m_dimensions));
        snapshot->hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            snapshot->space.get(),
            std::max<size_t>(entries.size(), 1),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction),
            kRandomSeed);
        for (size_t label = 0; label < entries.size(); ++label) {
            snapshot->hnsw->addPoint(entries[label].vector.data(),
                                     static_cast<hnswlib::labeltype>(label));
            snapshot->metadata.push_back(entries[label].metadata);
        }
        snapshot->hnsw->setEf(static_cast<size_t>(kEfSearch));
    } catch (const std::exception& e) {
        qCCritical(ddIndex) << "VectorIndex::build failed:" << e.what();
        result.status = BuildResult::Status::Failed;
        return result;
    }

    result.status = BuildResult::Status::Built;
    result.generation = snapshot->generation;
    result.entries = static_cast<int>(entries.size());
    {
        // retain() holds the build mutex, so only add() ran meanwhile.
        std::lock_guard<std::mutex> lock(m_writeMutex);
        m_pending -= pendingAtCopy;
        m_dirty = false;
    }
    publish(std::move(snapshot));

    LOG_INFO(ddIndex, "Vector index built: generation=%llu entries=%d",
             static_cast<unsigned long long>(result.generation), result.entries);
    return result;
}

VectorIndex::QueryResult VectorIndex::query(const std::vector<float>& vector, int k) const
{
    QueryResult result;
    const auto snapshot = currentSnapshot();
    if (!snapshot) {
        result.status = QueryResult::Status::NotBuilt;
        return result;
    }
    result.generation = snapshot->generation;

    if (static_cast<int>(vector.size()) != m_dimensions) {
        result.status = QueryResult::Status::DimensionMismatch;
        return result;
    }

    const size_t population = snapshot->metadata.size();
    if (k <= 0 || population == 0) {
        return result;
    }
    const size_t effectiveK = std::min(static_cast<size_t>(k), population);

    try {
        auto queue = snapshot->hnsw->searchKnn(vector.data(), effectiveK);
        result.hits.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            const auto label = static_cast<uint64_t>(entry.second);
            if (label >= population) {
                continue;
            }
            QueryHit hit;
            hit.localIndex = label;
            hit.distance = std::sqrt(std::max(entry.first, 0.0f));
            hit.metadata = snapshot->metadata[label];
            result.hits.push_back(std::move(hit));
        }
    } catch (const std::exception& e) {
        qCCritical(ddIndex) << "VectorIndex::query failed:" << e.what();
        result.status = QueryResult::Status::Failed;
        result.hits.clear();
        return result;
    }

    std::sort(result.hits.begin(), result.hits.end(), [](const QueryHit& a, const QueryHit& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.localIndex < b.localIndex;
    });
    return result;
}

int VectorIndex::retain(const std::function<bool(const QJsonObject&)>& keep)
{
    std::lock_guard<std::mutex> buildLock(m_buildMutex);
    std::lock_guard<std::mutex> lock(m_writeMutex);

    const size_t firstPending = m_entries.size() - static_cast<size_t>(m_pending);
    size_t kept = 0;
    int removedPending = 0;
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (keep(m_entries[i].metadata)) {
            if (kept != i) {
                m_entries[kept] = std::move(m_entries[i]);
            }
            ++kept;
        } else if (i >= firstPending) {
            ++removedPending;
        }
    }

    const int removed = static_cast<int>(m_entries.size() - kept);
    if (removed == 0) {
        return 0;
    }
    m_entries.resize(kept);
    m_pending -= removedPending;
    if (removed > removedPending) {
        m_dirty = true;
    }

    LOG_INFO(ddIndex, "Vector index dropped %d stale entr%s (%d remain)",
             removed, removed == 1 ? "y" : "ies", static_cast<int>(kept));
    return removed;
}

bool VectorIndex::save(const std::string& indexPath, const std::string& metaPath) const
{
    const auto snapshot = currentSnapshot();
    if (!snapshot) {
        qCWarning(ddIndex) << "VectorIndex::save called before the first build";
        return false;
    }

    const std::string tmpIndexPath = indexPath + ".tmp";
    try {
        snapshot->hnsw->saveIndex(tmpIndexPath);
    } catch (const std::exception& e) {
        qCCritical(ddIndex) << "VectorIndex::save failed to persist index:" << e.what();
        std::remove(tmpIndexPath.c_str());
        return false;
    }

    QJsonArray metadata;
    for (const QJsonObject& entry : snapshot->metadata) {
        metadata.append(entry);
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("version"), kMetaVersion);
    meta.insert(QStringLiteral("space"), QStringLiteral("l2"));
    meta.insert(QStringLiteral("dimensions"), m_dimensions);
    meta.insert(QStringLiteral("generation"), static_cast<qint64>(snapshot->generation));
    meta.insert(QStringLiteral("total_elements"), static_cast<int>(snapshot->metadata.size()));
    meta.insert(QStringLiteral("ef_construction"), kEfConstruction);
    meta.insert(QStringLiteral("m"), kM);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    meta.insert(QStringLiteral("metadata"), metadata);

    QSaveFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCCritical(ddIndex) << "VectorIndex::save failed to open meta file for write:"
                            << metaFile.fileName();
        std::remove(tmpIndexPath.c_str());
        return false;
    }
    metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Compact));

    // Index first, then the sidecar that describes it.
    if (std::rename(tmpIndexPath.c_str(), indexPath.c_str()) != 0) {
        qCCritical(ddIndex) << "VectorIndex::save failed to move index into place:"
                            << QString::fromStdString(indexPath);
        metaFile.cancelWriting();
        std::remove(tmpIndexPath.c_str());
        return false;
    }
    if (!metaFile.commit()) {
        qCCritical(ddIndex) << "VectorIndex::save failed writing meta file:" << metaFile.fileName();
        return false;
    }

    QFile::setPermissions(QString::fromStdString(indexPath), QFile::ReadOwner | QFile::WriteOwner);
    QFile::setPermissions(QString::fromStdString(metaPath), QFile::ReadOwner | QFile::WriteOwner);
    return true;
}

bool VectorIndex::load(const std::string& indexPath, const std::string& metaPath)
{
    const QFileInfo indexInfo(QString::fromStdString(indexPath));
    if (!indexInfo.exists()) {
        qCInfo(ddIndex) << "VectorIndex::load found no saved index at" << indexInfo.filePath();
        return true;
    }
    if (!indexInfo.isFile()) {
        qCCritical(ddIndex) << "VectorIndex::load index path is not a file:" << indexInfo.filePath();
        return false;
    }

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::ReadOnly)) {
        qCCritical(ddIndex) << "VectorIndex::load failed to open meta file:" << metaFile.fileName();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument metaDoc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    metaFile.close();
    if (parseError.error != QJsonParseError::NoError || !metaDoc.isObject()) {
        qCCritical(ddIndex) << "VectorIndex::load invalid meta JSON:" << parseError.errorString();
        return false;
    }

    const QJsonObject meta = metaDoc.object();
    const int dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    if (dimensions != m_dimensions) {
        qCCritical(ddIndex) << "VectorIndex::load dimension mismatch:" << dimensions
                            << "expected" << m_dimensions;
        return false;
    }

    const QJsonArray metadata = meta.value(QStringLiteral("metadata")).toArray();
    const int totalElements = meta.value(QStringLiteral("total_elements")).toInt(-1);
    if (totalElements != metadata.size()) {
        qCCritical(ddIndex) << "VectorIndex::load metadata table has" << metadata.size()
                            << "entries, expected" << totalElements;
        return false;
    }

    auto snapshot = std::make_shared<Snapshot>();
    snapshot->generation = static_cast<uint64_t>(
        meta.value(QStringLiteral("generation")).toVariant().toULongLong());

    std::vector<Entry> entries;
    entries.reserve(static_cast<size_t>(metadata.size()));

    try {
        snapshot->space = std::make_unique<hnswlib::L2Space>(static_cast<size_t>(m_dimensions));
        snapshot->hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(snapshot->space.get());
        snapshot->hnsw->loadIndex(indexPath, snapshot->space.get(),
                                  static_cast<size_t>(std::max(totalElements, 1)));
        snapshot->hnsw->setEf(static_cast<size_t>(kEfSearch));

        if (snapshot->hnsw->getCurrentElementCount() != static_cast<size_t>(totalElements)) {
            qCCritical(ddIndex) << "VectorIndex::load element count"
                                << snapshot->hnsw->getCurrentElementCount()
                                << "does not match metadata" << totalElements;
            return false;
        }

        for (int label = 0; label < totalElements; ++label) {
            Entry entry;
            entry.vector = snapshot->hnsw->getDataByLabel<float>(
                static_cast<hnswlib::labeltype>(label));
            entry.metadata = metadata.at(label).toObject();
            snapshot->metadata.push_back(entry.metadata);
            entries.push_back(std::move(entry));
        }
    } catch (const std::exception& e) {
        qCCritical(ddIndex) << "VectorIndex::load failed:" << e.what();
        return false;
    }

    std::lock_guard<std::mutex> buildLock(m_buildMutex);
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        m_entries = std::move(entries);
        m_pending = 0;
        m_dirty = false;
    }
    publish(std::move(snapshot));

    LOG_INFO(ddIndex, "Vector index loaded: %d entries", totalElements);
    return true;
}

VectorIndex::State VectorIndex::state() const
{
    const auto snapshot = currentSnapshot();
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_entries.empty() && !snapshot) {
        return State::Empty;
    }
    if (!snapshot || m_pending > 0 || m_dirty) {
        return State::Accumulating;
    }
    return State::Built;
}

bool VectorIndex::isBuilt() const
{
    return currentSnapshot() != nullptr;
}

uint64_t VectorIndex::generation() const
{
    const auto snapshot = currentSnapshot();
    return snapshot ? snapshot->generation : 0;
}

int VectorIndex::size() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return static_cast<int>(m_entries.size());
}

int VectorIndex::builtSize() const
{
    const auto snapshot = currentSnapshot();
    return snapshot ? static_cast<int>(snapshot->metadata.size()) : 0;
}

int VectorIndex::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_pending;
}

bool VectorIndex::hasUnbuiltChanges() const
{
    const bool built = isBuilt();
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return built ? (m_pending > 0 || m_dirty) : !m_entries.empty();
}

std::vector<QJsonObject> VectorIndex::entryMetadata() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    std::vector<QJsonObject> metadata;
    metadata.reserve(m_entries.size());
    for (const Entry& entry : m_entries) {
        metadata.push_back(entry.metadata);
    }
    return metadata;
}

} // namespace dd
