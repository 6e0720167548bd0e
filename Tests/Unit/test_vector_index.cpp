#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/vector/vector_index.h"

#include <atomic>
#include <cmath>
#include <thread>

class TestVectorIndex : public QObject {
    Q_OBJECT

private slots:
    void testQueryBeforeBuildIsNotBuilt();
    void testAddRejectsWrongDimension();
    void testLocalIndicesAreDense();
    void testQueryOrdersByEuclideanDistance();
    void testQueryRejectsWrongDimension();
    void testKLargerThanPopulationReturnsEverything();
    void testBuildIsIdempotentWithoutNewEntries();
    void testAddAfterBuildIsInvisibleUntilRebuild();
    void testRetainDiscardsEntriesAtNextBuild();
    void testRetainCountsDroppedPendingEntries();
    void testRetainEverythingBuildsEmptyIndex();
    void testSaveLoadPreservesResults();
    void testSaveBeforeBuildFails();
    void testLoadMissingFileLeavesIndexUnbuilt();
    void testLoadRejectsDimensionMismatch();
    void testQueriesDuringRebuildSeeCompleteSnapshot();
};

namespace {

std::vector<float> unit(int dims, int axis, float scale = 1.0f)
{
    std::vector<float> v(static_cast<size_t>(dims), 0.0f);
    v[static_cast<size_t>(axis)] = scale;
    return v;
}

QJsonObject meta(const QString& command, qint64 id)
{
    return QJsonObject{{QStringLiteral("command"), command}, {QStringLiteral("id"), id}};
}

} // namespace

void TestVectorIndex::testQueryBeforeBuildIsNotBuilt()
{
    dd::VectorIndex index(4);
    QCOMPARE(index.state(), dd::VectorIndex::State::Empty);

    auto result = index.query(unit(4, 0), 3);
    QCOMPARE(result.status, dd::VectorIndex::QueryResult::Status::NotBuilt);
    QVERIFY(result.hits.empty());

    QCOMPARE(index.add(unit(4, 0), meta(QStringLiteral("ls"), 1)).status,
             dd::VectorIndex::AddResult::Status::Ok);
    QCOMPARE(index.state(), dd::VectorIndex::State::Accumulating);
    QCOMPARE(index.query(unit(4, 0), 3).status, dd::VectorIndex::QueryResult::Status::NotBuilt);
}

void TestVectorIndex::testAddRejectsWrongDimension()
{
    dd::VectorIndex index(4);
    auto result = index.add(std::vector<float>(3, 1.0f), meta(QStringLiteral("ls"), 1));
    QCOMPARE(result.status, dd::VectorIndex::AddResult::Status::DimensionMismatch);
    QCOMPARE(index.size(), 0);
}

void TestVectorIndex::testLocalIndicesAreDense()
{
    dd::VectorIndex index(4);
    for (int i = 0; i < 4; ++i) {
        auto added = index.add(unit(4, i), meta(QStringLiteral("c%1").arg(i), i));
        QCOMPARE(added.status, dd::VectorIndex::AddResult::Status::Ok);
        QCOMPARE(added.localIndex, static_cast<uint64_t>(i));
    }
    QCOMPARE(index.size(), 4);
    QCOMPARE(index.pendingCount(), 4);
}

void TestVectorIndex::testQueryOrdersByEuclideanDistance()
{
    dd::VectorIndex index(4);
    index.add(unit(4, 0), meta(QStringLiteral("near"), 1));
    index.add(unit(4, 0, 3.0f), meta(QStringLiteral("middle"), 2));
    index.add(unit(4, 1, 6.0f), meta(QStringLiteral("far"), 3));

    auto built = index.build();
    QCOMPARE(built.status, dd::VectorIndex::BuildResult::Status::Built);
    QCOMPARE(built.generation, uint64_t(1));
    QCOMPARE(built.entries, 3);
    QVERIFY(index.isBuilt());

    auto result = index.query(unit(4, 0), 3);
    QCOMPARE(result.status, dd::VectorIndex::QueryResult::Status::Ok);
    QCOMPARE(result.hits.size(), size_t(3));
    QCOMPARE(result.hits[0].metadata.value(QStringLiteral("command")).toString(),
             QStringLiteral("near"));
    QCOMPARE(result.hits[1].metadata.value(QStringLiteral("command")).toString(),
             QStringLiteral("middle"));
    QCOMPARE(result.hits[2].metadata.value(QStringLiteral("command")).toString(),
             QStringLiteral("far"));

    QVERIFY(std::fabs(result.hits[0].distance - 0.0f) < 1e-4f);
    QVERIFY(std::fabs(result.hits[1].distance - 2.0f) < 1e-4f);
    QVERIFY(std::fabs(result.hits[2].distance - std::sqrt(37.0f)) < 1e-4f);
}

void TestVectorIndex::testQueryRejectsWrongDimension()
{
    dd::VectorIndex index(4);
    index.add(unit(4, 0), meta(QStringLiteral("ls"), 1));
    index.build();
    QCOMPARE(index.query(std::vector<float>(5, 0.0f), 1).status,
             dd::VectorIndex::QueryResult::Status::DimensionMismatch);
}

void TestVectorIndex::testKLargerThanPopulationReturnsEverything()
{
    dd::VectorIndex index(4);
    for (int i = 0; i < 3; ++i) {
        index.add(unit(4, i), meta(QStringLiteral("c%1").arg(i), i));
    }
    index.build();

    auto result = index.query(unit(4, 0), 50);
    QCOMPARE(result.status, dd::VectorIndex::QueryResult::Status::Ok);
    QCOMPARE(result.hits.size(), size_t(3));
}

void TestVectorIndex::testBuildIsIdempotentWithoutNewEntries()
{
    dd::VectorIndex index(4);
    for (int i = 0; i < 4; ++i) {
        index.add(unit(4, i, 1.0f + i), meta(QStringLiteral("c%1").arg(i), i));
    }
    QCOMPARE(index.build().generation, uint64_t(1));
    auto before = index.query(unit(4, 2), 4);

    auto again = index.build();
    QCOMPARE(again.status, dd::VectorIndex::BuildResult::Status::Unchanged);
    QCOMPARE(again.generation, uint64_t(1));
    QCOMPARE(index.generation(), uint64_t(1));

    auto after = index.query(unit(4, 2), 4);
    QCOMPARE(after.hits.size(), before.hits.size());
    for (size_t i = 0; i < after.hits.size(); ++i) {
        QCOMPARE(after.hits[i].localIndex, before.hits[i].localIndex);
        QCOMPARE(after.hits[i].distance, before.hits[i].distance);
    }
}

void TestVectorIndex::testAddAfterBuildIsInvisibleUntilRebuild()
{
    dd::VectorIndex index(4);
    index.add(unit(4, 0), meta(QStringLiteral("first"), 1));
    index.build();

    index.add(unit(4, 1), meta(QStringLiteral("second"), 2));
    QCOMPARE(index.state(), dd::VectorIndex::State::Accumulating);
    QVERIFY(index.isBuilt());
    QCOMPARE(index.pendingCount(), 1);
    QCOMPARE(index.builtSize(), 1);

    auto stale = index.query(unit(4, 1), 5);
    QCOMPARE(stale.status, dd::VectorIndex::QueryResult::Status::Ok);
    QCOMPARE(stale.hits.size(), size_t(1));
    QCOMPARE(stale.generation, uint64_t(1));

    auto rebuilt = index.build();
    QCOMPARE(rebuilt.status, dd::VectorIndex::BuildResult::Status::Built);
    QCOMPARE(rebuilt.generation, uint64_t(2));
    QCOMPARE(index.state(), dd::VectorIndex::State::Built);

    auto fresh = index.query(unit(4, 1), 5);
    QCOMPARE(fresh.hits.size(), size_t(2));
    QCOMPARE(fresh.hits[0].metadata.value(QStringLiteral("command")).toString(),
             QStringLiteral("second"));
}

void TestVectorIndex::testRetainDiscardsEntriesAtNextBuild()
{
    dd::VectorIndex index(4);
    for (int i = 0; i < 4; ++i) {
        index.add(unit(4, i), meta(QStringLiteral("c%1").arg(i), i));
    }
    QCOMPARE(index.build().generation, uint64_t(1));

    QCOMPARE(index.retain([](const QJsonObject&) { return true; }), 0);
    QCOMPARE(index.build().status, dd::VectorIndex::BuildResult::Status::Unchanged);

    const int removed = index.retain([](const QJsonObject& m) {
        const qint64 id = m.value(QStringLiteral("id")).toInteger();
        return id != 1 && id != 3;
    });
    QCOMPARE(removed, 2);
    QCOMPARE(index.size(), 2);
    QCOMPARE(index.pendingCount(), 0);
    QVERIFY(index.hasUnbuiltChanges());
    QCOMPARE(index.state(), dd::VectorIndex::State::Accumulating);

    // The published snapshot still answers until the rebuild.
    QCOMPARE(index.query(unit(4, 0), 10).hits.size(), size_t(4));

    auto rebuilt = index.build();
    QCOMPARE(rebuilt.status, dd::VectorIndex::BuildResult::Status::Built);
    QCOMPARE(rebuilt.generation, uint64_t(2));
    QCOMPARE(rebuilt.entries, 2);
    QCOMPARE(index.state(), dd::VectorIndex::State::Built);
    QVERIFY(!index.hasUnbuiltChanges());

    auto result = index.query(unit(4, 0), 10);
    QCOMPARE(result.hits.size(), size_t(2));
    QCOMPARE(result.hits[0].metadata.value(QStringLiteral("command")).toString(),
             QStringLiteral("c0"));
    QCOMPARE(result.hits[0].localIndex, uint64_t(0));
    QCOMPARE(result.hits[1].metadata.value(QStringLiteral("command")).toString(),
             QStringLiteral("c2"));
    QCOMPARE(result.hits[1].localIndex, uint64_t(1));

    const auto metadata = index.entryMetadata();
    QCOMPARE(metadata.size(), size_t(2));
    QCOMPARE(metadata[1].value(QStringLiteral("command")).toString(), QStringLiteral("c2"));
}

void TestVectorIndex::testRetainCountsDroppedPendingEntries()
{
    dd::VectorIndex index(4);
    index.add(unit(4, 0), meta(QStringLiteral("built"), 1));
    index.build();
    index.add(unit(4, 1), meta(QStringLiteral("dropped"), 2));
    index.add(unit(4, 2), meta(QStringLiteral("kept"), 3));
    QCOMPARE(index.pendingCount(), 2);

    QCOMPARE(index.retain([](const QJsonObject& m) {
                 return m.value(QStringLiteral("command")).toString() != QLatin1String("dropped");
             }),
             1);
    QCOMPARE(index.pendingCount(), 1);
    QCOMPARE(index.size(), 2);

    QCOMPARE(index.build().entries, 2);
    QCOMPARE(index.pendingCount(), 0);
    QCOMPARE(index.builtSize(), 2);
}

void TestVectorIndex::testRetainEverythingBuildsEmptyIndex()
{
    dd::VectorIndex index(4);
    index.add(unit(4, 0), meta(QStringLiteral("a"), 1));
    index.add(unit(4, 1), meta(QStringLiteral("b"), 2));
    index.build();

    QCOMPARE(index.retain([](const QJsonObject&) { return false; }), 2);
    auto rebuilt = index.build();
    QCOMPARE(rebuilt.status, dd::VectorIndex::BuildResult::Status::Built);
    QCOMPARE(rebuilt.entries, 0);
    QVERIFY(index.isBuilt());
    QCOMPARE(index.builtSize(), 0);

    auto result = index.query(unit(4, 0), 5);
    QCOMPARE(result.status, dd::VectorIndex::QueryResult::Status::Ok);
    QVERIFY(result.hits.empty());
}

void TestVectorIndex::testSaveLoadPreservesResults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const std::string indexPath = (dir.path() + "/commands.hnsw").toStdString();
    const std::string metaPath = (dir.path() + "/commands.hnsw.meta.json").toStdString();

    dd::VectorIndex original(8);
    for (int i = 0; i < 8; ++i) {
        original.add(unit(8, i, 1.0f + 0.5f * i), meta(QStringLiteral("cmd %1").arg(i), 100 + i));
    }
    original.build();
    original.add(unit(8, 0, 9.0f), meta(QStringLiteral("pending"), 200));
    original.build();
    QVERIFY(original.save(indexPath, metaPath));
    QVERIFY(!QFile::exists(QString::fromStdString(indexPath + ".tmp")));

    dd::VectorIndex restored(8);
    QVERIFY(restored.load(indexPath, metaPath));
    QVERIFY(restored.isBuilt());
    QCOMPARE(restored.generation(), original.generation());
    QCOMPARE(restored.size(), original.size());
    QCOMPARE(restored.pendingCount(), 0);

    const std::vector<float> queryVector = unit(8, 3, 2.0f);
    auto expected = original.query(queryVector, 5);
    auto actual = restored.query(queryVector, 5);
    QCOMPARE(actual.hits.size(), expected.hits.size());
    for (size_t i = 0; i < actual.hits.size(); ++i) {
        QCOMPARE(actual.hits[i].metadata, expected.hits[i].metadata);
        QVERIFY(std::fabs(actual.hits[i].distance - expected.hits[i].distance) < 1e-5f);
    }

    const auto metadata = restored.entryMetadata();
    QCOMPARE(metadata.size(), size_t(9));
    QCOMPARE(metadata.back().value(QStringLiteral("command")).toString(), QStringLiteral("pending"));

    // Entries restored from disk participate in the next build.
    restored.add(unit(8, 7, 4.0f), meta(QStringLiteral("after load"), 300));
    auto rebuilt = restored.build();
    QCOMPARE(rebuilt.status, dd::VectorIndex::BuildResult::Status::Built);
    QCOMPARE(rebuilt.entries, 10);
}

void TestVectorIndex::testSaveBeforeBuildFails()
{
    QTemporaryDir dir;
    dd::VectorIndex index(4);
    index.add(unit(4, 0), meta(QStringLiteral("ls"), 1));
    QVERIFY(!index.save((dir.path() + "/i.hnsw").toStdString(),
                        (dir.path() + "/i.meta.json").toStdString()));
    QVERIFY(!QFile::exists(dir.path() + "/i.hnsw"));
}

void TestVectorIndex::testLoadMissingFileLeavesIndexUnbuilt()
{
    QTemporaryDir dir;
    dd::VectorIndex index(4);
    QVERIFY(index.load((dir.path() + "/missing.hnsw").toStdString(),
                       (dir.path() + "/missing.meta.json").toStdString()));
    QVERIFY(!index.isBuilt());
    QCOMPARE(index.query(unit(4, 0), 1).status, dd::VectorIndex::QueryResult::Status::NotBuilt);
}

void TestVectorIndex::testLoadRejectsDimensionMismatch()
{
    QTemporaryDir dir;
    const std::string indexPath = (dir.path() + "/commands.hnsw").toStdString();
    const std::string metaPath = (dir.path() + "/commands.hnsw.meta.json").toStdString();

    dd::VectorIndex small(4);
    small.add(unit(4, 0), meta(QStringLiteral("ls"), 1));
    small.build();
    QVERIFY(small.save(indexPath, metaPath));

    dd::VectorIndex large(8);
    QVERIFY(!large.load(indexPath, metaPath));
    QVERIFY(!large.isBuilt());
}

void TestVectorIndex::testQueriesDuringRebuildSeeCompleteSnapshot()
{
    constexpr int kDims = 16;
    dd::VectorIndex index(kDims);
    for (int i = 0; i < 50; ++i) {
        index.add(unit(kDims, i % kDims, 1.0f + i), meta(QStringLiteral("c%1").arg(i), i));
    }
    index.build();

    std::atomic<bool> running{true};
    std::atomic<int> badQueries{0};
    std::thread reader([&]() {
        while (running.load()) {
            auto result = index.query(unit(kDims, 0), 1000);
            // A snapshot holds 50 entries plus 25 per rebuild.
            const int population = 50 + 25 * static_cast<int>(result.generation - 1);
            if (result.status != dd::VectorIndex::QueryResult::Status::Ok
                || result.hits.empty()
                || static_cast<int>(result.hits.size()) > population) {
                ++badQueries;
            }
        }
    });

    for (int round = 0; round < 4; ++round) {
        for (int i = 0; i < 25; ++i) {
            index.add(unit(kDims, i % kDims, 100.0f + i), meta(QStringLiteral("r%1").arg(i), i));
        }
        QCOMPARE(index.build().status, dd::VectorIndex::BuildResult::Status::Built);
    }
    running = false;
    reader.join();

    QCOMPARE(badQueries.load(), 0);
    QCOMPARE(index.generation(), uint64_t(5));
}

QTEST_MAIN(TestVectorIndex)
#include "test_vector_index.moc"
