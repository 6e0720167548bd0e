#include <QtTest/QtTest>
#include <QDateTime>
#include <QTemporaryDir>
#include <sqlite3.h>
#include "core/history/command_store.h"

#include <atomic>
#include <thread>
#include <vector>

class TestCommandStore : public QObject {
    Q_OBJECT

private slots:
    void testOpenCreatesDatabaseInWalMode();
    void testLogReturnsIncreasingIds();
    void testLogRejectsEmptyCommand();
    void testLogStoresAllFields();
    void testNegativeDurationStoredAsZero();
    void testRecordsSurviveReopen();
    void testSearchPrefixMostRecentFirst();
    void testSearchPrefixIsCaseInsensitive();
    void testSearchPrefixEscapesWildcards();
    void testSearchPrefixFoldsNonAsciiCase();
    void testSearchPrefixSuccessfulOnly();
    void testSearchPrefixCwdFilterIncludesDescendants();
    void testSearchTextRanksMatchingCommand();
    void testSearchTextFallsBackToAnyToken();
    void testSearchTextIgnoresOperatorCharacters();
    void testRecentRespectsLimitAndCwd();
    void testPruneRemovesOldRecordsAndIdsAreNotReused();
    void testDistinctRecentCollapsesDuplicates();
    void testStatisticsAndTopLists();
    void testConcurrentReadsDuringWrites();
    void testBuildFtsQuery();
};

namespace {

double now()
{
    return static_cast<double>(QDateTime::currentSecsSinceEpoch());
}

QStringList commandsOf(const std::vector<dd::CommandRecord>& records)
{
    QStringList out;
    for (const auto& record : records) {
        out.append(record.command);
    }
    return out;
}

} // namespace

void TestCommandStore::testOpenCreatesDatabaseInWalMode()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString dbPath = dir.path() + "/nested/history.db";

    auto store = dd::CommandStore::open(dbPath);
    QVERIFY(store != nullptr);
    QVERIFY(QFile::exists(dbPath));
    QVERIFY(store->integrityCheck());

    sqlite3* raw = nullptr;
    QCOMPARE(sqlite3_open_v2(dbPath.toUtf8().constData(), &raw, SQLITE_OPEN_READONLY, nullptr),
             SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    sqlite3_prepare_v2(raw, "PRAGMA journal_mode", -1, &stmt, nullptr);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    const QString mode = QString::fromUtf8(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    sqlite3_finalize(stmt);
    sqlite3_close(raw);
    QCOMPARE(mode, QStringLiteral("wal"));
}

void TestCommandStore::testLogReturnsIncreasingIds()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    int64_t previous = 0;
    for (int i = 0; i < 20; ++i) {
        auto id = store->log(QStringLiteral("echo %1").arg(i), QStringLiteral("/tmp"), 0, 0.1);
        QVERIFY(id.has_value());
        QVERIFY(id.value() > previous);
        previous = id.value();
    }
}

void TestCommandStore::testLogRejectsEmptyCommand()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(!store->log(QString(), QStringLiteral("/tmp"), 0, 0.0).has_value());
    QVERIFY(!store->log(QStringLiteral("   "), QStringLiteral("/tmp"), 0, 0.0).has_value());

    auto records = store->recent(10);
    QVERIFY(records.has_value());
    QVERIFY(records->empty());
}

void TestCommandStore::testLogStoresAllFields()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    auto id = store->log(QStringLiteral("make -j8"), QStringLiteral("/home/u/src"), 2, 12.5,
                         QStringLiteral("session-1"), 1700000000.0);
    QVERIFY(id.has_value());

    auto record = store->getById(id.value());
    QVERIFY(record.has_value());
    QCOMPARE(record->command, QStringLiteral("make -j8"));
    QCOMPARE(record->workingDirectory, QStringLiteral("/home/u/src"));
    QCOMPARE(record->exitCode, 2);
    QCOMPARE(record->durationSeconds, 12.5);
    QCOMPARE(record->timestamp, 1700000000.0);
    QCOMPARE(record->sessionId, QStringLiteral("session-1"));

    QVERIFY(!store->getById(id.value() + 100).has_value());
}

void TestCommandStore::testNegativeDurationStoredAsZero()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    auto id = store->log(QStringLiteral("true"), QString(), 0, -3.0);
    QVERIFY(id.has_value());
    QCOMPARE(store->getById(id.value())->durationSeconds, 0.0);
}

void TestCommandStore::testRecordsSurviveReopen()
{
    QTemporaryDir dir;
    const QString dbPath = dir.path() + "/history.db";
    int64_t id = 0;
    {
        auto store = dd::CommandStore::open(dbPath);
        QVERIFY(store != nullptr);
        id = store->log(QStringLiteral("cargo build"), QStringLiteral("/w"), 0, 1.0).value_or(0);
        QVERIFY(id > 0);
    }

    auto reopened = dd::CommandStore::open(dbPath);
    QVERIFY(reopened != nullptr);
    auto record = reopened->getById(id);
    QVERIFY(record.has_value());
    QCOMPARE(record->command, QStringLiteral("cargo build"));
}

void TestCommandStore::testSearchPrefixMostRecentFirst()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    const double t = now();
    QVERIFY(store->log(QStringLiteral("git status"), QString(), 0, 0, {}, t - 30).has_value());
    QVERIFY(store->log(QStringLiteral("git stash"), QString(), 0, 0, {}, t - 20).has_value());
    QVERIFY(store->log(QStringLiteral("ls -la"), QString(), 0, 0, {}, t - 10).has_value());
    QVERIFY(store->log(QStringLiteral("git status"), QString(), 0, 0, {}, t).has_value());

    auto records = store->searchPrefix(QStringLiteral("git st"), QString(), 10);
    QVERIFY(records.has_value());
    QCOMPARE(commandsOf(records.value()),
             (QStringList{QStringLiteral("git status"), QStringLiteral("git stash"),
                          QStringLiteral("git status")}));

    auto limited = store->searchPrefix(QStringLiteral("git"), QString(), 1);
    QVERIFY(limited.has_value());
    QCOMPARE(limited->size(), size_t(1));
}

void TestCommandStore::testSearchPrefixIsCaseInsensitive()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(store->log(QStringLiteral("Docker ps"), QString(), 0, 0).has_value());
    auto records = store->searchPrefix(QStringLiteral("docker P"), QString(), 10);
    QVERIFY(records.has_value());
    QCOMPARE(commandsOf(records.value()), QStringList{QStringLiteral("Docker ps")});
}

void TestCommandStore::testSearchPrefixFoldsNonAsciiCase()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(store->log(QStringLiteral("Übersetzen --all"), QString(), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("ÉCRIRE notes"), QString(), 0, 0).has_value());

    auto lower = store->searchPrefix(QStringLiteral("übers"), QString(), 10);
    QVERIFY(lower.has_value());
    QCOMPARE(commandsOf(lower.value()), QStringList{QStringLiteral("Übersetzen --all")});

    auto mixed = store->searchPrefix(QStringLiteral("éCri"), QString(), 10);
    QVERIFY(mixed.has_value());
    QCOMPARE(commandsOf(mixed.value()), QStringList{QStringLiteral("ÉCRIRE notes")});
}

void TestCommandStore::testSearchPrefixSuccessfulOnly()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    const double t = now();
    QVERIFY(store->log(QStringLiteral("gti status"), QString(), 127, 0, {}, t - 10).has_value());
    QVERIFY(store->log(QStringLiteral("git status"), QString(), 0, 0, {}, t - 5).has_value());
    QVERIFY(store->log(QStringLiteral("git stash pop"), QString(), 1, 0, {}, t).has_value());

    auto all = store->searchPrefix(QStringLiteral("g"), QString(), 10);
    QVERIFY(all.has_value());
    QCOMPARE(all->size(), size_t(3));

    auto successful = store->searchPrefix(QStringLiteral("g"), QString(), 10, true);
    QVERIFY(successful.has_value());
    QCOMPARE(commandsOf(successful.value()), QStringList{QStringLiteral("git status")});
}

void TestCommandStore::testSearchPrefixEscapesWildcards()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(store->log(QStringLiteral("echo 100%done"), QString(), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("echo 100xdone"), QString(), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("echo a_b"), QString(), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("echo axb"), QString(), 0, 0).has_value());

    auto percent = store->searchPrefix(QStringLiteral("echo 100%"), QString(), 10);
    QVERIFY(percent.has_value());
    QCOMPARE(commandsOf(percent.value()), QStringList{QStringLiteral("echo 100%done")});

    auto underscore = store->searchPrefix(QStringLiteral("echo a_"), QString(), 10);
    QVERIFY(underscore.has_value());
    QCOMPARE(commandsOf(underscore.value()), QStringList{QStringLiteral("echo a_b")});

    QCOMPARE(dd::CommandStore::escapeLikePattern(QStringLiteral("a%b_c\\d")),
             QStringLiteral("a\\%b\\_c\\\\d"));
}

void TestCommandStore::testSearchPrefixCwdFilterIncludesDescendants()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(store->log(QStringLiteral("make a"), QStringLiteral("/home/u/proj"), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("make b"), QStringLiteral("/home/u/proj/sub"), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("make c"), QStringLiteral("/home/u/project2"), 0, 0).has_value());

    auto filtered = store->searchPrefix(QStringLiteral("make"), QStringLiteral("/home/u/proj/"), 10);
    QVERIFY(filtered.has_value());
    QStringList commands = commandsOf(filtered.value());
    commands.sort();
    QCOMPARE(commands, (QStringList{QStringLiteral("make a"), QStringLiteral("make b")}));

    auto root = store->searchPrefix(QStringLiteral("make"), QStringLiteral("/"), 10);
    QVERIFY(root.has_value());
    QCOMPARE(root->size(), size_t(3));
}

void TestCommandStore::testSearchTextRanksMatchingCommand()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(store->log(QStringLiteral("git commit -m fix"), QString(), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("git push origin main"), QString(), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("docker build ."), QString(), 0, 0).has_value());

    auto records = store->searchText(QStringLiteral("git push"), 10);
    QVERIFY(records.has_value());
    QCOMPARE(commandsOf(records.value()), QStringList{QStringLiteral("git push origin main")});

    auto prefix = store->searchText(QStringLiteral("dock"), 10);
    QVERIFY(prefix.has_value());
    QCOMPARE(commandsOf(prefix.value()), QStringList{QStringLiteral("docker build .")});
}

void TestCommandStore::testSearchTextFallsBackToAnyToken()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(store->log(QStringLiteral("git commit"), QString(), 0, 0).has_value());
    QVERIFY(store->log(QStringLiteral("kubectl get pods"), QString(), 0, 0).has_value());

    auto records = store->searchText(QStringLiteral("git zzzunmatched"), 10);
    QVERIFY(records.has_value());
    QCOMPARE(commandsOf(records.value()), QStringList{QStringLiteral("git commit")});
}

void TestCommandStore::testSearchTextIgnoresOperatorCharacters()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);
    QVERIFY(store->log(QStringLiteral("grep -R \"TODO\" src"), QString(), 0, 0).has_value());

    auto records = store->searchText(QStringLiteral("\"todo* AND (src"), 10);
    QVERIFY(records.has_value());
    QCOMPARE(records->size(), size_t(1));

    auto empty = store->searchText(QStringLiteral("*** ()"), 10);
    QVERIFY(empty.has_value());
    QVERIFY(empty->empty());
}

void TestCommandStore::testRecentRespectsLimitAndCwd()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    const double t = now();
    for (int i = 0; i < 5; ++i) {
        QVERIFY(store->log(QStringLiteral("cmd %1").arg(i), QStringLiteral("/a"), 0, 0, {}, t + i)
                    .has_value());
    }
    QVERIFY(store->log(QStringLiteral("other"), QStringLiteral("/b"), 0, 0, {}, t + 10).has_value());

    auto latest = store->recent(3);
    QVERIFY(latest.has_value());
    QCOMPARE(commandsOf(latest.value()),
             (QStringList{QStringLiteral("other"), QStringLiteral("cmd 4"), QStringLiteral("cmd 3")}));

    auto inA = store->recent(10, QStringLiteral("/a"));
    QVERIFY(inA.has_value());
    QCOMPARE(inA->size(), size_t(5));
    QCOMPARE(inA->front().command, QStringLiteral("cmd 4"));
}

void TestCommandStore::testPruneRemovesOldRecordsAndIdsAreNotReused()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    const double t = now();
    QVERIFY(store->log(QStringLiteral("old one"), QString(), 0, 0, {}, t - 200 * 86400).has_value());
    auto lastOld = store->log(QStringLiteral("old two"), QString(), 0, 0, {}, t - 100 * 86400);
    QVERIFY(lastOld.has_value());
    QVERIFY(store->log(QStringLiteral("fresh"), QString(), 0, 0, {}, t).has_value());

    auto removed = store->prune(t - 90 * 86400);
    QVERIFY(removed.has_value());
    QCOMPARE(removed.value(), 2);

    auto remaining = store->recent(10);
    QVERIFY(remaining.has_value());
    QCOMPARE(commandsOf(remaining.value()), QStringList{QStringLiteral("fresh")});

    // Pruned rows are gone from the text index as well.
    auto hits = store->searchText(QStringLiteral("old"), 10);
    QVERIFY(hits.has_value());
    QVERIFY(hits->empty());

    auto next = store->log(QStringLiteral("newer"), QString(), 0, 0);
    QVERIFY(next.has_value());
    QVERIFY(next.value() > remaining->front().id);
    QVERIFY(next.value() > lastOld.value());

    QCOMPARE(store->prune(t - 90 * 86400).value_or(-1), 0);
}

void TestCommandStore::testDistinctRecentCollapsesDuplicates()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    const double t = now();
    QVERIFY(store->log(QStringLiteral("npm test"), QString(), 0, 0, {}, t - 5).has_value());
    QVERIFY(store->log(QStringLiteral("npm run lint"), QString(), 1, 0, {}, t - 4).has_value());
    QVERIFY(store->log(QStringLiteral("npm test"), QString(), 0, 0, {}, t - 3).has_value());

    auto all = store->distinctRecent(10);
    QVERIFY(all.has_value());
    QCOMPARE(all->size(), size_t(2));
    QCOMPARE(all->at(0).command, QStringLiteral("npm test"));
    QCOMPARE(all->at(0).useCount, 2);

    auto successful = store->distinctRecent(10, true);
    QVERIFY(successful.has_value());
    QCOMPARE(successful->size(), size_t(1));
    QCOMPARE(successful->at(0).command, QStringLiteral("npm test"));
}

void TestCommandStore::testStatisticsAndTopLists()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    QVERIFY(store->log(QStringLiteral("ls"), QStringLiteral("/a"), 0, 0, QStringLiteral("s1")).has_value());
    QVERIFY(store->log(QStringLiteral("ls"), QStringLiteral("/a"), 0, 0, QStringLiteral("s1")).has_value());
    QVERIFY(store->log(QStringLiteral("ls"), QStringLiteral("/b"), 0, 0, QStringLiteral("s2")).has_value());
    QVERIFY(store->log(QStringLiteral("false"), QStringLiteral("/a"), 1, 0, QStringLiteral("s2")).has_value());

    auto stats = store->statistics();
    QVERIFY(stats.has_value());
    QCOMPARE(stats->totalCommands, int64_t(4));
    QCOMPARE(stats->successfulCommands, int64_t(3));
    QCOMPARE(stats->successRate, 0.75);
    QCOMPARE(stats->uniqueCommands, int64_t(2));
    QCOMPARE(stats->sessions, int64_t(2));
    QVERIFY(stats->databaseBytes > 0);

    auto top = store->topCommands(5);
    QVERIFY(top.has_value());
    QCOMPARE(top->front().command, QStringLiteral("ls"));
    QCOMPARE(top->front().useCount, 3);

    auto dirs = store->topDirectories(5);
    QVERIFY(dirs.has_value());
    QCOMPARE(dirs->size(), size_t(2));
    QCOMPARE(dirs->front().cwd, QStringLiteral("/a"));
    QCOMPARE(dirs->front().useCount, 3);
}

void TestCommandStore::testConcurrentReadsDuringWrites()
{
    QTemporaryDir dir;
    auto store = dd::CommandStore::open(dir.path() + "/history.db");
    QVERIFY(store != nullptr);

    constexpr int kWrites = 200;
    std::atomic<bool> writing{true};
    std::atomic<int> readFailures{0};
    std::atomic<int> writeFailures{0};

    std::thread writer([&]() {
        for (int i = 0; i < kWrites; ++i) {
            if (!store->log(QStringLiteral("build step %1").arg(i), QStringLiteral("/w"), 0, 0.01)) {
                ++writeFailures;
            }
        }
        writing = false;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            while (writing.load()) {
                if (!store->searchPrefix(QStringLiteral("build"), QString(), 20)
                    || !store->recent(20)) {
                    ++readFailures;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    QCOMPARE(writeFailures.load(), 0);
    QCOMPARE(readFailures.load(), 0);
    QCOMPARE(store->statistics()->totalCommands, int64_t(kWrites));
}

void TestCommandStore::testBuildFtsQuery()
{
    QCOMPARE(dd::CommandStore::buildFtsQuery(QStringLiteral("Git  ST"), false),
             QStringLiteral("\"git\"* \"st\"*"));
    QCOMPARE(dd::CommandStore::buildFtsQuery(QStringLiteral("git st git"), true),
             QStringLiteral("\"git\"* OR \"st\"*"));
    QVERIFY(dd::CommandStore::buildFtsQuery(QStringLiteral("  -- ** "), false).isEmpty());
}

QTEST_MAIN(TestCommandStore)
#include "test_command_store.moc"
