#include <QtTest/QtTest>
#include "core/embedding/hashing_embedder.h"

#include <cmath>

class TestHashingEmbedder : public QObject {
    Q_OBJECT

private slots:
    void testFnv1aKnownValues();
    void testOutputHasConfiguredDimensions();
    void testOutputIsUnitLength();
    void testEmptyTextFails();
    void testDeterministicAcrossInstances();
    void testCaseAndSpacingInsensitive();
    void testSimilarCommandsAreCloser();
};

namespace {

double distance(const std::vector<float>& a, const std::vector<float>& b)
{
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

} // namespace

void TestHashingEmbedder::testFnv1aKnownValues()
{
    QCOMPARE(dd::HashingEmbedder::fnv1a(QByteArray()), 2166136261u);
    QCOMPARE(dd::HashingEmbedder::fnv1a(QByteArrayLiteral("a")), 0xe40c292cu);
}

void TestHashingEmbedder::testOutputHasConfiguredDimensions()
{
    dd::HashingEmbedder embedder(64);
    QCOMPARE(embedder.dimensions(), 64);
    QCOMPARE(embedder.encode(QStringLiteral("git status")).size(), size_t(64));
}

void TestHashingEmbedder::testOutputIsUnitLength()
{
    dd::HashingEmbedder embedder(128);
    const auto vector = embedder.encode(QStringLiteral("docker compose up -d --build"));
    double norm = 0.0;
    for (const float value : vector) {
        norm += static_cast<double>(value) * static_cast<double>(value);
    }
    QVERIFY(std::fabs(std::sqrt(norm) - 1.0) < 1e-5);
}

void TestHashingEmbedder::testEmptyTextFails()
{
    dd::HashingEmbedder embedder(32);
    QVERIFY(embedder.encode(QString()).empty());
    QVERIFY(embedder.encode(QStringLiteral(" \t ")).empty());
}

void TestHashingEmbedder::testDeterministicAcrossInstances()
{
    dd::HashingEmbedder first(96);
    dd::HashingEmbedder second(96);
    QCOMPARE(first.encode(QStringLiteral("make -j8 test")),
             second.encode(QStringLiteral("make -j8 test")));
}

void TestHashingEmbedder::testCaseAndSpacingInsensitive()
{
    dd::HashingEmbedder embedder(96);
    QCOMPARE(embedder.encode(QStringLiteral("  GIT   Status ")),
             embedder.encode(QStringLiteral("git status")));
}

void TestHashingEmbedder::testSimilarCommandsAreCloser()
{
    dd::HashingEmbedder embedder(256);
    const auto query = embedder.encode(QStringLiteral("git stat"));
    const auto near = embedder.encode(QStringLiteral("git status"));
    const auto far = embedder.encode(QStringLiteral("npm install lodash"));
    QVERIFY(distance(query, near) < distance(query, far));
}

QTEST_MAIN(TestHashingEmbedder)
#include "test_hashing_embedder.moc"
