#include <QtTest/QtTest>
#include "core/cache/cache_keys.h"
#include "core/cache/cache_service.h"
#include "core/cache/memory_cache_backend.h"
#include "core/retrieval/centroid_tracker.h"
#include "core/vector/sqlite_vector_index.h"
#include "instrumented_index.h"

#include <QJsonArray>
#include <QTemporaryDir>

#include <cmath>
#include <thread>

namespace {

dr::Chunk pointChunk(int n)
{
    dr::Chunk chunk;
    chunk.text = QStringLiteral("point %1").arg(n);
    chunk.metadata.source = QStringLiteral("points.txt");
    chunk.metadata.contentHash = chunk.text;
    chunk.metadata.qualityScore = 0.5;
    return chunk;
}

bool near(float a, double b)
{
    return std::fabs(static_cast<double>(a) - b) < 1e-5;
}

} // namespace

class TestCentroidTracker : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Computation ──────────────────────────────────────────────
    void testEmptyIndexHasNoCentroid();
    void testCentroidIsNormalizedMeanOfUnitVectors();
    void testScanPagesThroughIndex();

    // ── Reuse and invalidation ───────────────────────────────────
    void testSnapshotReusedWithinInterval();
    void testInvalidateForcesRecompute();
    void testCountChangeTriggersRecompute();
    void testUnchangedCountKeepsSnapshot();
    void testEmptiedIndexDropsSnapshot();

    // ── Concurrency ──────────────────────────────────────────────
    void testConcurrentCallersShareOneRecompute();
    void testInvalidateDuringScanDiscardsResult();

    // ── Cache mirror ─────────────────────────────────────────────
    void testLoadsFromCache();
    void testIgnoresCachedCentroidWithWrongDimensions();

private:
    void addPoint(const std::vector<float>& vector);
    dr::CentroidConfig config(std::chrono::milliseconds interval = std::chrono::milliseconds(60000)) const;

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<dr::SqliteVectorIndex> m_store;
    std::unique_ptr<dr::test::InstrumentedIndex> m_index;
    std::unique_ptr<dr::CacheService> m_cache;
    int m_points = 0;
};

void TestCentroidTracker::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    dr::SqliteVectorIndexConfig indexConfig;
    indexConfig.dimensions = 2;
    m_store = dr::SqliteVectorIndex::open(m_dir->filePath(QStringLiteral("index.db")), indexConfig);
    QVERIFY(m_store != nullptr);
    m_index = std::make_unique<dr::test::InstrumentedIndex>(*m_store);
    m_cache = std::make_unique<dr::CacheService>(std::make_unique<dr::MemoryCacheBackend>());
    m_points = 0;
}

void TestCentroidTracker::cleanup()
{
    m_cache.reset();
    m_index.reset();
    m_store.reset();
    m_dir.reset();
}

void TestCentroidTracker::addPoint(const std::vector<float>& vector)
{
    QVERIFY(m_store->add({pointChunk(m_points++)}, {vector}));
}

dr::CentroidConfig TestCentroidTracker::config(std::chrono::milliseconds interval) const
{
    dr::CentroidConfig result;
    result.dimensions = 2;
    result.pageSize = 2;
    result.countCheckInterval = interval;
    return result;
}

// ── Computation ──────────────────────────────────────────────────

void TestCentroidTracker::testEmptyIndexHasNoCentroid()
{
    dr::CentroidTracker tracker(*m_index, m_cache.get(), config());
    QVERIFY(tracker.current() == nullptr);
    QVERIFY(tracker.snapshot() == nullptr);
    QVERIFY(!m_cache->get(QString::fromLatin1(dr::cache_keys::kCentroid)).ok());
}

void TestCentroidTracker::testCentroidIsNormalizedMeanOfUnitVectors()
{
    // Magnitudes differ; each vector is normalized before averaging.
    addPoint({10.0f, 0.0f});
    addPoint({0.0f, 0.5f});

    dr::CentroidTracker tracker(*m_index, m_cache.get(), config());
    const dr::CentroidTracker::Snapshot centroid = tracker.current();
    QVERIFY(centroid != nullptr);
    QCOMPARE(static_cast<int>(centroid->size()), 2);
    QVERIFY(near((*centroid)[0], std::sqrt(0.5)));
    QVERIFY(near((*centroid)[1], std::sqrt(0.5)));
    QCOMPARE(tracker.computeCount(), uint64_t(1));
}

void TestCentroidTracker::testScanPagesThroughIndex()
{
    for (int i = 0; i < 5; ++i) {
        addPoint({1.0f, static_cast<float>(i)});
    }
    dr::CentroidTracker tracker(*m_index, nullptr, config());
    QVERIFY(tracker.current() != nullptr);
    // pageSize 2 over 5 points: 2 + 2 + 1
    QCOMPARE(m_index->scrollCalls(), 3);
}

// ── Reuse and invalidation ───────────────────────────────────────

void TestCentroidTracker::testSnapshotReusedWithinInterval()
{
    addPoint({1.0f, 0.0f});
    dr::CentroidTracker tracker(*m_index, m_cache.get(), config());
    const auto first = tracker.current();
    addPoint({0.0f, 1.0f});
    const auto second = tracker.current();
    QVERIFY(first == second);
    QCOMPARE(tracker.computeCount(), uint64_t(1));
}

void TestCentroidTracker::testInvalidateForcesRecompute()
{
    addPoint({1.0f, 0.0f});
    dr::CentroidTracker tracker(*m_index, m_cache.get(), config());
    QVERIFY(tracker.current() != nullptr);
    const uint64_t generation = tracker.generation();

    addPoint({0.0f, 1.0f});
    tracker.invalidate();
    QCOMPARE(tracker.generation(), generation + 1);
    QVERIFY(tracker.snapshot() == nullptr);
    QVERIFY(!m_cache->get(QString::fromLatin1(dr::cache_keys::kCentroid)).ok());

    const auto centroid = tracker.current();
    QVERIFY(centroid != nullptr);
    QCOMPARE(tracker.computeCount(), uint64_t(2));
    QVERIFY(near((*centroid)[1], std::sqrt(0.5)));
}

void TestCentroidTracker::testCountChangeTriggersRecompute()
{
    addPoint({1.0f, 0.0f});
    dr::CentroidTracker tracker(*m_index, m_cache.get(), config(std::chrono::milliseconds(0)));
    const auto first = tracker.current();
    QVERIFY(near((*first)[0], 1.0));

    addPoint({0.0f, 1.0f});
    const auto second = tracker.current();
    QVERIFY(second != first);
    QCOMPARE(tracker.computeCount(), uint64_t(2));
    QVERIFY(near((*second)[0], std::sqrt(0.5)));
}

void TestCentroidTracker::testUnchangedCountKeepsSnapshot()
{
    addPoint({1.0f, 0.0f});
    dr::CentroidTracker tracker(*m_index, m_cache.get(), config(std::chrono::milliseconds(0)));
    const auto first = tracker.current();
    const auto second = tracker.current();
    QVERIFY(first == second);
    QCOMPARE(tracker.computeCount(), uint64_t(1));
}

void TestCentroidTracker::testEmptiedIndexDropsSnapshot()
{
    addPoint({1.0f, 0.0f});
    dr::CentroidTracker tracker(*m_index, m_cache.get(), config(std::chrono::milliseconds(0)));
    QVERIFY(tracker.current() != nullptr);
    QVERIFY(m_cache->get(QString::fromLatin1(dr::cache_keys::kCentroid)).ok());

    // Removed behind the tracker's back, as another process would.
    QCOMPARE(m_index->remove(QJsonObject{{QStringLiteral("source"), QStringLiteral("points.txt")}}),
             1);

    QVERIFY(tracker.current() == nullptr);
    QVERIFY(tracker.snapshot() == nullptr);
    QVERIFY(!m_cache->get(QString::fromLatin1(dr::cache_keys::kCentroid)).ok());
    QVERIFY(tracker.current() == nullptr);
}

// ── Concurrency ──────────────────────────────────────────────────

void TestCentroidTracker::testConcurrentCallersShareOneRecompute()
{
    for (int i = 0; i < 4; ++i) {
        addPoint({1.0f, static_cast<float>(i)});
    }
    m_index->setScrollHook([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    });

    dr::CentroidTracker tracker(*m_index, nullptr, config());
    constexpr int kCallers = 8;
    std::vector<dr::CentroidTracker::Snapshot> results(kCallers);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&tracker, &results, i]() { results[i] = tracker.current(); });
    }
    for (std::thread& caller : callers) {
        caller.join();
    }

    QCOMPARE(tracker.computeCount(), uint64_t(1));
    QVERIFY(results[0] != nullptr);
    for (const auto& result : results) {
        QVERIFY(result == results[0]);
    }
    QVERIFY(tracker.snapshot() == results[0]);
}

void TestCentroidTracker::testInvalidateDuringScanDiscardsResult()
{
    addPoint({1.0f, 0.0f});
    addPoint({0.0f, 1.0f});

    dr::CentroidTracker tracker(*m_index, m_cache.get(), config());
    bool invalidated = false;
    m_index->setScrollHook([&tracker, &invalidated]() {
        if (!invalidated) {
            invalidated = true;
            tracker.invalidate();
        }
    });

    const uint64_t generation = tracker.generation();
    tracker.current();
    QVERIFY(invalidated);
    QCOMPARE(tracker.generation(), generation + 1);
    QCOMPARE(tracker.computeCount(), uint64_t(1));
    QVERIFY(tracker.snapshot() == nullptr);
    QVERIFY(!m_cache->get(QString::fromLatin1(dr::cache_keys::kCentroid)).ok());

    // The next caller computes and publishes normally.
    QVERIFY(tracker.current() != nullptr);
    QVERIFY(tracker.snapshot() != nullptr);
}

// ── Cache mirror ─────────────────────────────────────────────────

void TestCentroidTracker::testLoadsFromCache()
{
    addPoint({1.0f, 0.0f});
    {
        dr::CentroidTracker writer(*m_index, m_cache.get(), config());
        QVERIFY(writer.current() != nullptr);
    }
    QVERIFY(m_cache->get(QString::fromLatin1(dr::cache_keys::kCentroid)).ok());

    dr::CentroidTracker reader(*m_index, m_cache.get(), config());
    const auto centroid = reader.current();
    QVERIFY(centroid != nullptr);
    QCOMPARE(reader.computeCount(), uint64_t(0));
    QVERIFY(near((*centroid)[0], 1.0));
}

void TestCentroidTracker::testIgnoresCachedCentroidWithWrongDimensions()
{
    addPoint({0.0f, 1.0f});
    m_cache->set(QString::fromLatin1(dr::cache_keys::kCentroid), QJsonArray{1.0, 0.0, 0.0});

    dr::CentroidTracker tracker(*m_index, m_cache.get(), config());
    const auto centroid = tracker.current();
    QVERIFY(centroid != nullptr);
    QCOMPARE(tracker.computeCount(), uint64_t(1));
    QVERIFY(near((*centroid)[1], 1.0));
}

QTEST_MAIN(TestCentroidTracker)
#include "test_centroid_tracker.moc"
