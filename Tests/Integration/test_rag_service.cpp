#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QStandardPaths>

#include "core/retrieval/retrieval_engine.h"
#include "core/shared/settings_manager.h"
#include "services/ragctl/rag_service.h"

namespace {

const QString kManual = QStringLiteral(
    "The router ships with a default configuration that works for most homes. Connect the "
    "power cable and wait until the status light turns solid green before continuing.\n\n"
    "Firmware updates are installed automatically every night. You can disable automatic "
    "updates in the advanced settings page if your network requires manual approval.");

} // namespace

class TestRagService : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // ── Settings ─────────────────────────────────────────────────
    void testResolveSettingsFillsPaths();
    void testResolveSettingsReadsConfigFile();

    // ── Commands ─────────────────────────────────────────────────
    void testIngestAndStatus();
    void testIngestTwiceSkips();
    void testIngestMissingFileReportsError();
    void testIngestDirectoryRejectsFile();
    void testQueryInMockModeFindsNothing();
    void testQueryDefaultsToConfiguredK();
    void testGateInMockMode();
    void testDeleteAndClear();
    void testErrorResponse();

    // ── Filters ──────────────────────────────────────────────────
    void testParseFilterTypesBySchemaField();
    void testParseFilterRejectsBadEntries();

private:
    QString writeDocument(const QString& name, const QString& text);

    QTemporaryDir m_dir;
    std::unique_ptr<dr::RagService> m_service;
    int m_run = 0;
};

void TestRagService::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void TestRagService::init()
{
    QVERIFY(m_dir.isValid());
    dr::Settings settings;
    const QString dataDir = QStringLiteral("data%1/").arg(++m_run);
    settings.indexPath = m_dir.filePath(dataDir + QStringLiteral("index.db"));
    settings.cachePath = m_dir.filePath(dataDir + QStringLiteral("cache.db"));
    settings.embeddingDimension = 16;
    settings.embeddingMockMode = true;
    settings.qualityFloor = 0.0;
    settings.retrievalK = 7;

    m_service = std::make_unique<dr::RagService>(settings);
    QString error;
    QVERIFY2(m_service->initialize(&error), qPrintable(error));
}

void TestRagService::cleanup()
{
    m_service.reset();
}

QString TestRagService::writeDocument(const QString& name, const QString& text)
{
    const QString path = m_dir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {};
    }
    file.write(text.toUtf8());
    return path;
}

// ── Settings ─────────────────────────────────────────────────────

void TestRagService::testResolveSettingsFillsPaths()
{
    const dr::Settings settings = dr::RagService::resolveSettings(
        m_dir.filePath(QStringLiteral("missing.json")), true);
    QVERIFY(settings.embeddingMockMode);
    QVERIFY(settings.indexPath.startsWith(dr::SettingsManager::dataDirectory()));
    QVERIFY(settings.indexPath.endsWith(QStringLiteral("index.db")));
    QVERIFY(settings.cachePath.endsWith(QStringLiteral("cache.db")));
}

void TestRagService::testResolveSettingsReadsConfigFile()
{
    const QString configPath = m_dir.filePath(QStringLiteral("config/settings.json"));
    dr::Settings expected;
    expected.chunkSize = 400;
    expected.indexPath = QStringLiteral("/tmp/custom-index.db");
    QVERIFY(dr::SettingsManager::save(expected, configPath));

    const dr::Settings settings = dr::RagService::resolveSettings(configPath, false);
    QCOMPARE(settings.chunkSize, 400);
    QCOMPARE(settings.indexPath, QStringLiteral("/tmp/custom-index.db"));
    QVERIFY(settings.cachePath.endsWith(QStringLiteral("cache.db")));
}

// ── Commands ─────────────────────────────────────────────────────

void TestRagService::testIngestAndStatus()
{
    const QString path = writeDocument(QStringLiteral("manual.txt"), kManual);
    const QJsonObject response = m_service->ingest({path}, false);
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    QCOMPARE(response.value(QStringLiteral("failed")).toInt(), 0);

    const QJsonArray documents = response.value(QStringLiteral("documents")).toArray();
    QCOMPARE(documents.size(), 1);
    const QJsonObject report = documents.at(0).toObject();
    QCOMPARE(report.value(QStringLiteral("filename")).toString(), QStringLiteral("manual.txt"));
    QCOMPARE(report.value(QStringLiteral("status")).toString(), QStringLiteral("success"));
    QVERIFY(report.value(QStringLiteral("chunks_added")).toInt() >= 1);

    const QJsonObject status = m_service->status();
    QCOMPARE(status.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    const QJsonObject index = status.value(QStringLiteral("index")).toObject();
    QCOMPARE(index.value(QStringLiteral("points")).toInt(),
             report.value(QStringLiteral("chunks_added")).toInt());
    QCOMPARE(index.value(QStringLiteral("dimensions")).toInt(), 16);

    const QJsonObject embedding = status.value(QStringLiteral("embedding")).toObject();
    QVERIFY(embedding.value(QStringLiteral("mock")).toBool());
    QVERIFY(!embedding.value(QStringLiteral("available")).toBool());
    QCOMPARE(embedding.value(QStringLiteral("model")).toString(), QStringLiteral("mock"));

    const QJsonObject cache = status.value(QStringLiteral("cache")).toObject();
    QCOMPARE(cache.value(QStringLiteral("backend")).toString(), QStringLiteral("sqlite"));
    QVERIFY(cache.value(QStringLiteral("available")).toBool());
    QVERIFY(status.value(QStringLiteral("settings")).isObject());

    // Mock embeddings are zero vectors, so there is nothing to average.
    const QJsonObject retrieval = status.value(QStringLiteral("retrieval")).toObject();
    QVERIFY(retrieval.contains(QStringLiteral("centroid_ready")));
    QVERIFY(!retrieval.value(QStringLiteral("centroid_ready")).toBool());
    QCOMPARE(retrieval.value(QStringLiteral("gating_threshold")).toDouble(), 0.20);
}

void TestRagService::testIngestTwiceSkips()
{
    const QString path = writeDocument(QStringLiteral("manual.txt"), kManual);
    QCOMPARE(m_service->ingest({path}, false).value(QStringLiteral("status")).toString(),
             QStringLiteral("ok"));

    const QJsonObject again = m_service->ingest({path}, false);
    QCOMPARE(again.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    const QJsonObject report =
        again.value(QStringLiteral("documents")).toArray().at(0).toObject();
    QCOMPARE(report.value(QStringLiteral("status")).toString(), QStringLiteral("skipped"));
}

void TestRagService::testIngestMissingFileReportsError()
{
    const QString good = writeDocument(QStringLiteral("manual.txt"), kManual);
    const QJsonObject response =
        m_service->ingest({good, m_dir.filePath(QStringLiteral("absent.txt"))}, false);
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("error"));
    QCOMPARE(response.value(QStringLiteral("failed")).toInt(), 1);

    const QJsonArray documents = response.value(QStringLiteral("documents")).toArray();
    QCOMPARE(documents.size(), 2);
    QCOMPARE(documents.at(0).toObject().value(QStringLiteral("status")).toString(),
             QStringLiteral("success"));
    QCOMPARE(documents.at(1).toObject().value(QStringLiteral("status")).toString(),
             QStringLiteral("error"));
}

void TestRagService::testIngestDirectoryRejectsFile()
{
    const QString path = writeDocument(QStringLiteral("manual.txt"), kManual);
    const QJsonObject response = m_service->ingestDirectory(path, false);
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("error"));
    QVERIFY(response.value(QStringLiteral("error")).toString().contains(path));
}

void TestRagService::testQueryInMockModeFindsNothing()
{
    const QString path = writeDocument(QStringLiteral("manual.txt"), kManual);
    m_service->ingest({path}, false);

    const QJsonObject response = m_service->query(
        QStringLiteral("when do firmware updates install"), 4, {}, false);
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    QVERIFY(response.value(QStringLiteral("results")).toArray().isEmpty());
    QCOMPARE(response.value(QStringLiteral("context")).toString(),
             dr::RetrievalEngine::noResultsMessage());

    const QJsonObject traced = m_service->query(
        QStringLiteral("when do firmware updates install"), 4, {}, true);
    QCOMPARE(traced.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
}

void TestRagService::testQueryDefaultsToConfiguredK()
{
    QCOMPARE(m_service->settings().retrievalK, 7);
    const QString question = QStringLiteral("when do firmware updates install");

    const QJsonObject byDefault = m_service->query(question, std::nullopt, {}, false);
    QCOMPARE(byDefault.value(QStringLiteral("k")).toInt(), 7);
    const QJsonObject traced = m_service->query(question, std::nullopt, {}, true);
    QCOMPARE(traced.value(QStringLiteral("k")).toInt(), 7);

    const QJsonObject explicitK = m_service->query(question, 2, {}, false);
    QCOMPARE(explicitK.value(QStringLiteral("k")).toInt(), 2);
}

void TestRagService::testGateInMockMode()
{
    const QString path = writeDocument(QStringLiteral("manual.txt"), kManual);
    m_service->ingest({path}, false);

    const QJsonObject response = m_service->gate(QStringLiteral("how do I update firmware"));
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    QCOMPARE(response.value(QStringLiteral("query")).toString(),
             QStringLiteral("how do I update firmware"));
    QVERIFY(!response.value(QStringLiteral("use_rag")).toBool());
}

void TestRagService::testDeleteAndClear()
{
    const QString manual = writeDocument(QStringLiteral("manual.txt"), kManual);
    const QString notes = writeDocument(
        QStringLiteral("notes.md"),
        QStringLiteral("Shipping labels are printed at the front desk every morning. Packages "
                       "leave the warehouse before noon and arrive within two business days."));
    const QJsonObject ingested = m_service->ingest({manual, notes}, false);
    QCOMPARE(ingested.value(QStringLiteral("failed")).toInt(), 0);

    const int before = m_service->status().value(QStringLiteral("index")).toObject()
                           .value(QStringLiteral("points")).toInt();
    const QJsonObject deleted = m_service->deleteDocument(QStringLiteral("manual.txt"));
    QCOMPARE(deleted.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    QCOMPARE(deleted.value(QStringLiteral("filename")).toString(), QStringLiteral("manual.txt"));
    const int removed = deleted.value(QStringLiteral("removed")).toInt();
    QVERIFY(removed >= 1);

    const int after = m_service->status().value(QStringLiteral("index")).toObject()
                          .value(QStringLiteral("points")).toInt();
    QCOMPARE(after, before - removed);
    QVERIFY(after >= 1);

    QCOMPARE(m_service->clear().value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    QCOMPARE(m_service->status().value(QStringLiteral("index")).toObject()
                 .value(QStringLiteral("points")).toInt(), 0);
}

void TestRagService::testErrorResponse()
{
    const QJsonObject response = dr::RagService::errorResponse(QStringLiteral("boom"));
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("error"));
    QCOMPARE(response.value(QStringLiteral("error")).toString(), QStringLiteral("boom"));
    QCOMPARE(response.size(), 2);
}

// ── Filters ──────────────────────────────────────────────────────

void TestRagService::testParseFilterTypesBySchemaField()
{
    dr::MetadataFilter filter;
    QString error;
    QVERIFY2(dr::RagService::parseFilter(
                 {QStringLiteral("source=2024"),
                  QStringLiteral("page_number=2"),
                  QStringLiteral("quality_score=0.5"),
                  QStringLiteral("has_complete_sentences=true"),
                  QStringLiteral("chunk_type=\"header\"")},
                 &filter, &error),
             qPrintable(error));

    QVERIFY(filter.value(QStringLiteral("source")).isString());
    QCOMPARE(filter.value(QStringLiteral("source")).toString(), QStringLiteral("2024"));
    QVERIFY(filter.value(QStringLiteral("page_number")).isDouble());
    QCOMPARE(filter.value(QStringLiteral("page_number")).toInt(), 2);
    QCOMPARE(filter.value(QStringLiteral("quality_score")).toDouble(), 0.5);
    QVERIFY(filter.value(QStringLiteral("has_complete_sentences")).isBool());
    QVERIFY(filter.value(QStringLiteral("has_complete_sentences")).toBool());
    QCOMPARE(filter.value(QStringLiteral("chunk_type")).toString(), QStringLiteral("header"));

    dr::MetadataFilter quoted;
    QVERIFY(dr::RagService::parseFilter({QStringLiteral("page_number=\"2\"")}, &quoted, &error));
    QVERIFY(quoted.value(QStringLiteral("page_number")).isString());
}

void TestRagService::testParseFilterRejectsBadEntries()
{
    const QStringList bad = {
        QStringLiteral("source"),
        QStringLiteral("=value"),
        QStringLiteral("bad-key=1"),
        QStringLiteral("page_number=two"),
        QStringLiteral("has_complete_sentences=yes"),
    };
    for (const QString& entry : bad) {
        dr::MetadataFilter filter;
        QString error;
        QVERIFY2(!dr::RagService::parseFilter({entry}, &filter, &error), qPrintable(entry));
        QVERIFY(!error.isEmpty());
    }
}

QTEST_MAIN(TestRagService)
#include "test_rag_service.moc"
