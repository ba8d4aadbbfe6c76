#include <QtTest/QtTest>
#include "core/shared/chunk.h"

#include <QJsonArray>

#include <limits>

namespace {

dr::ChunkMetadata sampleMetadata()
{
    dr::ChunkMetadata meta;
    meta.source = QStringLiteral("manual.pdf");
    meta.sourceDocumentId = dr::computeDocumentId(QStringLiteral("/docs/manual.pdf"));
    meta.filePath = QStringLiteral("/docs/manual.pdf");
    meta.pdfHash = QStringLiteral("ab12");
    meta.contentHashGlobal = QStringLiteral("cd34");
    meta.contentHash = QStringLiteral("ef56");
    meta.chunkType = dr::ChunkType::BulletList;
    meta.qualityScore = 0.75;
    meta.wordCount = 42;
    meta.charCount = 256;
    meta.pageNumber = 3;
    meta.hasCompleteSentences = true;
    meta.boundaryQualityScore = 0.875;
    meta.embedding = {0.5f, -0.25f, 0.125f};
    return meta;
}

dr::Chunk validChunk()
{
    dr::Chunk chunk;
    chunk.text = QStringLiteral("Hold the reset button for ten seconds.");
    chunk.metadata = sampleMetadata();
    chunk.metadata.wordCount = 7;
    chunk.metadata.charCount = static_cast<int>(chunk.text.size());
    return chunk;
}

} // namespace

class TestChunkSchema : public QObject {
    Q_OBJECT

private slots:
    void testChunkTypeNames();
    void testWireFieldNames();
    void testParseRestoresFields();
    void testEmbeddingOmittedOnRequest();
    void testMissingPageNumberStaysEmpty();
    void testRejectsUnknownChunkType();
    void testRejectsQualityOutOfRange();
    void testRejectsNonNumericEmbedding();
    void testDocumentIdIsStable();
    void testAssignEmbeddingOnce();
    void testScoredChunkJson();

    // ── Validation before upload ─────────────────────────────────
    void testCountWords();
    void testValidChunkAccepted();
    void testInvalidChunkRejected_data();
    void testInvalidChunkRejected();
};

void TestChunkSchema::testChunkTypeNames()
{
    QCOMPARE(dr::chunkTypeToString(dr::ChunkType::NumberedList), QStringLiteral("numbered_list"));
    QCOMPARE(dr::chunkTypeToString(dr::ChunkType::BulletList), QStringLiteral("bullet_list"));
    QCOMPARE(dr::chunkTypeFromString(QStringLiteral("header")), dr::ChunkType::Header);
    QVERIFY(!dr::chunkTypeFromString(QStringLiteral("table")).has_value());
}

void TestChunkSchema::testWireFieldNames()
{
    const QJsonObject json = dr::chunkMetadataToJson(sampleMetadata());
    const QStringList expected = {
        QStringLiteral("source"), QStringLiteral("source_document_id"),
        QStringLiteral("file_path"), QStringLiteral("pdf_hash"),
        QStringLiteral("content_hash_global"), QStringLiteral("content_hash"),
        QStringLiteral("chunk_type"), QStringLiteral("quality_score"),
        QStringLiteral("word_count"), QStringLiteral("char_count"),
        QStringLiteral("page_number"), QStringLiteral("has_complete_sentences"),
        QStringLiteral("boundary_quality_score"), QStringLiteral("embedding"),
    };
    for (const QString& key : expected) {
        QVERIFY2(json.contains(key), qPrintable(key));
    }
    QCOMPARE(json.size(), expected.size());
    QCOMPARE(json.value(QStringLiteral("chunk_type")).toString(), QStringLiteral("bullet_list"));
}

void TestChunkSchema::testParseRestoresFields()
{
    const dr::ChunkMetadata original = sampleMetadata();
    QString error;
    const auto parsed = dr::chunkMetadataFromJson(dr::chunkMetadataToJson(original), &error);
    QVERIFY2(parsed.has_value(), qPrintable(error));

    QCOMPARE(parsed->source, original.source);
    QCOMPARE(parsed->sourceDocumentId, original.sourceDocumentId);
    QCOMPARE(parsed->contentHashGlobal, original.contentHashGlobal);
    QCOMPARE(parsed->chunkType, original.chunkType);
    QCOMPARE(parsed->qualityScore, original.qualityScore);
    QCOMPARE(parsed->wordCount, original.wordCount);
    QCOMPARE(parsed->pageNumber, original.pageNumber);
    QCOMPARE(parsed->hasCompleteSentences, original.hasCompleteSentences);
    QCOMPARE(parsed->boundaryQualityScore, original.boundaryQualityScore);
    QVERIFY(parsed->embedding == original.embedding);
}

void TestChunkSchema::testEmbeddingOmittedOnRequest()
{
    const QJsonObject json = dr::chunkMetadataToJson(sampleMetadata(), false);
    QVERIFY(!json.contains(QStringLiteral("embedding")));

    const auto parsed = dr::chunkMetadataFromJson(json);
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->embedding.empty());
}

void TestChunkSchema::testMissingPageNumberStaysEmpty()
{
    dr::ChunkMetadata meta = sampleMetadata();
    meta.pageNumber.reset();
    const QJsonObject json = dr::chunkMetadataToJson(meta);
    QVERIFY(!json.contains(QStringLiteral("page_number")));
    QVERIFY(!dr::chunkMetadataFromJson(json)->pageNumber.has_value());
}

void TestChunkSchema::testRejectsUnknownChunkType()
{
    QJsonObject json = dr::chunkMetadataToJson(sampleMetadata());
    json[QStringLiteral("chunk_type")] = QStringLiteral("table");
    QString error;
    QVERIFY(!dr::chunkMetadataFromJson(json, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("table")));
}

void TestChunkSchema::testRejectsQualityOutOfRange()
{
    QJsonObject json = dr::chunkMetadataToJson(sampleMetadata());
    json[QStringLiteral("quality_score")] = 1.5;
    QVERIFY(!dr::chunkMetadataFromJson(json).has_value());

    json[QStringLiteral("quality_score")] = QStringLiteral("high");
    QVERIFY(!dr::chunkMetadataFromJson(json).has_value());
}

void TestChunkSchema::testRejectsNonNumericEmbedding()
{
    QJsonObject json = dr::chunkMetadataToJson(sampleMetadata());
    json[QStringLiteral("embedding")] = QJsonArray{0.1, QStringLiteral("x")};
    QVERIFY(!dr::chunkMetadataFromJson(json).has_value());

    json[QStringLiteral("embedding")] = QStringLiteral("0.1,0.2");
    QVERIFY(!dr::chunkMetadataFromJson(json).has_value());
}

void TestChunkSchema::testDocumentIdIsStable()
{
    const QString a = dr::computeDocumentId(QStringLiteral("/docs/a.pdf"));
    QCOMPARE(a, dr::computeDocumentId(QStringLiteral("/docs/a.pdf")));
    QVERIFY(a != dr::computeDocumentId(QStringLiteral("/docs/b.pdf")));
    QCOMPARE(a.size(), 64);
}

void TestChunkSchema::testAssignEmbeddingOnce()
{
    dr::Chunk chunk;
    QVERIFY(dr::assignEmbedding(chunk, {1.0f, 0.0f}));
    QVERIFY(dr::assignEmbedding(chunk, {1.0f, 0.0f}));
    QVERIFY(!dr::assignEmbedding(chunk, {0.0f, 1.0f}));
    QVERIFY((chunk.metadata.embedding == std::vector<float>{1.0f, 0.0f}));
}

void TestChunkSchema::testScoredChunkJson()
{
    dr::ScoredChunk item;
    item.chunk.text = QStringLiteral("Returns are accepted within 30 days.");
    item.chunk.metadata = sampleMetadata();
    item.score = 0.91;

    const QJsonObject json = dr::scoredChunkToJson(item);
    QVERIFY(!json.value(QStringLiteral("metadata")).toObject()
                 .contains(QStringLiteral("embedding")));

    const auto parsed = dr::scoredChunkFromJson(json);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->chunk.text, item.chunk.text);
    QCOMPARE(parsed->score, item.score);
    QCOMPARE(parsed->chunk.metadata.source, item.chunk.metadata.source);
}

// ── Validation before upload ─────────────────────────────────────

void TestChunkSchema::testCountWords()
{
    QCOMPARE(dr::countWords(QString()), 0);
    QCOMPARE(dr::countWords(QStringLiteral("  one\ttwo\n\nthree ")), 3);
}

void TestChunkSchema::testValidChunkAccepted()
{
    QString error;
    QVERIFY2(dr::validateChunk(validChunk(), &error), qPrintable(error));

    // Mock embeddings are zero vectors; they are still stored.
    dr::Chunk zero = validChunk();
    zero.metadata.embedding.assign(3, 0.0f);
    zero.metadata.pageNumber.reset();
    QVERIFY2(dr::validateChunk(zero, &error), qPrintable(error));
}

void TestChunkSchema::testInvalidChunkRejected_data()
{
    QTest::addColumn<QString>("defect");
    QTest::addColumn<QString>("expectedInError");

    QTest::newRow("blank text") << QStringLiteral("text") << QStringLiteral("text");
    QTest::newRow("no source") << QStringLiteral("source") << QStringLiteral("source");
    QTest::newRow("no pdf hash") << QStringLiteral("pdf_hash") << QStringLiteral("pdf_hash");
    QTest::newRow("no global hash") << QStringLiteral("content_hash_global")
                                    << QStringLiteral("content_hash_global");
    QTest::newRow("no content hash") << QStringLiteral("content_hash")
                                     << QStringLiteral("content_hash");
    QTest::newRow("quality above 1") << QStringLiteral("quality_score")
                                     << QStringLiteral("quality_score");
    QTest::newRow("negative boundary") << QStringLiteral("boundary_quality_score")
                                       << QStringLiteral("boundary_quality_score");
    QTest::newRow("word count mismatch") << QStringLiteral("word_count")
                                         << QStringLiteral("word_count");
    QTest::newRow("char count mismatch") << QStringLiteral("char_count")
                                         << QStringLiteral("char_count");
    QTest::newRow("page zero") << QStringLiteral("page_number") << QStringLiteral("page_number");
    QTest::newRow("no embedding") << QStringLiteral("embedding") << QStringLiteral("embedding");
    QTest::newRow("nan embedding") << QStringLiteral("embedding_nan")
                                   << QStringLiteral("non-finite");
}

void TestChunkSchema::testInvalidChunkRejected()
{
    QFETCH(QString, defect);
    QFETCH(QString, expectedInError);

    dr::Chunk chunk = validChunk();
    dr::ChunkMetadata& meta = chunk.metadata;
    if (defect == QLatin1String("text")) {
        chunk.text = QStringLiteral("   ");
    } else if (defect == QLatin1String("source")) {
        meta.source.clear();
    } else if (defect == QLatin1String("pdf_hash")) {
        meta.pdfHash.clear();
    } else if (defect == QLatin1String("content_hash_global")) {
        meta.contentHashGlobal.clear();
    } else if (defect == QLatin1String("content_hash")) {
        meta.contentHash.clear();
    } else if (defect == QLatin1String("quality_score")) {
        meta.qualityScore = 1.5;
    } else if (defect == QLatin1String("boundary_quality_score")) {
        meta.boundaryQualityScore = -0.1;
    } else if (defect == QLatin1String("word_count")) {
        meta.wordCount = 8;
    } else if (defect == QLatin1String("char_count")) {
        meta.charCount = 10;
    } else if (defect == QLatin1String("page_number")) {
        meta.pageNumber = 0;
    } else if (defect == QLatin1String("embedding")) {
        meta.embedding.clear();
    } else if (defect == QLatin1String("embedding_nan")) {
        meta.embedding[1] = std::numeric_limits<float>::quiet_NaN();
    }

    QString error;
    QVERIFY(!dr::validateChunk(chunk, &error));
    QVERIFY2(error.contains(expectedInError), qPrintable(error));
}

QTEST_MAIN(TestChunkSchema)
#include "test_chunk_schema.moc"
