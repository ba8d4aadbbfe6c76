#include <QtTest/QtTest>
#include "core/hashing/content_hasher.h"
#include "core/indexing/chunker.h"
#include "core/shared/chunk.h"

#include <QDir>
#include <QFileInfo>

namespace {

QString sentences(int count)
{
    QString text;
    for (int i = 0; i < count; ++i) {
        text += QStringLiteral("Sentence number %1 is here. ").arg(i);
    }
    return text.trimmed();
}

const QString kParagraph = QStringLiteral(
    "Docrag splits documents into chunks before indexing them. Each chunk keeps its page "
    "number and a quality score. Retrieval ranks chunks by similarity to the question.");

const QString kNumberedList = QStringLiteral(
    "1. Open the settings file and set the index path.\n"
    "2. Run the ingest command for every document.\n"
    "3. Query the index with a question.");

} // namespace

class TestChunker : public QObject {
    Q_OBJECT

private slots:
    // ── Splitting ────────────────────────────────────────────────
    void testEmptyTextReturnsNoWindows();
    void testShortTextIsSingleWindow();
    void testWindowsRespectChunkSize();
    void testConsecutiveWindowsOverlap();
    void testPrefersParagraphBoundaries();
    void testUnbrokenTextFallsBackToCharacters();
    void testSplitIsDeterministic();

    // ── Chunk metadata ───────────────────────────────────────────
    void testChunkPagesCarriesPageNumbers();
    void testChunkMetadataFields();
    void testChunkTypesDetected();

    // ── Filters ──────────────────────────────────────────────────
    void testShortChunksDropped();
    void testLowQualityChunksDropped();
    void testBlankPagesSkipped();

    // ── Config ───────────────────────────────────────────────────
    void testInvalidOverlapSanitized();
    void testSeparatorOrder();
};

// ── Splitting ────────────────────────────────────────────────────

void TestChunker::testEmptyTextReturnsNoWindows()
{
    dr::Chunker chunker;
    QVERIFY(chunker.splitText(QString()).isEmpty());
    QVERIFY(chunker.chunkPages(QStringLiteral("/docs/empty.txt"), {{1, QString()}}).empty());
}

void TestChunker::testShortTextIsSingleWindow()
{
    dr::Chunker chunker;
    const QStringList windows = chunker.splitText(kParagraph);
    QCOMPARE(windows.size(), 1);
    QCOMPARE(windows.first(), kParagraph);
}

void TestChunker::testWindowsRespectChunkSize()
{
    dr::ChunkerConfig config;
    config.chunkSize = 100;
    config.chunkOverlap = 30;
    config.minChunkLength = 10;
    dr::Chunker chunker(config);

    const QStringList windows = chunker.splitText(sentences(40));
    QVERIFY(windows.size() > 5);
    for (const QString& window : windows) {
        QVERIFY2(window.size() <= 100, qPrintable(window));
        QVERIFY(!window.isEmpty());
    }
}

void TestChunker::testConsecutiveWindowsOverlap()
{
    dr::ChunkerConfig config;
    config.chunkSize = 100;
    config.chunkOverlap = 30;
    config.minChunkLength = 10;
    dr::Chunker chunker(config);

    const QStringList windows = chunker.splitText(sentences(20));
    QVERIFY(windows.size() >= 2);
    for (int i = 1; i < windows.size(); ++i) {
        // Each window opens with the last sentence of its predecessor.
        const QString opening = windows[i].section(QStringLiteral(". "), 0, 0);
        QVERIFY2(windows[i - 1].contains(opening),
                 qPrintable(windows[i - 1] + QStringLiteral(" | ") + windows[i]));
    }
}

void TestChunker::testPrefersParagraphBoundaries()
{
    dr::ChunkerConfig config;
    config.chunkSize = 200;
    config.chunkOverlap = 0;
    config.minChunkLength = 10;
    dr::Chunker chunker(config);

    const QString first = QStringLiteral("First paragraph. ").repeated(7).trimmed();
    const QString second = QStringLiteral("Second paragraph. ").repeated(7).trimmed();
    const QStringList windows = chunker.splitText(first + QStringLiteral("\n\n") + second);

    QCOMPARE(windows.size(), 2);
    QCOMPARE(windows[0], first);
    QCOMPARE(windows[1], second);
}

void TestChunker::testUnbrokenTextFallsBackToCharacters()
{
    dr::ChunkerConfig config;
    config.chunkSize = 50;
    config.chunkOverlap = 10;
    config.minChunkLength = 10;
    dr::Chunker chunker(config);

    QString blob;
    blob.fill(QLatin1Char('x'), 180);
    const QStringList windows = chunker.splitText(blob);
    QVERIFY(windows.size() >= 4);
    for (const QString& window : windows) {
        QVERIFY(window.size() <= 50);
    }
}

void TestChunker::testSplitIsDeterministic()
{
    dr::Chunker chunker;
    const QString text = sentences(120);
    QCOMPARE(chunker.splitText(text), chunker.splitText(text));
}

// ── Chunk metadata ───────────────────────────────────────────────

void TestChunker::testChunkPagesCarriesPageNumbers()
{
    dr::ChunkerConfig config;
    config.chunkSize = 500;
    config.chunkOverlap = 50;
    dr::Chunker chunker(config);

    const std::vector<dr::PageText> pages = {
        {1, kParagraph},
        {2, kNumberedList},
        {3, kParagraph + QStringLiteral(" The last page repeats it.")},
    };
    const std::vector<dr::Chunk> chunks =
        chunker.chunkPages(QStringLiteral("/docs/manual.pdf"), pages);

    QCOMPARE(static_cast<int>(chunks.size()), 3);
    for (int i = 0; i < 3; ++i) {
        QVERIFY(chunks[i].metadata.pageNumber.has_value());
        QCOMPARE(*chunks[i].metadata.pageNumber, i + 1);
    }
}

void TestChunker::testChunkMetadataFields()
{
    dr::Chunker chunker;
    const QString path = QDir::temp().filePath(QStringLiteral("notes.txt"));
    const std::vector<dr::Chunk> chunks = chunker.chunkPages(path, {{1, kParagraph}});
    QCOMPARE(static_cast<int>(chunks.size()), 1);

    const dr::Chunk& chunk = chunks.front();
    const QString absolute = QFileInfo(path).absoluteFilePath();
    QCOMPARE(chunk.text, kParagraph);
    QCOMPARE(chunk.metadata.source, QStringLiteral("notes.txt"));
    QCOMPARE(chunk.metadata.filePath, absolute);
    QCOMPARE(chunk.metadata.sourceDocumentId, dr::computeDocumentId(absolute));
    QCOMPARE(chunk.metadata.contentHash, dr::ContentHasher::hashNormalizedText(kParagraph));
    QCOMPARE(chunk.metadata.charCount, static_cast<int>(kParagraph.size()));
    QCOMPARE(chunk.metadata.wordCount, 26);
    QVERIFY(chunk.metadata.qualityScore >= 0.3);
    QVERIFY(chunk.metadata.qualityScore <= 1.0);
    QVERIFY(chunk.metadata.hasCompleteSentences);
    QCOMPARE(chunk.metadata.boundaryQualityScore, 1.0);
    QVERIFY(chunk.metadata.embedding.empty());
    // Filled in later by the ingestion pipeline.
    QVERIFY(chunk.metadata.pdfHash.isEmpty());
    QVERIFY(chunk.metadata.contentHashGlobal.isEmpty());
}

void TestChunker::testChunkTypesDetected()
{
    dr::Chunker chunker;
    const auto chunks = chunker.chunkPages(QStringLiteral("/docs/guide.txt"),
                                           {{1, kParagraph}, {2, kNumberedList}});
    QCOMPARE(static_cast<int>(chunks.size()), 2);
    QCOMPARE(chunks[0].metadata.chunkType, dr::ChunkType::Paragraph);
    QCOMPARE(chunks[1].metadata.chunkType, dr::ChunkType::NumberedList);
}

// ── Filters ──────────────────────────────────────────────────────

void TestChunker::testShortChunksDropped()
{
    dr::Chunker chunker;  // minChunkLength = 100
    const auto chunks = chunker.chunkPages(QStringLiteral("/docs/short.txt"),
                                           {{1, QStringLiteral("Too short to be useful.")}});
    QVERIFY(chunks.empty());
}

void TestChunker::testLowQualityChunksDropped()
{
    dr::ChunkerConfig config;
    config.qualityFloor = 0.95;
    dr::Chunker chunker(config);
    QVERIFY(chunker.chunkPages(QStringLiteral("/docs/a.txt"), {{1, kParagraph}}).empty());

    config.qualityFloor = 0.0;
    dr::Chunker permissive(config);
    QCOMPARE(static_cast<int>(permissive.chunkPages(QStringLiteral("/docs/a.txt"),
                                                    {{1, kParagraph}}).size()), 1);
}

void TestChunker::testBlankPagesSkipped()
{
    dr::Chunker chunker;
    const auto chunks = chunker.chunkPages(QStringLiteral("/docs/scan.pdf"),
                                           {{1, QStringLiteral("  \n\n ")}, {2, kParagraph}});
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(*chunks.front().metadata.pageNumber, 2);
}

// ── Config ───────────────────────────────────────────────────────

void TestChunker::testInvalidOverlapSanitized()
{
    dr::ChunkerConfig config;
    config.chunkSize = 100;
    config.chunkOverlap = 150;
    config.minChunkLength = 500;
    dr::Chunker chunker(config);
    QCOMPARE(chunker.config().chunkOverlap, 20);
    QCOMPARE(chunker.config().minChunkLength, 100);
}

void TestChunker::testSeparatorOrder()
{
    const QStringList& seps = dr::Chunker::separators();
    QVERIFY(seps.indexOf(QStringLiteral("\n\n")) < seps.indexOf(QStringLiteral("\n")));
    QVERIFY(seps.indexOf(QStringLiteral("\n")) < seps.indexOf(QStringLiteral(". ")));
    QVERIFY(seps.indexOf(QStringLiteral(". ")) < seps.indexOf(QStringLiteral(" ")));
    QVERIFY(seps.last().isEmpty());
}

QTEST_MAIN(TestChunker)
#include "test_chunker.moc"
