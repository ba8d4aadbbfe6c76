#include <QtTest/QtTest>
#include "core/indexing/chunk_scorer.h"

class TestChunkScorer : public QObject {
    Q_OBJECT

private slots:
    // ── Type detection ───────────────────────────────────────────
    void testDetectType_data();
    void testDetectType();
    void testNumberedListWinsOverHeader();

    // ── Quality ──────────────────────────────────────────────────
    void testEmptyTextScoresZero();
    void testShortFragmentPenalized();
    void testWellFormedParagraphScoresHigher();
    void testNoisyTextPenalized();
    void testScoreAlwaysInRange();

    // ── Helpers ──────────────────────────────────────────────────
    void testImportantTerms();
    void testWordCount();
    void testSpecialCharDensity();
};

// ── Type detection ───────────────────────────────────────────────

void TestChunkScorer::testDetectType_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<int>("expected");

    QTest::newRow("numbered")
        << QStringLiteral("1. Open the file\n2. Edit the value\n3. Save it")
        << static_cast<int>(dr::ChunkType::NumberedList);
    QTest::newRow("numbered parenthesis")
        << QStringLiteral("1) first\n2) second")
        << static_cast<int>(dr::ChunkType::NumberedList);
    QTest::newRow("bullets")
        << QStringLiteral("- apples\n- pears\n- plums")
        << static_cast<int>(dr::ChunkType::BulletList);
    QTest::newRow("bullet glyphs")
        << QStringLiteral("• apples\n• pears")
        << static_cast<int>(dr::ChunkType::BulletList);
    QTest::newRow("markdown heading")
        << QStringLiteral("# Installation\nRun the installer.")
        << static_cast<int>(dr::ChunkType::Header);
    QTest::newRow("colon heading")
        << QStringLiteral("Requirements:\nA working compiler.")
        << static_cast<int>(dr::ChunkType::Header);
    QTest::newRow("uppercase heading")
        << QStringLiteral("GENERAL TERMS\nThese terms apply to every order.")
        << static_cast<int>(dr::ChunkType::Header);
    QTest::newRow("paragraph")
        << QStringLiteral("The index stores one vector per chunk of text. Each vector is compared "
                          "with the question at query time. The closest chunks are returned.")
        << static_cast<int>(dr::ChunkType::Paragraph);
    QTest::newRow("plain text")
        << QStringLiteral("just a few words without any sentence ending")
        << static_cast<int>(dr::ChunkType::Text);
    QTest::newRow("empty")
        << QString()
        << static_cast<int>(dr::ChunkType::Text);
}

void TestChunkScorer::testDetectType()
{
    QFETCH(QString, text);
    QFETCH(int, expected);
    QCOMPARE(static_cast<int>(dr::ChunkScorer::detectType(text)), expected);
}

void TestChunkScorer::testNumberedListWinsOverHeader()
{
    const QString text = QStringLiteral("STEPS:\n1. Mix\n2. Bake\n3. Serve");
    QCOMPARE(dr::ChunkScorer::detectType(text), dr::ChunkType::NumberedList);
}

// ── Quality ──────────────────────────────────────────────────────

void TestChunkScorer::testEmptyTextScoresZero()
{
    QCOMPARE(dr::ChunkScorer::qualityScore(QString()), 0.0);
    QCOMPARE(dr::ChunkScorer::qualityScore(QStringLiteral("   \n ")), 0.0);
}

void TestChunkScorer::testShortFragmentPenalized()
{
    // Base 0.5, fewer than 10 words -0.25, nothing else applies.
    QCOMPARE(dr::ChunkScorer::qualityScore(QStringLiteral("ok")), 0.25);
}

void TestChunkScorer::testWellFormedParagraphScoresHigher()
{
    const QString paragraph = QStringLiteral(
        "The retention period is defined as the time a record must be kept. "
        "For example, invoices are kept for 10 years under the Data Protection Act. "
        "After that period the records are deleted by the archive service.");
    const QString fragment = QStringLiteral("kept for ten years under the");

    const double good = dr::ChunkScorer::qualityScore(paragraph);
    const double poor = dr::ChunkScorer::qualityScore(fragment);
    QVERIFY2(good > poor, qPrintable(QStringLiteral("%1 <= %2").arg(good).arg(poor)));
    QVERIFY(good >= 0.7);
}

void TestChunkScorer::testNoisyTextPenalized()
{
    const QString clean = QStringLiteral("This sentence has ordinary words and ends properly.");
    const QString noisy = QStringLiteral("Th@s s#nt$nce h^s ~rd{n}ry w<rds @nd #nds pr*p|rly.");
    QVERIFY(dr::ChunkScorer::specialCharDensity(noisy) > 0.15);
    QVERIFY(dr::ChunkScorer::qualityScore(noisy) < dr::ChunkScorer::qualityScore(clean));
}

void TestChunkScorer::testScoreAlwaysInRange()
{
    const QStringList samples = {
        QStringLiteral("a"),
        QStringLiteral("@@@@ #### $$$$ ^^^^ ~~~~ ||||"),
        QStringLiteral("1. \"Alpha Beta\" 10 kg API\n2. \"Gamma Delta\" 20 % SQL\n"
                       "3. for example this means a lot. " ).repeated(10),
        QStringLiteral("WORD ").repeated(200),
    };
    for (const QString& sample : samples) {
        const double score = dr::ChunkScorer::qualityScore(sample);
        QVERIFY(score >= 0.0);
        QVERIFY(score <= 1.0);
    }
}

// ── Helpers ──────────────────────────────────────────────────────

void TestChunkScorer::testImportantTerms()
{
    const QStringList terms = dr::ChunkScorer::importantTerms(
        QStringLiteral("The API stores data in the Vector Index with 15 % overhead "
                       "and supports \"hybrid search\" via the API."));
    QVERIFY(terms.contains(QStringLiteral("API")));
    QVERIFY(terms.contains(QStringLiteral("Vector Index")));
    QVERIFY(terms.contains(QStringLiteral("15 %")));
    QVERIFY(terms.contains(QStringLiteral("\"hybrid search\"")));
    QCOMPARE(terms.count(QStringLiteral("API")), 1);
}

void TestChunkScorer::testWordCount()
{
    QCOMPARE(dr::ChunkScorer::wordCount(QStringLiteral("  one two\n three\t")), 3);
    QCOMPARE(dr::ChunkScorer::wordCount(QString()), 0);
}

void TestChunkScorer::testSpecialCharDensity()
{
    QCOMPARE(dr::ChunkScorer::specialCharDensity(QStringLiteral("a@b")), 1.0 / 3.0);
    QCOMPARE(dr::ChunkScorer::specialCharDensity(QStringLiteral("Hello, world.")), 0.0);
    QCOMPARE(dr::ChunkScorer::specialCharDensity(QStringLiteral("   ")), 0.0);
}

QTEST_MAIN(TestChunkScorer)
#include "test_chunk_scorer.moc"
