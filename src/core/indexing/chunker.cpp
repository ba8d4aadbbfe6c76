#include "core/indexing/chunker.h"
#include "core/extraction/text_cleaner.h"
#include "core/hashing/content_hasher.h"
#include "core/indexing/chunk_scorer.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QRegularExpression>

namespace dr {

namespace {

constexpr double kMinKeptFraction = 0.7;

bool endsWithTerminalPunctuation(const QString& text)
{
    static const QRegularExpression re(QStringLiteral("[.!?][\"')\\]]*$"));
    return re.match(text).hasMatch();
}

} // namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    // Sanity-check config bounds
    if (m_config.chunkSize < 1) {
        m_config.chunkSize = 1;
    }
    if (m_config.chunkOverlap < 0 || m_config.chunkOverlap >= m_config.chunkSize) {
        m_config.chunkOverlap = m_config.chunkSize / 5;
    }
    if (m_config.minChunkLength > m_config.chunkSize) {
        m_config.minChunkLength = m_config.chunkSize;
    }
}

const QStringList& Chunker::separators()
{
    static const QStringList seps = {
        QStringLiteral("\n\n\n"),
        QStringLiteral("\n\n"),
        QStringLiteral("\n---\n"),
        QStringLiteral("\n## "),
        QStringLiteral("\n# "),
        QStringLiteral("\n- "),
        QStringLiteral("\n\x2022 "),
        QStringLiteral("\n* "),
        QStringLiteral("\n\t"),
        QStringLiteral(".\n"),
        QStringLiteral("!\n"),
        QStringLiteral("?\n"),
        QStringLiteral("\n"),
        QStringLiteral(". "),
        QStringLiteral("! "),
        QStringLiteral("? "),
        QStringLiteral("; "),
        QStringLiteral(": "),
        QStringLiteral(", "),
        QStringLiteral(" "),
        QString(),
    };
    return seps;
}

// ── Public API ──────────────────────────────────────────────

std::vector<Chunk> Chunker::chunkPages(const QString& filePath,
                                       const std::vector<PageText>& pages) const
{
    std::vector<Chunk> chunks;

    const QFileInfo info(filePath);
    const QString source = info.fileName();
    const QString absolutePath = info.absoluteFilePath();
    const QString documentId = computeDocumentId(absolutePath);

    int windowsSeen = 0;
    int droppedShort = 0;
    int droppedQuality = 0;

    for (const PageText& page : pages) {
        const QString cleaned = TextCleaner::clean(page.text);
        if (cleaned.isEmpty()) {
            continue;
        }

        const QStringList windows = splitText(cleaned);
        windowsSeen += static_cast<int>(windows.size());

        for (int w = 0; w < windows.size(); ++w) {
            QString text = windows[w].trimmed();
            if (text.size() < m_config.minChunkLength) {
                ++droppedShort;
                continue;
            }

            bool complete = endsWithTerminalPunctuation(text);
            double boundaryQuality = complete ? 1.0 : 0.5;
            // The last window of a page has no successor to pick up a trimmed tail.
            if (!complete && w + 1 < windows.size()) {
                boundaryQuality = adjustToSentenceBoundary(text, complete);
            }

            const double quality = ChunkScorer::qualityScore(text);
            if (quality < m_config.qualityFloor) {
                ++droppedQuality;
                continue;
            }

            Chunk c;
            c.text = text;
            ChunkMetadata& meta = c.metadata;
            meta.source = source;
            meta.sourceDocumentId = documentId;
            meta.filePath = absolutePath;
            meta.contentHash = ContentHasher::hashNormalizedText(text);
            meta.chunkType = ChunkScorer::detectType(text);
            meta.qualityScore = quality;
            meta.wordCount = ChunkScorer::wordCount(text);
            meta.charCount = static_cast<int>(text.size());
            if (page.pageNumber > 0) {
                meta.pageNumber = page.pageNumber;
            }
            meta.hasCompleteSentences = complete;
            meta.boundaryQualityScore = boundaryQuality;

            chunks.push_back(std::move(c));
        }
    }

    LOG_DEBUG(drIngest, "Chunked %s: %d chunks from %d windows (%d short, %d low quality)",
              qUtf8Printable(source),
              static_cast<int>(chunks.size()),
              windowsSeen, droppedShort, droppedQuality);

    return chunks;
}

QStringList Chunker::splitText(const QString& text) const
{
    if (text.isEmpty()) {
        return {};
    }
    return splitRecursive(text, 0);
}

// ── Private helpers ─────────────────────────────────────────

QStringList Chunker::splitKeepingSeparator(const QString& text, const QString& separator)
{
    QStringList pieces;

    if (separator.isEmpty()) {
        pieces.reserve(text.size());
        for (const QChar ch : text) {
            pieces << QString(ch);
        }
        return pieces;
    }

    // Structural separators ("\n- ", "\n# ") open the next piece; punctuation
    // separators (". ", ", ") close the current one.
    const bool attachToNext = separator.startsWith(QLatin1Char('\n'));

    qsizetype start = 0;
    qsizetype pos = text.indexOf(separator);
    while (pos >= 0) {
        const qsizetype cut = attachToNext ? pos : pos + separator.size();
        if (cut > start) {
            pieces << text.mid(start, cut - start);
        }
        start = cut;
        pos = text.indexOf(separator, pos + separator.size());
    }
    if (start < text.size()) {
        pieces << text.mid(start);
    }
    return pieces;
}

QStringList Chunker::splitRecursive(const QString& text, int separatorIndex) const
{
    const QStringList& seps = separators();

    int index = separatorIndex;
    while (index < seps.size() - 1 && !text.contains(seps[index])) {
        ++index;
    }
    const QString& separator = seps[index];

    QStringList result;
    QStringList pending;

    for (const QString& piece : splitKeepingSeparator(text, separator)) {
        if (piece.size() <= m_config.chunkSize) {
            pending << piece;
            continue;
        }
        if (!pending.isEmpty()) {
            result << mergePieces(pending);
            pending.clear();
        }
        result << splitRecursive(piece, index + 1);
    }

    if (!pending.isEmpty()) {
        result << mergePieces(pending);
    }
    return result;
}

QStringList Chunker::mergePieces(const QStringList& pieces) const
{
    QStringList windows;
    QStringList current;
    qsizetype total = 0;

    auto emitCurrent = [&]() {
        const QString window = current.join(QString()).trimmed();
        if (!window.isEmpty()) {
            windows << window;
        }
    };

    for (const QString& piece : pieces) {
        const qsizetype len = piece.size();
        if (total + len > m_config.chunkSize && !current.isEmpty()) {
            emitCurrent();
            // Keep a tail of at most chunkOverlap characters that still
            // leaves room for the incoming piece.
            while (!current.isEmpty()
                   && (total > m_config.chunkOverlap
                       || total + len > m_config.chunkSize)) {
                total -= current.front().size();
                current.removeFirst();
            }
        }
        current << piece;
        total += len;
    }

    if (!current.isEmpty()) {
        emitCurrent();
    }
    return windows;
}

double Chunker::adjustToSentenceBoundary(QString& text, bool& complete) const
{
    static const QRegularExpression sentenceEnd(QStringLiteral("[.!?][\"')\\]]*(?=\\s)"));

    qsizetype lastEnd = -1;
    auto it = sentenceEnd.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        lastEnd = m.capturedEnd(0);
    }

    if (lastEnd <= 0) {
        complete = false;
        return 0.5;
    }

    const double kept = static_cast<double>(lastEnd) / static_cast<double>(text.size());
    if (kept < kMinKeptFraction || lastEnd < m_config.minChunkLength) {
        complete = false;
        return 0.5;
    }

    text.truncate(lastEnd);
    complete = true;
    return kept;
}

} // namespace dr
