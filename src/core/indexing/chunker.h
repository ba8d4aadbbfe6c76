#pragma once

#include "core/extraction/extractor.h"
#include "core/shared/chunk.h"

#include <QString>
#include <QStringList>
#include <vector>

namespace dr {

// Configuration for the Chunker. Sizes are in characters.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int chunkSize = 700;
    int chunkOverlap = 150;
    int minChunkLength = 100;
    double qualityFloor = 0.3;
};

// Chunker: splits cleaned page text into overlapping windows for embedding.
//
// Split priority (highest to lowest), see separators():
//   paragraph -> horizontal rule / Markdown heading -> list item ->
//   line -> sentence -> clause -> word -> character
//
// Windows hold at most chunkSize characters and each one starts with up to
// chunkOverlap characters of its predecessor. Pages are split independently,
// so every chunk carries the page it came from. Chunks shorter than
// minChunkLength or scoring below qualityFloor are dropped.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    std::vector<Chunk> chunkPages(const QString& filePath,
                                  const std::vector<PageText>& pages) const;

    // Raw overlapping windows before filtering. Deterministic.
    QStringList splitText(const QString& text) const;

    const Config& config() const { return m_config; }

    static const QStringList& separators();

private:
    QStringList splitRecursive(const QString& text, int separatorIndex) const;
    QStringList mergePieces(const QStringList& pieces) const;
    static QStringList splitKeepingSeparator(const QString& text, const QString& separator);

    // Trims an unterminated window back to its last sentence end when at
    // least 70% of the text survives. Returns the boundary quality in [0, 1].
    double adjustToSentenceBoundary(QString& text, bool& complete) const;

    Config m_config;
};

} // namespace dr
