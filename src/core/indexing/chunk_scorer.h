#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <QStringList>

namespace dr {

// ChunkScorer: content heuristics assigned once when a chunk is created.
//
// qualityScore() starts from 0.5 and adjusts for length, special-character
// density, capitalization and terminal punctuation, important terms and
// list/definition/example structure. The result is clamped to [0, 1].
class ChunkScorer {
public:
    static double qualityScore(const QString& text);
    static ChunkType detectType(const QString& text);

    // Acronyms, capitalized multi-word terms, numbers with units and quoted
    // terms, de-duplicated in order of first appearance.
    static QStringList importantTerms(const QString& text);

    static int wordCount(const QString& text);
    static double specialCharDensity(const QString& text);
};

} // namespace dr
