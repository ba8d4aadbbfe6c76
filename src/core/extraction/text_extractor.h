#pragma once

#include "core/extraction/extractor.h"
#include <QSet>

namespace dr {

// TextExtractor: reads plain-text and Markdown documents.
//
// Attempts UTF-8 decoding first, falling back to Latin-1. A form feed (\f),
// as written by pdftotext, starts a new page; a file without form feeds is a
// single page.
//
// Size limit: files larger than 50 MB are rejected with SizeExceeded.
class TextExtractor : public DocumentExtractor {
public:
    ExtractionResult extract(const QString& filePath) override;
    bool supports(const QString& extension) const override;

private:
    static const QSet<QString>& supportedExtensions();
};

} // namespace dr
