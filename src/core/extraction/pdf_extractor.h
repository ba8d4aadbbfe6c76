#pragma once

#include "core/extraction/extractor.h"

namespace dr {

// PdfExtractor: extracts per-page text from PDF files using Poppler.
//
// When compiled with DR_POPPLER_QT6, uses the Poppler Qt 6 API to iterate
// pages. Without Poppler, returns UnsupportedFormat.
//
// Limits:
//   - 1000-page cap per document
//   - 10 MB extracted text cap
//   - Encrypted PDFs are rejected (CorruptedFile status)
class PdfExtractor : public DocumentExtractor {
public:
    ExtractionResult extract(const QString& filePath) override;
    bool supports(const QString& extension) const override;
};

} // namespace dr
