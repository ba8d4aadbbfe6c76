#include "core/extraction/pdf_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFileInfo>

#include <algorithm>
#include <memory>

#if defined(DR_POPPLER_QT6)
#include <poppler/qt6/poppler-qt6.h>
#endif

namespace dr {

bool PdfExtractor::supports(const QString& extension) const
{
    return extension.compare(QLatin1String("pdf"), Qt::CaseInsensitive) == 0;
}

ExtractionResult PdfExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;

    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File does not exist or is not a regular file");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (!info.isReadable()) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File is not readable");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

#if defined(DR_POPPLER_QT6)
    constexpr int kMaxPages = 1000;
    constexpr int64_t kMaxExtractedTextBytes = 10LL * 1024 * 1024;

    std::unique_ptr<Poppler::Document> doc(Poppler::Document::load(filePath));
    if (!doc) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("Failed to load PDF document");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_WARN(drExtraction, "Poppler failed to load: %s", qUtf8Printable(filePath));
        return result;
    }

    if (doc->isLocked()) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("PDF is encrypted or password-protected");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_INFO(drExtraction, "Skipping encrypted PDF: %s", qUtf8Printable(filePath));
        return result;
    }

    const int pageCount = doc->numPages();
    const int pagesToProcess = std::min(pageCount, kMaxPages);

    if (pageCount > kMaxPages) {
        LOG_INFO(drExtraction, "PDF has %d pages, capping at %d: %s",
                 pageCount, kMaxPages, qUtf8Printable(filePath));
    }

    int64_t extractedBytes = 0;
    for (int i = 0; i < pagesToProcess; ++i) {
        std::unique_ptr<Poppler::Page> page(doc->page(i));
        if (!page) {
            LOG_DEBUG(drExtraction, "Null page %d in %s", i, qUtf8Printable(filePath));
            continue;
        }

        QString pageText = page->text(QRectF());
        if (pageText.trimmed().isEmpty()) {
            continue;
        }

        extractedBytes += pageText.toUtf8().size();
        result.pages.push_back({i + 1, std::move(pageText)});

        if (extractedBytes > kMaxExtractedTextBytes) {
            LOG_INFO(drExtraction, "Extracted text exceeded %lld bytes at page %d: %s",
                     static_cast<long long>(kMaxExtractedTextBytes), i + 1,
                     qUtf8Printable(filePath));
            break;
        }
    }

    result.status = result.pages.empty() ? ExtractionResult::Status::Empty
                                         : ExtractionResult::Status::Success;
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(drExtraction, "Extracted %d/%d pages from PDF %s in %d ms",
              static_cast<int>(result.pages.size()), pagesToProcess,
              qUtf8Printable(filePath), result.durationMs);

    return result;

#else
    result.status = ExtractionResult::Status::UnsupportedFormat;
    result.errorMessage = QStringLiteral("PDF extraction unavailable (Poppler not found)");
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(drExtraction, "PDF extraction skipped (no Poppler): %s",
             qUtf8Printable(filePath));
    return result;
#endif
}

} // namespace dr
