#include "core/extraction/extractor.h"

namespace dr {

QString ExtractionResult::fullText() const
{
    QString text;
    for (const PageText& page : pages) {
        if (page.text.isEmpty()) {
            continue;
        }
        if (!text.isEmpty()) {
            text += QLatin1Char('\n');
        }
        text += page.text;
    }
    return text;
}

QString extractionStatusToString(ExtractionResult::Status status)
{
    switch (status) {
    case ExtractionResult::Status::Success:           return QStringLiteral("success");
    case ExtractionResult::Status::Empty:             return QStringLiteral("empty");
    case ExtractionResult::Status::CorruptedFile:     return QStringLiteral("corrupted_file");
    case ExtractionResult::Status::UnsupportedFormat: return QStringLiteral("unsupported_format");
    case ExtractionResult::Status::SizeExceeded:      return QStringLiteral("size_exceeded");
    case ExtractionResult::Status::Inaccessible:      return QStringLiteral("inaccessible");
    case ExtractionResult::Status::Unknown:           return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

} // namespace dr
