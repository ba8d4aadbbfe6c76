#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace dr {

struct PageText {
    int pageNumber = 0;  // 1-based
    QString text;
};

// Result of a content extraction attempt.
// Every extraction produces a status; pages are present only on Success.
struct ExtractionResult {
    enum class Status {
        Success,
        Empty,
        CorruptedFile,
        UnsupportedFormat,
        SizeExceeded,
        Inaccessible,
        Unknown,
    };

    Status status = Status::Unknown;
    std::vector<PageText> pages;
    std::optional<QString> errorMessage;
    int durationMs = 0;

    QString fullText() const;
};

QString extractionStatusToString(ExtractionResult::Status status);

// DocumentExtractor: abstract interface for page-aware extraction backends.
class DocumentExtractor {
public:
    virtual ~DocumentExtractor() = default;

    virtual ExtractionResult extract(const QString& filePath) = 0;

    // The extension is lowercase without a leading dot (e.g. "pdf", "txt").
    virtual bool supports(const QString& extension) const = 0;
};

} // namespace dr
