#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QStringConverter>

namespace dr {

namespace {

constexpr int64_t kMaxFileSizeBytes = 50 * 1024 * 1024;

} // anonymous namespace

const QSet<QString>& TextExtractor::supportedExtensions()
{
    static const QSet<QString> exts = {
        QStringLiteral("txt"),
        QStringLiteral("text"),
        QStringLiteral("md"),
        QStringLiteral("markdown"),
        QStringLiteral("rst"),
    };
    return exts;
}

bool TextExtractor::supports(const QString& extension) const
{
    return supportedExtensions().contains(extension.toLower());
}

ExtractionResult TextExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;

    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile() || !info.isReadable()) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File does not exist or is not readable");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (info.size() > kMaxFileSizeBytes) {
        result.status = ExtractionResult::Status::SizeExceeded;
        result.errorMessage = QString("File size %1 bytes exceeds limit of %2 bytes")
                                  .arg(info.size())
                                  .arg(kMaxFileSizeBytes);
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_INFO(drExtraction, "Skipping oversized file: %s (%lld bytes)",
                 qUtf8Printable(filePath), static_cast<long long>(info.size()));
        return result;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QString("Failed to open file: %1").arg(file.errorString());
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    const QByteArray rawBytes = file.readAll();
    file.close();

    QString decoded;
    {
        auto toUtf8 = QStringDecoder(QStringDecoder::Utf8,
                                     QStringDecoder::Flag::Stateless);
        decoded = toUtf8(rawBytes);

        if (toUtf8.hasError()) {
            decoded = QString::fromLatin1(rawBytes);
            LOG_DEBUG(drExtraction, "UTF-8 decode failed for %s, using Latin-1 fallback",
                      qUtf8Printable(filePath));
        }
    }

    const QStringList pageTexts = decoded.split(QLatin1Char('\f'));
    for (int i = 0; i < pageTexts.size(); ++i) {
        if (pageTexts[i].trimmed().isEmpty()) {
            continue;
        }
        result.pages.push_back({i + 1, pageTexts[i]});
    }

    result.status = result.pages.empty() ? ExtractionResult::Status::Empty
                                         : ExtractionResult::Status::Success;
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(drExtraction, "Extracted %d pages (%lld chars) from %s in %d ms",
              static_cast<int>(result.pages.size()),
              static_cast<long long>(decoded.size()),
              qUtf8Printable(filePath),
              result.durationMs);

    return result;
}

} // namespace dr
