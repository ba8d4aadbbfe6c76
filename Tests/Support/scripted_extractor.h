#pragma once

#include "core/extraction/extractor.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <atomic>

namespace dr::test {

// Returns a preset ExtractionResult per file name; files without one get
// Status::CorruptedFile. Claims a single extension ("doc" by default).
class ScriptedExtractor : public DocumentExtractor {
public:
    explicit ScriptedExtractor(QString extension = QStringLiteral("doc"))
        : m_extension(std::move(extension))
    {
    }

    void setResult(const QString& fileName, ExtractionResult result)
    {
        m_results.insert(fileName, std::move(result));
    }

    static ExtractionResult pages(const QStringList& texts)
    {
        ExtractionResult result;
        result.status = ExtractionResult::Status::Success;
        for (int i = 0; i < texts.size(); ++i) {
            result.pages.push_back(PageText{i + 1, texts[i]});
        }
        return result;
    }

    ExtractionResult extract(const QString& filePath) override
    {
        ++m_calls;
        const QString name = filePath.section(QLatin1Char('/'), -1);
        auto it = m_results.constFind(name);
        if (it == m_results.constEnd()) {
            ExtractionResult failed;
            failed.status = ExtractionResult::Status::CorruptedFile;
            failed.errorMessage = QStringLiteral("no scripted result");
            return failed;
        }
        return it.value();
    }

    bool supports(const QString& extension) const override
    {
        return extension == m_extension;
    }

    int callCount() const { return m_calls.load(); }

private:
    QString m_extension;
    QHash<QString, ExtractionResult> m_results;
    std::atomic<int> m_calls{0};
};

} // namespace dr::test
