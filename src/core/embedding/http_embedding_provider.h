#pragma once

#include "core/embedding/embedding_provider.h"

#include <QByteArray>
#include <QUrl>

namespace dr {

struct HttpEmbeddingConfig {
    QUrl endpoint = QUrl(QStringLiteral("https://api.openai.com/v1/embeddings"));
    QString model = QStringLiteral("text-embedding-3-small");
    QString apiKey;
    int timeoutMs = 30000;
};

// HttpEmbeddingProvider: OpenAI-compatible embeddings endpoint.
//
// POSTs {"model": ..., "input": [...]} and reads data[].embedding ordered by
// data[].index. Each call blocks on a local event loop, so it can run on any
// thread of a QCoreApplication process.
//
// Error classification:
//   transient: timeout, connection/DNS failure, HTTP 408, 429, 5xx
//   permanent: other HTTP 4xx, malformed response body
class HttpEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HttpEmbeddingProvider(HttpEmbeddingConfig config);

    QString modelId() const override { return m_config.model; }
    std::vector<std::vector<float>> embed(const std::vector<QString>& texts) override;

    static EmbeddingProviderError::Kind classifyHttpStatus(int status);
    static std::vector<std::vector<float>> parseResponse(const QByteArray& body,
                                                         size_t expectedCount);

private:
    HttpEmbeddingConfig m_config;
};

} // namespace dr
