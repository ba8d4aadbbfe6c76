#include "core/embedding/http_embedding_provider.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <memory>

namespace dr {

HttpEmbeddingProvider::HttpEmbeddingProvider(HttpEmbeddingConfig config)
    : m_config(std::move(config))
{
}

EmbeddingProviderError::Kind HttpEmbeddingProvider::classifyHttpStatus(int status)
{
    if (status == 408 || status == 429 || status >= 500) {
        return EmbeddingProviderError::Kind::Transient;
    }
    return EmbeddingProviderError::Kind::Permanent;
}

std::vector<std::vector<float>> HttpEmbeddingProvider::parseResponse(const QByteArray& body,
                                                                     size_t expectedCount)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        throw EmbeddingProviderError(EmbeddingProviderError::Kind::Permanent,
                                     QStringLiteral("malformed embedding response: %1")
                                         .arg(parseError.errorString()));
    }

    const QJsonArray data = doc.object().value(QStringLiteral("data")).toArray();
    std::vector<std::vector<float>> vectors(expectedCount);

    for (int i = 0; i < data.size(); ++i) {
        const QJsonObject item = data.at(i).toObject();
        const int index = item.value(QStringLiteral("index")).toInt(i);
        if (index < 0 || static_cast<size_t>(index) >= expectedCount) {
            throw EmbeddingProviderError(EmbeddingProviderError::Kind::Permanent,
                                         QStringLiteral("embedding index %1 out of range")
                                             .arg(index));
        }
        const QJsonArray values = item.value(QStringLiteral("embedding")).toArray();
        std::vector<float>& vector = vectors[static_cast<size_t>(index)];
        vector.reserve(static_cast<size_t>(values.size()));
        for (const QJsonValue& value : values) {
            vector.push_back(static_cast<float>(value.toDouble()));
        }
    }
    // Missing entries stay empty; EmbeddingManager substitutes zero vectors.
    return vectors;
}

std::vector<std::vector<float>> HttpEmbeddingProvider::embed(const std::vector<QString>& texts)
{
    if (texts.empty()) {
        return {};
    }

    QElapsedTimer timer;
    timer.start();

    QJsonArray input;
    for (const QString& text : texts) {
        input.append(text);
    }
    QJsonObject body;
    body.insert(QStringLiteral("model"), m_config.model);
    body.insert(QStringLiteral("input"), input);

    QNetworkRequest request(m_config.endpoint);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!m_config.apiKey.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + m_config.apiKey.toUtf8());
    }
    request.setTransferTimeout(m_config.timeoutMs);

    QNetworkAccessManager manager;
    std::unique_ptr<QNetworkReply> reply(
        manager.post(request, QJsonDocument(body).toJson(QJsonDocument::Compact)));

    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QNetworkReply::NetworkError networkError = reply->error();
    const QByteArray responseBody = reply->readAll();

    if (status == 0) {
        // No HTTP response at all: timeout, refused, DNS, TLS.
        const bool permanent = networkError == QNetworkReply::ProtocolUnknownError
            || networkError == QNetworkReply::ProtocolInvalidOperationError;
        const QString message = QStringLiteral("embedding request failed: %1")
                                    .arg(reply->errorString());
        LOG_WARN(drEmbedding, "%s (%lld ms)", qUtf8Printable(message),
                 static_cast<long long>(timer.elapsed()));
        throw EmbeddingProviderError(permanent ? EmbeddingProviderError::Kind::Permanent
                                               : EmbeddingProviderError::Kind::Transient,
                                     message);
    }

    if (status < 200 || status >= 300) {
        const QString message = QStringLiteral("embedding endpoint returned HTTP %1: %2")
                                    .arg(status)
                                    .arg(QString::fromUtf8(responseBody.left(300)));
        LOG_WARN(drEmbedding, "%s", qUtf8Printable(message));
        throw EmbeddingProviderError(classifyHttpStatus(status), message);
    }

    std::vector<std::vector<float>> vectors = parseResponse(responseBody, texts.size());
    LOG_DEBUG(drEmbedding, "Embedded %d texts with %s in %lld ms",
              static_cast<int>(texts.size()), qUtf8Printable(m_config.model),
              static_cast<long long>(timer.elapsed()));
    return vectors;
}

} // namespace dr
