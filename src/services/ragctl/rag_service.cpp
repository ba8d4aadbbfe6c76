#include "rag_service.h"
#include "core/cache/cache_service.h"
#include "core/embedding/embedding_manager.h"
#include "core/embedding/http_embedding_provider.h"
#include "core/extraction/pdf_extractor.h"
#include "core/extraction/text_extractor.h"
#include "core/ingestion/ingestion_pipeline.h"
#include "core/retrieval/retrieval_engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/sqlite_vector_index.h"

#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QUrl>

namespace dr {

namespace {

enum class FilterValueType { String, Integer, Number, Boolean };

FilterValueType filterValueType(const QString& key)
{
    static const QHash<QString, FilterValueType> types = {
        {QStringLiteral("page_number"), FilterValueType::Integer},
        {QStringLiteral("word_count"), FilterValueType::Integer},
        {QStringLiteral("char_count"), FilterValueType::Integer},
        {QStringLiteral("quality_score"), FilterValueType::Number},
        {QStringLiteral("boundary_quality_score"), FilterValueType::Number},
        {QStringLiteral("has_complete_sentences"), FilterValueType::Boolean},
    };
    return types.value(key, FilterValueType::String);
}

QJsonObject reportsResponse(const std::vector<IngestionReport>& reports)
{
    QJsonArray items;
    int failed = 0;
    for (const IngestionReport& report : reports) {
        items.append(report.toJson());
        if (report.status == IngestionStatus::Error) {
            ++failed;
        }
    }

    QJsonObject response;
    response[QStringLiteral("status")] = failed == 0 ? QStringLiteral("ok") : QStringLiteral("error");
    response[QStringLiteral("documents")] = items;
    response[QStringLiteral("failed")] = failed;
    return response;
}

} // namespace

RagService::RagService(Settings settings)
    : m_settings(std::move(settings))
{
}

RagService::~RagService()
{
    // Pipeline and engine reference the components below them.
    m_ingestion.reset();
    m_retrieval.reset();
    m_embeddings.reset();
    m_provider.reset();
    m_index.reset();
    if (m_cache) {
        m_cache->close();
    }
}

Settings RagService::resolveSettings(const QString& configPath, bool mockEmbeddings)
{
    Settings settings = SettingsManager::load(configPath).value_or(Settings{});
    SettingsManager::applyEnvironment(settings);

    const QString dataDir = SettingsManager::dataDirectory();
    if (settings.indexPath.isEmpty()) {
        settings.indexPath = QDir(dataDir).filePath(QStringLiteral("index.db"));
    }
    if (settings.cachePath.isEmpty()) {
        settings.cachePath = QDir(dataDir).filePath(QStringLiteral("cache.db"));
    }
    if (mockEmbeddings) {
        settings.embeddingMockMode = true;
    }
    return settings;
}

bool RagService::initialize(QString* error)
{
    const QString indexDir = QFileInfo(m_settings.indexPath).absolutePath();
    if (!QDir().mkpath(indexDir)) {
        *error = QStringLiteral("Cannot create directory %1").arg(indexDir);
        return false;
    }
    if (!m_settings.cachePath.isEmpty()) {
        QDir().mkpath(QFileInfo(m_settings.cachePath).absolutePath());
    }

    SqliteVectorIndexConfig indexConfig;
    indexConfig.dimensions = m_settings.embeddingDimension;
    m_index = SqliteVectorIndex::open(m_settings.indexPath, indexConfig);
    if (!m_index) {
        *error = QStringLiteral("Cannot open vector index at %1").arg(m_settings.indexPath);
        return false;
    }

    m_cache = CacheService::create(m_settings);

    if (!m_settings.embeddingMockMode) {
        if (m_settings.embeddingApiKey.isEmpty()) {
            LOG_WARN(drCore, "EMBEDDING_API_KEY is not set; requests may be rejected");
        }
        HttpEmbeddingConfig providerConfig;
        providerConfig.endpoint = QUrl(m_settings.embeddingEndpoint);
        providerConfig.model = m_settings.embeddingModel;
        providerConfig.apiKey = m_settings.embeddingApiKey;
        providerConfig.timeoutMs = m_settings.embeddingTimeoutMs;
        m_provider = std::make_unique<HttpEmbeddingProvider>(providerConfig);
    }

    EmbeddingManagerConfig embeddingConfig;
    embeddingConfig.dimensions = m_settings.embeddingDimension;
    embeddingConfig.batchSize = m_settings.embeddingBatchSize;
    embeddingConfig.retry.maxAttempts = m_settings.retryMaxAttempts;
    embeddingConfig.retry.baseDelayMs = m_settings.retryBaseDelayMs;
    embeddingConfig.retry.maxDelayMs = m_settings.retryMaxDelayMs;
    embeddingConfig.mockMode = m_settings.embeddingMockMode;
    m_embeddings = std::make_unique<EmbeddingManager>(m_provider.get(), m_cache.get(),
                                                      embeddingConfig);

    RetrievalConfig retrievalConfig;
    retrievalConfig.kMultiplier = m_settings.retrievalKMultiplier;
    retrievalConfig.candidateCap = m_settings.retrievalCandidateCap;
    retrievalConfig.mmrLambda = m_settings.mmrLambda;
    retrievalConfig.similarityThreshold = m_settings.similarityThreshold;
    retrievalConfig.gatingThreshold = m_settings.gatingThreshold;
    retrievalConfig.searchTimeout = std::chrono::milliseconds(m_settings.searchTimeoutMs);
    retrievalConfig.cacheEnabled = m_settings.enableCache;
    retrievalConfig.centroid.cacheTtlSeconds = m_settings.cacheTtlSeconds;
    m_retrieval = std::make_unique<RetrievalEngine>(*m_index, *m_embeddings, m_cache.get(),
                                                    retrievalConfig);

    ChunkerConfig chunkerConfig;
    chunkerConfig.chunkSize = m_settings.chunkSize;
    chunkerConfig.chunkOverlap = m_settings.chunkOverlap;
    chunkerConfig.minChunkLength = m_settings.minChunkLength;
    chunkerConfig.qualityFloor = m_settings.qualityFloor;

    IngestionConfig ingestionConfig;
    ingestionConfig.uploadBatchSize = m_settings.uploadBatchSize;
    ingestionConfig.deduplicationThreshold = m_settings.deduplicationThreshold;
    ingestionConfig.maxParallelDocuments = m_settings.maxParallelDocuments;

    m_ingestion = std::make_unique<IngestionPipeline>(*m_index, *m_embeddings, m_cache.get(),
                                                      chunkerConfig, ingestionConfig);
    m_ingestion->registerExtractor(std::make_unique<PdfExtractor>());
    m_ingestion->registerExtractor(std::make_unique<TextExtractor>());

    RetrievalEngine* retrieval = m_retrieval.get();
    m_ingestion->setIndexChangedCallback([retrieval]() { retrieval->invalidate(); });

    LOG_INFO(drCore, "docrag ready (index %s, model %s)",
             qUtf8Printable(m_settings.indexPath), qUtf8Printable(m_embeddings->modelId()));
    return true;
}

// ── Commands ────────────────────────────────────────────────

QJsonObject RagService::ingest(const QStringList& paths, bool forceUpdate)
{
    std::vector<QString> files(paths.begin(), paths.end());
    return reportsResponse(m_ingestion->ingestDocuments(files, forceUpdate));
}

QJsonObject RagService::ingestDirectory(const QString& dirPath, bool forceUpdate)
{
    if (!QFileInfo(dirPath).isDir()) {
        return errorResponse(QStringLiteral("Not a directory: %1").arg(dirPath));
    }
    return reportsResponse(m_ingestion->ingestDirectory(dirPath, forceUpdate));
}

QJsonObject RagService::query(const QString& text, std::optional<int> requestedK,
                              const MetadataFilter& filter, bool trace)
{
    const int k = requestedK.value_or(m_settings.retrievalK);
    QJsonObject response;
    if (trace) {
        response = m_retrieval->retrieveWithTrace(text, k, filter, true).toJson();
    } else {
        const std::vector<ScoredChunk> results = m_retrieval->retrieve(text, k, filter);
        QJsonArray items;
        for (const ScoredChunk& item : results) {
            items.append(scoredChunkToJson(item));
        }
        response[QStringLiteral("query")] = text;
        response[QStringLiteral("k")] = k;
        response[QStringLiteral("results")] = items;
        response[QStringLiteral("context")] = RetrievalEngine::formatContext(results);
    }
    response[QStringLiteral("status")] = QStringLiteral("ok");
    return response;
}

QJsonObject RagService::gate(const QString& text)
{
    QJsonObject response;
    response[QStringLiteral("status")] = QStringLiteral("ok");
    response[QStringLiteral("query")] = text;
    response[QStringLiteral("use_rag")] = m_retrieval->shouldUseRag(text);
    return response;
}

QJsonObject RagService::deleteDocument(const QString& filename)
{
    const int removed = m_ingestion->deleteDocument(filename);
    if (removed < 0) {
        return errorResponse(QStringLiteral("Failed to delete %1").arg(filename));
    }
    QJsonObject response;
    response[QStringLiteral("status")] = QStringLiteral("ok");
    response[QStringLiteral("filename")] = filename;
    response[QStringLiteral("removed")] = removed;
    return response;
}

QJsonObject RagService::clear()
{
    if (!m_ingestion->clearIndex()) {
        return errorResponse(QStringLiteral("Failed to clear the index"));
    }
    QJsonObject response;
    response[QStringLiteral("status")] = QStringLiteral("ok");
    return response;
}

QJsonObject RagService::status()
{
    QJsonObject index;
    index[QStringLiteral("path")] = m_settings.indexPath;
    index[QStringLiteral("points")] = m_index->count();
    index[QStringLiteral("dimensions")] = m_settings.embeddingDimension;

    const CacheService::Health health = m_cache->health();
    QJsonObject cache;
    cache[QStringLiteral("backend")] = health.backend;
    cache[QStringLiteral("available")] = health.available;
    cache[QStringLiteral("degraded")] = health.degraded;
    cache[QStringLiteral("entries")] = health.entries;
    if (!health.message.isEmpty()) {
        cache[QStringLiteral("message")] = health.message;
    }

    QJsonObject embedding;
    embedding[QStringLiteral("model")] = m_embeddings->modelId();
    embedding[QStringLiteral("mock")] = m_embeddings->isMockMode();
    embedding[QStringLiteral("available")] = m_embeddings->isAvailable();
    embedding[QStringLiteral("circuit_open")] = m_embeddings->circuitBreaker().isOpen();

    // Computes the centroid when it is not cached yet.
    QJsonObject retrieval;
    retrieval[QStringLiteral("centroid_ready")] = m_retrieval->warmup();
    retrieval[QStringLiteral("similarity_threshold")] = m_settings.similarityThreshold;
    retrieval[QStringLiteral("gating_threshold")] = m_settings.gatingThreshold;

    QJsonObject response;
    response[QStringLiteral("status")] = QStringLiteral("ok");
    response[QStringLiteral("index")] = index;
    response[QStringLiteral("cache")] = cache;
    response[QStringLiteral("embedding")] = embedding;
    response[QStringLiteral("retrieval")] = retrieval;
    response[QStringLiteral("settings")] = SettingsManager::toJson(m_settings);
    return response;
}

QJsonObject RagService::errorResponse(const QString& message)
{
    QJsonObject response;
    response[QStringLiteral("status")] = QStringLiteral("error");
    response[QStringLiteral("error")] = message;
    return response;
}

bool RagService::parseFilter(const QStringList& entries, MetadataFilter* filter, QString* error)
{
    for (const QString& entry : entries) {
        const int eq = entry.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            *error = QStringLiteral("Invalid filter '%1', expected key=value").arg(entry);
            return false;
        }
        const QString key = entry.left(eq);
        QString value = entry.mid(eq + 1);
        if (!isValidFilterKey(key)) {
            *error = QStringLiteral("Invalid filter key '%1'").arg(key);
            return false;
        }

        if (value.size() >= 2 && value.startsWith(QLatin1Char('"'))
            && value.endsWith(QLatin1Char('"'))) {
            filter->insert(key, value.mid(1, value.size() - 2));
            continue;
        }

        bool ok = true;
        switch (filterValueType(key)) {
        case FilterValueType::Integer: {
            const int number = value.toInt(&ok);
            if (ok) {
                filter->insert(key, number);
            }
            break;
        }
        case FilterValueType::Number: {
            const double number = value.toDouble(&ok);
            if (ok) {
                filter->insert(key, number);
            }
            break;
        }
        case FilterValueType::Boolean:
            ok = value == QLatin1String("true") || value == QLatin1String("false");
            if (ok) {
                filter->insert(key, value == QLatin1String("true"));
            }
            break;
        case FilterValueType::String:
            filter->insert(key, value);
            break;
        }
        if (!ok) {
            *error = QStringLiteral("Invalid value '%1' for filter key '%2'").arg(value, key);
            return false;
        }
    }
    return true;
}

} // namespace dr
