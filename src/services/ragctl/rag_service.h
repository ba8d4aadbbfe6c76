#pragma once

#include "core/shared/settings.h"
#include "core/vector/vector_index_adapter.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace dr {

class CacheService;
class EmbeddingManager;
class EmbeddingProvider;
class IngestionPipeline;
class RetrievalEngine;
class SqliteVectorIndex;

// RagService: owns one instance of every component and answers the ragctl
// commands with JSON objects. Each result carries "status": "ok" or "error".
class RagService {
public:
    explicit RagService(Settings settings);
    ~RagService();

    RagService(const RagService&) = delete;
    RagService& operator=(const RagService&) = delete;

    // Settings from the config file (or defaults), environment applied, with
    // storage paths filled in under the data directory.
    static Settings resolveSettings(const QString& configPath, bool mockEmbeddings);

    // Opens the index, the cache and the embedding provider.
    bool initialize(QString* error);

    QJsonObject ingest(const QStringList& paths, bool forceUpdate);
    QJsonObject ingestDirectory(const QString& dirPath, bool forceUpdate);
    // k defaults to Settings::retrievalK.
    QJsonObject query(const QString& text, std::optional<int> k, const MetadataFilter& filter,
                      bool trace);
    QJsonObject gate(const QString& text);
    QJsonObject deleteDocument(const QString& filename);
    QJsonObject clear();
    QJsonObject status();

    const Settings& settings() const { return m_settings; }

    static QJsonObject errorResponse(const QString& message);

    // key=value entries to an equality filter. Values are strings unless the
    // key is a numeric or boolean chunk field; a quoted value stays a string.
    static bool parseFilter(const QStringList& entries, MetadataFilter* filter, QString* error);

private:
    Settings m_settings;

    std::unique_ptr<CacheService> m_cache;
    std::unique_ptr<SqliteVectorIndex> m_index;
    std::unique_ptr<EmbeddingProvider> m_provider;
    std::unique_ptr<EmbeddingManager> m_embeddings;
    std::unique_ptr<RetrievalEngine> m_retrieval;
    std::unique_ptr<IngestionPipeline> m_ingestion;
};

} // namespace dr
