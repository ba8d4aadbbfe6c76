#pragma once

#include "core/extraction/extractor.h"
#include "core/indexing/chunker.h"

#include <QJsonObject>
#include <QString>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace dr {

class CacheService;
class EmbeddingManager;
class VectorIndexAdapter;

enum class IngestionStatus {
    Success,
    Skipped,
    Error,
};

QString ingestionStatusToString(IngestionStatus status);

struct IngestionReport {
    QString filename;
    IngestionStatus status = IngestionStatus::Error;
    QString reason;               // "duplicate_content", "already_processed", ...
    int chunksOriginal = 0;
    int chunksUnique = 0;
    int chunksAdded = 0;
    std::optional<QString> error;

    QJsonObject toJson() const;
};

struct IngestionConfig {
    int uploadBatchSize = 100;
    double deduplicationThreshold = 0.95;
    int maxParallelDocuments = 4;
};

// IngestionPipeline: turns documents into embedded, deduplicated chunks in
// the vector index.
//
// Per document: extract -> content_hash_global check -> pdf_hash check ->
// (force update: delete prior points) -> chunk -> embed -> in-document dedup
// -> batched upload. Any change to the index invalidates the retrieval cache
// and fires the index-changed callback.
class IngestionPipeline {
public:
    using IndexChangedCallback = std::function<void()>;

    IngestionPipeline(VectorIndexAdapter& index,
                      EmbeddingManager& embeddings,
                      CacheService* cache,
                      ChunkerConfig chunkerConfig = {},
                      IngestionConfig config = {});
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    // Extractors are consulted in registration order.
    void registerExtractor(std::unique_ptr<DocumentExtractor> extractor);
    void setIndexChangedCallback(IndexChangedCallback callback);

    IngestionReport ingestDocument(const QString& filePath, bool forceUpdate = false);

    // Distinct documents run on up to maxParallelDocuments threads.
    // Reports are returned in input order.
    std::vector<IngestionReport> ingestDocuments(const std::vector<QString>& filePaths,
                                                 bool forceUpdate = false);

    // Every supported file directly inside dirPath, sorted by name.
    std::vector<IngestionReport> ingestDirectory(const QString& dirPath, bool forceUpdate = false);

    // Removes every chunk whose source is filename. Returns the removed count
    // or -1 on failure.
    int deleteDocument(const QString& filename);

    bool clearIndex();

    // Points in the index, or -1 when the index cannot be counted.
    int indexedPointCount() const;

    bool supports(const QString& filePath) const;

private:
    DocumentExtractor* extractorFor(const QString& filePath) const;
    IngestionReport ingestOne(const QString& filePath, bool forceUpdate);

    // Drops chunks that repeat a content hash or are near-duplicates of a
    // kept chunk. Zero vectors never count as duplicates.
    void deduplicate(std::vector<Chunk>& chunks, std::vector<std::vector<float>>& embeddings) const;

    struct UploadResult {
        int added = 0;
        int rejected = 0;
        int failedBatches = 0;
    };
    // Chunks that fail validateChunk() are skipped. A failed batch is logged
    // and the remaining batches still run.
    UploadResult upload(std::vector<Chunk>& chunks, std::vector<std::vector<float>>& embeddings);

    void notifyIndexChanged();

    VectorIndexAdapter& m_index;
    EmbeddingManager& m_embeddings;
    CacheService* m_cache = nullptr;
    Chunker m_chunker;
    IngestionConfig m_config;
    std::vector<std::unique_ptr<DocumentExtractor>> m_extractors;
    IndexChangedCallback m_indexChanged;
};

} // namespace dr
