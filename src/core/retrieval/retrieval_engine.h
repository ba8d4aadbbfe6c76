#pragma once

#include "core/retrieval/centroid_tracker.h"
#include "core/retrieval/performance_metrics.h"
#include "core/retrieval/reranker.h"
#include "core/shared/chunk.h"
#include "core/vector/vector_index_adapter.h"

#include <QJsonObject>
#include <QString>

#include <chrono>
#include <optional>
#include <vector>

namespace dr {

class CacheService;
class EmbeddingManager;

struct RetrievalConfig {
    int kMultiplier = 3;
    int candidateCap = 20;
    double mmrLambda = 0.5;
    double similarityThreshold = 0.3;
    double gatingThreshold = 0.20;
    std::chrono::milliseconds searchTimeout{5000};
    bool cacheEnabled = true;
    std::optional<int> cacheTtlSeconds;  // defaults to the cache service TTL
    int minQueryLength = 5;
    RerankWeights weights;
    CentroidConfig centroid;
};

struct RetrievalOptions {
    bool useSemanticRanking = true;
    bool useMmr = false;  // only applies when semantic ranking is off
};

struct RetrievalTrace {
    QString query;
    int k = 0;
    std::vector<ScoredChunk> retrieved;
    std::optional<QString> context;
    QJsonObject timings;  // milliseconds per stage

    QJsonObject toJson() const;
};

// RetrievalEngine: query → ranked chunks, context formatting and gating.
//
// Pipeline per query:
//   trivial check → cache lookup → embed → vector search (with timeout)
//   → threshold → semantic rerank | MMR | top-k → cache store
//
// Every failure (embedding unavailable, search timeout, provider error)
// degrades to an empty result. Returned chunks never carry embeddings.
class RetrievalEngine {
public:
    RetrievalEngine(VectorIndexAdapter& index, EmbeddingManager& embeddings,
                    CacheService* cache, RetrievalConfig config = {});

    RetrievalEngine(const RetrievalEngine&) = delete;
    RetrievalEngine& operator=(const RetrievalEngine&) = delete;

    std::vector<ScoredChunk> retrieve(const QString& query, int k = 4,
                                      const MetadataFilter& filter = {},
                                      RetrievalOptions options = {});

    RetrievalTrace retrieveWithTrace(const QString& query, int k = 4,
                                     const MetadataFilter& filter = {},
                                     bool includeContext = true);

    // Chunks grouped by type (header, paragraph, numbered list, bullet list,
    // text), blank-line separated, under a fixed heading.
    static QString formatContext(const std::vector<ScoredChunk>& chunks);
    static QString noResultsMessage();

    // Fail-closed gate: true only when the query is close enough to the
    // corpus centroid.
    bool shouldUseRag(const QString& query);

    static bool isTrivialQuery(const QString& query, int minLength = 5);

    static QString cacheKey(const QString& query, int k, const MetadataFilter& filter,
                            const RetrievalOptions& options);

    // Drops cached results and the centroid. Call after the index changes.
    void invalidate();

    // Loads or computes the centroid. Returns false when the index is empty.
    bool warmup();

    PerformanceMetrics& metrics() { return m_metrics; }
    CentroidTracker& centroid() { return m_centroid; }
    const RetrievalConfig& config() const { return m_config; }

private:
    std::vector<ScoredChunk> run(const QString& query, int k, const MetadataFilter& filter,
                                 const RetrievalOptions& options, QJsonObject* timings);
    std::optional<std::vector<float>> embedQuery(const QString& query);
    void fillMissingEmbeddings(std::vector<ScoredChunk>& candidates);
    std::optional<std::vector<ScoredChunk>> cachedResults(const QString& key);
    void storeResults(const QString& key, const std::vector<ScoredChunk>& results);
    static void stripEmbeddings(std::vector<ScoredChunk>& results);

    VectorIndexAdapter& m_index;
    EmbeddingManager& m_embeddings;
    CacheService* m_cache = nullptr;
    RetrievalConfig m_config;
    CentroidTracker m_centroid;
    PerformanceMetrics m_metrics;
};

} // namespace dr
