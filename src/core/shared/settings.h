#pragma once

#include <QString>

namespace dr {

struct Settings {
    // Storage
    QString indexPath;   // SQLite vector index file
    QString cachePath;   // SQLite cache file; empty keeps the cache in memory

    // Chunking
    int chunkSize = 700;
    int chunkOverlap = 150;
    int minChunkLength = 100;
    double qualityFloor = 0.3;

    // Embedding
    QString embeddingModel = QStringLiteral("text-embedding-3-small");
    QString embeddingEndpoint = QStringLiteral("https://api.openai.com/v1/embeddings");
    QString embeddingApiKey;
    int embeddingDimension = 1536;
    int embeddingBatchSize = 32;
    int embeddingTimeoutMs = 30000;
    bool embeddingMockMode = false;
    int retryMaxAttempts = 3;
    int retryBaseDelayMs = 1000;
    int retryMaxDelayMs = 8000;

    // Ingestion
    int uploadBatchSize = 100;
    int maxParallelDocuments = 4;
    double deduplicationThreshold = 0.95;

    // Retrieval
    int retrievalK = 4;
    int retrievalKMultiplier = 3;
    int retrievalCandidateCap = 20;
    double mmrLambda = 0.5;
    double similarityThreshold = 0.3;
    double gatingThreshold = 0.20;
    int searchTimeoutMs = 5000;

    // Cache
    bool enableCache = true;
    int cacheTtlSeconds = 3600;
    int maxCacheSize = 1000;
};

} // namespace dr
