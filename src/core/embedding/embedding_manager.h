#pragma once

#include <QString>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace dr {

class CacheService;
class EmbeddingProvider;

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 exhausted batches
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct RetryPolicy {
    int maxAttempts = 3;
    int baseDelayMs = 1000;
    int maxDelayMs = 8000;

    // Wait after the given failed attempt (1-based): base * 2^(attempt-1), capped.
    int delayAfterAttempt(int attempt) const;
};

struct EmbeddingManagerConfig {
    int dimensions = 1536;
    int batchSize = 32;
    RetryPolicy retry;
    bool mockMode = false;
    std::optional<int> cacheTtlSeconds;  // defaults to the cache service TTL
};

// EmbeddingManager: produces fixed-dimension vectors for chunk and query text.
//
// Every returned vector has exactly dimensions() components: provider output
// that is missing, malformed or lost to exhausted retries becomes a zero
// vector. Valid vectors are L2-normalized and cached under
// cacheKey(modelId, text). Permanent provider errors are rethrown as
// EmbeddingProviderError without retry.
class EmbeddingManager {
public:
    using Config = EmbeddingManagerConfig;
    using SleepFunction = std::function<void(int delayMs)>;

    static constexpr const char* kPlaceholderText = "placeholder_text";
    static constexpr int kMinTextLength = 3;

    // provider may be null in mock mode. cache may be null.
    EmbeddingManager(EmbeddingProvider* provider, CacheService* cache, Config config = {});
    ~EmbeddingManager();

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;
    EmbeddingManager(EmbeddingManager&&) = delete;
    EmbeddingManager& operator=(EmbeddingManager&&) = delete;

    int dimensions() const { return m_config.dimensions; }
    QString modelId() const;
    bool isMockMode() const { return m_config.mockMode; }
    bool isAvailable() const;

    std::vector<float> embed(const QString& text);
    std::vector<float> embedQuery(const QString& text);
    std::vector<std::vector<float>> embedBatch(const std::vector<QString>& texts);

    static QString cacheKey(const QString& modelId, const QString& text);

    // Replaces the blocking sleep between retries (tests record delays).
    void setSleepFunction(SleepFunction sleep);

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

    struct Stats {
        uint64_t providerCalls = 0;
        uint64_t cacheHits = 0;
        uint64_t cacheMisses = 0;
        uint64_t fallbacks = 0;
    };
    Stats stats() const;

private:
    // nullopt when transient failures exhausted every attempt.
    std::optional<std::vector<std::vector<float>>> callWithRetry(const std::vector<QString>& batch);
    std::vector<float> zeroVector() const;

    EmbeddingProvider* m_provider = nullptr;
    CacheService* m_cache = nullptr;
    Config m_config;
    SleepFunction m_sleep;
    EmbeddingCircuitBreaker m_circuitBreaker;

    std::atomic<uint64_t> m_providerCalls{0};
    std::atomic<uint64_t> m_cacheHits{0};
    std::atomic<uint64_t> m_cacheMisses{0};
    std::atomic<uint64_t> m_fallbacks{0};
};

} // namespace dr
