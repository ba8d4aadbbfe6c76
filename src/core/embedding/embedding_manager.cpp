#include "core/embedding/embedding_manager.h"
#include "core/cache/cache_keys.h"
#include "core/cache/cache_service.h"
#include "core/embedding/embedding_provider.h"
#include "core/hashing/content_hasher.h"
#include "core/shared/logging.h"
#include "core/vector/vector_math.h"

#include <QHash>
#include <QJsonArray>

#include <algorithm>
#include <chrono>
#include <thread>

namespace dr {

namespace {

constexpr int kDefaultDimensions = 1536;

QJsonArray vectorToJson(const std::vector<float>& vector)
{
    QJsonArray values;
    for (const float v : vector) {
        values.append(static_cast<double>(v));
    }
    return values;
}

std::vector<float> vectorFromJson(const QJsonValue& value)
{
    std::vector<float> vector;
    if (!value.isArray()) {
        return vector;
    }
    const QJsonArray values = value.toArray();
    vector.reserve(static_cast<size_t>(values.size()));
    for (const QJsonValue& v : values) {
        if (!v.isDouble()) {
            return {};
        }
        vector.push_back(static_cast<float>(v.toDouble()));
    }
    return vector;
}

} // namespace

// ── Circuit breaker ─────────────────────────────────────────

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open: check if enough time has elapsed for half-open
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    const int64_t lastFail = lastFailureTime.load();
    if (now - lastFail >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    lastFailureTime.store(now);
}

int RetryPolicy::delayAfterAttempt(int attempt) const
{
    const int exponent = std::clamp(attempt - 1, 0, 20);
    const int64_t delay = static_cast<int64_t>(baseDelayMs) << exponent;
    return static_cast<int>(std::min<int64_t>(delay, maxDelayMs));
}

// ── Construction ────────────────────────────────────────────

EmbeddingManager::EmbeddingManager(EmbeddingProvider* provider, CacheService* cache,
                                   Config config)
    : m_provider(provider)
    , m_cache(cache)
    , m_config(config)
    , m_sleep([](int delayMs) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    })
{
    if (m_config.dimensions <= 0) {
        LOG_WARN(drEmbedding, "Invalid embedding dimension %d, using %d",
                 m_config.dimensions, kDefaultDimensions);
        m_config.dimensions = kDefaultDimensions;
    }
    if (m_config.batchSize <= 0) {
        m_config.batchSize = 32;
    }
    if (m_config.retry.maxAttempts <= 0) {
        m_config.retry.maxAttempts = 1;
    }
    if (!m_provider && !m_config.mockMode) {
        LOG_WARN(drEmbedding, "No embedding provider configured; embeddings will be zero vectors");
    }
}

EmbeddingManager::~EmbeddingManager() = default;

QString EmbeddingManager::modelId() const
{
    if (m_config.mockMode || !m_provider) {
        return QStringLiteral("mock");
    }
    return m_provider->modelId();
}

bool EmbeddingManager::isAvailable() const
{
    return !m_config.mockMode && m_provider != nullptr && !m_circuitBreaker.isOpen();
}

void EmbeddingManager::setSleepFunction(SleepFunction sleep)
{
    m_sleep = std::move(sleep);
}

QString EmbeddingManager::cacheKey(const QString& modelId, const QString& text)
{
    return QLatin1String(cache_keys::kEmbeddingPrefix) + modelId + QLatin1Char(':')
        + ContentHasher::hashNormalizedText(text);
}

EmbeddingManager::Stats EmbeddingManager::stats() const
{
    return {m_providerCalls.load(), m_cacheHits.load(), m_cacheMisses.load(), m_fallbacks.load()};
}

std::vector<float> EmbeddingManager::zeroVector() const
{
    return std::vector<float>(static_cast<size_t>(m_config.dimensions), 0.0f);
}

// ── Public API ──────────────────────────────────────────────

std::vector<float> EmbeddingManager::embed(const QString& text)
{
    std::vector<std::vector<float>> result = embedBatch({text});
    if (result.empty()) {
        return zeroVector();
    }
    return std::move(result.front());
}

std::vector<float> EmbeddingManager::embedQuery(const QString& text)
{
    return embed(text);
}

std::vector<std::vector<float>> EmbeddingManager::embedBatch(const std::vector<QString>& texts)
{
    std::vector<std::vector<float>> results(texts.size());
    if (texts.empty()) {
        return results;
    }

    if (m_config.mockMode) {
        for (auto& vector : results) {
            vector = zeroVector();
        }
        return results;
    }

    const QString model = modelId();

    // Cache lookup; identical inputs share one provider slot.
    std::vector<QString> pendingTexts;
    std::vector<QString> pendingKeys;
    QHash<QString, std::vector<size_t>> pendingTargets;

    for (size_t i = 0; i < texts.size(); ++i) {
        const QString input = texts[i].trimmed().size() < kMinTextLength
            ? QString::fromLatin1(kPlaceholderText)
            : texts[i];
        const QString key = cacheKey(model, input);

        if (m_cache) {
            const CacheResult<QJsonValue> cached = m_cache->get(key);
            if (cached.ok()) {
                std::vector<float> vector = vectorFromJson(*cached.value);
                if (isValidVector(vector, m_config.dimensions)) {
                    results[i] = std::move(vector);
                    ++m_cacheHits;
                    continue;
                }
                LOG_DEBUG(drEmbedding, "Ignoring cached embedding with wrong shape: %s",
                          qUtf8Printable(key));
            }
            ++m_cacheMisses;
        }

        auto target = pendingTargets.find(key);
        if (target == pendingTargets.end()) {
            pendingTargets.insert(key, {i});
            pendingTexts.push_back(input);
            pendingKeys.push_back(key);
        } else {
            target->push_back(i);
        }
    }

    if (pendingTexts.empty()) {
        return results;
    }

    const int ttl = m_config.cacheTtlSeconds.value_or(
        m_cache ? m_cache->defaultTtlSeconds() : 0);
    const size_t batchSize = static_cast<size_t>(m_config.batchSize);

    for (size_t start = 0; start < pendingTexts.size(); start += batchSize) {
        const size_t end = std::min(start + batchSize, pendingTexts.size());
        const std::vector<QString> batch(pendingTexts.begin() + static_cast<std::ptrdiff_t>(start),
                                         pendingTexts.begin() + static_cast<std::ptrdiff_t>(end));

        std::optional<std::vector<std::vector<float>>> vectors;
        if (!m_provider) {
            LOG_DEBUG(drEmbedding, "No provider, %d texts fall back to zero vectors",
                      static_cast<int>(batch.size()));
        } else if (m_circuitBreaker.isOpen()) {
            LOG_WARN(drEmbedding, "Embedding circuit breaker is open, skipping %d texts",
                     static_cast<int>(batch.size()));
        } else {
            vectors = callWithRetry(batch);
        }

        for (size_t j = 0; j < batch.size(); ++j) {
            const QString& key = pendingKeys[start + j];
            std::vector<float> vector;
            if (vectors.has_value() && j < vectors->size()
                && isValidVector((*vectors)[j], m_config.dimensions)) {
                vector = l2Normalize(std::move((*vectors)[j]));
                if (m_cache) {
                    m_cache->set(key, vectorToJson(vector), ttl);
                }
            } else {
                if (vectors.has_value()) {
                    const size_t got = j < vectors->size() ? (*vectors)[j].size() : 0;
                    LOG_WARN(drEmbedding, "Malformed embedding (%d components, expected %d)",
                             static_cast<int>(got), m_config.dimensions);
                }
                vector = zeroVector();
                ++m_fallbacks;
            }

            for (const size_t index : pendingTargets.value(key)) {
                results[index] = vector;
            }
        }
    }

    return results;
}

// ── Private helpers ─────────────────────────────────────────

std::optional<std::vector<std::vector<float>>> EmbeddingManager::callWithRetry(
    const std::vector<QString>& batch)
{
    const RetryPolicy& retry = m_config.retry;

    for (int attempt = 1; attempt <= retry.maxAttempts; ++attempt) {
        try {
            ++m_providerCalls;
            std::vector<std::vector<float>> vectors = m_provider->embed(batch);
            m_circuitBreaker.recordSuccess();
            return vectors;
        } catch (const EmbeddingProviderError& e) {
            if (!e.isTransient()) {
                LOG_ERROR(drEmbedding, "Embedding provider rejected request: %s", e.what());
                throw;
            }
            LOG_WARN(drEmbedding, "Embedding attempt %d/%d failed: %s",
                     attempt, retry.maxAttempts, e.what());
            if (attempt < retry.maxAttempts) {
                m_sleep(retry.delayAfterAttempt(attempt));
            }
        }
    }

    m_circuitBreaker.recordFailure();
    LOG_ERROR(drEmbedding, "Embedding retries exhausted for %d texts, using zero vectors",
              static_cast<int>(batch.size()));
    return std::nullopt;
}

} // namespace dr
