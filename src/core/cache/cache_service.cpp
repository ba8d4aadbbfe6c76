#include "core/cache/cache_service.h"
#include "core/cache/memory_cache_backend.h"
#include "core/cache/sqlite_cache_backend.h"
#include "core/shared/logging.h"

#include <chrono>
#include <thread>

namespace dr {

namespace {

constexpr int kOpenAttempts = 3;
constexpr int kOpenBaseDelayMs = 500;

} // namespace

CacheService::CacheService(std::unique_ptr<CacheBackend> backend, CacheServiceConfig config)
    : m_backend(std::move(backend))
    , m_config(config)
{
}

CacheService::~CacheService() = default;

std::unique_ptr<CacheService> CacheService::create(const Settings& settings)
{
    CacheServiceConfig config;
    config.enabled = settings.enableCache;
    config.defaultTtlSeconds = settings.cacheTtlSeconds;

    MemoryCacheConfig memoryConfig;
    memoryConfig.maxEntries = settings.maxCacheSize;

    if (settings.cachePath.isEmpty()) {
        return std::make_unique<CacheService>(
            std::make_unique<MemoryCacheBackend>(memoryConfig), config);
    }

    SqliteCacheConfig sqliteConfig;
    sqliteConfig.maxEntries = settings.maxCacheSize;

    int delayMs = kOpenBaseDelayMs;
    for (int attempt = 1; attempt <= kOpenAttempts; ++attempt) {
        std::unique_ptr<SqliteCacheBackend> backend =
            SqliteCacheBackend::open(settings.cachePath, sqliteConfig);
        if (backend) {
            LOG_INFO(drCache, "Cache backend: sqlite (%s)", qUtf8Printable(settings.cachePath));
            return std::make_unique<CacheService>(std::move(backend), config);
        }
        LOG_WARN(drCache, "Cache open attempt %d/%d failed: %s",
                 attempt, kOpenAttempts, qUtf8Printable(settings.cachePath));
        if (attempt < kOpenAttempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
            delayMs *= 2;
        }
    }

    auto service = std::make_unique<CacheService>(
        std::make_unique<MemoryCacheBackend>(memoryConfig), config);
    service->markDegraded(QStringLiteral("sqlite cache unavailable, using memory"));
    return service;
}

template <typename T, typename Fn>
CacheResult<T> CacheService::guarded(const char* operation, const QString& key, Fn&& fn)
{
    CacheResult<T> result;
    if (!m_config.enabled) {
        result.status = CacheStatus::Miss;
        return result;
    }
    if (m_closed.load() || !m_backend) {
        result.status = CacheStatus::Unavailable;
        result.error = QStringLiteral("cache closed");
        return result;
    }

    try {
        result = fn();
    } catch (const CacheUnavailableError& e) {
        ++m_unavailable;
        result = {};
        result.status = CacheStatus::Unavailable;
        result.error = QString::fromUtf8(e.what());
        LOG_DEBUG(drCache, "Cache unavailable during %s(%s): %s",
                  operation, qUtf8Printable(key), e.what());
    } catch (const std::exception& e) {
        ++m_failures;
        result = {};
        result.status = CacheStatus::Failed;
        result.error = QString::fromUtf8(e.what());
        LOG_WARN(drCache, "Cache %s(%s) failed: %s",
                 operation, qUtf8Printable(key), e.what());
    }
    return result;
}

CacheResult<QJsonValue> CacheService::get(const QString& key)
{
    return guarded<QJsonValue>("get", key, [&]() {
        CacheResult<QJsonValue> result;
        result.value = m_backend->get(key);
        if (result.value.has_value()) {
            result.status = CacheStatus::Ok;
            ++m_hits;
        } else {
            result.status = CacheStatus::Miss;
            ++m_misses;
        }
        return result;
    });
}

CacheStatus CacheService::set(const QString& key, const QJsonValue& value,
                              std::optional<int> ttlSeconds)
{
    const int ttl = ttlSeconds.value_or(m_config.defaultTtlSeconds);
    return guarded<bool>("set", key, [&]() {
        m_backend->set(key, value, ttl);
        CacheResult<bool> result;
        result.status = CacheStatus::Ok;
        result.value = true;
        return result;
    }).status;
}

CacheStatus CacheService::remove(const QString& key)
{
    return guarded<bool>("remove", key, [&]() {
        CacheResult<bool> result;
        result.value = m_backend->remove(key);
        result.status = *result.value ? CacheStatus::Ok : CacheStatus::Miss;
        return result;
    }).status;
}

CacheResult<int> CacheService::invalidatePrefix(const QString& prefix)
{
    return guarded<int>("invalidatePrefix", prefix, [&]() {
        CacheResult<int> result;
        result.value = m_backend->invalidatePrefix(prefix);
        result.status = CacheStatus::Ok;
        LOG_DEBUG(drCache, "Invalidated %d entries with prefix %s",
                  *result.value, qUtf8Printable(prefix));
        return result;
    });
}

CacheService::Health CacheService::health() const
{
    Health health;
    health.backend = m_backend ? m_backend->name() : QStringLiteral("none");
    health.degraded = m_degraded;
    health.message = m_degradedReason;

    if (!m_config.enabled) {
        health.message = QStringLiteral("cache disabled");
        return health;
    }
    if (m_closed.load() || !m_backend) {
        health.message = QStringLiteral("cache closed");
        return health;
    }

    try {
        health.entries = m_backend->size();
        health.available = true;
    } catch (const CacheUnavailableError& e) {
        health.message = QString::fromUtf8(e.what());
    } catch (const std::exception& e) {
        LOG_WARN(drCache, "Cache health probe failed: %s", e.what());
        health.message = QString::fromUtf8(e.what());
    }
    return health;
}

CacheService::Stats CacheService::stats() const
{
    return {m_hits.load(), m_misses.load(), m_unavailable.load(), m_failures.load()};
}

void CacheService::markDegraded(const QString& reason)
{
    m_degraded = true;
    m_degradedReason = reason;
    LOG_WARN(drCache, "Cache degraded: %s", qUtf8Printable(reason));
}

void CacheService::close()
{
    if (!m_closed.exchange(true)) {
        LOG_DEBUG(drCache, "Cache service closed");
    }
}

} // namespace dr
