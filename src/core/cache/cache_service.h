#pragma once

#include "core/cache/cache_backend.h"
#include "core/shared/settings.h"

#include <QJsonValue>
#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

namespace dr {

enum class CacheStatus {
    Ok,
    Miss,
    Unavailable,  // backend raised CacheUnavailableError, or cache disabled/closed
    Failed,       // any other backend error; logged as a warning
};

template <typename T>
struct CacheResult {
    CacheStatus status = CacheStatus::Miss;
    std::optional<T> value;
    QString error;

    bool ok() const { return status == CacheStatus::Ok && value.has_value(); }
};

struct CacheServiceConfig {
    bool enabled = true;
    int defaultTtlSeconds = 3600;
};

// CacheService: the process-wide cache handed to the embedding and
// retrieval components. Every call returns a typed result; backend errors
// never escape. Callers treat anything but Ok as "skip the optimization".
class CacheService {
public:
    CacheService(std::unique_ptr<CacheBackend> backend, CacheServiceConfig config = {});
    ~CacheService();

    CacheService(const CacheService&) = delete;
    CacheService& operator=(const CacheService&) = delete;

    // Builds the cache described by settings: SQLite when cachePath is set
    // (up to 3 open attempts, exponential backoff from 500 ms), memory
    // otherwise or when SQLite cannot be opened (health() reports degraded).
    static std::unique_ptr<CacheService> create(const Settings& settings);

    CacheResult<QJsonValue> get(const QString& key);
    CacheStatus set(const QString& key, const QJsonValue& value,
                    std::optional<int> ttlSeconds = std::nullopt);
    CacheStatus remove(const QString& key);
    CacheResult<int> invalidatePrefix(const QString& prefix);

    int defaultTtlSeconds() const { return m_config.defaultTtlSeconds; }
    bool isEnabled() const { return m_config.enabled; }

    struct Health {
        QString backend;
        bool available = false;
        bool degraded = false;
        int entries = 0;
        QString message;
    };
    Health health() const;

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t unavailable = 0;
        uint64_t failures = 0;
    };
    Stats stats() const;

    void markDegraded(const QString& reason);

    // Stops serving requests. Later calls report Unavailable.
    void close();

private:
    template <typename T, typename Fn>
    CacheResult<T> guarded(const char* operation, const QString& key, Fn&& fn);

    std::unique_ptr<CacheBackend> m_backend;
    CacheServiceConfig m_config;
    std::atomic<bool> m_closed{false};
    bool m_degraded = false;
    QString m_degradedReason;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_unavailable{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace dr
