#pragma once

#include "core/cache/cache_backend.h"

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <unordered_map>

namespace dr {

struct MemoryCacheConfig {
    int maxEntries = 1000;
};

// In-process cache. Entries are kept in insertion order; reads do not
// refresh an entry, so eviction always removes the oldest write.
class MemoryCacheBackend : public CacheBackend {
public:
    explicit MemoryCacheBackend(MemoryCacheConfig config = {});

    std::optional<QJsonValue> get(const QString& key) override;
    void set(const QString& key, const QJsonValue& value, int ttlSeconds) override;
    bool remove(const QString& key) override;
    int invalidatePrefix(const QString& prefix) override;
    int size() const override;
    QString name() const override { return QStringLiteral("memory"); }

    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        QString key;
        QJsonValue value;
        Clock::time_point insertedAt;
        std::optional<Clock::time_point> expiresAt;
    };

    MemoryCacheConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = newest

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
    uint64_t m_expirations = 0;
};

} // namespace dr
