#include "core/cache/memory_cache_backend.h"

namespace dr {

MemoryCacheBackend::MemoryCacheBackend(MemoryCacheConfig config)
    : m_config(config)
{
    if (m_config.maxEntries < 1) {
        m_config.maxEntries = 1;
    }
}

std::optional<QJsonValue> MemoryCacheBackend::get(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(key);
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    const auto& expiresAt = it->second->expiresAt;
    if (expiresAt.has_value() && Clock::now() >= *expiresAt) {
        // Expired, remove lazily
        m_list.erase(it->second);
        m_index.erase(it);
        ++m_expirations;
        ++m_misses;
        return std::nullopt;
    }

    ++m_hits;
    return it->second->value;
}

void MemoryCacheBackend::set(const QString& key, const QJsonValue& value, int ttlSeconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // Last writer wins; the entry moves to the newest position
    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    // Evict oldest entries if at capacity
    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        const auto& back = m_list.back();
        m_index.erase(back.key);
        m_list.pop_back();
        ++m_evictions;
    }

    const auto now = Clock::now();
    Entry entry{key, value, now, std::nullopt};
    if (ttlSeconds > 0) {
        entry.expiresAt = now + std::chrono::seconds(ttlSeconds);
    }
    m_list.push_front(std::move(entry));
    m_index[key] = m_list.begin();
}

bool MemoryCacheBackend::remove(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return false;
    }
    m_list.erase(it->second);
    m_index.erase(it);
    return true;
}

int MemoryCacheBackend::invalidatePrefix(const QString& prefix)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    int removed = 0;
    for (auto it = m_list.begin(); it != m_list.end();) {
        if (it->key.startsWith(prefix)) {
            m_index.erase(it->key);
            it = m_list.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

int MemoryCacheBackend::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_list.size());
}

void MemoryCacheBackend::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

MemoryCacheBackend::Stats MemoryCacheBackend::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, m_expirations, static_cast<int>(m_list.size())};
}

} // namespace dr
