#include "core/retrieval/centroid_tracker.h"
#include "core/cache/cache_keys.h"
#include "core/cache/cache_service.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index_adapter.h"
#include "core/vector/vector_math.h"

#include <QElapsedTimer>
#include <QJsonArray>

#include <optional>

namespace dr {

CentroidTracker::CentroidTracker(VectorIndexAdapter& index, CacheService* cache,
                                 CentroidConfig config)
    : m_index(index)
    , m_cache(cache)
    , m_config(config)
{
}

CentroidTracker::Snapshot CentroidTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_snapshot;
}

CentroidTracker::Snapshot CentroidTracker::current()
{
    Snapshot previous = snapshot();
    if (previous && !corpusChanged()) {
        return previous;
    }

    if (previous) {
        // Someone else is already recomputing; keep serving the old value.
        std::unique_lock<std::mutex> computeLock(m_computeMutex, std::try_to_lock);
        if (!computeLock.owns_lock()) {
            return previous;
        }
        return recompute(previous);
    }

    std::lock_guard<std::mutex> computeLock(m_computeMutex);
    // Published while we were waiting.
    Snapshot published = snapshot();
    if (published) {
        return published;
    }
    return recompute(nullptr);
}

void CentroidTracker::invalidate()
{
    m_generation.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        m_snapshot.reset();
        m_pointCount = -1;
    }
    if (m_cache) {
        m_cache->remove(QString::fromLatin1(cache_keys::kCentroid));
    }
    LOG_DEBUG(drRetrieval, "Centroid invalidated (generation %llu)",
              static_cast<unsigned long long>(m_generation.load()));
}

// ── Private ─────────────────────────────────────────────────

CentroidTracker::Snapshot CentroidTracker::recompute(const Snapshot& previous)
{
    const uint64_t generation = m_generation.load();

    if (!previous) {
        Snapshot cached = loadFromCache();
        if (cached) {
            publish(cached, m_index.count(), generation);
            return cached;
        }
    }

    int pointCount = 0;
    Snapshot centroid = scanIndex(&pointCount);
    if (!centroid) {
        // An emptied index must not keep serving the previous centroid.
        publish(nullptr, pointCount, generation);
        if (previous && m_generation.load() == generation && m_cache) {
            m_cache->remove(QString::fromLatin1(cache_keys::kCentroid));
        }
        return nullptr;
    }

    publish(centroid, pointCount, generation);
    if (m_generation.load() == generation && m_cache) {
        QJsonArray values;
        for (float v : *centroid) {
            values.append(static_cast<double>(v));
        }
        m_cache->set(QString::fromLatin1(cache_keys::kCentroid), values,
                     m_config.cacheTtlSeconds);
    }
    return centroid;
}

CentroidTracker::Snapshot CentroidTracker::loadFromCache()
{
    if (!m_cache) {
        return nullptr;
    }

    CacheResult<QJsonValue> cached = m_cache->get(QString::fromLatin1(cache_keys::kCentroid));
    if (!cached.ok() || !cached.value->isArray()) {
        return nullptr;
    }

    const QJsonArray values = cached.value->toArray();
    if (values.size() != m_config.dimensions) {
        LOG_INFO(drRetrieval, "Ignoring cached centroid with %d dimensions (expected %d)",
                 static_cast<int>(values.size()), m_config.dimensions);
        return nullptr;
    }

    std::vector<float> centroid;
    centroid.reserve(static_cast<size_t>(values.size()));
    for (const QJsonValue& v : values) {
        if (!v.isDouble()) {
            return nullptr;
        }
        centroid.push_back(static_cast<float>(v.toDouble()));
    }
    if (!isValidVector(centroid, m_config.dimensions) || isZeroVector(centroid)) {
        return nullptr;
    }

    LOG_DEBUG(drRetrieval, "Centroid loaded from cache");
    return std::make_shared<const std::vector<float>>(std::move(centroid));
}

CentroidTracker::Snapshot CentroidTracker::scanIndex(int* pointCount)
{
    QElapsedTimer timer;
    timer.start();
    m_computeCount.fetch_add(1);

    std::vector<double> sum(static_cast<size_t>(m_config.dimensions), 0.0);
    int used = 0;
    int scanned = 0;
    std::optional<int64_t> offset;

    do {
        ScrollPage page = m_index.scroll(m_config.pageSize, offset);
        for (const IndexedPoint& point : page.points) {
            ++scanned;
            if (!isValidVector(point.vector, m_config.dimensions) || isZeroVector(point.vector)) {
                continue;
            }
            const std::vector<float> unit = l2Normalize(point.vector);
            for (size_t i = 0; i < unit.size(); ++i) {
                sum[i] += unit[i];
            }
            ++used;
        }
        offset = page.nextOffset;
    } while (offset.has_value());

    *pointCount = scanned;
    if (used == 0) {
        LOG_INFO(drRetrieval, "No valid vectors available for the centroid");
        return nullptr;
    }

    std::vector<float> centroid(sum.size());
    for (size_t i = 0; i < sum.size(); ++i) {
        centroid[i] = static_cast<float>(sum[i] / used);
    }
    centroid = l2Normalize(std::move(centroid));
    if (isZeroVector(centroid)) {
        return nullptr;
    }

    LOG_INFO(drRetrieval, "Centroid computed from %d vectors in %lld ms",
             used, static_cast<long long>(timer.elapsed()));
    return std::make_shared<const std::vector<float>>(std::move(centroid));
}

bool CentroidTracker::corpusChanged()
{
    const auto now = std::chrono::steady_clock::now();
    int known = -1;
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        if (now - m_lastCountCheck < m_config.countCheckInterval) {
            return false;
        }
        m_lastCountCheck = now;
        known = m_pointCount;
    }

    const int count = m_index.count();
    if (count < 0) {
        return false;
    }
    if (count != known) {
        LOG_DEBUG(drRetrieval, "Point count changed (%d -> %d), centroid is stale", known, count);
        return true;
    }
    return false;
}

void CentroidTracker::publish(const Snapshot& centroid, int pointCount, uint64_t generation)
{
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    if (m_generation.load() != generation) {
        LOG_DEBUG(drRetrieval, "Discarding centroid computed before invalidation");
        return;
    }
    m_snapshot = centroid;
    m_pointCount = pointCount;
    m_lastCountCheck = std::chrono::steady_clock::now();
}

} // namespace dr
