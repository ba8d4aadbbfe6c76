#pragma once

#include <QString>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace dr {

class CacheService;
class VectorIndexAdapter;

struct CentroidConfig {
    int dimensions = 1536;
    int pageSize = 1000;
    std::chrono::milliseconds countCheckInterval{10000};
    int cacheTtlSeconds = 3600;
};

// CentroidTracker: mean direction of every indexed vector, used for gating.
//
// Readers get the last published snapshot. At most one recompute runs at a
// time; callers that already hold a snapshot never wait for it. A recompute
// started before invalidate() is discarded instead of published.
class CentroidTracker {
public:
    using Snapshot = std::shared_ptr<const std::vector<float>>;

    CentroidTracker(VectorIndexAdapter& index, CacheService* cache, CentroidConfig config = {});

    // Returns the current centroid, loading or computing it when missing or
    // when the point count changed. nullptr when the index has no vectors.
    Snapshot current();

    // Last published value; never triggers a computation.
    Snapshot snapshot() const;

    void invalidate();

    uint64_t generation() const { return m_generation.load(); }
    uint64_t computeCount() const { return m_computeCount.load(); }

private:
    Snapshot recompute(const Snapshot& previous);
    Snapshot loadFromCache();
    Snapshot scanIndex(int* pointCount);
    bool corpusChanged();
    void publish(const Snapshot& centroid, int pointCount, uint64_t generation);

    VectorIndexAdapter& m_index;
    CacheService* m_cache = nullptr;
    CentroidConfig m_config;

    mutable std::mutex m_snapshotMutex;
    Snapshot m_snapshot;
    int m_pointCount = -1;
    std::chrono::steady_clock::time_point m_lastCountCheck;

    std::mutex m_computeMutex;
    std::atomic<uint64_t> m_generation{0};
    std::atomic<uint64_t> m_computeCount{0};
};

} // namespace dr
