#include "core/retrieval/performance_metrics.h"

#include <algorithm>
#include <numeric>
#include <vector>

namespace dr {

void PerformanceMetrics::record(const QString& operation, double elapsedMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::deque<double>& samples = m_samples[operation];
    samples.push_back(elapsedMs);
    while (static_cast<int>(samples.size()) > kMaxSamples) {
        samples.pop_front();
    }
}

PerformanceMetrics::Summary PerformanceMetrics::summarize(const std::deque<double>& samples)
{
    Summary summary;
    summary.count = static_cast<int>(samples.size());
    if (samples.empty()) {
        return summary;
    }

    std::vector<double> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());
    summary.minMs = sorted.front();
    summary.maxMs = sorted.back();
    summary.avgMs = std::accumulate(sorted.begin(), sorted.end(), 0.0)
        / static_cast<double>(sorted.size());
    const size_t mid = sorted.size() / 2;
    summary.medianMs = sorted.size() % 2 == 0
        ? (sorted[mid - 1] + sorted[mid]) / 2.0
        : sorted[mid];
    return summary;
}

std::optional<PerformanceMetrics::Summary> PerformanceMetrics::summary(
    const QString& operation) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_samples.find(operation);
    if (it == m_samples.end() || it->second.empty()) {
        return std::nullopt;
    }
    return summarize(it->second);
}

QJsonObject PerformanceMetrics::toJson() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QJsonObject json;
    for (const auto& [operation, samples] : m_samples) {
        if (samples.empty()) {
            continue;
        }
        const Summary s = summarize(samples);
        QJsonObject entry;
        entry.insert(QStringLiteral("count"), s.count);
        entry.insert(QStringLiteral("min_ms"), s.minMs);
        entry.insert(QStringLiteral("max_ms"), s.maxMs);
        entry.insert(QStringLiteral("avg_ms"), s.avgMs);
        entry.insert(QStringLiteral("median_ms"), s.medianMs);
        json.insert(operation, entry);
    }
    return json;
}

void PerformanceMetrics::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.clear();
}

} // namespace dr
