#pragma once

#include <QJsonObject>
#include <QString>

#include <deque>
#include <map>
#include <mutex>
#include <optional>

namespace dr {

// Rolling latency samples (milliseconds) per named operation.
class PerformanceMetrics {
public:
    static constexpr int kMaxSamples = 1000;

    struct Summary {
        int count = 0;
        double minMs = 0.0;
        double maxMs = 0.0;
        double avgMs = 0.0;
        double medianMs = 0.0;
    };

    void record(const QString& operation, double elapsedMs);
    std::optional<Summary> summary(const QString& operation) const;

    // {"<operation>": {"count", "min_ms", "max_ms", "avg_ms", "median_ms"}, ...}
    QJsonObject toJson() const;
    void reset();

private:
    static Summary summarize(const std::deque<double>& samples);

    mutable std::mutex m_mutex;
    std::map<QString, std::deque<double>> m_samples;
};

} // namespace dr
