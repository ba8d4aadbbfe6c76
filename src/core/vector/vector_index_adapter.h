#pragma once

#include "core/shared/chunk.h"

#include <QJsonObject>
#include <QString>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace dr {

// Equality filter on payload fields, e.g. {"source": "manual.pdf"}.
// QJsonObject keeps keys sorted, so equal filters serialize identically.
using MetadataFilter = QJsonObject;

QString filterFingerprint(const MetadataFilter& filter);

// Payload field names usable in a filter: [A-Za-z0-9_]+
bool isValidFilterKey(const QString& key);

struct IndexedPoint {
    int64_t id = 0;
    Chunk chunk;
    std::vector<float> vector;
};

struct ScrollPage {
    std::vector<IndexedPoint> points;
    std::optional<int64_t> nextOffset;  // nullopt when the scan is complete
};

struct SearchOutcome {
    enum class Status {
        Ok,
        Timeout,
        Failed,
    };

    Status status = Status::Ok;
    std::vector<ScoredChunk> results;  // best first
    QString error;

    bool ok() const { return status == Status::Ok; }
};

// VectorIndexAdapter: capability interface over the vector index engine.
//
// Results carry the stored chunk text and metadata (embedding included).
// Failures are reported through return values and logged; implementations
// do not throw.
class VectorIndexAdapter {
public:
    virtual ~VectorIndexAdapter() = default;

    // chunks and embeddings must have the same length.
    virtual bool add(const std::vector<Chunk>& chunks,
                     const std::vector<std::vector<float>>& embeddings) = 0;

    virtual SearchOutcome search(const std::vector<float>& queryEmbedding, int k,
                                 const MetadataFilter& filter,
                                 std::chrono::milliseconds timeout) = 0;

    // Returns the number of removed points, or -1 on failure.
    virtual int remove(const MetadataFilter& filter) = 0;

    // Returns the number of matching points, or -1 on failure.
    virtual int count(const MetadataFilter& filter = {}) = 0;

    // Pages through every point in id order. Start with offset = nullopt.
    virtual ScrollPage scroll(int limit, std::optional<int64_t> offset) = 0;

    virtual bool clear() = 0;
};

} // namespace dr
