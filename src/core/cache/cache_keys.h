#pragma once

namespace dr::cache_keys {

// Everything under this prefix is derived from the index contents and is
// dropped whenever the index changes.
constexpr const char* kRetrievalPrefix = "rag:";
constexpr const char* kCentroid = "rag:centroid";

constexpr const char* kEmbeddingPrefix = "emb:";

} // namespace dr::cache_keys
