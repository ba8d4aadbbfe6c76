#pragma once

#include "core/shared/chunk.h"

#include <vector>

namespace dr {

struct RerankWeights {
    double semantic = 0.50;
    double quality = 0.35;
    double length = 0.10;
    double contentType = 0.05;
    double pdfBoost = 1.5;   // multiplier for chunks whose source is a PDF
};

// Reranker: stateless ordering of vector-search candidates.
//
// semanticRerank: (semantic * cos(query, chunk) + quality * quality_score
//                  + length * min(words / 100, 1) + contentType * typeScore)
//                 * pdfBoost for PDF sources
//
// maximalMarginalRelevance: greedy selection of
//   lambda * cos(query, c) + (1 - lambda) * (1 - max cos(c, selected))
class Reranker {
public:
    static double contentTypeScore(ChunkType type);
    static double lengthScore(int wordCount);
    static bool isPdfSource(const QString& source);

    static double semanticScore(const std::vector<float>& queryEmbedding,
                                const ScoredChunk& candidate,
                                const RerankWeights& weights = {});

    // Candidates without an embedding get no semantic credit. Returns at most
    // k items with score replaced by the rerank score, best first.
    static std::vector<ScoredChunk> semanticRerank(const std::vector<float>& queryEmbedding,
                                                   std::vector<ScoredChunk> candidates,
                                                   int k,
                                                   const RerankWeights& weights = {});

    // Candidates without a usable embedding are skipped. If none has one, or
    // the query embedding is empty, the first k candidates are returned.
    // Ties go to the earlier candidate.
    static std::vector<ScoredChunk> maximalMarginalRelevance(
        const std::vector<float>& queryEmbedding,
        const std::vector<ScoredChunk>& candidates,
        int k,
        double lambda);
};

} // namespace dr
