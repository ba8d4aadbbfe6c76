#include "core/retrieval/reranker.h"
#include "core/vector/vector_math.h"

#include <algorithm>
#include <limits>

namespace dr {

double Reranker::contentTypeScore(ChunkType type)
{
    switch (type) {
    case ChunkType::Header:       return 1.0;
    case ChunkType::Paragraph:    return 0.8;
    case ChunkType::Text:         return 0.75;
    case ChunkType::NumberedList: return 0.7;
    case ChunkType::BulletList:   return 0.7;
    }
    return 0.6;
}

double Reranker::lengthScore(int wordCount)
{
    return std::min(static_cast<double>(std::max(wordCount, 0)) / 100.0, 1.0);
}

bool Reranker::isPdfSource(const QString& source)
{
    return source.endsWith(QLatin1String(".pdf"), Qt::CaseInsensitive);
}

double Reranker::semanticScore(const std::vector<float>& queryEmbedding,
                               const ScoredChunk& candidate,
                               const RerankWeights& weights)
{
    const ChunkMetadata& meta = candidate.chunk.metadata;
    const double similarity = cosineSimilarity(queryEmbedding, meta.embedding);

    double score = weights.semantic * similarity
        + weights.quality * meta.qualityScore
        + weights.length * lengthScore(meta.wordCount)
        + weights.contentType * contentTypeScore(meta.chunkType);

    if (isPdfSource(meta.source)) {
        score *= weights.pdfBoost;
    }
    return score;
}

std::vector<ScoredChunk> Reranker::semanticRerank(const std::vector<float>& queryEmbedding,
                                                  std::vector<ScoredChunk> candidates,
                                                  int k,
                                                  const RerankWeights& weights)
{
    for (ScoredChunk& candidate : candidates) {
        candidate.score = semanticScore(queryEmbedding, candidate, weights);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ScoredChunk& a, const ScoredChunk& b) {
                         return a.score > b.score;
                     });

    if (k >= 0 && candidates.size() > static_cast<size_t>(k)) {
        candidates.resize(static_cast<size_t>(k));
    }
    return candidates;
}

std::vector<ScoredChunk> Reranker::maximalMarginalRelevance(
    const std::vector<float>& queryEmbedding,
    const std::vector<ScoredChunk>& candidates,
    int k,
    double lambda)
{
    if (k <= 0 || candidates.empty()) {
        return {};
    }

    auto firstK = [&]() {
        const size_t n = std::min(candidates.size(), static_cast<size_t>(k));
        return std::vector<ScoredChunk>(candidates.begin(),
                                        candidates.begin() + static_cast<std::ptrdiff_t>(n));
    };

    if (queryEmbedding.empty() || isZeroVector(queryEmbedding)) {
        return firstK();
    }

    std::vector<size_t> pool;
    std::vector<std::vector<float>> normalized(candidates.size());
    std::vector<double> relevance(candidates.size(), 0.0);
    const std::vector<float> query = l2Normalize(queryEmbedding);

    for (size_t i = 0; i < candidates.size(); ++i) {
        const std::vector<float>& embedding = candidates[i].chunk.metadata.embedding;
        if (embedding.size() != query.size() || isZeroVector(embedding)) {
            continue;
        }
        normalized[i] = l2Normalize(embedding);
        relevance[i] = dotProduct(query, normalized[i]);
        pool.push_back(i);
    }

    if (pool.empty()) {
        return firstK();
    }

    std::vector<size_t> selected;
    const size_t target = std::min(pool.size(), static_cast<size_t>(k));

    while (selected.size() < target) {
        double bestScore = -std::numeric_limits<double>::infinity();
        size_t bestPos = 0;

        for (size_t pos = 0; pos < pool.size(); ++pos) {
            const size_t idx = pool[pos];
            double maxSimilarity = 0.0;
            for (const size_t chosen : selected) {
                maxSimilarity = std::max(maxSimilarity,
                                         dotProduct(normalized[idx], normalized[chosen]));
            }
            const double score = lambda * relevance[idx] + (1.0 - lambda) * (1.0 - maxSimilarity);
            if (score > bestScore) {
                bestScore = score;
                bestPos = pos;
            }
        }

        selected.push_back(pool[bestPos]);
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(bestPos));
    }

    std::vector<ScoredChunk> result;
    result.reserve(selected.size());
    for (const size_t idx : selected) {
        result.push_back(candidates[idx]);
    }
    return result;
}

} // namespace dr
