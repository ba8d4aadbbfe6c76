#include "core/retrieval/retrieval_engine.h"
#include "core/cache/cache_keys.h"
#include "core/cache/cache_service.h"
#include "core/embedding/embedding_manager.h"
#include "core/embedding/embedding_provider.h"
#include "core/hashing/content_hasher.h"
#include "core/shared/logging.h"
#include "core/vector/vector_math.h"

#include <QElapsedTimer>
#include <QJsonArray>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <algorithm>
#include <cstdint>

namespace dr {

namespace {

constexpr int kPreviewChars = 300;

const QSet<QString>& smallTalk()
{
    static const QSet<QString> phrases = {
        // Greetings
        QStringLiteral("hola"), QStringLiteral("hla"), QStringLiteral("ola"),
        QStringLiteral("hi"), QStringLiteral("hey"), QStringLiteral("hello"),
        QStringLiteral("good morning"), QStringLiteral("good afternoon"),
        QStringLiteral("good evening"),
        QStringLiteral("buenos días"), QStringLiteral("buenos dias"),
        QStringLiteral("buen dia"), QStringLiteral("buen día"),
        QStringLiteral("buenas tardes"), QStringLiteral("buenas noches"),
        QStringLiteral("buenas"), QStringLiteral("saludos"),
        QStringLiteral("how are you"), QStringLiteral("what's up"),
        QStringLiteral("como estás"), QStringLiteral("cómo estás"),
        QStringLiteral("como estas"), QStringLiteral("qué tal"), QStringLiteral("que tal"),
        QStringLiteral("todo bien"), QStringLiteral("bien y tú"), QStringLiteral("bien y tu"),
        // Thanks
        QStringLiteral("thanks"), QStringLiteral("thank you"), QStringLiteral("thx"),
        QStringLiteral("gracias"), QStringLiteral("gracia"), QStringLiteral("grcias"),
        QStringLiteral("muchas gracias"), QStringLiteral("te agradezco"),
        QStringLiteral("great"), QStringLiteral("perfect"),
        QStringLiteral("genial"), QStringLiteral("perfecto"), QStringLiteral("excelente"),
        // Farewells
        QStringLiteral("bye"), QStringLiteral("goodbye"), QStringLiteral("see you"),
        QStringLiteral("adios"), QStringLiteral("adiós"), QStringLiteral("chao"),
        QStringLiteral("chau"), QStringLiteral("hasta luego"), QStringLiteral("hasta pronto"),
        QStringLiteral("nos vemos"), QStringLiteral("cuídate"),
        // Acknowledgements
        QStringLiteral("ok"), QStringLiteral("okey"), QStringLiteral("okay"),
        QStringLiteral("vale"), QStringLiteral("yes"), QStringLiteral("no"),
        QStringLiteral("sí"), QStringLiteral("si"), QStringLiteral("entendido"),
        QStringLiteral("de acuerdo"), QStringLiteral("claro"), QStringLiteral("listo"),
        // Meta questions
        QStringLiteral("help"), QStringLiteral("ayuda"), QStringLiteral("who are you"),
        QStringLiteral("quien eres"), QStringLiteral("quién eres"),
        QStringLiteral("como te llamas"), QStringLiteral("cómo te llamas"),
        QStringLiteral("qué puedes hacer"), QStringLiteral("que puedes hacer"),
    };
    return phrases;
}

double elapsedMs(const QElapsedTimer& timer)
{
    return static_cast<double>(timer.nsecsElapsed()) / 1.0e6;
}

QString previewOf(const QString& text)
{
    if (text.size() <= kPreviewChars) {
        return text;
    }
    return text.left(kPreviewChars) + QStringLiteral("...");
}

} // anonymous namespace

// ── RetrievalTrace ──────────────────────────────────────────

QJsonObject RetrievalTrace::toJson() const
{
    QJsonArray items;
    for (const ScoredChunk& item : retrieved) {
        const ChunkMetadata& meta = item.chunk.metadata;
        QJsonObject entry;
        entry[QStringLiteral("score")] = item.score;
        entry[QStringLiteral("source")] = meta.source;
        entry[QStringLiteral("file_path")] = meta.filePath;
        entry[QStringLiteral("content_hash")] = meta.contentHash;
        entry[QStringLiteral("chunk_type")] = chunkTypeToString(meta.chunkType);
        entry[QStringLiteral("word_count")] = meta.wordCount;
        entry[QStringLiteral("page_number")] = meta.pageNumber
            ? QJsonValue(*meta.pageNumber) : QJsonValue(QJsonValue::Null);
        entry[QStringLiteral("preview")] = previewOf(item.chunk.text);
        items.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("query")] = query;
    json[QStringLiteral("k")] = k;
    json[QStringLiteral("retrieved")] = items;
    if (context) {
        json[QStringLiteral("context")] = *context;
    }
    json[QStringLiteral("timings")] = timings;
    return json;
}

// ── RetrievalEngine ─────────────────────────────────────────

RetrievalEngine::RetrievalEngine(VectorIndexAdapter& index, EmbeddingManager& embeddings,
                                 CacheService* cache, RetrievalConfig config)
    : m_index(index)
    , m_embeddings(embeddings)
    , m_cache(cache)
    , m_config(config)
    , m_centroid(index, cache, [&]() {
        CentroidConfig centroid = config.centroid;
        centroid.dimensions = embeddings.dimensions();
        return centroid;
    }())
{
}

std::vector<ScoredChunk> RetrievalEngine::retrieve(const QString& query, int k,
                                                   const MetadataFilter& filter,
                                                   RetrievalOptions options)
{
    return run(query, k, filter, options, nullptr);
}

RetrievalTrace RetrievalEngine::retrieveWithTrace(const QString& query, int k,
                                                  const MetadataFilter& filter,
                                                  bool includeContext)
{
    RetrievalTrace trace;
    trace.query = query;
    trace.k = k;
    trace.retrieved = run(query, k, filter, RetrievalOptions{}, &trace.timings);
    if (includeContext) {
        trace.context = formatContext(trace.retrieved);
    }
    return trace;
}

QString RetrievalEngine::noResultsMessage()
{
    return QStringLiteral("No relevant information was found for this question.");
}

QString RetrievalEngine::formatContext(const std::vector<ScoredChunk>& chunks)
{
    if (chunks.empty()) {
        return noResultsMessage();
    }

    static const ChunkType order[] = {
        ChunkType::Header,
        ChunkType::Paragraph,
        ChunkType::NumberedList,
        ChunkType::BulletList,
        ChunkType::Text,
    };

    QStringList sections;
    sections.append(QStringLiteral("Relevant information found:"));
    for (ChunkType type : order) {
        for (const ScoredChunk& item : chunks) {
            if (item.chunk.metadata.chunkType != type) {
                continue;
            }
            const QString text = item.chunk.text.trimmed();
            if (!text.isEmpty()) {
                sections.append(text);
            }
        }
    }
    return sections.join(QStringLiteral("\n\n"));
}

bool RetrievalEngine::shouldUseRag(const QString& query)
{
    if (isTrivialQuery(query, m_config.minQueryLength)) {
        LOG_DEBUG(drRetrieval, "Gate closed: trivial query");
        return false;
    }

    CentroidTracker::Snapshot centroid = m_centroid.current();
    if (!centroid) {
        LOG_DEBUG(drRetrieval, "Gate closed: no centroid");
        return false;
    }

    std::optional<std::vector<float>> queryVector = embedQuery(query);
    if (!queryVector || queryVector->size() != centroid->size()) {
        LOG_DEBUG(drRetrieval, "Gate closed: query embedding unavailable");
        return false;
    }

    const double similarity = cosineSimilarity(*queryVector, *centroid);
    const bool open = similarity > m_config.gatingThreshold;
    LOG_DEBUG(drRetrieval, "Gate %s: similarity %.3f (threshold %.2f)",
              open ? "open" : "closed", similarity, m_config.gatingThreshold);
    return open;
}

bool RetrievalEngine::isTrivialQuery(const QString& query, int minLength)
{
    static const QRegularExpression edgePunctuation(
        QStringLiteral("^[\\s\\p{P}]+|[\\s\\p{P}]+$"));

    const QString trimmed = query.trimmed();
    if (trimmed.size() < minLength) {
        return true;
    }

    QString normalized = trimmed.toLower();
    normalized.remove(edgePunctuation);
    return smallTalk().contains(normalized.simplified());
}

QString RetrievalEngine::cacheKey(const QString& query, int k, const MetadataFilter& filter,
                                  const RetrievalOptions& options)
{
    return QStringLiteral("%1%2:sr=%3:mmr=%4:%5:%6")
        .arg(QLatin1String(cache_keys::kRetrievalPrefix),
             ContentHasher::normalizeText(query),
             options.useSemanticRanking ? QStringLiteral("1") : QStringLiteral("0"),
             options.useMmr ? QStringLiteral("1") : QStringLiteral("0"),
             QString::number(k),
             filterFingerprint(filter));
}

void RetrievalEngine::invalidate()
{
    if (m_cache) {
        m_cache->invalidatePrefix(QLatin1String(cache_keys::kRetrievalPrefix));
    }
    m_centroid.invalidate();
}

bool RetrievalEngine::warmup()
{
    QElapsedTimer timer;
    timer.start();
    const bool ready = m_centroid.current() != nullptr;
    LOG_INFO(drRetrieval, "Warmup %s in %lld ms", ready ? "complete" : "found no vectors",
             static_cast<long long>(timer.elapsed()));
    return ready;
}

// ── Private ─────────────────────────────────────────────────

std::vector<ScoredChunk> RetrievalEngine::run(const QString& query, int k,
                                              const MetadataFilter& filter,
                                              const RetrievalOptions& options,
                                              QJsonObject* timings)
{
    QElapsedTimer total;
    total.start();

    auto stage = [&](const char* name, double ms) {
        m_metrics.record(QLatin1String(name), ms);
        if (timings) {
            const QString key = QLatin1String(name);
            (*timings)[key] = (*timings)[key].toDouble() + ms;
        }
    };
    auto finish = [&](std::vector<ScoredChunk> results) {
        stage("total_time", elapsedMs(total));
        return results;
    };

    if (isTrivialQuery(query, m_config.minQueryLength)) {
        LOG_DEBUG(drRetrieval, "Trivial query skipped: %s", qUtf8Printable(logPreview(query)));
        return finish({});
    }

    k = std::max(1, k);
    const bool useCache = m_config.cacheEnabled && m_cache != nullptr;
    const QString key = useCache ? cacheKey(query, k, filter, options) : QString();

    if (useCache) {
        QElapsedTimer timer;
        timer.start();
        std::optional<std::vector<ScoredChunk>> cached = cachedResults(key);
        stage("cache_operations", elapsedMs(timer));
        if (cached) {
            LOG_DEBUG(drRetrieval, "Cache hit for %s", qUtf8Printable(logPreview(query)));
            return finish(std::move(*cached));
        }
    }

    QElapsedTimer timer;
    timer.start();
    std::optional<std::vector<float>> queryVector = embedQuery(query);
    stage("query_processing", elapsedMs(timer));
    if (!queryVector) {
        LOG_WARN(drRetrieval, "Query embedding unavailable, returning no results");
        return finish({});
    }

    const int64_t wanted = int64_t{k} * std::max(1, m_config.kMultiplier);
    const int candidateCount =
        static_cast<int>(std::min<int64_t>(wanted, std::max(1, m_config.candidateCap)));

    timer.restart();
    SearchOutcome outcome = m_index.search(*queryVector, candidateCount, filter,
                                           m_config.searchTimeout);
    stage("vector_retrieval", elapsedMs(timer));
    if (!outcome.ok()) {
        LOG_WARN(drRetrieval, "Vector search %s: %s",
                 outcome.status == SearchOutcome::Status::Timeout ? "timed out" : "failed",
                 qUtf8Printable(outcome.error));
        return finish({});
    }

    std::vector<ScoredChunk> candidates;
    candidates.reserve(outcome.results.size());
    for (ScoredChunk& item : outcome.results) {
        if (item.score >= m_config.similarityThreshold) {
            candidates.push_back(std::move(item));
        }
    }

    std::vector<ScoredChunk> results;
    if (candidates.size() <= static_cast<size_t>(k)) {
        results = std::move(candidates);
    } else if (options.useSemanticRanking) {
        timer.restart();
        fillMissingEmbeddings(candidates);
        results = Reranker::semanticRerank(*queryVector, std::move(candidates), k,
                                           m_config.weights);
        stage("semantic_reranking", elapsedMs(timer));
    } else if (options.useMmr) {
        timer.restart();
        results = Reranker::maximalMarginalRelevance(*queryVector, candidates, k,
                                                     m_config.mmrLambda);
        stage("mmr_application", elapsedMs(timer));
    } else {
        candidates.resize(static_cast<size_t>(k));
        results = std::move(candidates);
    }

    stripEmbeddings(results);

    if (useCache && !results.empty()) {
        timer.restart();
        storeResults(key, results);
        stage("cache_operations", elapsedMs(timer));
    }

    LOG_DEBUG(drRetrieval, "Retrieved %d chunks for %s", static_cast<int>(results.size()),
              qUtf8Printable(logPreview(query)));
    return finish(std::move(results));
}

std::optional<std::vector<float>> RetrievalEngine::embedQuery(const QString& query)
{
    std::vector<float> vector;
    try {
        vector = m_embeddings.embedQuery(query);
    } catch (const EmbeddingProviderError& e) {
        LOG_WARN(drRetrieval, "Query embedding failed: %s", e.what());
        return std::nullopt;
    }

    if (vector.empty() || isZeroVector(vector)) {
        return std::nullopt;
    }
    return vector;
}

void RetrievalEngine::fillMissingEmbeddings(std::vector<ScoredChunk>& candidates)
{
    const int dimensions = m_embeddings.dimensions();
    std::vector<size_t> missing;
    std::vector<QString> texts;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!isValidVector(candidates[i].chunk.metadata.embedding, dimensions)) {
            missing.push_back(i);
            texts.push_back(candidates[i].chunk.text);
        }
    }
    if (missing.empty()) {
        return;
    }

    std::vector<std::vector<float>> vectors;
    try {
        vectors = m_embeddings.embedBatch(texts);
    } catch (const EmbeddingProviderError& e) {
        LOG_WARN(drRetrieval, "Could not embed %d candidates for reranking: %s",
                 static_cast<int>(missing.size()), e.what());
        return;
    }

    for (size_t i = 0; i < missing.size() && i < vectors.size(); ++i) {
        candidates[missing[i]].chunk.metadata.embedding = std::move(vectors[i]);
    }
}

std::optional<std::vector<ScoredChunk>> RetrievalEngine::cachedResults(const QString& key)
{
    CacheResult<QJsonValue> cached = m_cache->get(key);
    if (!cached.ok() || !cached.value->isArray()) {
        return std::nullopt;
    }

    std::vector<ScoredChunk> results;
    for (const QJsonValue& entry : cached.value->toArray()) {
        QString error;
        std::optional<ScoredChunk> item = scoredChunkFromJson(entry.toObject(), &error);
        if (!item) {
            LOG_WARN(drRetrieval, "Discarding malformed cached result: %s",
                     qUtf8Printable(error));
            return std::nullopt;
        }
        results.push_back(std::move(*item));
    }
    return results;
}

void RetrievalEngine::storeResults(const QString& key, const std::vector<ScoredChunk>& results)
{
    QJsonArray entries;
    for (const ScoredChunk& item : results) {
        entries.append(scoredChunkToJson(item, false));
    }
    m_cache->set(key, entries, m_config.cacheTtlSeconds);
}

void RetrievalEngine::stripEmbeddings(std::vector<ScoredChunk>& results)
{
    for (ScoredChunk& item : results) {
        item.chunk.metadata.embedding.clear();
        item.chunk.metadata.embedding.shrink_to_fit();
    }
}

} // namespace dr
