#include "core/ingestion/ingestion_pipeline.h"
#include "core/cache/cache_keys.h"
#include "core/cache/cache_service.h"
#include "core/embedding/embedding_manager.h"
#include "core/extraction/text_cleaner.h"
#include "core/hashing/content_hasher.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index_adapter.h"
#include "core/vector/vector_math.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QSet>

#include <algorithm>
#include <atomic>
#include <thread>

namespace dr {

namespace {

MetadataFilter fieldFilter(const char* field, const QString& value)
{
    MetadataFilter filter;
    filter.insert(QLatin1String(field), value);
    return filter;
}

IngestionReport errorReport(IngestionReport report, const QString& message)
{
    report.status = IngestionStatus::Error;
    report.error = message;
    LOG_WARN(drIngest, "Ingestion of %s failed: %s",
             qUtf8Printable(report.filename), qUtf8Printable(message));
    return report;
}

} // namespace

QString ingestionStatusToString(IngestionStatus status)
{
    switch (status) {
    case IngestionStatus::Success: return QStringLiteral("success");
    case IngestionStatus::Skipped: return QStringLiteral("skipped");
    case IngestionStatus::Error:   return QStringLiteral("error");
    }
    return QStringLiteral("error");
}

QJsonObject IngestionReport::toJson() const
{
    QJsonObject json;
    json.insert(QStringLiteral("filename"), filename);
    json.insert(QStringLiteral("status"), ingestionStatusToString(status));
    if (!reason.isEmpty()) {
        json.insert(QStringLiteral("reason"), reason);
    }
    json.insert(QStringLiteral("chunks_original"), chunksOriginal);
    json.insert(QStringLiteral("chunks_unique"), chunksUnique);
    json.insert(QStringLiteral("chunks_added"), chunksAdded);
    json.insert(QStringLiteral("error"), error.has_value() ? QJsonValue(*error) : QJsonValue());
    return json;
}

// ── Construction ────────────────────────────────────────────

IngestionPipeline::IngestionPipeline(VectorIndexAdapter& index,
                                     EmbeddingManager& embeddings,
                                     CacheService* cache,
                                     ChunkerConfig chunkerConfig,
                                     IngestionConfig config)
    : m_index(index)
    , m_embeddings(embeddings)
    , m_cache(cache)
    , m_chunker(chunkerConfig)
    , m_config(config)
{
    if (m_config.uploadBatchSize <= 0) {
        m_config.uploadBatchSize = 100;
    }
    if (m_config.maxParallelDocuments <= 0) {
        m_config.maxParallelDocuments = 1;
    }
}

IngestionPipeline::~IngestionPipeline() = default;

void IngestionPipeline::registerExtractor(std::unique_ptr<DocumentExtractor> extractor)
{
    if (extractor) {
        m_extractors.push_back(std::move(extractor));
    }
}

void IngestionPipeline::setIndexChangedCallback(IndexChangedCallback callback)
{
    m_indexChanged = std::move(callback);
}

DocumentExtractor* IngestionPipeline::extractorFor(const QString& filePath) const
{
    const QString extension = QFileInfo(filePath).suffix().toLower();
    for (const auto& extractor : m_extractors) {
        if (extractor->supports(extension)) {
            return extractor.get();
        }
    }
    return nullptr;
}

bool IngestionPipeline::supports(const QString& filePath) const
{
    return extractorFor(filePath) != nullptr;
}

// ── Public API ──────────────────────────────────────────────

IngestionReport IngestionPipeline::ingestDocument(const QString& filePath, bool forceUpdate)
{
    QElapsedTimer timer;
    timer.start();

    IngestionReport report = ingestOne(filePath, forceUpdate);

    LOG_INFO(drIngest, "%s: %s (%d original, %d unique, %d added) in %lld ms",
             qUtf8Printable(report.filename),
             qUtf8Printable(ingestionStatusToString(report.status)),
             report.chunksOriginal, report.chunksUnique, report.chunksAdded,
             static_cast<long long>(timer.elapsed()));
    return report;
}

std::vector<IngestionReport> IngestionPipeline::ingestDocuments(
    const std::vector<QString>& filePaths, bool forceUpdate)
{
    std::vector<IngestionReport> reports(filePaths.size());
    if (filePaths.empty()) {
        return reports;
    }

    const int workerCount = std::min(m_config.maxParallelDocuments,
                                     static_cast<int>(filePaths.size()));
    if (workerCount <= 1) {
        for (size_t i = 0; i < filePaths.size(); ++i) {
            reports[i] = ingestDocument(filePaths[i], forceUpdate);
        }
        return reports;
    }

    std::atomic<size_t> next{0};
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(workerCount));
    for (int w = 0; w < workerCount; ++w) {
        workers.emplace_back([&]() {
            for (;;) {
                const size_t i = next.fetch_add(1);
                if (i >= filePaths.size()) {
                    break;
                }
                reports[i] = ingestDocument(filePaths[i], forceUpdate);
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    int succeeded = 0;
    for (const IngestionReport& report : reports) {
        if (report.status == IngestionStatus::Success) {
            ++succeeded;
        }
    }
    LOG_INFO(drIngest, "Batch ingestion: %d/%d documents added with %d workers",
             succeeded, static_cast<int>(reports.size()), workerCount);
    return reports;
}

std::vector<IngestionReport> IngestionPipeline::ingestDirectory(const QString& dirPath,
                                                                bool forceUpdate)
{
    const QDir dir(dirPath);
    if (!dir.exists()) {
        LOG_WARN(drIngest, "Directory does not exist: %s", qUtf8Printable(dirPath));
        return {};
    }

    std::vector<QString> paths;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Readable, QDir::Name);
    for (const QFileInfo& entry : entries) {
        if (supports(entry.absoluteFilePath())) {
            paths.push_back(entry.absoluteFilePath());
        }
    }

    LOG_INFO(drIngest, "Found %d supported documents in %s",
             static_cast<int>(paths.size()), qUtf8Printable(dirPath));
    return ingestDocuments(paths, forceUpdate);
}

int IngestionPipeline::deleteDocument(const QString& filename)
{
    const int removed = m_index.remove(fieldFilter("source", filename));
    if (removed < 0) {
        LOG_ERROR(drIngest, "Failed to delete chunks of %s", qUtf8Printable(filename));
        return -1;
    }

    LOG_INFO(drIngest, "Deleted %d chunks of %s", removed, qUtf8Printable(filename));
    if (removed > 0) {
        notifyIndexChanged();
    }
    return removed;
}

bool IngestionPipeline::clearIndex()
{
    if (!m_index.clear()) {
        return false;
    }
    notifyIndexChanged();
    return true;
}

int IngestionPipeline::indexedPointCount() const
{
    return m_index.count();
}

// ── Pipeline stages ─────────────────────────────────────────

IngestionReport IngestionPipeline::ingestOne(const QString& filePath, bool forceUpdate)
{
    IngestionReport report;
    const QFileInfo info(filePath);
    report.filename = info.fileName();

    bool indexChanged = false;

    try {
        if (!info.exists() || !info.isFile()) {
            return errorReport(report, QStringLiteral("File not found: %1").arg(filePath));
        }

        DocumentExtractor* extractor = extractorFor(filePath);
        if (!extractor) {
            return errorReport(report, QStringLiteral("Unsupported file type: %1")
                                           .arg(info.suffix()));
        }

        const ExtractionResult extraction = extractor->extract(info.absoluteFilePath());
        if (extraction.status != ExtractionResult::Status::Success) {
            return errorReport(report,
                               QStringLiteral("No extractable content (%1)%2")
                                   .arg(extractionStatusToString(extraction.status),
                                        extraction.errorMessage.has_value()
                                            ? QStringLiteral(": ") + *extraction.errorMessage
                                            : QString()));
        }

        QStringList cleanedPages;
        for (const PageText& page : extraction.pages) {
            const QString cleaned = TextCleaner::clean(page.text);
            if (!cleaned.isEmpty()) {
                cleanedPages << cleaned;
            }
        }
        const QString fullText = cleanedPages.join(QLatin1Char('\n'));
        if (fullText.trimmed().isEmpty()) {
            return errorReport(report, QStringLiteral("No extractable content"));
        }

        // ── Document-level dedup ──
        const QString contentHashGlobal = ContentHasher::hashNormalizedText(fullText);
        const MetadataFilter globalFilter = fieldFilter("content_hash_global", contentHashGlobal);
        if (!forceUpdate && m_index.count(globalFilter) > 0) {
            report.status = IngestionStatus::Skipped;
            report.reason = QStringLiteral("duplicate_content");
            return report;
        }

        const std::optional<QString> pdfHash = ContentHasher::hashFile(info.absoluteFilePath());
        if (!pdfHash.has_value()) {
            return errorReport(report, QStringLiteral("Failed to read file for hashing"));
        }
        const MetadataFilter fileFilter = fieldFilter("pdf_hash", *pdfHash);
        if (!forceUpdate && m_index.count(fileFilter) > 0) {
            report.status = IngestionStatus::Skipped;
            report.reason = QStringLiteral("already_processed");
            return report;
        }

        if (forceUpdate) {
            const int byContent = m_index.remove(globalFilter);
            const int byFile = m_index.remove(fileFilter);
            if (byContent < 0 || byFile < 0) {
                return errorReport(report, QStringLiteral("Failed to remove the previous version"));
            }
            if (byContent + byFile > 0) {
                indexChanged = true;
                LOG_INFO(drIngest, "Force update removed %d previous chunks of %s",
                         byContent + byFile, qUtf8Printable(report.filename));
            }
        }

        // ── Chunk ──
        std::vector<Chunk> chunks = m_chunker.chunkPages(info.absoluteFilePath(), extraction.pages);
        report.chunksOriginal = static_cast<int>(chunks.size());
        if (chunks.empty()) {
            if (indexChanged) {
                notifyIndexChanged();
            }
            return errorReport(report,
                               QStringLiteral("No chunks passed the length and quality filters"));
        }
        for (Chunk& chunk : chunks) {
            chunk.metadata.pdfHash = *pdfHash;
            chunk.metadata.contentHashGlobal = contentHashGlobal;
        }

        // ── Embed ──
        std::vector<QString> texts;
        texts.reserve(chunks.size());
        for (const Chunk& chunk : chunks) {
            texts.push_back(chunk.text);
        }
        std::vector<std::vector<float>> embeddings = m_embeddings.embedBatch(texts);
        if (embeddings.size() != chunks.size()) {
            return errorReport(report, QStringLiteral("Embedding count does not match chunk count"));
        }

        deduplicate(chunks, embeddings);
        report.chunksUnique = static_cast<int>(chunks.size());

        // ── Upload ──
        const UploadResult uploaded = upload(chunks, embeddings);
        report.chunksAdded = uploaded.added;
        if (uploaded.added > 0) {
            indexChanged = true;
        }
        if (indexChanged) {
            notifyIndexChanged();
        }

        if (uploaded.rejected > 0) {
            return errorReport(report, QStringLiteral("%1 chunk(s) failed validation, %2 of %3 chunks stored")
                                           .arg(uploaded.rejected)
                                           .arg(uploaded.added)
                                           .arg(report.chunksUnique));
        }
        if (uploaded.failedBatches > 0) {
            return errorReport(report, QStringLiteral("%1 upload batch(es) failed, %2 of %3 chunks stored")
                                           .arg(uploaded.failedBatches)
                                           .arg(uploaded.added)
                                           .arg(report.chunksUnique));
        }

        report.status = IngestionStatus::Success;
        return report;
    } catch (const std::exception& e) {
        if (indexChanged) {
            notifyIndexChanged();
        }
        return errorReport(report, QString::fromUtf8(e.what()));
    }
}

void IngestionPipeline::deduplicate(std::vector<Chunk>& chunks,
                                    std::vector<std::vector<float>>& embeddings) const
{
    std::vector<Chunk> keptChunks;
    std::vector<std::vector<float>> keptEmbeddings;
    keptChunks.reserve(chunks.size());
    keptEmbeddings.reserve(embeddings.size());

    QSet<QString> seenHashes;
    int exact = 0;
    int near = 0;

    for (size_t i = 0; i < chunks.size(); ++i) {
        const QString& hash = chunks[i].metadata.contentHash;
        if (seenHashes.contains(hash)) {
            ++exact;
            continue;
        }

        bool duplicate = false;
        if (!isZeroVector(embeddings[i])) {
            for (const auto& kept : keptEmbeddings) {
                if (isZeroVector(kept)) {
                    continue;
                }
                if (cosineSimilarity(embeddings[i], kept) > m_config.deduplicationThreshold) {
                    duplicate = true;
                    break;
                }
            }
        }
        if (duplicate) {
            ++near;
            continue;
        }

        seenHashes.insert(hash);
        keptChunks.push_back(std::move(chunks[i]));
        keptEmbeddings.push_back(std::move(embeddings[i]));
    }

    if (exact + near > 0) {
        LOG_DEBUG(drIngest, "Dropped %d exact and %d near-duplicate chunks", exact, near);
    }
    chunks = std::move(keptChunks);
    embeddings = std::move(keptEmbeddings);
}

IngestionPipeline::UploadResult IngestionPipeline::upload(
    std::vector<Chunk>& chunks, std::vector<std::vector<float>>& embeddings)
{
    UploadResult result;
    const size_t batchSize = static_cast<size_t>(m_config.uploadBatchSize);

    for (size_t start = 0; start < chunks.size(); start += batchSize) {
        const size_t end = std::min(start + batchSize, chunks.size());

        std::vector<Chunk> batch;
        std::vector<std::vector<float>> batchEmbeddings;
        batch.reserve(end - start);
        batchEmbeddings.reserve(end - start);

        for (size_t i = start; i < end; ++i) {
            if (!assignEmbedding(chunks[i], embeddings[i])) {
                ++result.rejected;
                continue;
            }
            QString error;
            if (!validateChunk(chunks[i], &error)) {
                ++result.rejected;
                LOG_ERROR(drIngest, "Rejected chunk %d of %s: %s", static_cast<int>(i),
                          qUtf8Printable(chunks[i].metadata.source), qUtf8Printable(error));
                continue;
            }
            // A chunk already stored under the same content hash is replaced,
            // whichever document it came from.
            if (m_index.remove(fieldFilter("content_hash", chunks[i].metadata.contentHash)) < 0) {
                LOG_WARN(drIngest, "Could not clear previous copies of chunk %s",
                         qUtf8Printable(chunks[i].metadata.contentHash));
            }
            batch.push_back(chunks[i]);
            batchEmbeddings.push_back(embeddings[i]);
        }
        if (batch.empty()) {
            continue;
        }

        if (m_index.add(batch, batchEmbeddings)) {
            result.added += static_cast<int>(batch.size());
        } else {
            ++result.failedBatches;
            LOG_ERROR(drIngest, "Upload batch %d-%d failed",
                      static_cast<int>(start), static_cast<int>(end));
        }
    }
    return result;
}

void IngestionPipeline::notifyIndexChanged()
{
    if (m_cache) {
        m_cache->invalidatePrefix(QLatin1String(cache_keys::kRetrievalPrefix));
    }
    if (m_indexChanged) {
        m_indexChanged();
    }
}

} // namespace dr
