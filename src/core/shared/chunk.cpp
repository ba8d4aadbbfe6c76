#include "core/shared/chunk.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QJsonArray>
#include <QRegularExpression>

#include <cmath>
#include <utility>

namespace dr {

namespace {

QString stringField(const QJsonObject& json, const char* key)
{
    return json.value(QLatin1String(key)).toString();
}

bool isUnitScore(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

QString chunkTypeToString(ChunkType type)
{
    switch (type) {
    case ChunkType::Header:       return QStringLiteral("header");
    case ChunkType::Paragraph:    return QStringLiteral("paragraph");
    case ChunkType::NumberedList: return QStringLiteral("numbered_list");
    case ChunkType::BulletList:   return QStringLiteral("bullet_list");
    case ChunkType::Text:         return QStringLiteral("text");
    }
    return QStringLiteral("text");
}

std::optional<ChunkType> chunkTypeFromString(const QString& value)
{
    if (value == QLatin1String("header"))        return ChunkType::Header;
    if (value == QLatin1String("paragraph"))     return ChunkType::Paragraph;
    if (value == QLatin1String("numbered_list")) return ChunkType::NumberedList;
    if (value == QLatin1String("bullet_list"))   return ChunkType::BulletList;
    if (value == QLatin1String("text"))          return ChunkType::Text;
    return std::nullopt;
}

QString computeDocumentId(const QString& filePath)
{
    const QByteArray hash = QCryptographicHash::hash(
        filePath.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

bool assignEmbedding(Chunk& chunk, std::vector<float> embedding)
{
    std::vector<float>& current = chunk.metadata.embedding;
    if (current.empty()) {
        current = std::move(embedding);
        return true;
    }
    if (current == embedding) {
        return true;
    }
    LOG_WARN(drIngest, "Refusing to overwrite embedding of chunk %s (%s)",
             qUtf8Printable(chunk.metadata.contentHash),
             qUtf8Printable(chunk.metadata.source));
    return false;
}

int countWords(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return static_cast<int>(text.split(whitespace, Qt::SkipEmptyParts).size());
}

bool validateChunk(const Chunk& chunk, QString* error)
{
    auto fail = [error](const QString& message) {
        if (error) {
            *error = message;
        }
        return false;
    };

    const ChunkMetadata& meta = chunk.metadata;
    if (chunk.text.trimmed().isEmpty()) {
        return fail(QStringLiteral("empty text"));
    }

    const std::pair<const char*, const QString*> required[] = {
        {"source", &meta.source},
        {"source_document_id", &meta.sourceDocumentId},
        {"file_path", &meta.filePath},
        {"pdf_hash", &meta.pdfHash},
        {"content_hash_global", &meta.contentHashGlobal},
        {"content_hash", &meta.contentHash},
    };
    for (const auto& field : required) {
        if (field.second->isEmpty()) {
            return fail(QStringLiteral("%1 is empty").arg(QLatin1String(field.first)));
        }
    }

    if (!isUnitScore(meta.qualityScore)) {
        return fail(QStringLiteral("quality_score %1 outside [0, 1]").arg(meta.qualityScore));
    }
    if (!isUnitScore(meta.boundaryQualityScore)) {
        return fail(QStringLiteral("boundary_quality_score %1 outside [0, 1]")
                        .arg(meta.boundaryQualityScore));
    }
    if (meta.charCount != chunk.text.size()) {
        return fail(QStringLiteral("char_count %1 does not match text length %2")
                        .arg(meta.charCount).arg(chunk.text.size()));
    }
    const int words = countWords(chunk.text);
    if (meta.wordCount != words) {
        return fail(QStringLiteral("word_count %1 does not match text (%2 words)")
                        .arg(meta.wordCount).arg(words));
    }
    if (meta.pageNumber && *meta.pageNumber < 1) {
        return fail(QStringLiteral("page_number %1 is not 1-based").arg(*meta.pageNumber));
    }

    if (meta.embedding.empty()) {
        return fail(QStringLiteral("missing embedding"));
    }
    for (float v : meta.embedding) {
        if (!std::isfinite(v)) {
            return fail(QStringLiteral("embedding has a non-finite value"));
        }
    }
    return true;
}

QJsonObject chunkMetadataToJson(const ChunkMetadata& metadata, bool includeEmbedding)
{
    QJsonObject json;
    json.insert(QStringLiteral("source"), metadata.source);
    json.insert(QStringLiteral("source_document_id"), metadata.sourceDocumentId);
    json.insert(QStringLiteral("file_path"), metadata.filePath);
    json.insert(QStringLiteral("pdf_hash"), metadata.pdfHash);
    json.insert(QStringLiteral("content_hash_global"), metadata.contentHashGlobal);
    json.insert(QStringLiteral("content_hash"), metadata.contentHash);
    json.insert(QStringLiteral("chunk_type"), chunkTypeToString(metadata.chunkType));
    json.insert(QStringLiteral("quality_score"), metadata.qualityScore);
    json.insert(QStringLiteral("word_count"), metadata.wordCount);
    json.insert(QStringLiteral("char_count"), metadata.charCount);
    if (metadata.pageNumber.has_value()) {
        json.insert(QStringLiteral("page_number"), *metadata.pageNumber);
    }
    json.insert(QStringLiteral("has_complete_sentences"), metadata.hasCompleteSentences);
    json.insert(QStringLiteral("boundary_quality_score"), metadata.boundaryQualityScore);

    if (includeEmbedding && !metadata.embedding.empty()) {
        QJsonArray values;
        for (const float v : metadata.embedding) {
            values.append(static_cast<double>(v));
        }
        json.insert(QStringLiteral("embedding"), values);
    }
    return json;
}

std::optional<ChunkMetadata> chunkMetadataFromJson(const QJsonObject& json, QString* error)
{
    auto fail = [error](const QString& message) -> std::optional<ChunkMetadata> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    ChunkMetadata metadata;
    metadata.source = stringField(json, "source");
    metadata.sourceDocumentId = stringField(json, "source_document_id");
    metadata.filePath = stringField(json, "file_path");
    metadata.pdfHash = stringField(json, "pdf_hash");
    metadata.contentHashGlobal = stringField(json, "content_hash_global");
    metadata.contentHash = stringField(json, "content_hash");

    const QString typeName = json.value(QStringLiteral("chunk_type"))
                                 .toString(QStringLiteral("text"));
    const std::optional<ChunkType> type = chunkTypeFromString(typeName);
    if (!type.has_value()) {
        return fail(QStringLiteral("unknown chunk_type '%1'").arg(typeName));
    }
    metadata.chunkType = *type;

    const QJsonValue quality = json.value(QStringLiteral("quality_score"));
    if (!quality.isUndefined() && !quality.isDouble()) {
        return fail(QStringLiteral("quality_score is not a number"));
    }
    metadata.qualityScore = quality.toDouble(0.0);
    if (!std::isfinite(metadata.qualityScore)
        || metadata.qualityScore < 0.0 || metadata.qualityScore > 1.0) {
        return fail(QStringLiteral("quality_score %1 outside [0, 1]")
                        .arg(metadata.qualityScore));
    }

    metadata.wordCount = json.value(QStringLiteral("word_count")).toInt(0);
    metadata.charCount = json.value(QStringLiteral("char_count")).toInt(0);
    const QJsonValue page = json.value(QStringLiteral("page_number"));
    if (page.isDouble()) {
        metadata.pageNumber = page.toInt();
    }
    metadata.hasCompleteSentences =
        json.value(QStringLiteral("has_complete_sentences")).toBool(false);
    metadata.boundaryQualityScore =
        json.value(QStringLiteral("boundary_quality_score")).toDouble(0.0);

    const QJsonValue embedding = json.value(QStringLiteral("embedding"));
    if (embedding.isArray()) {
        const QJsonArray values = embedding.toArray();
        metadata.embedding.reserve(static_cast<size_t>(values.size()));
        for (const QJsonValue& v : values) {
            if (!v.isDouble()) {
                return fail(QStringLiteral("embedding contains a non-numeric value"));
            }
            metadata.embedding.push_back(static_cast<float>(v.toDouble()));
        }
    } else if (!embedding.isUndefined() && !embedding.isNull()) {
        return fail(QStringLiteral("embedding is not an array"));
    }

    return metadata;
}

QJsonObject scoredChunkToJson(const ScoredChunk& item, bool includeEmbedding)
{
    QJsonObject json;
    json.insert(QStringLiteral("text"), item.chunk.text);
    json.insert(QStringLiteral("metadata"),
                chunkMetadataToJson(item.chunk.metadata, includeEmbedding));
    json.insert(QStringLiteral("score"), item.score);
    return json;
}

std::optional<ScoredChunk> scoredChunkFromJson(const QJsonObject& json, QString* error)
{
    std::optional<ChunkMetadata> metadata =
        chunkMetadataFromJson(json.value(QStringLiteral("metadata")).toObject(), error);
    if (!metadata.has_value()) {
        return std::nullopt;
    }

    ScoredChunk item;
    item.chunk.text = json.value(QStringLiteral("text")).toString();
    item.chunk.metadata = std::move(*metadata);
    item.score = json.value(QStringLiteral("score")).toDouble(0.0);
    return item;
}

} // namespace dr
