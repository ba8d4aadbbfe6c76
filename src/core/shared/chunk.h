#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace dr {

enum class ChunkType {
    Header,
    Paragraph,
    NumberedList,
    BulletList,
    Text,
};

QString chunkTypeToString(ChunkType type);
std::optional<ChunkType> chunkTypeFromString(const QString& value);

// Fixed metadata schema carried by every chunk. Field names in the JSON
// payload are the persisted wire names (snake_case).
struct ChunkMetadata {
    QString source;              // file name
    QString sourceDocumentId;    // computeDocumentId(filePath)
    QString filePath;
    QString pdfHash;             // SHA-256 of the raw file bytes
    QString contentHashGlobal;   // MD5 of the normalized full text
    QString contentHash;         // MD5 of the normalized chunk text
    ChunkType chunkType = ChunkType::Text;
    double qualityScore = 0.0;
    int wordCount = 0;
    int charCount = 0;
    std::optional<int> pageNumber;
    bool hasCompleteSentences = false;
    double boundaryQualityScore = 0.0;
    std::vector<float> embedding;  // empty until computed
};

struct Chunk {
    QString text;
    ChunkMetadata metadata;
};

struct ScoredChunk {
    Chunk chunk;
    double score = 0.0;
};

// Stable document ID: SHA-256 of the absolute file path.
QString computeDocumentId(const QString& filePath);

// Assigns the embedding once. Re-assigning an identical vector is a no-op;
// a different vector on a chunk that already has one is refused.
bool assignEmbedding(Chunk& chunk, std::vector<float> embedding);

// Whitespace-separated word count, as stored in word_count.
int countWords(const QString& text);

// Checks a chunk before it is written to the index: non-empty text, source
// and hashes, scores in [0, 1], counts that match the text, a 1-based page
// and a finite, non-empty embedding.
bool validateChunk(const Chunk& chunk, QString* error = nullptr);

QJsonObject chunkMetadataToJson(const ChunkMetadata& metadata, bool includeEmbedding = true);

// Parses a payload read back from the index or a cache entry. Returns nullopt
// (and fills error when given) for unknown chunk types, quality scores outside
// [0, 1] or a non-numeric embedding.
std::optional<ChunkMetadata> chunkMetadataFromJson(const QJsonObject& json,
                                                   QString* error = nullptr);

QJsonObject scoredChunkToJson(const ScoredChunk& item, bool includeEmbedding = false);
std::optional<ScoredChunk> scoredChunkFromJson(const QJsonObject& json, QString* error = nullptr);

} // namespace dr
