#pragma once

#include "core/vector/vector_index_adapter.h"

#include <QString>

#include <memory>
#include <mutex>

struct sqlite3;
struct sqlite3_stmt;

namespace dr {

struct SqliteVectorIndexConfig {
    int dimensions = 1536;
    int busyTimeoutMs = 30000;
};

// SqliteVectorIndex: VectorIndexAdapter over a single SQLite file.
//
// Each point stores the chunk text, its metadata as a JSON payload (embedding
// included) and the vector as a float32 BLOB. Search is an exact cosine scan
// over the rows matching the filter; the timeout bounds both the wait for a
// concurrent writer and the scan, which a progress handler interrupts. Payload fields used for dedup and deletion have
// expression indexes.
class SqliteVectorIndex : public VectorIndexAdapter {
public:
    // Returns nullptr if the database cannot be opened or its schema created.
    static std::unique_ptr<SqliteVectorIndex> open(const QString& dbPath,
                                                   SqliteVectorIndexConfig config = {});
    ~SqliteVectorIndex() override;

    SqliteVectorIndex(const SqliteVectorIndex&) = delete;
    SqliteVectorIndex& operator=(const SqliteVectorIndex&) = delete;
    SqliteVectorIndex(SqliteVectorIndex&&) = delete;
    SqliteVectorIndex& operator=(SqliteVectorIndex&&) = delete;

    bool add(const std::vector<Chunk>& chunks,
             const std::vector<std::vector<float>>& embeddings) override;
    SearchOutcome search(const std::vector<float>& queryEmbedding, int k,
                         const MetadataFilter& filter,
                         std::chrono::milliseconds timeout) override;
    int remove(const MetadataFilter& filter) override;
    int count(const MetadataFilter& filter = {}) override;
    ScrollPage scroll(int limit, std::optional<int64_t> offset) override;
    bool clear() override;

    int dimensions() const { return m_config.dimensions; }

private:
    SqliteVectorIndex(sqlite3* db, SqliteVectorIndexConfig config);

    struct WhereClause {
        QString sql;                    // empty or " WHERE ..."
        std::vector<QJsonValue> values; // bound from ?1 upward
    };
    static std::optional<WhereClause> buildWhere(const MetadataFilter& filter);
    static void bindValue(sqlite3_stmt* stmt, int index, const QJsonValue& value);

    static QByteArray encodeVector(const std::vector<float>& vector);
    static std::vector<float> decodeVector(const void* blob, int bytes);
    std::optional<Chunk> readChunk(sqlite3_stmt* stmt, int textColumn, int payloadColumn,
                                   int vectorColumn) const;

    bool prepareStatements();
    bool execSqlLocked(const char* sql);

    sqlite3* m_db = nullptr;
    SqliteVectorIndexConfig m_config;
    // Timed so search() can give up waiting once its deadline passes.
    mutable std::timed_mutex m_mutex;

    sqlite3_stmt* m_insertStmt = nullptr;
    sqlite3_stmt* m_scrollStmt = nullptr;
};

} // namespace dr
