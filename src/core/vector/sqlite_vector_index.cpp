#include "core/vector/sqlite_vector_index.h"
#include "core/shared/logging.h"
#include "core/vector/vector_math.h"

#include <sqlite3.h>

#include <QJsonDocument>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <queue>

namespace dr {

namespace {

constexpr const char* kCreateSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS points (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        text TEXT NOT NULL,
        payload TEXT NOT NULL,
        vector BLOB NOT NULL,
        dimensions INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_points_source
        ON points(json_extract(payload, '$.source'));
    CREATE INDEX IF NOT EXISTS idx_points_pdf_hash
        ON points(json_extract(payload, '$.pdf_hash'));
    CREATE INDEX IF NOT EXISTS idx_points_content_hash_global
        ON points(json_extract(payload, '$.content_hash_global'));
    CREATE INDEX IF NOT EXISTS idx_points_content_hash
        ON points(json_extract(payload, '$.content_hash'));
)";

constexpr const char* kInsertSql =
    "INSERT INTO points (text, payload, vector, dimensions) VALUES (?1, ?2, ?3, ?4)";
constexpr const char* kScrollSql =
    "SELECT id, text, payload, vector FROM points WHERE id > ?1 ORDER BY id ASC LIMIT ?2";
constexpr const char* kClearSql = "DELETE FROM points";

// Rows scanned between deadline checks inside the search loop.
constexpr int kDeadlineCheckInterval = 256;
// VM instructions between progress-handler callbacks.
constexpr int kProgressHandlerOps = 1000;

using SteadyClock = std::chrono::steady_clock;

int deadlineProgressHandler(void* context)
{
    const auto* deadline = static_cast<const SteadyClock::time_point*>(context);
    return SteadyClock::now() > *deadline ? 1 : 0;
}

// Finalizes a per-call statement on scope exit.
struct StatementGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StatementGuard() { sqlite3_finalize(stmt); }
};

struct Candidate {
    double score = 0.0;
    int64_t id = 0;
    QString text;
    QByteArray payload;
    std::vector<float> vector;
};

struct CandidateWorse {
    // Min-heap on score; ties keep the lower id.
    bool operator()(const Candidate& a, const Candidate& b) const
    {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.id < b.id;
    }
};

} // namespace

// ── Construction ────────────────────────────────────────────

std::unique_ptr<SqliteVectorIndex> SqliteVectorIndex::open(const QString& dbPath,
                                                           SqliteVectorIndexConfig config)
{
    if (config.dimensions <= 0) {
        LOG_ERROR(drIndex, "Invalid vector dimensions: %d", config.dimensions);
        return nullptr;
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                   nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drIndex, "Failed to open vector index %s: %s",
                  qUtf8Printable(dbPath), db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        return nullptr;
    }

    // Set busy_timeout before running any SQL.
    sqlite3_busy_timeout(db, config.busyTimeoutMs);

    std::unique_ptr<SqliteVectorIndex> index(new SqliteVectorIndex(db, config));
    index->execSqlLocked("PRAGMA journal_mode=WAL");
    index->execSqlLocked("PRAGMA synchronous=NORMAL");
    if (!index->execSqlLocked(kCreateSchemaSql) || !index->prepareStatements()) {
        return nullptr;
    }

    LOG_INFO(drIndex, "Vector index open: %s (%d dimensions)",
             qUtf8Printable(dbPath), config.dimensions);
    return index;
}

SqliteVectorIndex::SqliteVectorIndex(sqlite3* db, SqliteVectorIndexConfig config)
    : m_db(db)
    , m_config(config)
{
}

SqliteVectorIndex::~SqliteVectorIndex()
{
    sqlite3_finalize(m_insertStmt);
    sqlite3_finalize(m_scrollStmt);
    sqlite3_close(m_db);
}

bool SqliteVectorIndex::prepareStatements()
{
    if (sqlite3_prepare_v2(m_db, kInsertSql, -1, &m_insertStmt, nullptr) != SQLITE_OK
        || sqlite3_prepare_v2(m_db, kScrollSql, -1, &m_scrollStmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drIndex, "Failed to prepare vector index statements: %s",
                  sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool SqliteVectorIndex::execSqlLocked(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drIndex, "SQL failed: %s", errMsg ? errMsg : sqlite3_errmsg(m_db));
        if (errMsg) {
            sqlite3_free(errMsg);
        }
        return false;
    }
    return true;
}

// ── Helpers ─────────────────────────────────────────────────

std::optional<SqliteVectorIndex::WhereClause> SqliteVectorIndex::buildWhere(
    const MetadataFilter& filter)
{
    WhereClause clause;
    QStringList conditions;
    for (auto it = filter.constBegin(); it != filter.constEnd(); ++it) {
        if (!isValidFilterKey(it.key())) {
            LOG_WARN(drIndex, "Rejecting filter key '%s'", qUtf8Printable(it.key()));
            return std::nullopt;
        }
        const QJsonValue value = it.value();
        if (value.isArray() || value.isObject() || value.isUndefined()) {
            LOG_WARN(drIndex, "Rejecting non-scalar filter value for '%s'",
                     qUtf8Printable(it.key()));
            return std::nullopt;
        }
        if (value.isNull()) {
            conditions << QStringLiteral("json_extract(payload, '$.%1') IS NULL").arg(it.key());
            continue;
        }
        clause.values.push_back(value);
        conditions << QStringLiteral("json_extract(payload, '$.%1') = ?%2")
                          .arg(it.key())
                          .arg(clause.values.size());
    }
    if (!conditions.isEmpty()) {
        clause.sql = QStringLiteral(" WHERE ") + conditions.join(QStringLiteral(" AND "));
    }
    return clause;
}

void SqliteVectorIndex::bindValue(sqlite3_stmt* stmt, int index, const QJsonValue& value)
{
    if (value.isBool()) {
        sqlite3_bind_int(stmt, index, value.toBool() ? 1 : 0);
    } else if (value.isDouble()) {
        const double d = value.toDouble();
        if (std::floor(d) == d && std::fabs(d) < 9.0e15) {
            sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(d));
        } else {
            sqlite3_bind_double(stmt, index, d);
        }
    } else {
        const QByteArray utf8 = value.toString().toUtf8();
        sqlite3_bind_text(stmt, index, utf8.constData(), static_cast<int>(utf8.size()),
                          SQLITE_TRANSIENT);
    }
}

QByteArray SqliteVectorIndex::encodeVector(const std::vector<float>& vector)
{
    return QByteArray(reinterpret_cast<const char*>(vector.data()),
                      static_cast<qsizetype>(vector.size() * sizeof(float)));
}

std::vector<float> SqliteVectorIndex::decodeVector(const void* blob, int bytes)
{
    if (!blob || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) {
        return {};
    }
    std::vector<float> vector(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(vector.data(), blob, static_cast<size_t>(bytes));
    return vector;
}

std::optional<Chunk> SqliteVectorIndex::readChunk(sqlite3_stmt* stmt, int textColumn,
                                                  int payloadColumn, int vectorColumn) const
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, textColumn));
    const auto* payload = reinterpret_cast<const char*>(sqlite3_column_text(stmt, payloadColumn));
    const QByteArray payloadBytes(payload ? payload : "",
                                  sqlite3_column_bytes(stmt, payloadColumn));

    const QJsonDocument doc = QJsonDocument::fromJson(payloadBytes);
    QString error;
    std::optional<ChunkMetadata> metadata = doc.isObject()
        ? chunkMetadataFromJson(doc.object(), &error)
        : std::nullopt;
    if (!metadata.has_value()) {
        LOG_WARN(drIndex, "Skipping point with invalid payload: %s",
                 qUtf8Printable(error.isEmpty() ? QStringLiteral("not a JSON object") : error));
        return std::nullopt;
    }

    Chunk chunk;
    chunk.text = QString::fromUtf8(text ? text : "", sqlite3_column_bytes(stmt, textColumn));
    chunk.metadata = std::move(*metadata);
    if (chunk.metadata.embedding.empty() && vectorColumn >= 0) {
        chunk.metadata.embedding = decodeVector(sqlite3_column_blob(stmt, vectorColumn),
                                                sqlite3_column_bytes(stmt, vectorColumn));
    }
    return chunk;
}

// ── VectorIndexAdapter ──────────────────────────────────────

bool SqliteVectorIndex::add(const std::vector<Chunk>& chunks,
                            const std::vector<std::vector<float>>& embeddings)
{
    if (chunks.size() != embeddings.size()) {
        LOG_ERROR(drIndex, "add: %d chunks but %d embeddings",
                  static_cast<int>(chunks.size()), static_cast<int>(embeddings.size()));
        return false;
    }
    if (chunks.empty()) {
        return true;
    }
    for (const auto& embedding : embeddings) {
        if (!isValidVector(embedding, m_config.dimensions)) {
            LOG_ERROR(drIndex, "add: embedding of size %d does not match index dimensions %d",
                      static_cast<int>(embedding.size()), m_config.dimensions);
            return false;
        }
    }

    std::lock_guard<std::timed_mutex> lock(m_mutex);

    if (!execSqlLocked("BEGIN IMMEDIATE")) {
        return false;
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        ChunkMetadata metadata = chunks[i].metadata;
        metadata.embedding = embeddings[i];
        const QByteArray payload = QJsonDocument(chunkMetadataToJson(metadata, true))
                                       .toJson(QJsonDocument::Compact);
        const QByteArray text = chunks[i].text.toUtf8();
        const QByteArray blob = encodeVector(embeddings[i]);

        sqlite3_bind_text(m_insertStmt, 1, text.constData(), static_cast<int>(text.size()),
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(m_insertStmt, 2, payload.constData(), static_cast<int>(payload.size()),
                          SQLITE_TRANSIENT);
        sqlite3_bind_blob(m_insertStmt, 3, blob.constData(), static_cast<int>(blob.size()),
                          SQLITE_TRANSIENT);
        sqlite3_bind_int(m_insertStmt, 4, m_config.dimensions);

        const int rc = sqlite3_step(m_insertStmt);
        sqlite3_reset(m_insertStmt);
        sqlite3_clear_bindings(m_insertStmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(drIndex, "Insert failed: %s", sqlite3_errmsg(m_db));
            execSqlLocked("ROLLBACK");
            return false;
        }
    }

    if (!execSqlLocked("COMMIT")) {
        execSqlLocked("ROLLBACK");
        return false;
    }

    LOG_DEBUG(drIndex, "Added %d points", static_cast<int>(chunks.size()));
    return true;
}

SearchOutcome SqliteVectorIndex::search(const std::vector<float>& queryEmbedding, int k,
                                        const MetadataFilter& filter,
                                        std::chrono::milliseconds timeout)
{
    SearchOutcome outcome;
    if (k <= 0) {
        return outcome;
    }
    if (static_cast<int>(queryEmbedding.size()) != m_config.dimensions) {
        outcome.status = SearchOutcome::Status::Failed;
        outcome.error = QStringLiteral("query embedding has %1 dimensions, index has %2")
                            .arg(queryEmbedding.size())
                            .arg(m_config.dimensions);
        return outcome;
    }

    const std::optional<WhereClause> where = buildWhere(filter);
    if (!where.has_value()) {
        outcome.status = SearchOutcome::Status::Failed;
        outcome.error = QStringLiteral("invalid filter");
        return outcome;
    }

    const SteadyClock::time_point deadline = SteadyClock::now() + timeout;
    const double queryNorm = l2Norm(queryEmbedding);

    // The wait for a writer counts against the same deadline as the scan.
    std::unique_lock<std::timed_mutex> lock(m_mutex, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        outcome.status = SearchOutcome::Status::Timeout;
        outcome.error = QStringLiteral("index busy for %1 ms").arg(timeout.count());
        LOG_WARN(drIndex, "Vector search gave up waiting for the index after %lld ms",
                 static_cast<long long>(timeout.count()));
        return outcome;
    }

    const QByteArray sql = (QStringLiteral("SELECT id, text, payload, vector FROM points")
                            + where->sql).toUtf8();
    StatementGuard guard;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        outcome.status = SearchOutcome::Status::Failed;
        outcome.error = QString::fromUtf8(sqlite3_errmsg(m_db));
        return outcome;
    }
    for (size_t i = 0; i < where->values.size(); ++i) {
        bindValue(guard.stmt, static_cast<int>(i + 1), where->values[i]);
    }

    std::priority_queue<Candidate, std::vector<Candidate>, CandidateWorse> best;
    bool timedOut = false;
    int scanned = 0;

    sqlite3_progress_handler(m_db, kProgressHandlerOps, deadlineProgressHandler,
                             const_cast<SteadyClock::time_point*>(&deadline));

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        if (++scanned % kDeadlineCheckInterval == 0 && SteadyClock::now() > deadline) {
            timedOut = true;
            break;
        }

        const std::vector<float> vector = decodeVector(sqlite3_column_blob(guard.stmt, 3),
                                                       sqlite3_column_bytes(guard.stmt, 3));
        if (vector.size() != queryEmbedding.size()) {
            continue;
        }
        const double norm = l2Norm(vector);
        const double score = (norm > 0.0 && queryNorm > 0.0)
            ? dotProduct(queryEmbedding, vector) / (norm * queryNorm)
            : 0.0;

        if (static_cast<int>(best.size()) >= k && score <= best.top().score) {
            continue;
        }

        Candidate candidate;
        candidate.score = score;
        candidate.id = sqlite3_column_int64(guard.stmt, 0);
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(guard.stmt, 1));
        candidate.text = QString::fromUtf8(text ? text : "", sqlite3_column_bytes(guard.stmt, 1));
        const auto* payload = reinterpret_cast<const char*>(sqlite3_column_text(guard.stmt, 2));
        candidate.payload = QByteArray(payload ? payload : "",
                                       sqlite3_column_bytes(guard.stmt, 2));
        candidate.vector = vector;
        best.push(std::move(candidate));
        if (static_cast<int>(best.size()) > k) {
            best.pop();
        }
    }

    sqlite3_progress_handler(m_db, 0, nullptr, nullptr);

    if (timedOut || rc == SQLITE_INTERRUPT) {
        outcome.status = SearchOutcome::Status::Timeout;
        outcome.error = QStringLiteral("search exceeded %1 ms").arg(timeout.count());
        LOG_WARN(drIndex, "Vector search timed out after %lld ms (%d rows scanned)",
                 static_cast<long long>(timeout.count()), scanned);
        return outcome;
    }
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        outcome.status = SearchOutcome::Status::Failed;
        outcome.error = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_ERROR(drIndex, "Vector search failed: %s", qUtf8Printable(outcome.error));
        return outcome;
    }

    std::vector<Candidate> ranked;
    ranked.reserve(best.size());
    while (!best.empty()) {
        ranked.push_back(best.top());
        best.pop();
    }
    std::reverse(ranked.begin(), ranked.end());

    for (Candidate& candidate : ranked) {
        const QJsonDocument doc = QJsonDocument::fromJson(candidate.payload);
        QString error;
        std::optional<ChunkMetadata> metadata = doc.isObject()
            ? chunkMetadataFromJson(doc.object(), &error)
            : std::nullopt;
        if (!metadata.has_value()) {
            LOG_WARN(drIndex, "Skipping point %lld with invalid payload: %s",
                     static_cast<long long>(candidate.id), qUtf8Printable(error));
            continue;
        }
        ScoredChunk item;
        item.chunk.text = std::move(candidate.text);
        item.chunk.metadata = std::move(*metadata);
        if (item.chunk.metadata.embedding.empty()) {
            item.chunk.metadata.embedding = std::move(candidate.vector);
        }
        item.score = candidate.score;
        outcome.results.push_back(std::move(item));
    }

    LOG_DEBUG(drIndex, "Vector search: %d results from %d rows",
              static_cast<int>(outcome.results.size()), scanned);
    return outcome;
}

int SqliteVectorIndex::remove(const MetadataFilter& filter)
{
    if (filter.isEmpty()) {
        LOG_WARN(drIndex, "remove() requires a filter; use clear() to drop every point");
        return -1;
    }
    const std::optional<WhereClause> where = buildWhere(filter);
    if (!where.has_value()) {
        return -1;
    }

    std::lock_guard<std::timed_mutex> lock(m_mutex);

    const QByteArray sql = (QStringLiteral("DELETE FROM points") + where->sql).toUtf8();
    StatementGuard guard;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drIndex, "Failed to prepare delete: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    for (size_t i = 0; i < where->values.size(); ++i) {
        bindValue(guard.stmt, static_cast<int>(i + 1), where->values[i]);
    }
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        LOG_ERROR(drIndex, "Delete failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    const int removed = sqlite3_changes(m_db);
    LOG_DEBUG(drIndex, "Removed %d points matching %s", removed,
              qUtf8Printable(filterFingerprint(filter)));
    return removed;
}

int SqliteVectorIndex::count(const MetadataFilter& filter)
{
    const std::optional<WhereClause> where = buildWhere(filter);
    if (!where.has_value()) {
        return -1;
    }

    std::lock_guard<std::timed_mutex> lock(m_mutex);

    const QByteArray sql = (QStringLiteral("SELECT COUNT(*) FROM points") + where->sql).toUtf8();
    StatementGuard guard;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drIndex, "Failed to prepare count: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    for (size_t i = 0; i < where->values.size(); ++i) {
        bindValue(guard.stmt, static_cast<int>(i + 1), where->values[i]);
    }
    if (sqlite3_step(guard.stmt) != SQLITE_ROW) {
        LOG_ERROR(drIndex, "Count failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    return sqlite3_column_int(guard.stmt, 0);
}

ScrollPage SqliteVectorIndex::scroll(int limit, std::optional<int64_t> offset)
{
    ScrollPage page;
    if (limit <= 0) {
        return page;
    }

    std::lock_guard<std::timed_mutex> lock(m_mutex);

    sqlite3_bind_int64(m_scrollStmt, 1, offset.value_or(0));
    sqlite3_bind_int(m_scrollStmt, 2, limit);

    int rows = 0;
    int64_t lastId = 0;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(m_scrollStmt)) == SQLITE_ROW) {
        ++rows;
        lastId = sqlite3_column_int64(m_scrollStmt, 0);
        std::optional<Chunk> chunk = readChunk(m_scrollStmt, 1, 2, 3);
        if (!chunk.has_value()) {
            continue;
        }
        IndexedPoint point;
        point.id = lastId;
        point.vector = decodeVector(sqlite3_column_blob(m_scrollStmt, 3),
                                    sqlite3_column_bytes(m_scrollStmt, 3));
        point.chunk = std::move(*chunk);
        page.points.push_back(std::move(point));
    }
    sqlite3_reset(m_scrollStmt);
    sqlite3_clear_bindings(m_scrollStmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(drIndex, "Scroll failed: %s", sqlite3_errmsg(m_db));
        page.points.clear();
        return page;
    }
    if (rows == limit) {
        page.nextOffset = lastId;
    }
    return page;
}

bool SqliteVectorIndex::clear()
{
    std::lock_guard<std::timed_mutex> lock(m_mutex);
    const bool ok = execSqlLocked(kClearSql);
    if (ok) {
        LOG_INFO(drIndex, "Vector index cleared");
    }
    return ok;
}

} // namespace dr
