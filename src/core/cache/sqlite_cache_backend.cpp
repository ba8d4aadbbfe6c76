#include "core/cache/sqlite_cache_backend.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>

namespace dr {

namespace {

constexpr const char* kCreateSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS cache_entries (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL,
        created_at REAL NOT NULL,
        expires_at REAL NOT NULL DEFAULT 0
    );
    CREATE INDEX IF NOT EXISTS idx_cache_entries_expires
        ON cache_entries(expires_at);
)";

constexpr const char* kGetSql =
    "SELECT value, expires_at FROM cache_entries WHERE key = ?1";
constexpr const char* kSetSql =
    "INSERT OR REPLACE INTO cache_entries (key, value, created_at, expires_at) "
    "VALUES (?1, ?2, ?3, ?4)";
constexpr const char* kRemoveSql = "DELETE FROM cache_entries WHERE key = ?1";
constexpr const char* kPrefixSql =
    "DELETE FROM cache_entries WHERE substr(key, 1, ?2) = ?1";
constexpr const char* kCountSql = "SELECT COUNT(*) FROM cache_entries";
constexpr const char* kEvictSql = R"(
    DELETE FROM cache_entries WHERE rowid IN (
        SELECT rowid FROM cache_entries ORDER BY rowid ASC LIMIT ?1
    )
)";
constexpr const char* kPurgeSql =
    "DELETE FROM cache_entries WHERE expires_at > 0 AND expires_at <= ?1";

bool execSql(sqlite3* db, const char* sql)
{
    if (!db) {
        return false;
    }
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drCache, "SQL failed: %s", errMsg ? errMsg : "unknown error");
        if (errMsg) {
            sqlite3_free(errMsg);
        }
        return false;
    }
    return true;
}

double nowSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

QByteArray encodeValue(const QJsonValue& value)
{
    return QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
}

std::optional<QJsonValue> decodeValue(const QByteArray& raw)
{
    const QJsonDocument doc = QJsonDocument::fromJson(raw);
    if (!doc.isArray() || doc.array().size() != 1) {
        return std::nullopt;
    }
    return doc.array().at(0);
}

} // namespace

std::unique_ptr<SqliteCacheBackend> SqliteCacheBackend::open(const QString& dbPath,
                                                             SqliteCacheConfig config)
{
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                   nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drCache, "Failed to open cache database %s: %s",
                  qUtf8Printable(dbPath), db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        return nullptr;
    }

    sqlite3_busy_timeout(db, config.busyTimeoutMs);
    execSql(db, "PRAGMA journal_mode=WAL");

    if (!execSql(db, kCreateSchemaSql)) {
        sqlite3_close(db);
        return nullptr;
    }

    std::unique_ptr<SqliteCacheBackend> backend(new SqliteCacheBackend(db, config));
    if (!backend->prepareStatements()) {
        return nullptr;
    }
    return backend;
}

SqliteCacheBackend::SqliteCacheBackend(sqlite3* db, SqliteCacheConfig config)
    : m_db(db)
    , m_config(config)
{
    if (m_config.maxEntries < 1) {
        m_config.maxEntries = 1;
    }
}

SqliteCacheBackend::~SqliteCacheBackend()
{
    sqlite3_finalize(m_getStmt);
    sqlite3_finalize(m_setStmt);
    sqlite3_finalize(m_removeStmt);
    sqlite3_finalize(m_prefixStmt);
    sqlite3_finalize(m_countStmt);
    sqlite3_finalize(m_evictStmt);
    sqlite3_finalize(m_purgeStmt);
    sqlite3_close(m_db);
}

bool SqliteCacheBackend::prepareStatements()
{
    const std::pair<const char*, sqlite3_stmt**> statements[] = {
        {kGetSql, &m_getStmt},
        {kSetSql, &m_setStmt},
        {kRemoveSql, &m_removeStmt},
        {kPrefixSql, &m_prefixStmt},
        {kCountSql, &m_countStmt},
        {kEvictSql, &m_evictStmt},
        {kPurgeSql, &m_purgeStmt},
    };
    for (const auto& [sql, stmt] : statements) {
        if (sqlite3_prepare_v2(m_db, sql, -1, stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(drCache, "Failed to prepare cache statement: %s", sqlite3_errmsg(m_db));
            return false;
        }
    }
    return true;
}

void SqliteCacheBackend::resetStatement(sqlite3_stmt* stmt)
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

void SqliteCacheBackend::throwForResult(int rc, const char* operation) const
{
    const QString message = QStringLiteral("cache %1 failed: %2")
                                .arg(QLatin1String(operation),
                                     QString::fromUtf8(sqlite3_errmsg(m_db)));
    switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
    case SQLITE_READONLY:
    case SQLITE_FULL:
        throw CacheUnavailableError(message);
    default:
        throw std::runtime_error(message.toStdString());
    }
}

std::optional<QJsonValue> SqliteCacheBackend::get(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(m_getStmt, 1, keyUtf8.constData(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(m_getStmt);
    if (rc == SQLITE_DONE) {
        resetStatement(m_getStmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        resetStatement(m_getStmt);
        throwForResult(rc, "get");
    }

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(m_getStmt, 0));
    const int bytes = sqlite3_column_bytes(m_getStmt, 0);
    const QByteArray raw(text ? text : "", bytes);
    const double expiresAt = sqlite3_column_double(m_getStmt, 1);
    resetStatement(m_getStmt);

    if (expiresAt > 0.0 && expiresAt <= nowSeconds()) {
        sqlite3_bind_text(m_removeStmt, 1, keyUtf8.constData(), -1, SQLITE_TRANSIENT);
        sqlite3_step(m_removeStmt);
        resetStatement(m_removeStmt);
        return std::nullopt;
    }

    std::optional<QJsonValue> value = decodeValue(raw);
    if (!value.has_value()) {
        LOG_WARN(drCache, "Dropping undecodable cache entry %s", qUtf8Printable(key));
    }
    return value;
}

void SqliteCacheBackend::set(const QString& key, const QJsonValue& value, int ttlSeconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray encoded = encodeValue(value);
    const double now = nowSeconds();

    sqlite3_bind_text(m_setStmt, 1, keyUtf8.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_setStmt, 2, encoded.constData(), static_cast<int>(encoded.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_double(m_setStmt, 3, now);
    sqlite3_bind_double(m_setStmt, 4, ttlSeconds > 0 ? now + ttlSeconds : 0.0);
    const int rc = sqlite3_step(m_setStmt);
    resetStatement(m_setStmt);
    if (rc != SQLITE_DONE) {
        throwForResult(rc, "set");
    }

    int count = 0;
    if (sqlite3_step(m_countStmt) == SQLITE_ROW) {
        count = sqlite3_column_int(m_countStmt, 0);
    }
    resetStatement(m_countStmt);

    if (count > m_config.maxEntries) {
        sqlite3_bind_int(m_evictStmt, 1, count - m_config.maxEntries);
        const int evictRc = sqlite3_step(m_evictStmt);
        resetStatement(m_evictStmt);
        if (evictRc != SQLITE_DONE) {
            throwForResult(evictRc, "evict");
        }
    }
}

bool SqliteCacheBackend::remove(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(m_removeStmt, 1, keyUtf8.constData(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(m_removeStmt);
    resetStatement(m_removeStmt);
    if (rc != SQLITE_DONE) {
        throwForResult(rc, "remove");
    }
    return sqlite3_changes(m_db) > 0;
}

int SqliteCacheBackend::invalidatePrefix(const QString& prefix)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray prefixUtf8 = prefix.toUtf8();
    sqlite3_bind_text(m_prefixStmt, 1, prefixUtf8.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(m_prefixStmt, 2, static_cast<int>(prefix.toUcs4().size()));
    const int rc = sqlite3_step(m_prefixStmt);
    resetStatement(m_prefixStmt);
    if (rc != SQLITE_DONE) {
        throwForResult(rc, "invalidate");
    }
    return sqlite3_changes(m_db);
}

int SqliteCacheBackend::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    int count = 0;
    const int rc = sqlite3_step(m_countStmt);
    if (rc == SQLITE_ROW) {
        count = sqlite3_column_int(m_countStmt, 0);
    }
    resetStatement(m_countStmt);
    if (rc != SQLITE_ROW) {
        throwForResult(rc, "count");
    }
    return count;
}

int SqliteCacheBackend::purgeExpired()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_bind_double(m_purgeStmt, 1, nowSeconds());
    const int rc = sqlite3_step(m_purgeStmt);
    resetStatement(m_purgeStmt);
    if (rc != SQLITE_DONE) {
        throwForResult(rc, "purge");
    }
    return sqlite3_changes(m_db);
}

} // namespace dr
