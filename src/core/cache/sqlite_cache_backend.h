#pragma once

#include "core/cache/cache_backend.h"

#include <memory>
#include <mutex>

struct sqlite3;
struct sqlite3_stmt;

namespace dr {

struct SqliteCacheConfig {
    int maxEntries = 1000;
    int busyTimeoutMs = 5000;
};

// Persistent cache shared between processes through a SQLite file.
// Rows are evicted in insertion (rowid) order once maxEntries is exceeded.
class SqliteCacheBackend : public CacheBackend {
public:
    // Returns nullptr if the database cannot be opened or initialized.
    static std::unique_ptr<SqliteCacheBackend> open(const QString& dbPath,
                                                    SqliteCacheConfig config = {});
    ~SqliteCacheBackend() override;

    SqliteCacheBackend(const SqliteCacheBackend&) = delete;
    SqliteCacheBackend& operator=(const SqliteCacheBackend&) = delete;

    std::optional<QJsonValue> get(const QString& key) override;
    void set(const QString& key, const QJsonValue& value, int ttlSeconds) override;
    bool remove(const QString& key) override;
    int invalidatePrefix(const QString& prefix) override;
    int size() const override;
    QString name() const override { return QStringLiteral("sqlite"); }

    // Deletes expired rows. Returns the number removed.
    int purgeExpired();

private:
    SqliteCacheBackend(sqlite3* db, SqliteCacheConfig config);

    bool prepareStatements();
    // Throws CacheUnavailableError for lock/IO conditions, std::runtime_error otherwise.
    void throwForResult(int rc, const char* operation) const;
    static void resetStatement(sqlite3_stmt* stmt);

    sqlite3* m_db = nullptr;
    SqliteCacheConfig m_config;
    mutable std::mutex m_mutex;

    sqlite3_stmt* m_getStmt = nullptr;
    sqlite3_stmt* m_setStmt = nullptr;
    sqlite3_stmt* m_removeStmt = nullptr;
    sqlite3_stmt* m_prefixStmt = nullptr;
    sqlite3_stmt* m_countStmt = nullptr;
    sqlite3_stmt* m_evictStmt = nullptr;
    sqlite3_stmt* m_purgeStmt = nullptr;
};

} // namespace dr
