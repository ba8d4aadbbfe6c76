#pragma once

#include <QJsonValue>
#include <QString>

#include <optional>
#include <stdexcept>

namespace dr {

// Thrown by a backend when its store cannot be reached (database locked,
// file missing, connection lost). CacheService treats it as a normal miss.
class CacheUnavailableError : public std::runtime_error {
public:
    explicit CacheUnavailableError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

// Key/value store with per-entry TTL. ttlSeconds <= 0 means no expiry.
// Implementations are thread-safe and evict oldest entries first when full.
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual std::optional<QJsonValue> get(const QString& key) = 0;
    virtual void set(const QString& key, const QJsonValue& value, int ttlSeconds) = 0;
    virtual bool remove(const QString& key) = 0;
    // Returns the number of removed entries.
    virtual int invalidatePrefix(const QString& prefix) = 0;
    virtual int size() const = 0;
    virtual QString name() const = 0;
};

} // namespace dr
