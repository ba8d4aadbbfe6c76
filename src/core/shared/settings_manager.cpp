#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace dr {

namespace {

void readInt(const QJsonObject& json, const char* key, int& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isDouble()) {
        target = value.toInt(target);
    }
}

void readDouble(const QJsonObject& json, const char* key, double& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isDouble()) {
        target = value.toDouble(target);
    }
}

void readBool(const QJsonObject& json, const char* key, bool& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isBool()) {
        target = value.toBool(target);
    }
}

void readString(const QJsonObject& json, const char* key, QString& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isString()) {
        target = value.toString();
    }
}

// ── Environment parsing ─────────────────────────────────────

void envInt(const QProcessEnvironment& env, const char* name, int& target)
{
    const QString raw = env.value(QLatin1String(name));
    if (raw.isEmpty()) {
        return;
    }
    bool ok = false;
    const int parsed = raw.trimmed().toInt(&ok);
    if (!ok) {
        LOG_WARN(drCore, "Ignoring %s=%s (not an integer)", name, qUtf8Printable(raw));
        return;
    }
    target = parsed;
}

void envDouble(const QProcessEnvironment& env, const char* name, double& target)
{
    const QString raw = env.value(QLatin1String(name));
    if (raw.isEmpty()) {
        return;
    }
    bool ok = false;
    const double parsed = raw.trimmed().toDouble(&ok);
    if (!ok) {
        LOG_WARN(drCore, "Ignoring %s=%s (not a number)", name, qUtf8Printable(raw));
        return;
    }
    target = parsed;
}

void envBool(const QProcessEnvironment& env, const char* name, bool& target)
{
    const QString raw = env.value(QLatin1String(name)).trimmed().toLower();
    if (raw.isEmpty()) {
        return;
    }
    if (raw == QLatin1String("1") || raw == QLatin1String("true")
        || raw == QLatin1String("yes") || raw == QLatin1String("on")) {
        target = true;
    } else if (raw == QLatin1String("0") || raw == QLatin1String("false")
               || raw == QLatin1String("no") || raw == QLatin1String("off")) {
        target = false;
    } else {
        LOG_WARN(drCore, "Ignoring %s=%s (not a boolean)", name, qUtf8Printable(raw));
    }
}

void envString(const QProcessEnvironment& env, const char* name, QString& target)
{
    if (env.contains(QLatin1String(name))) {
        target = env.value(QLatin1String(name));
    }
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    const QString path = filePath.isEmpty() ? settingsFilePath() : filePath;
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(drCore, "Failed to open settings file for read: %s", qUtf8Printable(path));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(drCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(path),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString path = filePath.isEmpty() ? settingsFilePath() : filePath;
    const QString parentDir = QFileInfo(path).absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(drCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(drCore, "Failed to open settings file for write: %s", qUtf8Printable(path));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(drCore, "Failed to write settings file: %s", qUtf8Printable(path));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/docrag/settings.json");
}

QString SettingsManager::dataDirectory()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/docrag");
}

void SettingsManager::applyEnvironment(Settings& settings, const QProcessEnvironment& env)
{
    envString(env, "RAG_INDEX_PATH", settings.indexPath);
    envString(env, "RAG_CACHE_PATH", settings.cachePath);

    envInt(env, "RAG_CHUNK_SIZE", settings.chunkSize);
    envInt(env, "RAG_CHUNK_OVERLAP", settings.chunkOverlap);
    envInt(env, "MIN_CHUNK_LENGTH", settings.minChunkLength);
    envDouble(env, "RAG_QUALITY_FLOOR", settings.qualityFloor);

    envString(env, "EMBEDDING_MODEL", settings.embeddingModel);
    envString(env, "EMBEDDING_ENDPOINT", settings.embeddingEndpoint);
    envString(env, "EMBEDDING_API_KEY", settings.embeddingApiKey);
    envInt(env, "DEFAULT_EMBEDDING_DIMENSION", settings.embeddingDimension);
    envInt(env, "EMBEDDING_BATCH_SIZE", settings.embeddingBatchSize);
    envBool(env, "EMBEDDING_MOCK", settings.embeddingMockMode);

    envInt(env, "BATCH_SIZE", settings.uploadBatchSize);
    envDouble(env, "DEDUP_THRESHOLD", settings.deduplicationThreshold);

    envInt(env, "RETRIEVAL_K", settings.retrievalK);
    envInt(env, "RETRIEVAL_K_MULTIPLIER", settings.retrievalKMultiplier);
    envDouble(env, "MMR_LAMBDA_MULT", settings.mmrLambda);
    envDouble(env, "SIMILARITY_THRESHOLD", settings.similarityThreshold);
    envDouble(env, "RAG_GATING_SIMILARITY_THRESHOLD", settings.gatingThreshold);
    envInt(env, "SEARCH_TIMEOUT_MS", settings.searchTimeoutMs);

    envBool(env, "ENABLE_CACHE", settings.enableCache);
    envInt(env, "CACHE_TTL", settings.cacheTtlSeconds);
    envInt(env, "MAX_CACHE_SIZE", settings.maxCacheSize);
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("indexPath"), settings.indexPath);
    json.insert(QStringLiteral("cachePath"), settings.cachePath);

    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("minChunkLength"), settings.minChunkLength);
    json.insert(QStringLiteral("qualityFloor"), settings.qualityFloor);

    json.insert(QStringLiteral("embeddingModel"), settings.embeddingModel);
    json.insert(QStringLiteral("embeddingEndpoint"), settings.embeddingEndpoint);
    json.insert(QStringLiteral("embeddingDimension"), settings.embeddingDimension);
    json.insert(QStringLiteral("embeddingBatchSize"), settings.embeddingBatchSize);
    json.insert(QStringLiteral("embeddingTimeoutMs"), settings.embeddingTimeoutMs);
    json.insert(QStringLiteral("embeddingMockMode"), settings.embeddingMockMode);
    json.insert(QStringLiteral("retryMaxAttempts"), settings.retryMaxAttempts);
    json.insert(QStringLiteral("retryBaseDelayMs"), settings.retryBaseDelayMs);
    json.insert(QStringLiteral("retryMaxDelayMs"), settings.retryMaxDelayMs);

    json.insert(QStringLiteral("uploadBatchSize"), settings.uploadBatchSize);
    json.insert(QStringLiteral("maxParallelDocuments"), settings.maxParallelDocuments);
    json.insert(QStringLiteral("deduplicationThreshold"), settings.deduplicationThreshold);

    json.insert(QStringLiteral("retrievalK"), settings.retrievalK);
    json.insert(QStringLiteral("retrievalKMultiplier"), settings.retrievalKMultiplier);
    json.insert(QStringLiteral("retrievalCandidateCap"), settings.retrievalCandidateCap);
    json.insert(QStringLiteral("mmrLambda"), settings.mmrLambda);
    json.insert(QStringLiteral("similarityThreshold"), settings.similarityThreshold);
    json.insert(QStringLiteral("gatingThreshold"), settings.gatingThreshold);
    json.insert(QStringLiteral("searchTimeoutMs"), settings.searchTimeoutMs);

    json.insert(QStringLiteral("enableCache"), settings.enableCache);
    json.insert(QStringLiteral("cacheTtlSeconds"), settings.cacheTtlSeconds);
    json.insert(QStringLiteral("maxCacheSize"), settings.maxCacheSize);
    // The API key is never written back to disk.
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    readString(json, "indexPath", settings.indexPath);
    readString(json, "cachePath", settings.cachePath);

    readInt(json, "chunkSize", settings.chunkSize);
    readInt(json, "chunkOverlap", settings.chunkOverlap);
    readInt(json, "minChunkLength", settings.minChunkLength);
    readDouble(json, "qualityFloor", settings.qualityFloor);

    readString(json, "embeddingModel", settings.embeddingModel);
    readString(json, "embeddingEndpoint", settings.embeddingEndpoint);
    readString(json, "embeddingApiKey", settings.embeddingApiKey);
    readInt(json, "embeddingDimension", settings.embeddingDimension);
    readInt(json, "embeddingBatchSize", settings.embeddingBatchSize);
    readInt(json, "embeddingTimeoutMs", settings.embeddingTimeoutMs);
    readBool(json, "embeddingMockMode", settings.embeddingMockMode);
    readInt(json, "retryMaxAttempts", settings.retryMaxAttempts);
    readInt(json, "retryBaseDelayMs", settings.retryBaseDelayMs);
    readInt(json, "retryMaxDelayMs", settings.retryMaxDelayMs);

    readInt(json, "uploadBatchSize", settings.uploadBatchSize);
    readInt(json, "maxParallelDocuments", settings.maxParallelDocuments);
    readDouble(json, "deduplicationThreshold", settings.deduplicationThreshold);

    readInt(json, "retrievalK", settings.retrievalK);
    readInt(json, "retrievalKMultiplier", settings.retrievalKMultiplier);
    readInt(json, "retrievalCandidateCap", settings.retrievalCandidateCap);
    readDouble(json, "mmrLambda", settings.mmrLambda);
    readDouble(json, "similarityThreshold", settings.similarityThreshold);
    readDouble(json, "gatingThreshold", settings.gatingThreshold);
    readInt(json, "searchTimeoutMs", settings.searchTimeoutMs);

    readBool(json, "enableCache", settings.enableCache);
    readInt(json, "cacheTtlSeconds", settings.cacheTtlSeconds);
    readInt(json, "maxCacheSize", settings.maxCacheSize);

    return settings;
}

} // namespace dr
