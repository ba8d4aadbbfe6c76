#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(drCore)
Q_DECLARE_LOGGING_CATEGORY(drIngest)
Q_DECLARE_LOGGING_CATEGORY(drExtraction)
Q_DECLARE_LOGGING_CATEGORY(drEmbedding)
Q_DECLARE_LOGGING_CATEGORY(drIndex)
Q_DECLARE_LOGGING_CATEGORY(drRetrieval)
Q_DECLARE_LOGGING_CATEGORY(drCache)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)

namespace dr {

// Shortens free text (queries, chunk previews) before it reaches a log line.
QString logPreview(const QString& text, int maxChars = 160);

} // namespace dr
