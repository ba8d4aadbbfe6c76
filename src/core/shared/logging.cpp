#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(drCore, "docrag.core")
Q_LOGGING_CATEGORY(drIngest, "docrag.ingest")
Q_LOGGING_CATEGORY(drExtraction, "docrag.extraction")
Q_LOGGING_CATEGORY(drEmbedding, "docrag.embedding")
Q_LOGGING_CATEGORY(drIndex, "docrag.index")
Q_LOGGING_CATEGORY(drRetrieval, "docrag.retrieval")
Q_LOGGING_CATEGORY(drCache, "docrag.cache")

namespace dr {

QString logPreview(const QString& text, int maxChars)
{
    QString flat = text.simplified();
    if (flat.size() <= maxChars) {
        return flat;
    }
    flat.truncate(maxChars);
    return flat + QStringLiteral("...");
}

} // namespace dr
