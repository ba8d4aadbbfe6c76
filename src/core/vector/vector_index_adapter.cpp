#include "core/vector/vector_index_adapter.h"

#include <QJsonDocument>
#include <QRegularExpression>

namespace dr {

QString filterFingerprint(const MetadataFilter& filter)
{
    if (filter.isEmpty()) {
        return QStringLiteral("{}");
    }
    return QString::fromUtf8(QJsonDocument(filter).toJson(QJsonDocument::Compact));
}

bool isValidFilterKey(const QString& key)
{
    static const QRegularExpression re(QStringLiteral("^[A-Za-z0-9_]+$"));
    return re.match(key).hasMatch();
}

} // namespace dr
