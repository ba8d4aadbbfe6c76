#include "core/hashing/content_hasher.h"
#include "core/shared/logging.h"

#include <QByteArrayView>
#include <QCryptographicHash>
#include <QFile>
#include <QIODevice>

namespace dr {

namespace {

constexpr qint64 kBlockSize = 64 * 1024;

} // namespace

std::optional<QString> ContentHasher::hashBytes(QIODevice& device)
{
    if (!device.isOpen() || !device.isReadable()) {
        return std::nullopt;
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    QByteArray buffer(static_cast<qsizetype>(kBlockSize), Qt::Uninitialized);

    while (true) {
        const qint64 n = device.read(buffer.data(), kBlockSize);
        if (n < 0) {
            LOG_WARN(drIngest, "Read failed while hashing: %s",
                     qUtf8Printable(device.errorString()));
            return std::nullopt;
        }
        if (n == 0) {
            if (device.atEnd() || !device.isSequential()) {
                break;
            }
            if (!device.waitForReadyRead(30000)) {
                break;
            }
            continue;
        }
        hash.addData(QByteArrayView(buffer.constData(), static_cast<qsizetype>(n)));
    }

    return QString::fromLatin1(hash.result().toHex());
}

std::optional<QString> ContentHasher::hashFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(drIngest, "Cannot open %s for hashing: %s",
                 qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return std::nullopt;
    }
    return hashBytes(file);
}

QString ContentHasher::normalizeText(const QString& text)
{
    // simplified() trims and collapses every whitespace run to one space.
    return text.toLower().simplified();
}

QString ContentHasher::hashNormalizedText(const QString& text)
{
    const QByteArray digest = QCryptographicHash::hash(
        normalizeText(text).toUtf8(), QCryptographicHash::Md5);
    return QString::fromLatin1(digest.toHex());
}

} // namespace dr
