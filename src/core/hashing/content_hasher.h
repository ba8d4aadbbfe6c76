#pragma once

#include <QString>

#include <optional>

class QIODevice;

namespace dr {

// ContentHasher: fingerprints used for deduplication and cache keys.
//
//   hashBytes / hashFile   SHA-256 over the raw bytes, streamed in 64 KiB blocks
//   hashNormalizedText     MD5 over lowercased, whitespace-collapsed text
//
// All digests are lowercase hex.
class ContentHasher {
public:
    // Returns nullopt if the device is not readable or a read fails.
    static std::optional<QString> hashBytes(QIODevice& device);
    static std::optional<QString> hashFile(const QString& filePath);

    static QString normalizeText(const QString& text);
    static QString hashNormalizedText(const QString& text);
};

} // namespace dr
