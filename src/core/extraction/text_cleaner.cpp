#include "core/extraction/text_cleaner.h"

namespace dr {

namespace {

bool isHorizontalSpace(QChar ch)
{
    return ch == QLatin1Char(' ') || ch == QLatin1Char('\t');
}

bool isClosingPunctuation(QChar ch)
{
    switch (ch.unicode()) {
    case ',': case '.': case ';': case ':': case '!': case '?':
        return true;
    default:
        return false;
    }
}

} // namespace

QChar TextCleaner::normalizeChar(QChar ch)
{
    switch (ch.unicode()) {
    // Single quotes and primes
    case 0x2018: case 0x2019: case 0x201A: case 0x201B: case 0x2032:
        return QLatin1Char('\'');
    // Double quotes and guillemets
    case 0x201C: case 0x201D: case 0x201E: case 0x201F: case 0x2033:
    case 0x00AB: case 0x00BB:
        return QLatin1Char('"');
    // Dashes and minus
    case 0x2010: case 0x2011: case 0x2012: case 0x2013: case 0x2014:
    case 0x2015: case 0x2212:
        return QLatin1Char('-');
    // No-break and thin spaces
    case 0x00A0: case 0x2002: case 0x2003: case 0x2007: case 0x2009:
    case 0x200A: case 0x202F: case 0x3000:
        return QLatin1Char(' ');
    // Bullet glyphs (0xF0B7 is the Symbol-font bullet many PDFs emit)
    case 0x25AA: case 0x25CF: case 0x25E6: case 0x2023: case 0x2043:
    case 0x25A0: case 0x25A1: case 0x2219: case 0xF0B7: case 0x2022:
        return QChar(0x2022);
    // Invisible characters
    case 0x00AD: case 0x200B: case 0x200C: case 0x200D: case 0xFEFF:
        return QChar();
    default:
        return ch;
    }
}

QString TextCleaner::clean(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString result;
    result.reserve(raw.size());

    // Pass 1: Strip control chars, normalize line endings and typography
    for (int i = 0; i < raw.size(); ++i) {
        const QChar ch = raw[i];
        const ushort code = ch.unicode();

        if (code == '\r') {
            if (i + 1 < raw.size() && raw[i + 1] == QLatin1Char('\n')) {
                ++i;
            }
            result.append(QLatin1Char('\n'));
            continue;
        }

        // Strip control characters except tab (0x09) and newline (0x0A)
        if ((code < 0x20 && code != 0x09 && code != 0x0A) || code == 0x7F) {
            continue;
        }

        if (code == 0x2026) {
            result.append(QStringLiteral("..."));
            continue;
        }

        const QChar normalized = normalizeChar(ch);
        if (!normalized.isNull()) {
            result.append(normalized);
        }
    }

    // Pass 2: Collapse newlines and horizontal whitespace
    QString collapsed;
    collapsed.reserve(result.size());

    auto dropTrailingSpace = [&collapsed]() {
        while (!collapsed.isEmpty() && collapsed.back() == QLatin1Char(' ')) {
            collapsed.chop(1);
        }
    };

    int i = 0;
    while (i < result.size()) {
        const QChar ch = result[i];

        if (ch == QLatin1Char('\n')) {
            int count = 0;
            while (i < result.size()
                   && (result[i] == QLatin1Char('\n') || isHorizontalSpace(result[i]))) {
                if (result[i] == QLatin1Char('\n')) {
                    ++count;
                }
                ++i;
            }
            dropTrailingSpace();
            const int emitCount = qMin(count, 2);
            for (int j = 0; j < emitCount; ++j) {
                collapsed.append(QLatin1Char('\n'));
            }
        } else if (isHorizontalSpace(ch)) {
            while (i < result.size() && isHorizontalSpace(result[i])) {
                ++i;
            }
            if (!collapsed.isEmpty() && collapsed.back() != QLatin1Char('\n')) {
                collapsed.append(QLatin1Char(' '));
            }
        } else {
            if (isClosingPunctuation(ch)) {
                dropTrailingSpace();
            }
            collapsed.append(ch);
            ++i;
        }
    }

    return collapsed.trimmed();
}

} // namespace dr
