#pragma once

#include <QString>

namespace dr {

// TextCleaner: normalizes raw extractor output before chunking.
//
// Operations performed:
// 1. Strip ASCII control characters except tab and newline; drop soft hyphens,
//    zero-width spaces and byte-order marks
// 2. Normalize line endings: \r\n and \r to \n
// 3. Typography: curly quotes to straight quotes, en/em dashes to '-',
//    ellipsis to "...", no-break spaces to plain spaces, bullet glyphs to '•'
// 4. Collapse runs of 3+ newlines to 2 newlines (preserve paragraph breaks)
// 5. Collapse runs of spaces/tabs to a single space, drop horizontal
//    whitespace at line start/end and before , . ; : ! ?
// 6. Trim leading/trailing whitespace
class TextCleaner {
public:
    static QString clean(const QString& raw);

private:
    // Returns the replacement for ch, or a null QChar to drop it.
    // Multi-character replacements (ellipsis) are handled by the caller.
    static QChar normalizeChar(QChar ch);
};

} // namespace dr
