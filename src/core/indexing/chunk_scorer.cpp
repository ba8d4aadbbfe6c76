#include "core/indexing/chunk_scorer.h"

#include <QRegularExpression>
#include <QSet>

#include <algorithm>

namespace dr {

namespace {

constexpr double kBaseScore = 0.5;
constexpr double kTermBonus = 0.03;
constexpr double kMaxTermBonus = 0.15;

const QRegularExpression& numberedLineRe()
{
    static const QRegularExpression re(QStringLiteral("^\\s*\\d+[.)]\\s"));
    return re;
}

const QRegularExpression& bulletLineRe()
{
    static const QRegularExpression re(QStringLiteral("^\\s*[\\x{2022}*-]\\s"));
    return re;
}

const QRegularExpression& sentenceEndRe()
{
    static const QRegularExpression re(QStringLiteral("[.!?](?=\\s|$)"));
    return re;
}

const QRegularExpression& definitionRe()
{
    static const QRegularExpression re(
        QStringLiteral("\\b(?:is defined as|refers to|means|se define como|se refiere a|"
                       "significa|consiste en)\\b"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& exampleRe()
{
    static const QRegularExpression re(
        QStringLiteral("(?:\\bfor example\\b|\\bfor instance\\b|\\be\\.g\\.|\\bsuch as\\b|"
                       "\\bpor ejemplo\\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

const std::vector<QRegularExpression>& termPatterns()
{
    static const std::vector<QRegularExpression> patterns = {
        // Acronyms: API, ISO9001
        QRegularExpression(QStringLiteral("\\b[A-Z]{2,}[0-9]*\\b")),
        // Capitalized multi-word terms: Vector Index, Data Protection Act
        QRegularExpression(QStringLiteral("\\b[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)+\\b")),
        // Numbers with units: 15 %, 3.5 kg, 30 days
        QRegularExpression(
            QStringLiteral("\\b\\d+(?:[.,]\\d+)?\\s?(?:%|(?:kg|mg|g|km|cm|mm|m|ml|l|h|min|ms|s|"
                           "USD|EUR|days|years|months|d\\x{00ED}as|a\\x{00F1}os|meses)\\b)")),
        // Quoted terms
        QRegularExpression(QStringLiteral("\"[^\"\\n]{2,60}\"")),
    };
    return patterns;
}

bool isAllowedPunctuation(QChar ch)
{
    static const QString allowed = QStringLiteral(".,;:!?'\"()[]-/%&\x2022");
    return allowed.contains(ch);
}

QStringList nonEmptyLines(const QString& text)
{
    QStringList lines;
    for (const QString& line : text.split(QLatin1Char('\n'))) {
        if (!line.trimmed().isEmpty()) {
            lines << line;
        }
    }
    return lines;
}

bool isUppercaseLine(const QString& line)
{
    bool hasLetter = false;
    for (const QChar ch : line) {
        if (ch.isLetter()) {
            hasLetter = true;
            if (ch.isLower()) {
                return false;
            }
        }
    }
    return hasLetter;
}

} // namespace

int ChunkScorer::wordCount(const QString& text)
{
    return countWords(text);
}

double ChunkScorer::specialCharDensity(const QString& text)
{
    int visible = 0;
    int special = 0;
    for (const QChar ch : text) {
        if (ch.isSpace()) {
            continue;
        }
        ++visible;
        if (!ch.isLetterOrNumber() && !isAllowedPunctuation(ch)) {
            ++special;
        }
    }
    return visible == 0 ? 0.0 : static_cast<double>(special) / visible;
}

QStringList ChunkScorer::importantTerms(const QString& text)
{
    QStringList terms;
    QSet<QString> seen;
    for (const QRegularExpression& re : termPatterns()) {
        auto it = re.globalMatch(text);
        while (it.hasNext()) {
            const QString term = it.next().captured(0).trimmed();
            if (!seen.contains(term)) {
                seen.insert(term);
                terms << term;
            }
        }
    }
    return terms;
}

double ChunkScorer::qualityScore(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return 0.0;
    }

    double score = kBaseScore;

    // ── Length ──
    const int words = wordCount(trimmed);
    if (words < 10) {
        score -= 0.25;
    } else if (words < 25) {
        score -= 0.1;
    } else if (words >= 50) {
        score += 0.1;
    }

    // ── Noise ──
    const double density = specialCharDensity(trimmed);
    if (density > 0.3) {
        score -= 0.3;
    } else if (density > 0.15) {
        score -= 0.15;
    }

    // ── Form ──
    const QChar first = trimmed.front();
    if (first.isUpper() || first.isDigit() || first == QChar(0x2022)
        || first == QLatin1Char('-') || first == QLatin1Char('*')) {
        score += 0.05;
    }
    const QChar last = trimmed.back();
    if (last == QLatin1Char('.') || last == QLatin1Char('!') || last == QLatin1Char('?')
        || last == QLatin1Char(':') || last == QLatin1Char(')') || last == QLatin1Char('"')) {
        score += 0.1;
    }

    // ── Content ──
    const int termCount = static_cast<int>(importantTerms(trimmed).size());
    score += std::min(kMaxTermBonus, kTermBonus * termCount);

    int listLines = 0;
    for (const QString& line : nonEmptyLines(trimmed)) {
        if (numberedLineRe().match(line).hasMatch() || bulletLineRe().match(line).hasMatch()) {
            ++listLines;
        }
    }
    if (listLines >= 2) {
        score += 0.1;
    }
    if (definitionRe().match(trimmed).hasMatch()) {
        score += 0.05;
    }
    if (exampleRe().match(trimmed).hasMatch()) {
        score += 0.05;
    }

    return std::clamp(score, 0.0, 1.0);
}

ChunkType ChunkScorer::detectType(const QString& text)
{
    const QString trimmed = text.trimmed();
    const QStringList lines = nonEmptyLines(trimmed);
    if (lines.isEmpty()) {
        return ChunkType::Text;
    }

    int numbered = 0;
    int bullets = 0;
    for (const QString& line : lines) {
        if (numberedLineRe().match(line).hasMatch()) {
            ++numbered;
        } else if (bulletLineRe().match(line).hasMatch()) {
            ++bullets;
        }
    }
    const int lineCount = static_cast<int>(lines.size());

    if (numberedLineRe().match(lines.front()).hasMatch()
        || (numbered >= 2 && numbered * 2 >= lineCount)) {
        return ChunkType::NumberedList;
    }
    if (bulletLineRe().match(lines.front()).hasMatch()
        || (bullets >= 2 && bullets * 2 >= lineCount)) {
        return ChunkType::BulletList;
    }

    const QString firstLine = lines.front().trimmed();
    if (firstLine.startsWith(QLatin1Char('#'))
        || (firstLine.size() < 100 && firstLine.endsWith(QLatin1Char(':')))
        || (firstLine.size() < 80 && isUppercaseLine(firstLine))) {
        return ChunkType::Header;
    }

    int sentences = 0;
    auto it = sentenceEndRe().globalMatch(trimmed);
    while (it.hasNext()) {
        it.next();
        ++sentences;
    }
    if (sentences >= 2 && wordCount(trimmed) >= 20) {
        return ChunkType::Paragraph;
    }

    return ChunkType::Text;
}

} // namespace dr
