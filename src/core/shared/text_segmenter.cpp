#include "core/shared/text_segmenter.h"

#include <QRegularExpression>
#include <QTextBoundaryFinder>

namespace dq {

QString TextSegmenter::normalizeWhitespace(const QString& text)
{
    return text.simplified();
}

QStringList TextSegmenter::sentences(const QString& text)
{
    QStringList result;
    if (text.trimmed().isEmpty()) {
        return result;
    }

    QTextBoundaryFinder finder(QTextBoundaryFinder::Sentence, text);
    qsizetype start = 0;
    while (true) {
        const qsizetype next = finder.toNextBoundary();
        if (next < 0) {
            break;
        }
        const QString sentence = text.mid(start, next - start).trimmed();
        if (!sentence.isEmpty()) {
            result.append(sentence);
        }
        start = next;
    }

    if (start < text.size()) {
        const QString tail = text.mid(start).trimmed();
        if (!tail.isEmpty()) {
            result.append(tail);
        }
    }
    return result;
}

QStringList TextSegmenter::words(const QString& text)
{
    static const QRegularExpression whitespaceRegex(QStringLiteral("\\s+"));
    return text.split(whitespaceRegex, Qt::SkipEmptyParts);
}

QStringList TextSegmenter::tokens(const QString& text, int minLength)
{
    static const QRegularExpression tokenRegex(QStringLiteral("[\\p{L}\\p{N}_]+"));

    QStringList result;
    const QString lowered = text.toLower();
    auto matchIt = tokenRegex.globalMatch(lowered);
    while (matchIt.hasNext()) {
        const QString token = matchIt.next().captured(0);
        if (token.size() >= minLength) {
            result.append(token);
        }
    }
    return result;
}

} // namespace dq
