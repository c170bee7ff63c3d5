#pragma once

#include <QString>
#include <QStringList>

namespace dq {

// TextSegmenter -- sentence and word segmentation shared by the chunker,
// the sparse vectorizer and the extractive answer path.
//
// Sentence boundaries follow Unicode UAX #29 via QTextBoundaryFinder.
// Returned sentences are trimmed and never empty.
class TextSegmenter {
public:
    // Collapse every whitespace run to a single space and trim.
    static QString normalizeWhitespace(const QString& text);

    static QStringList sentences(const QString& text);

    // Whitespace-delimited words, original casing and punctuation kept.
    static QStringList words(const QString& text);

    // Lower-cased alphanumeric tokens ("Cats?" -> "cats"). When
    // minLength > 1, shorter tokens are dropped.
    static QStringList tokens(const QString& text, int minLength = 1);
};

} // namespace dq
