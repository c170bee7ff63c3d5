#pragma once

#include "core/extraction/extractor.h"

namespace dq {

// MarkdownExtractor -- renders GitHub-flavored Markdown through QTextDocument
// and keeps the document's plain text.
//
// Markup, escapes and entities are resolved by the Markdown parser; link text
// is kept while images are dropped. Requires a QGuiApplication instance.
class MarkdownExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QByteArray& data) override;
    bool supports(const QString& extension) const override;

    static QString stripMarkup(const QString& markdown);
};

} // namespace dq
