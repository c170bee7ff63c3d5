#include "core/extraction/markdown_extractor.h"
#include "core/extraction/text_extractor.h"

#include <QElapsedTimer>
#include <QTextDocument>

namespace dq {

bool MarkdownExtractor::supports(const QString& extension) const
{
    return extension == QLatin1String("md") || extension == QLatin1String("markdown");
}

QString MarkdownExtractor::stripMarkup(const QString& markdown)
{
    QTextDocument document;
    document.setMarkdown(markdown, QTextDocument::MarkdownDialectGitHub);

    // Images render as object placeholders with no text of their own.
    QString plain = document.toPlainText();
    plain.remove(QChar::ObjectReplacementCharacter);
    return plain.trimmed();
}

ExtractionResult MarkdownExtractor::extract(const QByteArray& data)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;
    result.status = ExtractionResult::Status::Success;
    result.content = stripMarkup(TextExtractor::decode(data));
    result.durationMs = static_cast<int>(timer.elapsed());
    return result;
}

} // namespace dq
