#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QStringDecoder>

namespace dq {

bool TextExtractor::supports(const QString& extension) const
{
    return extension == QLatin1String("txt") || extension == QLatin1String("text");
}

QString TextExtractor::decode(const QByteArray& data)
{
    QStringDecoder utf8(QStringDecoder::Utf8);
    QString text = utf8(data);
    if (utf8.hasError()) {
        LOG_DEBUG(dqExtraction, "Invalid UTF-8, decoding as Latin-1");
        return QString::fromLatin1(data);
    }
    if (text.startsWith(QChar(0xFEFF))) {
        text.remove(0, 1);
    }
    return text;
}

ExtractionResult TextExtractor::extract(const QByteArray& data)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;
    result.status = ExtractionResult::Status::Success;
    result.content = decode(data);
    result.durationMs = static_cast<int>(timer.elapsed());
    return result;
}

} // namespace dq
