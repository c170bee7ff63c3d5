#include "core/extraction/pdf_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QRectF>

#include <poppler/qt6/poppler-qt6.h>

#include <algorithm>
#include <memory>

namespace dq {

namespace {

constexpr int kMaxPages = 1000;
constexpr int64_t kMaxExtractedTextBytes = 10LL * 1024 * 1024;

} // anonymous namespace

bool PdfExtractor::supports(const QString& extension) const
{
    return extension == QLatin1String("pdf");
}

ExtractionResult PdfExtractor::extract(const QByteArray& data)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;

    if (!data.startsWith("%PDF")) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("Missing PDF header");
        return result;
    }

    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(data);
    if (!doc) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("Failed to load PDF document");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_WARN(dqExtraction, "Poppler failed to load PDF (%lld bytes)",
                 static_cast<long long>(data.size()));
        return result;
    }

    if (doc->isLocked()) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("PDF is encrypted or password-protected");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_INFO(dqExtraction, "Skipping encrypted PDF");
        return result;
    }

    const int pageCount = doc->numPages();
    const int pagesToProcess = std::min(pageCount, kMaxPages);
    if (pageCount > kMaxPages) {
        LOG_INFO(dqExtraction, "PDF has %d pages, capping at %d", pageCount, kMaxPages);
    }

    QString fullText;
    int64_t extractedBytes = 0;
    for (int i = 0; i < pagesToProcess; ++i) {
        std::unique_ptr<Poppler::Page> page = doc->page(i);
        if (!page) {
            LOG_DEBUG(dqExtraction, "Null page %d", i);
            continue;
        }

        const QString pageText = page->text(QRectF());
        fullText += pageText;
        fullText += QLatin1Char('\n');

        extractedBytes += pageText.toUtf8().size();
        if (extractedBytes > kMaxExtractedTextBytes) {
            LOG_INFO(dqExtraction, "Extracted text exceeded %lld bytes at page %d, truncating",
                     static_cast<long long>(kMaxExtractedTextBytes), i + 1);
            break;
        }
    }

    result.status = ExtractionResult::Status::Success;
    result.content = std::move(fullText);
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(dqExtraction, "Extracted %d pages from PDF in %d ms",
              pagesToProcess, result.durationMs);
    return result;
}

} // namespace dq
