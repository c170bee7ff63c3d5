#include "core/extraction/extraction_manager.h"
#include "core/extraction/docx_extractor.h"
#include "core/extraction/markdown_extractor.h"
#include "core/extraction/pdf_extractor.h"
#include "core/extraction/text_cleaner.h"
#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>

namespace dq {

QString extractionStatusToString(ExtractionResult::Status status)
{
    switch (status) {
    case ExtractionResult::Status::Success:           return QStringLiteral("success");
    case ExtractionResult::Status::CorruptedFile:     return QStringLiteral("corrupted_file");
    case ExtractionResult::Status::UnsupportedFormat: return QStringLiteral("unsupported_format");
    case ExtractionResult::Status::SizeExceeded:      return QStringLiteral("size_exceeded");
    case ExtractionResult::Status::Inaccessible:      return QStringLiteral("inaccessible");
    case ExtractionResult::Status::Unknown:           return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

ExtractionManager::ExtractionManager(int64_t maxFileSizeBytes, const QStringList& allowedExtensions)
    : m_maxFileSize(std::max<int64_t>(0, maxFileSizeBytes))
{
    m_extractors.push_back(std::make_unique<TextExtractor>());
    m_extractors.push_back(std::make_unique<MarkdownExtractor>());
    m_extractors.push_back(std::make_unique<PdfExtractor>());
    m_extractors.push_back(std::make_unique<DocxExtractor>());

    for (const QString& extension : allowedExtensions) {
        m_allowedExtensions.append(normalizeExtension(extension));
    }

    LOG_INFO(dqExtraction, "ExtractionManager initialised (maxSize=%lld, allowed=%s)",
             static_cast<long long>(m_maxFileSize),
             qUtf8Printable(m_allowedExtensions.isEmpty()
                                ? QStringLiteral("<all>")
                                : m_allowedExtensions.join(QLatin1Char(','))));
}

ExtractionManager::~ExtractionManager() = default;

QString ExtractionManager::normalizeExtension(const QString& extension)
{
    QString normalized = extension.trimmed().toLower();
    while (normalized.startsWith(QLatin1Char('.'))) {
        normalized.remove(0, 1);
    }
    return normalized;
}

FileExtractor* ExtractionManager::selectExtractor(const QString& extension) const
{
    if (!m_allowedExtensions.isEmpty() && !m_allowedExtensions.contains(extension)) {
        return nullptr;
    }
    for (const auto& extractor : m_extractors) {
        if (extractor->supports(extension)) {
            return extractor.get();
        }
    }
    return nullptr;
}

bool ExtractionManager::isSupported(const QString& extension) const
{
    return selectExtractor(normalizeExtension(extension)) != nullptr;
}

ExtractionResult ExtractionManager::extract(const QByteArray& data, const QString& extension) const
{
    ExtractionResult result;
    const QString ext = normalizeExtension(extension);

    FileExtractor* extractor = selectExtractor(ext);
    if (!extractor) {
        result.status = ExtractionResult::Status::UnsupportedFormat;
        result.errorMessage = QStringLiteral("File type '%1' is not supported")
                                  .arg(ext.isEmpty() ? QStringLiteral("<none>") : ext);
        return result;
    }

    if (data.size() > m_maxFileSize) {
        result.status = ExtractionResult::Status::SizeExceeded;
        result.errorMessage = QStringLiteral("File size %1 exceeds limit %2")
                                  .arg(data.size())
                                  .arg(m_maxFileSize);
        LOG_INFO(dqExtraction, "Rejecting oversized upload (%lld bytes, limit %lld)",
                 static_cast<long long>(data.size()), static_cast<long long>(m_maxFileSize));
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    result = extractor->extract(data);
    if (result.status == ExtractionResult::Status::Success && result.content) {
        result.content = TextCleaner::clean(*result.content);
    }
    result.durationMs = static_cast<int>(timer.elapsed());

    if (result.status == ExtractionResult::Status::Success) {
        LOG_DEBUG(dqExtraction, "Extracted %lld chars from .%s in %d ms",
                  static_cast<long long>(result.content.value_or(QString()).size()),
                  qUtf8Printable(ext), result.durationMs);
    } else {
        LOG_INFO(dqExtraction, "Extraction of .%s failed: %s (%s)", qUtf8Printable(ext),
                 qUtf8Printable(extractionStatusToString(result.status)),
                 qUtf8Printable(result.errorMessage.value_or(QStringLiteral("no details"))));
    }
    return result;
}

} // namespace dq
