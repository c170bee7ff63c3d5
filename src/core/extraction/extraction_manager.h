#pragma once

#include "core/extraction/extractor.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <memory>
#include <vector>

namespace dq {

// ExtractionManager -- turns uploaded bytes into plain text.
//
// Routes by extension to the text, Markdown, PDF or DOCX extractor,
// rejects extensions outside the allow-list (UnsupportedFormat) and
// payloads above the size limit (SizeExceeded), and normalizes every
// successful result with TextCleaner.
//
// Usage:
//   ExtractionManager mgr;
//   ExtractionResult r = mgr.extract(bytes, QStringLiteral("pdf"));
//
// Thread safety: extract() keeps no per-call state and may run concurrently.
class ExtractionManager {
public:
    static constexpr int64_t kDefaultMaxFileSize = 10 * 1024 * 1024;

    explicit ExtractionManager(int64_t maxFileSizeBytes = kDefaultMaxFileSize,
                               const QStringList& allowedExtensions = {});
    ~ExtractionManager();

    ExtractionManager(const ExtractionManager&) = delete;
    ExtractionManager& operator=(const ExtractionManager&) = delete;

    ExtractionResult extract(const QByteArray& data, const QString& extension) const;

    bool isSupported(const QString& extension) const;
    int64_t maxFileSizeBytes() const { return m_maxFileSize; }

    // "PDF", ".pdf" and "pdf" all become "pdf".
    static QString normalizeExtension(const QString& extension);

private:
    FileExtractor* selectExtractor(const QString& extension) const;

    std::vector<std::unique_ptr<FileExtractor>> m_extractors;
    QStringList m_allowedExtensions;   // empty = everything an extractor supports
    int64_t m_maxFileSize;
};

} // namespace dq
