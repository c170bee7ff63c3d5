#pragma once

#include "core/extraction/extractor.h"

namespace dq {

// PdfExtractor -- extracts text from PDF bytes using Poppler (Qt 6 bindings).
//
// Page texts are concatenated in page order, one newline between pages.
//
// Limits:
//   - 1000-page cap per document
//   - 10 MB extracted text cap
//   - Encrypted PDFs are rejected (CorruptedFile status)
class PdfExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QByteArray& data) override;
    bool supports(const QString& extension) const override;
};

} // namespace dq
