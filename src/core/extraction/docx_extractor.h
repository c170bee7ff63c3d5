#pragma once

#include "core/extraction/extractor.h"

namespace dq {

// DocxExtractor -- Word (.docx) documents via duckx. Paragraph texts are
// joined with newlines, runs within a paragraph are concatenated.
class DocxExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QByteArray& data) override;
    bool supports(const QString& extension) const override;
};

} // namespace dq
