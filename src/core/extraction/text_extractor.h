#pragma once

#include "core/extraction/extractor.h"

namespace dq {

// TextExtractor -- plain-text uploads. Decodes UTF-8 (BOM stripped),
// falling back to Latin-1 when the bytes are not valid UTF-8.
class TextExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QByteArray& data) override;
    bool supports(const QString& extension) const override;

    static QString decode(const QByteArray& data);
};

} // namespace dq
