#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace dq {

// Result of a content extraction attempt.
// Every extraction produces a status; content is present only on Success.
struct ExtractionResult {
    enum class Status {
        Success,
        CorruptedFile,
        UnsupportedFormat,
        SizeExceeded,
        Inaccessible,
        Unknown,
    };

    Status status = Status::Unknown;
    std::optional<QString> content;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

QString extractionStatusToString(ExtractionResult::Status status);

// FileExtractor -- abstract interface for one family of document formats.
//
// Extractors work on the raw bytes of an upload; ExtractionManager picks
// one by extension and post-processes its output.
class FileExtractor {
public:
    virtual ~FileExtractor() = default;

    virtual ExtractionResult extract(const QByteArray& data) = 0;

    // Extension is lower-case without a leading dot ("pdf", "md").
    virtual bool supports(const QString& extension) const = 0;
};

} // namespace dq
