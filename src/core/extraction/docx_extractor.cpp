#include "core/extraction/docx_extractor.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QTemporaryFile>

#include <duckx/duckx.hpp>

#include <exception>
#include <string>

namespace dq {

bool DocxExtractor::supports(const QString& extension) const
{
    return extension == QLatin1String("docx");
}

ExtractionResult DocxExtractor::extract(const QByteArray& data)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;

    // DOCX is a zip container
    if (!data.startsWith("PK")) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("Not a DOCX (zip) container");
        return result;
    }

    // duckx reads from a path
    QTemporaryFile file(QDir::tempPath() + QStringLiteral("/docquery-XXXXXX.docx"));
    if (!file.open() || file.write(data) != data.size() || !file.flush()) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("Failed to stage DOCX: %1").arg(file.errorString());
        LOG_WARN(dqExtraction, "%s", qUtf8Printable(*result.errorMessage));
        return result;
    }
    file.close();

    try {
        duckx::Document doc(file.fileName().toStdString());
        doc.open();
        if (!doc.is_open()) {
            result.status = ExtractionResult::Status::CorruptedFile;
            result.errorMessage = QStringLiteral("Failed to open DOCX");
            result.durationMs = static_cast<int>(timer.elapsed());
            return result;
        }

        QString text;
        for (auto paragraph = doc.paragraphs(); paragraph.has_next(); paragraph.next()) {
            std::string line;
            for (auto run = paragraph.runs(); run.has_next(); run.next()) {
                line += run.get_text();
            }
            text += QString::fromStdString(line);
            text += QLatin1Char('\n');
        }

        result.status = ExtractionResult::Status::Success;
        result.content = std::move(text);
    } catch (const std::exception& ex) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("DOCX parse failed: %1").arg(QString::fromUtf8(ex.what()));
        LOG_WARN(dqExtraction, "%s", qUtf8Printable(*result.errorMessage));
    }

    result.durationMs = static_cast<int>(timer.elapsed());
    return result;
}

} // namespace dq
