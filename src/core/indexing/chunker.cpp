#include "core/indexing/chunker.h"
#include "core/shared/logging.h"
#include "core/shared/text_segmenter.h"

#include <algorithm>

namespace dq {

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    // Sanity-check config bounds: chunkSize > overlap >= 0
    if (m_config.chunkSize < 1) {
        LOG_WARN(dqIndex, "Chunker chunkSize %d clamped to 1", m_config.chunkSize);
        m_config.chunkSize = 1;
    }
    if (m_config.overlap < 0) {
        LOG_WARN(dqIndex, "Chunker overlap %d clamped to 0", m_config.overlap);
        m_config.overlap = 0;
    }
    if (m_config.overlap >= m_config.chunkSize) {
        LOG_WARN(dqIndex, "Chunker overlap %d clamped below chunkSize %d",
                 m_config.overlap, m_config.chunkSize);
        m_config.overlap = m_config.chunkSize - 1;
    }
}

// ── Public API ──────────────────────────────────────────────

std::vector<QString> Chunker::split(const QString& text) const
{
    std::vector<QString> chunks;

    const QString normalized = TextSegmenter::normalizeWhitespace(text);
    if (normalized.isEmpty()) {
        return chunks;
    }

    const std::vector<QStringList> units = segmentUnits(normalized);

    QStringList buffer;
    int seededWords = 0;

    for (const QStringList& unit : units) {
        const bool wouldOverflow =
            buffer.size() + unit.size() > static_cast<qsizetype>(m_config.chunkSize);
        if (wouldOverflow && buffer.size() > seededWords) {
            chunks.push_back(buffer.join(QLatin1Char(' ')));

            const qsizetype keep = std::min<qsizetype>(m_config.overlap, buffer.size());
            buffer = buffer.mid(buffer.size() - keep);
            seededWords = static_cast<int>(keep);
        }
        buffer.append(unit);
    }

    if (buffer.size() > seededWords) {
        chunks.push_back(buffer.join(QLatin1Char(' ')));
    }

    LOG_DEBUG(dqIndex, "Chunked %d words into %d chunks (size=%d, overlap=%d)",
              static_cast<int>(TextSegmenter::words(normalized).size()),
              static_cast<int>(chunks.size()),
              m_config.chunkSize, m_config.overlap);

    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

std::vector<QStringList> Chunker::segmentUnits(const QString& normalized) const
{
    std::vector<QStringList> units;

    QStringList sentences = TextSegmenter::sentences(normalized);
    if (sentences.isEmpty()) {
        sentences.append(normalized);
    }

    for (const QString& sentence : sentences) {
        const QStringList words = TextSegmenter::words(sentence);
        if (words.isEmpty()) {
            continue;
        }
        if (words.size() <= static_cast<qsizetype>(m_config.chunkSize)) {
            units.push_back(words);
            continue;
        }
        // Oversized sentence: fall back to word granularity
        for (const QString& word : words) {
            units.push_back(QStringList{word});
        }
    }

    return units;
}

} // namespace dq
