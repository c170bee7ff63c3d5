#include "core/embedding/sparse_embedding_backend.h"
#include "core/shared/logging.h"
#include "core/shared/stopwords.h"
#include "core/shared/text_segmenter.h"

#include <QCryptographicHash>
#include <QSet>

#include <algorithm>
#include <cmath>
#include <utility>

namespace dq {

SparseEmbeddingBackend::SparseEmbeddingBackend(SparseEmbeddingConfig config)
    : m_config(config)
    , m_identity(QStringLiteral("tfidf:unfitted"))
{
    m_config.maxFeatures = std::max(1, m_config.maxFeatures);
    m_config.minNgram = std::max(1, m_config.minNgram);
    m_config.maxNgram = std::max(m_config.minNgram, m_config.maxNgram);
}

EmbeddingBackendKind SparseEmbeddingBackend::kind() const
{
    return EmbeddingBackendKind::Sparse;
}

QString SparseEmbeddingBackend::identity() const
{
    return m_identity;
}

int SparseEmbeddingBackend::dimensions() const
{
    return static_cast<int>(m_idf.size());
}

QStringList SparseEmbeddingBackend::analyze(const QString& text) const
{
    QStringList words;
    for (const QString& token : TextSegmenter::tokens(text, 2)) {
        if (!isStopword(token)) {
            words.append(token);
        }
    }

    QStringList terms;
    for (int n = m_config.minNgram; n <= m_config.maxNgram; ++n) {
        for (int i = 0; i + n <= words.size(); ++i) {
            terms.append(n == 1 ? words.at(i) : words.mid(i, n).join(QLatin1Char(' ')));
        }
    }
    return terms;
}

std::shared_ptr<const EmbeddingBackend> SparseEmbeddingBackend::fitCorpus(
    const std::vector<QString>& corpus) const
{
    QHash<QString, int> documentFrequency;
    QHash<QString, qint64> totalCount;

    for (const QString& text : corpus) {
        QSet<QString> seen;
        for (const QString& term : analyze(text)) {
            totalCount[term] += 1;
            if (!seen.contains(term)) {
                seen.insert(term);
                documentFrequency[term] += 1;
            }
        }
    }

    QStringList terms = documentFrequency.keys();
    if (terms.size() > m_config.maxFeatures) {
        std::sort(terms.begin(), terms.end(), [&totalCount](const QString& a, const QString& b) {
            const qint64 ca = totalCount.value(a);
            const qint64 cb = totalCount.value(b);
            if (ca != cb) {
                return ca > cb;
            }
            return a < b;
        });
        terms = terms.mid(0, m_config.maxFeatures);
    }
    std::sort(terms.begin(), terms.end());

    auto fitted = std::make_shared<SparseEmbeddingBackend>(m_config);
    const double n = static_cast<double>(corpus.size());
    fitted->m_idf.reserve(static_cast<size_t>(terms.size()));

    QCryptographicHash digest(QCryptographicHash::Sha256);
    for (int i = 0; i < terms.size(); ++i) {
        const QString& term = terms.at(i);
        const double df = static_cast<double>(documentFrequency.value(term));
        const double idf = std::log((1.0 + n) / (1.0 + df)) + 1.0;
        fitted->m_termIndex.insert(term, i);
        fitted->m_idf.push_back(idf);

        digest.addData(term.toUtf8());
        digest.addData(QByteArray::number(idf, 'g', 12));
        digest.addData(QByteArray(1, '\n'));
    }

    fitted->m_identity = QStringLiteral("tfidf:")
        + QString::fromLatin1(digest.result().toHex().left(16));

    LOG_DEBUG(dqEmbedding, "SparseEmbeddingBackend: fitted %d terms over %zu texts (%s)",
              static_cast<int>(terms.size()), corpus.size(), qUtf8Printable(fitted->m_identity));
    return fitted;
}

EmbeddingBatch SparseEmbeddingBackend::embed(const std::vector<QString>& texts) const
{
    EmbeddingBatch results;
    results.reserve(texts.size());

    for (const QString& text : texts) {
        Embedding vector(m_idf.size(), 0.0f);
        if (!m_idf.empty()) {
            std::vector<double> weights(m_idf.size(), 0.0);
            for (const QString& term : analyze(text)) {
                const auto it = m_termIndex.constFind(term);
                if (it != m_termIndex.constEnd()) {
                    weights[static_cast<size_t>(it.value())] += 1.0;
                }
            }
            for (size_t i = 0; i < weights.size(); ++i) {
                vector[i] = static_cast<float>(weights[i] * m_idf[i]);
            }
        }
        results.emplace_back(l2Normalize(std::move(vector)));
    }

    return results;
}

QStringList SparseEmbeddingBackend::vocabulary() const
{
    QStringList terms(m_termIndex.size());
    for (auto it = m_termIndex.constBegin(); it != m_termIndex.constEnd(); ++it) {
        terms[it.value()] = it.key();
    }
    return terms;
}

double SparseEmbeddingBackend::idf(const QString& term) const
{
    const auto it = m_termIndex.constFind(term);
    if (it == m_termIndex.constEnd()) {
        return 0.0;
    }
    return m_idf[static_cast<size_t>(it.value())];
}

} // namespace dq
