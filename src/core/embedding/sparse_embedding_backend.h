#pragma once

#include "core/embedding/embedding_backend.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

namespace dq {

struct SparseEmbeddingConfig {
    int maxFeatures = 5000;
    int minNgram = 1;
    int maxNgram = 2;
};

// SparseEmbeddingBackend -- TF-IDF term vectors, the fallback when no dense
// model is available.
//
// Terms are lower-cased word tokens of two or more characters with English
// stop words removed, plus their n-grams up to maxNgram. The vocabulary
// keeps the maxFeatures most frequent terms across the fitted corpus
// (ties broken alphabetically) and is indexed in alphabetical order.
// Weights are raw term count times smoothed idf, ln((1+n)/(1+df)) + 1,
// then L2-normalized.
//
// An unfitted instance has an empty vocabulary and embeds every text as a
// zero-length vector; fitCorpus() returns a new fitted instance.
class SparseEmbeddingBackend : public EmbeddingBackend {
public:
    explicit SparseEmbeddingBackend(SparseEmbeddingConfig config = {});

    EmbeddingBackendKind kind() const override;
    QString identity() const override;
    int dimensions() const override;
    EmbeddingBatch embed(const std::vector<QString>& texts) const override;
    std::shared_ptr<const EmbeddingBackend> fitCorpus(
        const std::vector<QString>& corpus) const override;

    // Fitted vocabulary in index order.
    QStringList vocabulary() const;
    double idf(const QString& term) const;

    // Terms (unigrams and n-grams) extracted from text, in order.
    QStringList analyze(const QString& text) const;

private:
    SparseEmbeddingConfig m_config;
    QHash<QString, int> m_termIndex;
    std::vector<double> m_idf;
    QString m_identity;
};

} // namespace dq
