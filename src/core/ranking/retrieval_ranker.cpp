#include "core/ranking/retrieval_ranker.h"
#include "core/indexing/corpus_state.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <utility>

namespace dq {

RetrievalRanker::RetrievalRanker(const CorpusState& state, double minSimilarity)
    : m_state(state)
    , m_minSimilarity(minSimilarity)
{
}

std::vector<RetrievalResult> RetrievalRanker::retrieve(const QString& query, int maxResults) const
{
    std::vector<RetrievalResult> results;
    if (maxResults <= 0 || query.trimmed().isEmpty()) {
        return results;
    }

    // Hold the snapshot for the whole query; no lock is kept while scoring
    const std::shared_ptr<const SimilarityIndex> snapshot = m_state.snapshot();
    if (!snapshot || snapshot->isEmpty() || !snapshot->encoder()) {
        LOG_DEBUG(dqRanking, "retrieve: empty index");
        return results;
    }

    QElapsedTimer timer;
    timer.start();

    const EmbeddingBatch queryVectors = snapshot->encoder()->embed({query});
    if (queryVectors.empty() || !queryVectors.front()) {
        LOG_WARN(dqRanking, "retrieve: query embedding unavailable (%s)",
                 qUtf8Printable(snapshot->backendIdentity()));
        return results;
    }

    std::vector<SimilarityMatch> matches = snapshot->query(
        *queryVectors.front(), static_cast<size_t>(maxResults), m_minSimilarity);

    results.reserve(matches.size());
    for (SimilarityMatch& match : matches) {
        results.push_back(RetrievalResult{std::move(match.chunk), match.similarity});
    }

    LOG_DEBUG(dqRanking, "retrieve: %zu of %zu chunks above %.2f in %lld ms",
              results.size(), snapshot->size(), m_minSimilarity,
              static_cast<long long>(timer.elapsed()));
    return results;
}

double RetrievalRanker::confidence(const std::vector<RetrievalResult>& results)
{
    if (results.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const RetrievalResult& result : results) {
        sum += result.similarity;
    }
    return std::clamp(sum / static_cast<double>(results.size()), 0.0, 1.0);
}

} // namespace dq
