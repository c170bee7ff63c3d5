#pragma once

#include "core/shared/chunk.h"

#include <QString>

#include <vector>

namespace dq {

class CorpusState;

struct RetrievalResult {
    Chunk chunk;
    double similarity = 0.0;   // cosine, in [-1, 1]
};

// RetrievalRanker -- read path from a query to ranked chunks.
//
// The query is embedded with the encoder of the snapshot being searched,
// so query and passage vectors always share a vector space. Candidates
// below minSimilarity are dropped; an empty result is the "insufficient
// information" signal, not an error.
class RetrievalRanker {
public:
    static constexpr double kDefaultMinSimilarity = 0.1;

    explicit RetrievalRanker(const CorpusState& state,
                             double minSimilarity = kDefaultMinSimilarity);

    std::vector<RetrievalResult> retrieve(const QString& query, int maxResults) const;

    double minSimilarity() const { return m_minSimilarity; }

    // Arithmetic mean of similarities clamped to [0, 1]; 0 for no results.
    static double confidence(const std::vector<RetrievalResult>& results);

private:
    const CorpusState& m_state;
    double m_minSimilarity;
};

} // namespace dq
