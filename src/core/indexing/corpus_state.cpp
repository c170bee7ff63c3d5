#include "core/indexing/corpus_state.h"

#include <mutex>
#include <utility>

namespace dq {

CorpusState::CorpusState()
    : m_snapshot(SimilarityIndex::empty())
{
}

std::shared_ptr<const SimilarityIndex> CorpusState::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_snapshot;
}

void CorpusState::publish(std::shared_ptr<const SimilarityIndex> index)
{
    if (!index) {
        index = SimilarityIndex::empty();
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_snapshot = std::move(index);
    ++m_generation;
}

quint64 CorpusState::generation() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_generation;
}

} // namespace dq
