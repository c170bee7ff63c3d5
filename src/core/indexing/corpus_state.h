#pragma once

#include "core/vector/similarity_index.h"

#include <QtGlobal>

#include <memory>
#include <shared_mutex>

namespace dq {

// CorpusState -- holder of the current SimilarityIndex snapshot.
//
// Readers call snapshot() and keep the returned pointer for the rest of
// their query; no lock is held while they score. publish() swaps the
// snapshot in one step, so a reader sees the old index or the new one,
// never a mix. Owned by CorpusManager; handed by reference to readers.
class CorpusState {
public:
    CorpusState();

    CorpusState(const CorpusState&) = delete;
    CorpusState& operator=(const CorpusState&) = delete;

    std::shared_ptr<const SimilarityIndex> snapshot() const;
    void publish(std::shared_ptr<const SimilarityIndex> index);

    // Incremented on every publish().
    quint64 generation() const;

private:
    mutable std::shared_mutex m_mutex;
    std::shared_ptr<const SimilarityIndex> m_snapshot;
    quint64 m_generation = 0;
};

} // namespace dq
