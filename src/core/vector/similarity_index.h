#pragma once

#include "core/embedding/embedding_backend.h"
#include "core/shared/chunk.h"

#include <QString>

#include <cstddef>
#include <memory>
#include <vector>

namespace hnswlib {
class InnerProductSpace;
} // namespace hnswlib

namespace dq {

struct SimilarityMatch {
    Chunk chunk;
    double similarity = 0.0;   // cosine, in [-1, 1]
};

// SimilarityIndex -- immutable snapshot of every embedded chunk plus the
// encoder that produced the vectors. Built wholesale by CorpusManager and
// shared read-only with concurrent queries.
//
// Only chunks whose embedding is present, carries the encoder identity and
// has the encoder's dimensionality enter the snapshot. Vectors are stored
// unit-normalized so cosine is a plain inner product; zero-norm vectors
// score 0 against everything.
//
// query() scans exhaustively, so results are exact and reproducible:
// descending score, then ascending chunk index, then snapshot order.
class SimilarityIndex {
public:
    SimilarityIndex(std::shared_ptr<const EmbeddingBackend> encoder, std::vector<Chunk> chunks);
    ~SimilarityIndex();

    SimilarityIndex(const SimilarityIndex&) = delete;
    SimilarityIndex& operator=(const SimilarityIndex&) = delete;

    // An index with no encoder and no entries.
    static std::shared_ptr<const SimilarityIndex> empty();

    const std::shared_ptr<const EmbeddingBackend>& encoder() const { return m_encoder; }
    QString backendIdentity() const;
    int dimensions() const { return m_dimensions; }

    size_t size() const { return m_chunks.size(); }
    bool isEmpty() const { return m_chunks.empty(); }
    const std::vector<Chunk>& chunks() const { return m_chunks; }

    // Top `k` entries with similarity >= minSimilarity.
    std::vector<SimilarityMatch> query(const Embedding& queryVector, size_t k,
                                       double minSimilarity = -1.0) const;

    // Cosine of two raw vectors; 0 when either has zero norm or the sizes differ.
    static double cosineSimilarity(const Embedding& a, const Embedding& b);

private:
    SimilarityIndex() = default;

    std::shared_ptr<const EmbeddingBackend> m_encoder;
    std::vector<Chunk> m_chunks;
    std::vector<bool> m_zeroNorm;
    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
};

} // namespace dq
