#include "core/vector/similarity_index.h"
#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace dq {

namespace {

double squaredNorm(const Embedding& vector)
{
    double sum = 0.0;
    for (const float value : vector) {
        sum += static_cast<double>(value) * static_cast<double>(value);
    }
    return sum;
}

} // anonymous namespace

SimilarityIndex::SimilarityIndex(std::shared_ptr<const EmbeddingBackend> encoder,
                                 std::vector<Chunk> chunks)
    : m_encoder(std::move(encoder))
{
    if (!m_encoder) {
        return;
    }

    m_dimensions = m_encoder->dimensions();
    const QString identity = m_encoder->identity();

    size_t skipped = 0;
    m_chunks.reserve(chunks.size());
    m_zeroNorm.reserve(chunks.size());
    for (Chunk& chunk : chunks) {
        if (!chunk.embedding || chunk.embeddingBackend != identity
            || static_cast<int>(chunk.embedding->size()) != m_dimensions) {
            ++skipped;
            continue;
        }
        const bool zero = squaredNorm(*chunk.embedding) <= 0.0;
        if (!zero) {
            chunk.embedding = l2Normalize(std::move(*chunk.embedding));
        }
        m_zeroNorm.push_back(zero);
        m_chunks.push_back(std::move(chunk));
    }

    if (m_dimensions > 0) {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(m_dimensions));
    }

    if (skipped > 0) {
        LOG_DEBUG(dqIndex, "SimilarityIndex: %zu chunks excluded (no usable vector)", skipped);
    }
}

SimilarityIndex::~SimilarityIndex() = default;

std::shared_ptr<const SimilarityIndex> SimilarityIndex::empty()
{
    return std::shared_ptr<const SimilarityIndex>(new SimilarityIndex());
}

QString SimilarityIndex::backendIdentity() const
{
    return m_encoder ? m_encoder->identity() : QString();
}

std::vector<SimilarityMatch> SimilarityIndex::query(const Embedding& queryVector, size_t k,
                                                    double minSimilarity) const
{
    std::vector<SimilarityMatch> matches;
    if (k == 0 || m_chunks.empty() || !m_space
        || static_cast<int>(queryVector.size()) != m_dimensions) {
        return matches;
    }

    const bool queryIsZero = squaredNorm(queryVector) <= 0.0;
    const Embedding unitQuery = queryIsZero ? queryVector : l2Normalize(queryVector);

    hnswlib::DISTFUNC<float> distance = m_space->get_dist_func();
    void* distanceParam = m_space->get_dist_func_param();

    std::vector<double> scores(m_chunks.size(), 0.0);
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        if (queryIsZero || m_zeroNorm[i]) {
            continue;
        }
        // InnerProductSpace distance is 1 - dot
        const float dist = distance(unitQuery.data(), m_chunks[i].embedding->data(), distanceParam);
        scores[i] = std::clamp(1.0 - static_cast<double>(dist), -1.0, 1.0);
    }

    std::vector<size_t> order(m_chunks.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (scores[a] != scores[b]) {
            return scores[a] > scores[b];
        }
        return m_chunks[a].chunkIndex < m_chunks[b].chunkIndex;
    });

    for (const size_t i : order) {
        if (matches.size() >= k) {
            break;
        }
        if (scores[i] < minSimilarity) {
            break;
        }
        matches.push_back(SimilarityMatch{m_chunks[i], scores[i]});
    }
    return matches;
}

double SimilarityIndex::cosineSimilarity(const Embedding& a, const Embedding& b)
{
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        normA += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        normB += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    return std::clamp(dot / (std::sqrt(normA) * std::sqrt(normB)), -1.0, 1.0);
}

} // namespace dq
