#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>

#include <memory>
#include <optional>
#include <vector>

namespace dq {

using EmbeddingBatch = std::vector<std::optional<Embedding>>;

// EmbeddingBackend -- maps text to fixed-length vectors.
//
// Vectors are only comparable when produced under the same identity().
// Corpus-dependent backends (TF-IDF) are fitted with fitCorpus() and the
// fitted instance is what embeds both passages and queries for one index
// snapshot.
class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;

    virtual EmbeddingBackendKind kind() const = 0;

    // Stable tag stored beside each vector. Changes whenever the vector
    // space changes (different model, refitted vocabulary).
    virtual QString identity() const = 0;

    virtual int dimensions() const = 0;

    // One entry per input, in order. nullopt marks a text the backend
    // could not embed; the caller decides how to treat it.
    virtual EmbeddingBatch embed(const std::vector<QString>& texts) const = 0;

    // Encoder for an index built over `corpus`. Backends that do not
    // depend on the corpus return themselves.
    virtual std::shared_ptr<const EmbeddingBackend> fitCorpus(
        const std::vector<QString>& corpus) const = 0;
};

// Scale to unit L2 norm. Zero vectors are returned unchanged.
Embedding l2Normalize(Embedding embedding);

} // namespace dq
