#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace dq {

using Embedding = std::vector<float>;

// A passage of a document, the unit of indexing and retrieval.
// `filename` is hydrated from the parent document when chunks are loaded.
struct Chunk {
    QString chunkId;
    QString documentId;
    QString filename;
    int chunkIndex = 0;
    QString text;

    // Absent when the embedding backend failed for this chunk. Absent
    // chunks stay in the store but never enter the similarity index.
    std::optional<Embedding> embedding;
    QString embeddingBackend;
};

// Compute stable chunk ID: SHA-256 of "documentId#chunkIndex"
QString computeChunkId(const QString& documentId, int chunkIndex);

} // namespace dq
