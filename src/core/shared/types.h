#pragma once

#include <QByteArray>
#include <QString>
#include <cstdint>

namespace dq {

// An ingested document. Immutable after ingestion except chunkCount.
struct Document {
    QString id;
    QString filename;
    int64_t byteSize = 0;
    QString contentHash;
    double uploadedAt = 0.0;   // seconds since epoch, UTC
    int chunkCount = 0;
};

// Embedding strategy that produced a vector (see EmbeddingBackend).
enum class EmbeddingBackendKind {
    Dense,
    Sparse,
};

QString embeddingBackendKindToString(EmbeddingBackendKind kind);

// Deterministic digest of raw document bytes, used for duplicate detection.
QString computeContentHash(const QByteArray& rawBytes);

// Fresh opaque document identifier.
QString generateDocumentId();

} // namespace dq
