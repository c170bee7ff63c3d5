#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace dq {

// DocumentStore -- persistence consumed by CorpusManager.
//
// Every method is individually atomic. A `false` or `nullopt` return means
// the store itself failed; lastError() then describes why, as seen from the
// calling thread: failures on other threads never replace it. "Nothing
// found" is a successful call with an empty result.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // On success *document holds the match, or nullopt when none exists.
    virtual bool findByHash(const QString& contentHash, std::optional<Document>* document) = 0;
    virtual bool findById(const QString& documentId, std::optional<Document>* document) = 0;

    // Document row and all its chunks, or nothing.
    virtual bool save(const Document& document, const std::vector<Chunk>& chunks) = 0;

    // Every chunk with `filename` hydrated, ordered by document upload time
    // then chunk index.
    virtual std::optional<std::vector<Chunk>> loadAllChunks() = 0;
    virtual std::optional<std::vector<Chunk>> loadChunksForDocument(const QString& documentId) = 0;

    // Most recent upload first.
    virtual std::optional<std::vector<Document>> listDocuments() = 0;

    // Document row and its chunks. Deleting an unknown id succeeds.
    virtual bool deleteDocument(const QString& documentId) = 0;

    // Overwrite embedding/embeddingBackend of existing chunks, matched by chunkId.
    virtual bool updateEmbeddings(const std::vector<Chunk>& chunks) = 0;

    // Most recent failure on the calling thread.
    virtual QString lastError() const = 0;
};

} // namespace dq
