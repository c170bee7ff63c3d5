#pragma once

#include "core/embedding/embedding_backend.h"
#include "core/indexing/chunker.h"
#include "core/indexing/corpus_state.h"
#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace dq {

class DocumentStore;

struct IngestResult {
    enum class Status {
        Success,
        DuplicateDocument,   // content hash already stored; `document` is the existing one
        EmptyDocument,       // no text, or zero chunks
        UnsupportedFormat,
        SizeExceeded,
        Inaccessible,
        StoreFailure,        // nothing was committed
    };

    Status status = Status::StoreFailure;
    std::optional<Document> document;
    int unembeddedChunks = 0;   // stored without a vector, excluded from search
    std::optional<QString> errorMessage;
};

struct RemoveResult {
    enum class Status {
        Removed,
        NotFound,
        StoreFailure,
    };

    Status status = Status::StoreFailure;
    std::optional<QString> errorMessage;
};

QString ingestStatusToString(IngestResult::Status status);

// CorpusManager -- the mutation path. Owns the CorpusState and is the only
// component that writes to the DocumentStore.
//
// Every ingest/remove holds an exclusive mutex across "persist -> rebuild
// -> publish". Rebuilds are wholesale: the backend is refitted over the
// complete chunk set, stored vectors whose backend identity still matches
// are reused, the rest are recomputed and written back.
class CorpusManager {
public:
    CorpusManager(DocumentStore& store,
                  std::shared_ptr<const EmbeddingBackend> backend,
                  const ChunkerConfig& chunkerConfig = {});

    CorpusManager(const CorpusManager&) = delete;
    CorpusManager& operator=(const CorpusManager&) = delete;

    // Rebuild the index from whatever the store holds (startup reload).
    bool reload(QString* errorMessage = nullptr);

    IngestResult ingest(const QString& rawText, const QString& filename,
                        int64_t byteSize, const QString& contentHash);
    RemoveResult remove(const QString& documentId);

    std::optional<std::vector<Document>> listDocuments();
    std::optional<std::vector<Chunk>> documentChunks(const QString& documentId);

    const CorpusState& state() const { return m_state; }
    const EmbeddingBackend& backend() const { return *m_backend; }
    const Chunker& chunker() const { return m_chunker; }

private:
    // Caller holds m_mutationMutex. `encoder` may be null: fitted here.
    bool rebuildLocked(std::shared_ptr<const EmbeddingBackend> encoder, QString* errorMessage);

    DocumentStore& m_store;
    std::shared_ptr<const EmbeddingBackend> m_backend;
    Chunker m_chunker;
    CorpusState m_state;
    std::mutex m_mutationMutex;
};

} // namespace dq
