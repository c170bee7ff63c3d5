#include "core/indexing/corpus_manager.h"
#include "core/index/document_store.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>

#include <utility>

namespace dq {

QString ingestStatusToString(IngestResult::Status status)
{
    switch (status) {
    case IngestResult::Status::Success:           return QStringLiteral("success");
    case IngestResult::Status::DuplicateDocument: return QStringLiteral("duplicate_document");
    case IngestResult::Status::EmptyDocument:     return QStringLiteral("empty_document");
    case IngestResult::Status::UnsupportedFormat: return QStringLiteral("unsupported_format");
    case IngestResult::Status::SizeExceeded:      return QStringLiteral("size_exceeded");
    case IngestResult::Status::Inaccessible:      return QStringLiteral("inaccessible");
    case IngestResult::Status::StoreFailure:      return QStringLiteral("store_failure");
    }
    return QStringLiteral("unknown");
}

CorpusManager::CorpusManager(DocumentStore& store,
                             std::shared_ptr<const EmbeddingBackend> backend,
                             const ChunkerConfig& chunkerConfig)
    : m_store(store)
    , m_backend(std::move(backend))
    , m_chunker(chunkerConfig)
{
}

bool CorpusManager::reload(QString* errorMessage)
{
    std::lock_guard<std::mutex> lock(m_mutationMutex);
    return rebuildLocked(nullptr, errorMessage);
}

IngestResult CorpusManager::ingest(const QString& rawText, const QString& filename,
                                   int64_t byteSize, const QString& contentHash)
{
    std::lock_guard<std::mutex> lock(m_mutationMutex);

    IngestResult result;

    std::optional<Document> existing;
    if (!m_store.findByHash(contentHash, &existing)) {
        result.status = IngestResult::Status::StoreFailure;
        result.errorMessage = m_store.lastError();
        LOG_ERROR(dqCore, "Ingest of '%s' aborted: %s", qUtf8Printable(filename),
                  qUtf8Printable(*result.errorMessage));
        return result;
    }
    if (existing) {
        result.status = IngestResult::Status::DuplicateDocument;
        result.document = existing;
        result.errorMessage = QStringLiteral("Document already uploaded as '%1'").arg(existing->filename);
        LOG_INFO(dqCore, "Ingest of '%s' rejected: duplicate of %s", qUtf8Printable(filename),
                 qUtf8Printable(existing->id));
        return result;
    }

    const std::vector<QString> passages = m_chunker.split(rawText);
    if (passages.empty()) {
        result.status = IngestResult::Status::EmptyDocument;
        result.errorMessage = QStringLiteral("No text could be extracted from the document");
        LOG_INFO(dqCore, "Ingest of '%s' rejected: empty document", qUtf8Printable(filename));
        return result;
    }

    std::optional<std::vector<Chunk>> current = m_store.loadAllChunks();
    if (!current) {
        result.status = IngestResult::Status::StoreFailure;
        result.errorMessage = m_store.lastError();
        LOG_ERROR(dqCore, "Ingest of '%s' aborted: %s", qUtf8Printable(filename),
                  qUtf8Printable(*result.errorMessage));
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    std::vector<QString> corpus;
    corpus.reserve(current->size() + passages.size());
    for (const Chunk& chunk : *current) {
        corpus.push_back(chunk.text);
    }
    corpus.insert(corpus.end(), passages.begin(), passages.end());

    const std::shared_ptr<const EmbeddingBackend> encoder = m_backend->fitCorpus(corpus);
    const EmbeddingBatch vectors = encoder->embed(passages);
    const QString identity = encoder->identity();

    Document document;
    document.id = generateDocumentId();
    document.filename = filename;
    document.byteSize = byteSize;
    document.contentHash = contentHash;
    document.uploadedAt = static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
    document.chunkCount = static_cast<int>(passages.size());

    std::vector<Chunk> chunks;
    chunks.reserve(passages.size());
    for (size_t i = 0; i < passages.size(); ++i) {
        Chunk chunk;
        chunk.documentId = document.id;
        chunk.filename = filename;
        chunk.chunkIndex = static_cast<int>(i);
        chunk.chunkId = computeChunkId(document.id, chunk.chunkIndex);
        chunk.text = passages[i];
        if (i < vectors.size() && vectors[i]) {
            chunk.embedding = vectors[i];
            chunk.embeddingBackend = identity;
        } else {
            ++result.unembeddedChunks;
        }
        chunks.push_back(std::move(chunk));
    }

    if (result.unembeddedChunks > 0) {
        LOG_WARN(dqCore, "Ingest of '%s': %d of %zu chunks stored without embedding",
                 qUtf8Printable(filename), result.unembeddedChunks, chunks.size());
    }

    if (!m_store.save(document, chunks)) {
        result.status = IngestResult::Status::StoreFailure;
        result.errorMessage = m_store.lastError();
        LOG_ERROR(dqCore, "Ingest of '%s' aborted: %s", qUtf8Printable(filename),
                  qUtf8Printable(*result.errorMessage));
        return result;
    }

    QString rebuildError;
    if (!rebuildLocked(encoder, &rebuildError)) {
        // Undo the save so store and index stay in agreement
        if (!m_store.deleteDocument(document.id)) {
            LOG_ERROR(dqCore, "Failed to roll back document %s: %s",
                      qUtf8Printable(document.id), qUtf8Printable(m_store.lastError()));
        }
        result.status = IngestResult::Status::StoreFailure;
        result.errorMessage = rebuildError;
        LOG_ERROR(dqCore, "Ingest of '%s' aborted during reindex: %s", qUtf8Printable(filename),
                  qUtf8Printable(rebuildError));
        return result;
    }

    result.status = IngestResult::Status::Success;
    result.document = document;
    LOG_INFO(dqCore, "Ingested '%s' as %s: %zu chunks in %lld ms", qUtf8Printable(filename),
             qUtf8Printable(document.id), chunks.size(), static_cast<long long>(timer.elapsed()));
    return result;
}

RemoveResult CorpusManager::remove(const QString& documentId)
{
    std::lock_guard<std::mutex> lock(m_mutationMutex);

    RemoveResult result;

    std::optional<Document> existing;
    if (!m_store.findById(documentId, &existing)) {
        result.status = RemoveResult::Status::StoreFailure;
        result.errorMessage = m_store.lastError();
        LOG_ERROR(dqCore, "Remove of %s aborted: %s", qUtf8Printable(documentId),
                  qUtf8Printable(*result.errorMessage));
        return result;
    }
    if (!existing) {
        result.status = RemoveResult::Status::NotFound;
        return result;
    }

    if (!m_store.deleteDocument(documentId)) {
        result.status = RemoveResult::Status::StoreFailure;
        result.errorMessage = m_store.lastError();
        LOG_ERROR(dqCore, "Remove of %s aborted: %s", qUtf8Printable(documentId),
                  qUtf8Printable(*result.errorMessage));
        return result;
    }

    QString rebuildError;
    if (!rebuildLocked(nullptr, &rebuildError)) {
        // The delete is committed; drop the document's chunks from the live
        // snapshot so it can no longer be retrieved.
        const std::shared_ptr<const SimilarityIndex> current = m_state.snapshot();
        std::vector<Chunk> remaining;
        for (const Chunk& chunk : current->chunks()) {
            if (chunk.documentId != documentId) {
                remaining.push_back(chunk);
            }
        }
        m_state.publish(std::make_shared<const SimilarityIndex>(current->encoder(),
                                                                std::move(remaining)));
        LOG_ERROR(dqCore, "Reindex after removing %s failed: %s", qUtf8Printable(documentId),
                  qUtf8Printable(rebuildError));
    }

    result.status = RemoveResult::Status::Removed;
    LOG_INFO(dqCore, "Removed document %s ('%s')", qUtf8Printable(documentId),
             qUtf8Printable(existing->filename));
    return result;
}

std::optional<std::vector<Document>> CorpusManager::listDocuments()
{
    return m_store.listDocuments();
}

std::optional<std::vector<Chunk>> CorpusManager::documentChunks(const QString& documentId)
{
    return m_store.loadChunksForDocument(documentId);
}

bool CorpusManager::rebuildLocked(std::shared_ptr<const EmbeddingBackend> encoder,
                                  QString* errorMessage)
{
    QElapsedTimer timer;
    timer.start();

    std::optional<std::vector<Chunk>> chunks = m_store.loadAllChunks();
    if (!chunks) {
        if (errorMessage) {
            *errorMessage = m_store.lastError();
        }
        return false;
    }

    if (!encoder) {
        std::vector<QString> corpus;
        corpus.reserve(chunks->size());
        for (const Chunk& chunk : *chunks) {
            corpus.push_back(chunk.text);
        }
        encoder = m_backend->fitCorpus(corpus);
    }

    const QString identity = encoder->identity();
    const int dims = encoder->dimensions();

    std::vector<size_t> staleIndices;
    std::vector<QString> staleTexts;
    for (size_t i = 0; i < chunks->size(); ++i) {
        const Chunk& chunk = (*chunks)[i];
        const bool current = chunk.embedding && chunk.embeddingBackend == identity
            && static_cast<int>(chunk.embedding->size()) == dims;
        if (!current) {
            staleIndices.push_back(i);
            staleTexts.push_back(chunk.text);
        }
    }

    std::vector<Chunk> updates;
    int unembedded = 0;
    if (!staleTexts.empty()) {
        const EmbeddingBatch vectors = encoder->embed(staleTexts);
        for (size_t j = 0; j < staleIndices.size(); ++j) {
            Chunk& chunk = (*chunks)[staleIndices[j]];
            const bool hadVector = chunk.embedding.has_value();
            if (j < vectors.size() && vectors[j]) {
                chunk.embedding = vectors[j];
                chunk.embeddingBackend = identity;
            } else {
                chunk.embedding.reset();
                chunk.embeddingBackend.clear();
                ++unembedded;
                if (!hadVector) {
                    continue;
                }
            }
            updates.push_back(chunk);
        }
    }

    if (unembedded > 0) {
        LOG_WARN(dqIndex, "Reindex: %d chunks have no embedding and are excluded from search",
                 unembedded);
    }

    // Stored vectors are a cache of the index; a failed write-back only
    // means they are recomputed on the next rebuild.
    if (!updates.empty() && !m_store.updateEmbeddings(updates)) {
        LOG_WARN(dqIndex, "Reindex: writing %zu recomputed embeddings failed: %s",
                 updates.size(), qUtf8Printable(m_store.lastError()));
    }

    auto index = std::make_shared<const SimilarityIndex>(encoder, std::move(*chunks));
    const size_t indexed = index->size();
    m_state.publish(std::move(index));

    LOG_INFO(dqIndex, "Index rebuilt: %zu vectors (%zu recomputed) backend=%s in %lld ms",
             indexed, staleIndices.size(), qUtf8Printable(identity),
             static_cast<long long>(timer.elapsed()));
    return true;
}

} // namespace dq
