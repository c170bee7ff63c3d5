#pragma once

#include "core/index/document_store.h"

#include <QHash>
#include <QString>

#include <mutex>
#include <optional>
#include <vector>

namespace dq::test {

// DocumentStore held in memory, with switches that make individual
// operations fail the way a broken database would.
class InMemoryDocumentStore : public DocumentStore {
public:
    bool findByHash(const QString& contentHash, std::optional<Document>* document) override;
    bool findById(const QString& documentId, std::optional<Document>* document) override;
    bool save(const Document& document, const std::vector<Chunk>& chunks) override;
    std::optional<std::vector<Chunk>> loadAllChunks() override;
    std::optional<std::vector<Chunk>> loadChunksForDocument(const QString& documentId) override;
    std::optional<std::vector<Document>> listDocuments() override;
    bool deleteDocument(const QString& documentId) override;
    bool updateEmbeddings(const std::vector<Chunk>& chunks) override;
    QString lastError() const override;

    // Failure injection
    bool failFind = false;
    bool failSave = false;
    bool failDelete = false;
    bool failUpdateEmbeddings = false;
    // loadAllChunks() succeeds this many more times, then fails. -1 = never fails.
    int loadAllChunksBudget = -1;

    int saveCalls() const;
    int updateEmbeddingsCalls() const;
    std::vector<Chunk> storedChunks() const;

private:
    bool fail(const char* operation);

    mutable std::mutex m_mutex;
    std::vector<Document> m_documents;
    std::vector<Chunk> m_chunks;
    QHash<Qt::HANDLE, QString> m_lastErrors;   // per calling thread
    int m_saveCalls = 0;
    int m_updateEmbeddingsCalls = 0;
};

} // namespace dq::test
