#pragma once

#include "core/index/document_store.h"
#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QHash>
#include <QString>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace dq {

// SQLiteStore -- DocumentStore over a single SQLite database.
//
// One connection, serialized by an internal mutex so the mutation path and
// concurrent readers (listDocuments, loadChunksForDocument) can share it.
// lastError() is kept per calling thread, so a failing reader never
// replaces the message a writer is about to report.
// Multi-row writes run inside a SAVEPOINT: a document and its chunks are
// committed together or not at all. Chunk rows cascade from documents.
class SQLiteStore : public DocumentStore {
public:
    ~SQLiteStore() override;

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path (":memory:" allowed).
    // Creates schema and sets pragmas on first open.
    static std::unique_ptr<SQLiteStore> open(const QString& dbPath);

    bool findByHash(const QString& contentHash, std::optional<Document>* document) override;
    bool findById(const QString& documentId, std::optional<Document>* document) override;
    bool save(const Document& document, const std::vector<Chunk>& chunks) override;
    std::optional<std::vector<Chunk>> loadAllChunks() override;
    std::optional<std::vector<Chunk>> loadChunksForDocument(const QString& documentId) override;
    std::optional<std::vector<Document>> listDocuments() override;
    bool deleteDocument(const QString& documentId) override;
    bool updateEmbeddings(const std::vector<Chunk>& chunks) override;
    QString lastError() const override;

    int schemaVersion();

    // Little-endian float32 encoding used for the embedding column.
    static QByteArray encodeEmbedding(const Embedding& embedding);
    static std::optional<Embedding> decodeEmbedding(const void* data, int bytes, int dimensions);

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    void recordError(const char* context);
    void setLastError(const QString& message);

    bool findDocument(const char* sql, const QString& key, std::optional<Document>* document);
    std::optional<std::vector<Chunk>> loadChunks(const char* sql, const QString* documentId);
    bool rollback(const char* savepoint, const char* context);

    sqlite3* m_db = nullptr;
    mutable std::mutex m_mutex;
    QHash<Qt::HANDLE, QString> m_lastErrors;   // keyed by calling thread, guarded by m_mutex
};

} // namespace dq
