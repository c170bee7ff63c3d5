#include "core/index/sqlite_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QThread>
#include <QtEndian>

#include <cstring>

namespace dq {

namespace {

Document readDocumentRow(sqlite3_stmt* stmt)
{
    Document doc;
    doc.id = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    doc.filename = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
    doc.byteSize = sqlite3_column_int64(stmt, 2);
    doc.contentHash = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3)));
    doc.uploadedAt = sqlite3_column_double(stmt, 4);
    doc.chunkCount = sqlite3_column_int(stmt, 5);
    return doc;
}

} // anonymous namespace

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    std::unique_ptr<SQLiteStore> store(new SQLiteStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(dqIndex, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(dqIndex, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='documents'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(dqIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(dqIndex, "Failed to create schema");
            return false;
        }
    } else if (schemaVersion() > kCurrentSchemaVersion) {
        LOG_ERROR(dqIndex, "Database schema version %d is newer than supported %d",
                  schemaVersion(), kCurrentSchemaVersion);
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(dqIndex, "Database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        setLastError(QString::fromUtf8(errMsg ? errMsg : "unknown"));
        LOG_ERROR(dqIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

sqlite3_stmt* SQLiteStore::prepare(const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        recordError("prepare");
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return stmt;
}

void SQLiteStore::recordError(const char* context)
{
    const QString message = QStringLiteral("%1: %2").arg(QString::fromUtf8(context),
                                                        QString::fromUtf8(sqlite3_errmsg(m_db)));
    setLastError(message);
    LOG_ERROR(dqIndex, "%s", qUtf8Printable(message));
}

void SQLiteStore::setLastError(const QString& message)
{
    m_lastErrors.insert(QThread::currentThreadId(), message);
}

bool SQLiteStore::rollback(const char* savepoint, const char* context)
{
    recordError(context);
    const QString failure = m_lastErrors.value(QThread::currentThreadId());
    const QByteArray rollbackSql = QByteArray("ROLLBACK TO SAVEPOINT ") + savepoint;
    const QByteArray releaseSql = QByteArray("RELEASE SAVEPOINT ") + savepoint;
    if (!execSql(rollbackSql.constData()) || !execSql(releaseSql.constData())) {
        LOG_ERROR(dqIndex, "Rollback of savepoint %s failed", savepoint);
    }
    setLastError(failure);
    return false;
}

QString SQLiteStore::lastError() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastErrors.value(QThread::currentThreadId());
}

int SQLiteStore::schemaVersion()
{
    int version = 0;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA user_version", -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

// ── Embedding encoding ──────────────────────────────────────

QByteArray SQLiteStore::encodeEmbedding(const Embedding& embedding)
{
    QByteArray blob(static_cast<int>(embedding.size() * sizeof(quint32)), Qt::Uninitialized);
    uchar* out = reinterpret_cast<uchar*>(blob.data());
    for (size_t i = 0; i < embedding.size(); ++i) {
        quint32 bits = 0;
        std::memcpy(&bits, &embedding[i], sizeof(bits));
        qToLittleEndian<quint32>(bits, out + i * sizeof(quint32));
    }
    return blob;
}

std::optional<Embedding> SQLiteStore::decodeEmbedding(const void* data, int bytes, int dimensions)
{
    if (dimensions < 0 || bytes != dimensions * static_cast<int>(sizeof(quint32))) {
        return std::nullopt;
    }
    if (dimensions == 0) {
        return Embedding();
    }
    if (!data) {
        return std::nullopt;
    }
    const uchar* in = static_cast<const uchar*>(data);
    Embedding embedding(static_cast<size_t>(dimensions));
    for (int i = 0; i < dimensions; ++i) {
        const quint32 bits = qFromLittleEndian<quint32>(in + static_cast<size_t>(i) * sizeof(quint32));
        std::memcpy(&embedding[static_cast<size_t>(i)], &bits, sizeof(bits));
    }
    return embedding;
}

// ── Documents ───────────────────────────────────────────────

bool SQLiteStore::findDocument(const char* sql, const QString& key,
                               std::optional<Document>* document)
{
    if (document) {
        document->reset();
    }

    sqlite3_stmt* stmt = prepare(sql);
    if (!stmt) {
        return false;
    }

    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        if (document) {
            *document = readDocumentRow(stmt);
        }
    } else if (rc != SQLITE_DONE) {
        recordError("findDocument");
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool SQLiteStore::findByHash(const QString& contentHash, std::optional<Document>* document)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return findDocument(
        "SELECT id, filename, byte_size, content_hash, uploaded_at, chunk_count "
        "FROM documents WHERE content_hash = ?1",
        contentHash, document);
}

bool SQLiteStore::findById(const QString& documentId, std::optional<Document>* document)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return findDocument(
        "SELECT id, filename, byte_size, content_hash, uploaded_at, chunk_count "
        "FROM documents WHERE id = ?1",
        documentId, document);
}

std::optional<std::vector<Document>> SQLiteStore::listDocuments()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = prepare(
        "SELECT id, filename, byte_size, content_hash, uploaded_at, chunk_count "
        "FROM documents ORDER BY uploaded_at DESC, rowid DESC");
    if (!stmt) {
        return std::nullopt;
    }

    std::vector<Document> documents;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        documents.push_back(readDocumentRow(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        recordError("listDocuments");
        return std::nullopt;
    }
    return documents;
}

bool SQLiteStore::save(const Document& document, const std::vector<Chunk>& chunks)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!execSql("SAVEPOINT save_document")) {
        return false;
    }

    {
        sqlite3_stmt* stmt = prepare(R"(
            INSERT INTO documents (id, filename, byte_size, content_hash, uploaded_at, chunk_count)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6)
        )");
        if (!stmt) {
            return rollback("save_document", "document insert prepare");
        }
        const QByteArray idUtf8 = document.id.toUtf8();
        const QByteArray nameUtf8 = document.filename.toUtf8();
        const QByteArray hashUtf8 = document.contentHash.toUtf8();
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, nameUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, document.byteSize);
        sqlite3_bind_text(stmt, 4, hashUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 5, document.uploadedAt);
        sqlite3_bind_int(stmt, 6, static_cast<int>(chunks.size()));
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return rollback("save_document", "document insert");
        }
    }

    const char* chunkSql = R"(
        INSERT INTO chunks (id, document_id, chunk_index, chunk_text, embedding,
                            embedding_backend, dimensions)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";

    const QByteArray docIdUtf8 = document.id.toUtf8();
    for (const Chunk& chunk : chunks) {
        sqlite3_stmt* stmt = prepare(chunkSql);
        if (!stmt) {
            return rollback("save_document", "chunk insert prepare");
        }

        const QByteArray idUtf8 = chunk.chunkId.toUtf8();
        const QByteArray textUtf8 = chunk.text.toUtf8();
        const QByteArray backendUtf8 = chunk.embeddingBackend.toUtf8();
        const QByteArray blob = chunk.embedding ? encodeEmbedding(*chunk.embedding) : QByteArray();

        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, docIdUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 3, chunk.chunkIndex);
        sqlite3_bind_text(stmt, 4, textUtf8.constData(), -1, SQLITE_STATIC);
        if (chunk.embedding) {
            sqlite3_bind_blob(stmt, 5, blob.constData(), blob.size(), SQLITE_STATIC);
            sqlite3_bind_text(stmt, 6, backendUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_int(stmt, 7, static_cast<int>(chunk.embedding->size()));
        } else {
            sqlite3_bind_null(stmt, 5);
            sqlite3_bind_null(stmt, 6);
            sqlite3_bind_int(stmt, 7, 0);
        }

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return rollback("save_document", "chunk insert");
        }
    }

    return execSql("RELEASE SAVEPOINT save_document");
}

bool SQLiteStore::deleteDocument(const QString& documentId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = prepare("DELETE FROM documents WHERE id = ?1");
    if (!stmt) {
        return false;
    }
    const QByteArray idUtf8 = documentId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        recordError("deleteDocument");
        return false;
    }
    return true;
}

// ── Chunks ──────────────────────────────────────────────────

std::optional<std::vector<Chunk>> SQLiteStore::loadChunks(const char* sql,
                                                          const QString* documentId)
{
    sqlite3_stmt* stmt = prepare(sql);
    if (!stmt) {
        return std::nullopt;
    }

    QByteArray idUtf8;
    if (documentId) {
        idUtf8 = documentId->toUtf8();
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    }

    std::vector<Chunk> chunks;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Chunk chunk;
        chunk.chunkId = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        chunk.documentId = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        chunk.filename = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
        chunk.chunkIndex = sqlite3_column_int(stmt, 3);
        chunk.text = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4)));

        if (sqlite3_column_type(stmt, 5) == SQLITE_BLOB) {
            const void* blob = sqlite3_column_blob(stmt, 5);
            const int bytes = sqlite3_column_bytes(stmt, 5);
            chunk.embedding = decodeEmbedding(blob, bytes, sqlite3_column_int(stmt, 7));
            if (chunk.embedding) {
                chunk.embeddingBackend = QString::fromUtf8(
                    reinterpret_cast<const char*>(sqlite3_column_text(stmt, 6)));
            } else {
                LOG_WARN(dqIndex, "Chunk %s has a malformed embedding blob; treated as absent",
                         qUtf8Printable(chunk.chunkId));
            }
        }
        chunks.push_back(std::move(chunk));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        recordError("loadChunks");
        return std::nullopt;
    }
    return chunks;
}

std::optional<std::vector<Chunk>> SQLiteStore::loadAllChunks()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadChunks(R"(
        SELECT c.id, c.document_id, d.filename, c.chunk_index, c.chunk_text,
               c.embedding, c.embedding_backend, c.dimensions
        FROM chunks c JOIN documents d ON d.id = c.document_id
        ORDER BY d.uploaded_at ASC, d.rowid ASC, c.chunk_index ASC
    )", nullptr);
}

std::optional<std::vector<Chunk>> SQLiteStore::loadChunksForDocument(const QString& documentId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadChunks(R"(
        SELECT c.id, c.document_id, d.filename, c.chunk_index, c.chunk_text,
               c.embedding, c.embedding_backend, c.dimensions
        FROM chunks c JOIN documents d ON d.id = c.document_id
        WHERE c.document_id = ?1
        ORDER BY c.chunk_index ASC
    )", &documentId);
}

bool SQLiteStore::updateEmbeddings(const std::vector<Chunk>& chunks)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (chunks.empty()) {
        return true;
    }
    if (!execSql("SAVEPOINT update_embeddings")) {
        return false;
    }

    const char* sql = R"(
        UPDATE chunks SET embedding = ?1, embedding_backend = ?2, dimensions = ?3
        WHERE id = ?4
    )";

    for (const Chunk& chunk : chunks) {
        sqlite3_stmt* stmt = prepare(sql);
        if (!stmt) {
            return rollback("update_embeddings", "embedding update prepare");
        }

        const QByteArray blob = chunk.embedding ? encodeEmbedding(*chunk.embedding) : QByteArray();
        const QByteArray backendUtf8 = chunk.embeddingBackend.toUtf8();
        const QByteArray idUtf8 = chunk.chunkId.toUtf8();

        if (chunk.embedding) {
            sqlite3_bind_blob(stmt, 1, blob.constData(), blob.size(), SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, backendUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_int(stmt, 3, static_cast<int>(chunk.embedding->size()));
        } else {
            sqlite3_bind_null(stmt, 1);
            sqlite3_bind_null(stmt, 2);
            sqlite3_bind_int(stmt, 3, 0);
        }
        sqlite3_bind_text(stmt, 4, idUtf8.constData(), -1, SQLITE_STATIC);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return rollback("update_embeddings", "embedding update");
        }
    }

    return execSql("RELEASE SAVEPOINT update_embeddings");
}

} // namespace dq
