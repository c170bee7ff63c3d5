#include <QtTest/QtTest>
#include "core/index/sqlite_store.h"

#include <QTemporaryDir>

#include <sqlite3.h>

namespace {

dq::Document makeDocument(const QString& id, const QString& hash, double uploadedAt)
{
    dq::Document doc;
    doc.id = id;
    doc.filename = id + QStringLiteral(".txt");
    doc.byteSize = 42;
    doc.contentHash = hash;
    doc.uploadedAt = uploadedAt;
    return doc;
}

std::vector<dq::Chunk> makeChunks(const dq::Document& doc, int count, bool embedded = true)
{
    std::vector<dq::Chunk> chunks;
    for (int i = 0; i < count; ++i) {
        dq::Chunk chunk;
        chunk.documentId = doc.id;
        chunk.chunkIndex = i;
        chunk.chunkId = dq::computeChunkId(doc.id, i);
        chunk.text = QStringLiteral("%1 passage %2").arg(doc.id).arg(i);
        if (embedded) {
            chunk.embedding = dq::Embedding{float(i), 0.5f, -1.25f};
            chunk.embeddingBackend = QStringLiteral("test:v1");
        }
        chunks.push_back(chunk);
    }
    return chunks;
}

} // anonymous namespace

class TestSQLiteStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Schema ───────────────────────────────────────────────────
    void testOpenCreatesSchema();
    void testReopenKeepsData();
    void testNewerSchemaRefusesToOpen();

    // ── Documents ────────────────────────────────────────────────
    void testSaveAndFind();
    void testFindMissingIsSuccessfulAndEmpty();
    void testDuplicateHashRejectedAtomically();
    void testLastErrorIsPerThread();
    void testListDocumentsNewestFirst();

    // ── Chunks ───────────────────────────────────────────────────
    void testLoadAllChunksOrderAndFilename();
    void testEmbeddingRoundTrip();
    void testAbsentEmbeddingStaysAbsent();
    void testEmptyEmbedding();
    void testUpdateEmbeddings();

    // ── Delete ───────────────────────────────────────────────────
    void testDeleteCascadesToChunks();
    void testDeleteUnknownSucceeds();

    // ── Encoding ─────────────────────────────────────────────────
    void testEncodingIsLittleEndianFloat32();
    void testDecodeRejectsWrongSize();

private:
    QTemporaryDir* m_tempDir = nullptr;
    QString dbPath() const { return m_tempDir->filePath(QStringLiteral("docquery.db")); }
};

void TestSQLiteStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestSQLiteStore::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

// ── Schema ───────────────────────────────────────────────────────

void TestSQLiteStore::testOpenCreatesSchema()
{
    auto store = dq::SQLiteStore::open(dbPath());
    QVERIFY(store);
    QCOMPARE(store->schemaVersion(), 1);
    QVERIFY(QFile::exists(dbPath()));

    const auto docs = store->listDocuments();
    QVERIFY(docs.has_value());
    QVERIFY(docs->empty());
}

void TestSQLiteStore::testReopenKeepsData()
{
    const dq::Document doc = makeDocument(QStringLiteral("d1"), QStringLiteral("h1"), 100.0);
    {
        auto store = dq::SQLiteStore::open(dbPath());
        QVERIFY(store);
        QVERIFY(store->save(doc, makeChunks(doc, 2)));
    }

    auto reopened = dq::SQLiteStore::open(dbPath());
    QVERIFY(reopened);
    const auto chunks = reopened->loadAllChunks();
    QVERIFY(chunks.has_value());
    QCOMPARE(static_cast<int>(chunks->size()), 2);
}

void TestSQLiteStore::testNewerSchemaRefusesToOpen()
{
    {
        auto store = dq::SQLiteStore::open(dbPath());
        QVERIFY(store);
    }

    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(dbPath().toUtf8().constData(), &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, "PRAGMA user_version = 99", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    QVERIFY(!dq::SQLiteStore::open(dbPath()));
}

// ── Documents ────────────────────────────────────────────────────

void TestSQLiteStore::testSaveAndFind()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document doc = makeDocument(QStringLiteral("d1"), QStringLiteral("h1"), 100.5);
    QVERIFY(store->save(doc, makeChunks(doc, 3)));

    std::optional<dq::Document> found;
    QVERIFY(store->findByHash(QStringLiteral("h1"), &found));
    QVERIFY(found.has_value());
    QCOMPARE(found->id, QStringLiteral("d1"));
    QCOMPARE(found->filename, QStringLiteral("d1.txt"));
    QCOMPARE(found->byteSize, int64_t(42));
    QCOMPARE(found->uploadedAt, 100.5);
    QCOMPARE(found->chunkCount, 3);

    QVERIFY(store->findById(QStringLiteral("d1"), &found));
    QVERIFY(found.has_value());
    QCOMPARE(found->contentHash, QStringLiteral("h1"));
}

void TestSQLiteStore::testFindMissingIsSuccessfulAndEmpty()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    std::optional<dq::Document> found = makeDocument(QStringLiteral("x"), QStringLiteral("x"), 0);
    QVERIFY(store->findByHash(QStringLiteral("nope"), &found));
    QVERIFY(!found.has_value());
    QVERIFY(store->findById(QStringLiteral("nope"), &found));
    QVERIFY(!found.has_value());
}

void TestSQLiteStore::testDuplicateHashRejectedAtomically()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document first = makeDocument(QStringLiteral("d1"), QStringLiteral("same"), 1.0);
    const dq::Document second = makeDocument(QStringLiteral("d2"), QStringLiteral("same"), 2.0);
    QVERIFY(store->save(first, makeChunks(first, 1)));
    QVERIFY(!store->save(second, makeChunks(second, 2)));
    QVERIFY(!store->lastError().isEmpty());

    // Nothing of the failed document was committed
    const auto docs = store->listDocuments();
    QCOMPARE(static_cast<int>(docs->size()), 1);
    QVERIFY(store->loadChunksForDocument(QStringLiteral("d2"))->empty());

    // The store is still usable afterwards
    const dq::Document third = makeDocument(QStringLiteral("d3"), QStringLiteral("other"), 3.0);
    QVERIFY(store->save(third, makeChunks(third, 1)));
}

void TestSQLiteStore::testLastErrorIsPerThread()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document first = makeDocument(QStringLiteral("d1"), QStringLiteral("same"), 1.0);
    const dq::Document sameHash = makeDocument(QStringLiteral("d2"), QStringLiteral("same"), 2.0);
    QVERIFY(store->save(first, makeChunks(first, 1)));
    QVERIFY(!store->save(sameHash, makeChunks(sameHash, 1)));
    const QString mainError = store->lastError();
    QVERIFY(mainError.contains(QStringLiteral("documents.content_hash")));

    QString workerBefore;
    QString workerError;
    bool workerFailed = false;
    QThread* worker = QThread::create([&]() {
        workerBefore = store->lastError();
        const dq::Document sameId = makeDocument(QStringLiteral("d1"), QStringLiteral("fresh"), 3.0);
        workerFailed = !store->save(sameId, makeChunks(sameId, 1));
        workerError = store->lastError();
    });
    worker->start();
    QVERIFY(worker->wait(10000));
    delete worker;

    QVERIFY(workerBefore.isEmpty());
    QVERIFY(workerFailed);
    QVERIFY(workerError.contains(QStringLiteral("documents.id")));
    QCOMPARE(store->lastError(), mainError);
}

void TestSQLiteStore::testListDocumentsNewestFirst()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    for (int i = 0; i < 3; ++i) {
        const dq::Document doc = makeDocument(QStringLiteral("d%1").arg(i),
                                              QStringLiteral("h%1").arg(i), 10.0 + i);
        QVERIFY(store->save(doc, makeChunks(doc, 1)));
    }

    const auto docs = store->listDocuments();
    QVERIFY(docs.has_value());
    QCOMPARE(static_cast<int>(docs->size()), 3);
    QCOMPARE((*docs)[0].id, QStringLiteral("d2"));
    QCOMPARE((*docs)[2].id, QStringLiteral("d0"));
}

// ── Chunks ───────────────────────────────────────────────────────

void TestSQLiteStore::testLoadAllChunksOrderAndFilename()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document later = makeDocument(QStringLiteral("later"), QStringLiteral("h1"), 20.0);
    const dq::Document earlier = makeDocument(QStringLiteral("earlier"), QStringLiteral("h2"), 10.0);
    QVERIFY(store->save(later, makeChunks(later, 2)));
    QVERIFY(store->save(earlier, makeChunks(earlier, 2)));

    const auto chunks = store->loadAllChunks();
    QVERIFY(chunks.has_value());
    QCOMPARE(static_cast<int>(chunks->size()), 4);
    QCOMPARE((*chunks)[0].documentId, QStringLiteral("earlier"));
    QCOMPARE((*chunks)[0].chunkIndex, 0);
    QCOMPARE((*chunks)[1].chunkIndex, 1);
    QCOMPARE((*chunks)[2].documentId, QStringLiteral("later"));
    QCOMPARE((*chunks)[2].filename, QStringLiteral("later.txt"));
}

void TestSQLiteStore::testEmbeddingRoundTrip()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document doc = makeDocument(QStringLiteral("d1"), QStringLiteral("h1"), 1.0);
    QVERIFY(store->save(doc, makeChunks(doc, 2)));

    const auto chunks = store->loadChunksForDocument(QStringLiteral("d1"));
    QVERIFY(chunks.has_value());
    QCOMPARE(static_cast<int>(chunks->size()), 2);
    const dq::Chunk& second = (*chunks)[1];
    QVERIFY(second.embedding.has_value());
    QCOMPARE(*second.embedding, (dq::Embedding{1.0f, 0.5f, -1.25f}));
    QCOMPARE(second.embeddingBackend, QStringLiteral("test:v1"));
    QCOMPARE(second.chunkId, dq::computeChunkId(QStringLiteral("d1"), 1));
    QCOMPARE(second.text, QStringLiteral("d1 passage 1"));
}

void TestSQLiteStore::testAbsentEmbeddingStaysAbsent()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document doc = makeDocument(QStringLiteral("d1"), QStringLiteral("h1"), 1.0);
    QVERIFY(store->save(doc, makeChunks(doc, 1, false)));

    const auto chunks = store->loadAllChunks();
    QVERIFY(chunks.has_value());
    QVERIFY(!(*chunks)[0].embedding.has_value());
    QVERIFY((*chunks)[0].embeddingBackend.isEmpty());
}

void TestSQLiteStore::testEmptyEmbedding()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document doc = makeDocument(QStringLiteral("d1"), QStringLiteral("h1"), 1.0);
    std::vector<dq::Chunk> chunks = makeChunks(doc, 1, false);
    chunks[0].embedding = dq::Embedding();
    chunks[0].embeddingBackend = QStringLiteral("tfidf:unfitted");
    QVERIFY(store->save(doc, chunks));

    const auto loaded = store->loadAllChunks();
    QVERIFY(loaded.has_value());
    QVERIFY((*loaded)[0].embedding.has_value());
    QVERIFY((*loaded)[0].embedding->empty());
}

void TestSQLiteStore::testUpdateEmbeddings()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document doc = makeDocument(QStringLiteral("d1"), QStringLiteral("h1"), 1.0);
    QVERIFY(store->save(doc, makeChunks(doc, 2)));

    std::vector<dq::Chunk> updates = *store->loadAllChunks();
    updates[0].embedding = dq::Embedding{9.0f, 8.0f};
    updates[0].embeddingBackend = QStringLiteral("test:v2");
    updates[1].embedding.reset();
    updates[1].embeddingBackend.clear();
    QVERIFY(store->updateEmbeddings(updates));
    QVERIFY(store->updateEmbeddings({}));

    const auto reloaded = store->loadAllChunks();
    QCOMPARE(*(*reloaded)[0].embedding, (dq::Embedding{9.0f, 8.0f}));
    QCOMPARE((*reloaded)[0].embeddingBackend, QStringLiteral("test:v2"));
    QVERIFY(!(*reloaded)[1].embedding.has_value());
}

// ── Delete ───────────────────────────────────────────────────────

void TestSQLiteStore::testDeleteCascadesToChunks()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);

    const dq::Document keep = makeDocument(QStringLiteral("keep"), QStringLiteral("h1"), 1.0);
    const dq::Document drop = makeDocument(QStringLiteral("drop"), QStringLiteral("h2"), 2.0);
    QVERIFY(store->save(keep, makeChunks(keep, 2)));
    QVERIFY(store->save(drop, makeChunks(drop, 3)));

    QVERIFY(store->deleteDocument(QStringLiteral("drop")));

    const auto chunks = store->loadAllChunks();
    QCOMPARE(static_cast<int>(chunks->size()), 2);
    for (const dq::Chunk& chunk : *chunks) {
        QCOMPARE(chunk.documentId, QStringLiteral("keep"));
    }

    std::optional<dq::Document> found;
    QVERIFY(store->findByHash(QStringLiteral("h2"), &found));
    QVERIFY(!found.has_value());
}

void TestSQLiteStore::testDeleteUnknownSucceeds()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store);
    QVERIFY(store->deleteDocument(QStringLiteral("missing")));
}

// ── Encoding ─────────────────────────────────────────────────────

void TestSQLiteStore::testEncodingIsLittleEndianFloat32()
{
    const QByteArray blob = dq::SQLiteStore::encodeEmbedding({1.0f});
    // 1.0f == 0x3F800000
    QCOMPARE(blob, QByteArray::fromHex("0000803f"));

    const auto decoded = dq::SQLiteStore::decodeEmbedding(blob.constData(),
                                                          static_cast<int>(blob.size()), 1);
    QVERIFY(decoded.has_value());
    QCOMPARE(*decoded, dq::Embedding{1.0f});
}

void TestSQLiteStore::testDecodeRejectsWrongSize()
{
    const QByteArray blob = dq::SQLiteStore::encodeEmbedding({1.0f, 2.0f});
    QVERIFY(!dq::SQLiteStore::decodeEmbedding(blob.constData(),
                                              static_cast<int>(blob.size()), 3).has_value());
    QVERIFY(!dq::SQLiteStore::decodeEmbedding(blob.constData(), 5, 1).has_value());
}

QTEST_MAIN(TestSQLiteStore)
#include "test_sqlite_store.moc"
