#include <QtTest/QtTest>
#include "core/embedding/dense_embedding_backend.h"

#include <QTemporaryDir>

#include <chrono>
#include <cmath>
#include <memory>
#include <thread>

class TestDenseEmbeddingBackend : public QObject {
    Q_OBJECT

private slots:
    // ── Circuit breaker ──────────────────────────────────────────
    void testCircuitBreakerInitiallyClosed();
    void testCircuitBreakerOpensAfterThreshold();
    void testCircuitBreakerResetsOnSuccess();
    void testCircuitBreakerHalfOpenAfterDelay();

    // ── Backend without a model ──────────────────────────────────
    void testIdentityNamesModelAndDimensions();
    void testInitializeFailsWithoutVocab();
    void testInitializeFailsWithoutModel();
    void testUnavailableBackendEmbedsNothing();
    void testFitCorpusReturnsSelf();

    // ── Helpers ──────────────────────────────────────────────────
    void testL2Normalize();
};

// ── Circuit breaker ──────────────────────────────────────────────

void TestDenseEmbeddingBackend::testCircuitBreakerInitiallyClosed()
{
    dq::EmbeddingCircuitBreaker cb;
    QVERIFY(!cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), 0);
}

void TestDenseEmbeddingBackend::testCircuitBreakerOpensAfterThreshold()
{
    dq::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < dq::EmbeddingCircuitBreaker::kOpenThreshold - 1; ++i) {
        cb.recordFailure();
    }
    QVERIFY(!cb.isOpen());

    cb.recordFailure();
    QVERIFY(cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), dq::EmbeddingCircuitBreaker::kOpenThreshold);
}

void TestDenseEmbeddingBackend::testCircuitBreakerResetsOnSuccess()
{
    dq::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < dq::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }
    QVERIFY(cb.isOpen());

    cb.recordSuccess();
    QVERIFY(!cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), 0);
}

void TestDenseEmbeddingBackend::testCircuitBreakerHalfOpenAfterDelay()
{
    dq::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < dq::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }
    QVERIFY(cb.isOpen());

    // Pretend the last failure happened long ago
    cb.lastFailureTime.store(cb.lastFailureTime.load()
                             - dq::EmbeddingCircuitBreaker::kHalfOpenDelayMs - 1);
    QVERIFY(!cb.isOpen());
}

// ── Backend without a model ──────────────────────────────────────

void TestDenseEmbeddingBackend::testIdentityNamesModelAndDimensions()
{
    dq::DenseEmbeddingConfig config;
    auto backend = std::make_shared<dq::DenseEmbeddingBackend>(config);
    QCOMPARE(backend->identity(), QStringLiteral("dense:all-MiniLM-L6-v2:384"));
    QCOMPARE(backend->dimensions(), 384);
    QVERIFY(backend->kind() == dq::EmbeddingBackendKind::Dense);

    config.modelId = QStringLiteral("other-model");
    config.dimensions = 768;
    auto other = std::make_shared<dq::DenseEmbeddingBackend>(config);
    QVERIFY(other->identity() != backend->identity());
}

void TestDenseEmbeddingBackend::testInitializeFailsWithoutVocab()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    dq::DenseEmbeddingConfig config;
    config.vocabPath = dir.filePath(QStringLiteral("vocab.txt"));
    config.modelPath = dir.filePath(QStringLiteral("model.onnx"));
    auto backend = std::make_shared<dq::DenseEmbeddingBackend>(config);
    QVERIFY(!backend->initialize());
    QVERIFY(!backend->isAvailable());
}

void TestDenseEmbeddingBackend::testInitializeFailsWithoutModel()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString vocabPath = dir.filePath(QStringLiteral("vocab.txt"));
    QFile vocab(vocabPath);
    QVERIFY(vocab.open(QIODevice::WriteOnly | QIODevice::Text));
    vocab.write("[PAD]\n[UNK]\n[CLS]\n[SEP]\nhello\n");
    vocab.close();

    dq::DenseEmbeddingConfig config;
    config.vocabPath = vocabPath;
    config.modelPath = dir.filePath(QStringLiteral("model.onnx"));
    auto backend = std::make_shared<dq::DenseEmbeddingBackend>(config);
    QVERIFY(!backend->initialize());
    QVERIFY(!backend->isAvailable());
}

void TestDenseEmbeddingBackend::testUnavailableBackendEmbedsNothing()
{
    auto backend = std::make_shared<dq::DenseEmbeddingBackend>(dq::DenseEmbeddingConfig{});
    const dq::EmbeddingBatch batch =
        backend->embed({QStringLiteral("first"), QStringLiteral("second")});
    QCOMPARE(static_cast<int>(batch.size()), 2);
    QVERIFY(!batch[0].has_value());
    QVERIFY(!batch[1].has_value());
}

void TestDenseEmbeddingBackend::testFitCorpusReturnsSelf()
{
    auto backend = std::make_shared<dq::DenseEmbeddingBackend>(dq::DenseEmbeddingConfig{});
    const auto fitted = backend->fitCorpus({QStringLiteral("anything")});
    QCOMPARE(fitted.get(), static_cast<const dq::EmbeddingBackend*>(backend.get()));
}

// ── Helpers ──────────────────────────────────────────────────────

void TestDenseEmbeddingBackend::testL2Normalize()
{
    const dq::Embedding unit = dq::l2Normalize({3.0f, 4.0f});
    QVERIFY(std::abs(unit[0] - 0.6f) < 1e-6f);
    QVERIFY(std::abs(unit[1] - 0.8f) < 1e-6f);

    const dq::Embedding zero = dq::l2Normalize({0.0f, 0.0f, 0.0f});
    QCOMPARE(zero, (dq::Embedding{0.0f, 0.0f, 0.0f}));
}

QTEST_MAIN(TestDenseEmbeddingBackend)
#include "test_dense_embedding_backend.moc"
