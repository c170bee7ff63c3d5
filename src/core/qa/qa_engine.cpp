#include "core/qa/qa_engine.h"
#include "core/embedding/dense_embedding_backend.h"
#include "core/embedding/sparse_embedding_backend.h"
#include "core/generation/generator.h"
#include "core/generation/ollama_generator.h"
#include "core/index/document_store.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <chrono>
#include <utility>

namespace dq {

namespace {

constexpr const char* kEmbeddingProbeText = "DocQuery embedding capability probe.";

} // anonymous namespace

QaEngine::QaEngine(Settings settings)
    : m_settings(SettingsManager::resolvePaths(std::move(settings)))
    , m_extraction(m_settings.maxFileSize, m_settings.allowedExtensions)
{
}

QaEngine::QaEngine(Settings settings,
                   std::unique_ptr<DocumentStore> store,
                   std::shared_ptr<const EmbeddingBackend> backend,
                   std::unique_ptr<Generator> generator)
    : m_settings(std::move(settings))
    , m_injected(true)
    , m_store(std::move(store))
    , m_backend(std::move(backend))
    , m_generator(std::move(generator))
    , m_extraction(m_settings.maxFileSize, m_settings.allowedExtensions)
{
}

QaEngine::~QaEngine() = default;

std::shared_ptr<const EmbeddingBackend> QaEngine::createEmbeddingBackend()
{
    if (m_settings.denseEmbeddingEnabled) {
        DenseEmbeddingConfig config;
        config.modelPath = m_settings.embeddingModelPath;
        config.vocabPath = m_settings.embeddingVocabPath;
        config.dimensions = m_settings.embeddingDimensions;
        config.maxSequenceLength = m_settings.embeddingMaxSequenceLength;

        auto dense = std::make_shared<DenseEmbeddingBackend>(config);
        if (dense->initialize()) {
            const EmbeddingBatch probe = dense->embed({QString::fromLatin1(kEmbeddingProbeText)});
            if (!probe.empty() && probe.front()) {
                return dense;
            }
            LOG_WARN(dqEmbedding, "Dense backend loaded but failed the probe embedding");
        }
        LOG_WARN(dqEmbedding, "Dense embedding unavailable, using TF-IDF fallback");
    }

    SparseEmbeddingConfig config;
    config.maxFeatures = m_settings.sparseMaxFeatures;
    return std::make_shared<SparseEmbeddingBackend>(config);
}

bool QaEngine::initialize(QString* errorMessage)
{
    if (m_corpus) {
        return true;
    }

    if (!m_injected) {
        if (!QDir().mkpath(QFileInfo(m_settings.dbPath).absolutePath())) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Cannot create data directory for %1")
                                    .arg(m_settings.dbPath);
            }
            LOG_ERROR(dqCore, "Cannot create data directory for %s",
                      qUtf8Printable(m_settings.dbPath));
            return false;
        }

        m_store = SQLiteStore::open(m_settings.dbPath);
        m_backend = createEmbeddingBackend();
        if (m_settings.generatorEnabled && !m_settings.generatorUrl.isEmpty()) {
            OllamaConfig config;
            config.baseUrl = m_settings.generatorUrl;
            config.model = m_settings.generatorModel;
            config.probeTimeout = std::chrono::milliseconds(m_settings.generatorProbeTimeoutMs);
            config.temperature = m_settings.generatorTemperature;
            config.topP = m_settings.generatorTopP;
            config.maxTokens = m_settings.generatorMaxTokens;
            m_generator = std::make_unique<OllamaGenerator>(config);
        }
    }

    if (!m_store || !m_backend) {
        if (errorMessage) {
            *errorMessage = m_store ? QStringLiteral("No embedding backend")
                                    : QStringLiteral("Failed to open document store");
        }
        LOG_ERROR(dqCore, "QaEngine initialization failed: %s",
                  m_store ? "no embedding backend" : "document store unavailable");
        return false;
    }

    m_capabilities.embeddingBackend = m_backend->kind();
    m_capabilities.generatorConfigured = m_generator != nullptr;
    m_capabilities.generatorReachable = m_generator && m_generator->isAvailable();

    ChunkerConfig chunkerConfig;
    chunkerConfig.chunkSize = m_settings.chunkSize;
    chunkerConfig.overlap = m_settings.chunkOverlap;

    auto corpus = std::make_unique<CorpusManager>(*m_store, m_backend, chunkerConfig);
    QString reloadError;
    if (!corpus->reload(&reloadError)) {
        if (errorMessage) {
            *errorMessage = reloadError;
        }
        LOG_ERROR(dqCore, "Failed to load corpus: %s", qUtf8Printable(reloadError));
        return false;
    }

    m_ranker = std::make_unique<RetrievalRanker>(corpus->state(), m_settings.minSimilarity);
    m_synthesizer = std::make_unique<AnswerSynthesizer>(
        m_generator.get(), std::chrono::milliseconds(m_settings.generatorTimeoutMs));
    m_corpus = std::move(corpus);

    LOG_INFO(dqCore, "QaEngine ready: backend=%s, generator=%s (%s), %zu indexed chunks",
             qUtf8Printable(embeddingBackendKindToString(m_capabilities.embeddingBackend)),
             m_generator ? qUtf8Printable(m_generator->describe()) : "none",
             m_capabilities.generatorReachable ? "reachable" : "unreachable",
             m_corpus->state().snapshot()->size());
    return true;
}

IngestResult QaEngine::fromExtraction(const ExtractionResult& extraction)
{
    IngestResult result;
    result.errorMessage = extraction.errorMessage;
    switch (extraction.status) {
    case ExtractionResult::Status::SizeExceeded:
        result.status = IngestResult::Status::SizeExceeded;
        break;
    case ExtractionResult::Status::Inaccessible:
        result.status = IngestResult::Status::Inaccessible;
        break;
    case ExtractionResult::Status::UnsupportedFormat:
    case ExtractionResult::Status::CorruptedFile:
    case ExtractionResult::Status::Unknown:
    case ExtractionResult::Status::Success:
        result.status = IngestResult::Status::UnsupportedFormat;
        break;
    }
    return result;
}

IngestResult QaEngine::ingestBytes(const QByteArray& data, const QString& filename)
{
    if (!m_corpus) {
        IngestResult result;
        result.errorMessage = QStringLiteral("Engine not initialized");
        return result;
    }

    const ExtractionResult extraction = m_extraction.extract(data, QFileInfo(filename).suffix());
    if (extraction.status != ExtractionResult::Status::Success || !extraction.content) {
        return fromExtraction(extraction);
    }

    const IngestResult result = m_corpus->ingest(*extraction.content, filename,
                                                 static_cast<int64_t>(data.size()),
                                                 computeContentHash(data));
    LOG_DEBUG(dqCore, "Upload '%s': %s", qUtf8Printable(filename),
              qUtf8Printable(ingestStatusToString(result.status)));
    return result;
}

IngestResult QaEngine::ingestFile(const QString& path, const QString& displayName)
{
    IngestResult result;
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        result.status = IngestResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File does not exist or is not a regular file");
        return result;
    }
    if (info.size() > m_extraction.maxFileSizeBytes()) {
        result.status = IngestResult::Status::SizeExceeded;
        result.errorMessage = QStringLiteral("File size %1 exceeds limit %2")
                                  .arg(info.size())
                                  .arg(m_extraction.maxFileSizeBytes());
        return result;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        result.status = IngestResult::Status::Inaccessible;
        result.errorMessage = file.errorString();
        return result;
    }
    const QByteArray data = file.readAll();
    file.close();

    return ingestBytes(data, displayName.isEmpty() ? info.fileName() : displayName);
}

RemoveResult QaEngine::remove(const QString& documentId)
{
    if (!m_corpus) {
        RemoveResult result;
        result.errorMessage = QStringLiteral("Engine not initialized");
        return result;
    }
    return m_corpus->remove(documentId);
}

std::optional<std::vector<Document>> QaEngine::listDocuments()
{
    if (!m_corpus) {
        return std::nullopt;
    }
    return m_corpus->listDocuments();
}

std::optional<std::vector<Chunk>> QaEngine::documentChunks(const QString& documentId)
{
    if (!m_corpus) {
        return std::nullopt;
    }
    return m_corpus->documentChunks(documentId);
}

std::vector<RetrievalResult> QaEngine::retrieve(const QString& question, int maxResults) const
{
    if (!m_ranker) {
        return {};
    }
    return m_ranker->retrieve(question, maxResults > 0 ? maxResults : m_settings.maxResults);
}

AnswerResult QaEngine::answer(const QString& question,
                              const std::vector<RetrievalResult>& results) const
{
    if (!m_synthesizer) {
        return AnswerSynthesizer().answer(question, {});
    }
    return m_synthesizer->answer(question, results);
}

AnswerResult QaEngine::ask(const QString& question, int maxResults) const
{
    AnswerResult result = answer(question, retrieve(question, maxResults));
    LOG_DEBUG(dqRanking, "ask: %s answer from %d source(s), confidence %.3f",
              qUtf8Printable(answerModeToString(result.mode)),
              static_cast<int>(result.sources.size()), result.confidence);
    return result;
}

HealthReport QaEngine::health()
{
    HealthReport report;
    report.ready = m_corpus != nullptr;
    report.capabilities = m_capabilities;
    if (!m_corpus) {
        return report;
    }

    if (const std::optional<std::vector<Document>> documents = m_corpus->listDocuments()) {
        report.documentCount = static_cast<int>(documents->size());
        for (const Document& document : *documents) {
            report.chunkCount += document.chunkCount;
        }
    } else {
        LOG_WARN(dqCore, "health: listing documents failed: %s",
                 qUtf8Printable(m_store->lastError()));
    }

    const std::shared_ptr<const SimilarityIndex> snapshot = m_corpus->state().snapshot();
    report.indexedChunkCount = static_cast<int>(snapshot->size());
    report.backendIdentity = snapshot->backendIdentity();

    if (m_generator) {
        report.generator = m_generator->describe();
        report.generatorModels = m_generator->availableModels();
        report.generatorReachable = m_generator->isAvailable();
    }
    return report;
}

} // namespace dq
