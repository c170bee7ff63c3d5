#pragma once

#include "core/extraction/extraction_manager.h"
#include "core/indexing/corpus_manager.h"
#include "core/ranking/answer_synthesizer.h"
#include "core/ranking/retrieval_ranker.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace dq {

class DocumentStore;
class EmbeddingBackend;
class Generator;

// Optional collaborators found at startup.
struct Capabilities {
    EmbeddingBackendKind embeddingBackend = EmbeddingBackendKind::Sparse;
    bool generatorConfigured = false;
    bool generatorReachable = false;   // as of initialize()
};

struct HealthReport {
    bool ready = false;
    int documentCount = 0;
    int chunkCount = 0;          // stored chunks
    int indexedChunkCount = 0;   // chunks with a usable vector in the live index
    QString backendIdentity;
    Capabilities capabilities;
    QString generator;           // Generator::describe(), empty when none
    bool generatorReachable = false;
    QStringList generatorModels;
};

// QaEngine -- the document question-answering core assembled from Settings.
//
// initialize() opens the store, selects the embedding backend (dense when
// the ONNX model loads and embeds a probe text, sparse otherwise), sets up
// the optional generator, records Capabilities and rebuilds the index from
// persisted chunks. All operations are safe to call from several threads;
// mutations are serialized by CorpusManager.
class QaEngine {
public:
    explicit QaEngine(Settings settings);

    // Collaborators supplied by the caller. A null generator disables
    // generation; store and backend must not be null.
    QaEngine(Settings settings,
             std::unique_ptr<DocumentStore> store,
             std::shared_ptr<const EmbeddingBackend> backend,
             std::unique_ptr<Generator> generator);

    ~QaEngine();

    QaEngine(const QaEngine&) = delete;
    QaEngine& operator=(const QaEngine&) = delete;

    bool initialize(QString* errorMessage = nullptr);
    bool isInitialized() const { return m_corpus != nullptr; }

    const Settings& settings() const { return m_settings; }
    const Capabilities& capabilities() const { return m_capabilities; }

    // Extract, hash and ingest an upload; the extension of `filename`
    // selects the extractor.
    IngestResult ingestBytes(const QByteArray& data, const QString& filename);
    IngestResult ingestFile(const QString& path, const QString& displayName = QString());

    RemoveResult remove(const QString& documentId);

    std::optional<std::vector<Document>> listDocuments();
    std::optional<std::vector<Chunk>> documentChunks(const QString& documentId);

    // maxResults <= 0 uses Settings::maxResults.
    std::vector<RetrievalResult> retrieve(const QString& question, int maxResults = 0) const;
    AnswerResult answer(const QString& question,
                        const std::vector<RetrievalResult>& results) const;
    AnswerResult ask(const QString& question, int maxResults = 0) const;

    HealthReport health();

private:
    std::shared_ptr<const EmbeddingBackend> createEmbeddingBackend();
    static IngestResult fromExtraction(const ExtractionResult& extraction);

    Settings m_settings;
    bool m_injected = false;

    std::unique_ptr<DocumentStore> m_store;
    std::shared_ptr<const EmbeddingBackend> m_backend;
    std::unique_ptr<Generator> m_generator;

    ExtractionManager m_extraction;
    std::unique_ptr<CorpusManager> m_corpus;
    std::unique_ptr<RetrievalRanker> m_ranker;
    std::unique_ptr<AnswerSynthesizer> m_synthesizer;
    Capabilities m_capabilities;
};

} // namespace dq
