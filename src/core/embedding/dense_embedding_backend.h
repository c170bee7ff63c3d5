#pragma once

#include "core/embedding/embedding_backend.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dq {

class WordPieceTokenizer;

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct DenseEmbeddingConfig {
    QString modelId = QStringLiteral("all-MiniLM-L6-v2");
    QString modelPath;
    QString vocabPath;
    int dimensions = 384;
    int maxSequenceLength = 256;
    int batchSize = 32;
    int intraOpThreads = 2;
};

// DenseEmbeddingBackend -- sentence embeddings from an ONNX export of a
// BERT-style encoder. Token outputs are mean-pooled under the attention
// mask; models that already emit a pooled [batch, dim] tensor are used
// as-is. Every vector is L2-normalized.
//
// Must be owned by a shared_ptr: fitCorpus() hands out shared_from_this().
class DenseEmbeddingBackend : public EmbeddingBackend,
                              public std::enable_shared_from_this<DenseEmbeddingBackend> {
public:
    explicit DenseEmbeddingBackend(DenseEmbeddingConfig config);
    ~DenseEmbeddingBackend() override;

    DenseEmbeddingBackend(const DenseEmbeddingBackend&) = delete;
    DenseEmbeddingBackend& operator=(const DenseEmbeddingBackend&) = delete;

    // Load vocabulary and model. Returns false (and logs) when either is
    // missing or the model does not expose input_ids/attention_mask.
    bool initialize();
    bool isAvailable() const;

    EmbeddingBackendKind kind() const override;
    QString identity() const override;
    int dimensions() const override;
    EmbeddingBatch embed(const std::vector<QString>& texts) const override;
    std::shared_ptr<const EmbeddingBackend> fitCorpus(
        const std::vector<QString>& corpus) const override;

private:
    // Runs one forward pass. nullopt when inference fails for the batch.
    std::optional<std::vector<Embedding>> runBatch(const std::vector<QString>& texts) const;

    class Impl;
    std::unique_ptr<Impl> m_impl;

    DenseEmbeddingConfig m_config;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    bool m_available = false;
    mutable EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace dq
