#include "core/embedding/dense_embedding_backend.h"
#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace dq {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "docquery-embedding");
    return env;
}

} // anonymous namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Half-open once the delay has elapsed: one attempt is let through
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

class DenseEmbeddingBackend::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> inputNames;   // subset of input_ids/attention_mask/token_type_ids
    std::string outputName;
    bool pooledOutput = false;
};

DenseEmbeddingBackend::DenseEmbeddingBackend(DenseEmbeddingConfig config)
    : m_impl(std::make_unique<Impl>())
    , m_config(std::move(config))
{
    m_config.batchSize = std::max(1, m_config.batchSize);
}

DenseEmbeddingBackend::~DenseEmbeddingBackend() = default;

bool DenseEmbeddingBackend::initialize()
{
    m_available = false;

    if (m_config.dimensions <= 0) {
        LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: invalid dimensions %d", m_config.dimensions);
        return false;
    }

    m_tokenizer = std::make_unique<WordPieceTokenizer>(m_config.vocabPath,
                                                       m_config.maxSequenceLength);
    if (!m_tokenizer->isLoaded()) {
        LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: tokenizer unavailable (%s)",
                 qUtf8Printable(m_config.vocabPath));
        m_tokenizer.reset();
        return false;
    }

    if (m_config.modelPath.isEmpty() || !QFile::exists(m_config.modelPath)) {
        LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: model file missing at %s",
                 qUtf8Printable(m_config.modelPath));
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(std::max(1, m_config.intraOpThreads));
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), m_config.modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;

        std::vector<std::string> modelInputs;
        const size_t inputCount = m_impl->session->GetInputCount();
        for (size_t i = 0; i < inputCount; ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetInputNameAllocated(i, allocator);
            if (name.get() != nullptr) {
                modelInputs.emplace_back(name.get());
            }
        }

        const auto hasInput = [&modelInputs](const char* name) {
            return std::find(modelInputs.begin(), modelInputs.end(), name) != modelInputs.end();
        };
        if (!hasInput("input_ids") || !hasInput("attention_mask")) {
            LOG_WARN(dqEmbedding,
                     "DenseEmbeddingBackend: model lacks input_ids/attention_mask inputs");
            m_impl->session.reset();
            return false;
        }
        m_impl->inputNames = {"input_ids", "attention_mask"};
        if (hasInput("token_type_ids")) {
            m_impl->inputNames.emplace_back("token_type_ids");
        }

        std::vector<std::string> modelOutputs;
        const size_t outputCount = m_impl->session->GetOutputCount();
        for (size_t i = 0; i < outputCount; ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetOutputNameAllocated(i, allocator);
            if (name.get() != nullptr && name.get()[0] != '\0') {
                modelOutputs.emplace_back(name.get());
            }
        }
        if (modelOutputs.empty()) {
            LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: no output names found in model");
            m_impl->session.reset();
            return false;
        }

        // Prefer an explicitly pooled output when the export provides one
        const auto pooled = std::find(modelOutputs.begin(), modelOutputs.end(),
                                      std::string("sentence_embedding"));
        m_impl->outputName = pooled != modelOutputs.end() ? *pooled : modelOutputs.front();

        LOG_INFO(dqEmbedding, "DenseEmbeddingBackend: initialized '%s' (%zu inputs, output '%s')",
                 qUtf8Printable(m_config.modelId), m_impl->inputNames.size(),
                 m_impl->outputName.c_str());
    } catch (const Ort::Exception& ex) {
        LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: ONNX initialization failed: %s", ex.what());
        m_impl->session.reset();
        return false;
    }

    m_available = true;
    return true;
}

bool DenseEmbeddingBackend::isAvailable() const
{
    return m_available;
}

EmbeddingBackendKind DenseEmbeddingBackend::kind() const
{
    return EmbeddingBackendKind::Dense;
}

QString DenseEmbeddingBackend::identity() const
{
    return QStringLiteral("dense:%1:%2").arg(m_config.modelId).arg(m_config.dimensions);
}

int DenseEmbeddingBackend::dimensions() const
{
    return m_config.dimensions;
}

std::shared_ptr<const EmbeddingBackend> DenseEmbeddingBackend::fitCorpus(
    const std::vector<QString>& /*corpus*/) const
{
    return shared_from_this();
}

EmbeddingBatch DenseEmbeddingBackend::embed(const std::vector<QString>& texts) const
{
    EmbeddingBatch results(texts.size());
    if (!m_available || texts.empty()) {
        return results;
    }

    const size_t batchSize = static_cast<size_t>(m_config.batchSize);
    for (size_t begin = 0; begin < texts.size(); begin += batchSize) {
        if (m_circuitBreaker.isOpen()) {
            LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: circuit breaker open, %zu texts skipped",
                     texts.size() - begin);
            break;
        }

        const size_t end = std::min(texts.size(), begin + batchSize);
        const std::vector<QString> batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));

        std::optional<std::vector<Embedding>> vectors = runBatch(batch);
        if (vectors) {
            for (size_t i = 0; i < vectors->size(); ++i) {
                results[begin + i] = std::move((*vectors)[i]);
            }
            continue;
        }

        if (batch.size() == 1) {
            continue;
        }

        // Isolate the failing text(s): retry one at a time
        LOG_DEBUG(dqEmbedding, "DenseEmbeddingBackend: batch of %zu failed, retrying singly",
                  batch.size());
        for (size_t i = 0; i < batch.size(); ++i) {
            if (m_circuitBreaker.isOpen()) {
                break;
            }
            std::optional<std::vector<Embedding>> single = runBatch({batch[i]});
            if (single && !single->empty()) {
                results[begin + i] = std::move(single->front());
            }
        }
    }

    return results;
}

std::optional<std::vector<Embedding>> DenseEmbeddingBackend::runBatch(
    const std::vector<QString>& texts) const
{
    if (!m_impl->session || !m_tokenizer || texts.empty()) {
        return std::nullopt;
    }

    const BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize <= 0 || tokenized.seqLength <= 0) {
        return std::nullopt;
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(tokenized.batchSize),
        static_cast<int64_t>(tokenized.seqLength),
    };

    QElapsedTimer timer;
    timer.start();

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);

        std::vector<Ort::Value> inputTensors;
        std::vector<const char*> inputNames;
        inputTensors.reserve(m_impl->inputNames.size());
        inputNames.reserve(m_impl->inputNames.size());

        for (const std::string& name : m_impl->inputNames) {
            const std::vector<int64_t>* source = &tokenized.inputIds;
            if (name == "attention_mask") {
                source = &tokenized.attentionMask;
            } else if (name == "token_type_ids") {
                source = &tokenized.tokenTypeIds;
            }
            inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo, const_cast<int64_t*>(source->data()), source->size(), inputShape, 2));
            inputNames.push_back(name.c_str());
        }

        const char* outputNames[1] = {m_impl->outputName.c_str()};

        std::vector<Ort::Value> outputs = m_impl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames.data(),
            inputTensors.data(),
            inputTensors.size(),
            outputNames,
            1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: inference returned no tensor");
            m_circuitBreaker.recordFailure();
            return std::nullopt;
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        const int64_t dims = m_config.dimensions;
        const int batch = tokenized.batchSize;

        std::vector<Embedding> embeddings;
        embeddings.reserve(static_cast<size_t>(batch));

        if (data && shape.size() == 2 && shape[0] == batch && shape[1] == dims) {
            for (int i = 0; i < batch; ++i) {
                const float* row = data + static_cast<size_t>(i) * static_cast<size_t>(dims);
                embeddings.push_back(l2Normalize(Embedding(row, row + dims)));
            }
        } else if (data && shape.size() == 3 && shape[0] == batch && shape[1] >= 1
                   && shape[2] == dims) {
            const int64_t seqLen = shape[1];
            for (int i = 0; i < batch; ++i) {
                std::vector<double> sum(static_cast<size_t>(dims), 0.0);
                double maskTotal = 0.0;
                for (int64_t t = 0; t < seqLen && t < tokenized.seqLength; ++t) {
                    const int64_t mask = tokenized.attentionMask[
                        static_cast<size_t>(i) * static_cast<size_t>(tokenized.seqLength)
                        + static_cast<size_t>(t)];
                    if (mask == 0) {
                        continue;
                    }
                    const float* token = data
                        + (static_cast<size_t>(i) * static_cast<size_t>(seqLen)
                           + static_cast<size_t>(t)) * static_cast<size_t>(dims);
                    for (int64_t d = 0; d < dims; ++d) {
                        sum[static_cast<size_t>(d)] += token[d];
                    }
                    maskTotal += 1.0;
                }

                Embedding pooled(static_cast<size_t>(dims), 0.0f);
                if (maskTotal > 0.0) {
                    for (int64_t d = 0; d < dims; ++d) {
                        pooled[static_cast<size_t>(d)] =
                            static_cast<float>(sum[static_cast<size_t>(d)] / maskTotal);
                    }
                }
                embeddings.push_back(l2Normalize(std::move(pooled)));
            }
        } else {
            LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: unsupported output shape (rank %zu)",
                     shape.size());
            m_circuitBreaker.recordFailure();
            return std::nullopt;
        }

        m_circuitBreaker.recordSuccess();
        LOG_DEBUG(dqEmbedding, "DenseEmbeddingBackend: embedded %d texts in %lld ms",
                  batch, static_cast<long long>(timer.elapsed()));
        return embeddings;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(dqEmbedding, "DenseEmbeddingBackend: inference failed: %s", ex.what());
        m_circuitBreaker.recordFailure();
        return std::nullopt;
    }
}

} // namespace dq
