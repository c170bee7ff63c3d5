#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace dq {

struct Settings {
    // Storage
    QString dataDir;                       // empty = <GenericDataLocation>/docquery
    QString dbPath;                        // empty = <dataDir>/docquery.db

    // Chunking (measured in words)
    int chunkSize = 500;
    int chunkOverlap = 50;

    // Retrieval
    int maxResults = 5;
    double minSimilarity = 0.1;

    // Upload limits
    int64_t maxFileSize = 10 * 1024 * 1024;  // 10 MB
    QStringList allowedExtensions = {
        QStringLiteral("txt"),
        QStringLiteral("md"),
        QStringLiteral("markdown"),
        QStringLiteral("pdf"),
        QStringLiteral("docx"),
    };

    // Dense embedding (all-MiniLM-L6-v2 ONNX export)
    bool denseEmbeddingEnabled = true;
    QString embeddingModelPath;            // empty = <dataDir>/models/all-MiniLM-L6-v2/model.onnx
    QString embeddingVocabPath;            // empty = <dataDir>/models/all-MiniLM-L6-v2/vocab.txt
    int embeddingDimensions = 384;
    int embeddingMaxSequenceLength = 256;

    // Sparse fallback
    int sparseMaxFeatures = 5000;

    // Generator (Ollama-compatible HTTP endpoint)
    bool generatorEnabled = true;
    QString generatorUrl = QStringLiteral("http://localhost:11434");
    QString generatorModel = QStringLiteral("llama3.2:latest");
    int generatorTimeoutMs = 60000;
    int generatorProbeTimeoutMs = 5000;
    double generatorTemperature = 0.1;
    double generatorTopP = 0.9;
    int generatorMaxTokens = 500;
};

} // namespace dq
