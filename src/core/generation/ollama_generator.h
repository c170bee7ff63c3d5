#pragma once

#include "core/generation/generator.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <chrono>

class QNetworkRequest;

namespace dq {

struct OllamaConfig {
    QString baseUrl = QStringLiteral("http://localhost:11434");
    QString model = QStringLiteral("llama3.2:latest");
    std::chrono::milliseconds probeTimeout{5000};
    double temperature = 0.1;
    double topP = 0.9;
    int maxTokens = 500;
};

// OllamaGenerator -- Generator over an Ollama-compatible HTTP API.
//
//   probe:    GET  {baseUrl}/api/tags
//   generate: POST {baseUrl}/api/generate  {model, prompt, stream:false, options}
//             -> {"response": "..."}
//
// Calls are synchronous: each request runs a local QEventLoop bounded by a
// single-shot timer and the reply is aborted when the timer fires. The
// calling thread needs a QCoreApplication to exist, not a running loop.
class OllamaGenerator : public Generator {
public:
    explicit OllamaGenerator(OllamaConfig config);

    bool isAvailable() override;
    GenerationResult generate(const QString& prompt, std::chrono::milliseconds timeout) override;
    QString describe() const override;

    // Model names reported by /api/tags.
    QStringList availableModels() override;

    const OllamaConfig& config() const { return m_config; }

    QByteArray buildRequestBody(const QString& prompt) const;

private:
    struct HttpResponse {
        bool timedOut = false;
        bool networkError = false;
        int httpStatus = 0;
        QByteArray body;
        QString errorString;
    };

    HttpResponse send(QNetworkRequest request, const QByteArray* postBody,
                      std::chrono::milliseconds timeout) const;
    QUrl endpoint(const QString& path) const;

    OllamaConfig m_config;
};

} // namespace dq
