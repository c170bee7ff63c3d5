#include "core/generation/ollama_generator.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <algorithm>
#include <utility>

namespace dq {

OllamaGenerator::OllamaGenerator(OllamaConfig config)
    : m_config(std::move(config))
{
    while (m_config.baseUrl.endsWith(QLatin1Char('/'))) {
        m_config.baseUrl.chop(1);
    }
}

QString OllamaGenerator::describe() const
{
    return QStringLiteral("ollama:%1@%2").arg(m_config.model, m_config.baseUrl);
}

QUrl OllamaGenerator::endpoint(const QString& path) const
{
    return QUrl(m_config.baseUrl + path);
}

QByteArray OllamaGenerator::buildRequestBody(const QString& prompt) const
{
    QJsonObject options;
    options[QStringLiteral("temperature")] = m_config.temperature;
    options[QStringLiteral("top_p")] = m_config.topP;
    options[QStringLiteral("num_predict")] = m_config.maxTokens;

    QJsonObject body;
    body[QStringLiteral("model")] = m_config.model;
    body[QStringLiteral("prompt")] = prompt;
    body[QStringLiteral("stream")] = false;
    body[QStringLiteral("options")] = options;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

OllamaGenerator::HttpResponse OllamaGenerator::send(QNetworkRequest request,
                                                    const QByteArray* postBody,
                                                    std::chrono::milliseconds timeout) const
{
    HttpResponse response;

    QNetworkAccessManager manager;
    QNetworkReply* reply = postBody ? manager.post(request, *postBody) : manager.get(request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(std::max<std::chrono::milliseconds::rep>(1, timeout.count())));

    if (!reply->isFinished()) {
        loop.exec();
    }

    if (!reply->isFinished()) {
        response.timedOut = true;
        response.errorString = QStringLiteral("no response within %1 ms").arg(timeout.count());
        reply->abort();
        delete reply;
        return response;
    }

    response.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError && response.httpStatus == 0) {
        response.networkError = true;
        response.errorString = reply->errorString();
    }
    delete reply;
    return response;
}

bool OllamaGenerator::isAvailable()
{
    QNetworkRequest request(endpoint(QStringLiteral("/api/tags")));
    const HttpResponse response = send(request, nullptr, m_config.probeTimeout);
    const bool ok = !response.timedOut && !response.networkError
        && response.httpStatus >= 200 && response.httpStatus < 300;
    if (!ok) {
        LOG_DEBUG(dqGeneration, "Ollama probe failed: %s (HTTP %d)",
                  qUtf8Printable(response.errorString), response.httpStatus);
    }
    return ok;
}

QStringList OllamaGenerator::availableModels()
{
    QStringList models;
    QNetworkRequest request(endpoint(QStringLiteral("/api/tags")));
    const HttpResponse response = send(request, nullptr, m_config.probeTimeout);
    if (response.timedOut || response.networkError
        || response.httpStatus < 200 || response.httpStatus >= 300) {
        return models;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(response.body);
    const QJsonArray entries = doc.object().value(QStringLiteral("models")).toArray();
    for (const QJsonValue& entry : entries) {
        const QString name = entry.toObject().value(QStringLiteral("name")).toString();
        if (!name.isEmpty()) {
            models.append(name);
        }
    }
    return models;
}

GenerationResult OllamaGenerator::generate(const QString& prompt, std::chrono::milliseconds timeout)
{
    GenerationResult result;
    if (m_config.baseUrl.isEmpty() || m_config.model.isEmpty()) {
        result.status = GenerationResult::Status::NotConfigured;
        result.errorMessage = QStringLiteral("generator URL or model not set");
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    QNetworkRequest request(endpoint(QStringLiteral("/api/generate")));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    const QByteArray body = buildRequestBody(prompt);

    const HttpResponse response = send(request, &body, timeout);
    result.durationMs = static_cast<int>(timer.elapsed());

    if (response.timedOut) {
        result.status = GenerationResult::Status::Timeout;
        result.errorMessage = response.errorString;
    } else if (response.networkError) {
        result.status = GenerationResult::Status::NetworkError;
        result.errorMessage = response.errorString;
    } else if (response.httpStatus < 200 || response.httpStatus >= 300) {
        result.status = GenerationResult::Status::HttpError;
        const QString serverError = QJsonDocument::fromJson(response.body)
                                        .object().value(QStringLiteral("error")).toString();
        result.errorMessage = QStringLiteral("HTTP %1%2").arg(response.httpStatus)
            .arg(serverError.isEmpty() ? QString() : QStringLiteral(": ") + serverError);
    } else {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
        const QJsonValue text = doc.object().value(QStringLiteral("response"));
        if (parseError.error != QJsonParseError::NoError || !doc.isObject() || !text.isString()) {
            result.status = GenerationResult::Status::InvalidResponse;
            result.errorMessage = parseError.error != QJsonParseError::NoError
                ? parseError.errorString()
                : QStringLiteral("missing \"response\" field");
        } else {
            result.status = GenerationResult::Status::Success;
            result.text = text.toString();
        }
    }

    if (result.status == GenerationResult::Status::Success) {
        LOG_INFO(dqGeneration, "Ollama generated %d chars in %d ms",
                 static_cast<int>(result.text->size()), result.durationMs);
    } else {
        LOG_WARN(dqGeneration, "Ollama generate failed (%s): %s",
                 qUtf8Printable(generationStatusToString(result.status)),
                 qUtf8Printable(result.errorMessage.value_or(QString())));
    }
    return result;
}

} // namespace dq
