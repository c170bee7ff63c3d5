#pragma once

#include <QString>
#include <QStringList>

#include <chrono>
#include <optional>

namespace dq {

// Result of one generation request. Text is present only on Success.
struct GenerationResult {
    enum class Status {
        Success,
        Timeout,
        NetworkError,      // connection refused, DNS, TLS, reset
        HttpError,         // non-2xx response
        InvalidResponse,   // 2xx but body unusable
        NotConfigured,
    };

    Status status = Status::NotConfigured;
    std::optional<QString> text;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

QString generationStatusToString(GenerationResult::Status status);

// Generator -- external text generator consulted by AnswerSynthesizer.
//
// Implementations make exactly one bounded attempt per call and never
// throw; every failure is reported through GenerationResult.
class Generator {
public:
    virtual ~Generator() = default;

    // Cheap reachability check, bounded by the implementation's probe timeout.
    virtual bool isAvailable() = 0;

    virtual GenerationResult generate(const QString& prompt, std::chrono::milliseconds timeout) = 0;

    // Human-readable target, e.g. "ollama:llama3.2:latest@http://localhost:11434".
    virtual QString describe() const = 0;

    // Models the endpoint can serve; empty when unknown or unreachable.
    virtual QStringList availableModels() { return {}; }
};

} // namespace dq
