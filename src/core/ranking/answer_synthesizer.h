#pragma once

#include "core/ranking/retrieval_ranker.h"

#include <QString>
#include <QStringList>

#include <chrono>
#include <optional>
#include <vector>

namespace dq {

class Generator;

struct AnswerResult {
    enum class Mode {
        Generated,                // generator output
        Extractive,               // sentences selected from the best chunk
        InsufficientInformation,  // nothing retrieved
    };

    QString answer;
    QStringList sources;          // distinct filenames, first appearance in ranking order
    double confidence = 0.0;      // mean similarity of contributing chunks
    QString context;              // chunk texts in ranking order, blank-line separated
    Mode mode = Mode::InsufficientInformation;
    std::optional<QString> generatorError;   // why the generator was not used
};

QString answerModeToString(AnswerResult::Mode mode);

// AnswerSynthesizer -- turns ranked chunks into an answer.
//
// With a generator configured, the prompt built from the context and question
// is sent once with a bounded timeout; reachability is not checked first.
// Any generator absence or failure, unreachable hosts included, falls back
// to extractive synthesis, which is deterministic for a given query and
// result list.
//
// No corpus lock is involved: the synthesizer only sees the results.
class AnswerSynthesizer {
public:
    static constexpr int kMaxExtractiveSentences = 3;
    static constexpr int kFallbackSentences = 2;

    explicit AnswerSynthesizer(Generator* generator = nullptr,
                               std::chrono::milliseconds generatorTimeout = std::chrono::seconds(60));

    AnswerResult answer(const QString& query, const std::vector<RetrievalResult>& results) const;

    static QString insufficientInformationAnswer();
    static QString buildPrompt(const QString& context, const QString& query);

    // Up to kMaxExtractiveSentences sentences of `passage` sharing the most
    // non-stop-words with `query`, or its first kFallbackSentences sentences
    // when none overlaps.
    static QString extractiveAnswer(const QString& query, const QString& passage);

private:
    Generator* m_generator = nullptr;
    std::chrono::milliseconds m_generatorTimeout;
};

} // namespace dq
