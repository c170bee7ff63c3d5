#include "core/ranking/answer_synthesizer.h"
#include "core/generation/generator.h"
#include "core/shared/logging.h"
#include "core/shared/stopwords.h"
#include "core/shared/text_segmenter.h"

#include <QSet>

#include <algorithm>
#include <numeric>

namespace dq {

QString answerModeToString(AnswerResult::Mode mode)
{
    switch (mode) {
    case AnswerResult::Mode::Generated:               return QStringLiteral("generated");
    case AnswerResult::Mode::Extractive:              return QStringLiteral("extractive");
    case AnswerResult::Mode::InsufficientInformation: return QStringLiteral("insufficient_information");
    }
    return QStringLiteral("unknown");
}

AnswerSynthesizer::AnswerSynthesizer(Generator* generator,
                                     std::chrono::milliseconds generatorTimeout)
    : m_generator(generator)
    , m_generatorTimeout(generatorTimeout)
{
}

QString AnswerSynthesizer::insufficientInformationAnswer()
{
    return QStringLiteral("I don't have enough information to answer that question. "
                          "Please upload relevant documents first.");
}

QString AnswerSynthesizer::buildPrompt(const QString& context, const QString& query)
{
    return QStringLiteral(
               "Based on the following context, please answer the question.\n\n"
               "Context:\n%1\n\n"
               "Question: %2\n\n"
               "Please provide a clear, concise answer based on the context provided. "
               "If the context doesn't contain enough information to answer the question, "
               "please say so.\n\n"
               "Answer:")
        .arg(context, query);
}

QString AnswerSynthesizer::extractiveAnswer(const QString& query, const QString& passage)
{
    const QStringList sentences = TextSegmenter::sentences(passage);
    if (sentences.isEmpty()) {
        return passage.trimmed();
    }

    QSet<QString> queryWords;
    for (const QString& token : TextSegmenter::tokens(query)) {
        if (!isStopword(token)) {
            queryWords.insert(token);
        }
    }

    std::vector<int> scores;
    scores.reserve(static_cast<size_t>(sentences.size()));
    for (const QString& sentence : sentences) {
        const QStringList tokens = TextSegmenter::tokens(sentence);
        const QSet<QString> sentenceWords(tokens.begin(), tokens.end());
        int overlap = 0;
        for (const QString& word : sentenceWords) {
            if (queryWords.contains(word)) {
                ++overlap;
            }
        }
        scores.push_back(overlap);
    }

    std::vector<int> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scores](int a, int b) {
        return scores[static_cast<size_t>(a)] > scores[static_cast<size_t>(b)];
    });

    QStringList selected;
    for (const int i : order) {
        if (selected.size() >= kMaxExtractiveSentences || scores[static_cast<size_t>(i)] == 0) {
            break;
        }
        selected.append(sentences.at(i));
    }

    if (selected.isEmpty()) {
        selected = sentences.mid(0, kFallbackSentences);
    }
    return selected.join(QLatin1Char(' '));
}

AnswerResult AnswerSynthesizer::answer(const QString& query,
                                       const std::vector<RetrievalResult>& results) const
{
    AnswerResult result;
    if (results.empty()) {
        result.answer = insufficientInformationAnswer();
        result.mode = AnswerResult::Mode::InsufficientInformation;
        return result;
    }

    QStringList contextParts;
    for (const RetrievalResult& r : results) {
        contextParts.append(r.chunk.text);
        if (!result.sources.contains(r.chunk.filename)) {
            result.sources.append(r.chunk.filename);
        }
    }
    result.context = contextParts.join(QStringLiteral("\n\n"));
    result.confidence = RetrievalRanker::confidence(results);

    if (m_generator) {
        const GenerationResult generated =
            m_generator->generate(buildPrompt(result.context, query), m_generatorTimeout);
        if (generated.status == GenerationResult::Status::Success && generated.text
            && !generated.text->trimmed().isEmpty()) {
            result.answer = generated.text->trimmed();
            result.mode = AnswerResult::Mode::Generated;
            return result;
        }
        result.generatorError = QStringLiteral("%1: %2").arg(
            generationStatusToString(generated.status),
            generated.errorMessage.value_or(QStringLiteral("empty response")));
        LOG_WARN(dqGeneration, "Generator failed, using extractive answer: %s",
                 qUtf8Printable(*result.generatorError));
    }

    result.answer = extractiveAnswer(query, results.front().chunk.text);
    result.mode = AnswerResult::Mode::Extractive;
    return result;
}

} // namespace dq
