#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>
#include <utility>

#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

namespace dq {

namespace {

bool isPunctuation(QChar ch)
{
    const ushort code = ch.unicode();
    // ASCII non-alphanumerics are treated as punctuation, as in BERT
    if ((code >= 33 && code <= 47) || (code >= 58 && code <= 64)
        || (code >= 91 && code <= 96) || (code >= 123 && code <= 126)) {
        return true;
    }
    return ch.isPunct();
}

} // anonymous namespace

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::clamp(maxSequenceLength, 3, kMaxSupportedSequenceLength))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(dqEmbedding, "WordPieceTokenizer failed to open vocab: %s",
                 qUtf8Printable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        LOG_WARN(dqEmbedding, "WordPieceTokenizer loaded empty vocab from %s",
                 qUtf8Printable(vocabPath));
        return;
    }

    m_padTokenId = specialTokenId("[PAD]", m_padTokenId);
    m_unkTokenId = specialTokenId("[UNK]", m_unkTokenId);
    m_clsTokenId = specialTokenId("[CLS]", m_clsTokenId);
    m_sepTokenId = specialTokenId("[SEP]", m_sepTokenId);
    m_loaded = true;
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

int WordPieceTokenizer::vocabSize() const
{
    return static_cast<int>(m_vocab.size());
}

int64_t WordPieceTokenizer::specialTokenId(const char* token, int64_t fallback) const
{
    const auto it = m_vocab.find(token);
    return it != m_vocab.end() ? static_cast<int64_t>(it->second) : fallback;
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    QString normalized = text.toLower().normalized(QString::NormalizationForm_D);

    QString stripped;
    stripped.reserve(normalized.size());
    for (const QChar ch : normalized) {
        const QChar::Category category = ch.category();
        const bool isCombiningMark = category == QChar::Mark_NonSpacing
                                   || category == QChar::Mark_SpacingCombining
                                   || category == QChar::Mark_Enclosing;
        if (!isCombiningMark) {
            stripped.append(ch);
        }
    }

    static const QRegularExpression whitespaceRegex(QStringLiteral("\\s+"));
    stripped.replace(whitespaceRegex, QStringLiteral(" "));
    return stripped.trimmed();
}

std::vector<QString> WordPieceTokenizer::basicTokens(const QString& normalizedText) const
{
    std::vector<QString> tokens;
    QString current;
    for (const QChar ch : normalizedText) {
        if (ch.isSpace()) {
            if (!current.isEmpty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else if (isPunctuation(ch)) {
            if (!current.isEmpty()) {
                tokens.push_back(current);
                current.clear();
            }
            tokens.emplace_back(ch);
        } else {
            current.append(ch);
        }
    }
    if (!current.isEmpty()) {
        tokens.push_back(current);
    }
    return tokens;
}

void WordPieceTokenizer::appendWordPieces(const QString& token, std::vector<int64_t>* output) const
{
    const int maxContentTokens = m_maxSequenceLength - 2;
    if (!output || token.isEmpty() || static_cast<int>(output->size()) >= maxContentTokens) {
        return;
    }

    const int tokenLength = static_cast<int>(token.size());
    int start = 0;
    std::vector<int64_t> pieces;

    while (start < tokenLength) {
        int end = tokenLength;
        int matchedId = -1;

        while (end > start) {
            QString piece = token.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }

            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matchedId = it->second;
                break;
            }

            --end;
        }

        if (matchedId < 0) {
            // Whole word maps to [UNK] when any piece is unmatched
            pieces.assign(1, m_unkTokenId);
            break;
        }

        pieces.push_back(static_cast<int64_t>(matchedId));
        start = end;
    }

    for (const int64_t id : pieces) {
        if (static_cast<int>(output->size()) >= maxContentTokens) {
            break;
        }
        output->push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::tokenizeContent(const QString& normalizedText) const
{
    std::vector<int64_t> content;
    if (!m_loaded || normalizedText.isEmpty()) {
        return content;
    }

    const int maxContentTokens = m_maxSequenceLength - 2;
    for (const QString& word : basicTokens(normalizedText)) {
        if (static_cast<int>(content.size()) >= maxContentTokens) {
            break;
        }
        appendWordPieces(word, &content);
    }
    return content;
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text, int padToLength) const
{
    TokenizerOutput output;
    if (!m_loaded) {
        return output;
    }

    std::vector<int64_t> content = tokenizeContent(normalize(text));

    output.inputIds.reserve(content.size() + 2);
    output.inputIds.push_back(m_clsTokenId);
    output.inputIds.insert(output.inputIds.end(), content.begin(), content.end());
    output.inputIds.push_back(m_sepTokenId);

    const int unpaddedLength = static_cast<int>(output.inputIds.size());
    const int clampedPadLength = std::min(padToLength, m_maxSequenceLength);
    const int targetLength = std::max(unpaddedLength, clampedPadLength);

    output.attentionMask.assign(static_cast<size_t>(targetLength), 0);
    output.tokenTypeIds.assign(static_cast<size_t>(targetLength), 0);

    for (int i = 0; i < unpaddedLength; ++i) {
        output.attentionMask[static_cast<size_t>(i)] = 1;
    }

    if (targetLength > unpaddedLength) {
        output.inputIds.resize(static_cast<size_t>(targetLength), m_padTokenId);
    }

    output.seqLength = targetLength;
    return output;
}

BatchTokenizerOutput WordPieceTokenizer::tokenizeBatch(const std::vector<QString>& texts) const
{
    BatchTokenizerOutput batch;
    if (!m_loaded || texts.empty()) {
        return batch;
    }

    std::vector<TokenizerOutput> tokenized;
    tokenized.reserve(texts.size());

    int maxLength = 0;
    for (const QString& text : texts) {
        TokenizerOutput single = tokenize(text);
        maxLength = std::max(maxLength, single.seqLength);
        tokenized.push_back(std::move(single));
    }

    batch.batchSize = static_cast<int>(texts.size());
    batch.seqLength = maxLength;
    batch.inputIds.reserve(static_cast<size_t>(batch.batchSize * batch.seqLength));
    batch.attentionMask.reserve(static_cast<size_t>(batch.batchSize * batch.seqLength));
    batch.tokenTypeIds.reserve(static_cast<size_t>(batch.batchSize * batch.seqLength));

    for (TokenizerOutput& row : tokenized) {
        if (row.seqLength < maxLength) {
            row.inputIds.resize(static_cast<size_t>(maxLength), m_padTokenId);
            row.attentionMask.resize(static_cast<size_t>(maxLength), 0);
            row.tokenTypeIds.resize(static_cast<size_t>(maxLength), 0);
            row.seqLength = maxLength;
        }

        batch.inputIds.insert(batch.inputIds.end(), row.inputIds.begin(), row.inputIds.end());
        batch.attentionMask.insert(batch.attentionMask.end(), row.attentionMask.begin(), row.attentionMask.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(), row.tokenTypeIds.begin(), row.tokenTypeIds.end());
    }

    return batch;
}

} // namespace dq
