#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace dq {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

struct BatchTokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;
};

// WordPieceTokenizer -- uncased BERT tokenization for the dense
// sentence-embedding model: lower-case, strip accents, split on whitespace
// and punctuation, then greedy longest-match WordPiece against vocab.txt.
// Sequences are [CLS] tokens [SEP], truncated to maxSequenceLength.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength = 256);

    bool isLoaded() const;
    int vocabSize() const;
    int maxSequenceLength() const { return m_maxSequenceLength; }

    TokenizerOutput tokenize(const QString& text, int padToLength = 0) const;
    BatchTokenizerOutput tokenizeBatch(const std::vector<QString>& texts) const;

private:
    static constexpr int kMaxSupportedSequenceLength = 512;

    QString normalize(const QString& text) const;
    std::vector<QString> basicTokens(const QString& normalizedText) const;
    std::vector<int64_t> tokenizeContent(const QString& normalizedText) const;
    void appendWordPieces(const QString& token, std::vector<int64_t>* output) const;
    int64_t specialTokenId(const char* token, int64_t fallback) const;

    std::unordered_map<std::string, int> m_vocab;
    int m_maxSequenceLength = 256;
    int64_t m_padTokenId = 0;
    int64_t m_unkTokenId = 100;
    int64_t m_clsTokenId = 101;
    int64_t m_sepTokenId = 102;
    bool m_loaded = false;
};

} // namespace dq
