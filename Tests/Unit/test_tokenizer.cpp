#include <QtTest/QtTest>
#include "core/embedding/tokenizer.h"

#include <QTemporaryDir>

#include <vector>

class TestTokenizer : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // ── Loading ──────────────────────────────────────────────────
    void testMissingVocabIsNotLoaded();
    void testVocabLoads();

    // ── WordPiece ────────────────────────────────────────────────
    void testWrapsWithClsAndSep();
    void testPunctuationIsSplit();
    void testSubwordPieces();
    void testAccentsStripped();
    void testUnknownWordMapsToUnk();

    // ── Shape ────────────────────────────────────────────────────
    void testPaddingAndAttentionMask();
    void testTruncationKeepsSep();
    void testBatchPadsToLongest();

private:
    QString writeVocab();

    QTemporaryDir m_tempDir;
    QString m_vocabPath;
};

// Token ids are line numbers
static const char* const kVocab[] = {
    "[PAD]", "[UNK]", "[CLS]", "[SEP]",
    "hello", "world", "##s", "un", "##aff", "##able", ",", "!", "cafe",
};

void TestTokenizer::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_vocabPath = writeVocab();
    QVERIFY(!m_vocabPath.isEmpty());
}

QString TestTokenizer::writeVocab()
{
    const QString path = m_tempDir.filePath(QStringLiteral("vocab.txt"));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return QString();
    }
    for (const char* token : kVocab) {
        file.write(token);
        file.write("\n");
    }
    return path;
}

// ── Loading ──────────────────────────────────────────────────────

void TestTokenizer::testMissingVocabIsNotLoaded()
{
    dq::WordPieceTokenizer tokenizer(m_tempDir.filePath(QStringLiteral("missing.txt")));
    QVERIFY(!tokenizer.isLoaded());
    QVERIFY(tokenizer.tokenize(QStringLiteral("hello")).inputIds.empty());
    QCOMPARE(tokenizer.tokenizeBatch({QStringLiteral("hello")}).batchSize, 0);
}

void TestTokenizer::testVocabLoads()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    QVERIFY(tokenizer.isLoaded());
    QCOMPARE(tokenizer.vocabSize(), 13);
    QCOMPARE(tokenizer.maxSequenceLength(), 256);
}

// ── WordPiece ────────────────────────────────────────────────────

void TestTokenizer::testWrapsWithClsAndSep()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    const dq::TokenizerOutput out = tokenizer.tokenize(QStringLiteral("hello world"));
    QCOMPARE(out.inputIds, (std::vector<int64_t>{2, 4, 5, 3}));
    QCOMPARE(out.attentionMask, (std::vector<int64_t>{1, 1, 1, 1}));
    QCOMPARE(out.tokenTypeIds, (std::vector<int64_t>{0, 0, 0, 0}));
    QCOMPARE(out.seqLength, 4);
}

void TestTokenizer::testPunctuationIsSplit()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    const dq::TokenizerOutput out = tokenizer.tokenize(QStringLiteral("Hello,  WORLD!"));
    QCOMPARE(out.inputIds, (std::vector<int64_t>{2, 4, 10, 5, 11, 3}));
}

void TestTokenizer::testSubwordPieces()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.tokenize(QStringLiteral("unaffable")).inputIds,
             (std::vector<int64_t>{2, 7, 8, 9, 3}));
    QCOMPARE(tokenizer.tokenize(QStringLiteral("worlds")).inputIds,
             (std::vector<int64_t>{2, 5, 6, 3}));
}

void TestTokenizer::testAccentsStripped()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.tokenize(QStringLiteral("Café")).inputIds,
             (std::vector<int64_t>{2, 12, 3}));
}

void TestTokenizer::testUnknownWordMapsToUnk()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    // "helloxyz" matches "hello" then fails on "##xyz": whole word is [UNK]
    QCOMPARE(tokenizer.tokenize(QStringLiteral("helloxyz world")).inputIds,
             (std::vector<int64_t>{2, 1, 5, 3}));
}

// ── Shape ────────────────────────────────────────────────────────

void TestTokenizer::testPaddingAndAttentionMask()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    const dq::TokenizerOutput out = tokenizer.tokenize(QStringLiteral("hello"), 6);
    QCOMPARE(out.seqLength, 6);
    QCOMPARE(out.inputIds, (std::vector<int64_t>{2, 4, 3, 0, 0, 0}));
    QCOMPARE(out.attentionMask, (std::vector<int64_t>{1, 1, 1, 0, 0, 0}));
}

void TestTokenizer::testTruncationKeepsSep()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath, 5);
    const dq::TokenizerOutput out = tokenizer.tokenize(QStringLiteral("hello world hello world"));
    QCOMPARE(out.seqLength, 5);
    QCOMPARE(out.inputIds, (std::vector<int64_t>{2, 4, 5, 4, 3}));
}

void TestTokenizer::testBatchPadsToLongest()
{
    dq::WordPieceTokenizer tokenizer(m_vocabPath);
    const dq::BatchTokenizerOutput batch =
        tokenizer.tokenizeBatch({QStringLiteral("hello"), QStringLiteral("hello world")});
    QCOMPARE(batch.batchSize, 2);
    QCOMPARE(batch.seqLength, 4);
    QCOMPARE(batch.inputIds, (std::vector<int64_t>{2, 4, 3, 0, 2, 4, 5, 3}));
    QCOMPARE(batch.attentionMask, (std::vector<int64_t>{1, 1, 1, 0, 1, 1, 1, 1}));
}

QTEST_MAIN(TestTokenizer)
#include "test_tokenizer.moc"
