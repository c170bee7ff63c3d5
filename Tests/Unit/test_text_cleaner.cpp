#include <QtTest/QtTest>
#include "core/extraction/text_cleaner.h"

class TestTextCleaner : public QObject {
    Q_OBJECT

private slots:
    void testEmptyStaysEmpty();
    void testLineEndingsNormalized();
    void testControlCharactersDropped();
    void testInvisibleCharactersDropped();
    void testNoBreakSpaceBecomesSpace();
    void testHyphenatedLineBreakJoined();
    void testHyphenBeforeCapitalKept();
    void testWhitespaceCollapsed();
    void testBlankLinesCapped();
};

void TestTextCleaner::testEmptyStaysEmpty()
{
    QVERIFY(dq::TextCleaner::clean(QString()).isEmpty());
    QVERIFY(dq::TextCleaner::clean(QStringLiteral(" \t\n ")).isEmpty());
}

void TestTextCleaner::testLineEndingsNormalized()
{
    QCOMPARE(dq::TextCleaner::clean(QStringLiteral("a\r\nb\rc\nd")), QStringLiteral("a\nb\nc\nd"));
}

void TestTextCleaner::testControlCharactersDropped()
{
    const QString raw = QStringLiteral("be") + QChar(0x07) + QStringLiteral("ll") + QChar(0x7F)
        + QChar(0x00) + QStringLiteral("s");
    QCOMPARE(dq::TextCleaner::clean(raw), QStringLiteral("bells"));
}

void TestTextCleaner::testInvisibleCharactersDropped()
{
    const QString raw = QChar(0xFEFF) + QStringLiteral("zero") + QChar(0x200B)
        + QStringLiteral("width") + QChar(0x00AD) + QStringLiteral("ness");
    QCOMPARE(dq::TextCleaner::clean(raw), QStringLiteral("zerowidthness"));
}

void TestTextCleaner::testNoBreakSpaceBecomesSpace()
{
    const QString raw = QStringLiteral("10") + QChar(0x00A0) + QStringLiteral("km");
    QCOMPARE(dq::TextCleaner::clean(raw), QStringLiteral("10 km"));
}

void TestTextCleaner::testHyphenatedLineBreakJoined()
{
    QCOMPARE(dq::TextCleaner::clean(QStringLiteral("an exam-\n  ple of it")),
             QStringLiteral("an example of it"));
}

void TestTextCleaner::testHyphenBeforeCapitalKept()
{
    QCOMPARE(dq::TextCleaner::clean(QStringLiteral("Jean-\nPaul")), QStringLiteral("Jean-\nPaul"));
}

void TestTextCleaner::testWhitespaceCollapsed()
{
    QCOMPARE(dq::TextCleaner::clean(QStringLiteral("  a \t  b  \n   c  ")), QStringLiteral("a b\nc"));
}

void TestTextCleaner::testBlankLinesCapped()
{
    QCOMPARE(dq::TextCleaner::clean(QStringLiteral("top\n\n\n\n\nbottom")),
             QStringLiteral("top\n\nbottom"));
}

QTEST_MAIN(TestTextCleaner)
#include "test_text_cleaner.moc"
