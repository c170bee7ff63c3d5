#include "core/extraction/text_cleaner.h"

#include <QRegularExpression>

namespace dq {

namespace {

bool isDropped(char16_t code)
{
    if (code < 0x20) {
        return code != u'\t' && code != u'\n';
    }
    switch (code) {
    case 0x007F:   // DEL
    case 0x00AD:   // soft hyphen
    case 0x200B:   // zero-width space
    case 0x200C:
    case 0x200D:
    case 0x2060:   // word joiner
    case 0xFEFF:   // BOM
        return true;
    default:
        return false;
    }
}

} // anonymous namespace

QString TextCleaner::clean(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString text;
    text.reserve(raw.size());

    for (qsizetype i = 0; i < raw.size(); ++i) {
        const char16_t code = raw.at(i).unicode();
        if (code == u'\r') {
            if (i + 1 < raw.size() && raw.at(i + 1) == QLatin1Char('\n')) {
                ++i;
            }
            text.append(QLatin1Char('\n'));
        } else if (code == 0x00A0 || code == 0x202F) {
            text.append(QLatin1Char(' '));
        } else if (!isDropped(code)) {
            text.append(raw.at(i));
        }
    }

    static const QRegularExpression hyphenatedBreak(QStringLiteral("(\\p{L})-\\n[ \\t]*(\\p{Ll})"));
    static const QRegularExpression horizontalRun(QStringLiteral("[ \\t]+"));
    static const QRegularExpression spaceAroundNewline(QStringLiteral(" ?\\n ?"));
    static const QRegularExpression newlineRun(QStringLiteral("\\n{3,}"));

    text.replace(hyphenatedBreak, QStringLiteral("\\1\\2"));
    text.replace(horizontalRun, QStringLiteral(" "));
    text.replace(spaceAroundNewline, QStringLiteral("\n"));
    text.replace(newlineRun, QStringLiteral("\n\n"));

    return text.trimmed();
}

} // namespace dq
