#pragma once

#include <QString>

namespace dq {

// TextCleaner -- normalizes raw extractor output before chunking.
//
// 1. \r\n and \r become \n
// 2. Control characters other than tab and newline, DEL, BOMs and
//    zero-width characters are dropped; no-break spaces become spaces
// 3. Soft hyphens are dropped and "exam-\nple" line-break hyphenation is joined
// 4. Runs of spaces/tabs collapse to one space, 3+ newlines to 2
// 5. Leading/trailing whitespace is trimmed
class TextCleaner {
public:
    static QString clean(const QString& raw);
};

} // namespace dq
