#pragma once

#include <QSet>
#include <QString>

namespace dq {

// English stop-word list (the NLTK "english" corpus), lower-case.
const QSet<QString>& englishStopwords();

bool isStopword(const QString& lowerCaseToken);

} // namespace dq
