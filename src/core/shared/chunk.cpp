#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace dq {

QString computeChunkId(const QString& documentId, int chunkIndex)
{
    const QString seed = documentId + QStringLiteral("#") + QString::number(chunkIndex);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace dq
