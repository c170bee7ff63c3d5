#include "core/shared/types.h"

#include <QCryptographicHash>
#include <QUuid>

namespace dq {

QString embeddingBackendKindToString(EmbeddingBackendKind kind)
{
    switch (kind) {
    case EmbeddingBackendKind::Dense:  return QStringLiteral("dense");
    case EmbeddingBackendKind::Sparse: return QStringLiteral("sparse");
    }
    return QStringLiteral("sparse");
}

QString computeContentHash(const QByteArray& rawBytes)
{
    const QByteArray hash = QCryptographicHash::hash(rawBytes, QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

QString generateDocumentId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace dq
