#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace ox {

QString computeChunkHash(const QString& text)
{
    const QByteArray hash = QCryptographicHash::hash(
        text.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace ox
