#pragma once

#include "core/embedding/embedding_transport.h"

namespace ox {

// QNetworkAccessManager-backed transport. A manager is created per request so
// the transport can be used from any thread; the calling thread spins a local
// event loop until the reply finishes. Requires a QCoreApplication.
class HttpEmbeddingTransport : public EmbeddingTransport {
public:
    TransportResponse post(const QUrl& url, const QString& apiKey,
                           const QByteArray& payload, int timeoutMs) override;
};

} // namespace ox
