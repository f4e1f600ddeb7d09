#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

namespace ox {

struct TransportResponse {
    int statusCode = 0;       // 0 when no HTTP response was received
    QByteArray body;
    QString networkError;     // set for connection failures and timeouts
};

// Single JSON POST to an embeddings endpoint. Implementations block until the
// exchange completes or `timeoutMs` elapses and never throw.
class EmbeddingTransport {
public:
    virtual ~EmbeddingTransport() = default;

    virtual TransportResponse post(const QUrl& url, const QString& apiKey,
                                   const QByteArray& payload, int timeoutMs) = 0;
};

} // namespace ox
