#include "core/embedding/http_embedding_transport.h"
#include "core/shared/logging.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <memory>

namespace ox {

TransportResponse HttpEmbeddingTransport::post(const QUrl& url, const QString& apiKey,
                                               const QByteArray& payload, int timeoutMs)
{
    TransportResponse response;

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("Authorization", QByteArrayLiteral("Bearer ") + apiKey.toUtf8());
    if (timeoutMs > 0) {
        request.setTransferTimeout(timeoutMs);
    }

    std::unique_ptr<QNetworkReply> reply(manager.post(request, payload));

    QEventLoop loop;
    QTimer watchdog;
    watchdog.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&watchdog, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
        loop.quit();
    });
    if (timeoutMs > 0) {
        // The transfer timeout normally fires first; this only covers stalls
        // the network stack does not report.
        watchdog.start(timeoutMs + 1000);
    }
    if (!reply->isFinished()) {
        loop.exec();
    }
    watchdog.stop();

    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();

    if (timedOut) {
        response.statusCode = 0;
        response.networkError = QStringLiteral("request timed out after %1 ms").arg(timeoutMs);
    } else if (response.statusCode == 0 && reply->error() != QNetworkReply::NoError) {
        response.networkError = reply->errorString();
    }

    if (!response.networkError.isEmpty()) {
        LOG_DEBUG(oxEmbed, "POST %s failed: %s",
                  qUtf8Printable(url.toString()), qUtf8Printable(response.networkError));
    }
    return response;
}

} // namespace ox
