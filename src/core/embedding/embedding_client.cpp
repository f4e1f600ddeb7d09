#include "core/embedding/embedding_client.h"
#include "core/embedding/embedding_error.h"
#include "core/embedding/http_embedding_transport.h"
#include "core/shared/cancellation.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>
#include <QUrl>

#include <algorithm>

namespace ox {

namespace {

constexpr int kSleepSliceMs = 50;

bool isRetryableStatus(int statusCode)
{
    return statusCode == 429 || statusCode >= 500;
}

QString errorSnippet(const QByteArray& body)
{
    // Prefer the provider's error.message when present.
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (doc.isObject()) {
        const QString message = doc.object()
                                    .value(QStringLiteral("error")).toObject()
                                    .value(QStringLiteral("message")).toString();
        if (!message.isEmpty()) {
            return message;
        }
    }
    return QString::fromUtf8(body.left(200));
}

} // namespace

EmbeddingClient::EmbeddingClient(const EmbeddingClientConfig& config,
                                 std::shared_ptr<EmbeddingTransport> transport)
    : m_config(config)
    , m_transport(std::move(transport))
{
    if (!m_transport) {
        m_transport = std::make_shared<HttpEmbeddingTransport>();
    }
    m_config.maxBatchSize = std::clamp(m_config.maxBatchSize, 1, 2048);
    m_config.maxAttempts = std::max(m_config.maxAttempts, 1);
    m_config.retryBaseDelayMs = std::max(m_config.retryBaseDelayMs, 0);
    m_config.maxRetryDelayMs = std::max(m_config.maxRetryDelayMs, m_config.retryBaseDelayMs);
}

bool EmbeddingClient::isConfigured() const
{
    return !m_config.apiKey.trimmed().isEmpty() && !m_config.model.trimmed().isEmpty();
}

std::vector<std::vector<float>> EmbeddingClient::getEmbeddings(const std::vector<QString>& texts,
                                                               const std::atomic<bool>* cancel)
{
    if (m_config.apiKey.trimmed().isEmpty()) {
        throw EmbeddingError(EmbeddingError::Kind::Configuration,
                             QStringLiteral("embedding API key is not configured"));
    }
    if (m_config.model.trimmed().isEmpty()) {
        throw EmbeddingError(EmbeddingError::Kind::Configuration,
                             QStringLiteral("embedding model is not configured"));
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    const size_t batchSize = static_cast<size_t>(m_config.maxBatchSize);
    for (size_t start = 0; start < texts.size(); start += batchSize) {
        throwIfCanceled(cancel);
        const size_t end = std::min(texts.size(), start + batchSize);
        const std::vector<QString> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));
        std::vector<std::vector<float>> vectors = requestBatch(batch, cancel);
        for (auto& vec : vectors) {
            embeddings.push_back(std::move(vec));
        }
    }
    return embeddings;
}

std::vector<float> EmbeddingClient::getEmbedding(const QString& text,
                                                 const std::atomic<bool>* cancel)
{
    std::vector<std::vector<float>> vectors = getEmbeddings({text}, cancel);
    return std::move(vectors.front());
}

int EmbeddingClient::backoffDelayMs(int attempt) const
{
    int64_t delay = m_config.retryBaseDelayMs;
    for (int i = 1; i < attempt && delay < m_config.maxRetryDelayMs; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<int64_t>(delay, m_config.maxRetryDelayMs));
}

std::vector<std::vector<float>> EmbeddingClient::requestBatch(const std::vector<QString>& texts,
                                                              const std::atomic<bool>* cancel)
{
    QJsonArray input;
    for (const QString& text : texts) {
        input.append(text);
    }
    QJsonObject payload;
    payload[QStringLiteral("model")] = m_config.model;
    payload[QStringLiteral("input")] = input;
    payload[QStringLiteral("encoding_format")] = QStringLiteral("float");
    const QByteArray body = QJsonDocument(payload).toJson(QJsonDocument::Compact);

    QString base = m_config.baseUrl.trimmed();
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    const QUrl url(base + QStringLiteral("/embeddings"));

    QString lastError;
    int lastStatus = 0;
    for (int attempt = 1; attempt <= m_config.maxAttempts; ++attempt) {
        throwIfCanceled(cancel);

        const TransportResponse response =
            m_transport->post(url, m_config.apiKey, body, m_config.timeoutMs);

        if (response.statusCode >= 200 && response.statusCode < 300) {
            return parseResponse(response.body, static_cast<int>(texts.size()));
        }

        if (response.statusCode == 0) {
            lastError = response.networkError.isEmpty()
                ? QStringLiteral("no response from embedding provider")
                : response.networkError;
        } else if (isRetryableStatus(response.statusCode)) {
            lastError = QStringLiteral("HTTP %1: %2")
                            .arg(response.statusCode)
                            .arg(errorSnippet(response.body));
        } else {
            throw EmbeddingError(EmbeddingError::Kind::Http,
                                 QStringLiteral("embedding request failed with HTTP %1: %2")
                                     .arg(response.statusCode)
                                     .arg(errorSnippet(response.body)),
                                 response.statusCode);
        }
        lastStatus = response.statusCode;

        if (attempt < m_config.maxAttempts) {
            const int delay = backoffDelayMs(attempt);
            LOG_WARN(oxEmbed, "Embedding attempt %d/%d failed (%s), retrying in %d ms",
                     attempt, m_config.maxAttempts, qUtf8Printable(lastError), delay);
            sleepWithCancel(delay, cancel);
        }
    }

    throw EmbeddingError(EmbeddingError::Kind::Transient,
                         QStringLiteral("embedding request failed after %1 attempts: %2")
                             .arg(m_config.maxAttempts)
                             .arg(lastError),
                         lastStatus);
}

void EmbeddingClient::sleepWithCancel(int delayMs, const std::atomic<bool>* cancel) const
{
    int remaining = delayMs;
    while (remaining > 0) {
        throwIfCanceled(cancel);
        const int slice = std::min(remaining, kSleepSliceMs);
        QThread::msleep(static_cast<unsigned long>(slice));
        remaining -= slice;
    }
    throwIfCanceled(cancel);
}

std::vector<std::vector<float>> EmbeddingClient::parseResponse(const QByteArray& body,
                                                               int expectedCount)
{
    auto protocolError = [](const QString& message) {
        return EmbeddingError(EmbeddingError::Kind::Protocol, message);
    };

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        throw protocolError(QStringLiteral("invalid JSON in embedding response: %1")
                                .arg(parseError.errorString()));
    }

    const QJsonValue dataValue = doc.object().value(QStringLiteral("data"));
    if (!dataValue.isArray()) {
        throw protocolError(QStringLiteral("embedding response has no data array"));
    }
    const QJsonArray data = dataValue.toArray();
    if (data.size() != expectedCount) {
        throw protocolError(QStringLiteral("embedding response has %1 items, expected %2")
                                .arg(data.size())
                                .arg(expectedCount));
    }

    std::vector<std::vector<float>> vectors(static_cast<size_t>(expectedCount));
    std::vector<bool> seen(static_cast<size_t>(expectedCount), false);
    int dimensions = -1;

    for (const QJsonValue& itemValue : data) {
        const QJsonObject item = itemValue.toObject();
        const QJsonValue indexValue = item.value(QStringLiteral("index"));
        if (!indexValue.isDouble()) {
            throw protocolError(QStringLiteral("embedding item is missing its index"));
        }
        const double rawIndex = indexValue.toDouble();
        const int index = static_cast<int>(rawIndex);
        if (static_cast<double>(index) != rawIndex || index < 0 || index >= expectedCount) {
            throw protocolError(QStringLiteral("embedding item index %1 is out of range")
                                    .arg(rawIndex));
        }
        if (seen[static_cast<size_t>(index)]) {
            throw protocolError(QStringLiteral("duplicate embedding index %1").arg(index));
        }
        seen[static_cast<size_t>(index)] = true;

        const QJsonValue embeddingValue = item.value(QStringLiteral("embedding"));
        if (!embeddingValue.isArray() || embeddingValue.toArray().isEmpty()) {
            throw protocolError(QStringLiteral("embedding item %1 has no embedding array")
                                    .arg(index));
        }
        const QJsonArray values = embeddingValue.toArray();
        if (dimensions < 0) {
            dimensions = static_cast<int>(values.size());
        } else if (values.size() != dimensions) {
            throw protocolError(QStringLiteral("inconsistent embedding dimensions (%1 vs %2)")
                                    .arg(values.size())
                                    .arg(dimensions));
        }

        std::vector<float>& vec = vectors[static_cast<size_t>(index)];
        vec.reserve(static_cast<size_t>(values.size()));
        for (const QJsonValue& v : values) {
            if (!v.isDouble()) {
                throw protocolError(QStringLiteral("non-numeric value in embedding %1").arg(index));
            }
            vec.push_back(static_cast<float>(v.toDouble()));
        }
    }

    return vectors;
}

} // namespace ox
