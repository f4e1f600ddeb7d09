#pragma once

#include "core/embedding/embedding_transport.h"

#include <QString>

#include <atomic>
#include <memory>
#include <vector>

namespace ox {

struct EmbeddingClientConfig {
    QString baseUrl = QStringLiteral("https://api.openai.com/v1");
    QString model = QStringLiteral("text-embedding-3-small");
    QString apiKey;
    int timeoutMs = 30000;
    int maxAttempts = 3;
    int retryBaseDelayMs = 2000;
    int maxRetryDelayMs = 30000;
    int maxBatchSize = 2048;   // provider limit on inputs per request
};

// EmbeddingClient: turns texts into vectors through an OpenAI-compatible
// /embeddings endpoint.
//
// Inputs are split into requests of at most maxBatchSize. Each response is
// re-sorted by the `index` of its data items so vectors line up with inputs.
// HTTP 429, 5xx and network errors are retried with exponential backoff
// (base, doubling, capped); anything else fails the batch immediately.
//
// Errors: EmbeddingError (see Kind), OperationCanceled when `cancel` is set.
class EmbeddingClient {
public:
    explicit EmbeddingClient(const EmbeddingClientConfig& config,
                             std::shared_ptr<EmbeddingTransport> transport = nullptr);

    // True when both API key and model are set.
    bool isConfigured() const;

    std::vector<std::vector<float>> getEmbeddings(const std::vector<QString>& texts,
                                                  const std::atomic<bool>* cancel = nullptr);

    std::vector<float> getEmbedding(const QString& text,
                                    const std::atomic<bool>* cancel = nullptr);

    // Delay before retry number `attempt` (1-based).
    int backoffDelayMs(int attempt) const;

    const EmbeddingClientConfig& config() const { return m_config; }

    // Parses one /embeddings response body holding exactly `expectedCount`
    // vectors. Throws EmbeddingError(Protocol) on any inconsistency.
    static std::vector<std::vector<float>> parseResponse(const QByteArray& body,
                                                         int expectedCount);

private:
    std::vector<std::vector<float>> requestBatch(const std::vector<QString>& texts,
                                                 const std::atomic<bool>* cancel);
    void sleepWithCancel(int delayMs, const std::atomic<bool>* cancel) const;

    EmbeddingClientConfig m_config;
    std::shared_ptr<EmbeddingTransport> m_transport;
};

} // namespace ox
