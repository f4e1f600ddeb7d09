#include "core/query/vault_search_engine.h"
#include "core/embedding/embedding_client.h"
#include "core/index/vault_store.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <limits>

namespace ox {

VaultSearchEngine::VaultSearchEngine(VaultStore& store, EmbeddingClient& embedder,
                                     const VaultSearchConfig& config)
    : m_store(store)
    , m_embedder(embedder)
    , m_config(config)
    , m_referenceDate([]() { return QDate::currentDate(); })
{
}

std::vector<VaultSearchResult> VaultSearchEngine::search(const QString& query,
                                                         std::optional<int> topK,
                                                         std::optional<double> minScore,
                                                         const std::atomic<bool>* cancel)
{
    Options options;
    options.topK = topK;
    options.minScore = minScore;
    return searchDetailed(query, options, cancel).results;
}

VaultSearchEngine::DetailedResult VaultSearchEngine::searchDetailed(const QString& query,
                                                                    const Options& options,
                                                                    const std::atomic<bool>* cancel)
{
    DetailedResult detailed;
    detailed.translated.originalQuery = query;

    if (!m_config.enabled) {
        LOG_DEBUG(oxQuery, "Vault search is disabled");
        return detailed;
    }
    if (query.trimmed().isEmpty()) {
        return detailed;
    }

    // Twice topK candidates are fetched, so keep the doubling in range.
    const int topK = std::clamp(options.topK.value_or(m_config.topK), 1,
                                std::numeric_limits<int>::max() / 2);
    const double minScore = options.minScore.value_or(m_config.minScore);

    QElapsedTimer timer;
    timer.start();

    detailed.translated = m_translator.translate(query, m_referenceDate());
    const QString combined = detailed.translated.combinedQuery();

    LOG_DEBUG(oxQuery, "Searching vault: query=\"%s\" dateTerms=%d topK=%d minScore=%.2f",
              qUtf8Printable(query), static_cast<int>(detailed.translated.dateTerms.size()),
              topK, minScore);

    const std::vector<float> queryEmbedding = m_embedder.getEmbedding(combined, cancel);

    std::vector<VaultSearchResult> raw = m_store.nearestNeighbors(queryEmbedding, topK * 2, minScore);
    const size_t rawCount = raw.size();

    if (options.restrictToDateRange && detailed.translated.hasRange()) {
        const QDate start = *detailed.translated.startDate;
        const QDate end = *detailed.translated.endDate;
        raw.erase(std::remove_if(raw.begin(), raw.end(),
                                 [&](const VaultSearchResult& r) {
                                     const std::optional<QDate> date = noteDateFromPath(r.filePath);
                                     return date && (*date < start || *date > end);
                                 }),
                  raw.end());
    }

    detailed.results = dedupeByFile(raw, topK);

    LOG_DEBUG(oxQuery, "Vault search returned %d results (from %d raw) in %lld ms",
              static_cast<int>(detailed.results.size()), static_cast<int>(rawCount),
              static_cast<long long>(timer.elapsed()));
    return detailed;
}

bool VaultSearchEngine::isAvailable() const
{
    return m_config.enabled && m_store.isVectorSearchAvailable();
}

VaultStats VaultSearchEngine::stats()
{
    return m_store.stats();
}

void VaultSearchEngine::setReferenceDateProvider(ReferenceDateProvider provider)
{
    if (provider) {
        m_referenceDate = std::move(provider);
    }
}

} // namespace ox
