#pragma once

#include "core/query/date_query_translator.h"
#include "core/shared/search_result.h"
#include "core/shared/types.h"

#include <QDate>
#include <QString>

#include <atomic>
#include <functional>
#include <optional>
#include <vector>

namespace ox {

class EmbeddingClient;
class VaultStore;

struct VaultSearchConfig {
    bool enabled = true;
    int topK = 5;
    double minScore = 0.3;
};

// VaultSearchEngine: semantic search over the indexed vault.
//
// The query's date phrases are resolved first and their terms appended, so
// "what did I do yesterday" also embeds "2026-01-18 20260118 ...". The
// nearest 2*topK chunks are fetched to survive per-note dedup, then only the
// best chunk per note is kept.
//
// Embedding failures propagate (EmbeddingError, OperationCanceled); there is
// no retry beyond the client's own policy.
class VaultSearchEngine {
public:
    using ReferenceDateProvider = std::function<QDate()>;

    struct Options {
        std::optional<int> topK;
        std::optional<double> minScore;
        // Drop notes whose file name carries a date outside the resolved range.
        bool restrictToDateRange = false;
    };

    struct DetailedResult {
        TranslatedQuery translated;
        std::vector<VaultSearchResult> results;
    };

    VaultSearchEngine(VaultStore& store, EmbeddingClient& embedder,
                      const VaultSearchConfig& config = {});

    std::vector<VaultSearchResult> search(const QString& query,
                                          std::optional<int> topK = std::nullopt,
                                          std::optional<double> minScore = std::nullopt,
                                          const std::atomic<bool>* cancel = nullptr);

    DetailedResult searchDetailed(const QString& query, const Options& options,
                                  const std::atomic<bool>* cancel = nullptr);

    // False means "not indexed yet" (or search disabled), not an error.
    bool isAvailable() const;

    VaultStats stats();

    // Defaults to the local current date.
    void setReferenceDateProvider(ReferenceDateProvider provider);

    const VaultSearchConfig& config() const { return m_config; }

private:
    VaultStore& m_store;
    EmbeddingClient& m_embedder;
    VaultSearchConfig m_config;
    DateQueryTranslator m_translator;
    ReferenceDateProvider m_referenceDate;
};

} // namespace ox
