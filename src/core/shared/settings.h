#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace ox {

struct Settings {
    // Vault
    QString vaultPath = QStringLiteral("/var/notes");
    QString vaultName = QStringLiteral("Notes");
    QString includePattern = QStringLiteral("**/*.md");
    QStringList excludePatterns = {
        QStringLiteral("**/templates/**"),
        QStringLiteral("**/.obsidian/**"),
    };

    // Database; empty means <vaultPath>/.obsidex/index.db
    QString dbPath;

    // Chunking (1 token ~= 4 chars)
    int chunkTargetTokens = 500;
    int chunkOverlapTokens = 50;

    // Embedding
    QString embeddingBaseUrl = QStringLiteral("https://api.openai.com/v1");
    QString embeddingModel = QStringLiteral("text-embedding-3-small");
    QString embeddingApiKey;
    int embeddingBatchSize = 100;
    int embeddingTimeoutMs = 30000;
    int embeddingMaxAttempts = 3;
    int embeddingRetryBaseDelayMs = 2000;

    // Search
    bool searchEnabled = true;
    double minScore = 0.3;
    int topK = 5;
    int maxCitations = 5;
};

} // namespace ox
