#pragma once

#include <QDate>
#include <QString>

#include <optional>
#include <vector>

namespace ox {

struct VaultSearchResult {
    QString filePath;
    QString title;
    QString chunkText;
    double score = 0.0;    // 0..1, higher is closer
    int startLine = 0;
    int chunkIndex = 0;
};

// Keep the best-scoring entry per filePath, order by descending score and
// truncate to topK (topK <= 0 keeps everything).
std::vector<VaultSearchResult> dedupeByFile(const std::vector<VaultSearchResult>& results,
                                            int topK);

// Date encoded at the start of a note's file name ("2026-01-18.md",
// "journal/2026-01-18 standup.md").
std::optional<QDate> noteDateFromPath(const QString& filePath);

} // namespace ox
