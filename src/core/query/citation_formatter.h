#pragma once

#include "core/shared/search_result.h"

#include <QString>

#include <vector>

namespace ox {

// Renders search results as a "Sources:" block of obsidian:// links.
// Pure formatting; no file or network access.
class CitationFormatter {
public:
    static constexpr int kDefaultMaxCitations = 5;

    // Empty when there are no results or the vault name is blank.
    static QString formatCitations(const std::vector<VaultSearchResult>& results,
                                   const QString& vaultName,
                                   int maxCitations = kDefaultMaxCitations);

    // obsidian://open?vault=<vault>&file=<path>, both percent-encoded.
    static QString buildObsidianUri(const QString& vaultName, const QString& filePath);

    // Date in the file name, then the stored title, then the file stem.
    static QString displayTitle(const VaultSearchResult& result);
};

} // namespace ox
