#include "core/query/citation_formatter.h"

#include <QFileInfo>
#include <QUrl>

#include <algorithm>

namespace ox {

QString CitationFormatter::formatCitations(const std::vector<VaultSearchResult>& results,
                                           const QString& vaultName, int maxCitations)
{
    if (results.empty() || vaultName.trimmed().isEmpty()) {
        return QString();
    }

    const int limit = std::max(maxCitations, 0);
    const int total = static_cast<int>(results.size());
    const int shown = std::min(total, limit);

    QString out;
    out += QStringLiteral("\n---\nSources:\n");
    for (int i = 0; i < shown; ++i) {
        const VaultSearchResult& result = results[static_cast<size_t>(i)];
        out += QStringLiteral("- [[%1]](%2)\n")
                   .arg(displayTitle(result), buildObsidianUri(vaultName, result.filePath));
    }
    if (total > shown) {
        out += QStringLiteral("- ...and %1 more\n").arg(total - shown);
    }
    return out;
}

QString CitationFormatter::buildObsidianUri(const QString& vaultName, const QString& filePath)
{
    return QStringLiteral("obsidian://open?vault=%1&file=%2")
        .arg(QString::fromLatin1(QUrl::toPercentEncoding(vaultName)),
             QString::fromLatin1(QUrl::toPercentEncoding(filePath)));
}

QString CitationFormatter::displayTitle(const VaultSearchResult& result)
{
    if (const std::optional<QDate> date = noteDateFromPath(result.filePath)) {
        return date->toString(QStringLiteral("yyyy-MM-dd"));
    }
    if (!result.title.trimmed().isEmpty()) {
        return result.title.trimmed();
    }
    return QFileInfo(result.filePath).completeBaseName();
}

} // namespace ox
