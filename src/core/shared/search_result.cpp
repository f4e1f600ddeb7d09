#include "core/shared/search_result.h"

#include <QFileInfo>
#include <QHash>
#include <QRegularExpression>

#include <algorithm>

namespace ox {

std::vector<VaultSearchResult> dedupeByFile(const std::vector<VaultSearchResult>& results,
                                            int topK)
{
    std::vector<VaultSearchResult> best;
    best.reserve(results.size());
    QHash<QString, size_t> slotByPath;

    for (const VaultSearchResult& result : results) {
        auto it = slotByPath.constFind(result.filePath);
        if (it == slotByPath.constEnd()) {
            slotByPath.insert(result.filePath, best.size());
            best.push_back(result);
        } else if (result.score > best[it.value()].score) {
            best[it.value()] = result;
        }
    }

    std::stable_sort(best.begin(), best.end(),
                     [](const VaultSearchResult& a, const VaultSearchResult& b) {
                         return a.score > b.score;
                     });

    if (topK > 0 && best.size() > static_cast<size_t>(topK)) {
        best.resize(static_cast<size_t>(topK));
    }
    return best;
}

std::optional<QDate> noteDateFromPath(const QString& filePath)
{
    static const QRegularExpression datePrefix(QStringLiteral(R"(^(\d{4})-(\d{2})-(\d{2})(?!\d))"));
    const QRegularExpressionMatch m = datePrefix.match(QFileInfo(filePath).completeBaseName());
    if (!m.hasMatch()) {
        return std::nullopt;
    }
    const QDate date(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt());
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

} // namespace ox
