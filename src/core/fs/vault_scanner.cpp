#include "core/fs/vault_scanner.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>

namespace ox {

QString vaultRelativePath(const QString& root, const QString& absolutePath)
{
    QString relative = QDir(root).relativeFilePath(absolutePath);
    relative.replace(QLatin1Char('\\'), QLatin1Char('/'));
    return relative;
}

VaultScanner::VaultScanner(const QString& includePattern, const QStringList& excludePatterns)
{
    m_include.addPattern(includePattern.toStdString());
    for (const QString& pattern : excludePatterns) {
        m_exclude.addPattern(pattern.toStdString());
    }
}

bool VaultScanner::isIncluded(const QString& relativePath) const
{
    return m_include.matches(relativePath.toStdString());
}

bool VaultScanner::isExcluded(const QString& relativePath) const
{
    return m_exclude.matches(relativePath.toStdString());
}

std::optional<std::vector<VaultFile>> VaultScanner::scan(const QString& root) const
{
    const QFileInfo rootInfo(root);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        LOG_WARN(oxFs, "Vault root does not exist: %s", qUtf8Printable(root));
        return std::nullopt;
    }

    const QString absoluteRoot = rootInfo.absoluteFilePath();
    std::vector<VaultFile> results;
    int excludedCount = 0;

    scanRecursive(absoluteRoot, absoluteRoot, results, excludedCount, 0);

    std::sort(results.begin(), results.end(), [](const VaultFile& a, const VaultFile& b) {
        return a.relativePath < b.relativePath;
    });

    LOG_INFO(oxFs, "Vault scan complete: %s: %d files, %d excluded",
             qUtf8Printable(absoluteRoot), static_cast<int>(results.size()), excludedCount);
    return results;
}

void VaultScanner::scanRecursive(const QString& root, const QString& dirPath,
                                 std::vector<VaultFile>& results, int& excludedCount,
                                 int depth) const
{
    if (depth >= kMaxDepth) {
        LOG_WARN(oxFs, "Max scan depth (%d) reached at: %s", kMaxDepth,
                 qUtf8Printable(dirPath));
        return;
    }

    QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
        QDir::Name);

    for (const QFileInfo& fi : entries) {
        const QString relativePath = vaultRelativePath(root, fi.absoluteFilePath());

        if (fi.isDir()) {
            if (fi.isSymLink()) {
                ++excludedCount;
                continue;
            }
            // Trailing '/' lets "dir/**" style patterns prune the directory itself.
            if (isExcluded(relativePath + QLatin1Char('/'))) {
                ++excludedCount;
                continue;
            }
            scanRecursive(root, fi.absoluteFilePath(), results, excludedCount, depth + 1);
            continue;
        }

        if (!isIncluded(relativePath) || isExcluded(relativePath)) {
            ++excludedCount;
            continue;
        }

        VaultFile file;
        file.absolutePath = fi.absoluteFilePath();
        file.relativePath = relativePath;
        file.size = static_cast<uint64_t>(fi.size());
        file.modifiedAt = static_cast<double>(fi.lastModified().toMSecsSinceEpoch()) / 1000.0;
        results.push_back(std::move(file));
    }
}

} // namespace ox
