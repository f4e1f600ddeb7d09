#pragma once

#include "core/fs/glob_matcher.h"

#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>
#include <vector>

namespace ox {

struct VaultFile {
    QString absolutePath;
    QString relativePath;   // '/' separated, relative to the vault root
    uint64_t size = 0;
    double modifiedAt = 0.0;
};

// VaultScanner: recursive walk of a vault root.
//
// A file is emitted when its vault-relative path matches the include pattern
// and none of the exclude patterns. Excluded directories are pruned before
// descending; symlinked directories are never followed.
class VaultScanner {
public:
    VaultScanner(const QString& includePattern, const QStringList& excludePatterns);

    // Returns nullopt when the root does not exist or is not a directory.
    // Results are sorted by relative path.
    std::optional<std::vector<VaultFile>> scan(const QString& root) const;

    bool isIncluded(const QString& relativePath) const;
    bool isExcluded(const QString& relativePath) const;

private:
    void scanRecursive(const QString& root, const QString& dirPath,
                       std::vector<VaultFile>& results, int& excludedCount,
                       int depth) const;

    static constexpr int kMaxDepth = 64;

    GlobMatcher m_include;
    GlobMatcher m_exclude;
};

// Vault-relative form of an absolute path, with '/' separators.
QString vaultRelativePath(const QString& root, const QString& absolutePath);

} // namespace ox
