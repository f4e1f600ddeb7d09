#pragma once

#include <string>
#include <vector>

namespace ox {

// GlobMatcher: include/exclude pattern matching for vault-relative paths.
//
// Supported syntax:
//   *        matches any characters except /
//   **       matches any characters including / (directory traversal);
//            "**/" also matches zero directories
//   ?        matches a single character (not /)
//
// Patterns containing '/' are anchored at the vault root. Patterns without
// '/' match any single path component ("*.md", ".obsidian").
class GlobMatcher {
public:
    GlobMatcher() = default;
    explicit GlobMatcher(std::vector<std::string> patterns);

    void addPattern(const std::string& pattern);
    void clear();

    // True if any pattern matches. Paths use '/' separators and are relative
    // to the vault root.
    bool matches(const std::string& relativePath) const;

    bool empty() const { return m_patterns.empty(); }
    const std::vector<std::string>& patterns() const { return m_patterns; }

    static bool matchGlob(const std::string& pattern, const std::string& path);

private:
    static bool matchGlobImpl(const char* pattern, const char* path);

    std::vector<std::string> m_patterns;
};

} // namespace ox
