#include "core/fs/glob_matcher.h"

#include <cstring>
#include <utility>

namespace ox {

namespace {

std::string normalizePattern(std::string pattern)
{
    while (!pattern.empty() &&
           (pattern.back() == ' ' || pattern.back() == '\t' || pattern.back() == '\r')) {
        pattern.pop_back();
    }
    size_t start = 0;
    while (start < pattern.size() && (pattern[start] == ' ' || pattern[start] == '\t')) {
        ++start;
    }
    pattern.erase(0, start);

    // "./x" and "/x" both mean "x at the vault root".
    if (pattern.rfind("./", 0) == 0) {
        pattern.erase(0, 2);
    } else if (!pattern.empty() && pattern.front() == '/') {
        pattern.erase(0, 1);
    }
    if (!pattern.empty() && pattern.back() == '/') {
        pattern.pop_back();
    }
    return pattern;
}

} // namespace

GlobMatcher::GlobMatcher(std::vector<std::string> patterns)
{
    for (auto& pattern : patterns) {
        addPattern(pattern);
    }
}

void GlobMatcher::addPattern(const std::string& pattern)
{
    std::string normalized = normalizePattern(pattern);
    if (!normalized.empty()) {
        m_patterns.push_back(std::move(normalized));
    }
}

void GlobMatcher::clear()
{
    m_patterns.clear();
}

bool GlobMatcher::matches(const std::string& relativePath) const
{
    for (const auto& pattern : m_patterns) {
        if (matchGlob(pattern, relativePath)) {
            return true;
        }
    }
    return false;
}

bool GlobMatcher::matchGlob(const std::string& pattern, const std::string& path)
{
    if (pattern.find('/') == std::string::npos && pattern.find("**") == std::string::npos) {
        // Component pattern: match against each path component.
        size_t pos = 0;
        while (pos < path.size()) {
            const size_t slash = path.find('/', pos);
            const std::string component = (slash == std::string::npos)
                                              ? path.substr(pos)
                                              : path.substr(pos, slash - pos);
            if (!component.empty() && matchGlobImpl(pattern.c_str(), component.c_str())) {
                return true;
            }
            if (slash == std::string::npos) {
                break;
            }
            pos = slash + 1;
        }
        return false;
    }

    return matchGlobImpl(pattern.c_str(), path.c_str());
}

bool GlobMatcher::matchGlobImpl(const char* pattern, const char* path)
{
    while (*pattern) {
        if (*pattern == '*') {
            if (*(pattern + 1) == '*') {
                pattern += 2;

                // '**' at end of pattern matches everything remaining.
                if (*pattern == '\0') {
                    return true;
                }

                if (*pattern == '/') {
                    ++pattern;
                    // "**/" spans zero or more whole directories: retry the
                    // rest at the current position and after every '/'.
                    if (matchGlobImpl(pattern, path)) {
                        return true;
                    }
                    for (const char* p = path; *p; ++p) {
                        if (*p == '/' && matchGlobImpl(pattern, p + 1)) {
                            return true;
                        }
                    }
                    return false;
                }

                // "**" glued to other characters behaves as an unbounded '*'.
                for (const char* p = path;; ++p) {
                    if (matchGlobImpl(pattern, p)) {
                        return true;
                    }
                    if (*p == '\0') {
                        return false;
                    }
                }
            }

            // Single '*' matches any characters except '/'.
            ++pattern;
            if (*pattern == '\0') {
                return std::strchr(path, '/') == nullptr;
            }
            for (const char* p = path;; ++p) {
                if (matchGlobImpl(pattern, p)) {
                    return true;
                }
                if (*p == '\0' || *p == '/') {
                    return false;
                }
            }
        }

        if (*path == '\0') {
            return false;
        }

        if (*pattern == '?') {
            if (*path == '/') {
                return false;
            }
            ++pattern;
            ++path;
            continue;
        }

        if (*pattern != *path) {
            return false;
        }

        ++pattern;
        ++path;
    }

    return *path == '\0';
}

} // namespace ox
