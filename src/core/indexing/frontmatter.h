#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

namespace ox {

// Leading YAML block of a note, kept as a flat string map. Only top-level
// "key: value" pairs are recorded; block lists ("key:" followed by "- item"
// lines) are joined with ", ". Keys are lower-cased.
struct Frontmatter {
    bool present = false;
    QString raw;
    QMap<QString, QString> fields;
    int bodyStartLine = 0;   // first line after the closing delimiter

    QString value(const QString& key) const { return fields.value(key.toLower()); }

    // "YYYY-MM-DD" taken from the `date` field, or empty.
    QString date() const;
    // `tags` with list brackets removed, or empty.
    QString tags() const;
};

// The block must start on the first line with "---" and end on a later
// "---" line; without the closing delimiter nothing is extracted.
Frontmatter extractFrontmatter(const QStringList& lines);

// Split raw note text into lines, dropping the '\r' of CRLF endings.
QStringList splitNoteLines(const QString& content);

// Title for a note: frontmatter `title`, then the first H1 of the body,
// then the file name without extension.
QString extractNoteTitle(const QString& content, const QString& filePath);

} // namespace ox
