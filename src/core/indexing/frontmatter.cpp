#include "core/indexing/frontmatter.h"

#include <QFileInfo>
#include <QRegularExpression>

namespace ox {

namespace {

bool isDelimiter(const QString& line)
{
    return line.trimmed() == QLatin1String("---");
}

QString unquote(QString value)
{
    value = value.trimmed();
    if (value.size() >= 2) {
        const QChar first = value.front();
        const QChar last = value.back();
        if ((first == QLatin1Char('"') || first == QLatin1Char('\'')) && first == last) {
            value = value.mid(1, value.size() - 2);
        }
    }
    return value;
}

} // namespace

QString Frontmatter::date() const
{
    static const QRegularExpression isoDate(QStringLiteral(R"((\d{4}-\d{2}-\d{2}))"));
    const QRegularExpressionMatch m = isoDate.match(value(QStringLiteral("date")));
    return m.hasMatch() ? m.captured(1) : QString();
}

QString Frontmatter::tags() const
{
    QString tags = value(QStringLiteral("tags")).trimmed();
    if (tags.startsWith(QLatin1Char('['))) {
        tags.remove(0, 1);
    }
    if (tags.endsWith(QLatin1Char(']'))) {
        tags.chop(1);
    }
    return tags.trimmed();
}

QStringList splitNoteLines(const QString& content)
{
    QStringList lines = content.split(QLatin1Char('\n'));
    for (QString& line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }
    return lines;
}

Frontmatter extractFrontmatter(const QStringList& lines)
{
    Frontmatter fm;
    if (lines.isEmpty() || !isDelimiter(lines.front())) {
        return fm;
    }

    int closing = -1;
    for (int i = 1; i < lines.size(); ++i) {
        if (isDelimiter(lines[i])) {
            closing = i;
            break;
        }
    }
    if (closing < 0) {
        return fm;
    }

    static const QRegularExpression keyValue(QStringLiteral(R"(^([A-Za-z0-9_\-]+)\s*:\s*(.*)$)"));
    static const QRegularExpression listItem(QStringLiteral(R"(^\s+-\s+(.*)$|^-\s+(.*)$)"));

    fm.present = true;
    fm.bodyStartLine = closing + 1;
    fm.raw = lines.mid(1, closing - 1).join(QLatin1Char('\n')).trimmed();

    QString listKey;
    QStringList listValues;
    auto flushList = [&]() {
        if (!listKey.isEmpty() && !listValues.isEmpty()) {
            fm.fields.insert(listKey, listValues.join(QStringLiteral(", ")));
        }
        listKey.clear();
        listValues.clear();
    };

    for (int i = 1; i < closing; ++i) {
        const QString& line = lines[i];
        if (line.trimmed().isEmpty() || line.trimmed().startsWith(QLatin1Char('#'))) {
            continue;
        }

        if (!listKey.isEmpty()) {
            const QRegularExpressionMatch item = listItem.match(line);
            if (item.hasMatch()) {
                const QString captured = item.captured(1).isNull() ? item.captured(2)
                                                                   : item.captured(1);
                listValues.append(unquote(captured));
                continue;
            }
            flushList();
        }

        if (line.front().isSpace()) {
            continue;   // nested mapping; not modelled
        }

        const QRegularExpressionMatch kv = keyValue.match(line);
        if (!kv.hasMatch()) {
            continue;
        }
        const QString key = kv.captured(1).toLower();
        const QString value = kv.captured(2).trimmed();
        if (value.isEmpty()) {
            listKey = key;
            continue;
        }
        fm.fields.insert(key, unquote(value));
    }
    flushList();

    return fm;
}

QString extractNoteTitle(const QString& content, const QString& filePath)
{
    const QStringList lines = splitNoteLines(content);
    const Frontmatter fm = extractFrontmatter(lines);

    const QString fmTitle = fm.value(QStringLiteral("title")).trimmed();
    if (!fmTitle.isEmpty()) {
        return fmTitle;
    }

    static const QRegularExpression h1(QStringLiteral(R"(^#\s+(.+)$)"));
    for (int i = fm.bodyStartLine; i < lines.size(); ++i) {
        const QRegularExpressionMatch m = h1.match(lines[i]);
        if (m.hasMatch()) {
            return m.captured(1).trimmed();
        }
    }

    return QFileInfo(filePath).completeBaseName();
}

} // namespace ox
