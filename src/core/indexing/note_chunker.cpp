#include "core/indexing/note_chunker.h"
#include "core/indexing/frontmatter.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QRegularExpression>

#include <algorithm>

namespace ox {

namespace {

const QRegularExpression& headerPattern()
{
    static const QRegularExpression pattern(QStringLiteral(R"(^(#{1,6})\s+(.+)$)"));
    return pattern;
}

} // namespace

// Accumulates chunk bodies and emits finished chunks with the note prefix.
struct NoteChunker::Builder {
    QString prefix;
    int budget = 0;
    int overlap = 0;

    std::vector<NoteChunk> chunks;
    QString body;
    int startLine = 0;
    int endLine = 0;
    QString previousBody;

    void emitChunk(const QString& text, int from, int to)
    {
        const QString trimmed = text.trimmed();
        if (trimmed.isEmpty()) {
            return;
        }
        NoteChunk chunk;
        chunk.chunkIndex = static_cast<int>(chunks.size());
        chunk.text = prefix + trimmed;
        chunk.startLine = from;
        chunk.endLine = std::max(from, to);
        chunks.push_back(std::move(chunk));
        previousBody = text;
    }

    void flush()
    {
        emitChunk(body, startLine, endLine);
        body.clear();
    }

    // Open a new chunk with `sectionText`, seeded with the previous chunk's
    // tail when the combination stays within budget.
    void start(const QString& sectionText, int from, int to)
    {
        body.clear();
        if (!previousBody.isEmpty()) {
            const QString seed = NoteChunker::overlapTail(previousBody, overlap);
            if (!seed.trimmed().isEmpty() && seed.size() + sectionText.size() <= budget) {
                body = seed;
                if (!body.endsWith(QLatin1Char('\n'))) {
                    body += QLatin1Char('\n');
                }
            }
        }
        body += sectionText;
        startLine = from;
        endLine = to;
    }
};

NoteChunker::NoteChunker(const Config& config)
    : m_config(config)
{
    if (m_config.charsPerToken <= 0) {
        m_config.charsPerToken = 4;
    }
    if (m_config.targetTokens <= 0) {
        m_config.targetTokens = 500;
    }
    if (m_config.overlapTokens < 0) {
        m_config.overlapTokens = 0;
    }
    if (m_config.overlapTokens >= m_config.targetTokens) {
        m_config.overlapTokens = m_config.targetTokens / 2;
    }
}

QString NoteChunker::Section::text() const
{
    QString out;
    if (!header.isEmpty()) {
        out += header + QLatin1Char('\n');
    }
    for (const QString& line : lines) {
        out += line + QLatin1Char('\n');
    }
    return out;
}

std::vector<NoteChunk> NoteChunker::chunkNote(const QString& content, const QString& filePath,
                                              const QString& title) const
{
    if (content.trimmed().isEmpty()) {
        return {};
    }

    const QStringList lines = splitNoteLines(content);
    const Frontmatter frontmatter = extractFrontmatter(lines);

    Builder builder;
    builder.prefix = buildNotePrefix(filePath, title, frontmatter.date(), frontmatter.tags());
    // Bodies never exceed targetChars; the prefix eats into the budget but
    // never below half of it.
    const int target = targetChars();
    builder.budget = std::max(target - static_cast<int>(builder.prefix.size()), target / 2);
    builder.overlap = overlapChars();

    const std::vector<Section> sections = parseSections(lines, frontmatter.bodyStartLine);

    for (const Section& section : sections) {
        const QString sectionText = section.text();
        const int sectionLength = static_cast<int>(sectionText.size());

        if (sectionLength > builder.budget) {
            builder.flush();
            splitLargeSection(section, builder);
            continue;
        }

        if (builder.body.isEmpty()) {
            builder.start(sectionText, section.startLine, section.endLine);
            continue;
        }

        if (builder.body.size() + sectionLength <= builder.budget) {
            builder.body += sectionText;
            builder.endLine = section.endLine;
            continue;
        }

        builder.flush();
        builder.start(sectionText, section.startLine, section.endLine);
    }
    builder.flush();

    LOG_DEBUG(oxIndex, "Chunked %s: %d chunks from %d lines",
              qUtf8Printable(filePath),
              static_cast<int>(builder.chunks.size()),
              static_cast<int>(lines.size()));

    return std::move(builder.chunks);
}

void NoteChunker::splitLargeSection(const Section& section, Builder& builder) const
{
    const QString continuedHeader = section.header.isEmpty()
        ? QString()
        : section.header + QStringLiteral(" (continued)\n");

    QString body = section.header.isEmpty() ? QString() : section.header + QLatin1Char('\n');
    int startLine = section.startLine;
    int endLine = section.startLine;
    int linesInBody = 0;

    for (int i = 0; i < section.lines.size(); ++i) {
        const QString& line = section.lines[i];
        const int lineNumber = section.lineNumbers[static_cast<size_t>(i)];

        if (linesInBody > 0 && body.size() + line.size() + 1 > builder.budget) {
            builder.emitChunk(body, startLine, endLine);

            const QString seed = overlapTail(body, builder.overlap);
            body = continuedHeader;
            if (!seed.trimmed().isEmpty()
                && body.size() + seed.size() + line.size() + 1 <= builder.budget) {
                body += seed;
            }
            startLine = lineNumber;
            linesInBody = 0;
        }

        body += line + QLatin1Char('\n');
        endLine = lineNumber;
        ++linesInBody;
    }

    builder.emitChunk(body, startLine, section.endLine);
    builder.body.clear();
}

std::vector<NoteChunker::Section> NoteChunker::parseSections(const QStringList& lines,
                                                             int startLine)
{
    std::vector<Section> sections;
    bool open = false;
    Section current;

    for (int i = startLine; i < lines.size(); ++i) {
        const QString& line = lines[i];

        if (headerPattern().match(line).hasMatch()) {
            if (open) {
                sections.push_back(std::move(current));
            }
            current = Section();
            current.header = line;
            current.startLine = i;
            current.endLine = i;
            open = true;
            continue;
        }

        if (!open) {
            current = Section();
            current.startLine = i;
            open = true;
        }
        current.lines.append(line);
        current.lineNumbers.push_back(i);
        current.endLine = i;
    }

    if (open) {
        sections.push_back(std::move(current));
    }
    return sections;
}

QString NoteChunker::overlapTail(const QString& text, int overlapChars)
{
    if (overlapChars <= 0 || text.trimmed().isEmpty()) {
        return QString();
    }
    if (text.size() <= overlapChars) {
        return text;
    }

    const int windowStart = static_cast<int>(text.size()) - overlapChars;

    // 1. Paragraph boundary inside the window.
    const int paragraph = static_cast<int>(text.lastIndexOf(QStringLiteral("\n\n")));
    if (paragraph >= windowStart) {
        const QString tail = text.mid(paragraph + 2);
        if (!tail.trimmed().isEmpty()) {
            return tail;
        }
    }

    // 2. Sentence boundary inside the window.
    static const QRegularExpression sentenceEnd(QStringLiteral(R"([.!?][ \n])"));
    int sentence = -1;
    QRegularExpressionMatchIterator it = sentenceEnd.globalMatch(text, windowStart);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        if (m.capturedEnd() < text.size()) {
            sentence = static_cast<int>(m.capturedEnd());
        }
    }
    if (sentence >= 0) {
        const QString tail = text.mid(sentence);
        if (!tail.trimmed().isEmpty()) {
            return tail;
        }
    }

    // 3. Raw character boundary.
    return text.right(overlapChars);
}

QString NoteChunker::buildNotePrefix(const QString& filePath, const QString& title,
                                     const QString& date, const QString& tags)
{
    const QString stem = QFileInfo(filePath).completeBaseName();

    QString prefix;
    if (!title.trimmed().isEmpty() && title.compare(stem, Qt::CaseInsensitive) != 0) {
        prefix += QStringLiteral("[Note: %1 (%2)]\n").arg(title.trimmed(), stem);
    } else {
        prefix += QStringLiteral("[Note: %1]\n").arg(stem);
    }

    if (!date.isEmpty()) {
        prefix += QStringLiteral("Date: %1\n").arg(date);
    }
    if (!tags.isEmpty()) {
        prefix += QStringLiteral("Tags: %1\n").arg(tags);
    }

    prefix += QLatin1Char('\n');
    return prefix;
}

} // namespace ox
