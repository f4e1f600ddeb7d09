#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <QStringList>
#include <vector>

namespace ox {

// Defined outside the class so it can carry default member initializers.
struct NoteChunkerConfig {
    int targetTokens = 500;
    int overlapTokens = 50;
    int charsPerToken = 4;   // rough English average
};

// NoteChunker: splits one markdown note into embedding-sized chunks.
//
//   1. A leading YAML frontmatter block is never chunked; its `date` and
//      `tags` go into a short note prefix repeated at the top of every chunk.
//   2. The body is cut into sections at markdown headers (a headerless
//      leading section is allowed).
//   3. Sections are packed greedily while the chunk stays under target.
//   4. A section larger than target is split line by line; continuation
//      pieces repeat the header as "<header> (continued)".
//   5. Every chunk after the first is seeded with an overlap tail of the
//      previous chunk, snapped to a paragraph, sentence or character boundary.
//
// Line numbers are 0-based positions in the raw note (frontmatter included).
class NoteChunker {
public:
    using Config = NoteChunkerConfig;

    explicit NoteChunker(const Config& config = {});

    // Empty or whitespace-only content yields no chunks.
    std::vector<NoteChunk> chunkNote(const QString& content, const QString& filePath,
                                     const QString& title = QString()) const;

    int targetChars() const { return m_config.targetTokens * m_config.charsPerToken; }
    int overlapChars() const { return m_config.overlapTokens * m_config.charsPerToken; }

    // Tail of `text` no longer than overlapChars, starting after the last
    // paragraph break, else the last sentence end, else a raw cut.
    static QString overlapTail(const QString& text, int overlapChars);

    static QString buildNotePrefix(const QString& filePath, const QString& title,
                                   const QString& date, const QString& tags);

private:
    struct Section {
        QString header;          // empty for the leading headerless section
        int startLine = 0;
        int endLine = 0;
        std::vector<int> lineNumbers;
        QStringList lines;

        QString text() const;
    };

    struct Builder;

    static std::vector<Section> parseSections(const QStringList& lines, int startLine);
    void splitLargeSection(const Section& section, Builder& builder) const;

    Config m_config;
};

} // namespace ox
