#pragma once

#include <QString>
#include <cstdint>
#include <vector>

namespace ox {

// One bounded span of a note. The chunker fills text and line range; the
// indexer attaches the embedding before the chunk is persisted.
struct NoteChunk {
    int chunkIndex = 0;
    QString text;
    int startLine = 0;   // 0-based, inclusive
    int endLine = 0;     // 0-based, inclusive
    std::vector<float> embedding;
};

// Stable digest of a chunk's text, stored alongside the row for diagnostics.
QString computeChunkHash(const QString& text);

} // namespace ox
