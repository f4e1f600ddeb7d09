#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace ox {

// A markdown file tracked by the index (relative path is the unique key).
struct VaultNote {
    int64_t id = 0;
    QString filePath;
    QString title;
    QString contentHash;
    double fileModifiedAt = 0.0;   // seconds since epoch, UTC
    double createdAt = 0.0;
    double updatedAt = 0.0;
};

// Summary of one indexing run. Per-file failures land in `errors`; the run
// itself never throws for them.
struct VaultIndexingResult {
    int notesScanned = 0;
    int notesAdded = 0;
    int notesUpdated = 0;
    int notesRemoved = 0;
    int chunksCreated = 0;
    int chunksRemoved = 0;
    int64_t durationMs = 0;
    QStringList errors;
    bool aborted = false;    // whole-run precondition failed
    bool canceled = false;
};

struct VaultStats {
    int indexedNotes = 0;
    int indexedChunks = 0;
    bool vectorSearchAvailable = false;
};

} // namespace ox
