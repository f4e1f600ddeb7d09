#pragma once

#include "core/shared/chunk.h"
#include "core/shared/search_result.h"
#include "core/shared/types.h"
#include "core/vector/vector_index.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <sqlite3.h>

namespace ox {

// VaultStore: owner of the notes/chunks database and the in-memory HNSW
// index built from the stored embeddings.
//
// Writers (chunk replacement, deletes) hold an exclusive lock across the
// SQLite transaction and the matching HNSW update; searches hold a shared
// lock. A reader therefore never observes a note with half of its chunks
// replaced.
class VaultStore {
public:
    ~VaultStore();

    VaultStore(const VaultStore&) = delete;
    VaultStore& operator=(const VaultStore&) = delete;

    // Open or create the database, creating parent directories as needed,
    // and rebuild the vector index from stored embeddings.
    static std::unique_ptr<VaultStore> open(const QString& dbPath);

    // ── Notes ───────────────────────────────────────────────

    // Insert or update by filePath. Returns the note id.
    std::optional<int64_t> upsertNote(const VaultNote& note);

    std::optional<VaultNote> getNoteByPath(const QString& filePath);

    struct StoredHash {
        int64_t noteId = 0;
        QString contentHash;
    };

    // All stored content hashes keyed by vault-relative path.
    std::optional<QHash<QString, StoredHash>> noteHashes();

    // Clears the stored hash so the next scan treats the note as modified.
    bool invalidateContentHash(int64_t noteId);

    // ── Chunks (atomic) ─────────────────────────────────────

    // Delete every chunk of the note and insert `chunks`, all or nothing.
    // Every chunk must carry an embedding of the index dimension. Returns the
    // number of chunks replaced, or nullopt when nothing changed.
    std::optional<int> replaceChunksForNote(int64_t noteId, const std::vector<NoteChunk>& chunks);

    std::vector<NoteChunk> chunksForNote(int64_t noteId);

    // ── Deletes ─────────────────────────────────────────────

    struct DeleteSummary {
        int notesRemoved = 0;
        int chunksRemoved = 0;
    };

    // Remove the given notes and their chunks in one transaction. Paths that
    // are not stored are ignored.
    std::optional<DeleteSummary> bulkDeleteNotes(const QStringList& filePaths);
    std::optional<DeleteSummary> deleteNote(const QString& filePath);

    // ── Search ──────────────────────────────────────────────

    // Up to k chunks closest to `queryEmbedding` with score >= minScore,
    // best first. The query does not need to be normalized.
    std::vector<VaultSearchResult> nearestNeighbors(const std::vector<float>& queryEmbedding,
                                                    int k, double minScore);

    // True once at least one embedded chunk is searchable.
    bool isVectorSearchAvailable() const;

    VaultStats stats();

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

private:
    VaultStore() = default;

    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    bool rebuildVectorIndex();
    std::vector<int64_t> chunkIdsForNote(int64_t noteId);
    std::optional<int64_t> insertChunk(int64_t noteId, const NoteChunk& chunk,
                                       const std::vector<float>& normalized);

    sqlite3* m_db = nullptr;
    VectorIndex m_index;
    mutable std::shared_mutex m_lock;
};

} // namespace ox
