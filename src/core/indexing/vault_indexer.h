#pragma once

#include "core/fs/vault_scanner.h"
#include "core/indexing/note_chunker.h"
#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <atomic>
#include <mutex>
#include <optional>
#include <vector>

namespace ox {

class EmbeddingClient;
class VaultStore;

struct VaultIndexerConfig {
    QString vaultPath;
    QString includePattern = QStringLiteral("**/*.md");
    QStringList excludePatterns = {
        QStringLiteral("**/templates/**"),
        QStringLiteral("**/.obsidian/**"),
    };
    int embeddingBatchSize = 100;
    NoteChunkerConfig chunker;
};

// VaultIndexer: keeps the store in sync with the markdown files of a vault.
//
// A run:
//   1. Scans the vault and hashes every matching file.
//   2. Diffs against the stored hashes: new, modified, unchanged, deleted.
//   3. Chunks every new/modified note and embeds all pending chunks across
//      notes in batches of embeddingBatchSize.
//   4. Persists each note once all of its chunks are embedded (upsert, then
//      atomic chunk replacement).
//   5. Removes deleted notes in one bulk delete.
//
// Per-file and per-batch failures are collected in the result's error list.
// Only a missing vault root or an unconfigured embedding client aborts a run.
// One run executes at a time per indexer.
class VaultIndexer {
public:
    VaultIndexer(VaultStore& store, EmbeddingClient& embedder, const VaultIndexerConfig& config);

    VaultIndexingResult indexVault(const std::atomic<bool>* cancel = nullptr);

    // Reindex one note given as an absolute or vault-relative path.
    VaultIndexingResult indexNote(const QString& path, const std::atomic<bool>* cancel = nullptr);

    // Drop one note (absolute or vault-relative path) from the index.
    VaultIndexingResult removeNote(const QString& path);

    const VaultIndexerConfig& config() const { return m_config; }

    // Hex SHA-256 of the raw file bytes.
    static QString computeContentHash(const QByteArray& raw);

    // Strict UTF-8 decode; nullopt on malformed input.
    static std::optional<QString> decodeUtf8(const QByteArray& raw);

private:
    struct PendingNote {
        QString relativePath;
        QString title;
        QString contentHash;
        double modifiedAt = 0.0;
        bool isNew = true;
        std::vector<NoteChunk> chunks;
        size_t embedded = 0;
        bool failed = false;
        bool persisted = false;
    };

    struct ChunkRef {
        size_t note = 0;
        size_t chunk = 0;
    };

    // Decodes and chunks one note; failures are appended to result.errors.
    std::optional<PendingNote> prepareNote(const VaultFile& file, const QByteArray& raw,
                                           bool isNew, VaultIndexingResult& result) const;
    void embedAndPersist(std::vector<PendingNote>& notes, VaultIndexingResult& result,
                         const std::atomic<bool>* cancel);
    void persistNote(PendingNote& note, VaultIndexingResult& result);
    bool checkPreconditions(VaultIndexingResult& result) const;
    std::optional<VaultFile> resolveFile(const QString& path, QString& error) const;

    VaultStore& m_store;
    EmbeddingClient& m_embedder;
    VaultIndexerConfig m_config;
    VaultScanner m_scanner;
    NoteChunker m_chunker;
    std::mutex m_runMutex;
};

} // namespace ox
