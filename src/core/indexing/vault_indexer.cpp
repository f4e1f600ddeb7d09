#include "core/indexing/vault_indexer.h"
#include "core/embedding/embedding_client.h"
#include "core/embedding/embedding_error.h"
#include "core/index/vault_store.h"
#include "core/indexing/frontmatter.h"
#include "core/shared/cancellation.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QStringDecoder>

#include <algorithm>

namespace ox {

VaultIndexer::VaultIndexer(VaultStore& store, EmbeddingClient& embedder,
                           const VaultIndexerConfig& config)
    : m_store(store)
    , m_embedder(embedder)
    , m_config(config)
    , m_scanner(config.includePattern, config.excludePatterns)
    , m_chunker(config.chunker)
{
    m_config.embeddingBatchSize = std::max(m_config.embeddingBatchSize, 1);
}

QString VaultIndexer::computeContentHash(const QByteArray& raw)
{
    return QString::fromLatin1(QCryptographicHash::hash(raw, QCryptographicHash::Sha256).toHex());
}

std::optional<QString> VaultIndexer::decodeUtf8(const QByteArray& raw)
{
    QStringDecoder decoder(QStringDecoder::Utf8);
    QString text = decoder.decode(raw);
    if (decoder.hasError()) {
        return std::nullopt;
    }
    return text;
}

bool VaultIndexer::checkPreconditions(VaultIndexingResult& result) const
{
    const QFileInfo root(m_config.vaultPath);
    if (!root.exists() || !root.isDir()) {
        LOG_WARN(oxIndex, "Vault path does not exist: %s", qUtf8Printable(m_config.vaultPath));
        result.errors.append(QStringLiteral("Vault path does not exist: %1").arg(m_config.vaultPath));
        result.aborted = true;
        return false;
    }
    if (!m_embedder.isConfigured()) {
        LOG_WARN(oxIndex, "Embedding client is not configured; skipping indexing");
        result.errors.append(QStringLiteral("Embedding client is not configured (missing API key or model)"));
        result.aborted = true;
        return false;
    }
    return true;
}

// ── Full run ────────────────────────────────────────────────

VaultIndexingResult VaultIndexer::indexVault(const std::atomic<bool>* cancel)
{
    std::lock_guard<std::mutex> runLock(m_runMutex);

    QElapsedTimer timer;
    timer.start();
    VaultIndexingResult result;

    auto finish = [&]() {
        result.durationMs = timer.elapsed();
        LOG_INFO(oxIndex,
                 "Vault indexing %s in %lld ms: %d scanned, %d added, %d updated, %d removed, "
                 "%d chunks, %d errors",
                 result.aborted ? "aborted" : (result.canceled ? "canceled" : "complete"),
                 static_cast<long long>(result.durationMs), result.notesScanned,
                 result.notesAdded, result.notesUpdated, result.notesRemoved,
                 result.chunksCreated, static_cast<int>(result.errors.size()));
        return result;
    };

    if (!checkPreconditions(result)) {
        return finish();
    }

    const std::optional<std::vector<VaultFile>> files = m_scanner.scan(m_config.vaultPath);
    if (!files) {
        result.errors.append(QStringLiteral("Vault path does not exist: %1").arg(m_config.vaultPath));
        result.aborted = true;
        return finish();
    }
    result.notesScanned = static_cast<int>(files->size());

    const std::optional<QHash<QString, VaultStore::StoredHash>> stored = m_store.noteHashes();
    if (!stored) {
        result.errors.append(QStringLiteral("Failed to load stored note hashes"));
        result.aborted = true;
        return finish();
    }

    QSet<QString> toRemove;
    for (auto it = stored->constBegin(); it != stored->constEnd(); ++it) {
        toRemove.insert(it.key());
    }

    std::vector<PendingNote> pending;
    int unchanged = 0;
    for (const VaultFile& file : *files) {
        if (isCanceled(cancel)) {
            result.canceled = true;
            return finish();
        }
        toRemove.remove(file.relativePath);

        QFile handle(file.absolutePath);
        if (!handle.open(QIODevice::ReadOnly)) {
            result.errors.append(QStringLiteral("Error reading %1: %2")
                                     .arg(file.relativePath, handle.errorString()));
            continue;
        }
        const QByteArray raw = handle.readAll();
        handle.close();
        const QString hash = computeContentHash(raw);

        const auto existing = stored->constFind(file.relativePath);
        const bool isNew = existing == stored->constEnd();
        if (!isNew && existing.value().contentHash == hash) {
            ++unchanged;
            continue;
        }

        std::optional<PendingNote> note = prepareNote(file, raw, isNew, result);
        if (note) {
            pending.push_back(std::move(*note));
        }
    }

    LOG_INFO(oxIndex, "Indexing changes: %d to process, %d unchanged, %d to remove",
             static_cast<int>(pending.size()), unchanged, static_cast<int>(toRemove.size()));

    embedAndPersist(pending, result, cancel);
    if (result.canceled) {
        return finish();
    }

    if (!toRemove.isEmpty()) {
        QStringList paths(toRemove.begin(), toRemove.end());
        paths.sort();
        const std::optional<VaultStore::DeleteSummary> summary = m_store.bulkDeleteNotes(paths);
        if (summary) {
            result.notesRemoved += summary->notesRemoved;
            result.chunksRemoved += summary->chunksRemoved;
        } else {
            result.errors.append(QStringLiteral("Failed to remove %1 deleted notes").arg(paths.size()));
        }
    }

    return finish();
}

// ── Single note ─────────────────────────────────────────────

std::optional<VaultFile> VaultIndexer::resolveFile(const QString& path, QString& error) const
{
    const QString absolute = QDir::isAbsolutePath(path)
        ? QDir::cleanPath(path)
        : QDir::cleanPath(QDir(m_config.vaultPath).filePath(path));
    const QString relative = vaultRelativePath(m_config.vaultPath, absolute);
    if (relative.startsWith(QLatin1String("../")) || relative == QLatin1String("..")) {
        error = QStringLiteral("Path is outside the vault: %1").arg(path);
        return std::nullopt;
    }

    const QFileInfo info(absolute);
    VaultFile file;
    file.absolutePath = absolute;
    file.relativePath = relative;
    if (info.exists() && info.isFile()) {
        file.size = static_cast<uint64_t>(info.size());
        file.modifiedAt = static_cast<double>(info.lastModified().toMSecsSinceEpoch()) / 1000.0;
    }
    return file;
}

VaultIndexingResult VaultIndexer::indexNote(const QString& path, const std::atomic<bool>* cancel)
{
    std::lock_guard<std::mutex> runLock(m_runMutex);

    QElapsedTimer timer;
    timer.start();
    VaultIndexingResult result;
    result.notesScanned = 1;

    if (!checkPreconditions(result)) {
        result.durationMs = timer.elapsed();
        return result;
    }

    QString error;
    const std::optional<VaultFile> file = resolveFile(path, error);
    if (!file) {
        result.errors.append(error);
    } else if (!QFileInfo(file->absolutePath).isFile()) {
        result.errors.append(QStringLiteral("File not found: %1").arg(file->absolutePath));
    } else if (!m_scanner.isIncluded(file->relativePath) || m_scanner.isExcluded(file->relativePath)) {
        result.errors.append(QStringLiteral("File is excluded from the vault index: %1")
                                 .arg(file->relativePath));
    } else {
        QFile handle(file->absolutePath);
        std::optional<PendingNote> note;
        if (!handle.open(QIODevice::ReadOnly)) {
            result.errors.append(QStringLiteral("Error reading %1: %2")
                                     .arg(file->relativePath, handle.errorString()));
        } else {
            const bool isNew = !m_store.getNoteByPath(file->relativePath).has_value();
            note = prepareNote(*file, handle.readAll(), isNew, result);
        }
        if (note) {
            std::vector<PendingNote> pending;
            pending.push_back(std::move(*note));
            embedAndPersist(pending, result, cancel);
        }
    }

    result.durationMs = timer.elapsed();
    LOG_DEBUG(oxIndex, "indexNote %s: %d chunks, %d errors", qUtf8Printable(path),
              result.chunksCreated, static_cast<int>(result.errors.size()));
    return result;
}

VaultIndexingResult VaultIndexer::removeNote(const QString& path)
{
    std::lock_guard<std::mutex> runLock(m_runMutex);

    QElapsedTimer timer;
    timer.start();
    VaultIndexingResult result;

    QString error;
    const std::optional<VaultFile> file = resolveFile(path, error);
    if (!file) {
        result.errors.append(error);
    } else {
        const std::optional<VaultStore::DeleteSummary> summary = m_store.deleteNote(file->relativePath);
        if (summary) {
            result.notesRemoved = summary->notesRemoved;
            result.chunksRemoved = summary->chunksRemoved;
            LOG_DEBUG(oxIndex, "Removed note from index: %s", qUtf8Printable(file->relativePath));
        } else {
            result.errors.append(QStringLiteral("Failed to remove %1").arg(file->relativePath));
        }
    }

    result.durationMs = timer.elapsed();
    return result;
}

// ── Pipeline stages ─────────────────────────────────────────

std::optional<VaultIndexer::PendingNote> VaultIndexer::prepareNote(const VaultFile& file,
                                                                  const QByteArray& raw, bool isNew,
                                                                  VaultIndexingResult& result) const
{
    const std::optional<QString> content = decodeUtf8(raw);
    if (!content) {
        LOG_WARN(oxIndex, "Skipping %s: not valid UTF-8", qUtf8Printable(file.relativePath));
        result.errors.append(QStringLiteral("Error processing %1: content is not valid UTF-8")
                                 .arg(file.relativePath));
        return std::nullopt;
    }

    PendingNote note;
    note.relativePath = file.relativePath;
    note.title = extractNoteTitle(*content, file.relativePath);
    note.contentHash = computeContentHash(raw);
    note.modifiedAt = file.modifiedAt;
    note.isNew = isNew;
    note.chunks = m_chunker.chunkNote(*content, file.relativePath, note.title);
    return note;
}

void VaultIndexer::embedAndPersist(std::vector<PendingNote>& notes, VaultIndexingResult& result,
                                   const std::atomic<bool>* cancel)
{
    std::vector<ChunkRef> refs;
    for (size_t n = 0; n < notes.size(); ++n) {
        for (size_t c = 0; c < notes[n].chunks.size(); ++c) {
            refs.push_back(ChunkRef{n, c});
        }
    }

    // Notes without chunks (empty files) are recorded right away so they are
    // not rediscovered as new on every run.
    for (PendingNote& note : notes) {
        if (note.chunks.empty()) {
            if (isCanceled(cancel)) {
                result.canceled = true;
                return;
            }
            persistNote(note, result);
        }
    }

    const size_t batchSize = static_cast<size_t>(m_config.embeddingBatchSize);
    LOG_DEBUG(oxIndex, "Generating embeddings for %d chunks (batch size %d)",
              static_cast<int>(refs.size()), m_config.embeddingBatchSize);

    size_t cursor = 0;
    while (cursor < refs.size()) {
        if (isCanceled(cancel)) {
            result.canceled = true;
            return;
        }

        // Next batch, skipping notes that already failed.
        std::vector<ChunkRef> batch;
        while (cursor < refs.size() && batch.size() < batchSize) {
            const ChunkRef ref = refs[cursor++];
            if (!notes[ref.note].failed) {
                batch.push_back(ref);
            }
        }
        if (batch.empty()) {
            break;
        }

        std::vector<QString> texts;
        texts.reserve(batch.size());
        for (const ChunkRef& ref : batch) {
            texts.push_back(notes[ref.note].chunks[ref.chunk].text);
        }

        std::vector<std::vector<float>> vectors;
        try {
            vectors = m_embedder.getEmbeddings(texts, cancel);
        } catch (const OperationCanceled&) {
            result.canceled = true;
            return;
        } catch (const EmbeddingError& e) {
            LOG_ERROR(oxEmbed, "Embedding batch of %d chunks failed (%s): %s",
                      static_cast<int>(batch.size()), EmbeddingError::kindName(e.kind()), e.what());
            result.errors.append(QStringLiteral("Embedding error: %1").arg(QString::fromUtf8(e.what())));
            for (const ChunkRef& ref : batch) {
                notes[ref.note].failed = true;
            }
            continue;
        }

        if (vectors.size() != batch.size()) {
            result.errors.append(QStringLiteral("Embedding error: expected %1 vectors, got %2")
                                     .arg(batch.size())
                                     .arg(vectors.size()));
            for (const ChunkRef& ref : batch) {
                notes[ref.note].failed = true;
            }
            continue;
        }

        std::vector<size_t> touched;
        for (size_t i = 0; i < batch.size(); ++i) {
            PendingNote& note = notes[batch[i].note];
            note.chunks[batch[i].chunk].embedding = std::move(vectors[i]);
            ++note.embedded;
            if (touched.empty() || touched.back() != batch[i].note) {
                touched.push_back(batch[i].note);
            }
        }

        for (size_t index : touched) {
            PendingNote& note = notes[index];
            if (note.failed || note.persisted || note.embedded < note.chunks.size()) {
                continue;
            }
            if (isCanceled(cancel)) {
                result.canceled = true;
                return;
            }
            persistNote(note, result);
        }
    }
}

void VaultIndexer::persistNote(PendingNote& note, VaultIndexingResult& result)
{
    VaultNote record;
    record.filePath = note.relativePath;
    record.title = note.title;
    record.contentHash = note.contentHash;
    record.fileModifiedAt = note.modifiedAt;

    const std::optional<int64_t> noteId = m_store.upsertNote(record);
    if (!noteId) {
        result.errors.append(QStringLiteral("Failed to store note %1").arg(note.relativePath));
        note.failed = true;
        return;
    }

    const std::optional<int> replaced = m_store.replaceChunksForNote(*noteId, note.chunks);
    if (!replaced) {
        if (note.isNew) {
            // Nothing was stored before; drop the row so the next run sees a new note.
            if (!m_store.deleteNote(note.relativePath)) {
                LOG_ERROR(oxIndex, "Failed to drop note row for %s",
                          qUtf8Printable(note.relativePath));
            }
        } else if (!m_store.invalidateContentHash(*noteId)) {
            // Old chunks are still in place; an empty hash forces a retry next run.
            LOG_ERROR(oxIndex, "Failed to invalidate content hash for %s",
                      qUtf8Printable(note.relativePath));
        }
        result.errors.append(QStringLiteral("Failed to store chunks for %1").arg(note.relativePath));
        note.failed = true;
        return;
    }

    note.persisted = true;
    if (note.isNew) {
        ++result.notesAdded;
    } else {
        ++result.notesUpdated;
    }
    result.chunksCreated += static_cast<int>(note.chunks.size());
    result.chunksRemoved += *replaced;
}

} // namespace ox
