#include "core/index/vault_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <algorithm>
#include <cstring>
#include <mutex>

namespace ox {

namespace {

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

std::vector<float> columnEmbedding(sqlite3_stmt* stmt, int column, int dimensions)
{
    const void* blob = sqlite3_column_blob(stmt, column);
    const int bytes = sqlite3_column_bytes(stmt, column);
    if (blob == nullptr || dimensions <= 0
        || bytes != dimensions * static_cast<int>(sizeof(float))) {
        return {};
    }
    std::vector<float> embedding(static_cast<size_t>(dimensions));
    std::memcpy(embedding.data(), blob, static_cast<size_t>(bytes));
    return embedding;
}

// RAII wrapper so early returns never leak a prepared statement.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(oxIndex, "prepare failed: %s", sqlite3_errmsg(db));
            m_stmt = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_stmt != nullptr; }
    sqlite3_stmt* get() const { return m_stmt; }

private:
    sqlite3_stmt* m_stmt = nullptr;
};

} // namespace

VaultStore::~VaultStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<VaultStore> VaultStore::open(const QString& dbPath)
{
    std::unique_ptr<VaultStore> store(new VaultStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool VaultStore::init(const QString& dbPath)
{
    if (dbPath != QLatin1String(":memory:")) {
        const QString dir = QFileInfo(dbPath).absolutePath();
        if (!QDir().mkpath(dir)) {
            LOG_ERROR(oxIndex, "Failed to create database directory: %s", qUtf8Printable(dir));
            return false;
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(oxIndex, "Failed to open database: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(oxIndex, "Failed to set connection pragmas");
        return false;
    }

    int userVersion = 0;
    {
        Statement stmt(m_db, "PRAGMA user_version");
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt.get(), 0);
        }
    }

    if (userVersion == 0) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(oxIndex, "Failed to set database pragmas");
            return false;
        }
    } else if (userVersion > kCurrentSchemaVersion) {
        LOG_ERROR(oxIndex, "Database schema version %d is newer than supported version %d",
                  userVersion, kCurrentSchemaVersion);
        return false;
    }

    if (!execSql(kSchemaV1)) {
        LOG_ERROR(oxIndex, "Failed to create schema");
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        QFile(dbPath).setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    if (!rebuildVectorIndex()) {
        return false;
    }

    LOG_INFO(oxIndex, "Database opened: %s (%d vectors)",
             qUtf8Printable(dbPath), m_index.liveElements());
    return true;
}

bool VaultStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(oxIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool VaultStore::rebuildVectorIndex()
{
    m_index.reset();

    int rowCount = 0;
    {
        Statement count(m_db, "SELECT count(*) FROM chunks");
        if (!count.ok()) {
            return false;
        }
        if (sqlite3_step(count.get()) == SQLITE_ROW) {
            rowCount = sqlite3_column_int(count.get(), 0);
        }
    }
    if (rowCount == 0) {
        return true;
    }

    Statement stmt(m_db, "SELECT id, dimensions, embedding FROM chunks ORDER BY id");
    if (!stmt.ok()) {
        return false;
    }

    int skipped = 0;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const int64_t id = sqlite3_column_int64(stmt.get(), 0);
        const int dimensions = sqlite3_column_int(stmt.get(), 1);
        std::vector<float> embedding = columnEmbedding(stmt.get(), 2, dimensions);

        if (!m_index.isAvailable() && !embedding.empty()) {
            if (!m_index.create(dimensions, std::max(VectorIndex::kInitialCapacity, rowCount * 2))) {
                return false;
            }
        }
        if (embedding.empty() || dimensions != m_index.dimensions()
            || !m_index.addVector(embedding.data(), static_cast<uint64_t>(id))) {
            ++skipped;
        }
    }

    if (skipped > 0) {
        LOG_WARN(oxIndex, "Skipped %d stored chunk embeddings with mismatched dimensions", skipped);
    }
    return true;
}

// ── Notes ───────────────────────────────────────────────────

std::optional<int64_t> VaultStore::upsertNote(const VaultNote& note)
{
    const char* sql = R"(
        INSERT INTO notes (file_path, title, content_hash, file_modified_at, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?5)
        ON CONFLICT(file_path) DO UPDATE SET
            title = excluded.title,
            content_hash = excluded.content_hash,
            file_modified_at = excluded.file_modified_at,
            updated_at = excluded.updated_at
    )";

    std::unique_lock<std::shared_mutex> lock(m_lock);

    {
        Statement stmt(m_db, sql);
        if (!stmt.ok()) {
            return std::nullopt;
        }

        const double now = static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
        const QByteArray pathUtf8 = note.filePath.toUtf8();
        const QByteArray titleUtf8 = note.title.toUtf8();
        const QByteArray hashUtf8 = note.contentHash.toUtf8();

        sqlite3_bind_text(stmt.get(), 1, pathUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 2, titleUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 3, hashUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt.get(), 4, note.fileModifiedAt);
        sqlite3_bind_double(stmt.get(), 5, now);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            LOG_ERROR(oxIndex, "upsertNote failed for %s: %s",
                      pathUtf8.constData(), sqlite3_errmsg(m_db));
            return std::nullopt;
        }
    }

    // last_insert_rowid is stale when the conflict branch fires.
    Statement select(m_db, "SELECT id FROM notes WHERE file_path = ?1");
    if (!select.ok()) {
        return std::nullopt;
    }
    const QByteArray pathUtf8 = note.filePath.toUtf8();
    sqlite3_bind_text(select.get(), 1, pathUtf8.constData(), -1, SQLITE_STATIC);
    if (sqlite3_step(select.get()) != SQLITE_ROW) {
        LOG_ERROR(oxIndex, "upsertNote: row not found after upsert for %s", pathUtf8.constData());
        return std::nullopt;
    }
    return sqlite3_column_int64(select.get(), 0);
}

std::optional<VaultNote> VaultStore::getNoteByPath(const QString& filePath)
{
    const char* sql = R"(
        SELECT id, file_path, title, content_hash, file_modified_at, created_at, updated_at
        FROM notes WHERE file_path = ?1
    )";

    std::shared_lock<std::shared_mutex> lock(m_lock);
    Statement stmt(m_db, sql);
    if (!stmt.ok()) {
        return std::nullopt;
    }
    const QByteArray pathUtf8 = filePath.toUtf8();
    sqlite3_bind_text(stmt.get(), 1, pathUtf8.constData(), -1, SQLITE_STATIC);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    VaultNote note;
    note.id = sqlite3_column_int64(stmt.get(), 0);
    note.filePath = columnText(stmt.get(), 1);
    note.title = columnText(stmt.get(), 2);
    note.contentHash = columnText(stmt.get(), 3);
    note.fileModifiedAt = sqlite3_column_double(stmt.get(), 4);
    note.createdAt = sqlite3_column_double(stmt.get(), 5);
    note.updatedAt = sqlite3_column_double(stmt.get(), 6);
    return note;
}

std::optional<QHash<QString, VaultStore::StoredHash>> VaultStore::noteHashes()
{
    std::shared_lock<std::shared_mutex> lock(m_lock);
    Statement stmt(m_db, "SELECT id, file_path, content_hash FROM notes");
    if (!stmt.ok()) {
        return std::nullopt;
    }

    QHash<QString, StoredHash> hashes;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        StoredHash entry;
        entry.noteId = sqlite3_column_int64(stmt.get(), 0);
        entry.contentHash = columnText(stmt.get(), 2);
        hashes.insert(columnText(stmt.get(), 1), entry);
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(oxIndex, "noteHashes failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return hashes;
}

bool VaultStore::invalidateContentHash(int64_t noteId)
{
    std::unique_lock<std::shared_mutex> lock(m_lock);
    Statement stmt(m_db, "UPDATE notes SET content_hash = '' WHERE id = ?1");
    if (!stmt.ok()) {
        return false;
    }
    sqlite3_bind_int64(stmt.get(), 1, noteId);
    return sqlite3_step(stmt.get()) == SQLITE_DONE;
}

// ── Chunks ──────────────────────────────────────────────────

std::vector<int64_t> VaultStore::chunkIdsForNote(int64_t noteId)
{
    std::vector<int64_t> ids;
    Statement stmt(m_db, "SELECT id FROM chunks WHERE note_id = ?1");
    if (!stmt.ok()) {
        return ids;
    }
    sqlite3_bind_int64(stmt.get(), 1, noteId);
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
    return ids;
}

std::optional<int64_t> VaultStore::insertChunk(int64_t noteId, const NoteChunk& chunk,
                                               const std::vector<float>& normalized)
{
    const char* sql = R"(
        INSERT INTO chunks (note_id, chunk_index, chunk_text, chunk_hash,
                            start_line, end_line, dimensions, embedding)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
    )";
    Statement stmt(m_db, sql);
    if (!stmt.ok()) {
        return std::nullopt;
    }

    const QByteArray textUtf8 = chunk.text.toUtf8();
    const QByteArray hashUtf8 = computeChunkHash(chunk.text).toUtf8();

    sqlite3_bind_int64(stmt.get(), 1, noteId);
    sqlite3_bind_int(stmt.get(), 2, chunk.chunkIndex);
    sqlite3_bind_text(stmt.get(), 3, textUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 4, hashUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt.get(), 5, chunk.startLine);
    sqlite3_bind_int(stmt.get(), 6, chunk.endLine);
    sqlite3_bind_int(stmt.get(), 7, static_cast<int>(normalized.size()));
    sqlite3_bind_blob(stmt.get(), 8, normalized.data(),
                      static_cast<int>(normalized.size() * sizeof(float)), SQLITE_STATIC);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        LOG_ERROR(oxIndex, "insertChunk failed for note %lld chunk %d: %s",
                  static_cast<long long>(noteId), chunk.chunkIndex, sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<int> VaultStore::replaceChunksForNote(int64_t noteId, const std::vector<NoteChunk>& chunks)
{
    std::unique_lock<std::shared_mutex> lock(m_lock);

    // Validate and normalize before touching anything.
    int dimensions = m_index.liveElements() > 0 ? m_index.dimensions() : 0;
    std::vector<std::vector<float>> normalized;
    normalized.reserve(chunks.size());
    for (const NoteChunk& chunk : chunks) {
        if (chunk.embedding.empty()) {
            LOG_ERROR(oxIndex, "replaceChunksForNote: chunk %d of note %lld has no embedding",
                      chunk.chunkIndex, static_cast<long long>(noteId));
            return std::nullopt;
        }
        if (dimensions == 0) {
            dimensions = static_cast<int>(chunk.embedding.size());
        }
        if (static_cast<int>(chunk.embedding.size()) != dimensions) {
            LOG_ERROR(oxIndex, "replaceChunksForNote: dimension mismatch (%d vs %d) for note %lld",
                      static_cast<int>(chunk.embedding.size()), dimensions,
                      static_cast<long long>(noteId));
            return std::nullopt;
        }
        std::vector<float> vec = chunk.embedding;
        if (!VectorIndex::normalize(vec)) {
            LOG_ERROR(oxIndex, "replaceChunksForNote: zero embedding for chunk %d of note %lld",
                      chunk.chunkIndex, static_cast<long long>(noteId));
            return std::nullopt;
        }
        normalized.push_back(std::move(vec));
    }

    // An empty index (or one emptied by deletes) adopts the incoming dimension.
    if (!chunks.empty()
        && (!m_index.isAvailable()
            || (m_index.liveElements() == 0 && m_index.dimensions() != dimensions))) {
        if (!m_index.create(dimensions)) {
            return std::nullopt;
        }
    }

    const std::vector<int64_t> oldIds = chunkIdsForNote(noteId);

    if (!execSql("SAVEPOINT replace_chunks")) {
        return std::nullopt;
    }

    std::vector<uint64_t> added;
    std::vector<uint64_t> removed;
    auto revert = [&]() {
        execSql("ROLLBACK TO replace_chunks");
        execSql("RELEASE replace_chunks");
        for (uint64_t label : added) {
            m_index.deleteVector(label);
        }
        for (uint64_t label : removed) {
            m_index.restoreVector(label);
        }
        return std::optional<int>();
    };

    {
        Statement del(m_db, "DELETE FROM chunks WHERE note_id = ?1");
        if (!del.ok()) {
            return revert();
        }
        sqlite3_bind_int64(del.get(), 1, noteId);
        if (sqlite3_step(del.get()) != SQLITE_DONE) {
            LOG_ERROR(oxIndex, "replaceChunksForNote: delete failed: %s", sqlite3_errmsg(m_db));
            return revert();
        }
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        const std::optional<int64_t> rowId = insertChunk(noteId, chunks[i], normalized[i]);
        if (!rowId) {
            return revert();
        }
        const uint64_t label = static_cast<uint64_t>(*rowId);
        if (!m_index.addVector(normalized[i].data(), label)) {
            return revert();
        }
        added.push_back(label);
    }

    for (int64_t oldId : oldIds) {
        // Rows skipped at load time were never in the index.
        if (m_index.deleteVector(static_cast<uint64_t>(oldId))) {
            removed.push_back(static_cast<uint64_t>(oldId));
        }
    }

    if (!execSql("RELEASE replace_chunks")) {
        return revert();
    }

    LOG_DEBUG(oxIndex, "Replaced %d chunks with %d for note %lld",
              static_cast<int>(oldIds.size()), static_cast<int>(chunks.size()),
              static_cast<long long>(noteId));
    return static_cast<int>(oldIds.size());
}

std::vector<NoteChunk> VaultStore::chunksForNote(int64_t noteId)
{
    const char* sql = R"(
        SELECT chunk_index, chunk_text, start_line, end_line, dimensions, embedding
        FROM chunks WHERE note_id = ?1 ORDER BY chunk_index
    )";

    std::shared_lock<std::shared_mutex> lock(m_lock);
    std::vector<NoteChunk> chunks;
    Statement stmt(m_db, sql);
    if (!stmt.ok()) {
        return chunks;
    }
    sqlite3_bind_int64(stmt.get(), 1, noteId);
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        NoteChunk chunk;
        chunk.chunkIndex = sqlite3_column_int(stmt.get(), 0);
        chunk.text = columnText(stmt.get(), 1);
        chunk.startLine = sqlite3_column_int(stmt.get(), 2);
        chunk.endLine = sqlite3_column_int(stmt.get(), 3);
        chunk.embedding = columnEmbedding(stmt.get(), 5, sqlite3_column_int(stmt.get(), 4));
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

// ── Deletes ─────────────────────────────────────────────────

std::optional<VaultStore::DeleteSummary> VaultStore::bulkDeleteNotes(const QStringList& filePaths)
{
    DeleteSummary summary;
    if (filePaths.isEmpty()) {
        return summary;
    }

    std::unique_lock<std::shared_mutex> lock(m_lock);

    if (!execSql("SAVEPOINT delete_notes")) {
        return std::nullopt;
    }
    auto rollback = [this]() {
        execSql("ROLLBACK TO delete_notes");
        execSql("RELEASE delete_notes");
        return std::nullopt;
    };

    Statement find(m_db, "SELECT id FROM notes WHERE file_path = ?1");
    Statement del(m_db, "DELETE FROM notes WHERE id = ?1");
    if (!find.ok() || !del.ok()) {
        return rollback();
    }

    std::vector<int64_t> chunkIds;
    for (const QString& path : filePaths) {
        const QByteArray pathUtf8 = path.toUtf8();
        sqlite3_reset(find.get());
        sqlite3_bind_text(find.get(), 1, pathUtf8.constData(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(find.get()) != SQLITE_ROW) {
            continue;
        }
        const int64_t noteId = sqlite3_column_int64(find.get(), 0);
        sqlite3_reset(find.get());

        const std::vector<int64_t> ids = chunkIdsForNote(noteId);
        chunkIds.insert(chunkIds.end(), ids.begin(), ids.end());

        // Chunks cascade.
        sqlite3_reset(del.get());
        sqlite3_bind_int64(del.get(), 1, noteId);
        if (sqlite3_step(del.get()) != SQLITE_DONE) {
            LOG_ERROR(oxIndex, "bulkDeleteNotes: delete failed for %s: %s",
                      pathUtf8.constData(), sqlite3_errmsg(m_db));
            return rollback();
        }
        ++summary.notesRemoved;
    }

    if (!execSql("RELEASE delete_notes")) {
        return rollback();
    }

    for (int64_t id : chunkIds) {
        m_index.deleteVector(static_cast<uint64_t>(id));
    }
    summary.chunksRemoved = static_cast<int>(chunkIds.size());

    LOG_DEBUG(oxIndex, "Deleted %d notes (%d chunks)", summary.notesRemoved, summary.chunksRemoved);
    return summary;
}

std::optional<VaultStore::DeleteSummary> VaultStore::deleteNote(const QString& filePath)
{
    return bulkDeleteNotes(QStringList{filePath});
}

// ── Search ──────────────────────────────────────────────────

std::vector<VaultSearchResult> VaultStore::nearestNeighbors(const std::vector<float>& queryEmbedding,
                                                            int k, double minScore)
{
    std::vector<VaultSearchResult> results;
    if (k <= 0 || queryEmbedding.empty()) {
        return results;
    }

    std::shared_lock<std::shared_mutex> lock(m_lock);

    if (!m_index.isAvailable()) {
        return results;
    }
    if (static_cast<int>(queryEmbedding.size()) != m_index.dimensions()) {
        LOG_WARN(oxIndex, "Query dimension %d does not match index dimension %d",
                 static_cast<int>(queryEmbedding.size()), m_index.dimensions());
        return results;
    }

    std::vector<float> query = queryEmbedding;
    if (!VectorIndex::normalize(query)) {
        return results;
    }

    const std::vector<VectorIndex::KnnResult> hits = m_index.search(query.data(), k);
    if (hits.empty()) {
        return results;
    }

    const char* sql = R"(
        SELECT n.file_path, n.title, c.chunk_text, c.start_line, c.chunk_index
        FROM chunks c JOIN notes n ON n.id = c.note_id
        WHERE c.id = ?1
    )";
    Statement stmt(m_db, sql);
    if (!stmt.ok()) {
        return results;
    }

    for (const VectorIndex::KnnResult& hit : hits) {
        const double score = VectorIndex::scoreFromDistance(hit.distance);
        if (score < minScore) {
            continue;
        }
        sqlite3_reset(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(hit.label));
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            continue;
        }
        VaultSearchResult result;
        result.filePath = columnText(stmt.get(), 0);
        result.title = columnText(stmt.get(), 1);
        result.chunkText = columnText(stmt.get(), 2);
        result.startLine = sqlite3_column_int(stmt.get(), 3);
        result.chunkIndex = sqlite3_column_int(stmt.get(), 4);
        result.score = score;
        results.push_back(std::move(result));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const VaultSearchResult& a, const VaultSearchResult& b) {
                         return a.score > b.score;
                     });
    return results;
}

bool VaultStore::isVectorSearchAvailable() const
{
    std::shared_lock<std::shared_mutex> lock(m_lock);
    return m_index.isAvailable() && m_index.liveElements() > 0;
}

VaultStats VaultStore::stats()
{
    std::shared_lock<std::shared_mutex> lock(m_lock);

    VaultStats stats;
    {
        Statement stmt(m_db, "SELECT count(*) FROM notes");
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            stats.indexedNotes = sqlite3_column_int(stmt.get(), 0);
        }
    }
    {
        Statement stmt(m_db, "SELECT count(*) FROM chunks");
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            stats.indexedChunks = sqlite3_column_int(stmt.get(), 0);
        }
    }
    stats.vectorSearchAvailable = m_index.isAvailable() && m_index.liveElements() > 0;
    return stats;
}

} // namespace ox
