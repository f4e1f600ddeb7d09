#pragma once

namespace ox {

constexpr int kCurrentSchemaVersion = 1;

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas, run once when the file is created.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x4F4258;
PRAGMA user_version = 1;
)";

// Notes are keyed by vault-relative path. Chunks belong to exactly one note
// and are always replaced as a set; their row id doubles as the HNSW label,
// so AUTOINCREMENT keeps labels from being reused after deletes.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS notes (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_path TEXT NOT NULL UNIQUE,
    title TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    file_modified_at REAL NOT NULL DEFAULT 0,
    created_at REAL NOT NULL,
    updated_at REAL NOT NULL
);

CREATE TABLE IF NOT EXISTS chunks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    note_id INTEGER NOT NULL REFERENCES notes(id) ON DELETE CASCADE,
    chunk_index INTEGER NOT NULL,
    chunk_text TEXT NOT NULL,
    chunk_hash TEXT NOT NULL,
    start_line INTEGER NOT NULL,
    end_line INTEGER NOT NULL,
    dimensions INTEGER NOT NULL,
    embedding BLOB NOT NULL,
    UNIQUE(note_id, chunk_index)
);

CREATE INDEX IF NOT EXISTS idx_chunks_note_id ON chunks(note_id);
)";

} // namespace ox
