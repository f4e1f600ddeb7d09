#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>

#include "core/embedding/embedding_client.h"
#include "core/index/vault_store.h"
#include "core/indexing/vault_indexer.h"
#include "core/query/citation_formatter.h"
#include "core/query/vault_search_engine.h"
#include "fake_embedding_transport.h"

#include <atomic>
#include <memory>

using ox::test::FakeEmbeddingTransport;

class TestVaultIndexingPipeline : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Full runs ────────────────────────────────────────────────
    void testIndexesNewNotes();
    void testSecondRunIsIdempotent();
    void testModifiedNoteIsUpdated();
    void testDeletedNoteIsRemoved();
    void testExcludedFoldersAreIgnored();
    void testEmptyNoteIsRecordedOnce();

    // ── Failure containment ──────────────────────────────────────
    void testInvalidUtf8IsContained();
    void testEmbeddingBatchFailureIsContained();
    void testStorageFailureForcesRetry();
    void testStorageFailureOnNewNoteLeavesNoRow();
    void testMissingVaultRootAborts();
    void testUnconfiguredClientAborts();

    // ── Cancellation ─────────────────────────────────────────────
    void testCancelBeforeRun();
    void testCancelBetweenBatches();

    // ── Single note ──────────────────────────────────────────────
    void testIndexNoteAlwaysReprocesses();
    void testIndexNoteRejectsBadPaths();
    void testRemoveNote();

    // ── Search ───────────────────────────────────────────────────
    void testSearchFindsIndexedNote();
    void testJournalSearchRanksDogNoteFirst();

private:
    void writeNote(const QString& relativePath, const QByteArray& content);
    std::unique_ptr<ox::VaultIndexer> makeIndexer(int batchSize = 100);

    std::unique_ptr<QTemporaryDir> m_vault;
    std::unique_ptr<QTemporaryDir> m_dataDir;
    std::unique_ptr<ox::VaultStore> m_store;
    std::shared_ptr<FakeEmbeddingTransport> m_transport;
    std::unique_ptr<ox::EmbeddingClient> m_client;
};

void TestVaultIndexingPipeline::init()
{
    m_vault = std::make_unique<QTemporaryDir>();
    m_dataDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_vault->isValid());
    QVERIFY(m_dataDir->isValid());

    m_store = ox::VaultStore::open(m_dataDir->filePath(QStringLiteral("index.db")));
    QVERIFY(m_store != nullptr);

    m_transport = std::make_shared<FakeEmbeddingTransport>();
    ox::EmbeddingClientConfig config;
    config.apiKey = QStringLiteral("sk-test");
    config.retryBaseDelayMs = 1;
    m_client = std::make_unique<ox::EmbeddingClient>(config, m_transport);
}

void TestVaultIndexingPipeline::cleanup()
{
    m_client.reset();
    m_transport.reset();
    m_store.reset();
    m_dataDir.reset();
    m_vault.reset();
}

void TestVaultIndexingPipeline::writeNote(const QString& relativePath, const QByteArray& content)
{
    const QString path = m_vault->filePath(relativePath);
    QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QCOMPARE(f.write(content), static_cast<qint64>(content.size()));
}

std::unique_ptr<ox::VaultIndexer> TestVaultIndexingPipeline::makeIndexer(int batchSize)
{
    ox::VaultIndexerConfig config;
    config.vaultPath = m_vault->path();
    config.embeddingBatchSize = batchSize;
    return std::make_unique<ox::VaultIndexer>(*m_store, *m_client, config);
}

// ── Full runs ────────────────────────────────────────────────────

void TestVaultIndexingPipeline::testIndexesNewNotes()
{
    writeNote(QStringLiteral("Daily/2026-01-18.md"), "Took the dog for a long walk.\n");
    writeNote(QStringLiteral("reading.md"), "# Reading log\n\nFinished the novel.\n");
    writeNote(QStringLiteral("work.md"), "Project deadline moved to Friday.\n");

    auto indexer = makeIndexer();
    const ox::VaultIndexingResult result = indexer->indexVault();

    QVERIFY2(result.errors.isEmpty(), qPrintable(result.errors.join(QLatin1Char('\n'))));
    QVERIFY(!result.aborted);
    QVERIFY(!result.canceled);
    QCOMPARE(result.notesScanned, 3);
    QCOMPARE(result.notesAdded, 3);
    QCOMPARE(result.notesUpdated, 0);
    QCOMPARE(result.chunksCreated, 3);
    QCOMPARE(m_transport->callCount(), 1);

    const ox::VaultStats stats = m_store->stats();
    QCOMPARE(stats.indexedNotes, 3);
    QCOMPARE(stats.indexedChunks, 3);
    QVERIFY(stats.vectorSearchAvailable);

    const auto note = m_store->getNoteByPath(QStringLiteral("reading.md"));
    QVERIFY(note.has_value());
    QCOMPARE(note->title, QStringLiteral("Reading log"));
    QCOMPARE(note->contentHash,
             ox::VaultIndexer::computeContentHash("# Reading log\n\nFinished the novel.\n"));
}

void TestVaultIndexingPipeline::testSecondRunIsIdempotent()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("b.md"), "Cooked dinner.\n");

    auto indexer = makeIndexer();
    QCOMPARE(indexer->indexVault().notesAdded, 2);
    const int callsAfterFirstRun = m_transport->callCount();

    const ox::VaultIndexingResult second = indexer->indexVault();
    QVERIFY(second.errors.isEmpty());
    QCOMPARE(second.notesScanned, 2);
    QCOMPARE(second.notesAdded, 0);
    QCOMPARE(second.notesUpdated, 0);
    QCOMPARE(second.notesRemoved, 0);
    QCOMPARE(second.chunksCreated, 0);
    QCOMPARE(m_transport->callCount(), callsAfterFirstRun);
}

void TestVaultIndexingPipeline::testModifiedNoteIsUpdated()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("b.md"), "Cooked dinner.\n");

    auto indexer = makeIndexer();
    QCOMPARE(indexer->indexVault().notesAdded, 2);

    writeNote(QStringLiteral("b.md"), "Cooked dinner and read a book.\n");
    const ox::VaultIndexingResult result = indexer->indexVault();

    QVERIFY(result.errors.isEmpty());
    QCOMPARE(result.notesAdded, 0);
    QCOMPARE(result.notesUpdated, 1);
    QCOMPARE(result.chunksRemoved, 1);
    QCOMPARE(result.chunksCreated, 1);

    // Only the modified note was sent for embedding.
    const QStringList inputs = m_transport->inputsOfRequest(m_transport->callCount() - 1);
    QCOMPARE(static_cast<int>(inputs.size()), 1);
    QVERIFY(inputs.first().contains(QStringLiteral("read a book")));

    const auto note = m_store->getNoteByPath(QStringLiteral("b.md"));
    QVERIFY(note.has_value());
    const std::vector<ox::NoteChunk> chunks = m_store->chunksForNote(note->id);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QVERIFY(chunks.front().text.contains(QStringLiteral("read a book")));
}

void TestVaultIndexingPipeline::testDeletedNoteIsRemoved()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("sub/b.md"), "Cooked dinner.\n");

    auto indexer = makeIndexer();
    QCOMPARE(indexer->indexVault().notesAdded, 2);

    QVERIFY(QFile::remove(m_vault->filePath(QStringLiteral("sub/b.md"))));
    const ox::VaultIndexingResult result = indexer->indexVault();

    QVERIFY(result.errors.isEmpty());
    QCOMPARE(result.notesRemoved, 1);
    QCOMPARE(result.chunksRemoved, 1);
    QVERIFY(!m_store->getNoteByPath(QStringLiteral("sub/b.md")).has_value());
    QCOMPARE(m_store->stats().indexedNotes, 1);
    QCOMPARE(m_store->stats().indexedChunks, 1);
}

void TestVaultIndexingPipeline::testExcludedFoldersAreIgnored()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("templates/daily.md"), "# {{date}}\n");
    writeNote(QStringLiteral(".obsidian/snippets/readme.md"), "Config notes.\n");
    writeNote(QStringLiteral("notes.txt"), "Not markdown.\n");

    auto indexer = makeIndexer();
    const ox::VaultIndexingResult result = indexer->indexVault();

    QVERIFY(result.errors.isEmpty());
    QCOMPARE(result.notesScanned, 1);
    QCOMPARE(result.notesAdded, 1);
    QVERIFY(!m_store->getNoteByPath(QStringLiteral("templates/daily.md")).has_value());
}

void TestVaultIndexingPipeline::testEmptyNoteIsRecordedOnce()
{
    writeNote(QStringLiteral("empty.md"), "");
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");

    auto indexer = makeIndexer();
    const ox::VaultIndexingResult first = indexer->indexVault();
    QVERIFY(first.errors.isEmpty());
    QCOMPARE(first.notesAdded, 2);
    QCOMPARE(first.chunksCreated, 1);

    const auto note = m_store->getNoteByPath(QStringLiteral("empty.md"));
    QVERIFY(note.has_value());
    QVERIFY(m_store->chunksForNote(note->id).empty());

    const ox::VaultIndexingResult second = indexer->indexVault();
    QCOMPARE(second.notesAdded, 0);
    QCOMPARE(second.notesUpdated, 0);
}

// ── Failure containment ──────────────────────────────────────────

void TestVaultIndexingPipeline::testInvalidUtf8IsContained()
{
    for (int i = 0; i < 10; ++i) {
        writeNote(QStringLiteral("note-%1.md").arg(i),
                  QByteArray("Walked the dog, day ") + QByteArray::number(i) + '\n');
    }
    writeNote(QStringLiteral("broken.md"), QByteArray("valid start \xC3\x28 then garbage \xFF\n"));

    auto indexer = makeIndexer();
    const ox::VaultIndexingResult result = indexer->indexVault();

    QVERIFY(!result.aborted);
    QCOMPARE(result.notesScanned, 11);
    QCOMPARE(result.notesAdded, 10);
    QCOMPARE(static_cast<int>(result.errors.size()), 1);
    QVERIFY(result.errors.first().contains(QStringLiteral("broken.md")));
    QVERIFY(!m_store->getNoteByPath(QStringLiteral("broken.md")).has_value());
}

void TestVaultIndexingPipeline::testEmbeddingBatchFailureIsContained()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("b.md"), "POISON pill.\n");
    writeNote(QStringLiteral("c.md"), "Cooked dinner.\n");
    m_transport->failInputsContaining(QStringLiteral("POISON"));

    auto indexer = makeIndexer(1);
    const ox::VaultIndexingResult result = indexer->indexVault();

    QVERIFY(!result.aborted);
    QCOMPARE(result.notesAdded, 2);
    QCOMPARE(static_cast<int>(result.errors.size()), 1);
    QVERIFY(result.errors.first().startsWith(QStringLiteral("Embedding error")));
    QVERIFY(!m_store->getNoteByPath(QStringLiteral("b.md")).has_value());

    // The failed note is picked up again once the endpoint accepts it.
    m_transport->failInputsContaining(QString());
    const ox::VaultIndexingResult retry = indexer->indexVault();
    QVERIFY(retry.errors.isEmpty());
    QCOMPARE(retry.notesAdded, 1);
    QVERIFY(m_store->getNoteByPath(QStringLiteral("b.md")).has_value());
}

void TestVaultIndexingPipeline::testStorageFailureForcesRetry()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("b.md"), "Cooked dinner.\n");

    auto indexer = makeIndexer();
    QCOMPARE(indexer->indexVault().notesAdded, 2);

    // A vector of the wrong width is rejected by the store.
    writeNote(QStringLiteral("b.md"), "Cooked dinner twice.\n");
    m_transport->queueResponse(FakeEmbeddingTransport::embeddingResponse({{1.0f, 0.0f, 0.0f, 0.0f}}));
    const ox::VaultIndexingResult failed = indexer->indexVault();

    QCOMPARE(failed.notesUpdated, 0);
    QCOMPARE(static_cast<int>(failed.errors.size()), 1);
    QVERIFY(failed.errors.first().contains(QStringLiteral("b.md")));

    const auto note = m_store->getNoteByPath(QStringLiteral("b.md"));
    QVERIFY(note.has_value());
    QVERIFY(note->contentHash.isEmpty());
    // Previous chunks survive the failed replacement.
    const std::vector<ox::NoteChunk> chunks = m_store->chunksForNote(note->id);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QVERIFY(!chunks.front().text.contains(QStringLiteral("twice")));

    const ox::VaultIndexingResult retry = indexer->indexVault();
    QVERIFY(retry.errors.isEmpty());
    QCOMPARE(retry.notesUpdated, 1);
}

void TestVaultIndexingPipeline::testStorageFailureOnNewNoteLeavesNoRow()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    auto indexer = makeIndexer();
    QCOMPARE(indexer->indexVault().notesAdded, 1);

    writeNote(QStringLiteral("c.md"), "Cooked dinner.\n");
    m_transport->queueResponse(FakeEmbeddingTransport::embeddingResponse({{1.0f, 0.0f, 0.0f, 0.0f}}));
    const ox::VaultIndexingResult failed = indexer->indexVault();

    QCOMPARE(failed.notesAdded, 0);
    QCOMPARE(static_cast<int>(failed.errors.size()), 1);
    QVERIFY(failed.errors.first().contains(QStringLiteral("c.md")));
    QVERIFY(!m_store->getNoteByPath(QStringLiteral("c.md")).has_value());
    QCOMPARE(m_store->stats().indexedNotes, 1);

    const ox::VaultIndexingResult retry = indexer->indexVault();
    QVERIFY(retry.errors.isEmpty());
    QCOMPARE(retry.notesAdded, 1);
    QCOMPARE(retry.notesUpdated, 0);
}

void TestVaultIndexingPipeline::testMissingVaultRootAborts()
{
    ox::VaultIndexerConfig config;
    config.vaultPath = m_vault->filePath(QStringLiteral("does-not-exist"));
    ox::VaultIndexer indexer(*m_store, *m_client, config);

    const ox::VaultIndexingResult result = indexer.indexVault();
    QVERIFY(result.aborted);
    QCOMPARE(static_cast<int>(result.errors.size()), 1);
    QCOMPARE(result.notesScanned, 0);
    QCOMPARE(m_transport->callCount(), 0);
}

void TestVaultIndexingPipeline::testUnconfiguredClientAborts()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");

    ox::EmbeddingClient unconfigured(ox::EmbeddingClientConfig{}, m_transport);
    ox::VaultIndexerConfig config;
    config.vaultPath = m_vault->path();
    ox::VaultIndexer indexer(*m_store, unconfigured, config);

    const ox::VaultIndexingResult result = indexer.indexVault();
    QVERIFY(result.aborted);
    QVERIFY(!result.errors.isEmpty());
    QCOMPARE(m_transport->callCount(), 0);
    QCOMPARE(m_store->stats().indexedNotes, 0);
}

// ── Cancellation ─────────────────────────────────────────────────

void TestVaultIndexingPipeline::testCancelBeforeRun()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");

    std::atomic<bool> cancel{true};
    auto indexer = makeIndexer();
    const ox::VaultIndexingResult result = indexer->indexVault(&cancel);

    QVERIFY(result.canceled);
    QCOMPARE(result.notesAdded, 0);
    QCOMPARE(m_transport->callCount(), 0);
}

void TestVaultIndexingPipeline::testCancelBetweenBatches()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("b.md"), "Cooked dinner.\n");
    writeNote(QStringLiteral("c.md"), "Read a book.\n");

    std::atomic<bool> cancel{false};
    m_transport->setBeforePost([&cancel](int call) {
        if (call == 2) {
            cancel.store(true);
        }
    });

    auto indexer = makeIndexer(1);
    const ox::VaultIndexingResult result = indexer->indexVault(&cancel);

    QVERIFY(result.canceled);
    QCOMPARE(result.notesAdded, 1);
    QCOMPARE(m_transport->callCount(), 2);
    QCOMPARE(m_store->stats().indexedNotes, 1);

    // The next run finishes what was left.
    m_transport->setBeforePost(nullptr);
    cancel.store(false);
    const ox::VaultIndexingResult resumed = indexer->indexVault(&cancel);
    QVERIFY(!resumed.canceled);
    QCOMPARE(resumed.notesAdded, 2);
    QCOMPARE(m_store->stats().indexedNotes, 3);
}

// ── Single note ──────────────────────────────────────────────────

void TestVaultIndexingPipeline::testIndexNoteAlwaysReprocesses()
{
    writeNote(QStringLiteral("Daily/2026-01-18.md"), "Walked the dog.\n");
    auto indexer = makeIndexer();

    const ox::VaultIndexingResult first = indexer->indexNote(QStringLiteral("Daily/2026-01-18.md"));
    QVERIFY(first.errors.isEmpty());
    QCOMPARE(first.notesScanned, 1);
    QCOMPARE(first.notesAdded, 1);
    QCOMPARE(first.chunksCreated, 1);

    // Absolute paths resolve to the same note; unchanged content is redone.
    const ox::VaultIndexingResult second =
        indexer->indexNote(m_vault->filePath(QStringLiteral("Daily/2026-01-18.md")));
    QVERIFY(second.errors.isEmpty());
    QCOMPARE(second.notesAdded, 0);
    QCOMPARE(second.notesUpdated, 1);
    QCOMPARE(second.chunksRemoved, 1);
    QCOMPARE(m_transport->callCount(), 2);
    QCOMPARE(m_store->stats().indexedNotes, 1);
}

void TestVaultIndexingPipeline::testIndexNoteRejectsBadPaths()
{
    writeNote(QStringLiteral("templates/daily.md"), "Template.\n");
    auto indexer = makeIndexer();

    const ox::VaultIndexingResult outside = indexer->indexNote(QStringLiteral("../elsewhere.md"));
    QCOMPARE(static_cast<int>(outside.errors.size()), 1);
    QVERIFY(outside.errors.first().startsWith(QStringLiteral("Path is outside the vault")));

    const ox::VaultIndexingResult missing = indexer->indexNote(QStringLiteral("ghost.md"));
    QCOMPARE(static_cast<int>(missing.errors.size()), 1);
    QVERIFY(missing.errors.first().startsWith(QStringLiteral("File not found")));

    const ox::VaultIndexingResult excluded = indexer->indexNote(QStringLiteral("templates/daily.md"));
    QCOMPARE(static_cast<int>(excluded.errors.size()), 1);
    QVERIFY(excluded.errors.first().startsWith(QStringLiteral("File is excluded")));

    QCOMPARE(m_transport->callCount(), 0);
    QCOMPARE(m_store->stats().indexedNotes, 0);
}

void TestVaultIndexingPipeline::testRemoveNote()
{
    writeNote(QStringLiteral("a.md"), "Walked the dog.\n");
    writeNote(QStringLiteral("b.md"), "Cooked dinner.\n");
    auto indexer = makeIndexer();
    QCOMPARE(indexer->indexVault().notesAdded, 2);

    const ox::VaultIndexingResult result = indexer->removeNote(QStringLiteral("a.md"));
    QVERIFY(result.errors.isEmpty());
    QCOMPARE(result.notesRemoved, 1);
    QCOMPARE(result.chunksRemoved, 1);
    QCOMPARE(m_store->stats().indexedNotes, 1);

    // Removing an unknown note is not an error.
    const ox::VaultIndexingResult again = indexer->removeNote(QStringLiteral("a.md"));
    QVERIFY(again.errors.isEmpty());
    QCOMPARE(again.notesRemoved, 0);
}

// ── Search ───────────────────────────────────────────────────────

void TestVaultIndexingPipeline::testSearchFindsIndexedNote()
{
    writeNote(QStringLiteral("Daily/2026-01-18.md"), "Took the dog for a long walk in the park.\n");
    writeNote(QStringLiteral("reading.md"), "Finished reading a novel.\n");
    writeNote(QStringLiteral("work.md"), "Project deadline meeting.\n");
    writeNote(QStringLiteral("food.md"), "Tried a new recipe for dinner.\n");

    auto indexer = makeIndexer();
    QCOMPARE(indexer->indexVault().notesAdded, 4);

    ox::VaultSearchConfig searchConfig;
    searchConfig.minScore = 0.75;
    ox::VaultSearchEngine engine(*m_store, *m_client, searchConfig);
    engine.setReferenceDateProvider([]() { return QDate(2026, 1, 19); });
    QVERIFY(engine.isAvailable());

    const std::vector<ox::VaultSearchResult> results = engine.search(QStringLiteral("pet"));
    QCOMPARE(static_cast<int>(results.size()), 1);
    QCOMPARE(results.front().filePath, QStringLiteral("Daily/2026-01-18.md"));
    QVERIFY(results.front().chunkText.contains(QStringLiteral("dog")));

    const QString citations = ox::CitationFormatter::formatCitations(results, QStringLiteral("My Vault"));
    QVERIFY(citations.contains(QStringLiteral("[[2026-01-18]]")));
    QVERIFY(citations.contains(
        QStringLiteral("obsidian://open?vault=My%20Vault&file=Daily%2F2026-01-18.md")));
}

void TestVaultIndexingPipeline::testJournalSearchRanksDogNoteFirst()
{
    writeNote(QStringLiteral("2026-01-18.md"), "# Journal\nWalked the dog.");
    writeNote(QStringLiteral("2026-01-19.md"), "# Journal\nRead a book.");

    auto indexer = makeIndexer();
    const ox::VaultIndexingResult indexed = indexer->indexVault();
    QVERIFY(indexed.errors.isEmpty());
    QCOMPARE(indexed.notesAdded, 2);

    ox::VaultSearchEngine engine(*m_store, *m_client);
    engine.setReferenceDateProvider([]() { return QDate(2026, 1, 19); });
    const std::vector<ox::VaultSearchResult> results = engine.search(QStringLiteral("pet"));

    QVERIFY(!results.empty());
    QCOMPARE(results.front().filePath, QStringLiteral("2026-01-18.md"));
    int dogEntries = 0;
    for (const ox::VaultSearchResult& result : results) {
        if (result.filePath == QLatin1String("2026-01-18.md")) {
            ++dogEntries;
        }
    }
    QCOMPARE(dogEntries, 1);
}

QTEST_MAIN(TestVaultIndexingPipeline)
#include "test_vault_indexing_pipeline.moc"
