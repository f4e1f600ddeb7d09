#include <QtTest/QtTest>
#include "core/indexing/note_chunker.h"

#include <algorithm>

class TestNoteChunker : public QObject {
    Q_OBJECT

private slots:
    // ── Basic behavior ───────────────────────────────────────────
    void testEmptyContentReturnsEmpty();
    void testWhitespaceOnlyReturnsEmpty();
    void testShortNoteReturnsSingleChunk();
    void testSmallSectionsArePacked();

    // ── Note prefix ──────────────────────────────────────────────
    void testPrefixUsesFileStem();
    void testPrefixIncludesDistinctTitle();
    void testFrontmatterFeedsPrefixAndIsNotChunked();

    // ── Splitting ────────────────────────────────────────────────
    void testSectionsSplitAtTarget();
    void testLargeSectionRepeatsHeader();
    void testChunksStayWithinBudget();
    void testContinuationCarriesOverlap();

    // ── Line ranges ──────────────────────────────────────────────
    void testLineRangesCoverBody();
    void testChunkIndicesAreSequential();

    // ── Overlap tail ─────────────────────────────────────────────
    void testOverlapTailShortText();
    void testOverlapTailPrefersParagraph();
    void testOverlapTailFallsBackToSentence();
    void testOverlapTailRawCut();

    // ── Determinism ──────────────────────────────────────────────
    void testChunkingDeterministic();

private:
    static QString longSection(const QString& header, int lines);
};

QString TestNoteChunker::longSection(const QString& header, int lines)
{
    QString text = header + QLatin1Char('\n');
    for (int i = 0; i < lines; ++i) {
        text += QStringLiteral("Sentence number %1 is here.\n").arg(i, 2, 10, QLatin1Char('0'));
    }
    return text;
}

// ── Basic behavior ───────────────────────────────────────────────

void TestNoteChunker::testEmptyContentReturnsEmpty()
{
    ox::NoteChunker chunker;
    QVERIFY(chunker.chunkNote(QString(), QStringLiteral("empty.md")).empty());
}

void TestNoteChunker::testWhitespaceOnlyReturnsEmpty()
{
    ox::NoteChunker chunker;
    QVERIFY(chunker.chunkNote(QStringLiteral("  \n\n\t\n"), QStringLiteral("blank.md")).empty());
}

void TestNoteChunker::testShortNoteReturnsSingleChunk()
{
    ox::NoteChunker chunker;
    auto chunks = chunker.chunkNote(QStringLiteral("Walked the dog this morning."),
                                    QStringLiteral("journal/2026-01-18.md"));
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0].chunkIndex, 0);
    QCOMPARE(chunks[0].startLine, 0);
    QCOMPARE(chunks[0].endLine, 0);
    QVERIFY(chunks[0].text.endsWith(QStringLiteral("Walked the dog this morning.")));
}

void TestNoteChunker::testSmallSectionsArePacked()
{
    ox::NoteChunker chunker;
    const QString content = QStringLiteral("# One\nalpha\n## Two\nbeta\n## Three\ngamma");
    auto chunks = chunker.chunkNote(content, QStringLiteral("packed.md"));
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QVERIFY(chunks[0].text.contains(QStringLiteral("## Two\nbeta")));
    QVERIFY(chunks[0].text.contains(QStringLiteral("## Three\ngamma")));
}

// ── Note prefix ──────────────────────────────────────────────────

void TestNoteChunker::testPrefixUsesFileStem()
{
    QCOMPARE(ox::NoteChunker::buildNotePrefix(QStringLiteral("a/b/ideas.md"), QString(),
                                              QString(), QString()),
             QStringLiteral("[Note: ideas]\n\n"));
    // A title equal to the stem is not repeated.
    QCOMPARE(ox::NoteChunker::buildNotePrefix(QStringLiteral("Ideas.md"), QStringLiteral("ideas"),
                                              QString(), QString()),
             QStringLiteral("[Note: Ideas]\n\n"));
}

void TestNoteChunker::testPrefixIncludesDistinctTitle()
{
    const QString prefix = ox::NoteChunker::buildNotePrefix(
        QStringLiteral("2026-01-18.md"), QStringLiteral("Sunday walk"),
        QStringLiteral("2026-01-18"), QStringLiteral("pets, outdoors"));
    QCOMPARE(prefix, QStringLiteral("[Note: Sunday walk (2026-01-18)]\n"
                                    "Date: 2026-01-18\n"
                                    "Tags: pets, outdoors\n\n"));
}

void TestNoteChunker::testFrontmatterFeedsPrefixAndIsNotChunked()
{
    ox::NoteChunker chunker;
    const QString content = QStringLiteral("---\n"
                                           "date: 2026-01-18\n"
                                           "tags: [work, ideas]\n"
                                           "---\n"
                                           "# Standup\n"
                                           "Discussed the deadline.");
    auto chunks = chunker.chunkNote(content, QStringLiteral("daily/2026-01-18.md"),
                                    QStringLiteral("Standup"));
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QVERIFY(chunks[0].text.startsWith(QStringLiteral("[Note: Standup (2026-01-18)]\n"
                                                     "Date: 2026-01-18\n"
                                                     "Tags: work, ideas\n\n")));
    QVERIFY(!chunks[0].text.contains(QStringLiteral("date:")));
    QVERIFY(!chunks[0].text.contains(QStringLiteral("---")));
    QCOMPARE(chunks[0].startLine, 4);
    QCOMPARE(chunks[0].endLine, 5);
}

// ── Splitting ────────────────────────────────────────────────────

void TestNoteChunker::testSectionsSplitAtTarget()
{
    ox::NoteChunker chunker({50, 10, 4});   // 200 char target
    QString content;
    for (int i = 0; i < 4; ++i) {
        content += QStringLiteral("## Part %1\n").arg(i);
        content += QString(120, QLatin1Char('a' + i)) + QLatin1Char('\n');
    }
    auto chunks = chunker.chunkNote(content.trimmed(), QStringLiteral("parts.md"));
    QCOMPARE(static_cast<int>(chunks.size()), 4);
    for (int i = 0; i < 4; ++i) {
        QVERIFY(chunks[static_cast<size_t>(i)].text.contains(QStringLiteral("## Part %1").arg(i)));
    }
}

void TestNoteChunker::testLargeSectionRepeatsHeader()
{
    ox::NoteChunker chunker({50, 10, 4});
    auto chunks = chunker.chunkNote(longSection(QStringLiteral("## Big"), 30),
                                    QStringLiteral("big.md"));
    QVERIFY(chunks.size() > 1);
    QVERIFY(chunks[0].text.contains(QStringLiteral("## Big\n")));
    for (size_t i = 1; i < chunks.size(); ++i) {
        QVERIFY2(chunks[i].text.contains(QStringLiteral("## Big (continued)")),
                 qPrintable(chunks[i].text));
    }
}

void TestNoteChunker::testChunksStayWithinBudget()
{
    ox::NoteChunker chunker({50, 10, 4});
    const QString prefix = ox::NoteChunker::buildNotePrefix(QStringLiteral("big.md"), QString(),
                                                            QString(), QString());
    const int budget = std::max(chunker.targetChars() - static_cast<int>(prefix.size()),
                                chunker.targetChars() / 2);

    QString content = longSection(QStringLiteral("## First"), 25)
                      + QStringLiteral("## Small\nshort body\n")
                      + longSection(QStringLiteral("## Second"), 25);
    auto chunks = chunker.chunkNote(content, QStringLiteral("big.md"));
    QVERIFY(chunks.size() > 4);
    for (const auto& chunk : chunks) {
        QVERIFY(chunk.text.startsWith(prefix));
        QVERIFY2(chunk.text.size() - prefix.size() <= budget, qPrintable(chunk.text));
    }
}

void TestNoteChunker::testContinuationCarriesOverlap()
{
    ox::NoteChunker chunker({50, 10, 4});   // 40 char overlap
    auto chunks = chunker.chunkNote(longSection(QStringLiteral("## Big"), 30),
                                    QStringLiteral("big.md"));
    QVERIFY(chunks.size() > 1);
    for (size_t i = 1; i < chunks.size(); ++i) {
        const QString lastLine = chunks[i - 1].text.split(QLatin1Char('\n')).last();
        QVERIFY(lastLine.startsWith(QStringLiteral("Sentence number")));
        QVERIFY2(chunks[i].text.contains(lastLine), qPrintable(chunks[i].text));
    }
}

// ── Line ranges ──────────────────────────────────────────────────

void TestNoteChunker::testLineRangesCoverBody()
{
    ox::NoteChunker chunker({50, 10, 4});
    const QString content = longSection(QStringLiteral("## Big"), 30).trimmed();
    auto chunks = chunker.chunkNote(content, QStringLiteral("big.md"));
    QVERIFY(chunks.size() > 1);
    QCOMPARE(chunks.front().startLine, 0);
    QCOMPARE(chunks.back().endLine, 30);
    for (size_t i = 0; i < chunks.size(); ++i) {
        QVERIFY(chunks[i].startLine <= chunks[i].endLine);
        if (i > 0) {
            QVERIFY(chunks[i].startLine > chunks[i - 1].startLine);
            QCOMPARE(chunks[i].startLine, chunks[i - 1].endLine + 1);
        }
    }
}

void TestNoteChunker::testChunkIndicesAreSequential()
{
    ox::NoteChunker chunker({50, 10, 4});
    auto chunks = chunker.chunkNote(longSection(QStringLiteral("# Log"), 40),
                                    QStringLiteral("log.md"));
    for (size_t i = 0; i < chunks.size(); ++i) {
        QCOMPARE(chunks[i].chunkIndex, static_cast<int>(i));
    }
}

// ── Overlap tail ─────────────────────────────────────────────────

void TestNoteChunker::testOverlapTailShortText()
{
    QCOMPARE(ox::NoteChunker::overlapTail(QStringLiteral("tiny"), 40), QStringLiteral("tiny"));
    QVERIFY(ox::NoteChunker::overlapTail(QStringLiteral("tiny"), 0).isEmpty());
}

void TestNoteChunker::testOverlapTailPrefersParagraph()
{
    const QString text = QString(100, QLatin1Char('a'))
                         + QStringLiteral(". More words.\n\nshort tail");
    QCOMPARE(ox::NoteChunker::overlapTail(text, 40), QStringLiteral("short tail"));
}

void TestNoteChunker::testOverlapTailFallsBackToSentence()
{
    const QString text = QString(100, QLatin1Char('a')) + QStringLiteral(". Last sentence");
    QCOMPARE(ox::NoteChunker::overlapTail(text, 40), QStringLiteral("Last sentence"));
}

void TestNoteChunker::testOverlapTailRawCut()
{
    const QString text(100, QLatin1Char('z'));
    QCOMPARE(ox::NoteChunker::overlapTail(text, 40), QString(40, QLatin1Char('z')));
}

// ── Determinism ──────────────────────────────────────────────────

void TestNoteChunker::testChunkingDeterministic()
{
    ox::NoteChunker chunker({50, 10, 4});
    const QString content = longSection(QStringLiteral("## A"), 20)
                            + longSection(QStringLiteral("## B"), 20);
    auto first = chunker.chunkNote(content, QStringLiteral("same.md"));
    auto second = chunker.chunkNote(content, QStringLiteral("same.md"));
    QCOMPARE(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        QCOMPARE(first[i].text, second[i].text);
        QCOMPARE(first[i].startLine, second[i].startLine);
        QCOMPARE(first[i].endLine, second[i].endLine);
    }
}

QTEST_MAIN(TestNoteChunker)
#include "test_note_chunker.moc"
