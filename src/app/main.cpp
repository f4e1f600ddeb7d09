#include "core/embedding/embedding_client.h"
#include "core/embedding/embedding_error.h"
#include "core/index/vault_store.h"
#include "core/indexing/vault_indexer.h"
#include "core/query/citation_formatter.h"
#include "core/query/vault_search_engine.h"
#include "core/shared/cancellation.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QTextStream>

#include <atomic>
#include <csignal>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> g_cancel{false};

void handleSignal(int)
{
    g_cancel.store(true);
}

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

ox::EmbeddingClientConfig embeddingConfig(const ox::Settings& settings)
{
    ox::EmbeddingClientConfig config;
    config.baseUrl = settings.embeddingBaseUrl;
    config.model = settings.embeddingModel;
    config.apiKey = settings.embeddingApiKey;
    config.timeoutMs = settings.embeddingTimeoutMs;
    config.maxAttempts = settings.embeddingMaxAttempts;
    config.retryBaseDelayMs = settings.embeddingRetryBaseDelayMs;
    return config;
}

ox::VaultIndexerConfig indexerConfig(const ox::Settings& settings)
{
    ox::VaultIndexerConfig config;
    config.vaultPath = settings.vaultPath;
    config.includePattern = settings.includePattern;
    config.excludePatterns = settings.excludePatterns;
    config.embeddingBatchSize = settings.embeddingBatchSize;
    config.chunker.targetTokens = settings.chunkTargetTokens;
    config.chunker.overlapTokens = settings.chunkOverlapTokens;
    return config;
}

int printIndexingResult(const ox::VaultIndexingResult& result)
{
    out() << "scanned: " << result.notesScanned
          << "  added: " << result.notesAdded
          << "  updated: " << result.notesUpdated
          << "  removed: " << result.notesRemoved
          << "  chunks: +" << result.chunksCreated << "/-" << result.chunksRemoved
          << "  duration: " << result.durationMs << " ms\n";
    for (const QString& error : result.errors) {
        out() << "error: " << error << '\n';
    }
    if (result.canceled) {
        out() << "canceled\n";
    }
    out().flush();
    return (result.aborted || result.canceled) ? kExitFailure : kExitOk;
}

int usage(QCommandLineParser& parser, const QString& message)
{
    err() << message << "\n\n" << parser.helpText();
    err().flush();
    return kExitUsage;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("obsidex"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Semantic index and search for a markdown vault"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("index | index-note <path> | remove-note <path> | "
                                                "search <query> | stats"));

    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Settings file."),
                                          QStringLiteral("file"));
    const QCommandLineOption topKOption(QStringLiteral("top-k"),
                                        QStringLiteral("Maximum number of results."),
                                        QStringLiteral("n"));
    const QCommandLineOption minScoreOption(QStringLiteral("min-score"),
                                            QStringLiteral("Minimum similarity score (0..1)."),
                                            QStringLiteral("score"));
    const QCommandLineOption dateFilterOption(QStringLiteral("date-filter"),
                                              QStringLiteral("Drop dated notes outside the query's date range."));
    const QCommandLineOption citationsOption(QStringLiteral("citations"),
                                             QStringLiteral("Append an obsidian:// sources block."));
    parser.addOptions({configOption, topKOption, minScoreOption, dateFilterOption, citationsOption});

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usage(parser, QStringLiteral("missing command"));
    }
    const QString command = args.first();

    ox::Settings settings;
    if (parser.isSet(configOption)) {
        const std::optional<ox::Settings> loaded = ox::SettingsManager::load(parser.value(configOption));
        if (!loaded) {
            err() << "cannot read settings file " << parser.value(configOption) << '\n';
            return kExitUsage;
        }
        settings = *loaded;
    } else if (QFileInfo::exists(ox::SettingsManager::settingsFilePath())) {
        settings = ox::SettingsManager::load().value_or(ox::Settings{});
    }
    ox::SettingsManager::applyEnvironment(settings);

    std::optional<int> topK;
    if (parser.isSet(topKOption)) {
        bool ok = false;
        const int value = parser.value(topKOption).toInt(&ok);
        if (!ok || value <= 0) {
            return usage(parser, QStringLiteral("--top-k must be a positive integer"));
        }
        topK = value;
    }
    std::optional<double> minScore;
    if (parser.isSet(minScoreOption)) {
        bool ok = false;
        const double value = parser.value(minScoreOption).toDouble(&ok);
        if (!ok || value < 0.0 || value > 1.0) {
            return usage(parser, QStringLiteral("--min-score must be between 0 and 1"));
        }
        minScore = value;
    }

    const bool knownCommand = command == QLatin1String("index")
        || command == QLatin1String("index-note") || command == QLatin1String("remove-note")
        || command == QLatin1String("search") || command == QLatin1String("stats");
    if (!knownCommand) {
        return usage(parser, QStringLiteral("unknown command: %1").arg(command));
    }
    const bool needsArgument = command == QLatin1String("index-note")
        || command == QLatin1String("remove-note") || command == QLatin1String("search");
    if (needsArgument && args.size() < 2) {
        return usage(parser, QStringLiteral("%1 requires an argument").arg(command));
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const QString dbPath = ox::SettingsManager::resolvedDbPath(settings);
    std::unique_ptr<ox::VaultStore> store = ox::VaultStore::open(dbPath);
    if (!store) {
        err() << "cannot open index database " << dbPath << '\n';
        return kExitFailure;
    }

    ox::EmbeddingClient embedder(embeddingConfig(settings));

    if (command == QLatin1String("index")) {
        ox::VaultIndexer indexer(*store, embedder, indexerConfig(settings));
        return printIndexingResult(indexer.indexVault(&g_cancel));
    }
    if (command == QLatin1String("index-note")) {
        ox::VaultIndexer indexer(*store, embedder, indexerConfig(settings));
        const ox::VaultIndexingResult result = indexer.indexNote(args.at(1), &g_cancel);
        const int code = printIndexingResult(result);
        return (code == kExitOk && !result.errors.isEmpty()) ? kExitFailure : code;
    }
    if (command == QLatin1String("remove-note")) {
        ox::VaultIndexer indexer(*store, embedder, indexerConfig(settings));
        return printIndexingResult(indexer.removeNote(args.at(1)));
    }

    ox::VaultSearchConfig searchConfig;
    searchConfig.enabled = settings.searchEnabled;
    searchConfig.topK = settings.topK;
    searchConfig.minScore = settings.minScore;
    ox::VaultSearchEngine engine(*store, embedder, searchConfig);

    if (command == QLatin1String("stats")) {
        const ox::VaultStats stats = engine.stats();
        out() << "notes: " << stats.indexedNotes << '\n'
              << "chunks: " << stats.indexedChunks << '\n'
              << "vector search: " << (stats.vectorSearchAvailable ? "available" : "unavailable") << '\n';
        out().flush();
        return kExitOk;
    }

    // search
    const QString query = args.mid(1).join(QLatin1Char(' '));
    if (!engine.isAvailable()) {
        err() << "vault search is unavailable (disabled or not indexed yet)\n";
        err().flush();
    }

    ox::VaultSearchEngine::Options options;
    options.topK = topK;
    options.minScore = minScore;
    options.restrictToDateRange = parser.isSet(dateFilterOption);

    try {
        const ox::VaultSearchEngine::DetailedResult detailed =
            engine.searchDetailed(query, options, &g_cancel);
        if (detailed.translated.hasRange()) {
            out() << "dates: " << detailed.translated.startDate->toString(Qt::ISODate)
                  << " .. " << detailed.translated.endDate->toString(Qt::ISODate) << '\n';
        }
        int rank = 1;
        for (const ox::VaultSearchResult& result : detailed.results) {
            out() << rank++ << ". " << result.filePath << ":" << (result.startLine + 1)
                  << "  (" << QString::number(result.score, 'f', 3) << ")  "
                  << result.title << '\n';
        }
        if (parser.isSet(citationsOption)) {
            out() << ox::CitationFormatter::formatCitations(detailed.results, settings.vaultName,
                                                            settings.maxCitations);
        }
        out().flush();
        return kExitOk;
    } catch (const ox::EmbeddingError& e) {
        err() << "search failed (" << ox::EmbeddingError::kindName(e.kind()) << "): " << e.what() << '\n';
    } catch (const ox::OperationCanceled&) {
        err() << "search canceled\n";
    }
    err().flush();
    return kExitFailure;
}
