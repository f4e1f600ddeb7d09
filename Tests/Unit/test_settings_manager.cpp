#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void cleanup();

    void testDefaults();
    void testSaveAndLoad();
    void testSaveRestrictsPermissions();
    void testLoadMissingFile();
    void testLoadInvalidJson();
    void testPartialJsonKeepsDefaults();
    void testResolvedDbPath();
    void testEnvironmentOverrides();
    void testApiKeyFallsBackToOpenAiVariable();
};

void TestSettingsManager::cleanup()
{
    qunsetenv("OBSIDEX_API_KEY");
    qunsetenv("OPENAI_API_KEY");
    qunsetenv("OBSIDEX_VAULT_PATH");
    qunsetenv("OBSIDEX_EMBEDDING_BASE_URL");
}

void TestSettingsManager::testDefaults()
{
    const ox::Settings settings;
    QCOMPARE(settings.vaultPath, QStringLiteral("/var/notes"));
    QCOMPARE(settings.includePattern, QStringLiteral("**/*.md"));
    QCOMPARE(settings.excludePatterns, QStringList({QStringLiteral("**/templates/**"),
                                                    QStringLiteral("**/.obsidian/**")}));
    QCOMPARE(settings.chunkTargetTokens, 500);
    QCOMPARE(settings.chunkOverlapTokens, 50);
    QCOMPARE(settings.embeddingBatchSize, 100);
    QCOMPARE(settings.embeddingModel, QStringLiteral("text-embedding-3-small"));
    QCOMPARE(settings.minScore, 0.3);
    QCOMPARE(settings.topK, 5);
    QVERIFY(settings.searchEnabled);
}

void TestSettingsManager::testSaveAndLoad()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("config/settings.json"));

    ox::Settings settings;
    settings.vaultPath = QStringLiteral("/home/me/vault");
    settings.vaultName = QStringLiteral("Personal");
    settings.excludePatterns = {QStringLiteral("archive/**")};
    settings.embeddingApiKey = QStringLiteral("sk-saved");
    settings.topK = 8;
    settings.minScore = 0.45;
    settings.searchEnabled = false;
    QVERIFY(ox::SettingsManager::save(settings, path));

    const auto loaded = ox::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->vaultPath, settings.vaultPath);
    QCOMPARE(loaded->vaultName, settings.vaultName);
    QCOMPARE(loaded->excludePatterns, settings.excludePatterns);
    QCOMPARE(loaded->embeddingApiKey, settings.embeddingApiKey);
    QCOMPARE(loaded->topK, 8);
    QCOMPARE(loaded->minScore, 0.45);
    QVERIFY(!loaded->searchEnabled);
}

void TestSettingsManager::testSaveRestrictsPermissions()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QVERIFY(ox::SettingsManager::save(ox::Settings(), path));
    const auto perms = QFile(path).permissions();
    QVERIFY(perms.testFlag(QFile::ReadOwner));
    QVERIFY(!perms.testFlag(QFile::ReadGroup));
    QVERIFY(!perms.testFlag(QFile::ReadOther));
}

void TestSettingsManager::testLoadMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(!ox::SettingsManager::load(dir.filePath(QStringLiteral("nope.json"))).has_value());
}

void TestSettingsManager::testLoadInvalidJson()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    QVERIFY(!ox::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testPartialJsonKeepsDefaults()
{
    QJsonObject json;
    json.insert(QStringLiteral("vaultPath"), QStringLiteral("/srv/vault"));
    json.insert(QStringLiteral("chunkTargetTokens"), 300);

    const ox::Settings settings = ox::SettingsManager::fromJson(json);
    QCOMPARE(settings.vaultPath, QStringLiteral("/srv/vault"));
    QCOMPARE(settings.chunkTargetTokens, 300);
    QCOMPARE(settings.chunkOverlapTokens, 50);
    QCOMPARE(settings.excludePatterns.size(), ox::Settings().excludePatterns.size());
    QCOMPARE(settings.embeddingBaseUrl, QStringLiteral("https://api.openai.com/v1"));

    json.insert(QStringLiteral("excludePatterns"), QJsonArray());
    QVERIFY(ox::SettingsManager::fromJson(json).excludePatterns.isEmpty());
}

void TestSettingsManager::testResolvedDbPath()
{
    ox::Settings settings;
    settings.vaultPath = QStringLiteral("/srv/vault");
    QCOMPARE(ox::SettingsManager::resolvedDbPath(settings),
             QStringLiteral("/srv/vault/.obsidex/index.db"));

    settings.dbPath = QStringLiteral("/tmp/custom.db");
    QCOMPARE(ox::SettingsManager::resolvedDbPath(settings), QStringLiteral("/tmp/custom.db"));
}

void TestSettingsManager::testEnvironmentOverrides()
{
    qputenv("OBSIDEX_API_KEY", " sk-env ");
    qputenv("OPENAI_API_KEY", "sk-openai");
    qputenv("OBSIDEX_VAULT_PATH", "/env/vault");
    qputenv("OBSIDEX_EMBEDDING_BASE_URL", "http://localhost:8080/v1");

    ox::Settings settings;
    settings.embeddingApiKey = QStringLiteral("sk-file");
    ox::SettingsManager::applyEnvironment(settings);
    QCOMPARE(settings.embeddingApiKey, QStringLiteral("sk-env"));
    QCOMPARE(settings.vaultPath, QStringLiteral("/env/vault"));
    QCOMPARE(settings.embeddingBaseUrl, QStringLiteral("http://localhost:8080/v1"));
}

void TestSettingsManager::testApiKeyFallsBackToOpenAiVariable()
{
    qputenv("OPENAI_API_KEY", "sk-openai");

    ox::Settings settings;
    ox::SettingsManager::applyEnvironment(settings);
    QCOMPARE(settings.embeddingApiKey, QStringLiteral("sk-openai"));
    QCOMPARE(settings.vaultPath, QStringLiteral("/var/notes"));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
