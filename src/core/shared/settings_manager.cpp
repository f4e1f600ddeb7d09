#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>
#include <QtGlobal>

namespace ox {

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(oxCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(oxCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(oxCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(oxCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(oxCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    // The file may hold an API key.
    file.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/obsidex/settings.json");
}

QString SettingsManager::resolvedDbPath(const Settings& settings)
{
    if (!settings.dbPath.isEmpty()) {
        return settings.dbPath;
    }
    return QDir(settings.vaultPath).filePath(QStringLiteral(".obsidex/index.db"));
}

void SettingsManager::applyEnvironment(Settings& settings)
{
    QByteArray apiKey = qgetenv("OBSIDEX_API_KEY");
    if (apiKey.isEmpty()) {
        apiKey = qgetenv("OPENAI_API_KEY");
    }
    if (!apiKey.isEmpty()) {
        settings.embeddingApiKey = QString::fromUtf8(apiKey).trimmed();
    }

    const QByteArray vaultPath = qgetenv("OBSIDEX_VAULT_PATH");
    if (!vaultPath.isEmpty()) {
        settings.vaultPath = QString::fromUtf8(vaultPath);
    }

    const QByteArray baseUrl = qgetenv("OBSIDEX_EMBEDDING_BASE_URL");
    if (!baseUrl.isEmpty()) {
        settings.embeddingBaseUrl = QString::fromUtf8(baseUrl);
    }
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("vaultPath"), settings.vaultPath);
    json.insert(QStringLiteral("vaultName"), settings.vaultName);
    json.insert(QStringLiteral("includePattern"), settings.includePattern);
    json.insert(QStringLiteral("excludePatterns"), QJsonArray::fromStringList(settings.excludePatterns));
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("chunkTargetTokens"), settings.chunkTargetTokens);
    json.insert(QStringLiteral("chunkOverlapTokens"), settings.chunkOverlapTokens);
    json.insert(QStringLiteral("embeddingBaseUrl"), settings.embeddingBaseUrl);
    json.insert(QStringLiteral("embeddingModel"), settings.embeddingModel);
    json.insert(QStringLiteral("embeddingApiKey"), settings.embeddingApiKey);
    json.insert(QStringLiteral("embeddingBatchSize"), settings.embeddingBatchSize);
    json.insert(QStringLiteral("embeddingTimeoutMs"), settings.embeddingTimeoutMs);
    json.insert(QStringLiteral("embeddingMaxAttempts"), settings.embeddingMaxAttempts);
    json.insert(QStringLiteral("embeddingRetryBaseDelayMs"), settings.embeddingRetryBaseDelayMs);
    json.insert(QStringLiteral("searchEnabled"), settings.searchEnabled);
    json.insert(QStringLiteral("minScore"), settings.minScore);
    json.insert(QStringLiteral("topK"), settings.topK);
    json.insert(QStringLiteral("maxCitations"), settings.maxCitations);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.vaultPath = json.value(QStringLiteral("vaultPath")).toString(settings.vaultPath);
    settings.vaultName = json.value(QStringLiteral("vaultName")).toString(settings.vaultName);
    settings.includePattern = json.value(QStringLiteral("includePattern"))
                                  .toString(settings.includePattern);

    if (json.contains(QStringLiteral("excludePatterns"))) {
        const QJsonArray excludePatternsArray = json.value(QStringLiteral("excludePatterns")).toArray();
        settings.excludePatterns.clear();
        settings.excludePatterns.reserve(excludePatternsArray.size());
        for (const QJsonValue& value : excludePatternsArray) {
            settings.excludePatterns.append(value.toString());
        }
    }

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);

    settings.chunkTargetTokens = json.value(QStringLiteral("chunkTargetTokens"))
                                     .toInt(settings.chunkTargetTokens);
    settings.chunkOverlapTokens = json.value(QStringLiteral("chunkOverlapTokens"))
                                      .toInt(settings.chunkOverlapTokens);

    settings.embeddingBaseUrl = json.value(QStringLiteral("embeddingBaseUrl"))
                                    .toString(settings.embeddingBaseUrl);
    settings.embeddingModel = json.value(QStringLiteral("embeddingModel"))
                                  .toString(settings.embeddingModel);
    settings.embeddingApiKey = json.value(QStringLiteral("embeddingApiKey"))
                                   .toString(settings.embeddingApiKey);
    settings.embeddingBatchSize = json.value(QStringLiteral("embeddingBatchSize"))
                                      .toInt(settings.embeddingBatchSize);
    settings.embeddingTimeoutMs = json.value(QStringLiteral("embeddingTimeoutMs"))
                                      .toInt(settings.embeddingTimeoutMs);
    settings.embeddingMaxAttempts = json.value(QStringLiteral("embeddingMaxAttempts"))
                                        .toInt(settings.embeddingMaxAttempts);
    settings.embeddingRetryBaseDelayMs = json.value(QStringLiteral("embeddingRetryBaseDelayMs"))
                                             .toInt(settings.embeddingRetryBaseDelayMs);

    settings.searchEnabled = json.value(QStringLiteral("searchEnabled")).toBool(settings.searchEnabled);
    settings.minScore = json.value(QStringLiteral("minScore")).toDouble(settings.minScore);
    settings.topK = json.value(QStringLiteral("topK")).toInt(settings.topK);
    settings.maxCitations = json.value(QStringLiteral("maxCitations")).toInt(settings.maxCitations);

    return settings;
}

} // namespace ox
