#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <utility>

namespace dq {

std::optional<Settings> SettingsManager::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(dqCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(dqCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::saveToFile(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(dqCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(dqCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(dqCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/docquery/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("maxResults"), settings.maxResults);
    json.insert(QStringLiteral("minSimilarity"), settings.minSimilarity);
    json.insert(QStringLiteral("maxFileSize"), static_cast<qint64>(settings.maxFileSize));
    json.insert(QStringLiteral("allowedExtensions"),
                QJsonArray::fromStringList(settings.allowedExtensions));

    QJsonObject embedding;
    embedding.insert(QStringLiteral("denseEnabled"), settings.denseEmbeddingEnabled);
    embedding.insert(QStringLiteral("modelPath"), settings.embeddingModelPath);
    embedding.insert(QStringLiteral("vocabPath"), settings.embeddingVocabPath);
    embedding.insert(QStringLiteral("dimensions"), settings.embeddingDimensions);
    embedding.insert(QStringLiteral("maxSequenceLength"), settings.embeddingMaxSequenceLength);
    embedding.insert(QStringLiteral("sparseMaxFeatures"), settings.sparseMaxFeatures);
    json.insert(QStringLiteral("embedding"), embedding);

    QJsonObject generator;
    generator.insert(QStringLiteral("enabled"), settings.generatorEnabled);
    generator.insert(QStringLiteral("url"), settings.generatorUrl);
    generator.insert(QStringLiteral("model"), settings.generatorModel);
    generator.insert(QStringLiteral("timeoutMs"), settings.generatorTimeoutMs);
    generator.insert(QStringLiteral("probeTimeoutMs"), settings.generatorProbeTimeoutMs);
    generator.insert(QStringLiteral("temperature"), settings.generatorTemperature);
    generator.insert(QStringLiteral("topP"), settings.generatorTopP);
    generator.insert(QStringLiteral("maxTokens"), settings.generatorMaxTokens);
    json.insert(QStringLiteral("generator"), generator);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dataDir = json.value(QStringLiteral("dataDir")).toString(settings.dataDir);
    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.chunkSize = json.value(QStringLiteral("chunkSize")).toInt(settings.chunkSize);
    settings.chunkOverlap = json.value(QStringLiteral("chunkOverlap")).toInt(settings.chunkOverlap);
    settings.maxResults = json.value(QStringLiteral("maxResults")).toInt(settings.maxResults);
    settings.minSimilarity = json.value(QStringLiteral("minSimilarity"))
                                 .toDouble(settings.minSimilarity);

    if (json.contains(QStringLiteral("maxFileSize"))) {
        settings.maxFileSize = static_cast<int64_t>(
            json.value(QStringLiteral("maxFileSize")).toVariant().toLongLong());
    }

    if (json.contains(QStringLiteral("allowedExtensions"))) {
        const QJsonArray extensionsArray = json.value(QStringLiteral("allowedExtensions")).toArray();
        settings.allowedExtensions.clear();
        settings.allowedExtensions.reserve(extensionsArray.size());
        for (const QJsonValue& value : extensionsArray) {
            const QString ext = value.toString().trimmed().toLower();
            if (!ext.isEmpty()) {
                settings.allowedExtensions.append(ext.startsWith(QLatin1Char('.')) ? ext.mid(1) : ext);
            }
        }
    }

    const QJsonObject embedding = json.value(QStringLiteral("embedding")).toObject();
    settings.denseEmbeddingEnabled = embedding.value(QStringLiteral("denseEnabled"))
                                         .toBool(settings.denseEmbeddingEnabled);
    settings.embeddingModelPath = embedding.value(QStringLiteral("modelPath"))
                                      .toString(settings.embeddingModelPath);
    settings.embeddingVocabPath = embedding.value(QStringLiteral("vocabPath"))
                                      .toString(settings.embeddingVocabPath);
    settings.embeddingDimensions = embedding.value(QStringLiteral("dimensions"))
                                       .toInt(settings.embeddingDimensions);
    settings.embeddingMaxSequenceLength = embedding.value(QStringLiteral("maxSequenceLength"))
                                              .toInt(settings.embeddingMaxSequenceLength);
    settings.sparseMaxFeatures = embedding.value(QStringLiteral("sparseMaxFeatures"))
                                     .toInt(settings.sparseMaxFeatures);

    const QJsonObject generator = json.value(QStringLiteral("generator")).toObject();
    settings.generatorEnabled = generator.value(QStringLiteral("enabled"))
                                    .toBool(settings.generatorEnabled);
    settings.generatorUrl = generator.value(QStringLiteral("url")).toString(settings.generatorUrl);
    settings.generatorModel = generator.value(QStringLiteral("model"))
                                  .toString(settings.generatorModel);
    settings.generatorTimeoutMs = generator.value(QStringLiteral("timeoutMs"))
                                      .toInt(settings.generatorTimeoutMs);
    settings.generatorProbeTimeoutMs = generator.value(QStringLiteral("probeTimeoutMs"))
                                           .toInt(settings.generatorProbeTimeoutMs);
    settings.generatorTemperature = generator.value(QStringLiteral("temperature"))
                                        .toDouble(settings.generatorTemperature);
    settings.generatorTopP = generator.value(QStringLiteral("topP")).toDouble(settings.generatorTopP);
    settings.generatorMaxTokens = generator.value(QStringLiteral("maxTokens"))
                                      .toInt(settings.generatorMaxTokens);

    return settings;
}

Settings SettingsManager::applyEnvironment(Settings settings, const QProcessEnvironment& env)
{
    const QString url = env.value(QStringLiteral("OLLAMA_URL")).trimmed();
    if (!url.isEmpty()) {
        settings.generatorUrl = url;
    }
    const QString model = env.value(QStringLiteral("OLLAMA_MODEL")).trimmed();
    if (!model.isEmpty()) {
        settings.generatorModel = model;
    }
    const QString dataDir = env.value(QStringLiteral("DOCQUERY_DATA_DIR")).trimmed();
    if (!dataDir.isEmpty()) {
        settings.dataDir = dataDir;
    }
    return settings;
}

Settings SettingsManager::resolvePaths(Settings settings)
{
    if (settings.dataDir.isEmpty()) {
        settings.dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
                           + QStringLiteral("/docquery");
    }
    const QDir dataDir(settings.dataDir);
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = dataDir.filePath(QStringLiteral("docquery.db"));
    }
    if (settings.embeddingModelPath.isEmpty()) {
        settings.embeddingModelPath =
            dataDir.filePath(QStringLiteral("models/all-MiniLM-L6-v2/model.onnx"));
    }
    if (settings.embeddingVocabPath.isEmpty()) {
        settings.embeddingVocabPath =
            dataDir.filePath(QStringLiteral("models/all-MiniLM-L6-v2/vocab.txt"));
    }
    return settings;
}

Settings SettingsManager::loadEffective(const QString& filePath, const QProcessEnvironment& env)
{
    Settings settings;
    if (std::optional<Settings> stored = loadFromFile(filePath)) {
        settings = std::move(*stored);
    } else {
        LOG_INFO(dqCore, "No usable settings at %s, using defaults", qUtf8Printable(filePath));
    }
    return resolvePaths(applyEnvironment(std::move(settings), env));
}

} // namespace dq
