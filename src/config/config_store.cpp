#include "config/config_store.hpp"

#include <algorithm>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/logging.hpp"

namespace officebridge {

namespace {

constexpr int kJsonIndent = 2;

enum class NameRule {
    Unique,
    Free
};

template <typename Entry>
bool hasId(const std::vector<Entry> &entries, const std::string &id)
{
    return std::any_of(entries.begin(), entries.end(),
                       [&id](const Entry &entry) { return entry.id == id; });
}

template <typename Entry>
bool nameTakenByOther(const std::vector<Entry> &entries, const Entry &candidate)
{
    return std::any_of(entries.begin(), entries.end(),
                       [&candidate](const Entry &entry) {
                           return entry.id != candidate.id && entry.name == candidate.name;
                       });
}

template <typename Entry>
Status addEntry(std::vector<Entry> &entries, const Entry &entry,
                NameRule nameRule, const std::string &label)
{
    if (hasId(entries, entry.id)) {
        return makeError(ErrorKind::Conflict, label + " id already exists: " + entry.id);
    }
    if (nameRule == NameRule::Unique && nameTakenByOther(entries, entry)) {
        return makeError(ErrorKind::Conflict, label + " name already exists: " + entry.name);
    }
    entries.push_back(entry);
    return std::nullopt;
}

template <typename Entry>
Status updateEntry(std::vector<Entry> &entries, const Entry &entry,
                   NameRule nameRule, const std::string &label)
{
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&entry](const Entry &existing) { return existing.id == entry.id; });
    if (it == entries.end()) {
        return makeError(ErrorKind::NotFound, label + " not found: " + entry.id);
    }
    if (nameRule == NameRule::Unique && nameTakenByOther(entries, entry)) {
        return makeError(ErrorKind::Conflict, label + " name already exists: " + entry.name);
    }
    *it = entry;
    return std::nullopt;
}

template <typename Entry>
Status deleteEntry(std::vector<Entry> &entries, const std::string &id, const std::string &label)
{
    const auto originalSize = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&id](const Entry &entry) { return entry.id == id; }),
                  entries.end());
    if (entries.size() == originalSize) {
        return makeError(ErrorKind::NotFound, label + " not found: " + id);
    }
    return std::nullopt;
}

void logMutation(const QString &where, const QString &path, const Status &status)
{
    if (status) {
        OBLOG_WARN(QStringLiteral("ConfigStore"),
                   where,
                   QStringLiteral("config_mutation_rejected"),
                   QString::fromStdString(toErrorKindString(status->kind)),
                   QStringLiteral("json_file"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()},
                                   {"error", status->message}}));
        return;
    }
    OBLOG_INFO(QStringLiteral("ConfigStore"),
               where,
               QStringLiteral("config_mutated"),
               QStringLiteral("user_action"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()}}));
}

} // namespace

ConfigStore::ConfigStore()
    : m_configDir(defaultConfigDir())
{
}

ConfigStore::ConfigStore(const QString &configDir)
    : m_configDir(configDir)
{
}

QString ConfigStore::defaultConfigDir()
{
    QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        home = QStringLiteral(".");
    }
    return home + QStringLiteral("/.office-local-bridge");
}

QString ConfigStore::configDir() const
{
    return m_configDir;
}

QString ConfigStore::configPath() const
{
    return QDir(m_configDir).filePath(QStringLiteral("config.json"));
}

QString ConfigStore::providersPath() const
{
    return QDir(m_configDir).filePath(QStringLiteral("providers.json"));
}

QString ConfigStore::modelsPath() const
{
    return QDir(m_configDir).filePath(QStringLiteral("models.json"));
}

QString ConfigStore::mcpServersPath() const
{
    return QDir(m_configDir).filePath(QStringLiteral("mcp-servers.json"));
}

std::optional<nlohmann::json> ConfigStore::readDocument(const QString &path) const
{
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        reportUnreadableDocument(path, file.errorString().toUtf8().constData());
        return std::nullopt;
    }

    const QByteArray content = file.readAll();
    auto document = nlohmann::json::parse(content.constData(),
                                          content.constData() + content.size(),
                                          nullptr, false);
    if (document.is_discarded()) {
        reportUnreadableDocument(path, "malformed JSON");
        return std::nullopt;
    }
    return document;
}

Status ConfigStore::writeDocument(const QString &path, const nlohmann::json &document) const
{
    std::string text;
    try {
        text = document.dump(kJsonIndent);
    } catch (const nlohmann::json::exception &ex) {
        return makeError(ErrorKind::SerializationFailure,
                         std::string("failed to serialize configuration: ") + ex.what());
    }

    const QString dirPath = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        OBLOG_ERROR(QStringLiteral("ConfigStore"),
                    QStringLiteral("writeDocument"),
                    QStringLiteral("config_dir_create_failed"),
                    QStringLiteral("mkpath_failed"),
                    QStringLiteral("filesystem"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"dir", dirPath.toStdString()}}));
        return makeError(ErrorKind::IoFailure,
                         "failed to create configuration directory: " + dirPath.toStdString());
    }

    // QSaveFile writes to a temporary sibling and renames on commit, so readers
    // never observe a half-written document.
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return makeError(ErrorKind::IoFailure,
                         "failed to open configuration file " + path.toStdString() + ": "
                             + file.errorString().toStdString());
    }

    const QByteArray bytes = QByteArray::fromStdString(text);
    if (file.write(bytes) != bytes.size()) {
        const std::string reason = file.errorString().toStdString();
        file.cancelWriting();
        return makeError(ErrorKind::IoFailure,
                         "failed to write configuration file " + path.toStdString() + ": " + reason);
    }

    if (!file.commit()) {
        OBLOG_ERROR(QStringLiteral("ConfigStore"),
                    QStringLiteral("writeDocument"),
                    QStringLiteral("config_write_failed"),
                    QStringLiteral("commit_failed"),
                    QStringLiteral("save_file"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", path.toStdString()},
                                    {"error", file.errorString().toStdString()}}));
        return makeError(ErrorKind::IoFailure,
                         "failed to write configuration file " + path.toStdString() + ": "
                             + file.errorString().toStdString());
    }

    return std::nullopt;
}

void ConfigStore::reportUnreadableDocument(const QString &path, const char *reason) const
{
    OBLOG_WARN(QStringLiteral("ConfigStore"),
               QStringLiteral("read"),
               QStringLiteral("config_read_defaulted"),
               QStringLiteral("unreadable_document"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()},
                               {"reason", reason}}));
}

BridgeConfig ConfigStore::loadConfig() const
{
    return read<BridgeConfig>(configPath());
}

Status ConfigStore::saveConfig(const BridgeConfig &config) const
{
    const Status status = write(configPath(), config);
    logMutation(QStringLiteral("saveConfig"), configPath(), status);
    return status;
}

Result<BridgeConfig> ConfigStore::updateConfig(const BridgeConfigPatch &patch) const
{
    BridgeConfig current = loadConfig();
    applyBridgeConfigPatch(current, patch);

    const Status status = write(configPath(), current);
    logMutation(QStringLiteral("updateConfig"), configPath(), status);
    if (status) {
        return *status;
    }
    return current;
}

std::vector<AIProviderConfig> ConfigStore::providers() const
{
    return read<ProvidersConfig>(providersPath()).providers;
}

Status ConfigStore::addProvider(const AIProviderConfig &provider) const
{
    auto config = read<ProvidersConfig>(providersPath());
    Status status = addEntry(config.providers, provider, NameRule::Unique, "provider");
    if (!status) {
        status = write(providersPath(), config);
    }
    logMutation(QStringLiteral("addProvider"), providersPath(), status);
    return status;
}

Status ConfigStore::updateProvider(const AIProviderConfig &provider) const
{
    auto config = read<ProvidersConfig>(providersPath());
    Status status = updateEntry(config.providers, provider, NameRule::Unique, "provider");
    if (!status) {
        status = write(providersPath(), config);
    }
    logMutation(QStringLiteral("updateProvider"), providersPath(), status);
    return status;
}

Status ConfigStore::deleteProvider(const std::string &id) const
{
    auto config = read<ProvidersConfig>(providersPath());
    Status status = deleteEntry(config.providers, id, "provider");
    if (!status) {
        status = write(providersPath(), config);
    }
    logMutation(QStringLiteral("deleteProvider"), providersPath(), status);
    return status;
}

std::vector<ModelConfig> ConfigStore::models() const
{
    return read<ModelsConfig>(modelsPath()).models;
}

Status ConfigStore::addModel(const ModelConfig &model) const
{
    auto config = read<ModelsConfig>(modelsPath());
    Status status = addEntry(config.models, model, NameRule::Free, "model");
    if (!status) {
        status = write(modelsPath(), config);
    }
    logMutation(QStringLiteral("addModel"), modelsPath(), status);
    return status;
}

Status ConfigStore::updateModel(const ModelConfig &model) const
{
    auto config = read<ModelsConfig>(modelsPath());
    Status status = updateEntry(config.models, model, NameRule::Free, "model");
    if (!status) {
        status = write(modelsPath(), config);
    }
    logMutation(QStringLiteral("updateModel"), modelsPath(), status);
    return status;
}

Status ConfigStore::deleteModel(const std::string &id) const
{
    auto config = read<ModelsConfig>(modelsPath());
    Status status = deleteEntry(config.models, id, "model");
    if (!status) {
        status = write(modelsPath(), config);
    }
    logMutation(QStringLiteral("deleteModel"), modelsPath(), status);
    return status;
}

std::vector<McpServerConfig> ConfigStore::mcpServers() const
{
    return read<McpServersConfig>(mcpServersPath()).servers;
}

Status ConfigStore::addMcpServer(const McpServerConfig &server) const
{
    auto config = read<McpServersConfig>(mcpServersPath());
    Status status = addEntry(config.servers, server, NameRule::Unique, "MCP server");
    if (!status) {
        status = write(mcpServersPath(), config);
    }
    logMutation(QStringLiteral("addMcpServer"), mcpServersPath(), status);
    return status;
}

Status ConfigStore::updateMcpServer(const McpServerConfig &server) const
{
    auto config = read<McpServersConfig>(mcpServersPath());
    Status status = updateEntry(config.servers, server, NameRule::Unique, "MCP server");
    if (!status) {
        status = write(mcpServersPath(), config);
    }
    logMutation(QStringLiteral("updateMcpServer"), mcpServersPath(), status);
    return status;
}

Status ConfigStore::deleteMcpServer(const std::string &id) const
{
    auto config = read<McpServersConfig>(mcpServersPath());
    Status status = deleteEntry(config.servers, id, "MCP server");
    if (!status) {
        status = write(mcpServersPath(), config);
    }
    logMutation(QStringLiteral("deleteMcpServer"), mcpServersPath(), status);
    return status;
}

} // namespace officebridge
