#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "config/config_patch.hpp"

namespace officebridge {

// ConfigStore reads and rewrites the four JSON documents kept under the
// per-user configuration directory. Reads never fail: a missing, unreadable or
// malformed document yields the type's default. Writes replace the whole file
// atomically and report IoFailure or SerializationFailure.
//
// There is no in-process or cross-process locking; the last writer wins.
class ConfigStore {
public:
    // Uses $HOME/.office-local-bridge.
    ConfigStore();
    explicit ConfigStore(const QString &configDir);

    static QString defaultConfigDir();

    QString configDir() const;
    QString configPath() const;
    QString providersPath() const;
    QString modelsPath() const;
    QString mcpServersPath() const;

    template <typename T>
    T read(const QString &path) const;

    template <typename T>
    Status write(const QString &path, const T &value) const;

    // Main settings document.
    BridgeConfig loadConfig() const;
    Status saveConfig(const BridgeConfig &config) const;
    Result<BridgeConfig> updateConfig(const BridgeConfigPatch &patch) const;

    // Collections. add: Conflict on duplicate id (and duplicate name for
    // providers and MCP servers). update: NotFound on unknown id, Conflict when
    // the name belongs to another entry. delete: NotFound on unknown id.
    std::vector<AIProviderConfig> providers() const;
    Status addProvider(const AIProviderConfig &provider) const;
    Status updateProvider(const AIProviderConfig &provider) const;
    Status deleteProvider(const std::string &id) const;

    std::vector<ModelConfig> models() const;
    Status addModel(const ModelConfig &model) const;
    Status updateModel(const ModelConfig &model) const;
    Status deleteModel(const std::string &id) const;

    std::vector<McpServerConfig> mcpServers() const;
    Status addMcpServer(const McpServerConfig &server) const;
    Status updateMcpServer(const McpServerConfig &server) const;
    Status deleteMcpServer(const std::string &id) const;

private:
    std::optional<nlohmann::json> readDocument(const QString &path) const;
    Status writeDocument(const QString &path, const nlohmann::json &document) const;
    void reportUnreadableDocument(const QString &path, const char *reason) const;

    QString m_configDir;
};

template <typename T>
T ConfigStore::read(const QString &path) const
{
    const std::optional<nlohmann::json> document = readDocument(path);
    if (!document) {
        return T{};
    }

    try {
        return document->get<T>();
    } catch (const nlohmann::json::exception &ex) {
        reportUnreadableDocument(path, ex.what());
        return T{};
    }
}

template <typename T>
Status ConfigStore::write(const QString &path, const T &value) const
{
    nlohmann::json document;
    try {
        document = value;
    } catch (const nlohmann::json::exception &ex) {
        return makeError(ErrorKind::SerializationFailure,
                         std::string("failed to serialize configuration: ") + ex.what());
    }
    return writeDocument(path, document);
}

} // namespace officebridge
