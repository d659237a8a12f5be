#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "config/config_patch.hpp"

namespace officebridge {

class Autostart;
class ConfigStore;
class ProcessSupervisor;

// Uniform envelope handed back to the UI: {success, data, error}.
// errorKind stays in-process and is not serialized.
template <typename T>
struct CommandResponse {
    bool success = false;
    std::optional<T> data;
    std::optional<std::string> error;
    std::optional<ErrorKind> errorKind;

    static CommandResponse ok(T value)
    {
        CommandResponse response;
        response.success = true;
        response.data = std::move(value);
        return response;
    }

    static CommandResponse failure(const Error &err)
    {
        CommandResponse response;
        response.error = err.message;
        response.errorKind = err.kind;
        return response;
    }
};

template <typename T>
void to_json(nlohmann::json &j, const CommandResponse<T> &response)
{
    j = nlohmann::json{{"success", response.success}};
    setOptional(j, "data", response.data);
    setOptional(j, "error", response.error);
}

// One operation per user-facing action. Stateless apart from the three
// collaborators; the bridge service address is re-read from config.json on
// every call that talks to it.
class CommandFacade {
public:
    CommandFacade(ConfigStore &store, ProcessSupervisor &supervisor, Autostart &autostart);

    // Main settings
    CommandResponse<BridgeConfig> getConfig();
    CommandResponse<BridgeConfig> saveConfig(const BridgeConfig &config);
    CommandResponse<BridgeConfig> updateConfig(const BridgeConfigPatch &patch);

    // AI providers
    CommandResponse<std::vector<AIProviderConfig>> getProviders();
    CommandResponse<AIProviderConfig> addProvider(const AIProviderConfig &provider);
    CommandResponse<AIProviderConfig> updateProvider(const AIProviderConfig &provider);
    CommandResponse<bool> deleteProvider(const std::string &id);
    CommandResponse<bool> testProviderConnection(const AIProviderConfig &provider);
    CommandResponse<ValidateProviderResponse> validateProvider(const ValidateProviderRequest &request);
    CommandResponse<nlohmann::json> getProviderModels(const std::string &providerId);
    CommandResponse<TestModelResponse> testModel(const std::string &providerId,
                                                 const TestModelRequest &request);

    // Models
    CommandResponse<std::vector<ModelConfig>> getModels();
    CommandResponse<ModelConfig> addModel(const ModelConfig &model);
    CommandResponse<ModelConfig> updateModel(const ModelConfig &model);
    CommandResponse<bool> deleteModel(const std::string &id);

    // MCP servers
    CommandResponse<std::vector<McpServerConfig>> getMcpServers();
    CommandResponse<McpServerConfig> addMcpServer(const McpServerConfig &server);
    CommandResponse<McpServerConfig> updateMcpServer(const McpServerConfig &server);
    // Asks the bridge service to stop the server first; that outcome is only logged.
    CommandResponse<bool> deleteMcpServer(const std::string &id);
    CommandResponse<std::vector<McpServerStatus>> getMcpServerStatus();
    CommandResponse<bool> startMcpServer(const std::string &id);
    CommandResponse<bool> stopMcpServer(const std::string &id);
    CommandResponse<bool> restartMcpServer(const std::string &id);
    CommandResponse<std::vector<McpTool>> getMcpServerTools(const std::string &id);

    CommandResponse<std::vector<LogEntry>> getLogs(std::optional<std::uint32_t> limit,
                                                   const std::optional<std::string> &level);

    // Bridge service lifecycle. getBridgeStatus always succeeds; an unreachable
    // or failing service reports running=false.
    CommandResponse<BridgeStatus> getBridgeStatus();
    CommandResponse<bool> startBridgeService();
    CommandResponse<bool> stopBridgeService();
    // True only while this process owns the running bridge service child. A
    // service started elsewhere answers getBridgeStatus but is not supervised.
    bool isBridgeServiceSupervised();

    // Login autostart
    CommandResponse<bool> enableAutostart();
    CommandResponse<bool> disableAutostart();
    CommandResponse<bool> isAutostartEnabled();

private:
    ConfigStore &m_store;
    ProcessSupervisor &m_supervisor;
    Autostart &m_autostart;
};

} // namespace officebridge
