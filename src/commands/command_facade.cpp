#include "commands/command_facade.hpp"

#include "bridge/bridge_client.hpp"
#include "bridge/provider_probe.hpp"
#include "common/logging.hpp"
#include "config/config_store.hpp"
#include "desktop/autostart.hpp"
#include "supervisor/process_supervisor.hpp"

namespace officebridge {

namespace {

void logCommandFailure(const char *command, const Error &error)
{
    OBLOG_WARN(QStringLiteral("CommandFacade"),
               QString::fromLatin1(command),
               QStringLiteral("command_failed"),
               QString::fromStdString(toErrorKindString(error.kind)),
               QStringLiteral("command"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"error", error.message}}));
}

template <typename T>
CommandResponse<T> respond(const char *command, Result<T> result)
{
    if (!result) {
        logCommandFailure(command, result.error());
        return CommandResponse<T>::failure(result.error());
    }
    return CommandResponse<T>::ok(std::move(result).value());
}

template <typename T>
CommandResponse<T> respond(const char *command, const Status &status, T valueOnSuccess)
{
    if (status) {
        logCommandFailure(command, *status);
        return CommandResponse<T>::failure(*status);
    }
    return CommandResponse<T>::ok(std::move(valueOnSuccess));
}

} // namespace

CommandFacade::CommandFacade(ConfigStore &store, ProcessSupervisor &supervisor, Autostart &autostart)
    : m_store(store)
    , m_supervisor(supervisor)
    , m_autostart(autostart)
{
}

CommandResponse<BridgeConfig> CommandFacade::getConfig()
{
    return CommandResponse<BridgeConfig>::ok(m_store.loadConfig());
}

CommandResponse<BridgeConfig> CommandFacade::saveConfig(const BridgeConfig &config)
{
    return respond("saveConfig", m_store.saveConfig(config), config);
}

CommandResponse<BridgeConfig> CommandFacade::updateConfig(const BridgeConfigPatch &patch)
{
    return respond("updateConfig", m_store.updateConfig(patch));
}

CommandResponse<std::vector<AIProviderConfig>> CommandFacade::getProviders()
{
    return CommandResponse<std::vector<AIProviderConfig>>::ok(m_store.providers());
}

CommandResponse<AIProviderConfig> CommandFacade::addProvider(const AIProviderConfig &provider)
{
    return respond("addProvider", m_store.addProvider(provider), provider);
}

CommandResponse<AIProviderConfig> CommandFacade::updateProvider(const AIProviderConfig &provider)
{
    return respond("updateProvider", m_store.updateProvider(provider), provider);
}

CommandResponse<bool> CommandFacade::deleteProvider(const std::string &id)
{
    return respond("deleteProvider", m_store.deleteProvider(id), true);
}

CommandResponse<bool> CommandFacade::testProviderConnection(const AIProviderConfig &provider)
{
    return respond("testProviderConnection", probeProviderConnection(provider));
}

CommandResponse<ValidateProviderResponse> CommandFacade::validateProvider(
    const ValidateProviderRequest &request)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("validateProvider", client.validateProvider(request));
}

CommandResponse<nlohmann::json> CommandFacade::getProviderModels(const std::string &providerId)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("getProviderModels", client.providerModels(providerId));
}

CommandResponse<TestModelResponse> CommandFacade::testModel(const std::string &providerId,
                                                            const TestModelRequest &request)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("testModel", client.testModel(providerId, request));
}

CommandResponse<std::vector<ModelConfig>> CommandFacade::getModels()
{
    return CommandResponse<std::vector<ModelConfig>>::ok(m_store.models());
}

CommandResponse<ModelConfig> CommandFacade::addModel(const ModelConfig &model)
{
    return respond("addModel", m_store.addModel(model), model);
}

CommandResponse<ModelConfig> CommandFacade::updateModel(const ModelConfig &model)
{
    return respond("updateModel", m_store.updateModel(model), model);
}

CommandResponse<bool> CommandFacade::deleteModel(const std::string &id)
{
    return respond("deleteModel", m_store.deleteModel(id), true);
}

CommandResponse<std::vector<McpServerConfig>> CommandFacade::getMcpServers()
{
    return CommandResponse<std::vector<McpServerConfig>>::ok(m_store.mcpServers());
}

CommandResponse<McpServerConfig> CommandFacade::addMcpServer(const McpServerConfig &server)
{
    return respond("addMcpServer", m_store.addMcpServer(server), server);
}

CommandResponse<McpServerConfig> CommandFacade::updateMcpServer(const McpServerConfig &server)
{
    return respond("updateMcpServer", m_store.updateMcpServer(server), server);
}

CommandResponse<bool> CommandFacade::deleteMcpServer(const std::string &id)
{
    // The server may not be running, or the bridge service may be down.
    const BridgeClient client(m_store.loadConfig());
    const Status stopped = client.stopMcpServer(id);
    OBLOG_INFO(QStringLiteral("CommandFacade"),
               QStringLiteral("deleteMcpServer"),
               QStringLiteral("mcp_stop_before_delete"),
               stopped ? QString::fromStdString(toErrorKindString(stopped->kind))
                       : QStringLiteral("stopped"),
               QStringLiteral("bridge_http"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"id", id},
                               {"error", stopped ? nlohmann::json(stopped->message)
                                                 : nlohmann::json(nullptr)}}));

    return respond("deleteMcpServer", m_store.deleteMcpServer(id), true);
}

CommandResponse<std::vector<McpServerStatus>> CommandFacade::getMcpServerStatus()
{
    const BridgeClient client(m_store.loadConfig());
    return respond("getMcpServerStatus", client.mcpServerStatus());
}

CommandResponse<bool> CommandFacade::startMcpServer(const std::string &id)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("startMcpServer", client.startMcpServer(id), true);
}

CommandResponse<bool> CommandFacade::stopMcpServer(const std::string &id)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("stopMcpServer", client.stopMcpServer(id), true);
}

CommandResponse<bool> CommandFacade::restartMcpServer(const std::string &id)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("restartMcpServer", client.restartMcpServer(id), true);
}

CommandResponse<std::vector<McpTool>> CommandFacade::getMcpServerTools(const std::string &id)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("getMcpServerTools", client.mcpServerTools(id));
}

CommandResponse<std::vector<LogEntry>> CommandFacade::getLogs(std::optional<std::uint32_t> limit,
                                                              const std::optional<std::string> &level)
{
    const BridgeClient client(m_store.loadConfig());
    return respond("getLogs", client.logs(limit, level));
}

CommandResponse<BridgeStatus> CommandFacade::getBridgeStatus()
{
    const BridgeConfig config = m_store.loadConfig();
    const BridgeClient client(config);

    BridgeStatus status;
    status.port = config.port;
    status.url = client.baseUrl().toStdString();

    const Result<HealthReport> health = client.health();
    if (health) {
        status.running = true;
        status.uptime = health.value().uptime;
    } else {
        OBLOG_DEBUG(QStringLiteral("CommandFacade"),
                    QStringLiteral("getBridgeStatus"),
                    QStringLiteral("bridge_not_answering"),
                    QString::fromStdString(toErrorKindString(health.error().kind)),
                    QStringLiteral("bridge_http"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", health.error().message}}));
    }
    return CommandResponse<BridgeStatus>::ok(status);
}

CommandResponse<bool> CommandFacade::startBridgeService()
{
    return respond("startBridgeService", m_supervisor.start(), true);
}

CommandResponse<bool> CommandFacade::stopBridgeService()
{
    return respond("stopBridgeService", m_supervisor.stop(), true);
}

bool CommandFacade::isBridgeServiceSupervised()
{
    return m_supervisor.isRunning();
}

CommandResponse<bool> CommandFacade::enableAutostart()
{
    return respond("enableAutostart", m_autostart.enable(), true);
}

CommandResponse<bool> CommandFacade::disableAutostart()
{
    return respond("disableAutostart", m_autostart.disable(), true);
}

CommandResponse<bool> CommandFacade::isAutostartEnabled()
{
    return CommandResponse<bool>::ok(m_autostart.isEnabled());
}

} // namespace officebridge
