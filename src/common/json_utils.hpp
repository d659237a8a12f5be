#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace officebridge {

// Thrown by the from_json overloads below when a value has the right JSON type
// but lies outside the accepted set. Callers catch it as nlohmann::json::exception.
class InvalidJsonValue : public nlohmann::json::exception {
public:
    explicit InvalidJsonValue(const std::string &message)
        : nlohmann::json::exception(302, message.c_str())
    {
    }
};

// Absent optionals are written as null; null and missing keys read back as absent.
template <typename T>
void setOptional(nlohmann::json &j, const char *key, const std::optional<T> &value)
{
    if (value.has_value()) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json &j, const char *key)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

inline std::string toProviderTypeString(ProviderType type)
{
    switch (type) {
    case ProviderType::OpenAI:
        return "openai";
    case ProviderType::Azure:
        return "azure";
    case ProviderType::Anthropic:
        return "anthropic";
    case ProviderType::Ollama:
        return "ollama";
    case ProviderType::Custom:
        return "custom";
    }
    return "custom";
}

inline std::optional<ProviderType> parseProviderTypeString(const std::string &value)
{
    if (value == "openai") {
        return ProviderType::OpenAI;
    }
    if (value == "azure") {
        return ProviderType::Azure;
    }
    if (value == "anthropic") {
        return ProviderType::Anthropic;
    }
    if (value == "ollama") {
        return ProviderType::Ollama;
    }
    if (value == "custom") {
        return ProviderType::Custom;
    }
    return std::nullopt;
}

inline std::string toModelTypeString(ModelType type)
{
    switch (type) {
    case ModelType::Chat:
        return "chat";
    case ModelType::Embedding:
        return "embedding";
    case ModelType::Multimodal:
        return "multimodal";
    }
    return "chat";
}

inline std::optional<ModelType> parseModelTypeString(const std::string &value)
{
    if (value == "chat") {
        return ModelType::Chat;
    }
    if (value == "embedding") {
        return ModelType::Embedding;
    }
    if (value == "multimodal") {
        return ModelType::Multimodal;
    }
    return std::nullopt;
}

// Ports outside 0..65535 and non-integers are rejected rather than truncated.
inline std::uint16_t portFromJson(const nlohmann::json &value)
{
    if (!value.is_number_integer()) {
        throw InvalidJsonValue("port is not an integer: " + value.dump());
    }
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > std::numeric_limits<std::uint16_t>::max()) {
            throw InvalidJsonValue("port out of range: " + value.dump());
        }
    } else if (value.get<std::int64_t>() < 0) {
        throw InvalidJsonValue("port out of range: " + value.dump());
    }
    return static_cast<std::uint16_t>(value.get<std::uint64_t>());
}

inline void to_json(nlohmann::json &j, const ProviderType &type)
{
    j = toProviderTypeString(type);
}

inline void from_json(const nlohmann::json &j, ProviderType &type)
{
    const std::optional<ProviderType> parsed = parseProviderTypeString(j.get<std::string>());
    if (!parsed) {
        throw InvalidJsonValue("unknown provider type: " + j.dump());
    }
    type = *parsed;
}

inline void to_json(nlohmann::json &j, const ModelType &type)
{
    j = toModelTypeString(type);
}

inline void from_json(const nlohmann::json &j, ModelType &type)
{
    const std::optional<ModelType> parsed = parseModelTypeString(j.get<std::string>());
    if (!parsed) {
        throw InvalidJsonValue("unknown model type: " + j.dump());
    }
    type = *parsed;
}

inline void to_json(nlohmann::json &j, const BridgeConfig &config)
{
    j = nlohmann::json{
        {"version", config.version},
        {"port", config.port},
        {"host", config.host},
        {"logLevel", config.logLevel},
        {"autoStart", config.autoStart},
        {"minimizeToTray", config.minimizeToTray}
    };
    setOptional(j, "defaultProviderId", config.defaultProviderId);
    setOptional(j, "defaultChatModelId", config.defaultChatModelId);
    setOptional(j, "defaultEmbeddingModelId", config.defaultEmbeddingModelId);
}

inline void from_json(const nlohmann::json &j, BridgeConfig &config)
{
    const BridgeConfig defaults;
    config.version = j.value("version", defaults.version);
    const auto port = j.find("port");
    config.port = port == j.end() ? defaults.port : portFromJson(*port);
    config.host = j.value("host", defaults.host);
    config.logLevel = j.value("logLevel", defaults.logLevel);
    config.defaultProviderId = getOptional<std::string>(j, "defaultProviderId");
    config.defaultChatModelId = getOptional<std::string>(j, "defaultChatModelId");
    config.defaultEmbeddingModelId = getOptional<std::string>(j, "defaultEmbeddingModelId");
    config.autoStart = j.value("autoStart", defaults.autoStart);
    config.minimizeToTray = j.value("minimizeToTray", defaults.minimizeToTray);
}

inline void to_json(nlohmann::json &j, const SelectedModel &model)
{
    j = nlohmann::json{
        {"id", model.id},
        {"name", model.name},
        {"modelType", model.modelType}
    };
    setOptional(j, "displayName", model.displayName);
    setOptional(j, "contextWindow", model.contextWindow);
    setOptional(j, "supportsVision", model.supportsVision);
    setOptional(j, "supportsTools", model.supportsTools);
    setOptional(j, "supportsStreaming", model.supportsStreaming);
}

inline void from_json(const nlohmann::json &j, SelectedModel &model)
{
    model.id = j.value("id", "");
    model.name = j.value("name", "");
    model.displayName = getOptional<std::string>(j, "displayName");
    if (j.contains("modelType")) {
        model.modelType = j.at("modelType").get<ModelType>();
    } else {
        model.modelType = ModelType::Chat;
    }
    model.contextWindow = getOptional<std::int64_t>(j, "contextWindow");
    model.supportsVision = getOptional<bool>(j, "supportsVision");
    model.supportsTools = getOptional<bool>(j, "supportsTools");
    model.supportsStreaming = getOptional<bool>(j, "supportsStreaming");
}

inline void to_json(nlohmann::json &j, const AIProviderConfig &provider)
{
    j = nlohmann::json{
        {"id", provider.id},
        {"type", provider.type},
        {"name", provider.name},
        {"enabled", provider.enabled},
        {"isDefault", provider.isDefault},
        {"apiKey", provider.apiKey}
    };
    setOptional(j, "baseUrl", provider.baseUrl);
    setOptional(j, "azureEndpoint", provider.azureEndpoint);
    setOptional(j, "azureDeployment", provider.azureDeployment);
    setOptional(j, "azureApiVersion", provider.azureApiVersion);
    setOptional(j, "customHeaders", provider.customHeaders);
    setOptional(j, "selectedModels", provider.selectedModels);
    setOptional(j, "connectionStatus", provider.connectionStatus);
    setOptional(j, "lastTestedAt", provider.lastTestedAt);
}

inline void from_json(const nlohmann::json &j, AIProviderConfig &provider)
{
    provider.id = j.value("id", "");
    if (j.contains("type")) {
        provider.type = j.at("type").get<ProviderType>();
    } else {
        provider.type = ProviderType::Custom;
    }
    provider.name = j.value("name", "");
    provider.enabled = j.value("enabled", false);
    provider.isDefault = j.value("isDefault", false);
    provider.apiKey = j.value("apiKey", "");
    provider.baseUrl = getOptional<std::string>(j, "baseUrl");
    provider.azureEndpoint = getOptional<std::string>(j, "azureEndpoint");
    provider.azureDeployment = getOptional<std::string>(j, "azureDeployment");
    provider.azureApiVersion = getOptional<std::string>(j, "azureApiVersion");
    provider.customHeaders =
        getOptional<std::map<std::string, std::string>>(j, "customHeaders");
    provider.selectedModels = getOptional<std::vector<SelectedModel>>(j, "selectedModels");
    provider.connectionStatus = getOptional<std::string>(j, "connectionStatus");
    provider.lastTestedAt = getOptional<std::int64_t>(j, "lastTestedAt");
}

inline void to_json(nlohmann::json &j, const ModelConfig &model)
{
    j = nlohmann::json{
        {"id", model.id},
        {"providerId", model.providerId},
        {"name", model.name},
        {"displayName", model.displayName},
        {"enabled", model.enabled},
        {"isDefault", model.isDefault}
    };
    setOptional(j, "maxTokens", model.maxTokens);
    setOptional(j, "temperature", model.temperature);
    setOptional(j, "topP", model.topP);
    setOptional(j, "frequencyPenalty", model.frequencyPenalty);
    setOptional(j, "presencePenalty", model.presencePenalty);
    setOptional(j, "supportsVision", model.supportsVision);
    setOptional(j, "supportsTools", model.supportsTools);
    setOptional(j, "supportsStreaming", model.supportsStreaming);
    setOptional(j, "contextWindow", model.contextWindow);
}

inline void from_json(const nlohmann::json &j, ModelConfig &model)
{
    model.id = j.value("id", "");
    model.providerId = j.value("providerId", "");
    model.name = j.value("name", "");
    model.displayName = j.value("displayName", "");
    model.enabled = j.value("enabled", false);
    model.isDefault = j.value("isDefault", false);
    model.maxTokens = getOptional<std::int32_t>(j, "maxTokens");
    model.temperature = getOptional<double>(j, "temperature");
    model.topP = getOptional<double>(j, "topP");
    model.frequencyPenalty = getOptional<double>(j, "frequencyPenalty");
    model.presencePenalty = getOptional<double>(j, "presencePenalty");
    model.supportsVision = getOptional<bool>(j, "supportsVision");
    model.supportsTools = getOptional<bool>(j, "supportsTools");
    model.supportsStreaming = getOptional<bool>(j, "supportsStreaming");
    model.contextWindow = getOptional<std::int32_t>(j, "contextWindow");
}

inline void to_json(nlohmann::json &j, const McpServerConfig &server)
{
    j = nlohmann::json{
        {"id", server.id},
        {"name", server.name},
        {"command", server.command},
        {"enabled", server.enabled},
        {"autoStart", server.autoStart}
    };
    setOptional(j, "args", server.args);
    setOptional(j, "cwd", server.cwd);
    setOptional(j, "env", server.env);
}

inline void from_json(const nlohmann::json &j, McpServerConfig &server)
{
    server.id = j.value("id", "");
    server.name = j.value("name", "");
    server.command = j.value("command", "");
    server.args = getOptional<std::vector<std::string>>(j, "args");
    server.cwd = getOptional<std::string>(j, "cwd");
    server.env = getOptional<std::map<std::string, std::string>>(j, "env");
    server.enabled = j.value("enabled", false);
    server.autoStart = j.value("autoStart", false);
}

inline void to_json(nlohmann::json &j, const ProvidersConfig &config)
{
    j = nlohmann::json{{"version", config.version}, {"providers", config.providers}};
}

inline void from_json(const nlohmann::json &j, ProvidersConfig &config)
{
    config.version = j.value("version", 1);
    if (j.contains("providers") && j.at("providers").is_array()) {
        config.providers = j.at("providers").get<std::vector<AIProviderConfig>>();
    } else {
        config.providers.clear();
    }
}

inline void to_json(nlohmann::json &j, const ModelsConfig &config)
{
    j = nlohmann::json{{"version", config.version}, {"models", config.models}};
}

inline void from_json(const nlohmann::json &j, ModelsConfig &config)
{
    config.version = j.value("version", 1);
    if (j.contains("models") && j.at("models").is_array()) {
        config.models = j.at("models").get<std::vector<ModelConfig>>();
    } else {
        config.models.clear();
    }
}

inline void to_json(nlohmann::json &j, const McpServersConfig &config)
{
    j = nlohmann::json{{"version", config.version}, {"servers", config.servers}};
}

inline void from_json(const nlohmann::json &j, McpServersConfig &config)
{
    config.version = j.value("version", 1);
    if (j.contains("servers") && j.at("servers").is_array()) {
        config.servers = j.at("servers").get<std::vector<McpServerConfig>>();
    } else {
        config.servers.clear();
    }
}

inline void to_json(nlohmann::json &j, const McpServerStatus &status)
{
    j = nlohmann::json{
        {"id", status.id},
        {"name", status.name},
        {"status", status.status}
    };
    setOptional(j, "pid", status.pid);
    setOptional(j, "startTime", status.startTime);
    setOptional(j, "lastError", status.lastError);
    setOptional(j, "toolCount", status.toolCount);
}

inline void from_json(const nlohmann::json &j, McpServerStatus &status)
{
    status.id = j.value("id", "");
    status.name = j.value("name", "");
    status.status = j.value("status", "stopped");
    status.pid = getOptional<std::uint32_t>(j, "pid");
    status.startTime = getOptional<std::int64_t>(j, "startTime");
    status.lastError = getOptional<std::string>(j, "lastError");
    status.toolCount = getOptional<std::int32_t>(j, "toolCount");
}

inline void to_json(nlohmann::json &j, const McpTool &tool)
{
    j = nlohmann::json{
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.inputSchema}
    };
    setOptional(j, "category", tool.category);
}

inline void from_json(const nlohmann::json &j, McpTool &tool)
{
    tool.name = j.value("name", "");
    tool.description = j.value("description", "");
    if (j.contains("inputSchema")) {
        tool.inputSchema = j.at("inputSchema");
    } else {
        tool.inputSchema = nullptr;
    }
    tool.category = getOptional<std::string>(j, "category");
}

inline void to_json(nlohmann::json &j, const LogEntry &entry)
{
    j = nlohmann::json{
        {"timestamp", entry.timestamp},
        {"level", entry.level},
        {"module", entry.module},
        {"message", entry.message}
    };
    setOptional(j, "data", entry.data);
}

inline void from_json(const nlohmann::json &j, LogEntry &entry)
{
    entry.timestamp = j.value("timestamp", static_cast<std::int64_t>(0));
    entry.level = j.value("level", "");
    entry.module = j.value("module", "");
    entry.message = j.value("message", "");
    entry.data = getOptional<nlohmann::json>(j, "data");
}

inline void to_json(nlohmann::json &j, const ModelInfo &model)
{
    j = nlohmann::json{{"id", model.id}, {"name", model.name}};
    setOptional(j, "description", model.description);
    setOptional(j, "contextWindow", model.contextWindow);
    setOptional(j, "supportsVision", model.supportsVision);
    setOptional(j, "supportsTools", model.supportsTools);
    setOptional(j, "supportsStreaming", model.supportsStreaming);
}

inline void from_json(const nlohmann::json &j, ModelInfo &model)
{
    model.id = j.value("id", "");
    model.name = j.value("name", "");
    model.description = getOptional<std::string>(j, "description");
    model.contextWindow = getOptional<std::int64_t>(j, "contextWindow");
    model.supportsVision = getOptional<bool>(j, "supportsVision");
    model.supportsTools = getOptional<bool>(j, "supportsTools");
    model.supportsStreaming = getOptional<bool>(j, "supportsStreaming");
}

inline void to_json(nlohmann::json &j, const ValidateProviderRequest &request)
{
    j = nlohmann::json{{"type", request.type}, {"apiKey", request.apiKey}};
    setOptional(j, "baseUrl", request.baseUrl);
    setOptional(j, "azureEndpoint", request.azureEndpoint);
    setOptional(j, "azureDeployment", request.azureDeployment);
    setOptional(j, "azureApiVersion", request.azureApiVersion);
}

inline void from_json(const nlohmann::json &j, ValidateProviderRequest &request)
{
    if (j.contains("type")) {
        request.type = j.at("type").get<ProviderType>();
    } else {
        request.type = ProviderType::Custom;
    }
    request.apiKey = j.value("apiKey", "");
    request.baseUrl = getOptional<std::string>(j, "baseUrl");
    request.azureEndpoint = getOptional<std::string>(j, "azureEndpoint");
    request.azureDeployment = getOptional<std::string>(j, "azureDeployment");
    request.azureApiVersion = getOptional<std::string>(j, "azureApiVersion");
}

inline void to_json(nlohmann::json &j, const ValidateProviderResponse &response)
{
    j = nlohmann::json{{"valid", response.valid}};
    setOptional(j, "error", response.error);
    setOptional(j, "models", response.models);
}

inline void from_json(const nlohmann::json &j, ValidateProviderResponse &response)
{
    response.valid = j.value("valid", false);
    response.error = getOptional<std::string>(j, "error");
    response.models = getOptional<std::vector<ModelInfo>>(j, "models");
}

inline void to_json(nlohmann::json &j, const TestModelRequest &request)
{
    j = nlohmann::json{{"modelId", request.modelId}};
    setOptional(j, "testMessage", request.testMessage);
}

inline void from_json(const nlohmann::json &j, TestModelRequest &request)
{
    request.modelId = j.value("modelId", "");
    request.testMessage = getOptional<std::string>(j, "testMessage");
}

inline void to_json(nlohmann::json &j, const TestModelResponse &response)
{
    j = nlohmann::json{{"success", response.success}};
    setOptional(j, "response", response.response);
    setOptional(j, "latency", response.latency);
    setOptional(j, "error", response.error);
}

inline void from_json(const nlohmann::json &j, TestModelResponse &response)
{
    response.success = j.value("success", false);
    response.response = getOptional<std::string>(j, "response");
    response.latency = getOptional<std::int64_t>(j, "latency");
    response.error = getOptional<std::string>(j, "error");
}

inline void to_json(nlohmann::json &j, const BridgeStatus &status)
{
    j = nlohmann::json{
        {"running", status.running},
        {"port", status.port},
        {"url", status.url}
    };
    setOptional(j, "uptime", status.uptime);
}

inline void from_json(const nlohmann::json &j, BridgeStatus &status)
{
    status.running = j.value("running", false);
    const auto port = j.find("port");
    status.port = port == j.end() ? static_cast<std::uint16_t>(0) : portFromJson(*port);
    status.url = j.value("url", "");
    status.uptime = getOptional<std::int64_t>(j, "uptime");
}

} // namespace officebridge
