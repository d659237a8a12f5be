#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace officebridge {

// Main settings document (config.json).
struct BridgeConfig {
    int version = 1;
    std::uint16_t port = 3001;
    std::string host = "localhost";
    std::string logLevel = "info";
    std::optional<std::string> defaultProviderId;
    // "providerId:modelId"
    std::optional<std::string> defaultChatModelId;
    std::optional<std::string> defaultEmbeddingModelId;
    bool autoStart = true;
    bool minimizeToTray = true;
};

struct SelectedModel {
    std::string id;
    std::string name;
    std::optional<std::string> displayName;
    ModelType modelType = ModelType::Chat;
    std::optional<std::int64_t> contextWindow;
    std::optional<bool> supportsVision;
    std::optional<bool> supportsTools;
    std::optional<bool> supportsStreaming;
};

struct AIProviderConfig {
    std::string id;
    ProviderType type = ProviderType::OpenAI;
    std::string name;
    bool enabled = false;
    bool isDefault = false;
    std::string apiKey;
    std::optional<std::string> baseUrl;

    std::optional<std::string> azureEndpoint;
    std::optional<std::string> azureDeployment;
    std::optional<std::string> azureApiVersion;

    std::optional<std::map<std::string, std::string>> customHeaders;
    std::optional<std::vector<SelectedModel>> selectedModels;

    std::optional<std::string> connectionStatus;
    std::optional<std::int64_t> lastTestedAt;
};

struct ModelConfig {
    std::string id;
    std::string providerId;
    std::string name;
    std::string displayName;
    bool enabled = false;
    bool isDefault = false;

    std::optional<std::int32_t> maxTokens;
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<double> frequencyPenalty;
    std::optional<double> presencePenalty;

    std::optional<bool> supportsVision;
    std::optional<bool> supportsTools;
    std::optional<bool> supportsStreaming;

    std::optional<std::int32_t> contextWindow;
};

// Persisted MCP server definition. Live status comes from the bridge service.
struct McpServerConfig {
    std::string id;
    std::string name;
    std::string command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::string> cwd;
    std::optional<std::map<std::string, std::string>> env;
    bool enabled = false;
    bool autoStart = false;
};

struct ProvidersConfig {
    int version = 1;
    std::vector<AIProviderConfig> providers;
};

struct ModelsConfig {
    int version = 1;
    std::vector<ModelConfig> models;
};

struct McpServersConfig {
    int version = 1;
    std::vector<McpServerConfig> servers;
};

struct McpServerStatus {
    std::string id;
    std::string name;
    std::string status;
    std::optional<std::uint32_t> pid;
    std::optional<std::int64_t> startTime;
    std::optional<std::string> lastError;
    std::optional<std::int32_t> toolCount;
};

struct McpTool {
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    std::optional<std::string> category;
};

struct LogEntry {
    std::int64_t timestamp = 0;
    std::string level;
    std::string module;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct ModelInfo {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::int64_t> contextWindow;
    std::optional<bool> supportsVision;
    std::optional<bool> supportsTools;
    std::optional<bool> supportsStreaming;
};

struct ValidateProviderRequest {
    ProviderType type = ProviderType::OpenAI;
    std::string apiKey;
    std::optional<std::string> baseUrl;
    std::optional<std::string> azureEndpoint;
    std::optional<std::string> azureDeployment;
    std::optional<std::string> azureApiVersion;
};

struct ValidateProviderResponse {
    bool valid = false;
    std::optional<std::string> error;
    std::optional<std::vector<ModelInfo>> models;
};

struct TestModelRequest {
    std::string modelId;
    std::optional<std::string> testMessage;
};

struct TestModelResponse {
    bool success = false;
    std::optional<std::string> response;
    std::optional<std::int64_t> latency;
    std::optional<std::string> error;
};

struct BridgeStatus {
    bool running = false;
    std::uint16_t port = 0;
    std::string url;
    std::optional<std::int64_t> uptime;
};

} // namespace officebridge
