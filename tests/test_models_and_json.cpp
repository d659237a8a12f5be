#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

using namespace officebridge;

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testBridgeConfigDefaults();
    void testBridgeConfigWritesNullOptionals();
    void testProviderRoundTrip();
    void testProviderTypeStrings();
    void testUnknownEnumStringsRejected();
    void testPortOutOfRangeRejected();
    void testModelConfigKeys();
    void testMcpServerRoundTrip();
    void testMcpStatusMissingFields();
    void testCollectionDocuments();
    void testLogEntryData();
};

void ModelsJsonTests::testBridgeConfigDefaults()
{
    const auto config = nlohmann::json::object().get<BridgeConfig>();
    QCOMPARE(config.version, 1);
    QCOMPARE(config.port, static_cast<std::uint16_t>(3001));
    QCOMPARE(QString::fromStdString(config.host), QStringLiteral("localhost"));
    QCOMPARE(QString::fromStdString(config.logLevel), QStringLiteral("info"));
    QVERIFY(config.autoStart);
    QVERIFY(config.minimizeToTray);
    QVERIFY(!config.defaultProviderId.has_value());

    const auto partial = nlohmann::json{{"port", 4100}, {"defaultProviderId", nullptr}}
                             .get<BridgeConfig>();
    QCOMPARE(partial.port, static_cast<std::uint16_t>(4100));
    QVERIFY(!partial.defaultProviderId.has_value());
}

void ModelsJsonTests::testBridgeConfigWritesNullOptionals()
{
    BridgeConfig config;
    config.defaultChatModelId = "openai-1:gpt-4o";

    const nlohmann::json j = config;
    QVERIFY(j.contains("defaultProviderId"));
    QVERIFY(j.at("defaultProviderId").is_null());
    QCOMPARE(QString::fromStdString(j.value("defaultChatModelId", "")),
             QStringLiteral("openai-1:gpt-4o"));
    QVERIFY(j.contains("minimizeToTray"));
    QVERIFY(!j.contains("default_chat_model_id"));
}

void ModelsJsonTests::testProviderRoundTrip()
{
    AIProviderConfig provider;
    provider.id = "azure-1";
    provider.type = ProviderType::Azure;
    provider.name = "Work Azure";
    provider.enabled = true;
    provider.apiKey = "secret";
    provider.azureEndpoint = "https://example.openai.azure.com";
    provider.azureDeployment = "gpt4";
    provider.customHeaders = std::map<std::string, std::string>{{"X-Team", "office"}};

    SelectedModel selected;
    selected.id = "gpt-4o";
    selected.name = "GPT-4o";
    selected.modelType = ModelType::Multimodal;
    selected.contextWindow = 128000;
    provider.selectedModels = std::vector<SelectedModel>{selected};

    const nlohmann::json j = provider;
    QCOMPARE(QString::fromStdString(j.value("type", "")), QStringLiteral("azure"));
    QVERIFY(j.contains("isDefault"));
    QVERIFY(j.at("baseUrl").is_null());
    QCOMPARE(QString::fromStdString(j["selectedModels"][0].value("modelType", "")),
             QStringLiteral("multimodal"));

    const auto parsed = j.get<AIProviderConfig>();
    QCOMPARE(QString::fromStdString(parsed.id), QStringLiteral("azure-1"));
    QCOMPARE(parsed.type, ProviderType::Azure);
    QVERIFY(parsed.enabled);
    QVERIFY(!parsed.baseUrl.has_value());
    QCOMPARE(QString::fromStdString(parsed.customHeaders->at("X-Team")), QStringLiteral("office"));
    QCOMPARE(parsed.selectedModels->size(), static_cast<size_t>(1));
    QCOMPARE(parsed.selectedModels->front().modelType, ModelType::Multimodal);
    QCOMPARE(*parsed.selectedModels->front().contextWindow, static_cast<std::int64_t>(128000));
}

void ModelsJsonTests::testProviderTypeStrings()
{
    QCOMPARE(*parseProviderTypeString("openai"), ProviderType::OpenAI);
    QCOMPARE(*parseProviderTypeString("anthropic"), ProviderType::Anthropic);
    QCOMPARE(*parseProviderTypeString("ollama"), ProviderType::Ollama);
    QCOMPARE(*parseProviderTypeString("custom"), ProviderType::Custom);
    QVERIFY(!parseProviderTypeString("gemini").has_value());
    QCOMPARE(QString::fromStdString(toProviderTypeString(ProviderType::Ollama)),
             QStringLiteral("ollama"));
    QCOMPARE(*parseModelTypeString("embedding"), ModelType::Embedding);
    QCOMPARE(*parseModelTypeString("chat"), ModelType::Chat);
    QVERIFY(!parseModelTypeString("").has_value());
}

void ModelsJsonTests::testUnknownEnumStringsRejected()
{
    const nlohmann::json provider = {
        {"id", "g1"}, {"type", "gemini"}, {"name", "Gemini"}, {"apiKey", "k"}
    };
    QVERIFY_THROWS_EXCEPTION(nlohmann::json::exception, provider.get<AIProviderConfig>());

    const nlohmann::json numericType = {{"id", "g1"}, {"type", 3}, {"name", "Gemini"}};
    QVERIFY_THROWS_EXCEPTION(nlohmann::json::exception, numericType.get<AIProviderConfig>());

    const nlohmann::json selected = {{"id", "x"}, {"name", "x"}, {"modelType", "audio"}};
    QVERIFY_THROWS_EXCEPTION(nlohmann::json::exception, selected.get<SelectedModel>());

    // A missing type still falls back to custom.
    const auto untyped = nlohmann::json{{"id", "c1"}, {"name", "Mine"}}.get<AIProviderConfig>();
    QCOMPARE(untyped.type, ProviderType::Custom);
}

void ModelsJsonTests::testPortOutOfRangeRejected()
{
    QVERIFY_THROWS_EXCEPTION(nlohmann::json::exception,
                             (nlohmann::json{{"port", 70000}}.get<BridgeConfig>()));
    QVERIFY_THROWS_EXCEPTION(nlohmann::json::exception,
                             (nlohmann::json{{"port", -1}}.get<BridgeConfig>()));
    QVERIFY_THROWS_EXCEPTION(nlohmann::json::exception,
                             (nlohmann::json{{"port", "3001"}}.get<BridgeConfig>()));
    QCOMPARE(nlohmann::json{{"port", 65535}}.get<BridgeConfig>().port,
             static_cast<std::uint16_t>(65535));
}

void ModelsJsonTests::testModelConfigKeys()
{
    ModelConfig model;
    model.id = "m1";
    model.providerId = "openai-1";
    model.name = "gpt-4o-mini";
    model.displayName = "GPT-4o mini";
    model.maxTokens = 4096;
    model.temperature = 0.7;
    model.topP = 0.9;

    const nlohmann::json j = model;
    QCOMPARE(QString::fromStdString(j.value("providerId", "")), QStringLiteral("openai-1"));
    QCOMPARE(j.value("maxTokens", 0), 4096);
    QVERIFY(j.at("presencePenalty").is_null());
    QCOMPARE(j.at("temperature").dump(), std::string("0.7"));
    QCOMPARE(j.at("topP").dump(), std::string("0.9"));

    // Values the UI sends come back with the same decimal text.
    const auto fromUi = nlohmann::json::parse(R"({"id":"m2","temperature":0.7})").get<ModelConfig>();
    QCOMPARE(nlohmann::json(fromUi).at("temperature").dump(), std::string("0.7"));

    const auto parsed = j.get<ModelConfig>();
    QCOMPARE(*parsed.maxTokens, 4096);
    QCOMPARE(*parsed.temperature, 0.7);
    QVERIFY(!parsed.contextWindow.has_value());
}

void ModelsJsonTests::testMcpServerRoundTrip()
{
    McpServerConfig server;
    server.id = "fs";
    server.name = "Filesystem";
    server.command = "npx";
    server.args = std::vector<std::string>{"-y", "@modelcontextprotocol/server-filesystem"};
    server.env = std::map<std::string, std::string>{{"DEBUG", "1"}};
    server.autoStart = true;

    const auto parsed = nlohmann::json(server).get<McpServerConfig>();
    QCOMPARE(QString::fromStdString(parsed.command), QStringLiteral("npx"));
    QCOMPARE(parsed.args->size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(parsed.env->at("DEBUG")), QStringLiteral("1"));
    QVERIFY(!parsed.cwd.has_value());
    QVERIFY(parsed.autoStart);
    QVERIFY(!parsed.enabled);
}

void ModelsJsonTests::testMcpStatusMissingFields()
{
    const auto status = nlohmann::json{{"id", "fs"}, {"name", "Filesystem"}, {"pid", 4242}}
                            .get<McpServerStatus>();
    QCOMPARE(QString::fromStdString(status.status), QStringLiteral("stopped"));
    QCOMPARE(*status.pid, static_cast<std::uint32_t>(4242));
    QVERIFY(!status.toolCount.has_value());

    const auto tool = nlohmann::json{{"name", "read_file"}}.get<McpTool>();
    QVERIFY(tool.inputSchema.is_null());
    QVERIFY(tool.description.empty());
}

void ModelsJsonTests::testCollectionDocuments()
{
    const auto providers = nlohmann::json{{"version", 1}, {"providers", "oops"}}
                               .get<ProvidersConfig>();
    QVERIFY(providers.providers.empty());

    McpServersConfig servers;
    servers.servers.push_back(McpServerConfig{});
    const nlohmann::json j = servers;
    QVERIFY(j.at("servers").is_array());
    QCOMPARE(j.at("servers").size(), static_cast<size_t>(1));
    QCOMPARE(j.value("version", 0), 1);
}

void ModelsJsonTests::testLogEntryData()
{
    const auto withData = nlohmann::json{{"timestamp", 1700000000000},
                                         {"level", "warn"},
                                         {"module", "mcp"},
                                         {"message", "restarting"},
                                         {"data", {{"attempt", 2}}}}
                              .get<LogEntry>();
    QCOMPARE(withData.timestamp, static_cast<std::int64_t>(1700000000000));
    QVERIFY(withData.data.has_value());
    QCOMPARE((*withData.data).value("attempt", 0), 2);

    const auto withoutData = nlohmann::json{{"level", "info"}}.get<LogEntry>();
    QVERIFY(!withoutData.data.has_value());
    QCOMPARE(withoutData.timestamp, static_cast<std::int64_t>(0));
}

QTEST_GUILESS_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
