#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "config/config_store.hpp"

using namespace officebridge;

class ConfigStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDefaultsWhenMissing();
    void testMalformedDocumentDefaults();
    void testSaveWritesPrettyJson();
    void testUpdateConfigPatch();
    void testProviderConflicts();
    void testProviderUpdateAndDelete();
    void testModelsAllowDuplicateNames();
    void testMcpServerCollection();
    void testMcpServerRenameClash();
    void testWriteFailureReportsIo();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::unique_ptr<ConfigStore> m_store;
    int m_round = 0;

    static AIProviderConfig makeProvider(const std::string &id, const std::string &name);
    static nlohmann::json readJson(const QString &path);
};

void ConfigStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigStoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigStoreTests::init()
{
    ++m_round;
    m_store = std::make_unique<ConfigStore>(
        m_tempDir.path() + QStringLiteral("/round-%1/.office-local-bridge").arg(m_round));
}

AIProviderConfig ConfigStoreTests::makeProvider(const std::string &id, const std::string &name)
{
    AIProviderConfig provider;
    provider.id = id;
    provider.name = name;
    provider.type = ProviderType::OpenAI;
    provider.apiKey = "sk-test";
    provider.enabled = true;
    return provider;
}

nlohmann::json ConfigStoreTests::readJson(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nullptr;
    }
    return nlohmann::json::parse(file.readAll().toStdString());
}

void ConfigStoreTests::testDefaultsWhenMissing()
{
    QCOMPARE(ConfigStore::defaultConfigDir(), m_tempDir.path() + "/.office-local-bridge");

    const BridgeConfig config = m_store->loadConfig();
    QCOMPARE(config.port, static_cast<std::uint16_t>(3001));
    QCOMPARE(QString::fromStdString(config.host), QStringLiteral("localhost"));
    QVERIFY(m_store->providers().empty());
    QVERIFY(m_store->models().empty());
    QVERIFY(m_store->mcpServers().empty());
    QVERIFY(!QFile::exists(m_store->configPath()));
}

void ConfigStoreTests::testMalformedDocumentDefaults()
{
    QVERIFY(!m_store->saveConfig(BridgeConfig{}));

    QFile config(m_store->configPath());
    QVERIFY(config.open(QIODevice::WriteOnly | QIODevice::Truncate));
    config.write("{\"port\": 4000,");
    config.close();
    QCOMPARE(m_store->loadConfig().port, static_cast<std::uint16_t>(3001));

    QFile providers(m_store->providersPath());
    QVERIFY(providers.open(QIODevice::WriteOnly | QIODevice::Truncate));
    providers.write("{\"version\": 1, \"providers\": [{\"id\": 5}]}");
    providers.close();
    QVERIFY(m_store->providers().empty());
}

void ConfigStoreTests::testSaveWritesPrettyJson()
{
    BridgeConfig config;
    config.port = 3100;
    config.defaultProviderId = "openai-1";
    QVERIFY(!m_store->saveConfig(config));

    QFile file(m_store->configPath());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray text = file.readAll();
    QVERIFY(text.contains("\n  \"port\": 3100"));

    const BridgeConfig loaded = m_store->loadConfig();
    QCOMPARE(loaded.port, static_cast<std::uint16_t>(3100));
    QCOMPARE(QString::fromStdString(*loaded.defaultProviderId), QStringLiteral("openai-1"));
}

void ConfigStoreTests::testUpdateConfigPatch()
{
    BridgeConfig initial;
    initial.defaultProviderId = "openai-1";
    QVERIFY(!m_store->saveConfig(initial));

    const auto patch = parseBridgeConfigPatch(
        nlohmann::json{{"port", 3002}, {"defaultProviderId", nullptr}, {"autoStart", "yes"}});
    const Result<BridgeConfig> updated = m_store->updateConfig(patch);
    QVERIFY(updated.ok());
    QCOMPARE(updated.value().port, static_cast<std::uint16_t>(3002));
    QVERIFY(!updated.value().defaultProviderId.has_value());
    QVERIFY(updated.value().autoStart);

    const nlohmann::json onDisk = readJson(m_store->configPath());
    QCOMPARE(onDisk.value("port", 0), 3002);
    QVERIFY(onDisk.at("defaultProviderId").is_null());
}

void ConfigStoreTests::testProviderConflicts()
{
    QVERIFY(!m_store->addProvider(makeProvider("openai-1", "OpenAI")));

    const Status duplicateId = m_store->addProvider(makeProvider("openai-1", "Other"));
    QVERIFY(duplicateId.has_value());
    QCOMPARE(duplicateId->kind, ErrorKind::Conflict);
    QVERIFY(QString::fromStdString(duplicateId->message).contains(QStringLiteral("openai-1")));

    const Status duplicateName = m_store->addProvider(makeProvider("openai-2", "OpenAI"));
    QVERIFY(duplicateName.has_value());
    QCOMPARE(duplicateName->kind, ErrorKind::Conflict);

    const nlohmann::json onDisk = readJson(m_store->providersPath());
    QCOMPARE(onDisk.at("providers").size(), static_cast<size_t>(1));
    QCOMPARE(onDisk.value("version", 0), 1);
}

void ConfigStoreTests::testProviderUpdateAndDelete()
{
    QVERIFY(!m_store->addProvider(makeProvider("a", "Alpha")));
    QVERIFY(!m_store->addProvider(makeProvider("b", "Beta")));

    AIProviderConfig renamed = makeProvider("a", "Alpha");
    renamed.apiKey = "sk-rotated";
    QVERIFY(!m_store->updateProvider(renamed));

    const Status clash = m_store->updateProvider(makeProvider("a", "Beta"));
    QVERIFY(clash.has_value());
    QCOMPARE(clash->kind, ErrorKind::Conflict);

    const Status missing = m_store->updateProvider(makeProvider("zzz", "Zed"));
    QVERIFY(missing.has_value());
    QCOMPARE(missing->kind, ErrorKind::NotFound);

    const auto providers = m_store->providers();
    QCOMPARE(providers.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(providers.front().apiKey), QStringLiteral("sk-rotated"));

    QVERIFY(!m_store->deleteProvider("a"));
    const Status deletedTwice = m_store->deleteProvider("a");
    QVERIFY(deletedTwice.has_value());
    QCOMPARE(deletedTwice->kind, ErrorKind::NotFound);
    QCOMPARE(m_store->providers().size(), static_cast<size_t>(1));
}

void ConfigStoreTests::testModelsAllowDuplicateNames()
{
    ModelConfig first;
    first.id = "m1";
    first.providerId = "openai-1";
    first.name = "gpt-4o";
    ModelConfig second = first;
    second.id = "m2";

    QVERIFY(!m_store->addModel(first));
    QVERIFY(!m_store->addModel(second));
    QCOMPARE(m_store->models().size(), static_cast<size_t>(2));

    const Status duplicate = m_store->addModel(first);
    QVERIFY(duplicate.has_value());
    QCOMPARE(duplicate->kind, ErrorKind::Conflict);

    second.maxTokens = 2048;
    QVERIFY(!m_store->updateModel(second));
    QCOMPARE(*m_store->models().back().maxTokens, 2048);

    QVERIFY(!m_store->deleteModel("m1"));
    QCOMPARE(m_store->deleteModel("m1")->kind, ErrorKind::NotFound);
}

void ConfigStoreTests::testMcpServerCollection()
{
    McpServerConfig server;
    server.id = "fs";
    server.name = "Filesystem";
    server.command = "npx";
    QVERIFY(!m_store->addMcpServer(server));

    McpServerConfig sameName = server;
    sameName.id = "fs-2";
    QCOMPARE(m_store->addMcpServer(sameName)->kind, ErrorKind::Conflict);

    server.enabled = true;
    QVERIFY(!m_store->updateMcpServer(server));
    QVERIFY(m_store->mcpServers().front().enabled);

    const nlohmann::json onDisk = readJson(m_store->mcpServersPath());
    QVERIFY(onDisk.contains("servers"));

    QVERIFY(!m_store->deleteMcpServer("fs"));
    QVERIFY(m_store->mcpServers().empty());
}

void ConfigStoreTests::testMcpServerRenameClash()
{
    McpServerConfig files;
    files.id = "fs";
    files.name = "Filesystem";
    files.command = "npx";
    McpServerConfig search;
    search.id = "search";
    search.name = "Search";
    search.command = "uvx";
    QVERIFY(!m_store->addMcpServer(files));
    QVERIFY(!m_store->addMcpServer(search));

    QFile before(m_store->mcpServersPath());
    QVERIFY(before.open(QIODevice::ReadOnly));
    const QByteArray bytesBefore = before.readAll();
    before.close();

    McpServerConfig clash = search;
    clash.name = "Filesystem";
    const Status status = m_store->updateMcpServer(clash);
    QVERIFY(status.has_value());
    QCOMPARE(status->kind, ErrorKind::Conflict);

    QFile after(m_store->mcpServersPath());
    QVERIFY(after.open(QIODevice::ReadOnly));
    QCOMPARE(after.readAll(), bytesBefore);
    after.close();

    // Keeping its own name is not a clash.
    search.command = "npx";
    QVERIFY(!m_store->updateMcpServer(search));
    const auto servers = m_store->mcpServers();
    QCOMPARE(servers.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(servers.back().name), QStringLiteral("Search"));
    QCOMPARE(QString::fromStdString(servers.back().command), QStringLiteral("npx"));
}

void ConfigStoreTests::testWriteFailureReportsIo()
{
    // A regular file where the config directory should be.
    const QString blocker = m_tempDir.path() + QStringLiteral("/blocker-%1").arg(m_round);
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();

    const ConfigStore store(blocker + QStringLiteral("/nested"));
    const Status status = store.saveConfig(BridgeConfig{});
    QVERIFY(status.has_value());
    QCOMPARE(status->kind, ErrorKind::IoFailure);
    QVERIFY(!status->message.empty());
}

QTEST_GUILESS_MAIN(ConfigStoreTests)
#include "test_config_store.moc"
