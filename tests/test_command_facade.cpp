#include <QtTest/QtTest>

#include <QTcpServer>
#include <QTemporaryDir>

#include <memory>

#include <nlohmann/json.hpp>

#include "commands/command_facade.hpp"
#include "config/config_store.hpp"
#include "desktop/autostart.hpp"
#include "fake_http_server.hpp"
#include "supervisor/process_supervisor.hpp"

using namespace officebridge;

namespace {

class IdleChild : public ChildProcess {
public:
    qint64 pid() const override { return 4242; }
    Result<ChildState> tryWait() override { return m_state; }
    Status terminate() override
    {
        m_state = ChildState::Exited;
        return std::nullopt;
    }
    Status kill() override
    {
        m_state = ChildState::Exited;
        return std::nullopt;
    }
    Result<ChildState> waitForExit(int) override { return m_state; }

private:
    ChildState m_state = ChildState::Running;
};

class IdleLauncher : public ProcessLauncher {
public:
    Result<std::unique_ptr<ChildProcess>> spawn(const LaunchCommand &) override
    {
        return std::unique_ptr<ChildProcess>(std::make_unique<IdleChild>());
    }
};

quint16 closedPort()
{
    QTcpServer probe;
    if (!probe.listen(QHostAddress::LocalHost, 0)) {
        return 1;
    }
    const quint16 port = probe.serverPort();
    probe.close();
    return port;
}

} // namespace

class CommandFacadeTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testGetConfigDefaults();
    void testUpdateConfigReturnsMerged();
    void testAddProviderConflict();
    void testDeleteUnknownModel();
    void testResponseEnvelope();
    void testBridgeStatusUnreachable();
    void testBridgeStatusRunning();
    void testBridgeServiceLifecycle();
    void testAutostartCommands();
    void testDeleteMcpServerWithBridgeDown();
    void testProviderConnectionWithoutEndpoint();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_round = 0;

    std::unique_ptr<ConfigStore> m_store;
    std::unique_ptr<ProcessSupervisor> m_supervisor;
    std::unique_ptr<Autostart> m_autostart;
    std::unique_ptr<CommandFacade> m_facade;

    void pointBridgeAt(const std::string &host, quint16 port);
};

void CommandFacadeTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void CommandFacadeTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void CommandFacadeTests::init()
{
    ++m_round;
    const QString root = m_tempDir.path() + QStringLiteral("/round-%1").arg(m_round);
    m_store = std::make_unique<ConfigStore>(root + "/.office-local-bridge");
    m_supervisor = std::make_unique<ProcessSupervisor>(std::make_unique<IdleLauncher>(),
                                                       []() { return LaunchCommand{}; });
    m_autostart = std::make_unique<Autostart>(root + "/autostart",
                                              QStringLiteral("/usr/bin/office-bridge-desktop"));
    m_facade = std::make_unique<CommandFacade>(*m_store, *m_supervisor, *m_autostart);
}

void CommandFacadeTests::cleanup()
{
    m_facade.reset();
    m_autostart.reset();
    m_supervisor.reset();
    m_store.reset();
}

void CommandFacadeTests::pointBridgeAt(const std::string &host, quint16 port)
{
    BridgeConfig config;
    config.host = host;
    config.port = port;
    QVERIFY(m_facade->saveConfig(config).success);
}

void CommandFacadeTests::testGetConfigDefaults()
{
    const auto response = m_facade->getConfig();
    QVERIFY(response.success);
    QVERIFY(!response.error.has_value());
    QCOMPARE(response.data->port, static_cast<std::uint16_t>(3001));
    QCOMPARE(QString::fromStdString(response.data->logLevel), QStringLiteral("info"));
}

void CommandFacadeTests::testUpdateConfigReturnsMerged()
{
    BridgeConfigPatch patch;
    patch.logLevel = "debug";
    const auto response = m_facade->updateConfig(patch);
    QVERIFY(response.success);
    QCOMPARE(QString::fromStdString(response.data->logLevel), QStringLiteral("debug"));
    QCOMPARE(response.data->port, static_cast<std::uint16_t>(3001));
    QCOMPARE(QString::fromStdString(m_facade->getConfig().data->logLevel), QStringLiteral("debug"));
}

void CommandFacadeTests::testAddProviderConflict()
{
    AIProviderConfig provider;
    provider.id = "openai-1";
    provider.name = "OpenAI";
    provider.apiKey = "sk";

    const auto first = m_facade->addProvider(provider);
    QVERIFY(first.success);
    QCOMPARE(QString::fromStdString(first.data->id), QStringLiteral("openai-1"));

    const auto second = m_facade->addProvider(provider);
    QVERIFY(!second.success);
    QVERIFY(!second.data.has_value());
    QCOMPARE(*second.errorKind, ErrorKind::Conflict);
    QVERIFY(QString::fromStdString(*second.error).contains(QStringLiteral("already exists")));

    QCOMPARE(m_facade->getProviders().data->size(), static_cast<size_t>(1));
}

void CommandFacadeTests::testDeleteUnknownModel()
{
    const auto response = m_facade->deleteModel("missing");
    QVERIFY(!response.success);
    QCOMPARE(*response.errorKind, ErrorKind::NotFound);

    ModelConfig model;
    model.id = "m1";
    model.providerId = "openai-1";
    model.name = "gpt-4o";
    QVERIFY(m_facade->addModel(model).success);
    const auto deleted = m_facade->deleteModel("m1");
    QVERIFY(deleted.success);
    QVERIFY(*deleted.data);
}

void CommandFacadeTests::testResponseEnvelope()
{
    const nlohmann::json failure = m_facade->deleteProvider("nope");
    QCOMPARE(failure.value("success", true), false);
    QVERIFY(failure.at("data").is_null());
    QVERIFY(failure.at("error").is_string());
    QVERIFY(!failure.contains("errorKind"));

    const nlohmann::json ok = m_facade->getModels();
    QCOMPARE(ok.value("success", false), true);
    QVERIFY(ok.at("data").is_array());
    QVERIFY(ok.at("error").is_null());
}

void CommandFacadeTests::testBridgeStatusUnreachable()
{
    const quint16 port = closedPort();
    pointBridgeAt("127.0.0.1", port);

    const auto response = callBlocking([this]() { return m_facade->getBridgeStatus(); });
    QVERIFY(response.success);
    QVERIFY(!response.data->running);
    QCOMPARE(response.data->port, port);
    QCOMPARE(QString::fromStdString(response.data->url),
             QStringLiteral("http://127.0.0.1:%1").arg(port));
    QVERIFY(!response.data->uptime.has_value());
}

void CommandFacadeTests::testBridgeStatusRunning()
{
    FakeHttpServer server;
    QVERIFY(server.listen());
    server.route("GET", "/health", 200, R"({"data":{"uptime":{"uptimeSeconds":90}}})");
    pointBridgeAt("127.0.0.1", server.port());

    const auto response = callBlocking([this]() { return m_facade->getBridgeStatus(); });
    QVERIFY(response.success);
    QVERIFY(response.data->running);
    QCOMPARE(*response.data->uptime, static_cast<std::int64_t>(90));

    // Answering /health does not make an externally started service ours.
    QVERIFY(!m_facade->isBridgeServiceSupervised());
    QCOMPARE(*m_facade->stopBridgeService().errorKind, ErrorKind::NotRunning);
}

void CommandFacadeTests::testBridgeServiceLifecycle()
{
    QVERIFY(!m_facade->isBridgeServiceSupervised());
    QVERIFY(m_facade->startBridgeService().success);
    QVERIFY(m_facade->isBridgeServiceSupervised());

    const auto again = m_facade->startBridgeService();
    QVERIFY(!again.success);
    QCOMPARE(*again.errorKind, ErrorKind::AlreadyRunning);

    QVERIFY(m_facade->stopBridgeService().success);
    QVERIFY(!m_facade->isBridgeServiceSupervised());
    const auto stoppedTwice = m_facade->stopBridgeService();
    QVERIFY(!stoppedTwice.success);
    QCOMPARE(*stoppedTwice.errorKind, ErrorKind::NotRunning);
}

void CommandFacadeTests::testAutostartCommands()
{
    QCOMPARE(*m_facade->isAutostartEnabled().data, false);
    QVERIFY(m_facade->enableAutostart().success);
    QCOMPARE(*m_facade->isAutostartEnabled().data, true);
    QVERIFY(m_facade->disableAutostart().success);
    QCOMPARE(*m_facade->isAutostartEnabled().data, false);
}

void CommandFacadeTests::testDeleteMcpServerWithBridgeDown()
{
    pointBridgeAt("127.0.0.1", closedPort());

    McpServerConfig server;
    server.id = "fs";
    server.name = "Filesystem";
    server.command = "npx";
    QVERIFY(m_facade->addMcpServer(server).success);

    const auto deleted = callBlocking([this]() { return m_facade->deleteMcpServer("fs"); });
    QVERIFY(deleted.success);
    QVERIFY(m_facade->getMcpServers().data->empty());

    const auto status = callBlocking([this]() { return m_facade->getMcpServerStatus(); });
    QVERIFY(!status.success);
    QCOMPARE(*status.errorKind, ErrorKind::Unreachable);
}

void CommandFacadeTests::testProviderConnectionWithoutEndpoint()
{
    AIProviderConfig provider;
    provider.id = "custom-1";
    provider.type = ProviderType::Custom;
    provider.name = "Custom";

    const auto response = m_facade->testProviderConnection(provider);
    QVERIFY(!response.success);
    QCOMPARE(*response.errorKind, ErrorKind::InvalidArgument);
}

QTEST_GUILESS_MAIN(CommandFacadeTests)
#include "test_command_facade.moc"
