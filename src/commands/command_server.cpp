#include "commands/command_server.hpp"

#include <chrono>
#include <limits>
#include <optional>
#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QPointer>
#include <QStandardPaths>
#include <QUuid>
#include <QtConcurrent/QtConcurrentRun>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "config/config_patch.hpp"

namespace officebridge {

namespace {

// Raised while decoding params; reported to the client as a protocol error.
class InvalidParams : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[noreturn]] void rejectParam(const char *key)
{
    throw InvalidParams(std::string("Missing or invalid parameter: ") + key);
}

const nlohmann::json &requireObject(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_object()) {
        rejectParam(key);
    }
    return *it;
}

std::string requireString(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        rejectParam(key);
    }
    return it->get<std::string>();
}

template <typename T>
T requireTyped(const nlohmann::json &params, const char *key)
{
    const nlohmann::json &object = requireObject(params, key);
    try {
        return object.get<T>();
    } catch (const nlohmann::json::exception &) {
        rejectParam(key);
    }
}

std::optional<std::uint32_t> optionalLimit(const nlohmann::json &params)
{
    const auto it = params.find("limit");
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_unsigned()
        || it->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        rejectParam("limit");
    }
    return static_cast<std::uint32_t>(it->get<std::uint64_t>());
}

std::optional<std::string> optionalLevel(const nlohmann::json &params)
{
    const auto it = params.find("level");
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        rejectParam("level");
    }
    return it->get<std::string>();
}

bool isTruncatedJson(const QByteArray &buffer)
{
    try {
        (void)nlohmann::json::parse(buffer.constData(), buffer.constData() + buffer.size());
        return false;
    } catch (const nlohmann::json::parse_error &ex) {
        // The lexer reports one byte past the input when it ran out of data.
        return ex.byte > static_cast<std::size_t>(buffer.size());
    }
}

qint64 elapsedMs(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

CommandServer::CommandServer(CommandFacade &facade, QObject *parent)
    : QObject(parent)
    , m_facade(facade)
{
    registerHandlers();
}

CommandServer::~CommandServer()
{
    // Workers reference the facade and the handler table.
    m_pool.waitForDone();
}

QString CommandServer::socketPath()
{
    const QString socketName = qEnvironmentVariable("OFFICE_BRIDGE_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QDir::tempPath();
    }
    return runtimeDir + QStringLiteral("/office-bridge.sock");
}

bool CommandServer::start()
{
    const QString path = socketPath();
    if (path.contains(QLatin1Char('/'))) {
        const QFileInfo socketInfo(path);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            OBLOG_ERROR(QStringLiteral("CommandServer"),
                        QStringLiteral("start"),
                        QStringLiteral("socket_dir_create_failed"),
                        QStringLiteral("mkpath_failed"),
                        QStringLiteral("filesystem"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"dir", socketInfo.absolutePath().toStdString()}}));
            return false;
        }

        if (QFile::exists(path) && !QLocalServer::removeServer(path)) {
            OBLOG_ERROR(QStringLiteral("CommandServer"),
                        QStringLiteral("start"),
                        QStringLiteral("stale_socket_remove_failed"),
                        QStringLiteral("remove_failed"),
                        QStringLiteral("filesystem"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"socket", path.toStdString()}}));
            return false;
        }
    } else {
        QLocalServer::removeServer(path);
    }

    m_server.setSocketOptions(QLocalServer::UserAccessOption);
    if (!m_server.listen(path)) {
        OBLOG_ERROR(QStringLiteral("CommandServer"),
                    QStringLiteral("start"),
                    QStringLiteral("listen_failed"),
                    QStringLiteral("local_server_error"),
                    QStringLiteral("qlocalserver"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"socket", path.toStdString()},
                                    {"error", m_server.errorString().toStdString()}}));
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &CommandServer::handleNewConnection);

    OBLOG_INFO(QStringLiteral("CommandServer"),
               QStringLiteral("start"),
               QStringLiteral("command_server_listening"),
               QStringLiteral("startup"),
               QStringLiteral("qlocalserver"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"socket", m_server.fullServerName().toStdString()},
                               {"maxThreads", m_pool.maxThreadCount()}}));
    return true;
}

QString CommandServer::listeningPath() const
{
    return m_server.fullServerName();
}

QThreadPool &CommandServer::threadPool()
{
    return m_pool;
}

void CommandServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &CommandServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() {
            m_buffers.remove(socket);
            socket->deleteLater();
        });
    }
}

void CommandServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    QByteArray &buffer = m_buffers[socket];
    buffer.append(socket->readAll());
    if (buffer.trimmed().isEmpty() || isTruncatedJson(buffer)) {
        return;
    }

    const QByteArray payload = buffer;
    m_buffers.remove(socket);
    // One request per connection.
    disconnect(socket, &QLocalSocket::readyRead,
               this, &CommandServer::handleClientReadyRead);
    dispatchAsync(socket, payload);
}

void CommandServer::dispatchAsync(QLocalSocket *socket, const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QPointer<QLocalSocket> guardedSocket(socket);

    auto *watcher = new QFutureWatcher<QByteArray>(this);
    connect(watcher, &QFutureWatcher<QByteArray>::finished, this, [watcher, guardedSocket]() {
        const QByteArray response = watcher->result();
        watcher->deleteLater();
        if (!guardedSocket) {
            return;
        }
        guardedSocket->write(response);
        guardedSocket->flush();
        guardedSocket->disconnectFromServer();
    });

    watcher->setFuture(QtConcurrent::run(&m_pool, [this, payload, corrId]() {
        return handleRequestPayload(payload, corrId);
    }));
}

QByteArray CommandServer::handleRequestPayload(const QByteArray &payload, const QString &corrIdIn)
{
    const QString corrId = corrIdIn.isEmpty()
        ? QUuid::createUuid().toString(QUuid::WithoutBraces)
        : corrIdIn;
    logging::CorrelationScope corrScope(corrId);

    const auto parsed = nlohmann::json::parse(payload.constData(),
                                              payload.constData() + payload.size(),
                                              nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        OBLOG_WARN(QStringLiteral("CommandServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("command_request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Invalid JSON payload"));
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        OBLOG_WARN(QStringLiteral("CommandServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("command_request_error"),
                   QStringLiteral("missing_method"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Missing method"), id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params") && !parsed["params"].is_null()) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse(QStringLiteral("Invalid params"), id);
        }
        params = parsed["params"];
    }

    const auto handler = m_handlers.find(method);
    if (handler == m_handlers.end()) {
        OBLOG_WARN(QStringLiteral("CommandServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("command_request_error"),
                   QStringLiteral("unknown_method"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}}));
        return makeErrorResponse(QStringLiteral("Unknown method"), id);
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    OBLOG_INFO(QStringLiteral("CommandServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("command_request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_rpc"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method},
                               {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = handler->second(params);
        OBLOG_INFO(QStringLiteral("CommandServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("command_request_completed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method},
                                   {"success", result.value("success", false)},
                                   {"durationMs", elapsedMs(start)}}));
        return makeResultResponse(result, id);
    } catch (const InvalidParams &ex) {
        OBLOG_WARN(QStringLiteral("CommandServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("command_request_error"),
                   QString::fromStdString(toErrorKindString(ErrorKind::InvalidArgument)),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    } catch (const std::exception &ex) {
        OBLOG_ERROR(QStringLiteral("CommandServer"),
                    QStringLiteral("handleRequest"),
                    QStringLiteral("command_request_error"),
                    QStringLiteral("exception"),
                    QStringLiteral("json_rpc"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    }
}

void CommandServer::registerHandlers()
{
    CommandFacade &f = m_facade;

    m_handlers["get_config"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.getConfig();
    };
    m_handlers["save_config"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.saveConfig(requireTyped<BridgeConfig>(p, "config"));
    };
    m_handlers["update_config"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.updateConfig(parseBridgeConfigPatch(requireObject(p, "config")));
    };

    m_handlers["get_providers"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.getProviders();
    };
    m_handlers["add_provider"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.addProvider(requireTyped<AIProviderConfig>(p, "provider"));
    };
    m_handlers["update_provider"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.updateProvider(requireTyped<AIProviderConfig>(p, "provider"));
    };
    m_handlers["delete_provider"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.deleteProvider(requireString(p, "id"));
    };
    m_handlers["test_provider_connection"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.testProviderConnection(requireTyped<AIProviderConfig>(p, "provider"));
    };
    m_handlers["validate_provider"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.validateProvider(requireTyped<ValidateProviderRequest>(p, "config"));
    };
    m_handlers["get_provider_models"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.getProviderModels(requireString(p, "providerId"));
    };
    m_handlers["test_model"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.testModel(requireString(p, "providerId"),
                           requireTyped<TestModelRequest>(p, "request"));
    };

    m_handlers["get_models"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.getModels();
    };
    m_handlers["add_model"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.addModel(requireTyped<ModelConfig>(p, "model"));
    };
    m_handlers["update_model"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.updateModel(requireTyped<ModelConfig>(p, "model"));
    };
    m_handlers["delete_model"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.deleteModel(requireString(p, "id"));
    };

    m_handlers["get_mcp_servers"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.getMcpServers();
    };
    m_handlers["add_mcp_server"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.addMcpServer(requireTyped<McpServerConfig>(p, "server"));
    };
    m_handlers["update_mcp_server"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.updateMcpServer(requireTyped<McpServerConfig>(p, "server"));
    };
    m_handlers["delete_mcp_server"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.deleteMcpServer(requireString(p, "id"));
    };
    m_handlers["get_mcp_server_status"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.getMcpServerStatus();
    };
    m_handlers["start_mcp_server"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.startMcpServer(requireString(p, "id"));
    };
    m_handlers["stop_mcp_server"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.stopMcpServer(requireString(p, "id"));
    };
    m_handlers["restart_mcp_server"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.restartMcpServer(requireString(p, "id"));
    };
    m_handlers["get_mcp_server_tools"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.getMcpServerTools(requireString(p, "id"));
    };

    m_handlers["get_logs"] = [&f](const nlohmann::json &p) -> nlohmann::json {
        return f.getLogs(optionalLimit(p), optionalLevel(p));
    };

    m_handlers["get_bridge_status"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.getBridgeStatus();
    };
    m_handlers["start_bridge_service"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.startBridgeService();
    };
    m_handlers["stop_bridge_service"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.stopBridgeService();
    };

    m_handlers["enable_autostart"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.enableAutostart();
    };
    m_handlers["disable_autostart"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.disableAutostart();
    };
    m_handlers["is_autostart_enabled"] = [&f](const nlohmann::json &) -> nlohmann::json {
        return f.isAutostartEnabled();
    };
}

QByteArray CommandServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray CommandServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace officebridge
