#pragma once

#include <functional>
#include <map>
#include <string>

#include <QByteArray>
#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QThreadPool>

#include <nlohmann/json.hpp>

#include "commands/command_facade.hpp"

namespace officebridge {

/**
 * CommandServer exposes CommandFacade to the UI process over a local socket.
 *
 * A client sends one JSON object {"id", "method", "params"}; the reply is
 * {"id", "result": {success, data, error}} or, for malformed requests,
 * {"id", "error": "..."}. The connection is closed after the reply.
 * Each request runs on the server's thread pool.
 */
class CommandServer : public QObject
{
    Q_OBJECT
public:
    explicit CommandServer(CommandFacade &facade, QObject *parent = nullptr);
    ~CommandServer() override;

    // $OFFICE_BRIDGE_SOCKET_NAME, else $XDG_RUNTIME_DIR/office-bridge.sock
    static QString socketPath();

    bool start();
    QString listeningPath() const;

    // Dispatches one payload synchronously on the calling thread.
    QByteArray handleRequestPayload(const QByteArray &payload,
                                    const QString &corrId = QString());

    QThreadPool &threadPool();

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json &params)>;

    void registerHandlers();
    void dispatchAsync(QLocalSocket *socket, const QByteArray &payload);
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    CommandFacade &m_facade;
    std::map<std::string, Handler> m_handlers;
    QHash<QLocalSocket *, QByteArray> m_buffers;
    QLocalServer m_server;
    QThreadPool m_pool;
};

} // namespace officebridge
