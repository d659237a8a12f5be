#include "bridge/http_exchange.hpp"

#include <memory>

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include "common/logging.hpp"

namespace officebridge {

Result<HttpResponse> performHttpRequest(const HttpRequest &request)
{
    QNetworkAccessManager manager;
    QNetworkRequest networkRequest(request.url);
    for (const auto &header : request.headers) {
        networkRequest.setRawHeader(header.first, header.second);
    }
    if (request.jsonBody) {
        networkRequest.setHeader(QNetworkRequest::ContentTypeHeader,
                                 QByteArrayLiteral("application/json"));
    }

    std::unique_ptr<QNetworkReply> reply(
        request.jsonBody
            ? manager.sendCustomRequest(networkRequest, request.method, *request.jsonBody)
            : manager.sendCustomRequest(networkRequest, request.method));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    if (!reply->isFinished()) {
        timer.start(request.timeoutMs);
        loop.exec();
        timer.stop();
    }

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (timedOut || !statusAttr.isValid()) {
        const std::string cause = timedOut
            ? "request timed out after " + std::to_string(request.timeoutMs) + " ms"
            : reply->errorString().toStdString();
        OBLOG_DEBUG(QStringLiteral("HttpExchange"),
                    QStringLiteral("performHttpRequest"),
                    QStringLiteral("http_transport_failed"),
                    timedOut ? QStringLiteral("timeout") : QStringLiteral("network_error"),
                    QStringLiteral("qnetworkaccessmanager"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"method", request.method.toStdString()},
                                    {"url", request.url.toString().toStdString()},
                                    {"error", cause}}));
        return makeError(ErrorKind::Unreachable, cause);
    }

    HttpResponse response;
    response.statusCode = statusAttr.toInt();
    response.body = reply->readAll();

    OBLOG_DEBUG(QStringLiteral("HttpExchange"),
                QStringLiteral("performHttpRequest"),
                QStringLiteral("http_exchange_done"),
                QStringLiteral("response_received"),
                QStringLiteral("qnetworkaccessmanager"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"method", request.method.toStdString()},
                                {"url", request.url.toString().toStdString()},
                                {"status", response.statusCode},
                                {"bytes", response.body.size()}}));
    return response;
}

QString encodeUrlComponent(const QString &value)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(value));
}

} // namespace officebridge
