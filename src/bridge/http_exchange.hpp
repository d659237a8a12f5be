#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QUrl>

#include "common/errors.hpp"

namespace officebridge {

struct HttpRequest {
    QByteArray method = "GET";
    QUrl url;
    std::vector<std::pair<QByteArray, QByteArray>> headers;
    std::optional<QByteArray> jsonBody;
    int timeoutMs = 5000;
};

struct HttpResponse {
    int statusCode = 0;
    QByteArray body;

    bool isSuccess() const
    {
        return statusCode >= 200 && statusCode < 300;
    }
};

// Runs one request to completion on the calling thread. Each call owns a
// private QNetworkAccessManager and event loop, so it is safe from worker
// threads without a Qt event loop of their own.
//
// Any HTTP status is a successful exchange. Only transport failures
// (refused, DNS, TLS, timeout) produce an Error, of kind Unreachable, whose
// message is the bare cause.
Result<HttpResponse> performHttpRequest(const HttpRequest &request);

// Percent-encodes one path segment or query value.
QString encodeUrlComponent(const QString &value);

} // namespace officebridge
