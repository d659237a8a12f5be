#include "bridge/bridge_client.hpp"

#include <initializer_list>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace officebridge {

namespace {

// Walks a chain of object keys; nullptr when any hop is missing.
const nlohmann::json *findPath(const nlohmann::json &root, std::initializer_list<const char *> keys)
{
    const nlohmann::json *node = &root;
    for (const char *key : keys) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

template <typename T>
std::vector<T> decodeList(const nlohmann::json *node, const char *what)
{
    if (!node || !node->is_array()) {
        return {};
    }
    try {
        return node->get<std::vector<T>>();
    } catch (const nlohmann::json::exception &ex) {
        OBLOG_WARN(QStringLiteral("BridgeClient"),
                   QStringLiteral("decodeList"),
                   QStringLiteral("bridge_list_discarded"),
                   QStringLiteral("shape_mismatch"),
                   QStringLiteral("json_decode"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"list", what}, {"error", ex.what()}}));
        return {};
    }
}

template <typename T>
Result<T> decodeData(const nlohmann::json &body)
{
    const nlohmann::json *data = findPath(body, {"data"});
    if (!data) {
        return makeError(ErrorKind::ResponseShapeMismatch,
                         "malformed bridge service response: missing data field");
    }
    try {
        return data->get<T>();
    } catch (const nlohmann::json::exception &ex) {
        return makeError(ErrorKind::ResponseShapeMismatch,
                         std::string("failed to parse bridge service response: ") + ex.what());
    }
}

std::optional<std::int64_t> integerAt(const nlohmann::json &root,
                                      std::initializer_list<const char *> keys)
{
    const nlohmann::json *node = findPath(root, keys);
    if (!node || !node->is_number_integer()) {
        return std::nullopt;
    }
    return node->get<std::int64_t>();
}

Result<nlohmann::json> parseBody(const HttpResponse &response)
{
    auto body = nlohmann::json::parse(response.body.constData(),
                                      response.body.constData() + response.body.size(),
                                      nullptr, false);
    if (body.is_discarded()) {
        return makeError(ErrorKind::ResponseShapeMismatch,
                         "failed to parse bridge service response: body is not valid JSON");
    }
    return body;
}

QByteArray toJsonBody(const nlohmann::json &payload)
{
    return QByteArray::fromStdString(payload.dump());
}

} // namespace

BridgeClient::BridgeClient(std::string host, std::uint16_t port)
    : m_host(std::move(host))
    , m_port(port)
{
}

BridgeClient::BridgeClient(const BridgeConfig &config)
    : BridgeClient(config.host, config.port)
{
}

QString BridgeClient::baseUrl() const
{
    return QStringLiteral("http://%1:%2").arg(QString::fromStdString(m_host)).arg(m_port);
}

QUrl BridgeClient::endpoint(const QString &pathAndQuery) const
{
    return QUrl(baseUrl() + pathAndQuery);
}

Result<HttpResponse> BridgeClient::send(const char *action, const HttpRequest &request) const
{
    Result<HttpResponse> response = performHttpRequest(request);
    if (!response) {
        return makeError(ErrorKind::Unreachable,
                         "cannot reach bridge service: " + response.error().message);
    }
    if (!response.value().isSuccess()) {
        OBLOG_WARN(QStringLiteral("BridgeClient"),
                   QString::fromLatin1(action),
                   QStringLiteral("bridge_request_rejected"),
                   QStringLiteral("http_status"),
                   QString::fromLatin1(request.method),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"url", request.url.toString().toStdString()},
                                   {"status", response.value().statusCode}}));
        return makeError(ErrorKind::RemoteRejected,
                         std::string(action) + " failed: HTTP "
                             + std::to_string(response.value().statusCode) + " - "
                             + response.value().body.toStdString());
    }
    return response;
}

Result<HealthReport> BridgeClient::health() const
{
    HttpRequest request;
    request.url = endpoint(QStringLiteral("/health"));
    request.timeoutMs = kHealthTimeoutMs;

    Result<HttpResponse> response = send("health check", request);
    if (!response) {
        return response.error();
    }

    // A healthy service with an unexpected body still counts as running.
    HealthReport report;
    Result<nlohmann::json> body = parseBody(response.value());
    if (body) {
        report.uptime = integerAt(body.value(), {"data", "uptime", "uptimeSeconds"});
        if (!report.uptime) {
            report.uptime = integerAt(body.value(), {"data", "uptime"});
        }
        if (!report.uptime) {
            report.uptime = integerAt(body.value(), {"uptime"});
        }
    }
    return report;
}

Result<std::vector<McpServerStatus>> BridgeClient::mcpServerStatus() const
{
    HttpRequest request;
    request.url = endpoint(QStringLiteral("/api/mcp/servers"));
    request.timeoutMs = kMcpTimeoutMs;

    Result<HttpResponse> response = send("get MCP server status", request);
    if (!response) {
        return response.error();
    }
    Result<nlohmann::json> body = parseBody(response.value());
    if (!body) {
        return body.error();
    }

    const nlohmann::json &json = body.value();
    const nlohmann::json *servers = findPath(json, {"servers"});
    if (!servers) {
        servers = findPath(json, {"data", "servers"});
    }
    if (!servers && json.is_array()) {
        servers = &json;
    }
    return decodeList<McpServerStatus>(servers, "servers");
}

Status BridgeClient::postMcpAction(const std::string &id, const char *verb, const char *action) const
{
    HttpRequest request;
    request.method = "POST";
    request.url = endpoint(QStringLiteral("/api/mcp/servers/%1/%2")
                               .arg(encodeUrlComponent(QString::fromStdString(id)),
                                    QString::fromLatin1(verb)));
    request.timeoutMs = kMcpTimeoutMs;

    Result<HttpResponse> response = send(action, request);
    if (!response) {
        return response.error();
    }
    return std::nullopt;
}

Status BridgeClient::startMcpServer(const std::string &id) const
{
    return postMcpAction(id, "start", "start MCP server");
}

Status BridgeClient::stopMcpServer(const std::string &id) const
{
    return postMcpAction(id, "stop", "stop MCP server");
}

Status BridgeClient::restartMcpServer(const std::string &id) const
{
    return postMcpAction(id, "restart", "restart MCP server");
}

Result<std::vector<McpTool>> BridgeClient::mcpServerTools(const std::string &id) const
{
    HttpRequest request;
    request.url = endpoint(QStringLiteral("/api/mcp/servers/%1/tools")
                               .arg(encodeUrlComponent(QString::fromStdString(id))));
    request.timeoutMs = kMcpTimeoutMs;

    Result<HttpResponse> response = send("get MCP server tools", request);
    if (!response) {
        return response.error();
    }
    Result<nlohmann::json> body = parseBody(response.value());
    if (!body) {
        return body.error();
    }

    const nlohmann::json *tools = findPath(body.value(), {"tools"});
    if (!tools) {
        tools = findPath(body.value(), {"data", "tools"});
    }
    return decodeList<McpTool>(tools, "tools");
}

Result<std::vector<LogEntry>> BridgeClient::logs(std::optional<std::uint32_t> limit,
                                                 const std::optional<std::string> &level) const
{
    QStringList query;
    if (limit) {
        query << QStringLiteral("limit=%1").arg(*limit);
    }
    if (level) {
        query << QStringLiteral("level=%1").arg(encodeUrlComponent(QString::fromStdString(*level)));
    }
    QString path = QStringLiteral("/api/logs");
    if (!query.isEmpty()) {
        path += QLatin1Char('?') + query.join(QLatin1Char('&'));
    }

    HttpRequest request;
    request.url = endpoint(path);
    request.timeoutMs = kLogsTimeoutMs;

    Result<HttpResponse> response = send("get logs", request);
    if (!response) {
        return response.error();
    }
    Result<nlohmann::json> body = parseBody(response.value());
    if (!body) {
        return body.error();
    }

    const nlohmann::json *entries = findPath(body.value(), {"data", "logs"});
    if (!entries) {
        entries = findPath(body.value(), {"logs"});
    }
    return decodeList<LogEntry>(entries, "logs");
}

Result<ValidateProviderResponse> BridgeClient::validateProvider(
    const ValidateProviderRequest &validation) const
{
    HttpRequest request;
    request.method = "POST";
    request.url = endpoint(QStringLiteral("/api/config/providers/validate"));
    request.jsonBody = toJsonBody(validation);
    request.timeoutMs = kProviderTimeoutMs;

    Result<HttpResponse> response = send("validate provider", request);
    if (!response) {
        return response.error();
    }
    Result<nlohmann::json> body = parseBody(response.value());
    if (!body) {
        return body.error();
    }
    return decodeData<ValidateProviderResponse>(body.value());
}

Result<nlohmann::json> BridgeClient::providerModels(const std::string &providerId) const
{
    HttpRequest request;
    request.url = endpoint(QStringLiteral("/api/config/providers/%1/models")
                               .arg(encodeUrlComponent(QString::fromStdString(providerId))));
    request.timeoutMs = kProviderTimeoutMs;

    Result<HttpResponse> response = send("get provider models", request);
    if (!response) {
        return response.error();
    }
    Result<nlohmann::json> body = parseBody(response.value());
    if (!body) {
        return body.error();
    }

    if (const nlohmann::json *data = findPath(body.value(), {"data"})) {
        return *data;
    }
    return body;
}

Result<TestModelResponse> BridgeClient::testModel(const std::string &providerId,
                                                  const TestModelRequest &test) const
{
    HttpRequest request;
    request.method = "POST";
    request.url = endpoint(QStringLiteral("/api/config/providers/%1/test-model")
                               .arg(encodeUrlComponent(QString::fromStdString(providerId))));
    request.jsonBody = toJsonBody(test);
    request.timeoutMs = kModelTestTimeoutMs;

    Result<HttpResponse> response = send("test model", request);
    if (!response) {
        return response.error();
    }
    Result<nlohmann::json> body = parseBody(response.value());
    if (!body) {
        return body.error();
    }
    return decodeData<TestModelResponse>(body.value());
}

} // namespace officebridge
