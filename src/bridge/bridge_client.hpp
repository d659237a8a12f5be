#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "bridge/http_exchange.hpp"
#include "common/errors.hpp"
#include "common/models.hpp"

namespace officebridge {

struct HealthReport {
    std::optional<std::int64_t> uptime;
};

// Stateless client for the local bridge service HTTP API. Each call issues
// exactly one request against http://{host}:{port} and maps the outcome:
//   transport failure        -> Unreachable
//   non-2xx status           -> RemoteRejected (status and body in the message)
//   2xx with unparsable body -> ResponseShapeMismatch
// A 2xx body lacking the expected field yields an empty result, except for
// validateProvider and testModel where a missing "data" is a shape mismatch.
class BridgeClient {
public:
    static constexpr int kHealthTimeoutMs = 2000;
    static constexpr int kMcpTimeoutMs = 5000;
    static constexpr int kLogsTimeoutMs = 5000;
    static constexpr int kProviderTimeoutMs = 30000;
    static constexpr int kModelTestTimeoutMs = 60000;

    BridgeClient(std::string host, std::uint16_t port);
    explicit BridgeClient(const BridgeConfig &config);

    QString baseUrl() const;

    Result<HealthReport> health() const;

    Result<std::vector<McpServerStatus>> mcpServerStatus() const;
    Status startMcpServer(const std::string &id) const;
    Status stopMcpServer(const std::string &id) const;
    Status restartMcpServer(const std::string &id) const;
    Result<std::vector<McpTool>> mcpServerTools(const std::string &id) const;

    Result<std::vector<LogEntry>> logs(std::optional<std::uint32_t> limit,
                                       const std::optional<std::string> &level) const;

    Result<ValidateProviderResponse> validateProvider(const ValidateProviderRequest &request) const;
    Result<nlohmann::json> providerModels(const std::string &providerId) const;
    Result<TestModelResponse> testModel(const std::string &providerId,
                                        const TestModelRequest &request) const;

private:
    Result<HttpResponse> send(const char *action, const HttpRequest &request) const;
    Status postMcpAction(const std::string &id, const char *verb, const char *action) const;
    QUrl endpoint(const QString &pathAndQuery) const;

    std::string m_host;
    std::uint16_t m_port;
};

} // namespace officebridge
