#include "bridge/provider_probe.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace officebridge {

namespace {

const char *const kDefaultAzureApiVersion = "2024-02-15-preview";

QString defaultBaseUrl(const AIProviderConfig &provider)
{
    switch (provider.type) {
    case ProviderType::OpenAI:
        return QStringLiteral("https://api.openai.com/v1");
    case ProviderType::Anthropic:
        return QStringLiteral("https://api.anthropic.com");
    case ProviderType::Ollama:
        return QStringLiteral("http://localhost:11434");
    case ProviderType::Azure:
        return QString::fromStdString(provider.azureEndpoint.value_or(std::string()));
    case ProviderType::Custom:
        return QString();
    }
    return QString();
}

} // namespace

Result<HttpRequest> buildProviderProbe(const AIProviderConfig &provider)
{
    QString base = provider.baseUrl
        ? QString::fromStdString(*provider.baseUrl)
        : defaultBaseUrl(provider);
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    if (base.isEmpty()) {
        return makeError(ErrorKind::InvalidArgument, "no API endpoint configured");
    }

    HttpRequest request;
    request.timeoutMs = kProviderProbeTimeoutMs;
    const QByteArray apiKey = QByteArray::fromStdString(provider.apiKey);

    switch (provider.type) {
    case ProviderType::OpenAI:
    case ProviderType::Custom:
        request.url = QUrl(base + QStringLiteral("/models"));
        request.headers.emplace_back("Authorization", "Bearer " + apiKey);
        break;
    case ProviderType::Anthropic:
        request.url = QUrl(base + QStringLiteral("/v1/models"));
        request.headers.emplace_back("x-api-key", apiKey);
        request.headers.emplace_back("anthropic-version", "2023-06-01");
        break;
    case ProviderType::Ollama:
        request.url = QUrl(base + QStringLiteral("/api/tags"));
        break;
    case ProviderType::Azure: {
        const QString apiVersion = QString::fromStdString(
            provider.azureApiVersion.value_or(kDefaultAzureApiVersion));
        request.url = QUrl(base + QStringLiteral("/openai/models?api-version=")
                           + encodeUrlComponent(apiVersion));
        request.headers.emplace_back("api-key", apiKey);
        break;
    }
    }

    if (provider.customHeaders) {
        for (const auto &header : *provider.customHeaders) {
            request.headers.emplace_back(QByteArray::fromStdString(header.first),
                                         QByteArray::fromStdString(header.second));
        }
    }
    return request;
}

Result<bool> probeProviderConnection(const AIProviderConfig &provider)
{
    Result<HttpRequest> request = buildProviderProbe(provider);
    if (!request) {
        return request.error();
    }

    OBLOG_INFO(QStringLiteral("ProviderProbe"),
               QStringLiteral("probeProviderConnection"),
               QStringLiteral("provider_probe_started"),
               QStringLiteral("user_action"),
               QStringLiteral("http_get"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"providerId", provider.id},
                               {"type", toProviderTypeString(provider.type)},
                               {"url", request.value().url.toString().toStdString()}}));

    Result<HttpResponse> response = performHttpRequest(request.value());
    if (!response) {
        return makeError(ErrorKind::Unreachable,
                         "connection failed: " + response.error().message);
    }
    if (!response.value().isSuccess()) {
        return makeError(ErrorKind::RemoteRejected,
                         "connection failed: HTTP " + std::to_string(response.value().statusCode));
    }
    return true;
}

} // namespace officebridge
