#pragma once

#include "bridge/http_exchange.hpp"
#include "common/errors.hpp"
#include "common/models.hpp"

namespace officebridge {

constexpr int kProviderProbeTimeoutMs = 15000;

// Builds the direct connectivity check for a provider: a GET against its
// model listing endpoint with the provider's authentication headers.
// InvalidArgument when no endpoint can be derived (custom provider without
// baseUrl, azure without azureEndpoint).
Result<HttpRequest> buildProviderProbe(const AIProviderConfig &provider);

// Runs the probe. true on 2xx; RemoteRejected or Unreachable otherwise.
Result<bool> probeProviderConnection(const AIProviderConfig &provider);

} // namespace officebridge
