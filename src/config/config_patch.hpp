#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace officebridge {

// Field-level update of BridgeConfig. Every slot is independently present or
// absent; nullable fields use a nested optional where the inner nullopt means
// "clear the value".
struct BridgeConfigPatch {
    std::optional<std::uint16_t> port;
    std::optional<std::string> host;
    std::optional<std::string> logLevel;
    std::optional<std::optional<std::string>> defaultProviderId;
    std::optional<std::optional<std::string>> defaultChatModelId;
    std::optional<std::optional<std::string>> defaultEmbeddingModelId;
    std::optional<bool> autoStart;
    std::optional<bool> minimizeToTray;

    bool isEmpty() const;
};

// Builds a patch from a loosely typed JSON object. Unknown keys and values of
// the wrong JSON type are dropped silently; a non-object yields an empty patch.
BridgeConfigPatch parseBridgeConfigPatch(const nlohmann::json &object);

void applyBridgeConfigPatch(BridgeConfig &config, const BridgeConfigPatch &patch);

} // namespace officebridge
