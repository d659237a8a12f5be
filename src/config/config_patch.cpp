#include "config/config_patch.hpp"

#include <limits>

namespace officebridge {

namespace {

std::optional<std::string> stringField(const nlohmann::json &object, const char *key)
{
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<bool> boolField(const nlohmann::json &object, const char *key)
{
    const auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

std::optional<std::optional<std::string>> nullableStringField(const nlohmann::json &object,
                                                              const char *key)
{
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (it->is_null()) {
        return std::make_optional(std::optional<std::string>{});
    }
    if (it->is_string()) {
        return std::make_optional(std::optional<std::string>{it->get<std::string>()});
    }
    return std::nullopt;
}

std::optional<std::uint16_t> portField(const nlohmann::json &object, const char *key)
{
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    // Negative integers are number_integer, not number_unsigned.
    if (!it->is_number_unsigned()) {
        return std::nullopt;
    }
    const auto value = it->get<std::uint64_t>();
    if (value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

bool BridgeConfigPatch::isEmpty() const
{
    return !port && !host && !logLevel && !defaultProviderId && !defaultChatModelId
        && !defaultEmbeddingModelId && !autoStart && !minimizeToTray;
}

BridgeConfigPatch parseBridgeConfigPatch(const nlohmann::json &object)
{
    BridgeConfigPatch patch;
    if (!object.is_object()) {
        return patch;
    }

    patch.port = portField(object, "port");
    patch.host = stringField(object, "host");
    patch.logLevel = stringField(object, "logLevel");
    patch.defaultProviderId = nullableStringField(object, "defaultProviderId");
    patch.defaultChatModelId = nullableStringField(object, "defaultChatModelId");
    patch.defaultEmbeddingModelId = nullableStringField(object, "defaultEmbeddingModelId");
    patch.autoStart = boolField(object, "autoStart");
    patch.minimizeToTray = boolField(object, "minimizeToTray");
    return patch;
}

void applyBridgeConfigPatch(BridgeConfig &config, const BridgeConfigPatch &patch)
{
    if (patch.port) {
        config.port = *patch.port;
    }
    if (patch.host) {
        config.host = *patch.host;
    }
    if (patch.logLevel) {
        config.logLevel = *patch.logLevel;
    }
    if (patch.defaultProviderId) {
        config.defaultProviderId = *patch.defaultProviderId;
    }
    if (patch.defaultChatModelId) {
        config.defaultChatModelId = *patch.defaultChatModelId;
    }
    if (patch.defaultEmbeddingModelId) {
        config.defaultEmbeddingModelId = *patch.defaultEmbeddingModelId;
    }
    if (patch.autoStart) {
        config.autoStart = *patch.autoStart;
    }
    if (patch.minimizeToTray) {
        config.minimizeToTray = *patch.minimizeToTray;
    }
}

} // namespace officebridge
