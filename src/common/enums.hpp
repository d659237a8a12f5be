#pragma once

namespace officebridge {

enum class ProviderType {
    OpenAI,
    Azure,
    Anthropic,
    Ollama,
    Custom
};

enum class ModelType {
    Chat,
    Embedding,
    Multimodal
};

} // namespace officebridge
