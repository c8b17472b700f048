/**
 * @file OllamaCompletionService.hpp
 * @brief CompletionService backed by a local Ollama server.
 */

#pragma once

#include <string>
#include "domain/CompletionService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace campaignflow::infrastructure {

/**
 * @class OllamaCompletionService
 * @brief Implements CompletionService with /api/generate in JSON mode.
 */
class OllamaCompletionService : public domain::CompletionService {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Preferred model; when it is not installed the first installed model is used.
     */
    OllamaCompletionService(const std::string& host, int port, const std::string& model);

    /** @see domain::CompletionService::complete */
    std::optional<std::string> complete(const std::string& systemPrompt,
                                        const std::string& userContent) override;

    const std::string& model() const { return m_model; }

private:
    void detectModel();

    OllamaClient m_client;
    std::string m_model; ///< Target model name.
};

} // namespace campaignflow::infrastructure
