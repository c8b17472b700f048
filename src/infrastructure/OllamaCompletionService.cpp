/**
 * @file OllamaCompletionService.cpp
 * @brief Implementation of the OllamaCompletionService class.
 */
#include "infrastructure/OllamaCompletionService.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <iostream>

namespace campaignflow::infrastructure {

OllamaCompletionService::OllamaCompletionService(const std::string& host, int port, const std::string& model)
    : m_client(host, port), m_model(model) {
    detectModel();
}

void OllamaCompletionService::detectModel() {
    auto available = m_client.getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaCompletionService] Failed to list models. Is Ollama running? Keeping: "
                  << m_model << std::endl;
        return;
    }

    auto preferred = std::find_if(available.begin(), available.end(),
        [this](const std::string& name) { return name.find(m_model) != std::string::npos; });
    if (preferred != available.end()) {
        m_model = *preferred;
        std::cout << "[OllamaCompletionService] Using model: " << m_model << std::endl;
        return;
    }

    std::cout << "[OllamaCompletionService] Model " << m_model << " not installed, falling back to "
              << available.front() << std::endl;
    m_model = available.front();
}

std::optional<std::string> OllamaCompletionService::complete(const std::string& systemPrompt,
                                                             const std::string& userContent) {
    const std::string task = PromptCatalog::TaskOf(systemPrompt);
    std::cout << "[OllamaCompletionService] " << (task.empty() ? "completion" : task)
              << " with " << m_model << std::endl;
    return m_client.generate(m_model, systemPrompt, userContent, true);
}

} // namespace campaignflow::infrastructure
