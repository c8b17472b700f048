/**
 * @file CompletionService.hpp
 * @brief Port for the opaque text-completion collaborator.
 */

#pragma once

#include <optional>
#include <string>

namespace campaignflow::domain {

/**
 * @class CompletionService
 * @brief Turns a system instruction plus user content into generated text.
 */
class CompletionService {
public:
    virtual ~CompletionService() = default;

    /**
     * @brief Requests a completion.
     * @param systemPrompt Task instructions.
     * @param userContent Content the task applies to.
     * @return Generated text, or nullopt when the service is unreachable or failed.
     */
    virtual std::optional<std::string> complete(const std::string& systemPrompt,
                                                const std::string& userContent) = 0;
};

} // namespace campaignflow::domain
