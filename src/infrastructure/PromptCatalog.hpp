/**
 * @file PromptCatalog.hpp
 * @brief Central storage for completion prompts, fallback questions and field defaults.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/ClientContext.hpp"
#include "domain/WorkflowState.hpp"

namespace campaignflow::infrastructure {

/**
 * @class PromptCatalog
 * @brief Every system prompt starts with a "TASK: <name>" line naming the job.
 */
class PromptCatalog {
public:
    static constexpr const char* kExtractTask = "extract_campaign";
    static constexpr const char* kUpdateTask = "update_campaign";
    static constexpr const char* kRankTask = "rank_lists";

    /** @brief Prompt that turns a free-form request into campaign fields. */
    static std::string GetExtractionPrompt(const std::optional<domain::ClientLocation>& location);

    /** @brief Prompt that merges a clarification answer into the campaign fields. */
    static std::string GetUpdatePrompt();

    /** @brief User content for the update prompt: current fields, answers, open gaps. */
    static std::string BuildUpdateRequest(const domain::WorkflowState& state);

    /** @brief Prompt that scores contact lists against an audience description. */
    static std::string GetListRankingPrompt();

    /** @brief Question used when extraction could not phrase one. */
    static std::string GetFallbackQuestion(domain::FieldKind field);

    /** @brief Value applied when the user skips a question or the clarification cap is reached. */
    static std::string GetDefaultValue(domain::FieldKind field);

    /** @brief Bullet list of the location details useful to the model. */
    static std::string FormatLocationContext(const std::optional<domain::ClientLocation>& location);

    /** @brief Extracts the task name from a system prompt, empty if absent. */
    static std::string TaskOf(const std::string& systemPrompt);
};

} // namespace campaignflow::infrastructure
