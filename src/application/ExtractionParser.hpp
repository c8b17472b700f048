/**
 * @file ExtractionParser.hpp
 * @brief Tolerant parsing of campaign fields from completion output.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/WorkflowState.hpp"

namespace campaignflow::application {

/**
 * @struct CampaignExtraction
 * @brief Fields found in a completion. Missing entries may carry empty question/default.
 */
struct CampaignExtraction {
    std::optional<std::string> audience;
    std::optional<std::string> offer;
    std::optional<std::string> schedule;
    std::optional<std::string> smartListName;
    std::vector<domain::MissingField> missing;

    const std::optional<std::string>& value(domain::FieldKind kind) const;
    bool flags(domain::FieldKind kind) const;
};

class ExtractionParser {
public:
    /**
     * @brief Finds the JSON object in model output.
     *
     * Accepts bare JSON, ```json fenced blocks, and prose around a single object
     * (first '{' to last '}').
     */
    static std::optional<nlohmann::json> ExtractJsonObject(const std::string& text);

    /** @return nullopt when no JSON object with at least one known key is present. */
    static std::optional<CampaignExtraction> Parse(const std::string& text);
};

} // namespace campaignflow::application
