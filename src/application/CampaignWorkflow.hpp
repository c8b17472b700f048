/**
 * @file CampaignWorkflow.hpp
 * @brief Wiring of the campaign nodes into a WorkflowGraph.
 */

#pragma once

#include <memory>
#include <string>
#include "application/CampaignNodes.hpp"
#include "application/WorkflowGraph.hpp"

namespace campaignflow::application {

namespace nodes {
constexpr const char* kExtract = "extract";
constexpr const char* kCheckMissing = "check_missing";
constexpr const char* kClarify = "clarify";
constexpr const char* kFillDefaults = "fill_defaults";
constexpr const char* kMatchLists = "match_lists";
constexpr const char* kConfirmSelection = "confirm_selection";
constexpr const char* kConfirmNewList = "confirm_new_list";
constexpr const char* kSummary = "summary";
constexpr const char* kCancelled = "cancelled";
constexpr const char* kError = "error";
} // namespace nodes

/** @brief Branch taken after the missing-field check. */
std::string RouteAfterMissingCheck(const domain::WorkflowState& state, int maxClarifications);

/** @brief confirm_selection when lists matched, confirm_new_list otherwise. */
std::string RouteAfterMatching(const domain::WorkflowState& state);

/** @brief summary once a list decision exists, cancelled when the user declined. */
std::string RouteAfterNewListConfirmation(const domain::WorkflowState& state);

/**
 * @brief Builds the campaign setup graph.
 *
 * extract -> check_missing -> (clarify | fill_defaults)* -> match_lists
 *   -> confirm_selection | confirm_new_list -> summary
 *
 * An "all customers" audience skips list matching.
 */
WorkflowGraph BuildCampaignGraph(std::shared_ptr<CampaignNodes> campaignNodes);

} // namespace campaignflow::application
