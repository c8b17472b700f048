/**
 * @file CampaignNodes.hpp
 * @brief Node functions of the campaign setup workflow.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "application/ListMatcher.hpp"
#include "domain/CompletionService.hpp"
#include "domain/ListProvider.hpp"
#include "domain/WorkflowState.hpp"

namespace campaignflow::application {

class Session;

/**
 * @class CampaignNodes
 * @brief Stateless between calls; every node reads and writes only the session it is given.
 */
class CampaignNodes {
public:
    CampaignNodes(std::shared_ptr<domain::CompletionService> completion,
                  std::shared_ptr<domain::ListProvider> lists,
                  int maxClarifications = domain::WorkflowState::kMaxClarifications);

    int maxClarifications() const { return m_maxClarifications; }

    /** @brief Parses the request into fields and the ordered missing-field list. */
    void extract(domain::WorkflowState& state, Session& session) const;

    /** @brief Asks about the highest-priority missing field and merges the answer. */
    void clarify(domain::WorkflowState& state, Session& session) const;

    /** @brief Applies extraction defaults to every remaining gap. */
    void fillDefaults(domain::WorkflowState& state, Session& session) const;

    void matchLists(domain::WorkflowState& state, Session& session) const;

    /** @brief Offers the matched lists plus "create new"; re-prompts once on an unusable reply. */
    void confirmSelection(domain::WorkflowState& state, Session& session) const;

    /** @brief Yes/no on creating a new list; "no" cancels the campaign. */
    void confirmNewList(domain::WorkflowState& state, Session& session) const;

    void summary(domain::WorkflowState& state, Session& session) const;
    void cancelled(domain::WorkflowState& state, Session& session) const;
    void error(domain::WorkflowState& state, Session& session) const;

    /** @brief True when an audience description means every customer of the location. */
    static bool IsAllCustomers(const std::string& audience);

    /** @brief "yes"/"no" interpretation of a confirmation reply, nullopt when neither. */
    static std::optional<bool> ParseYesNo(const std::string& reply);

private:
    void markGap(domain::WorkflowState& state, domain::FieldKind field,
                 const std::string& question, const std::string& defaultValue) const;
    void refreshAudienceScope(domain::WorkflowState& state) const;

    std::shared_ptr<domain::CompletionService> m_completion;
    std::shared_ptr<domain::ListProvider> m_lists;
    ListMatcher m_matcher;
    int m_maxClarifications;
};

} // namespace campaignflow::application
