/**
 * @file ListMatcher.hpp
 * @brief Ranks existing contact lists against an audience description.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/CompletionService.hpp"
#include "domain/ListProvider.hpp"
#include "domain/WorkflowState.hpp"

namespace campaignflow::application {

/**
 * @class ListMatcher
 * @brief Completion-based scoring with a deterministic keyword-overlap fallback.
 *
 * Results hold at most WorkflowState::kMaxMatchedLists entries, scores in 1..100,
 * sorted by descending score. Lists scoring 0 are dropped.
 */
class ListMatcher {
public:
    explicit ListMatcher(std::shared_ptr<domain::CompletionService> completion);

    std::vector<domain::MatchedList> rank(const std::string& audience,
                                          const std::vector<domain::ContactList>& lists) const;

    /**
     * @brief Reads a {"matches":[{id, score, reason}]} ranking.
     *
     * Unknown ids are skipped, fractional scores (0..1) are scaled to percent, and
     * scores are clamped to 0..100.
     * @return nullopt when the text holds no usable ranking object.
     */
    static std::optional<std::vector<domain::MatchedList>> ParseRanking(
        const std::string& text, const std::vector<domain::ContactList>& lists);

    static std::vector<domain::MatchedList> KeywordRanking(
        const std::string& audience, const std::vector<domain::ContactList>& lists);

private:
    static std::vector<domain::MatchedList> Finalize(std::vector<domain::MatchedList> ranked);

    std::shared_ptr<domain::CompletionService> m_completion;
};

} // namespace campaignflow::application
