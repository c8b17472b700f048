/**
 * @file WorkflowState.hpp
 * @brief Fixed-schema state carried by a campaign session through the workflow graph.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace campaignflow::domain {

/**
 * @enum FieldKind
 * @brief Campaign fields that can be missing. Declaration order is priority order.
 */
enum class FieldKind {
    Audience,
    Offer,
    Datetime
};

std::string FieldKindToString(FieldKind kind);
std::optional<FieldKind> FieldKindFromString(const std::string& value);

/** @brief Lower value means asked first (audience > offer > datetime). */
int FieldPriority(FieldKind kind);

/**
 * @struct MissingField
 * @brief A field still needing clarification, with the question to ask and the best-effort default.
 */
struct MissingField {
    FieldKind field = FieldKind::Audience;
    std::string question;
    std::string defaultValue;
};

/**
 * @struct ClarificationResponse
 * @brief One answer already merged into the state.
 */
struct ClarificationResponse {
    FieldKind field = FieldKind::Audience;
    std::string question;
    std::string answer;
    bool defaulted = false; ///< True when the answer came from the extraction default.
};

/**
 * @struct MatchedList
 * @brief An existing contact list ranked against the audience description.
 */
struct MatchedList {
    std::string id;
    std::string displayName;
    long long size = 0;
    int score = 0; ///< Relevance 0-100.
    std::string reason;
};

/**
 * @enum Phase
 * @brief Coarse progress marker. Only moves forward; the clarify loop may stay in Clarify.
 */
enum class Phase {
    Extract,
    Clarify,
    MatchLists,
    ConfirmSelection,
    Summary,
    Completed,
    Cancelled,
    Failed
};

std::string PhaseToString(Phase phase);

/**
 * @struct WorkflowState
 * @brief Everything the nodes read and write. Validated at every node boundary.
 */
struct WorkflowState {
    static constexpr int kMaxClarifications = 5;
    static constexpr std::size_t kMaxMatchedLists = 3;
    static constexpr int kMaxSelectionAttempts = 2;

    std::string userPrompt;
    std::optional<std::string> audience;
    std::optional<std::string> offer;
    std::optional<std::string> schedule;
    std::optional<std::string> smartListName;
    std::optional<std::string> locationId;

    std::vector<MissingField> missingFields;
    std::vector<ClarificationResponse> clarificationResponses;
    std::vector<MatchedList> matchedLists;

    std::optional<std::string> selectedListId;
    bool createNewList = false;
    bool sendToAllCustomers = false;

    Phase phase = Phase::Extract;
    int questionsAsked = 0;
    int selectionAttempts = 0;
    std::optional<std::string> lastError;

    /** @brief Current value of a campaign field, if known. */
    const std::optional<std::string>& fieldValue(FieldKind kind) const;

    void setField(FieldKind kind, std::string value);

    bool isMissing(FieldKind kind) const;

    /**
     * @brief Adds or replaces the missing entry for a field, keeping priority order.
     */
    void markMissing(MissingField entry);

    void clearMissing(FieldKind kind);

    /** @brief Highest-priority missing field, if any. */
    std::optional<MissingField> nextMissing() const;

    /**
     * @brief Checks the schema invariants.
     * @return Description of the first violated invariant, or nullopt when valid.
     */
    std::optional<std::string> validate() const;

    nlohmann::json toJson() const;
};

} // namespace campaignflow::domain
