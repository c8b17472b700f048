/**
 * @file WorkflowState.cpp
 * @brief Implementation of WorkflowState helpers and invariant checks.
 */

#include "domain/WorkflowState.hpp"
#include <algorithm>
#include <cctype>

namespace campaignflow::domain {

using json = nlohmann::json;

std::string FieldKindToString(FieldKind kind) {
    switch (kind) {
        case FieldKind::Audience: return "audience";
        case FieldKind::Offer: return "offer";
        case FieldKind::Datetime: return "datetime";
    }
    return "audience";
}

std::optional<FieldKind> FieldKindFromString(const std::string& value) {
    std::string token;
    token.reserve(value.size());
    for (char ch : value) {
        token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (token == "audience") return FieldKind::Audience;
    if (token == "offer" || token == "template") return FieldKind::Offer;
    if (token == "datetime" || token == "schedule") return FieldKind::Datetime;
    return std::nullopt;
}

int FieldPriority(FieldKind kind) {
    return static_cast<int>(kind);
}

std::string PhaseToString(Phase phase) {
    switch (phase) {
        case Phase::Extract: return "extract";
        case Phase::Clarify: return "clarify";
        case Phase::MatchLists: return "match_lists";
        case Phase::ConfirmSelection: return "confirm_selection";
        case Phase::Summary: return "summary";
        case Phase::Completed: return "completed";
        case Phase::Cancelled: return "cancelled";
        case Phase::Failed: return "failed";
    }
    return "extract";
}

const std::optional<std::string>& WorkflowState::fieldValue(FieldKind kind) const {
    switch (kind) {
        case FieldKind::Audience: return audience;
        case FieldKind::Offer: return offer;
        case FieldKind::Datetime: return schedule;
    }
    return audience;
}

void WorkflowState::setField(FieldKind kind, std::string value) {
    switch (kind) {
        case FieldKind::Audience: audience = std::move(value); break;
        case FieldKind::Offer: offer = std::move(value); break;
        case FieldKind::Datetime: schedule = std::move(value); break;
    }
}

bool WorkflowState::isMissing(FieldKind kind) const {
    return std::any_of(missingFields.begin(), missingFields.end(),
        [kind](const MissingField& m) { return m.field == kind; });
}

void WorkflowState::markMissing(MissingField entry) {
    clearMissing(entry.field);
    auto pos = std::find_if(missingFields.begin(), missingFields.end(),
        [&entry](const MissingField& m) { return FieldPriority(m.field) > FieldPriority(entry.field); });
    missingFields.insert(pos, std::move(entry));
}

void WorkflowState::clearMissing(FieldKind kind) {
    missingFields.erase(
        std::remove_if(missingFields.begin(), missingFields.end(),
            [kind](const MissingField& m) { return m.field == kind; }),
        missingFields.end());
}

std::optional<MissingField> WorkflowState::nextMissing() const {
    if (missingFields.empty()) return std::nullopt;
    return missingFields.front();
}

std::optional<std::string> WorkflowState::validate() const {
    if (questionsAsked < 0 || questionsAsked > kMaxClarifications) {
        return "clarification count out of range: " + std::to_string(questionsAsked);
    }
    if (selectionAttempts < 0 || selectionAttempts > kMaxSelectionAttempts) {
        return "selection attempts out of range: " + std::to_string(selectionAttempts);
    }
    if (matchedLists.size() > kMaxMatchedLists) {
        return "too many matched lists: " + std::to_string(matchedLists.size());
    }
    for (std::size_t i = 0; i < matchedLists.size(); ++i) {
        const auto& list = matchedLists[i];
        if (list.score < 0 || list.score > 100) {
            return "matched list score out of range for " + list.id;
        }
        if (i > 0 && matchedLists[i - 1].score < list.score) {
            return "matched lists not sorted by descending score";
        }
    }
    for (std::size_t i = 1; i < missingFields.size(); ++i) {
        if (FieldPriority(missingFields[i - 1].field) >= FieldPriority(missingFields[i].field)) {
            return "missing fields not in priority order or duplicated";
        }
    }
    if (selectedListId && createNewList) {
        return "both an existing list and a new list were selected";
    }
    return std::nullopt;
}

json WorkflowState::toJson() const {
    auto optionalToJson = [](const std::optional<std::string>& v) -> json {
        return v ? json(*v) : json(nullptr);
    };

    json missing = json::array();
    for (const auto& m : missingFields) {
        missing.push_back({
            {"field", FieldKindToString(m.field)},
            {"question", m.question},
            {"default", m.defaultValue}
        });
    }

    json responses = json::array();
    for (const auto& r : clarificationResponses) {
        responses.push_back({
            {"field", FieldKindToString(r.field)},
            {"question", r.question},
            {"answer", r.answer},
            {"defaulted", r.defaulted}
        });
    }

    json lists = json::array();
    for (const auto& l : matchedLists) {
        lists.push_back({
            {"id", l.id},
            {"display_name", l.displayName},
            {"size", l.size},
            {"score", l.score},
            {"reason", l.reason}
        });
    }

    return {
        {"user_prompt", userPrompt},
        {"audience", optionalToJson(audience)},
        {"offer", optionalToJson(offer)},
        {"datetime", optionalToJson(schedule)},
        {"smart_list_name", optionalToJson(smartListName)},
        {"location_id", optionalToJson(locationId)},
        {"missing_fields", missing},
        {"clarification_responses", responses},
        {"matched_lists", lists},
        {"selected_list_id", optionalToJson(selectedListId)},
        {"create_new_list", createNewList},
        {"send_to_all_customers", sendToAllCustomers},
        {"phase", PhaseToString(phase)},
        {"questions_asked", questionsAsked},
        {"selection_attempts", selectionAttempts},
        {"last_error", optionalToJson(lastError)}
    };
}

} // namespace campaignflow::domain
