/**
 * @file CampaignNodes.cpp
 * @brief Implementation of the campaign workflow nodes.
 */

#include "application/CampaignNodes.hpp"
#include "application/ExtractionParser.hpp"
#include "application/Session.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>

namespace campaignflow::application {

using namespace campaignflow::domain;
using infrastructure::PromptCatalog;

namespace {

const FieldKind kAllFields[] = {FieldKind::Audience, FieldKind::Offer, FieldKind::Datetime};

std::string Trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Lowercase, punctuation folded to single spaces.
std::string Normalize(const std::string& s) {
    std::string out;
    bool space = false;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            if (space && !out.empty()) out.push_back(' ');
            out.push_back(static_cast<char>(std::tolower(c)));
            space = false;
        } else {
            space = true;
        }
    }
    return out;
}

std::string FieldLabel(FieldKind field) {
    switch (field) {
        case FieldKind::Audience: return "Audience";
        case FieldKind::Offer: return "Offer";
        case FieldKind::Datetime: return "Schedule";
    }
    return "Field";
}

std::string ValueOr(const std::optional<std::string>& value, const std::string& fallback) {
    return value ? *value : fallback;
}

enum class SelectionKind { Existing, CreateNew, Invalid };

struct Selection {
    SelectionKind kind = SelectionKind::Invalid;
    std::size_t index = 0;
};

Selection ResolveSelection(const std::string& reply, const std::vector<MatchedList>& lists) {
    Selection selection;
    const std::string text = Trim(reply);
    const std::string norm = Normalize(text);
    if (norm.empty()) return selection;

    if (norm == "0" || norm == "new" || norm == "create" || norm == "create new" ||
        norm == "create new list" || norm == "create new smart list" || norm == "new list") {
        selection.kind = SelectionKind::CreateNew;
        return selection;
    }

    if (std::all_of(norm.begin(), norm.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (norm.size() <= 3) {
            std::size_t number = std::stoul(norm);
            if (number >= 1 && number <= lists.size()) {
                selection.kind = SelectionKind::Existing;
                selection.index = number - 1;
                return selection;
            }
        }
    }

    for (std::size_t i = 0; i < lists.size(); ++i) {
        if (lists[i].id == text || Normalize(lists[i].displayName) == norm) {
            selection.kind = SelectionKind::Existing;
            selection.index = i;
            return selection;
        }
    }
    return selection;
}

} // namespace

CampaignNodes::CampaignNodes(std::shared_ptr<CompletionService> completion,
                             std::shared_ptr<ListProvider> lists,
                             int maxClarifications)
    : m_completion(std::move(completion)),
      m_lists(std::move(lists)),
      m_matcher(m_completion),
      m_maxClarifications(std::clamp(maxClarifications, 0, WorkflowState::kMaxClarifications)) {}

bool CampaignNodes::IsAllCustomers(const std::string& audience) {
    static const char* const kPhrases[] = {
        "all customers", "all customer", "all_customers", "all clients", "all contacts",
        "every customer", "everyone", "all my customers", "all of my customers"
    };
    const std::string norm = Normalize(audience);
    for (const char* phrase : kPhrases) {
        if (norm == Normalize(phrase)) return true;
    }
    return false;
}

std::optional<bool> CampaignNodes::ParseYesNo(const std::string& reply) {
    static const char* const kYes[] = {"yes", "y", "ok", "okay", "sure", "proceed", "yeah", "yep"};
    static const char* const kNo[] = {"no", "n", "nope", "cancel", "stop"};
    const std::string norm = Normalize(reply);
    for (const char* word : kYes) {
        if (norm == word) return true;
    }
    for (const char* word : kNo) {
        if (norm == word) return false;
    }
    return std::nullopt;
}

void CampaignNodes::markGap(WorkflowState& state, FieldKind field,
                            const std::string& question, const std::string& defaultValue) const {
    MissingField entry;
    entry.field = field;
    entry.question = question.empty() ? PromptCatalog::GetFallbackQuestion(field) : question;
    entry.defaultValue = defaultValue.empty() ? PromptCatalog::GetDefaultValue(field) : defaultValue;
    state.markMissing(std::move(entry));
}

void CampaignNodes::refreshAudienceScope(WorkflowState& state) const {
    state.sendToAllCustomers = state.audience && !state.isMissing(FieldKind::Audience) &&
                               IsAllCustomers(*state.audience);
}

void CampaignNodes::extract(WorkflowState& state, Session& session) const {
    state.phase = Phase::Extract;
    session.send(OutboundType::AssistantThinking, "Analyzing your campaign request...");

    std::optional<std::string> raw;
    if (m_completion) {
        raw = m_completion->complete(PromptCatalog::GetExtractionPrompt(session.context().location),
                                     state.userPrompt);
    }
    auto extraction = raw ? ExtractionParser::Parse(*raw) : std::nullopt;

    state.missingFields.clear();
    if (!extraction) {
        std::cerr << "[CampaignNodes] " << session.id()
                  << ": extraction output unusable, asking for every field" << std::endl;
        for (FieldKind field : kAllFields) {
            markGap(state, field, "", "");
        }
    } else {
        if (extraction->audience) state.audience = extraction->audience;
        if (extraction->offer) state.offer = extraction->offer;
        if (extraction->schedule) state.schedule = extraction->schedule;
        if (extraction->smartListName) state.smartListName = extraction->smartListName;

        for (const auto& gap : extraction->missing) {
            markGap(state, gap.field, gap.question, gap.defaultValue);
        }
        for (FieldKind field : kAllFields) {
            if (!state.fieldValue(field) && !state.isMissing(field)) {
                markGap(state, field, "", "");
            }
        }
    }
    refreshAudienceScope(state);

    std::string understood = "✓ Understood! Here's what I have so far:";
    for (FieldKind field : kAllFields) {
        understood += "\n• " + FieldLabel(field) + ": ";
        understood += state.isMissing(field) ? std::string("(to be clarified)")
                                             : ValueOr(state.fieldValue(field), "(to be clarified)");
    }
    session.send(OutboundType::Assistant, understood);
}

void CampaignNodes::clarify(WorkflowState& state, Session& session) const {
    state.phase = Phase::Clarify;
    auto target = state.nextMissing();
    if (!target) return;

    const int remaining = static_cast<int>(state.missingFields.size());
    const int total = std::min(state.questionsAsked + remaining, m_maxClarifications);
    if (state.questionsAsked == 0 && !session.isResuming()) {
        session.send(OutboundType::System,
                     "I need to clarify " + std::to_string(total) + " thing(s) about your campaign.");
    }

    const std::string reply = Trim(session.ask(QuestionKind::FreeText, target->question, {},
                                               state.questionsAsked + 1, total));
    state.questionsAsked++;

    if (reply.empty()) {
        state.setField(target->field, target->defaultValue);
        state.clearMissing(target->field);
        state.clarificationResponses.push_back({target->field, target->question, target->defaultValue, true});
        session.send(OutboundType::System, "No problem, I'll use: " + target->defaultValue);
        refreshAudienceScope(state);
        return;
    }

    // The asked field stays listed as missing until the update confirms the answer covers it.
    state.setField(target->field, reply);
    state.clarificationResponses.push_back({target->field, target->question, reply, false});

    std::optional<std::string> raw;
    if (m_completion) {
        raw = m_completion->complete(PromptCatalog::GetUpdatePrompt(), PromptCatalog::BuildUpdateRequest(state));
    }
    auto update = raw ? ExtractionParser::Parse(*raw) : std::nullopt;
    if (!update) {
        std::cerr << "[CampaignNodes] " << session.id() << ": update output unusable, applied '"
                  << FieldKindToString(target->field) << "' answer verbatim" << std::endl;
        state.clearMissing(target->field);
        refreshAudienceScope(state);
        return;
    }

    for (FieldKind field : kAllFields) {
        const auto& value = update->value(field);
        if (!state.isMissing(field)) {
            if (value) state.setField(field, *value);
            continue;
        }
        if (update->flags(field)) {
            // Still open: keep the freshest question and default the model offered.
            if (value) state.setField(field, *value);
            auto current = std::find_if(state.missingFields.begin(), state.missingFields.end(),
                [field](const MissingField& m) { return m.field == field; });
            MissingField kept = *current;
            for (const auto& gap : update->missing) {
                if (gap.field == field) {
                    markGap(state, field, gap.question.empty() ? kept.question : gap.question,
                            gap.defaultValue.empty() ? kept.defaultValue : gap.defaultValue);
                }
            }
            continue;
        }
        // An answer may cover more than the field that was asked about.
        if (value) {
            state.setField(field, *value);
            state.clearMissing(field);
        } else if (field == target->field) {
            state.clearMissing(field);
        }
    }

    if (state.isMissing(target->field)) {
        std::cout << "[CampaignNodes] " << session.id() << ": '" << FieldKindToString(target->field)
                  << "' still unclear after answer " << state.questionsAsked << std::endl;
    }
    refreshAudienceScope(state);
}

void CampaignNodes::fillDefaults(WorkflowState& state, Session& session) const {
    state.phase = Phase::Clarify;
    if (state.missingFields.empty()) return;

    std::string applied;
    for (const auto& gap : state.missingFields) {
        state.setField(gap.field, gap.defaultValue);
        state.clarificationResponses.push_back({gap.field, gap.question, gap.defaultValue, true});
        applied += "\n• " + FieldLabel(gap.field) + ": " + gap.defaultValue;
    }
    state.missingFields.clear();
    refreshAudienceScope(state);

    session.send(OutboundType::System, "I'll go with sensible defaults for the rest:" + applied);
}

void CampaignNodes::matchLists(WorkflowState& state, Session& session) const {
    state.phase = Phase::MatchLists;
    state.matchedLists.clear();
    state.selectedListId.reset();
    state.createNewList = false;
    state.selectionAttempts = 0;

    session.send(OutboundType::AssistantThinking, "Looking for existing smart lists that match your audience...");

    if (!state.locationId || state.locationId->empty()) {
        std::cerr << "[CampaignNodes] " << session.id() << ": no location id, skipping list lookup" << std::endl;
        return;
    }
    if (!m_lists) {
        std::cerr << "[CampaignNodes] " << session.id() << ": no list provider configured" << std::endl;
        return;
    }

    auto lookup = m_lists->fetchLists(*state.locationId, session.context().credentials);
    if (!lookup.ok()) {
        std::cerr << "[CampaignNodes] " << session.id() << ": list lookup failed: " << *lookup.error << std::endl;
        return;
    }
    std::cout << "[CampaignNodes] " << session.id() << ": " << lookup.lists.size()
              << " smart list(s) for location " << *state.locationId << std::endl;

    state.matchedLists = m_matcher.rank(ValueOr(state.audience, ""), lookup.lists);
}

void CampaignNodes::confirmSelection(WorkflowState& state, Session& session) const {
    state.phase = Phase::ConfirmSelection;

    if (!session.isResuming()) {
        session.send(OutboundType::System, "Great! I found " + std::to_string(state.matchedLists.size()) +
                                               " existing smart list(s) that match your audience.");
    }

    std::vector<QuestionOption> options;
    for (std::size_t i = 0; i < state.matchedLists.size(); ++i) {
        const auto& list = state.matchedLists[i];
        QuestionOption option;
        option.id = std::to_string(i + 1);
        option.label = list.displayName;
        option.description = "Relevance: " + std::to_string(list.score) + "% - " +
                              (list.reason.empty() ? std::string("N/A") : list.reason);
        option.metadata = {{"list_id", list.id}, {"name", list.displayName}, {"size", list.size}};
        options.push_back(std::move(option));
    }
    QuestionOption createNew;
    createNew.id = "0";
    createNew.label = "Create new smart list";
    createNew.description = "I'll create a custom list based on your audience criteria";
    options.push_back(std::move(createNew));

    while (true) {
        const std::string reply = session.ask(QuestionKind::MultipleChoice,
                                              "Please select a smart list or create a new one:", options);
        Selection selection = ResolveSelection(reply, state.matchedLists);

        if (selection.kind == SelectionKind::Existing) {
            const auto& chosen = state.matchedLists[selection.index];
            state.selectedListId = chosen.id;
            state.createNewList = false;
            session.send(OutboundType::System, "✓ Using smart list: " + chosen.displayName);
            return;
        }
        if (selection.kind == SelectionKind::CreateNew) {
            state.createNewList = true;
            session.send(OutboundType::System, "✓ I'll create a new smart list for your campaign.");
            return;
        }

        state.selectionAttempts++;
        if (state.selectionAttempts >= WorkflowState::kMaxSelectionAttempts) {
            state.createNewList = true;
            session.send(OutboundType::Error, "Invalid selection. Creating new list.");
            return;
        }
        session.send(OutboundType::Error,
                     "Invalid selection. Reply with an option number, or 0 to create a new list.");
    }
}

void CampaignNodes::confirmNewList(WorkflowState& state, Session& session) const {
    state.phase = Phase::ConfirmSelection;

    if (!session.isResuming()) {
        session.send(OutboundType::System, "No existing smart lists match your audience criteria.");
        session.send(OutboundType::System, "Target Audience: " + ValueOr(state.audience, "N/A"));
    }

    while (true) {
        const std::string reply = session.ask(QuestionKind::YesNo, "Would you like me to create a new smart list?");
        auto answer = ParseYesNo(reply);

        if (answer) {
            state.createNewList = *answer;
            if (*answer) {
                session.send(OutboundType::System, "✓ I'll create a new smart list for your campaign.");
            }
            return;
        }

        state.selectionAttempts++;
        if (state.selectionAttempts >= WorkflowState::kMaxSelectionAttempts) {
            state.createNewList = true;
            session.send(OutboundType::Error, "I couldn't understand that reply. Creating a new smart list.");
            return;
        }
        session.send(OutboundType::Error, "Please answer yes or no.");
    }
}

void CampaignNodes::summary(WorkflowState& state, Session& session) const {
    state.phase = Phase::Summary;

    std::string listLine;
    if (state.sendToAllCustomers) {
        listLine = "All customers (no list filtering)";
    } else if (state.selectedListId) {
        auto it = std::find_if(state.matchedLists.begin(), state.matchedLists.end(),
            [&state](const MatchedList& l) { return l.id == *state.selectedListId; });
        listLine = it == state.matchedLists.end()
            ? "Existing list " + *state.selectedListId
            : "Existing list \"" + it->displayName + "\" (" + std::to_string(it->size) + " contacts)";
    } else if (state.createNewList) {
        listLine = "New smart list";
        if (state.smartListName) listLine += " \"" + *state.smartListName + "\"";
    } else {
        listLine = "Not selected";
    }

    std::string text = "✓ Campaign setup complete! Here's the summary:\n";
    text += "\n• Audience: " + ValueOr(state.audience, "N/A");
    text += "\n• Offer: " + ValueOr(state.offer, "N/A");
    text += "\n• Schedule: " + ValueOr(state.schedule, "N/A");
    text += "\n• Smart list: " + listLine;

    auto message = OutboundMessage::Make(OutboundType::Assistant, text);
    message.disableInput = true;
    session.send(message);

    state.phase = Phase::Completed;
    std::cout << "[CampaignNodes] " << session.id() << ": completed " << state.toJson().dump() << std::endl;
}

void CampaignNodes::cancelled(WorkflowState& state, Session& session) const {
    state.phase = Phase::Cancelled;
    session.send(OutboundType::System, "Campaign creation cancelled.");
}

void CampaignNodes::error(WorkflowState& state, Session& session) const {
    state.phase = Phase::Failed;
    std::string text = "Something went wrong while setting up your campaign";
    if (state.lastError) text += ": " + *state.lastError;
    session.send(OutboundType::Error, text + ". Please start again.");
}

} // namespace campaignflow::application
