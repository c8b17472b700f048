#include "infrastructure/PromptCatalog.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace campaignflow::infrastructure {

using domain::FieldKind;
using json = nlohmann::json;

namespace {
const char kTaskPrefix[] = "TASK: ";
}

std::string PromptCatalog::GetExtractionPrompt(const std::optional<domain::ClientLocation>& location) {
    return std::string(kTaskPrefix) + kExtractTask + "\n"
        "You are an expert at parsing marketing email campaign requests.\n"
        "Extract the following information from the user's campaign request:\n"
        "1. AUDIENCE: who should receive the campaign (location, demographics, behavior, past visits).\n"
        "2. OFFER: what content or offer the email carries (discounts, promotions, products).\n"
        "3. DATETIME: when the campaign should be sent.\n"
        "4. MISSING_FIELDS: which of the three fields are missing or too vague to act on.\n\n"
        "RULES:\n"
        "- Only flag CRITICAL gaps. Make reasonable assumptions for minor details.\n"
        "- Do not ask about low-level template details.\n"
        "- Priority: audience > offer > datetime.\n"
        "- For every missing field give one short question and a sensible default value.\n"
        "- Suggest a short smart list name for the audience.\n\n"
        "BUSINESS CONTEXT:\n" + FormatLocationContext(location) + "\n\n"
        "Return ONLY a JSON object of this shape:\n"
        "{\n"
        "  \"audience\": \"description of the target audience or empty\",\n"
        "  \"offer\": \"description of the content and offer or empty\",\n"
        "  \"datetime\": \"scheduled date and time or empty\",\n"
        "  \"smart_list_name\": \"short list name\",\n"
        "  \"missing_fields\": [\n"
        "    {\"field\": \"audience|offer|datetime\", \"question\": \"...\", \"default\": \"...\"}\n"
        "  ]\n"
        "}";
}

std::string PromptCatalog::GetUpdatePrompt() {
    return std::string(kTaskPrefix) + kUpdateTask + "\n"
        "You are updating a marketing campaign based on the user's clarifications.\n"
        "You receive the current campaign fields, the answers given so far and the fields still open.\n"
        "Merge the answers into the fields, keeping everything already known.\n"
        "A field is only still missing if the answers do not cover it.\n"
        "The last answer is for the first field under still_missing. Flag that field again,\n"
        "with a new question and default, when the answer is vague or does not give a usable value.\n"
        "Never flag a field that is not listed under still_missing.\n\n"
        "Return ONLY a JSON object of this shape:\n"
        "{\n"
        "  \"audience\": \"updated audience description\",\n"
        "  \"offer\": \"updated content and offer description\",\n"
        "  \"datetime\": \"updated or confirmed date and time\",\n"
        "  \"missing_fields\": [ {\"field\": \"...\", \"question\": \"...\", \"default\": \"...\"} ]\n"
        "}";
}

std::string PromptCatalog::BuildUpdateRequest(const domain::WorkflowState& state) {
    auto valueOf = [](const std::optional<std::string>& v) -> json {
        return v ? json(*v) : json("");
    };

    json answers = json::array();
    for (const auto& r : state.clarificationResponses) {
        answers.push_back({
            {"field", domain::FieldKindToString(r.field)},
            {"question", r.question},
            {"answer", r.answer}
        });
    }

    json stillMissing = json::array();
    for (const auto& m : state.missingFields) {
        stillMissing.push_back(domain::FieldKindToString(m.field));
    }

    json request = {
        {"original_request", state.userPrompt},
        {"current", {
            {"audience", valueOf(state.audience)},
            {"offer", valueOf(state.offer)},
            {"datetime", valueOf(state.schedule)}
        }},
        {"clarifications", answers},
        {"still_missing", stillMissing}
    };
    return request.dump(2);
}

std::string PromptCatalog::GetListRankingPrompt() {
    return std::string(kTaskPrefix) + kRankTask + "\n"
        "You match a campaign audience against a business's existing smart contact lists.\n"
        "You receive the audience description and the candidate lists (id, name, size).\n"
        "Score each relevant list from 0 to 100 by how well its name describes the audience.\n"
        "Leave out lists that are unrelated. Give a one-sentence reason per match.\n\n"
        "Return ONLY a JSON object of this shape:\n"
        "{\"matches\": [ {\"id\": \"list id\", \"score\": 85, \"reason\": \"...\"} ]}";
}

std::string PromptCatalog::GetFallbackQuestion(FieldKind field) {
    switch (field) {
        case FieldKind::Audience:
            return "Who should receive this campaign? For example: all customers, recent visitors, or lapsed clients.";
        case FieldKind::Offer:
            return "What offer or message should the email carry? For example: 20% off, a new service, or a seasonal promotion.";
        case FieldKind::Datetime:
            return "When should the campaign be sent? Give a date and time.";
    }
    return "Could you tell me more about your campaign?";
}

std::string PromptCatalog::GetDefaultValue(FieldKind field) {
    switch (field) {
        case FieldKind::Audience: return "Customers who visited in the last 90 days";
        case FieldKind::Offer: return "A general promotion highlighting current services";
        case FieldKind::Datetime: return "Next Tuesday at 10:00 AM local time";
    }
    return "";
}

std::string PromptCatalog::FormatLocationContext(const std::optional<domain::ClientLocation>& location) {
    const std::string unavailable = "Location information not available.";
    if (!location) {
        return unavailable;
    }

    std::vector<std::string> parts;
    auto add = [&parts](const std::string& label, const std::string& value) {
        if (!value.empty()) parts.push_back(label + ": " + value);
    };
    add("Business Name", location->name);
    add("Location ID", location->id);
    add("Timezone", location->timezone);
    add("Management System", location->managementSystem);
    add("Website", location->website);
    add("Phone", location->phone);

    std::string address;
    for (const auto* piece : {&location->state, &location->postalCode, &location->country}) {
        if (piece->empty()) continue;
        if (!address.empty()) address += ", ";
        address += *piece;
    }
    add("Location", address);
    add("Currency", location->currency);

    if (parts.empty()) {
        return unavailable;
    }
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += "\n";
        out += "- " + part;
    }
    return out;
}

std::string PromptCatalog::TaskOf(const std::string& systemPrompt) {
    const std::string prefix = kTaskPrefix;
    if (systemPrompt.compare(0, prefix.size(), prefix) != 0) {
        return "";
    }
    auto end = systemPrompt.find('\n');
    return systemPrompt.substr(prefix.size(), end == std::string::npos ? std::string::npos : end - prefix.size());
}

} // namespace campaignflow::infrastructure
