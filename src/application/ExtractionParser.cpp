/**
 * @file ExtractionParser.cpp
 * @brief Implementation of ExtractionParser.
 */

#include "application/ExtractionParser.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iterator>

namespace campaignflow::application {

using domain::FieldKind;
using domain::MissingField;
using json = nlohmann::json;

namespace {

std::string Trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Placeholders models emit instead of leaving a field empty.
bool IsPlaceholder(const std::string& value) {
    static const char* const kPlaceholders[] = {
        "", "n/a", "na", "none", "null", "unknown", "not specified", "unspecified", "tbd"
    };
    const std::string v = Lower(value);
    for (const char* p : kPlaceholders) {
        if (v == p) return true;
    }
    return false;
}

std::optional<std::string> TextField(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (j.contains(key) && j[key].is_string()) {
            std::string value = Trim(j[key].get<std::string>());
            if (!IsPlaceholder(value)) return value;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

void AddMissing(std::vector<MissingField>& out, const json& entry) {
    MissingField field;
    if (entry.is_string()) {
        auto kind = domain::FieldKindFromString(Trim(entry.get<std::string>()));
        if (!kind) return;
        field.field = *kind;
    } else if (entry.is_object() && entry.contains("field") && entry["field"].is_string()) {
        auto kind = domain::FieldKindFromString(Trim(entry["field"].get<std::string>()));
        if (!kind) return;
        field.field = *kind;
        if (entry.contains("question") && entry["question"].is_string()) {
            field.question = Trim(entry["question"].get<std::string>());
        }
        if (entry.contains("default") && entry["default"].is_string()) {
            field.defaultValue = Trim(entry["default"].get<std::string>());
        }
    } else {
        return;
    }

    bool duplicate = std::any_of(out.begin(), out.end(),
        [&field](const MissingField& m) { return m.field == field.field; });
    if (!duplicate) out.push_back(std::move(field));
}

} // namespace

const std::optional<std::string>& CampaignExtraction::value(FieldKind kind) const {
    switch (kind) {
        case FieldKind::Audience: return audience;
        case FieldKind::Offer: return offer;
        case FieldKind::Datetime: return schedule;
    }
    return audience;
}

bool CampaignExtraction::flags(FieldKind kind) const {
    return std::any_of(missing.begin(), missing.end(),
        [kind](const MissingField& m) { return m.field == kind; });
}

std::optional<json> ExtractionParser::ExtractJsonObject(const std::string& text) {
    std::string body = Trim(text);

    auto fence = body.find("```");
    if (fence != std::string::npos) {
        auto contentStart = body.find('\n', fence);
        auto close = contentStart == std::string::npos ? std::string::npos : body.find("```", contentStart);
        if (close != std::string::npos) {
            body = body.substr(contentStart + 1, close - contentStart - 1);
        }
    }

    auto first = body.find('{');
    auto last = body.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        return std::nullopt;
    }

    try {
        json j = json::parse(body.substr(first, last - first + 1));
        if (j.is_object()) return j;
    } catch (const json::parse_error&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<CampaignExtraction> ExtractionParser::Parse(const std::string& text) {
    auto parsed = ExtractJsonObject(text);
    if (!parsed) return std::nullopt;
    const json& j = *parsed;

    static const char* const kKnownKeys[] = {
        "audience", "offer", "template", "datetime", "schedule", "missing_fields", "missing_info"
    };
    bool known = std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys),
        [&j](const char* key) { return j.contains(key); });
    if (!known) return std::nullopt;

    CampaignExtraction out;
    out.audience = TextField(j, {"audience"});
    out.offer = TextField(j, {"offer", "template"});
    out.schedule = TextField(j, {"datetime", "schedule"});
    out.smartListName = TextField(j, {"smart_list_name"});

    for (const char* key : {"missing_fields", "missing_info"}) {
        if (j.contains(key) && j[key].is_array()) {
            for (const auto& entry : j[key]) {
                AddMissing(out.missing, entry);
            }
        }
    }

    std::sort(out.missing.begin(), out.missing.end(), [](const MissingField& a, const MissingField& b) {
        return domain::FieldPriority(a.field) < domain::FieldPriority(b.field);
    });
    return out;
}

} // namespace campaignflow::application
