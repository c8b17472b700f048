/**
 * @file Messages.cpp
 * @brief JSON encoding of outbound messages and validation of inbound ones.
 */

#include "domain/Messages.hpp"
#include <chrono>

namespace campaignflow::domain {

using json = nlohmann::json;

namespace {

std::string StringOr(const json& obj, const char* key, const std::string& fallback = "") {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return fallback;
}

void Fail(std::string* error, const std::string& message) {
    if (error) *error = message;
}

ClientLocation ParseLocation(const json& loc) {
    ClientLocation location;
    location.id = StringOr(loc, "id");
    location.name = StringOr(loc, "name");
    location.timezone = StringOr(loc, "timezone");
    location.managementSystem = StringOr(loc, "management_system");
    location.website = StringOr(loc, "website");
    location.phone = StringOr(loc, "phone");
    if (loc.contains("address") && loc["address"].is_object()) {
        const auto& address = loc["address"];
        location.state = StringOr(address, "state");
        location.postalCode = StringOr(address, "postal_code");
        location.country = StringOr(address, "country");
    }
    location.state = StringOr(loc, "state", location.state);
    location.postalCode = StringOr(loc, "postal_code", location.postalCode);
    location.country = StringOr(loc, "country", location.country);
    location.currency = StringOr(loc, "currency");
    return location;
}

} // namespace

double NowSeconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

std::string OutboundTypeToString(OutboundType type) {
    switch (type) {
        case OutboundType::Assistant: return "assistant";
        case OutboundType::AssistantThinking: return "assistant_thinking";
        case OutboundType::Question: return "question";
        case OutboundType::Options: return "options";
        case OutboundType::Confirmation: return "confirmation";
        case OutboundType::Error: return "error";
        case OutboundType::System: return "system";
        case OutboundType::User: return "user";
    }
    return "assistant";
}

OutboundMessage OutboundMessage::Make(OutboundType type, std::string text) {
    OutboundMessage msg;
    msg.type = type;
    msg.message = std::move(text);
    msg.timestamp = NowSeconds();
    return msg;
}

OutboundMessage OutboundMessage::ForQuestion(const PendingQuestion& question) {
    OutboundType type = OutboundType::Question;
    if (question.kind == QuestionKind::MultipleChoice) {
        type = OutboundType::Options;
    } else if (question.kind == QuestionKind::YesNo) {
        type = OutboundType::Confirmation;
    }

    auto msg = Make(type, question.prompt);
    msg.questionId = question.id;
    msg.options = question.options;
    if (question.questionNumber > 0) {
        msg.questionNumber = question.questionNumber;
        msg.totalQuestions = question.totalQuestions;
    }
    return msg;
}

json OutboundMessage::toJson() const {
    json j = {
        {"type", OutboundTypeToString(type)},
        {"message", message},
        {"timestamp", timestamp}
    };
    if (questionId) j["question_id"] = *questionId;
    if (!options.empty()) {
        json opts = json::array();
        for (const auto& opt : options) {
            opts.push_back({
                {"id", opt.id},
                {"label", opt.label},
                {"description", opt.description},
                {"metadata", opt.metadata}
            });
        }
        j["options"] = opts;
    }
    if (questionNumber) j["question_number"] = *questionNumber;
    if (totalQuestions) j["total_questions"] = *totalQuestions;
    if (disableInput) j["disable_input"] = *disableInput;
    return j;
}

std::optional<InboundMessage> InboundMessage::Parse(const std::string& raw, std::string* error) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::parse_error& e) {
        Fail(error, std::string("invalid JSON: ") + e.what());
        return std::nullopt;
    }

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        Fail(error, "message has no string 'type'");
        return std::nullopt;
    }

    InboundMessage msg;
    const auto type = j["type"].get<std::string>();

    if (type == "user_message") {
        msg.type = InboundType::UserMessage;
        if (!j.contains("message") || !j["message"].is_string()) {
            Fail(error, "user_message requires a string 'message'");
            return std::nullopt;
        }
        msg.message = j["message"].get<std::string>();
    } else if (type == "user_response") {
        msg.type = InboundType::UserResponse;
        if (!j.contains("question_id") || !j["question_id"].is_string()) {
            Fail(error, "user_response requires a string 'question_id'");
            return std::nullopt;
        }
        msg.questionId = j["question_id"].get<std::string>();
        // A missing or null response is an empty answer (accept the default).
        if (j.contains("response") && j["response"].is_string()) {
            msg.response = j["response"].get<std::string>();
        } else if (j.contains("response") && !j["response"].is_null()) {
            Fail(error, "user_response 'response' must be a string");
            return std::nullopt;
        }
    } else if (type == "cancel") {
        msg.type = InboundType::Cancel;
    } else if (type == "reset") {
        msg.type = InboundType::Reset;
    } else if (type == "handshake") {
        msg.type = InboundType::Handshake;
        if (j.contains("location") && j["location"].is_object()) {
            msg.location = ParseLocation(j["location"]);
        }
        if (j.contains("credentials") && j["credentials"].is_object()) {
            const auto& c = j["credentials"];
            ListApiCredentials creds;
            creds.apiKey = StringOr(c, "api_key");
            creds.bearerToken = StringOr(c, "bearer_token");
            creds.apiUrl = StringOr(c, "api_url");
            msg.credentials = creds;
        }
    } else {
        Fail(error, "unknown message type '" + type + "'");
        return std::nullopt;
    }

    return msg;
}

} // namespace campaignflow::domain
