/**
 * @file Messages.hpp
 * @brief Wire messages exchanged with the client over the persistent connection.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ClientContext.hpp"
#include "domain/PendingQuestion.hpp"

namespace campaignflow::domain {

enum class OutboundType {
    Assistant,
    AssistantThinking,
    Question,
    Options,
    Confirmation,
    Error,
    System,
    User
};

std::string OutboundTypeToString(OutboundType type);

/**
 * @struct OutboundMessage
 * @brief Server-to-client message. Optional members are omitted from the JSON when unset.
 */
struct OutboundMessage {
    OutboundType type = OutboundType::Assistant;
    std::string message;
    double timestamp = 0.0; ///< Seconds since the Unix epoch.
    std::optional<std::string> questionId;
    std::vector<QuestionOption> options;
    std::optional<int> questionNumber;
    std::optional<int> totalQuestions;
    std::optional<bool> disableInput;

    /** @brief Builds a message stamped with the current time. */
    static OutboundMessage Make(OutboundType type, std::string text);

    /** @brief Builds the question/options/confirmation message announcing a pending question. */
    static OutboundMessage ForQuestion(const PendingQuestion& question);

    nlohmann::json toJson() const;
};

enum class InboundType {
    UserMessage,
    UserResponse,
    Cancel,
    Reset,
    Handshake
};

/**
 * @struct InboundMessage
 * @brief Client-to-server message after validation.
 */
struct InboundMessage {
    InboundType type = InboundType::UserMessage;
    std::string message;
    std::string questionId;
    std::string response;
    std::optional<ClientLocation> location;
    std::optional<ListApiCredentials> credentials;

    /**
     * @brief Parses and validates a raw JSON message.
     * @param raw The message body.
     * @param error Receives a description when parsing fails.
     * @return The message, or nullopt when malformed or of an unknown type.
     */
    static std::optional<InboundMessage> Parse(const std::string& raw, std::string* error = nullptr);
};

/** @brief Current wall-clock time in seconds since the Unix epoch. */
double NowSeconds();

} // namespace campaignflow::domain
