/**
 * @file PendingQuestion.hpp
 * @brief The single open human-input request of a session.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace campaignflow::domain {

enum class QuestionKind {
    FreeText,
    MultipleChoice,
    YesNo
};

/**
 * @struct QuestionOption
 * @brief One selectable choice of a multiple-choice question.
 */
struct QuestionOption {
    std::string id;
    std::string label;
    std::string description;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @struct PendingQuestion
 * @brief A question waiting for exactly one reply, correlated by id.
 */
struct PendingQuestion {
    std::string id;
    QuestionKind kind = QuestionKind::FreeText;
    std::string prompt;
    std::vector<QuestionOption> options;
    std::chrono::system_clock::time_point createdAt{};
    int questionNumber = 0; ///< 1-based position in the clarify loop, 0 outside it.
    int totalQuestions = 0;
};

} // namespace campaignflow::domain
