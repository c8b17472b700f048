#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/PromptCatalog.hpp"
#include "test/TestSupport.hpp"

using namespace campaignflow;
using namespace campaignflow::domain;
using application::RunOutcome;
using infrastructure::PromptCatalog;
using test::CampaignHarness;

namespace {

const char* kNeedsSchedule = R"({"audience":"Yoga regulars","offer":"Free mat","datetime":null})";

std::size_t CountText(const std::vector<OutboundMessage>& messages, const std::string& text) {
    std::size_t n = 0;
    for (const auto& m : messages) {
        if (m.message.find(text) != std::string::npos) ++n;
    }
    return n;
}

ListLookup YogaLists() {
    ListLookup lookup;
    lookup.lists.push_back(test::MakeList("l-yoga", "Yoga Regulars", 80));
    return lookup;
}

nlohmann::json WithoutError(nlohmann::json state) {
    state.erase("last_error");
    return state;
}

void TestDisconnectAndResumeKeepsQuestion() {
    CampaignHarness h;
    h.completion->reply(PromptCatalog::kExtractTask, kNeedsSchedule);

    h.connect("r");
    h.say("r", "Free mat for yoga regulars");
    auto question = h.transport->waitForQuestion("r");
    assert(question);

    h.service->onDisconnect("r");
    assert(h.waitOutcome("r", 1) == RunOutcome::Interrupted);
    assert(!h.service->isSessionActive("r"));

    auto checkpoint = h.checkpoints->load("r");
    assert(checkpoint && checkpoint->nodeName == "clarify");
    assert(checkpoint->pendingQuestion && checkpoint->pendingQuestion->id == *question->questionId);
    assert(checkpoint->state.audience == std::optional<std::string>("Yoga regulars"));
    std::cout << "[PASS] Disconnect leaves a checkpoint at the suspended node." << std::endl;

    // Twice, to show resuming is repeatable from the same checkpoint.
    for (int round = 0; round < 2; ++round) {
        h.service->onConnect("r");
        assert(h.transport->waitForText("r", "Welcome back!"));
        auto again = h.transport->waitForQuestion("r");
        assert(again && *again->questionId == *question->questionId && "Same question id after resume.");
        assert(again->questionNumber == std::optional<int>(1));
        if (round == 0) {
            h.service->onDisconnect("r");
            assert(h.waitOutcome("r", 2) == RunOutcome::Interrupted);
            assert(h.checkpoints->load("r")->pendingQuestion->id == *question->questionId);
        }
    }

    h.answer("r", *question->questionId, "Sunday 8 AM");
    h.answerNext("r", "yes");
    assert(h.waitOutcome("r", 3) == RunOutcome::Completed);
    auto summary = h.transport->waitForText("r", "Campaign setup complete");
    assert(summary->message.find("Sunday 8 AM") != std::string::npos);
    assert(summary->message.find("Yoga regulars") != std::string::npos);
    assert(!h.checkpoints->contains("r"));
    std::cout << "[PASS] Resumed session re-asks the same question and completes." << std::endl;
}

void TestResumedRunEndsLikeUninterruptedRun() {
    CampaignHarness straight(YogaLists());
    straight.completion->reply(PromptCatalog::kExtractTask, kNeedsSchedule);
    straight.connect("s");
    straight.say("s", "Free mat for yoga regulars");
    straight.answerNext("s", "Sunday 8 AM");
    straight.answerNext("s", "1");
    assert(straight.waitOutcome("s") == RunOutcome::Completed);

    CampaignHarness resumed(YogaLists());
    resumed.completion->reply(PromptCatalog::kExtractTask, kNeedsSchedule);
    resumed.connect("s");
    resumed.say("s", "Free mat for yoga regulars");

    // Drop the connection at the clarification and again at the list choice.
    auto clarification = resumed.transport->waitForQuestion("s");
    assert(clarification);
    resumed.service->onDisconnect("s");
    assert(resumed.waitOutcome("s", 1) == RunOutcome::Interrupted);
    resumed.service->onConnect("s");
    resumed.answerNext("s", "Sunday 8 AM");

    auto choice = resumed.transport->waitForQuestion("s");
    assert(choice && choice->type == OutboundType::Options);
    resumed.service->onDisconnect("s");
    assert(resumed.waitOutcome("s", 2) == RunOutcome::Interrupted);
    resumed.service->onConnect("s");
    resumed.answerNext("s", "1");
    assert(resumed.waitOutcome("s", 3) == RunOutcome::Completed);

    auto expected = WithoutError(straight.finalState("s"));
    auto actual = WithoutError(resumed.finalState("s", 3));
    assert(expected.is_object() && expected["selected_list_id"] == "l-yoga");
    assert(actual == expected && "Resuming does not change the outcome.");

    auto messages = resumed.transport->messagesFor("s");
    assert(CountText(messages, "I need to clarify") == 1);
    assert(CountText(messages, "Great! I found") == 1);
    std::cout << "[PASS] Interrupted and resumed run ends in the same state as a straight run." << std::endl;
}

void TestReplyRacingResumeIsKept() {
    CampaignHarness h;
    h.completion->reply(PromptCatalog::kExtractTask, kNeedsSchedule);

    h.connect("race");
    h.say("race", "Free mat for yoga regulars");
    auto question = h.transport->waitForQuestion("race");
    h.service->onDisconnect("race");
    assert(h.waitOutcome("race", 1) == RunOutcome::Interrupted);

    h.service->onConnect("race");
    // The checkpointed question is open before the task is even scheduled.
    h.answer("race", *question->questionId, "Saturday");
    auto confirm = h.transport->waitFor("race", [](const OutboundMessage& m) {
        return m.type == OutboundType::Confirmation;
    });
    assert(confirm);
    h.answer("race", *confirm->questionId, "yes");
    assert(h.waitOutcome("race", 2) == RunOutcome::Completed);
    assert(h.transport->waitForText("race", "Saturday"));
    std::cout << "[PASS] Reply arriving right after reconnect is not lost." << std::endl;
}

void TestExplicitCancelDropsCheckpoint() {
    CampaignHarness h;
    h.completion->reply(PromptCatalog::kExtractTask, kNeedsSchedule);

    h.connect("c");
    h.say("c", "Free mat for yoga regulars");
    assert(h.transport->waitForQuestion("c"));

    h.service->handleRawMessage("c", R"({"type":"cancel"})");
    assert(h.waitOutcome("c") == RunOutcome::Cancelled);
    assert(h.transport->waitForText("c", "Campaign creation cancelled."));
    assert(!h.checkpoints->contains("c"));

    h.service->handleRawMessage("c", R"({"type":"cancel"})");
    assert(h.transport->waitForText("c", "No active campaign session to cancel."));

    h.service->onDisconnect("c");
    h.service->onConnect("c");
    assert(h.transport->waitForText("c", application::ConversationService::kWelcomeMessage));
    assert(!h.service->isSessionActive("c"));
    std::cout << "[PASS] Cancel erases the checkpoint; reconnect starts fresh." << std::endl;
}

void TestResumeDisabledCancelsOnDisconnect() {
    application::ConversationOptions options;
    options.resumeOnReconnect = false;
    CampaignHarness h({}, WorkflowState::kMaxClarifications, options);
    h.completion->reply(PromptCatalog::kExtractTask, kNeedsSchedule);

    h.connect("off");
    h.say("off", "Free mat for yoga regulars");
    assert(h.transport->waitForQuestion("off"));

    h.service->onDisconnect("off");
    assert(h.waitOutcome("off") == RunOutcome::Cancelled);
    assert(!h.checkpoints->contains("off"));
    std::cout << "[PASS] With resume disabled a disconnect ends the session." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Resume Test..." << std::endl;
    TestDisconnectAndResumeKeepsQuestion();
    TestResumedRunEndsLikeUninterruptedRun();
    TestReplyRacingResumeIsKept();
    TestExplicitCancelDropsCheckpoint();
    TestResumeDisabledCancelsOnDisconnect();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
