/**
 * @file TestSupport.hpp
 * @brief Test doubles shared by the test executables.
 */

#pragma once

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/AsyncTaskManager.hpp"
#include "application/CampaignWorkflow.hpp"
#include "application/ConversationService.hpp"
#include "application/SessionRegistry.hpp"
#include "domain/CompletionService.hpp"
#include "domain/ListProvider.hpp"
#include "domain/MessageTransport.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace campaignflow::test {

/**
 * @class MockCompletionService
 * @brief Answers by prompt task name. Tasks without a handler behave like an unreachable server.
 */
class MockCompletionService : public domain::CompletionService {
public:
    using Handler = std::function<std::optional<std::string>(const std::string& userContent)>;

    void on(const std::string& task, Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers[task] = std::move(handler);
    }

    void reply(const std::string& task, const std::string& text) {
        on(task, [text](const std::string&) { return std::optional<std::string>(text); });
    }

    std::optional<std::string> complete(const std::string& systemPrompt,
                                        const std::string& userContent) override {
        const std::string task = infrastructure::PromptCatalog::TaskOf(systemPrompt);
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls[task]++;
            auto it = m_handlers.find(task);
            if (it == m_handlers.end()) return std::nullopt;
            handler = it->second;
        }
        return handler(userContent);
    }

    int calls(const std::string& task) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_calls.find(task);
        return it == m_calls.end() ? 0 : it->second;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Handler> m_handlers;
    std::map<std::string, int> m_calls;
};

class MockListProvider : public domain::ListProvider {
public:
    explicit MockListProvider(domain::ListLookup result = {}) : m_result(std::move(result)) {}

    domain::ListLookup fetchLists(const std::string& locationId,
                                  const domain::ListApiCredentials&) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_locations.push_back(locationId);
        return m_result;
    }

    std::vector<std::string> requestedLocations() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_locations;
    }

private:
    mutable std::mutex m_mutex;
    domain::ListLookup m_result;
    std::vector<std::string> m_locations;
};

/**
 * @class RecordingTransport
 * @brief Keeps every outbound message per client. waitFor() consumes messages in order.
 */
class RecordingTransport : public domain::MessageTransport {
public:
    using Predicate = std::function<bool(const domain::OutboundMessage&)>;

    bool send(const std::string& clientId, const domain::OutboundMessage& message) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_messages[clientId].push_back(message);
        }
        m_cv.notify_all();
        return true;
    }

    /**
     * @brief Waits for the next message of a client matching the predicate.
     * Messages before the match are skipped and not seen again by later calls.
     */
    std::optional<domain::OutboundMessage> waitFor(const std::string& clientId, Predicate predicate,
                                                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        std::optional<domain::OutboundMessage> found;
        m_cv.wait_for(lock, timeout, [&] {
            auto& messages = m_messages[clientId];
            auto& cursor = m_cursors[clientId];
            while (cursor < messages.size()) {
                const auto& candidate = messages[cursor++];
                if (predicate(candidate)) {
                    found = candidate;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    std::optional<domain::OutboundMessage> waitForQuestion(const std::string& clientId) {
        return waitFor(clientId, [](const domain::OutboundMessage& m) { return m.questionId.has_value(); });
    }

    std::optional<domain::OutboundMessage> waitForText(const std::string& clientId, const std::string& text) {
        return waitFor(clientId, [text](const domain::OutboundMessage& m) {
            return m.message.find(text) != std::string::npos;
        });
    }

    std::vector<domain::OutboundMessage> messagesFor(const std::string& clientId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_messages.find(clientId);
        return it == m_messages.end() ? std::vector<domain::OutboundMessage>{} : it->second;
    }

    std::size_t count(const std::string& clientId, domain::OutboundType type) const {
        std::size_t n = 0;
        for (const auto& m : messagesFor(clientId)) {
            if (m.type == type) ++n;
        }
        return n;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, std::vector<domain::OutboundMessage>> m_messages;
    std::map<std::string, std::size_t> m_cursors;
};

/** @brief Extraction output with every field present. */
inline std::string FullExtraction(const std::string& audience, const std::string& offer,
                                  const std::string& datetime) {
    return nlohmann::json{{"audience", audience}, {"offer", offer}, {"datetime", datetime},
                          {"missing_fields", nlohmann::json::array()}}.dump();
}

inline domain::ContactList MakeList(const std::string& id, const std::string& name, long long size) {
    domain::ContactList list;
    list.id = id;
    list.name = name;
    list.displayName = name;
    list.size = size;
    return list;
}

/**
 * @struct CampaignHarness
 * @brief The full conversation stack over test doubles, driven through raw JSON messages.
 */
struct CampaignHarness {
    std::shared_ptr<MockCompletionService> completion = std::make_shared<MockCompletionService>();
    std::shared_ptr<MockListProvider> lists;
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    std::shared_ptr<application::CheckpointStore> checkpoints = std::make_shared<application::CheckpointStore>();
    std::shared_ptr<application::SessionRegistry> registry;
    std::shared_ptr<application::AsyncTaskManager> tasks = std::make_shared<application::AsyncTaskManager>();
    std::shared_ptr<application::ConversationService> service;

    explicit CampaignHarness(domain::ListLookup lookup = {},
                             int maxClarifications = domain::WorkflowState::kMaxClarifications,
                             application::ConversationOptions options = {})
        : lists(std::make_shared<MockListProvider>(std::move(lookup))),
          registry(std::make_shared<application::SessionRegistry>(transport, checkpoints)) {
        auto nodes = std::make_shared<application::CampaignNodes>(completion, lists, maxClarifications);
        auto graph = std::make_shared<application::WorkflowGraph>(application::BuildCampaignGraph(nodes));
        service = std::make_shared<application::ConversationService>(registry, graph, tasks, transport, options);
        service->setSessionFinishedCallback([this](const std::string& id, application::RunOutcome outcome,
                                                   const domain::WorkflowState& finalState) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_outcomes[id].push_back(outcome);
                m_finalStates[id].push_back(finalState.toJson());
            }
            m_cv.notify_all();
        });
    }

    ~CampaignHarness() {
        service->shutdown(std::chrono::seconds(5));
    }

    void connect(const std::string& clientId, const std::string& locationId = "loc-1") {
        service->onConnect(clientId);
        nlohmann::json handshake = {{"type", "handshake"}, {"location", {{"id", locationId}, {"name", "Main St"}}}};
        service->handleRawMessage(clientId, handshake.dump());
    }

    void say(const std::string& clientId, const std::string& text) {
        service->handleRawMessage(clientId, nlohmann::json{{"type", "user_message"}, {"message", text}}.dump());
    }

    void answer(const std::string& clientId, const std::string& questionId, const std::string& response) {
        nlohmann::json reply = {{"type", "user_response"}, {"question_id", questionId}, {"response", response}};
        service->handleRawMessage(clientId, reply.dump());
    }

    /** @brief Waits for the next question and answers it. Returns the question. */
    domain::OutboundMessage answerNext(const std::string& clientId, const std::string& response) {
        auto question = transport->waitForQuestion(clientId);
        assert(question && "Expected a question.");
        answer(clientId, *question->questionId, response);
        return *question;
    }

    /** @brief Waits until the n-th run of a client has finished. */
    std::optional<application::RunOutcome> waitOutcome(const std::string& clientId, std::size_t run = 1,
                                                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        bool done = m_cv.wait_for(lock, timeout, [&] { return m_outcomes[clientId].size() >= run; });
        if (!done) return std::nullopt;
        return m_outcomes[clientId][run - 1];
    }

    /** @brief State snapshot the n-th run ended with. Call after waitOutcome(). */
    nlohmann::json finalState(const std::string& clientId, std::size_t run = 1) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto& states = m_finalStates[clientId];
        return run <= states.size() ? states[run - 1] : nlohmann::json();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, std::vector<application::RunOutcome>> m_outcomes;
    std::map<std::string, std::vector<nlohmann::json>> m_finalStates;
};

} // namespace campaignflow::test
