#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "application/CheckpointStore.hpp"
#include "application/Session.hpp"
#include "test/TestSupport.hpp"

using namespace campaignflow::application;
using namespace campaignflow::domain;

int main() {
    std::cout << "[Test] Starting CheckpointStore Test..." << std::endl;

    CheckpointStore store;
    assert(!store.load("missing"));
    assert(!store.erase("missing"));

    Checkpoint first;
    first.state.userPrompt = "Black Friday blast";
    first.state.audience = "VIP members";
    first.state.questionsAsked = 2;
    first.nodeName = "clarify";
    store.save("client-a", first);

    auto loaded = store.load("client-a");
    assert(loaded && loaded->nodeName == "clarify");
    assert(loaded->state.audience == std::optional<std::string>("VIP members"));
    assert(loaded->state.questionsAsked == 2);
    assert(!loaded->pendingQuestion);

    Checkpoint second = first;
    second.nodeName = "match_lists";
    store.save("client-a", second);
    assert(store.size() == 1 && "Saving replaces the previous checkpoint.");
    assert(store.load("client-a")->nodeName == "match_lists");
    std::cout << "[PASS] Save replaces, load returns a copy." << std::endl;

    // Sessions checkpoint on node entry and while suspended.
    auto transport = std::make_shared<campaignflow::test::RecordingTransport>();
    auto shared = std::make_shared<CheckpointStore>();
    Session session("client-b", transport, shared);
    session.state().userPrompt = "Spring sale";
    session.enterNode("extract");
    assert(shared->load("client-b")->nodeName == "extract");

    std::thread answerer([&] {
        auto question = transport->waitForQuestion("client-b");
        assert(question);
        auto cp = shared->load("client-b");
        assert(cp && cp->pendingQuestion && "Suspended session checkpoints its question.");
        assert(cp->pendingQuestion->id == *question->questionId);
        session.deliverReply(*question->questionId, "everyone");
    });
    assert(session.ask(QuestionKind::FreeText, "Who?") == "everyone");
    answerer.join();
    std::cout << "[PASS] Session checkpoints carry node and open question." << std::endl;

    session.cancel();
    session.state().userPrompt = "changed after cancel";
    session.checkpoint();
    assert(shared->load("client-b")->state.userPrompt == "Spring sale" &&
           "A cancelled session no longer writes checkpoints.");
    std::cout << "[PASS] Cancelled sessions stop checkpointing." << std::endl;

    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([&store, i] {
            for (int j = 0; j < 100; ++j) {
                Checkpoint cp;
                cp.nodeName = "node" + std::to_string(j);
                store.save("writer-" + std::to_string(i), cp);
                store.load("writer-" + std::to_string((i + 1) % 8));
            }
        });
    }
    for (auto& t : writers) t.join();
    assert(store.size() == 9);
    assert(store.erase("writer-3"));
    assert(!store.contains("writer-3"));
    std::cout << "[PASS] Concurrent writers and readers." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
