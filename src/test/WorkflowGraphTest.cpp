#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/CampaignWorkflow.hpp"
#include "application/Session.hpp"
#include "application/WorkflowGraph.hpp"
#include "test/TestSupport.hpp"

using namespace campaignflow::application;
using namespace campaignflow::domain;

namespace {

std::shared_ptr<Session> MakeSession(const std::string& id) {
    return std::make_shared<Session>(id, std::make_shared<campaignflow::test::RecordingTransport>(),
                                     std::make_shared<CheckpointStore>());
}

void TestRoutingPredicates() {
    WorkflowState state;
    assert(RouteAfterMissingCheck(state, 5) == nodes::kMatchLists);

    state.sendToAllCustomers = true;
    assert(RouteAfterMissingCheck(state, 5) == nodes::kSummary);
    state.sendToAllCustomers = false;

    state.markMissing({FieldKind::Offer, "What offer?", "10% off"});
    assert(RouteAfterMissingCheck(state, 5) == nodes::kClarify);
    state.questionsAsked = 5;
    assert(RouteAfterMissingCheck(state, 5) == nodes::kFillDefaults && "Cap reached.");
    state.questionsAsked = 1;
    assert(RouteAfterMissingCheck(state, 1) == nodes::kFillDefaults && "Lowered cap.");

    WorkflowState matched;
    assert(RouteAfterMatching(matched) == nodes::kConfirmNewList);
    matched.matchedLists.push_back({"l1", "VIP", 10, 80, ""});
    assert(RouteAfterMatching(matched) == nodes::kConfirmSelection);

    WorkflowState decided;
    assert(RouteAfterNewListConfirmation(decided) == nodes::kCancelled);
    decided.createNewList = true;
    assert(RouteAfterNewListConfirmation(decided) == nodes::kSummary);
    std::cout << "[PASS] Routing predicates." << std::endl;
}

void TestCampaignGraphShape() {
    auto campaign = std::make_shared<CampaignNodes>(nullptr, nullptr);
    WorkflowGraph graph = BuildCampaignGraph(campaign);
    assert(!graph.validate());
    assert(graph.entryPoint() == nodes::kExtract);
    assert(graph.isTerminal(nodes::kSummary));
    assert(graph.isTerminal(nodes::kCancelled));
    assert(graph.isTerminal(nodes::kError));
    assert(!graph.isTerminal(nodes::kClarify));
    assert(graph.nodeNames().size() == 10);

    const std::string mermaid = graph.toMermaid();
    assert(mermaid.rfind("flowchart TD", 0) == 0);
    assert(mermaid.find("__start__ --> extract") != std::string::npos);
    assert(mermaid.find("check_missing -.-> clarify") != std::string::npos);
    assert(mermaid.find("clarify --> check_missing") != std::string::npos);
    std::cout << "[PASS] Campaign graph wiring and Mermaid output." << std::endl;
}

void TestValidationRejectsMiswiring() {
    WorkflowGraph graph;
    graph.addNode({"a", NodeCapability::Automatic, nullptr, false});
    graph.setEntryPoint("a");
    assert(graph.validate() && "Non-terminal node without outgoing edge.");

    graph.addEdge("a", "ghost");
    assert(graph.validate() && "Edge to unknown node.");

    bool threw = false;
    try {
        graph.addNode({"a", NodeCapability::Automatic, nullptr, false});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Miswired graphs are rejected." << std::endl;
}

void TestInvariantViolationRoutesToError() {
    std::vector<std::string> visited;
    WorkflowGraph graph;
    graph.addNode({"start", NodeCapability::Automatic,
        [&visited](WorkflowState& state, Session&) {
            visited.push_back("start");
            state.questionsAsked = WorkflowState::kMaxClarifications + 1;
        }, false});
    graph.addNode({"done", NodeCapability::Automatic,
        [&visited](WorkflowState&, Session&) { visited.push_back("done"); }, true});
    graph.addNode({WorkflowGraph::kErrorNode, NodeCapability::Automatic,
        [&visited](WorkflowState& state, Session&) {
            visited.push_back("error");
            state.phase = Phase::Failed;
        }, true});
    graph.setEntryPoint("start");
    graph.addEdge("start", "done");

    auto session = MakeSession("invariant");
    assert(graph.run(*session) == RunOutcome::Failed);
    assert((visited == std::vector<std::string>{"start", "error"}));
    assert(session->state().lastError && session->state().lastError->find("clarification count") != std::string::npos);
    std::cout << "[PASS] Broken invariant routes to the error node." << std::endl;
}

void TestNodeExceptionAndBadRoute() {
    WorkflowGraph graph;
    graph.addNode({"boom", NodeCapability::Automatic,
        [](WorkflowState&, Session&) { throw std::runtime_error("completion backend exploded"); }, false});
    graph.addNode({"done", NodeCapability::Automatic, nullptr, true});
    graph.addNode({WorkflowGraph::kErrorNode, NodeCapability::Automatic, nullptr, true});
    graph.setEntryPoint("boom");
    graph.addEdge("boom", "done");

    auto session = MakeSession("exception");
    assert(graph.run(*session) == RunOutcome::Failed);
    assert(*session->state().lastError == "completion backend exploded");

    WorkflowGraph routed;
    routed.addNode({"pick", NodeCapability::Routing, nullptr, false});
    routed.addNode({"left", NodeCapability::Automatic, nullptr, true});
    routed.addNode({WorkflowGraph::kErrorNode, NodeCapability::Automatic, nullptr, true});
    routed.setEntryPoint("pick");
    routed.addConditionalEdges("pick", [](const WorkflowState&) { return std::string("right"); }, {"left"});

    auto other = MakeSession("bad-route");
    assert(routed.run(*other) == RunOutcome::Failed && "Undeclared route target.");
    std::cout << "[PASS] Node exceptions and undeclared routes fail the run." << std::endl;
}

void TestPhaseRegressionIsRejected() {
    WorkflowGraph graph;
    graph.addNode({"forward", NodeCapability::Automatic,
        [](WorkflowState& state, Session&) { state.phase = Phase::MatchLists; }, false});
    graph.addNode({"backward", NodeCapability::Automatic,
        [](WorkflowState& state, Session&) { state.phase = Phase::Extract; }, false});
    graph.addNode({"done", NodeCapability::Automatic, nullptr, true});
    graph.addNode({WorkflowGraph::kErrorNode, NodeCapability::Automatic, nullptr, true});
    graph.setEntryPoint("forward");
    graph.addEdge("forward", "backward");
    graph.addEdge("backward", "done");

    auto session = MakeSession("phase");
    assert(graph.run(*session) == RunOutcome::Failed);
    assert(session->state().lastError->find("phase moved back") != std::string::npos);
    std::cout << "[PASS] Phase only moves forward." << std::endl;
}

void TestCancelledBeforeRun() {
    WorkflowGraph graph;
    graph.addNode({"start", NodeCapability::Automatic,
        [](WorkflowState&, Session&) { assert(false && "Must not run after cancel."); }, true});
    graph.setEntryPoint("start");

    auto session = MakeSession("cancelled");
    session->cancel();
    assert(graph.run(*session) == RunOutcome::Cancelled);

    auto detached = MakeSession("detached");
    detached->cancel(true);
    assert(graph.run(*detached) == RunOutcome::Interrupted);
    std::cout << "[PASS] Cancelled and detached sessions stop before the next node." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WorkflowGraph Test..." << std::endl;
    TestRoutingPredicates();
    TestCampaignGraphShape();
    TestValidationRejectsMiswiring();
    TestInvariantViolationRoutesToError();
    TestNodeExceptionAndBadRoute();
    TestPhaseRegressionIsRejected();
    TestCancelledBeforeRun();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
