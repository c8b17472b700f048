#include "application/CampaignWorkflow.hpp"
#include <stdexcept>

namespace campaignflow::application {

using domain::WorkflowState;

std::string RouteAfterMissingCheck(const WorkflowState& state, int maxClarifications) {
    if (state.missingFields.empty()) {
        return state.sendToAllCustomers ? nodes::kSummary : nodes::kMatchLists;
    }
    if (state.questionsAsked < maxClarifications) {
        return nodes::kClarify;
    }
    return nodes::kFillDefaults;
}

std::string RouteAfterMatching(const WorkflowState& state) {
    return state.matchedLists.empty() ? nodes::kConfirmNewList : nodes::kConfirmSelection;
}

std::string RouteAfterNewListConfirmation(const WorkflowState& state) {
    return state.createNewList ? nodes::kSummary : nodes::kCancelled;
}

WorkflowGraph BuildCampaignGraph(std::shared_ptr<CampaignNodes> campaignNodes) {
    if (!campaignNodes) {
        throw std::invalid_argument("campaign nodes are required");
    }

    // Nodes share ownership of campaignNodes.
    auto bind = [campaignNodes](void (CampaignNodes::*fn)(WorkflowState&, Session&) const) -> NodeFn {
        return [campaignNodes, fn](WorkflowState& state, Session& session) {
            ((*campaignNodes).*fn)(state, session);
        };
    };

    WorkflowGraph graph;
    graph.addNode({nodes::kExtract, NodeCapability::Automatic, bind(&CampaignNodes::extract), false});
    graph.addNode({nodes::kCheckMissing, NodeCapability::Routing, nullptr, false});
    graph.addNode({nodes::kClarify, NodeCapability::Interactive, bind(&CampaignNodes::clarify), false});
    graph.addNode({nodes::kFillDefaults, NodeCapability::Automatic, bind(&CampaignNodes::fillDefaults), false});
    graph.addNode({nodes::kMatchLists, NodeCapability::Automatic, bind(&CampaignNodes::matchLists), false});
    graph.addNode({nodes::kConfirmSelection, NodeCapability::Interactive, bind(&CampaignNodes::confirmSelection), false});
    graph.addNode({nodes::kConfirmNewList, NodeCapability::Interactive, bind(&CampaignNodes::confirmNewList), false});
    graph.addNode({nodes::kSummary, NodeCapability::Automatic, bind(&CampaignNodes::summary), true});
    graph.addNode({nodes::kCancelled, NodeCapability::Automatic, bind(&CampaignNodes::cancelled), true});
    graph.addNode({nodes::kError, NodeCapability::Automatic, bind(&CampaignNodes::error), true});

    graph.setEntryPoint(nodes::kExtract);
    graph.addEdge(nodes::kExtract, nodes::kCheckMissing);

    const int maxClarifications = campaignNodes->maxClarifications();
    graph.addConditionalEdges(nodes::kCheckMissing,
        [maxClarifications](const WorkflowState& state) { return RouteAfterMissingCheck(state, maxClarifications); },
        {nodes::kClarify, nodes::kFillDefaults, nodes::kMatchLists, nodes::kSummary});

    graph.addEdge(nodes::kClarify, nodes::kCheckMissing);
    graph.addEdge(nodes::kFillDefaults, nodes::kCheckMissing);
    graph.addConditionalEdges(nodes::kMatchLists, RouteAfterMatching,
                              {nodes::kConfirmSelection, nodes::kConfirmNewList});
    graph.addEdge(nodes::kConfirmSelection, nodes::kSummary);
    graph.addConditionalEdges(nodes::kConfirmNewList, RouteAfterNewListConfirmation,
                              {nodes::kSummary, nodes::kCancelled});

    if (auto problem = graph.validate()) {
        throw std::logic_error("campaign graph is miswired: " + *problem);
    }
    return graph;
}

} // namespace campaignflow::application
